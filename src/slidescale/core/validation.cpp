// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "slidescale/core/validation.h"

#include <algorithm>
#include <cmath>

#include "absl/status/status.h"
#include "slidescale/errors.h"
#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"

namespace slidescale {
namespace core {

absl::Status CheckSize(const Size2i& size) {
  if (size[0] < 0 || size[1] < 0) {
    return MAKE_STATUS(
        ErrorCodes::kBounds,
        fmt::format("Size values must be greater than zero. Got [{}, {}]",
                    size[0], size[1]));
  }
  return absl::OkStatus();
}

absl::Status CheckSizeAndLocation(const Size2d& location, const Size2i& size,
                                  const Size2i& level_size) {
  RETURN_IF_ERROR(CheckSize(size), "");

  const Size2d end = location + size;
  bool outside = false;
  for (size_t axis = 0; axis < 2; ++axis) {
    if (location[axis] < 0.0 ||
        end[axis] > static_cast<double>(level_size[axis])) {
      outside = true;
    }
  }

  if (outside) {
    return MAKE_STATUS(
        ErrorCodes::kBounds,
        fmt::format("Requested region is outside level boundaries. "
                    "[{}, {}] + [{}, {}] (=[{}, {}]) > [{}, {}].",
                    location[0], location[1], size[0], size[1], end[0],
                    end[1], level_size[0], level_size[1]));
  }
  return absl::OkStatus();
}

absl::Status CheckScaling(double scaling) {
  if (!std::isfinite(scaling) || scaling <= 0.0) {
    return MAKE_STATUS(
        ErrorCodes::kConfiguration,
        fmt::format("Scaling must be a positive finite number, got {}",
                    scaling));
  }
  return absl::OkStatus();
}

absl::Status CheckMppIsValid(const Spacing& mpp) {
  const double mpp_x = mpp[0];
  const double mpp_y = mpp[1];

  if (!std::isfinite(mpp_x) || !std::isfinite(mpp_y) || mpp_x <= 0.0 ||
      mpp_y <= 0.0) {
    return MAKE_STATUS(
        ErrorCodes::kUnsupportedSlide,
        fmt::format("Invalid spacing [{}, {}]: mpp must be positive", mpp_x,
                    mpp_y));
  }

  const double tolerance =
      kMppAnisotropyTolerance * std::max(std::abs(mpp_x), std::abs(mpp_y));
  if (std::abs(mpp_x - mpp_y) > tolerance) {
    return MAKE_STATUS(
        ErrorCodes::kUnsupportedSlide,
        fmt::format("mpp_x ({}) and mpp_y ({}) are too far apart; "
                    "anisotropic pixels are not supported",
                    mpp_x, mpp_y));
  }
  return absl::OkStatus();
}

}  // namespace core
}  // namespace slidescale
