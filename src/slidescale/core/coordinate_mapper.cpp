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

#include "slidescale/core/coordinate_mapper.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <ostream>
#include <span>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidescale/core/validation.h"
#include "slidescale/errors.h"
#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"

namespace slidescale {
namespace core {

int32_t GetBestLevelForDownsample(std::span<const double> downsamples,
                                  double factor) {
  if (downsamples.empty() || factor < downsamples.front()) {
    return 0;
  }

  for (size_t level = 1; level < downsamples.size(); ++level) {
    if (factor < downsamples[level]) {
      return static_cast<int32_t>(level - 1);
    }
  }
  return static_cast<int32_t>(downsamples.size() - 1);
}

int64_t GetInterpolationSupport(double native_scaling) {
  if (native_scaling > 1.0) {
    return kKernelSupport;
  }
  return static_cast<int64_t>(
      std::ceil(static_cast<double>(kKernelSupport) / native_scaling));
}

Size2i GetScaledSize(const Size2i& size, double scaling) {
  return Floor(size.Cast<double>() * scaling).Cast<int64_t>();
}

absl::StatusOr<NativeRegionPlan> MapRegion(const PyramidGeometry& geometry,
                                           const RegionRequest& request) {
  RETURN_IF_ERROR(CheckScaling(request.scaling), "");
  if (geometry.levels.empty()) {
    return MAKE_STATUS(ErrorCodes::kConfiguration,
                       "Cannot map a region on a pyramid without levels");
  }

  const double scaling = request.scaling;
  const bool bounded = request.space == CoordinateSpace::kSlideBounds;

  // Requests are validated against the level they address, before any
  // coordinate is translated.
  const Size2i level_size = GetScaledSize(
      bounded ? geometry.bounds.size : geometry.dimensions, scaling);
  RETURN_IF_ERROR(
      CheckSizeAndLocation(request.location, request.size, level_size), "");

  NativeRegionPlan plan;
  plan.size = request.size;
  plan.location = request.location;
  if (bounded) {
    plan.location =
        plan.location + GetScaledSize(geometry.bounds.offset, scaling);
  }

  const std::vector<double> downsamples = geometry.GetLevelDownsamples();
  plan.native_level = GetBestLevelForDownsample(downsamples, 1.0 / scaling);

  const LevelInfo& level = geometry.levels[plan.native_level];
  const Size2d native_level_size = level.dimensions.Cast<double>();
  const Size2d origin{0.0, 0.0};

  plan.downsample = level.downsample;
  plan.native_scaling = scaling * level.downsample;
  plan.native_location = plan.location / plan.native_scaling;
  plan.native_size = request.size.Cast<double>() / plan.native_scaling;
  plan.support = GetInterpolationSupport(plan.native_scaling);

  const double support = static_cast<double>(plan.support);

  // Window start, padded with the kernel support and kept inside the level.
  Size2d adapted = Clamp(Floor(plan.native_location - support), origin,
                         native_level_size);

  // Backends are addressed in integer level-zero pixels, so the start is
  // snapped there and projected back to native space.
  plan.level_zero_location = Floor(adapted * plan.downsample).Cast<int64_t>();
  adapted = plan.level_zero_location.Cast<double>() / plan.downsample;
  plan.native_location_adapted = adapted;

  // The outer ceil covers the fractional start introduced by the snapping.
  const Size2d window_end =
      Clamp(Ceil(plan.native_location + plan.native_size + support), origin,
            native_level_size);
  plan.native_size_adapted = Ceil(window_end - adapted).Cast<int64_t>();

  const Size2d offset = plan.native_location - adapted;
  const Size2d window = plan.native_size_adapted.Cast<double>();
  plan.crop_box.left = std::clamp(offset[0], 0.0, window[0]);
  plan.crop_box.top = std::clamp(offset[1], 0.0, window[1]);
  plan.crop_box.right =
      std::clamp(offset[0] + plan.native_size[0], 0.0, window[0]);
  plan.crop_box.bottom =
      std::clamp(offset[1] + plan.native_size[1], 0.0, window[1]);

  return plan;
}

std::ostream& operator<<(std::ostream& os, const NativeRegionPlan& plan) {
  os << "NativeRegionPlan(level=" << plan.native_level
     << ", downsample=" << plan.downsample
     << ", native_scaling=" << plan.native_scaling
     << ", native_location=" << plan.native_location
     << ", native_size=" << plan.native_size << ", support=" << plan.support
     << ", level_zero_location=" << plan.level_zero_location
     << ", window=" << plan.native_size_adapted << ", crop_box=["
     << plan.crop_box.left << ", " << plan.crop_box.top << ", "
     << plan.crop_box.right << ", " << plan.crop_box.bottom << "])";
  return os;
}

}  // namespace core
}  // namespace slidescale
