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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_CORE_VALIDATION_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_CORE_VALIDATION_H_

#include "absl/status/status.h"
#include "slidescale/core/slide_geometry.h"
#include "slidescale/utilities/numeric.h"

namespace slidescale {
namespace core {

/// @brief Relative tolerance between mpp_x and mpp_y
inline constexpr double kMppAnisotropyTolerance = 0.015;

/// @brief Fails with a bounds error if any component of `size` is negative
[[nodiscard]] absl::Status CheckSize(const Size2i& size);

/// @brief Checks a request against the size of the level it addresses
///
/// Fails with a bounds error when the size is negative, the location is
/// negative, or location + size exceeds `level_size` in either axis.
[[nodiscard]] absl::Status CheckSizeAndLocation(const Size2d& location,
                                                const Size2i& size,
                                                const Size2i& level_size);

/// @brief Fails with a configuration error unless scaling is finite and > 0
[[nodiscard]] absl::Status CheckScaling(double scaling);

/// @brief Rejects missing, non-positive and anisotropic spacings
///
/// Pixels count as square when |mpp_x - mpp_y| <= 1.5% of the larger one.
/// Failures are unsupported-slide errors.
[[nodiscard]] absl::Status CheckMppIsValid(const Spacing& mpp);

}  // namespace core
}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_CORE_VALIDATION_H_
