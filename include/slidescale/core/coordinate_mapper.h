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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_CORE_COORDINATE_MAPPER_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_CORE_COORDINATE_MAPPER_H_

#include <cstdint>
#include <ostream>
#include <span>

#include "absl/status/statusor.h"
#include "slidescale/core/slide_geometry.h"
#include "slidescale/utilities/numeric.h"

/**
 * @file coordinate_mapper.h
 * @brief Maps a continuous-scale region request onto a native pyramid read
 *
 * Four coordinate spaces are involved:
 *  - request space: pixels at the requested scaling `s`
 *  - native space: pixels of the selected pyramid level
 *  - level-zero space: integer pixels of level 0, as backends are addressed
 *  - buffer space: pixels of the decoded padded window
 *
 * The mapper selects the native level, pads the native rectangle with the
 * interpolation support of the resampling kernel, snaps the window start to
 * integer level-zero coordinates and expresses the requested region as a
 * fractional box inside the decoded window. It performs no I/O.
 */

namespace slidescale {
namespace core {

/// @brief Support radius (in samples) of the widest kernel, Lanczos-3
inline constexpr int64_t kKernelSupport = 3;

/// @brief Coordinate system of a request location
enum class CoordinateSpace {
  kFullImage,    ///< Relative to the top-left of the full image
  kSlideBounds,  ///< Relative to the top-left of the scaled slide bounds
};

/// @brief Region at scaling `s`
struct RegionRequest {
  Size2d location;  ///< Top-left (x, y) at the requested scaling
  double scaling{1.0};
  Size2i size;  ///< Output (width, height)
  CoordinateSpace space{CoordinateSpace::kFullImage};
};

/// @brief Sub-pixel rectangle inside the decoded native window
struct CropBox {
  double left{0.0};
  double top{0.0};
  double right{0.0};
  double bottom{0.0};

  [[nodiscard]] double Width() const { return right - left; }
  [[nodiscard]] double Height() const { return bottom - top; }
};

/// @brief Result of mapping one region request onto the pyramid
struct NativeRegionPlan {
  int32_t native_level{0};
  double downsample{1.0};      ///< Downsample of the native level
  double native_scaling{1.0};  ///< s * downsample
  Size2d location;             ///< Request location in full-image space
  Size2i size;                 ///< Requested output size
  Size2d native_location;      ///< location / native_scaling
  Size2d native_size;          ///< size / native_scaling
  int64_t support{kKernelSupport};  ///< Padding in native samples
  Size2i level_zero_location;       ///< Window start passed to the backend
  Size2d native_location_adapted;   ///< Window start in native space
  Size2i native_size_adapted;       ///< Window size passed to the backend
  CropBox crop_box;                 ///< Requested region inside the window
};

std::ostream& operator<<(std::ostream& os, const NativeRegionPlan& plan);

/// @brief Level to read for a downsample factor (OpenSlide semantics)
///
/// Returns the largest level whose downsample does not exceed `factor`, or
/// level 0 when `factor` is below every downsample. `downsamples` must be
/// non-empty and sorted ascending.
[[nodiscard]] int32_t GetBestLevelForDownsample(
    std::span<const double> downsamples, double factor);

/// @brief Native samples of padding needed on each side of a region
///
/// 3 when upsampling (native_scaling > 1), ceil(3 / native_scaling)
/// otherwise.
[[nodiscard]] int64_t GetInterpolationSupport(double native_scaling);

/// @brief floor(size * scaling), elementwise
[[nodiscard]] Size2i GetScaledSize(const Size2i& size, double scaling);

/**
 * @brief Map a region request onto a padded native read.
 *
 * Validation runs first: negative sizes, negative locations and regions
 * extending past the scaled level (or scaled slide bounds for
 * CoordinateSpace::kSlideBounds) fail with a bounds error. An invalid
 * scaling or an empty pyramid fails with a configuration error.
 *
 * @param geometry Pyramid of the slide
 * @param request Region at the requested scaling
 * @return Padded native window and fractional crop box
 */
[[nodiscard]] absl::StatusOr<NativeRegionPlan> MapRegion(
    const PyramidGeometry& geometry, const RegionRequest& request);

}  // namespace core

using core::CoordinateSpace;
using core::CropBox;
using core::NativeRegionPlan;
using core::RegionRequest;

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_CORE_COORDINATE_MAPPER_H_
