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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_RESAMPLE_BOX_RESAMPLE_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_RESAMPLE_BOX_RESAMPLE_H_

#include <cmath>
#include <cstdint>
#include <numbers>
#include <vector>

#include "absl/status/statusor.h"
#include "slidescale/core/coordinate_mapper.h"
#include "slidescale/image.h"
#include "slidescale/resample/resampling.h"

namespace slidescale::resample {

/// @brief Mathematical tolerance for weight normalization
constexpr double kNormalizationTolerance = 1e-8;

/// @brief Fractional bits of the fixed-point filter coefficients
constexpr int kPrecisionBits = 32 - 8 - 2;

/// @brief Rounding offset added to every fixed-point accumulator
constexpr int64_t kFixedPointHalf = int64_t{1} << (kPrecisionBits - 1);

template <int A>
concept ValidKernelSize = (A >= 1 && A <= 5);

constexpr double Sinc(double x) noexcept {
  if (x == 0.0)
    return 1.0;
  double pi_x = std::numbers::pi * x;
  return std::sin(pi_x) / pi_x;
}

template <int A>
requires ValidKernelSize<A>

constexpr double LanczosKernel(double x) noexcept {
  if (std::abs(x) >= A)
    return 0.0;
  return Sinc(x) * Sinc(x / A);
}

/// @brief Contiguous source taps contributing to one output sample
struct TapSpan {
  int first;                   ///< First source index
  std::vector<double> weights;  ///< Normalized weights, one per source index
};

/**
 * @brief Filter weights for resizing the source interval [start, end).
 *
 * Output sample i is centred at start + (i + 0.5) * scale in source
 * coordinates, with scale = (end - start) / out_size. When downsampling the
 * kernel is stretched by the scale. Taps are restricted to [0, in_size) and
 * renormalized there, so samples outside the source never contribute.
 *
 * @param start Left edge of the source interval (may be fractional)
 * @param end Right edge of the source interval
 * @param in_size Number of source samples
 * @param out_size Number of output samples
 */
[[nodiscard]] std::vector<TapSpan> ComputeLanczosWeights(double start,
                                                         double end,
                                                         uint32_t in_size,
                                                         uint32_t out_size);

/// @brief Weights as fixed-point coefficients with kPrecisionBits fraction
/// bits, rounded half away from zero
[[nodiscard]] std::vector<int32_t> QuantizeWeights(
    const std::vector<double>& weights);

/**
 * @brief Nearest source index for every output sample.
 *
 * Picks floor(start + (i + 0.5) * scale), clamped to the source.
 */
[[nodiscard]] std::vector<int> ComputeNearestIndices(double start, double end,
                                                     uint32_t in_size,
                                                     uint32_t out_size);

/**
 * @brief Resize a fractional source box to an exact target size.
 *
 * The box is given in source pixel coordinates and is used as is; it is not
 * rounded to integers. Its right and bottom edges are clipped to the source
 * dimensions. The kernel is applied separably: rows first, then columns.
 *
 * Lanczos follows Pillow's 8-bit path: weights are computed in double
 * precision, quantized with QuantizeWeights, accumulated in integers and
 * rounded to 8 bits after each pass. Alpha is filtered as an independent
 * channel; Pillow premultiplies RGBA before filtering, so RGBA outputs can
 * differ from Pillow where alpha is not opaque.
 *
 * @param source Decoded native window
 * @param box Region of `source` to resample
 * @param target Output dimensions
 * @param resampling Kernel
 * @return Image of exactly `target` dimensions, or a configuration error
 *         for an empty source or a degenerate box
 */
[[nodiscard]] absl::StatusOr<Image> ResizeWithBox(const Image& source,
                                                  const core::CropBox& box,
                                                  const ImageDimensions& target,
                                                  Resampling resampling);

/// @brief Resize the whole image
[[nodiscard]] absl::StatusOr<Image> Resize(const Image& source,
                                           const ImageDimensions& target,
                                           Resampling resampling);

/// @brief Largest size with the aspect ratio of `size` fitting in `bound`
///
/// Never enlarges and never returns a zero dimension for a non-empty input.
[[nodiscard]] ImageDimensions FitInside(const ImageDimensions& size,
                                        const ImageDimensions& bound);

}  // namespace slidescale::resample

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_RESAMPLE_BOX_RESAMPLE_H_
