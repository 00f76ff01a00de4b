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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_PIPELINE_REGION_RESAMPLER_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_PIPELINE_REGION_RESAMPLER_H_

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "slidescale/core/coordinate_mapper.h"
#include "slidescale/image.h"
#include "slidescale/resample/resampling.h"

/**
 * @file region_resampler.h
 * @brief Turns a decoded native window into the requested output region
 *
 * Two pipelines are available. Both receive the padded window read from the
 * backend together with the fractional crop box computed by the coordinate
 * mapper and return an image of exactly the target size.
 */

namespace slidescale {

/// @brief Resampling pipeline selector
enum class InternalHandler {
  kBox,   ///< Fractional source box on pixel arrays
  kVips,  ///< Integer crop followed by a libvips resize
};

/// @brief Lower-case name of a pipeline
constexpr const char* GetName(InternalHandler handler) {
  switch (handler) {
    case InternalHandler::kBox:
      return "box";
    case InternalHandler::kVips:
      return "vips";
  }
  return "unknown";
}

/// @brief Parse "box" (alias "pil") or "vips", case-insensitive
/// @return Handler, or a configuration error for other names
[[nodiscard]] absl::StatusOr<InternalHandler> ParseInternalHandler(
    std::string_view name);

/// @brief Per-read resampling parameters
struct ResampleOptions {
  Resampling resampling{Resampling::kLanczos};
  bool apply_color_profile{false};
  /// ICC profile of the slide, nullptr if it has none
  const std::vector<uint8_t>* color_profile{nullptr};
};

/// @brief Crops a fractional box out of a native window and resizes it
class RegionResampler {
 public:
  virtual ~RegionResampler() = default;

  /**
   * @brief Produce the output region.
   *
   * @param window Padded native window as returned by the backend
   * @param box Requested region inside `window`, in window pixels
   * @param target Output dimensions
   * @param options Kernel and colour handling
   * @return Image of exactly `target` dimensions
   */
  [[nodiscard]] virtual absl::StatusOr<Image> Resample(
      const Image& window, const CropBox& box, const ImageDimensions& target,
      const ResampleOptions& options) const = 0;

  [[nodiscard]] virtual InternalHandler GetHandler() const = 0;
};

/// @brief Pipeline A: resize with a fractional source box
///
/// Colour profiles are not supported; a requested transform is skipped with
/// a warning and the read succeeds.
class BoxRegionResampler : public RegionResampler {
 public:
  absl::StatusOr<Image> Resample(const Image& window, const CropBox& box,
                                 const ImageDimensions& target,
                                 const ResampleOptions& options) const override;

  InternalHandler GetHandler() const override { return InternalHandler::kBox; }
};

/// @brief Pipeline B: integer crop, optional ICC transform, libvips resize
///
/// libvips must have been initialised (see utilities::VipsInitializer).
class VipsRegionResampler : public RegionResampler {
 public:
  absl::StatusOr<Image> Resample(const Image& window, const CropBox& box,
                                 const ImageDimensions& target,
                                 const ResampleOptions& options) const override;

  InternalHandler GetHandler() const override {
    return InternalHandler::kVips;
  }

  /// @brief Integer crop rectangle used for `box`, clamped to the window
  ///
  /// floor(left), floor(top), round(left + width), round(top + height).
  [[nodiscard]] static CropBox IntegerCrop(const CropBox& box,
                                           const ImageDimensions& window);
};

/// @brief Create the resampler for a pipeline
[[nodiscard]] std::unique_ptr<RegionResampler> CreateRegionResampler(
    InternalHandler handler);

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_PIPELINE_REGION_RESAMPLER_H_
