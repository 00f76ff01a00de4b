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

#include "slidescale/pipeline/region_resampler.h"

#include <vips/vips8>

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <string_view>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "slidescale/errors.h"
#include "slidescale/resample/box_resample.h"
#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"
#include "slidescale/utilities/vips.h"

namespace slidescale {

absl::StatusOr<InternalHandler> ParseInternalHandler(std::string_view name) {
  const std::string lower = absl::AsciiStrToLower(name);
  if (lower == "box" || lower == "pil") {
    return InternalHandler::kBox;
  }
  if (lower == "vips") {
    return InternalHandler::kVips;
  }
  return MAKE_STATUS(
      ErrorCodes::kConfiguration,
      fmt::format("Unknown internal handler '{}', expected box, pil or vips",
                  name));
}

// ============================================================================
// Pipeline A
// ============================================================================

absl::StatusOr<Image> BoxRegionResampler::Resample(
    const Image& window, const CropBox& box, const ImageDimensions& target,
    const ResampleOptions& options) const {
  if (options.apply_color_profile) {
    LOG(WARNING) << "Applying color profile is not supported with the box "
                    "handler, returning untransformed pixels";
  }

  // Some backends deliver one pixel less at the border than announced.
  CropBox clipped = box;
  clipped.left = std::max(clipped.left, 0.0);
  clipped.top = std::max(clipped.top, 0.0);
  clipped.right =
      std::min(clipped.right, static_cast<double>(window.GetWidth()));
  clipped.bottom =
      std::min(clipped.bottom, static_cast<double>(window.GetHeight()));

  return resample::ResizeWithBox(window, clipped, target, options.resampling);
}

// ============================================================================
// Pipeline B
// ============================================================================

CropBox VipsRegionResampler::IntegerCrop(const CropBox& box,
                                         const ImageDimensions& window) {
  const auto width = static_cast<double>(window[0]);
  const auto height = static_cast<double>(window[1]);

  CropBox crop;
  crop.left = std::clamp(std::floor(box.left), 0.0, width);
  crop.top = std::clamp(std::floor(box.top), 0.0, height);
  crop.right = std::clamp(std::round(box.right), crop.left, width);
  crop.bottom = std::clamp(std::round(box.bottom), crop.top, height);

  // Sub-pixel boxes still cover one source pixel when the window has one.
  if (crop.right == crop.left && crop.left < width) {
    crop.right = crop.left + 1;
  }
  if (crop.bottom == crop.top && crop.top < height) {
    crop.bottom = crop.top + 1;
  }
  return crop;
}

absl::StatusOr<Image> VipsRegionResampler::Resample(
    const Image& window, const CropBox& box, const ImageDimensions& target,
    const ResampleOptions& options) const {
  if (target[0] == 0 || target[1] == 0) {
    return Image(target, window.GetFormat());
  }
  if (window.Empty()) {
    return MAKE_STATUS(ErrorCodes::kConfiguration,
                       "Cannot resample an empty native window");
  }

  const CropBox crop = IntegerCrop(box, window.GetDimensions());
  const auto crop_width = static_cast<int>(crop.Width());
  const auto crop_height = static_cast<int>(crop.Height());
  if (crop_width <= 0 || crop_height <= 0) {
    return MAKE_STATUS(
        ErrorCodes::kConfiguration,
        fmt::format("Degenerate crop box [{}, {}, {}, {}]", box.left, box.top,
                    box.right, box.bottom));
  }

  DECLARE_ASSIGN_OR_RETURN(vips::VImage, source,
                           utilities::ToVipsImage(window));

  try {
    vips::VImage region = source.crop(static_cast<int>(crop.left),
                                      static_cast<int>(crop.top), crop_width,
                                      crop_height);

    if (options.apply_color_profile && options.color_profile != nullptr &&
        !options.color_profile->empty()) {
      // Own the pixels before attaching metadata to the image.
      const VipsInterpretation interpretation =
          region.bands() >= 3 ? VIPS_INTERPRETATION_sRGB
                              : VIPS_INTERPRETATION_B_W;
      region = region
                   .copy(vips::VImage::option()->set("interpretation",
                                                     interpretation))
                   .copy_memory();
      vips_image_set_blob_copy(region.get_image(), VIPS_META_ICC_NAME,
                               options.color_profile->data(),
                               options.color_profile->size());
      // Alpha passes through untouched.
      region = region.icc_transform(
          "srgb", vips::VImage::option()->set("embedded", true)->set(
                      "depth", 8));
    }

    const VipsKernel kernel = options.resampling == Resampling::kNearest
                                  ? VIPS_KERNEL_NEAREST
                                  : VIPS_KERNEL_LANCZOS3;
    const double hscale = static_cast<double>(target[0]) / crop_width;
    const double vscale = static_cast<double>(target[1]) / crop_height;
    vips::VImage resized = region.resize(
        hscale,
        vips::VImage::option()->set("vscale", vscale)->set("kernel", kernel));

    // libvips rounds the output size; force the exact target.
    const int target_width = static_cast<int>(target[0]);
    const int target_height = static_cast<int>(target[1]);
    if (resized.width() > target_width || resized.height() > target_height) {
      resized = resized.crop(0, 0, std::min(resized.width(), target_width),
                             std::min(resized.height(), target_height));
    }
    if (resized.width() != target_width || resized.height() != target_height) {
      resized = resized.embed(
          0, 0, target_width, target_height,
          vips::VImage::option()->set("extend", VIPS_EXTEND_COPY));
    }

    return utilities::FromVipsImage(resized);
  } catch (const vips::VError& e) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       fmt::format("VIPS error: {}", e.what()));
  }
}

std::unique_ptr<RegionResampler> CreateRegionResampler(
    InternalHandler handler) {
  switch (handler) {
    case InternalHandler::kVips:
      return std::make_unique<VipsRegionResampler>();
    case InternalHandler::kBox:
      break;
  }
  return std::make_unique<BoxRegionResampler>();
}

}  // namespace slidescale
