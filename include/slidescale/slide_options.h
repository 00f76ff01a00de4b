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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_SLIDE_OPTIONS_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_SLIDE_OPTIONS_H_

#include <optional>
#include <string>

#include "slidescale/core/slide_geometry.h"
#include "slidescale/pipeline/region_resampler.h"
#include "slidescale/resample/resampling.h"

namespace slidescale {

/// @brief Options for opening a SlideImage
///
/// Resolved once when the slide image is created; a SlideImage never changes
/// its configuration afterwards.
///
/// Example usage:
/// @code
/// SlideImageOptions options;
/// options.interpolator = Resampling::kNearest;
/// options.internal_handler = InternalHandler::kVips;
/// options.overwrite_mpp = Spacing{0.25, 0.25};
///
/// auto slide = SlideImage::FromFilePath("slide.svs", ImageBackend::kOpenSlide,
///                                       options);
/// @endcode
struct SlideImageOptions {
  /// @brief Name of the slide
  ///
  /// FromFilePath uses the path when unset.
  std::optional<std::string> identifier;

  /// @brief Kernel used to resample regions
  Resampling interpolator = Resampling::kLanczos;

  /// @brief Replaces the spacing reported by the backend
  ///
  /// Written into the backend with SetSpacing, so level spacings follow.
  std::optional<Spacing> overwrite_mpp;

  /// @brief Transform regions to sRGB using the embedded ICC profile
  ///
  /// Only honoured by InternalHandler::kVips.
  bool apply_color_profile = false;

  /// @brief Resampling pipeline
  ///
  /// Defaults to InternalHandler::kBox with a warning when unset.
  std::optional<InternalHandler> internal_handler;
};

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_SLIDE_OPTIONS_H_
