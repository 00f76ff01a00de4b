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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_UTILITIES_VIPS_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_UTILITIES_VIPS_H_

#include <vips/vips8>

#include <filesystem>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidescale/image.h"

namespace slidescale::utilities {

/// @brief Starts libvips on construction and shuts it down on destruction
///
/// Create one per process (CLI main, test environment) before any other
/// libvips call.
class VipsInitializer {
 public:
  explicit VipsInitializer(const char* argv0);

  ~VipsInitializer();

  VipsInitializer(const VipsInitializer&) = delete;
  VipsInitializer& operator=(const VipsInitializer&) = delete;
};

/// @brief Copy an 8-bit interleaved image into a libvips image
/// @return Image owning its own pixel memory, or kInternal on failure
absl::StatusOr<vips::VImage> ToVipsImage(const Image& image);

/// @brief Copy a libvips image into an interleaved 8-bit Image
///
/// Non-uchar band formats are cast to uchar first. Only 1 to 4 bands are
/// supported.
absl::StatusOr<Image> FromVipsImage(const vips::VImage& image);

/**
 * @brief Save a libvips image to a file.
 *
 * The format is picked by libvips from the file extension. libvips errors are
 * returned as kInternal statuses.
 *
 * @param image The image to save.
 * @param filename The path to the file to save the image to.
 * @param options Optional saver options.
 */
absl::Status SaveVipsImageToFile(const vips::VImage& image,
                                 const std::filesystem::path& filename,
                                 vips::VOption* options = nullptr);

/// @brief Save an Image through libvips (png, jpeg, tiff, ...)
absl::Status SaveImageToFile(const Image& image,
                             const std::filesystem::path& filename);

}  // namespace slidescale::utilities

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_UTILITIES_VIPS_H_
