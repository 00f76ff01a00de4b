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

#include "slidescale/utilities/vips.h"

#include <cstring>
#include <exception>
#include <stdexcept>
#include <vector>

#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"

namespace slidescale::utilities {

VipsInitializer::VipsInitializer(const char* argv0) {
  if (VIPS_INIT(argv0)) {
    throw std::runtime_error("Failed to initialize VIPS");
  }
  // Reads are parallelised by callers, not inside libvips
  vips_concurrency_set(1);
}

VipsInitializer::~VipsInitializer() { vips_shutdown(); }

absl::StatusOr<vips::VImage> ToVipsImage(const Image& image) {
  if (image.Empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Cannot convert an empty image to libvips");
  }

  try {
    // new_from_memory borrows the buffer, copy_memory detaches it.
    auto borrowed = vips::VImage::new_from_memory(
        const_cast<uint8_t*>(image.GetData()), image.SizeBytes(),
        static_cast<int>(image.GetWidth()), static_cast<int>(image.GetHeight()),
        static_cast<int>(image.GetChannels()), VIPS_FORMAT_UCHAR);
    return borrowed.copy_memory();
  } catch (const vips::VError& e) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       fmt::format("VIPS error: {}", e.what()));
  }
}

absl::StatusOr<Image> FromVipsImage(const vips::VImage& image) {
  const auto format = FormatFromChannels(static_cast<uint32_t>(image.bands()));
  if (!format.has_value()) {
    return MAKE_STATUS(
        absl::StatusCode::kInternal,
        fmt::format("Unsupported number of bands: {}", image.bands()));
  }

  try {
    vips::VImage uchar = image.format() == VIPS_FORMAT_UCHAR
                             ? image
                             : image.cast(VIPS_FORMAT_UCHAR);
    size_t size = 0;
    void* memory = uchar.write_to_memory(&size);
    std::vector<uint8_t> data(static_cast<uint8_t*>(memory),
                              static_cast<uint8_t*>(memory) + size);
    g_free(memory);

    return Image(ImageDimensions(static_cast<uint32_t>(uchar.width()),
                                 static_cast<uint32_t>(uchar.height())),
                 *format, std::move(data));
  } catch (const vips::VError& e) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       fmt::format("VIPS error: {}", e.what()));
  } catch (const std::invalid_argument& e) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       fmt::format("Unexpected buffer size: {}", e.what()));
  }
}

absl::Status SaveVipsImageToFile(const vips::VImage& image,
                                 const std::filesystem::path& filename,
                                 vips::VOption* options) {
  try {
    if (options) {
      image.write_to_file(filename.string().c_str(), options);
    } else {
      image.write_to_file(filename.string().c_str());
    }
    return absl::OkStatus();
  } catch (const vips::VError& e) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       fmt::format("VIPS error: {}", e.what()));
  } catch (const std::exception& e) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       fmt::format("Unexpected error: {}", e.what()));
  }
}

absl::Status SaveImageToFile(const Image& image,
                             const std::filesystem::path& filename) {
  DECLARE_ASSIGN_OR_RETURN(vips::VImage, vips_image, ToVipsImage(image));
  RETURN_IF_ERROR(SaveVipsImageToFile(vips_image, filename),
                  fmt::format("Cannot write {}", filename.string()));
  return absl::OkStatus();
}

}  // namespace slidescale::utilities
