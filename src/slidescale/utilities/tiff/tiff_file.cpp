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

#include "slidescale/utilities/tiff/tiff_file.h"

#include <tiffio.h>

#include <cstring>
#include <string>
#include <system_error>
#include <utility>

#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"

namespace slidescale {

absl::StatusOr<TiffFile> TiffFile::Open(
    const std::filesystem::path& filename) {
  std::error_code ec;
  if (!std::filesystem::exists(filename, ec)) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       fmt::format("File not found: {}", filename.string()));
  }

  TIFF* tif = TIFFOpen(filename.string().c_str(), "rm");
  if (tif == nullptr) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        fmt::format("Cannot open TIFF file: {}", filename.string()));
  }
  return TiffFile(tif);
}

TiffFile::TiffFile(TIFF* tif) : tif_(tif) {}

absl::StatusOr<uint16_t> TiffFile::GetDirectoryCount() const {
  if (directory_count_.has_value()) {
    return *directory_count_;
  }

  TIFF* tif = tif_.get();
  const tdir_t current = TIFFCurrentDirectory(tif);
  if (TIFFSetDirectory(tif, 0) == 0) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       "Failed to set directory to 0");
  }

  uint16_t count = 1;
  while (TIFFReadDirectory(tif) != 0) {
    ++count;
  }

  if (TIFFSetDirectory(tif, current) == 0) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       "Failed to restore the current directory");
  }

  directory_count_ = count;
  return count;
}

absl::Status TiffFile::SetDirectory(uint16_t dir_index) {
  TIFF* tif = tif_.get();
  if (TIFFSetDirectory(tif, dir_index) == 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        fmt::format("Failed to set directory to {}", dir_index));
  }
  current_directory_ = dir_index;

  const auto compression = GetOptionalField<uint16_t>(TIFFTAG_COMPRESSION);
  const auto photometric = GetOptionalField<uint16_t>(TIFFTAG_PHOTOMETRIC);
  if (compression == COMPRESSION_JPEG && photometric == PHOTOMETRIC_YCBCR) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
    TIFFSetField(tif, TIFFTAG_JPEGCOLORMODE, JPEGCOLORMODE_RGB);
  }
  return absl::OkStatus();
}

template <typename T>
absl::StatusOr<T> TiffFile::GetRequiredField(ttag_t tag) const {
  T value{};
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetField(tif_.get(), tag, &value) != 1) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       fmt::format("Required field (tag {}) not found",
                                   static_cast<uint32_t>(tag)));
  }
  return value;
}

template <typename T>
std::optional<T> TiffFile::GetOptionalField(ttag_t tag) const {
  T value{};
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetField(tif_.get(), tag, &value) == 1) {
    return value;
  }
  return std::nullopt;
}

std::string TiffFile::GetStringField(ttag_t tag) const {
  char* value = nullptr;
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetField(tif_.get(), tag, &value) == 1 && value != nullptr) {
    return std::string(value, std::strlen(value));
  }
  return "";
}

absl::StatusOr<TiffDirectoryInfo> TiffFile::GetDirectoryInfo() const {
  TiffDirectoryInfo info;
  info.index = current_directory_;

  DECLARE_ASSIGN_OR_RETURN(uint32_t, width,
                           GetRequiredField<uint32_t>(TIFFTAG_IMAGEWIDTH));
  DECLARE_ASSIGN_OR_RETURN(uint32_t, height,
                           GetRequiredField<uint32_t>(TIFFTAG_IMAGELENGTH));
  info.image_dims = TiffDimensions(width, height);

  if (TIFFIsTiled(tif_.get()) != 0) {
    DECLARE_ASSIGN_OR_RETURN(uint32_t, tile_width,
                             GetRequiredField<uint32_t>(TIFFTAG_TILEWIDTH));
    DECLARE_ASSIGN_OR_RETURN(uint32_t, tile_height,
                             GetRequiredField<uint32_t>(TIFFTAG_TILELENGTH));
    info.tile_dims = TiffDimensions(tile_width, tile_height);
  }

  info.samples_per_pixel =
      GetOptionalField<uint16_t>(TIFFTAG_SAMPLESPERPIXEL).value_or(1);
  info.bits_per_sample =
      GetOptionalField<uint16_t>(TIFFTAG_BITSPERSAMPLE).value_or(1);
  info.photometric = GetOptionalField<uint16_t>(TIFFTAG_PHOTOMETRIC)
                         .value_or(PHOTOMETRIC_MINISBLACK);
  info.compression = GetOptionalField<uint16_t>(TIFFTAG_COMPRESSION)
                         .value_or(COMPRESSION_NONE);
  info.planar_config = GetOptionalField<uint16_t>(TIFFTAG_PLANARCONFIG)
                           .value_or(PLANARCONFIG_CONTIG);
  info.subfile_type =
      GetOptionalField<uint32_t>(TIFFTAG_SUBFILETYPE).value_or(0);
  return info;
}

std::string TiffFile::GetImageDescription() const {
  return GetStringField(TIFFTAG_IMAGEDESCRIPTION);
}

std::string TiffFile::GetSoftware() const {
  return GetStringField(TIFFTAG_SOFTWARE);
}

std::optional<float> TiffFile::GetXResolution() const {
  return GetOptionalField<float>(TIFFTAG_XRESOLUTION);
}

std::optional<float> TiffFile::GetYResolution() const {
  return GetOptionalField<float>(TIFFTAG_YRESOLUTION);
}

uint16_t TiffFile::GetResolutionUnit() const {
  return GetOptionalField<uint16_t>(TIFFTAG_RESOLUTIONUNIT)
      .value_or(RESUNIT_INCH);
}

std::optional<std::vector<uint8_t>> TiffFile::GetIccProfile() const {
  uint32_t length = 0;
  void* data = nullptr;
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetField(tif_.get(), TIFFTAG_ICCPROFILE, &length, &data) != 1 ||
      data == nullptr || length == 0) {
    return std::nullopt;
  }
  const auto* bytes = static_cast<const uint8_t*>(data);
  return std::vector<uint8_t>(bytes, bytes + length);
}

absl::StatusOr<size_t> TiffFile::GetTileSize() const {
  const tmsize_t size = TIFFTileSize(tif_.get());
  if (size <= 0) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       "Failed to determine tile size");
  }
  return static_cast<size_t>(size);
}

absl::Status TiffFile::ReadTile(void* buffer, uint32_t x, uint32_t y) const {
  const tmsize_t bytes_read = TIFFReadTile(tif_.get(), buffer, x, y, 0, 0);
  if (bytes_read < 0) {
    return MAKE_STATUS(
        absl::StatusCode::kDataLoss,
        fmt::format("Failed to read tile at ({}, {}) in directory {}", x, y,
                    current_directory_));
  }
  return absl::OkStatus();
}

}  // namespace slidescale
