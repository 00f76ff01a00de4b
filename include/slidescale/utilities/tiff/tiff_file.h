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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_UTILITIES_TIFF_TIFF_FILE_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_UTILITIES_TIFF_TIFF_FILE_H_

#include <tiffio.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidescale/utilities/numeric.h"

namespace slidescale {

/// @brief Width and height of a TIFF image or tile
using TiffDimensions = Size<uint32_t, 2>;

/// @brief Layout of one TIFF directory
struct TiffDirectoryInfo {
  uint16_t index{0};
  TiffDimensions image_dims;
  std::optional<TiffDimensions> tile_dims;  ///< Set for tiled directories
  uint16_t samples_per_pixel{1};
  uint16_t bits_per_sample{8};
  uint16_t photometric{PHOTOMETRIC_MINISBLACK};
  uint16_t compression{COMPRESSION_NONE};
  uint16_t planar_config{PLANARCONFIG_CONTIG};
  uint32_t subfile_type{0};

  [[nodiscard]] bool IsTiled() const { return tile_dims.has_value(); }

  [[nodiscard]] bool IsMask() const {
    return (subfile_type & FILETYPE_MASK) != 0;
  }

  [[nodiscard]] uint64_t GetArea() const {
    return static_cast<uint64_t>(image_dims[0]) * image_dims[1];
  }
};

/// @brief RAII wrapper around a read-only libtiff handle
///
/// Not thread-safe: the current directory is shared state. Callers serialise
/// access (TiffBackend holds a mutex around every use).
class TiffFile {
 public:
  /// @brief Open a TIFF file for reading
  /// @return Open file, kNotFound if the path does not exist or
  ///         kInvalidArgument if libtiff cannot parse it
  static absl::StatusOr<TiffFile> Open(const std::filesystem::path& filename);

  ~TiffFile() = default;

  TiffFile(const TiffFile&) = delete;
  TiffFile& operator=(const TiffFile&) = delete;

  TiffFile(TiffFile&& other) noexcept = default;
  TiffFile& operator=(TiffFile&& other) noexcept = default;

  /// @brief Number of directories, counted once and cached
  absl::StatusOr<uint16_t> GetDirectoryCount() const;

  /// @brief Switch the current directory
  ///
  /// JPEG-compressed YCbCr directories are switched to RGB output so tiles
  /// decode to interleaved RGB.
  absl::Status SetDirectory(uint16_t dir_index);

  [[nodiscard]] uint16_t GetCurrentDirectory() const {
    return current_directory_;
  }

  /// @brief Layout of the current directory
  absl::StatusOr<TiffDirectoryInfo> GetDirectoryInfo() const;

  /// @brief TIFFTAG_IMAGEDESCRIPTION, empty if absent
  [[nodiscard]] std::string GetImageDescription() const;

  /// @brief TIFFTAG_SOFTWARE, empty if absent
  [[nodiscard]] std::string GetSoftware() const;

  [[nodiscard]] std::optional<float> GetXResolution() const;
  [[nodiscard]] std::optional<float> GetYResolution() const;

  /// @brief TIFFTAG_RESOLUTIONUNIT, RESUNIT_INCH when absent
  [[nodiscard]] uint16_t GetResolutionUnit() const;

  /// @brief TIFFTAG_ICCPROFILE of the current directory
  [[nodiscard]] std::optional<std::vector<uint8_t>> GetIccProfile() const;

  /// @brief Bytes needed by ReadTile
  absl::StatusOr<size_t> GetTileSize() const;

  /// @brief Decode the tile containing pixel (x, y) of the current directory
  absl::Status ReadTile(void* buffer, uint32_t x, uint32_t y) const;

 private:
  struct TiffCloser {
    void operator()(TIFF* tif) const {
      if (tif != nullptr) {
        TIFFClose(tif);
      }
    }
  };

  explicit TiffFile(TIFF* tif);

  template <typename T>
  absl::StatusOr<T> GetRequiredField(ttag_t tag) const;

  template <typename T>
  std::optional<T> GetOptionalField(ttag_t tag) const;

  [[nodiscard]] std::string GetStringField(ttag_t tag) const;

  std::unique_ptr<TIFF, TiffCloser> tif_;
  uint16_t current_directory_ = 0;
  mutable std::optional<uint16_t> directory_count_;
};

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_UTILITIES_TIFF_TIFF_FILE_H_
