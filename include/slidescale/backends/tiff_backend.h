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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_TIFF_BACKEND_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_TIFF_BACKEND_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "slidescale/backends/backend_creator.h"
#include "slidescale/image.h"
#include "slidescale/properties.h"
#include "slidescale/slide_backend.h"
#include "slidescale/utilities/tiff/tiff_file.h"

/**
 * @file tiff_backend.h
 * @brief Pyramidal TIFF backend on top of libtiff
 *
 * Every tiled 8-bit directory is a pyramid level; directories are ordered by
 * area, the largest being level 0. Stripped directories (thumbnails, labels,
 * macro images) and masks are ignored.
 *
 * Calibration comes from the Aperio ImageDescription (MPP, AppMag) when
 * present, otherwise from the TIFF resolution tags of the largest level.
 */

namespace slidescale {

class TiffBackend : public SlideBackend, public BackendCreator<TiffBackend> {
 public:
  /// @brief Open a pyramidal TIFF
  /// @return Backend, or an unsupported-slide error when the file has no
  ///         usable tiled level
  static absl::StatusOr<std::unique_ptr<TiffBackend>> Create(
      const std::filesystem::path& filename);

  ~TiffBackend() override;

  int GetLevelCount() const override {
    return static_cast<int>(levels_.size());
  }

  absl::StatusOr<LevelInfo> GetLevelInfo(int level) const override;

  std::string GetVendor() const override { return vendor_; }

  const Properties& GetProperties() const override { return properties_; }

  std::optional<double> GetMagnification() const override {
    return magnification_;
  }

  std::optional<std::vector<uint8_t>> GetColorProfile() const override {
    return color_profile_;
  }

  /// @brief Format of level 0; every level shares its sample layout
  ImageFormat GetImageFormat() const override;

  std::string GetName() const override { return "TiffBackend"; }

 protected:
  absl::StatusOr<Image> ReadRegionImpl(
      const Size2i& level_zero_location, int level,
      const ImageDimensions& size) const override;

  void CloseImpl() override;

 private:
  friend class BackendCreator<TiffBackend>;

  /// @brief One pyramid level backed by one TIFF directory
  struct TiffLevel {
    TiffDirectoryInfo directory;
    double downsample{1.0};
  };

  TiffBackend(TiffFile file, std::vector<TiffLevel> levels);

  static absl::Status ValidateInput(const std::filesystem::path& filename);

  static absl::StatusOr<std::unique_ptr<TiffBackend>> CreateBackendImpl(
      const std::filesystem::path& filename);

  /// @brief Read vendor, spacing, magnification and properties
  absl::Status LoadMetadata() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  mutable absl::Mutex mutex_;
  mutable std::optional<TiffFile> file_ ABSL_GUARDED_BY(mutex_);

  std::vector<TiffLevel> levels_;
  std::string vendor_;
  std::optional<double> magnification_;
  std::optional<std::vector<uint8_t>> color_profile_;
  Properties properties_;
};

/// @brief Microns per pixel from a TIFF resolution and unit
///
/// Supports RESUNIT_CENTIMETER and RESUNIT_INCH; nullopt otherwise or for a
/// non-positive resolution.
std::optional<double> ResolutionToMpp(float resolution, uint16_t unit);

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_TIFF_BACKEND_H_
