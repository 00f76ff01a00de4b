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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_OPENSLIDE_BACKEND_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_OPENSLIDE_BACKEND_H_

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
#include "openslide/openslide.h"
#include "slidescale/backends/backend_creator.h"
#include "slidescale/image.h"
#include "slidescale/properties.h"
#include "slidescale/slide_backend.h"

/**
 * @file openslide_backend.h
 * @brief Backend for every format libopenslide understands
 *
 * Level layout, vendor, calibration, objective power and tissue bounds are
 * read once at open from the standard `openslide.*` properties. All vendor
 * properties are exposed unchanged through GetProperties().
 *
 * Pixels come back as RGBA with straight (non-premultiplied) alpha.
 */

namespace slidescale {

class OpenSlideBackend : public SlideBackend,
                         public BackendCreator<OpenSlideBackend> {
 public:
  static absl::StatusOr<std::unique_ptr<OpenSlideBackend>> Create(
      const std::filesystem::path& filename);

  ~OpenSlideBackend() override;

  int GetLevelCount() const override {
    return static_cast<int>(levels_.size());
  }

  absl::StatusOr<LevelInfo> GetLevelInfo(int level) const override;

  std::string GetVendor() const override { return vendor_; }

  const Properties& GetProperties() const override { return properties_; }

  std::optional<double> GetMagnification() const override {
    return magnification_;
  }

  SlideBounds GetSlideBounds() const override { return bounds_; }

  std::optional<std::vector<uint8_t>> GetColorProfile() const override {
    return color_profile_;
  }

  /// @brief OpenSlide can pick a level itself; this defers to it
  int GetBestLevelForDownsample(double downsample) const override;

  /// @brief OpenSlide always returns unpremultiplied RGBA
  ImageFormat GetImageFormat() const override { return ImageFormat::kRGBA; }

  std::string GetName() const override { return "OpenSlideBackend"; }

 protected:
  absl::StatusOr<Image> ReadRegionImpl(
      const Size2i& level_zero_location, int level,
      const ImageDimensions& size) const override;

  void CloseImpl() override;

 private:
  friend class BackendCreator<OpenSlideBackend>;

  struct OpenSlideCloser {
    void operator()(openslide_t* slide) const {
      if (slide != nullptr) {
        openslide_close(slide);
      }
    }
  };

  using OpenSlideHandle = std::unique_ptr<openslide_t, OpenSlideCloser>;

  explicit OpenSlideBackend(OpenSlideHandle slide);

  static absl::Status ValidateInput(const std::filesystem::path& filename);

  static absl::StatusOr<std::unique_ptr<OpenSlideBackend>> CreateBackendImpl(
      const std::filesystem::path& filename);

  absl::Status LoadMetadata() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  /// @brief Error recorded on the handle, OK when there is none
  absl::Status CheckHandleError() const ABSL_SHARED_LOCKS_REQUIRED(mutex_);

  mutable absl::Mutex mutex_;
  OpenSlideHandle slide_ ABSL_GUARDED_BY(mutex_);

  std::vector<LevelInfo> levels_;
  std::string vendor_;
  std::optional<double> magnification_;
  SlideBounds bounds_;
  std::optional<std::vector<uint8_t>> color_profile_;
  Properties properties_;
};

/// @brief Convert OpenSlide's premultiplied ARGB words to straight RGBA bytes
void PremultipliedArgbToRgba(const uint32_t* source, size_t pixel_count,
                             uint8_t* destination);

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_OPENSLIDE_BACKEND_H_
