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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_SLIDE_IMAGE_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_SLIDE_IMAGE_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidescale/backends/backend_factory.h"
#include "slidescale/core/coordinate_mapper.h"
#include "slidescale/image.h"
#include "slidescale/properties.h"
#include "slidescale/region_extractor.h"
#include "slidescale/region_view.h"
#include "slidescale/slide_backend.h"
#include "slidescale/slide_options.h"

namespace slidescale {

class SlideImageView;  // scaled_view.h

/**
 * @brief Whole-slide image readable at any scaling.
 *
 * Wraps one SlideBackend and reads regions at a continuous scaling relative
 * to level 0, interpolating from the closest finer pyramid level. Scalings
 * and microns per pixel are related through the average level-0 spacing:
 * `GetMpp(s) = mpp / s` and `GetScaling(m) = mpp / m`.
 *
 * The slide owns its backend and closes it in Close() or on destruction.
 * All read operations are const and may run concurrently when the backend
 * supports concurrent reads.
 *
 * Example usage:
 * @code
 * SlideImageOptions options;
 * options.internal_handler = InternalHandler::kVips;
 * ASSIGN_OR_RETURN(auto slide,
 *                  SlideImage::FromFilePath(path, ImageBackend::kOpenSlide,
 *                                           options));
 * const double scaling = slide->GetScaling(2.0);  // 2 mpp
 * ASSIGN_OR_RETURN(Image tile,
 *                  slide->ReadRegion(Size2d{0, 0}, scaling, Size2i{512, 512}));
 * @endcode
 */
class SlideImage {
 public:
  /**
   * @brief Wrap an open backend.
   *
   * Applies `options.overwrite_mpp`, then requires a valid, nearly isotropic
   * spacing.
   *
   * @return Slide image, or an unsupported-slide error when the spacing is
   *         missing or invalid
   */
  static absl::StatusOr<std::unique_ptr<SlideImage>> Create(
      std::unique_ptr<SlideBackend> backend,
      const SlideImageOptions& options = {});

  /// @brief Open a file with a built-in backend
  ///
  /// Missing files fail with kNotFound, files the backend rejects with an
  /// unsupported-slide error naming the file.
  static absl::StatusOr<std::unique_ptr<SlideImage>> FromFilePath(
      const std::filesystem::path& path,
      ImageBackend backend = ImageBackend::kOpenSlide,
      const SlideImageOptions& options = {});

  /// @brief Open a file with a backend given by name ("openslide", "tiff")
  static absl::StatusOr<std::unique_ptr<SlideImage>> FromFilePath(
      const std::filesystem::path& path, std::string_view backend_name,
      const SlideImageOptions& options = {});

  /// @brief Open a file with a custom backend factory
  static absl::StatusOr<std::unique_ptr<SlideImage>> FromFilePath(
      const std::filesystem::path& path, const BackendFactory& factory,
      const SlideImageOptions& options = {});

  ~SlideImage();

  SlideImage(const SlideImage&) = delete;
  SlideImage& operator=(const SlideImage&) = delete;
  SlideImage(SlideImage&&) = delete;
  SlideImage& operator=(SlideImage&&) = delete;

  // =========================================================================
  // Regions
  // =========================================================================

  /**
   * @brief Read a region at a continuous scaling.
   *
   * @param location Top-left (x, y) in pixels at `scaling`
   * @param scaling Scaling relative to level 0
   * @param size Output (width, height)
   * @param space Whether `location` is relative to the full image or to the
   *              scaled slide bounds
   * @return Image of exactly `size`; a bounds error, raised before any
   *         backend read, when the region leaves the scaled image
   */
  [[nodiscard]] absl::StatusOr<Image> ReadRegion(
      const Size2d& location, double scaling, const Size2i& size,
      CoordinateSpace space = CoordinateSpace::kFullImage) const;

  /// @brief Native read ReadRegion would issue, without reading
  [[nodiscard]] absl::StatusOr<NativeRegionPlan> PlanRegion(
      const Size2d& location, double scaling, const Size2i& size,
      CoordinateSpace space = CoordinateSpace::kFullImage) const;

  /// @brief View of the slide at a fixed scaling
  [[nodiscard]] SlideImageView GetScaledView(
      double scaling,
      std::optional<BoundaryMode> boundary_mode = std::nullopt) const;

  /// @brief Thumbnail fitting inside `size`, aspect ratio preserved
  [[nodiscard]] absl::StatusOr<Image> GetThumbnail(
      const ImageDimensions& size = ImageDimensions(512, 512)) const;

  // =========================================================================
  // Scaling and resolution
  // =========================================================================

  /// @brief Image size at `scaling` (truncated)
  /// @param limit_bounds Use the slide bounds instead of the full image
  [[nodiscard]] Size2i GetScaledSize(double scaling,
                                     bool limit_bounds = false) const;

  /// @brief Average microns per pixel at `scaling`
  [[nodiscard]] double GetMpp(double scaling = 1.0) const {
    return avg_mpp_ / scaling;
  }

  /// @brief Scaling for a resolution; 1.0 for nullopt or zero
  [[nodiscard]] double GetScaling(std::optional<double> mpp) const;

  /// @brief Level whose average spacing is closest to `mpp`
  [[nodiscard]] int GetClosestNativeLevel(double mpp) const;

  /// @brief Spacing of GetClosestNativeLevel(mpp)
  [[nodiscard]] Spacing GetClosestNativeMpp(double mpp) const;

  /// @brief Slide bounds at `scaling`, offset and size truncated
  [[nodiscard]] SlideBounds GetScaledSlideBounds(double scaling) const;

  // =========================================================================
  // Accessors
  // =========================================================================

  [[nodiscard]] const std::string& GetIdentifier() const { return identifier_; }
  [[nodiscard]] std::string GetVendor() const { return backend_->GetVendor(); }
  [[nodiscard]] const Properties& GetProperties() const {
    return backend_->GetProperties();
  }

  /// @brief Level 0 (width, height)
  [[nodiscard]] Size2i GetSize() const { return backend_->GetDimensions(); }

  /// @brief Level 0 spacing (x, y)
  [[nodiscard]] Spacing GetSpacing() const { return *backend_->GetSpacing(); }

  [[nodiscard]] std::optional<double> GetMagnification() const {
    return backend_->GetMagnification();
  }

  /// @brief Width / height
  [[nodiscard]] double GetAspectRatio() const;

  [[nodiscard]] SlideBounds GetSlideBounds() const {
    return backend_->GetSlideBounds();
  }

  [[nodiscard]] std::optional<std::vector<uint8_t>> GetColorProfile() const {
    return backend_->GetColorProfile();
  }

  [[nodiscard]] Resampling GetInterpolator() const {
    return extractor_->GetInterpolator();
  }

  [[nodiscard]] InternalHandler GetInternalHandler() const {
    return extractor_->GetInternalHandler();
  }

  [[nodiscard]] bool GetApplyColorProfile() const {
    return apply_color_profile_;
  }

  [[nodiscard]] const SlideBackend& GetBackend() const { return *backend_; }

  /// @brief One-line summary of identifier, vendor, resolution and pipeline
  [[nodiscard]] std::string DebugString() const;

  // =========================================================================
  // Lifetime
  // =========================================================================

  /// @brief Release the backend; idempotent
  void Close();

  [[nodiscard]] bool IsClosed() const { return backend_->IsClosed(); }

 private:
  SlideImage(std::unique_ptr<SlideBackend> backend, std::string identifier,
             double avg_mpp, Resampling interpolator,
             InternalHandler internal_handler, bool apply_color_profile);

  std::unique_ptr<SlideBackend> backend_;
  std::unique_ptr<RegionExtractor> extractor_;
  std::string identifier_;
  double avg_mpp_;
  bool apply_color_profile_;
};

std::ostream& operator<<(std::ostream& os, const SlideImage& slide);

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_SLIDE_IMAGE_H_
