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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_SLIDE_BACKEND_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_SLIDE_BACKEND_H_

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidescale/core/slide_geometry.h"
#include "slidescale/image.h"
#include "slidescale/properties.h"
#include "slidescale/utilities/numeric.h"

namespace slidescale {

/// @brief Abstract base class for pyramidal slide backends
///
/// A backend decodes one slide file. It exposes the discrete pyramid, slide
/// metadata and native pixel reads addressed by a level-zero location, a
/// level and a size in pixels of that level. Continuous scaling is built on
/// top of this contract by SlideImage.
///
/// The spacing is held by the base class so it can be overridden by callers
/// (SetSpacing) when a file carries no or wrong calibration.
///
/// Reads after Close() fail with kFailedPrecondition. Implementations must
/// call Close() from their destructor.
class SlideBackend {
 public:
  /// @brief Virtual destructor
  virtual ~SlideBackend() = default;

  /// @brief Delete copy constructor and assignment
  SlideBackend(const SlideBackend&) = delete;
  SlideBackend& operator=(const SlideBackend&) = delete;

  /// @brief Delete move constructor and assignment
  SlideBackend(SlideBackend&&) = delete;
  SlideBackend& operator=(SlideBackend&&) = delete;

  // =========================================================================
  // Pyramid
  // =========================================================================

  /// @brief Get number of pyramid levels
  /// @return Number of levels (level 0 is full resolution)
  [[nodiscard]] virtual int GetLevelCount() const = 0;

  /// @brief Get level information
  /// @param level Pyramid level
  /// @return Dimensions and downsample of the level or error status
  [[nodiscard]] virtual absl::StatusOr<LevelInfo> GetLevelInfo(
      int level) const = 0;

  /// @brief Level 0 dimensions, {0, 0} for an empty pyramid
  [[nodiscard]] Size2i GetDimensions() const;

  /// @brief Dimensions of every level, finest first
  [[nodiscard]] std::vector<Size2i> GetLevelDimensions() const;

  /// @brief Downsample factor of every level, finest first
  [[nodiscard]] std::vector<double> GetLevelDownsamples() const;

  /// @brief Spacing of every level (spacing * downsample)
  /// @return Level spacings, or an unsupported-slide error without spacing
  [[nodiscard]] absl::StatusOr<std::vector<Spacing>> GetLevelSpacings() const;

  /// @brief Pyramid, level spacings and bounds in one structure
  [[nodiscard]] PyramidGeometry GetGeometry() const;

  /// @brief Level to read for a downsample factor
  ///
  /// Largest level with a downsample not exceeding `downsample`, level 0 if
  /// there is none.
  [[nodiscard]] virtual int GetBestLevelForDownsample(double downsample) const;

  // =========================================================================
  // Metadata
  // =========================================================================

  /// @brief Microns per pixel at level 0, if known
  [[nodiscard]] const std::optional<Spacing>& GetSpacing() const {
    return spacing_;
  }

  /// @brief Override the microns per pixel at level 0
  void SetSpacing(const Spacing& spacing) { spacing_ = spacing; }

  /// @brief Scanner vendor, empty if unknown
  [[nodiscard]] virtual std::string GetVendor() const = 0;

  /// @brief Raw and derived slide properties
  [[nodiscard]] virtual const Properties& GetProperties() const = 0;

  /// @brief Objective power, if known
  [[nodiscard]] virtual std::optional<double> GetMagnification() const = 0;

  /// @brief Tissue bounds at level 0
  /// @details Defaults to the full image.
  [[nodiscard]] virtual SlideBounds GetSlideBounds() const;

  /// @brief Embedded ICC profile, if any
  [[nodiscard]] virtual std::optional<std::vector<uint8_t>> GetColorProfile()
      const {
    return std::nullopt;
  }

  /// @brief Pixel layout of the images ReadRegion returns
  [[nodiscard]] virtual ImageFormat GetImageFormat() const {
    return ImageFormat::kRGB;
  }

  /// @brief Backend name, e.g. "OpenSlideBackend"
  [[nodiscard]] virtual std::string GetName() const = 0;

  // =========================================================================
  // Pixels
  // =========================================================================

  /**
   * @brief Read native pixels.
   *
   * Validates the state and arguments, then forwards to ReadRegionImpl.
   * Pixels of the requested rectangle that fall outside the level are
   * transparent (OpenSlide) or zero.
   *
   * @param level_zero_location Top-left corner in level 0 coordinates
   * @param level Pyramid level to read from
   * @param size Size in pixels of `level`
   * @return Image of exactly `size`
   */
  [[nodiscard]] absl::StatusOr<Image> ReadRegion(
      const Size2i& level_zero_location, int level, const Size2i& size) const;

  /**
   * @brief Thumbnail fitting inside a bounding box.
   *
   * Reads the best level for max(dimensions / bound) entirely and resizes it
   * with Lanczos so that it fits inside `bound`, preserving the aspect ratio.
   */
  [[nodiscard]] virtual absl::StatusOr<Image> GetThumbnail(
      const ImageDimensions& bound) const;

  // =========================================================================
  // Lifetime
  // =========================================================================

  /// @brief Release the underlying handle; idempotent
  void Close();

  /// @brief True once Close() has been called
  [[nodiscard]] bool IsClosed() const {
    return closed_.load(std::memory_order_acquire);
  }

 protected:
  /// @brief Protected constructor (only derived classes can instantiate)
  SlideBackend() = default;

  /// @brief Backend-specific read, arguments already validated
  [[nodiscard]] virtual absl::StatusOr<Image> ReadRegionImpl(
      const Size2i& level_zero_location, int level,
      const ImageDimensions& size) const = 0;

  /// @brief Backend-specific release, called at most once
  virtual void CloseImpl() = 0;

  /// @brief Fails with kFailedPrecondition after Close()
  [[nodiscard]] absl::Status CheckOpen() const;

  std::optional<Spacing> spacing_;

 private:
  std::atomic<bool> closed_{false};
};

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_SLIDE_BACKEND_H_
