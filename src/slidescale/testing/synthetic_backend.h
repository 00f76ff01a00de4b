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
#ifndef SLIDESCALE_SRC_SLIDESCALE_TESTING_SYNTHETIC_BACKEND_H_
#define SLIDESCALE_SRC_SLIDESCALE_TESTING_SYNTHETIC_BACKEND_H_

#include <atomic>
#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "slidescale/image.h"
#include "slidescale/properties.h"
#include "slidescale/slide_backend.h"

namespace slidescale::testing {

/// @brief Pixel pattern rendered by SyntheticBackend
enum class Pattern {
  kGradient,  ///< (x mod 256, y mod 256, (x + y) mod 256) at level 0
  kConstant,  ///< Every pixel equals SyntheticConfig::fill
};

/// @brief Shape and metadata of a synthetic slide
struct SyntheticConfig {
  Size2i dimensions{1000, 1000};
  std::vector<double> downsamples{1.0};
  std::optional<Spacing> spacing = Spacing{0.25, 0.25};
  std::optional<SlideBounds> bounds;
  std::optional<std::vector<uint8_t>> color_profile;
  std::optional<double> magnification = 40.0;
  std::string vendor = "synthetic";
  Pattern pattern = Pattern::kGradient;
  std::vector<uint8_t> fill{200, 100, 50};
  /// kRGBA adds an opaque alpha channel
  ImageFormat format = ImageFormat::kRGB;
};

/// @brief Arguments of one ReadRegion call
struct ReadCall {
  Size2i level_zero_location;
  int level{0};
  ImageDimensions size;
};

/**
 * @brief In-memory RGB or RGBA backend for tests.
 *
 * Renders pixels on demand from level-zero coordinates, so every level of
 * the pyramid shows the same content. Pixels outside a level are zero. All
 * reads are recorded; a failure status can be injected for subsequent reads.
 */
class SyntheticBackend : public SlideBackend {
 public:
  explicit SyntheticBackend(SyntheticConfig config = {})
      : config_(std::move(config)) {
    spacing_ = config_.spacing;
    properties_.Set("synthetic.vendor", config_.vendor);
    properties_.Set("synthetic.level-count",
                    static_cast<int64_t>(config_.downsamples.size()));
  }

  ~SyntheticBackend() override { Close(); }

  int GetLevelCount() const override {
    return static_cast<int>(config_.downsamples.size());
  }

  absl::StatusOr<LevelInfo> GetLevelInfo(int level) const override {
    if (level < 0 || level >= GetLevelCount()) {
      return absl::InvalidArgumentError("Invalid level");
    }
    const double downsample = config_.downsamples[level];
    LevelInfo info;
    info.downsample = downsample;
    info.dimensions = Size2i(
        static_cast<int64_t>(std::floor(config_.dimensions[0] / downsample)),
        static_cast<int64_t>(std::floor(config_.dimensions[1] / downsample)));
    if (spacing_.has_value()) {
      info.spacing = *spacing_ * downsample;
    }
    return info;
  }

  std::string GetVendor() const override { return config_.vendor; }

  const Properties& GetProperties() const override { return properties_; }

  std::optional<double> GetMagnification() const override {
    return config_.magnification;
  }

  SlideBounds GetSlideBounds() const override {
    if (config_.bounds.has_value()) {
      return *config_.bounds;
    }
    return SlideBackend::GetSlideBounds();
  }

  std::optional<std::vector<uint8_t>> GetColorProfile() const override {
    return config_.color_profile;
  }

  ImageFormat GetImageFormat() const override { return config_.format; }

  std::string GetName() const override { return "SyntheticBackend"; }

  /// @brief Number of ReadRegion calls that reached the backend
  int GetReadCount() const { return read_count_.load(); }

  /// @brief Recorded calls, oldest first
  std::vector<ReadCall> GetReadCalls() const {
    absl::MutexLock lock(&mutex_);
    return calls_;
  }

  /// @brief Make every following read fail with `status`
  void FailReadsWith(absl::Status status) {
    absl::MutexLock lock(&mutex_);
    failure_ = std::move(status);
  }

  /// @brief Number of times CloseImpl ran
  int GetCloseCount() const { return close_count_; }

  /// @brief Expected level-0 pixel value
  static uint8_t GradientValue(int64_t x, int64_t y, uint32_t channel) {
    switch (channel) {
      case 0:
        return static_cast<uint8_t>(x % 256);
      case 1:
        return static_cast<uint8_t>(y % 256);
      default:
        return static_cast<uint8_t>((x + y) % 256);
    }
  }

 protected:
  absl::StatusOr<Image> ReadRegionImpl(
      const Size2i& level_zero_location, int level,
      const ImageDimensions& size) const override {
    read_count_.fetch_add(1);
    {
      absl::MutexLock lock(&mutex_);
      calls_.push_back(ReadCall{level_zero_location, level, size});
      if (!failure_.ok()) {
        return failure_;
      }
    }

    const double downsample = config_.downsamples[level];
    const LevelInfo info = *GetLevelInfo(level);
    Image image(size, config_.format);
    // Level pixel nearest to the level-zero location.
    const int64_t origin_x = std::lround(level_zero_location[0] / downsample);
    const int64_t origin_y = std::lround(level_zero_location[1] / downsample);

    for (uint32_t row = 0; row < size[1]; ++row) {
      const int64_t level_y = origin_y + row;
      if (level_y < 0 || level_y >= info.dimensions[1]) {
        continue;
      }
      for (uint32_t col = 0; col < size[0]; ++col) {
        const int64_t level_x = origin_x + col;
        if (level_x < 0 || level_x >= info.dimensions[0]) {
          continue;
        }
        const auto x = static_cast<int64_t>(level_x * downsample);
        const auto y = static_cast<int64_t>(level_y * downsample);
        for (uint32_t c = 0; c < 3; ++c) {
          image.At(row, col, c) = config_.pattern == Pattern::kConstant
                                      ? config_.fill[c]
                                      : GradientValue(x, y, c);
        }
        if (config_.format == ImageFormat::kRGBA) {
          image.At(row, col, 3) = 255;
        }
      }
    }
    return image;
  }

  void CloseImpl() override { ++close_count_; }

 private:
  SyntheticConfig config_;
  Properties properties_;
  int close_count_ = 0;
  mutable std::atomic<int> read_count_{0};
  mutable absl::Mutex mutex_;
  mutable std::vector<ReadCall> calls_;
  absl::Status failure_;
};

/// @brief Convenience factory returning an owning pointer
inline std::unique_ptr<SyntheticBackend> MakeSyntheticBackend(
    SyntheticConfig config = {}) {
  return std::make_unique<SyntheticBackend>(std::move(config));
}

}  // namespace slidescale::testing

#endif  // SLIDESCALE_SRC_SLIDESCALE_TESTING_SYNTHETIC_BACKEND_H_
