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

#include "slidescale/backends/openslide_backend.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/numbers.h"
#include "slidescale/errors.h"
#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"

namespace slidescale {

namespace {

std::optional<std::string> GetProperty(openslide_t* slide, const char* name) {
  const char* value = openslide_get_property_value(slide, name);
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

std::optional<double> GetDoubleProperty(openslide_t* slide, const char* name) {
  auto value = GetProperty(slide, name);
  double parsed = 0.0;
  if (!value.has_value() || !absl::SimpleAtod(*value, &parsed)) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<int64_t> GetIntProperty(openslide_t* slide, const char* name) {
  auto value = GetProperty(slide, name);
  int64_t parsed = 0;
  if (!value.has_value() || !absl::SimpleAtoi(*value, &parsed)) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

void PremultipliedArgbToRgba(const uint32_t* source, size_t pixel_count,
                             uint8_t* destination) {
  for (size_t i = 0; i < pixel_count; ++i) {
    const uint32_t argb = source[i];
    const uint32_t alpha = argb >> 24;
    uint32_t red = (argb >> 16) & 0xff;
    uint32_t green = (argb >> 8) & 0xff;
    uint32_t blue = argb & 0xff;
    if (alpha != 0 && alpha != 255) {
      red = (red * 255 + alpha / 2) / alpha;
      green = (green * 255 + alpha / 2) / alpha;
      blue = (blue * 255 + alpha / 2) / alpha;
    }
    uint8_t* out = destination + i * 4;
    out[0] = static_cast<uint8_t>(red > 255 ? 255 : red);
    out[1] = static_cast<uint8_t>(green > 255 ? 255 : green);
    out[2] = static_cast<uint8_t>(blue > 255 ? 255 : blue);
    out[3] = static_cast<uint8_t>(alpha);
  }
}

absl::StatusOr<std::unique_ptr<OpenSlideBackend>> OpenSlideBackend::Create(
    const std::filesystem::path& filename) {
  return CreateImpl(filename);
}

absl::Status OpenSlideBackend::ValidateInput(
    const std::filesystem::path& filename) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(filename, ec)) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       fmt::format("Not a file: {}", filename.string()));
  }
  if (openslide_detect_vendor(filename.c_str()) == nullptr) {
    return MAKE_STATUS(ErrorCodes::kUnsupportedSlide,
                       fmt::format("OpenSlide does not recognise {}",
                                   filename.string()));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<OpenSlideBackend>>
OpenSlideBackend::CreateBackendImpl(const std::filesystem::path& filename) {
  OpenSlideHandle slide(openslide_open(filename.c_str()));
  if (!slide) {
    return MAKE_STATUS(
        ErrorCodes::kUnsupportedSlide,
        fmt::format("OpenSlide failed to open {}", filename.string()));
  }
  if (const char* error = openslide_get_error(slide.get()); error != nullptr) {
    return MAKE_STATUS(ErrorCodes::kUnsupportedSlide,
                       fmt::format("OpenSlide failed to open {}: {}",
                                   filename.string(), error));
  }

  std::unique_ptr<OpenSlideBackend> backend(
      new OpenSlideBackend(std::move(slide)));
  {
    absl::MutexLock lock(&backend->mutex_);
    RETURN_IF_ERROR(backend->LoadMetadata(),
                    "Failed to load OpenSlide metadata");
  }
  return backend;
}

OpenSlideBackend::OpenSlideBackend(OpenSlideHandle slide)
    : slide_(std::move(slide)) {}

OpenSlideBackend::~OpenSlideBackend() { Close(); }

absl::Status OpenSlideBackend::CheckHandleError() const {
  if (const char* error = openslide_get_error(slide_.get());
      error != nullptr) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       fmt::format("OpenSlide error: {}", error));
  }
  return absl::OkStatus();
}

absl::Status OpenSlideBackend::LoadMetadata() {
  openslide_t* slide = slide_.get();

  const int32_t level_count = openslide_get_level_count(slide);
  if (level_count <= 0) {
    RETURN_IF_ERROR(CheckHandleError(), "");
    return MAKE_STATUS(ErrorCodes::kUnsupportedSlide, "Slide has no levels");
  }

  levels_.reserve(level_count);
  for (int32_t level = 0; level < level_count; ++level) {
    int64_t width = 0;
    int64_t height = 0;
    openslide_get_level_dimensions(slide, level, &width, &height);
    LevelInfo info;
    info.dimensions = Size2i(width, height);
    info.downsample = openslide_get_level_downsample(slide, level);
    levels_.push_back(info);
  }
  RETURN_IF_ERROR(CheckHandleError(), "");

  for (const char* const* name = openslide_get_property_names(slide);
       name != nullptr && *name != nullptr; ++name) {
    if (auto value = GetProperty(slide, *name); value.has_value()) {
      properties_.Set(*name, std::move(*value));
    }
  }

  vendor_ = GetProperty(slide, OPENSLIDE_PROPERTY_NAME_VENDOR)
                .value_or("unknown");

  const auto mpp_x = GetDoubleProperty(slide, OPENSLIDE_PROPERTY_NAME_MPP_X);
  const auto mpp_y = GetDoubleProperty(slide, OPENSLIDE_PROPERTY_NAME_MPP_Y);
  if (mpp_x.has_value() && mpp_y.has_value()) {
    spacing_ = Spacing{*mpp_x, *mpp_y};
  }
  magnification_ =
      GetDoubleProperty(slide, OPENSLIDE_PROPERTY_NAME_OBJECTIVE_POWER);

  const Size2i dimensions = levels_.front().dimensions;
  bounds_ = SlideBounds{Size2i(0, 0), dimensions};
  const auto bounds_x = GetIntProperty(slide, OPENSLIDE_PROPERTY_NAME_BOUNDS_X);
  const auto bounds_y = GetIntProperty(slide, OPENSLIDE_PROPERTY_NAME_BOUNDS_Y);
  const auto bounds_w =
      GetIntProperty(slide, OPENSLIDE_PROPERTY_NAME_BOUNDS_WIDTH);
  const auto bounds_h =
      GetIntProperty(slide, OPENSLIDE_PROPERTY_NAME_BOUNDS_HEIGHT);
  if (bounds_x && bounds_y && bounds_w && bounds_h) {
    bounds_ = SlideBounds{Size2i(*bounds_x, *bounds_y),
                          Size2i(*bounds_w, *bounds_h)};
  }

  const int64_t icc_size = openslide_get_icc_profile_size(slide);
  if (icc_size > 0) {
    std::vector<uint8_t> profile(static_cast<size_t>(icc_size));
    openslide_read_icc_profile(slide, profile.data());
    RETURN_IF_ERROR(CheckHandleError(), "Failed to read ICC profile");
    color_profile_ = std::move(profile);
  }

  VLOG(1) << "Opened " << vendor_ << " slide with " << level_count
          << " levels";
  return absl::OkStatus();
}

absl::StatusOr<LevelInfo> OpenSlideBackend::GetLevelInfo(int level) const {
  if (level < 0 || level >= GetLevelCount()) {
    return MAKE_STATUS(
        ErrorCodes::kConfiguration,
        fmt::format("Level {} out of range [0, {})", level, GetLevelCount()));
  }
  LevelInfo info = levels_[level];
  if (spacing_.has_value()) {
    info.spacing = *spacing_ * info.downsample;
  }
  return info;
}

int OpenSlideBackend::GetBestLevelForDownsample(double downsample) const {
  absl::ReaderMutexLock lock(&mutex_);
  if (!slide_) {
    return SlideBackend::GetBestLevelForDownsample(downsample);
  }
  const int32_t level =
      openslide_get_best_level_for_downsample(slide_.get(), downsample);
  return level < 0 ? 0 : level;
}

absl::StatusOr<Image> OpenSlideBackend::ReadRegionImpl(
    const Size2i& level_zero_location, int level,
    const ImageDimensions& size) const {
  Image image(size, ImageFormat::kRGBA);
  if (image.Empty()) {
    return image;
  }

  std::vector<uint32_t> argb(image.GetPixelCount());
  {
    absl::ReaderMutexLock lock(&mutex_);
    if (!slide_) {
      return MAKE_STATUS(ErrorCodes::kUnsupportedSlide, "Slide is closed");
    }
    openslide_read_region(slide_.get(), argb.data(), level_zero_location[0],
                          level_zero_location[1], level, size[0], size[1]);
    RETURN_IF_ERROR(CheckHandleError(),
                    fmt::format("Failed to read level {} at ({}, {})", level,
                                level_zero_location[0],
                                level_zero_location[1]));
  }

  PremultipliedArgbToRgba(argb.data(), argb.size(), image.GetData());
  return image;
}

void OpenSlideBackend::CloseImpl() {
  absl::MutexLock lock(&mutex_);
  slide_.reset();
}

}  // namespace slidescale
