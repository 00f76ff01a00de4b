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

#include "slidescale/slide_backend.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <vector>

#include "absl/status/status.h"
#include "slidescale/core/coordinate_mapper.h"
#include "slidescale/errors.h"
#include "slidescale/resample/box_resample.h"
#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"

namespace slidescale {

Size2i SlideBackend::GetDimensions() const {
  auto level_info = GetLevelInfo(0);
  if (!level_info.ok()) {
    return Size2i{0, 0};
  }
  return level_info->dimensions;
}

std::vector<Size2i> SlideBackend::GetLevelDimensions() const {
  std::vector<Size2i> dimensions;
  for (int level = 0; level < GetLevelCount(); ++level) {
    auto level_info = GetLevelInfo(level);
    if (level_info.ok()) {
      dimensions.push_back(level_info->dimensions);
    }
  }
  return dimensions;
}

std::vector<double> SlideBackend::GetLevelDownsamples() const {
  std::vector<double> downsamples;
  for (int level = 0; level < GetLevelCount(); ++level) {
    auto level_info = GetLevelInfo(level);
    if (level_info.ok()) {
      downsamples.push_back(level_info->downsample);
    }
  }
  return downsamples;
}

absl::StatusOr<std::vector<Spacing>> SlideBackend::GetLevelSpacings() const {
  if (!spacing_.has_value()) {
    return MAKE_STATUS(ErrorCodes::kUnsupportedSlide,
                       "Slide has no spacing, level spacings are undefined");
  }

  std::vector<Spacing> spacings;
  for (double downsample : GetLevelDownsamples()) {
    spacings.push_back(*spacing_ * downsample);
  }
  return spacings;
}

PyramidGeometry SlideBackend::GetGeometry() const {
  PyramidGeometry geometry;
  geometry.dimensions = GetDimensions();
  geometry.bounds = GetSlideBounds();
  for (int level = 0; level < GetLevelCount(); ++level) {
    auto level_info = GetLevelInfo(level);
    if (!level_info.ok()) {
      continue;
    }
    LevelInfo info = *level_info;
    if (spacing_.has_value()) {
      info.spacing = *spacing_ * info.downsample;
    }
    geometry.levels.push_back(info);
  }
  return geometry;
}

int SlideBackend::GetBestLevelForDownsample(double downsample) const {
  const std::vector<double> downsamples = GetLevelDownsamples();
  if (downsamples.empty()) {
    return 0;
  }
  return core::GetBestLevelForDownsample(downsamples, downsample);
}

SlideBounds SlideBackend::GetSlideBounds() const {
  return SlideBounds{Size2i{0, 0}, GetDimensions()};
}

absl::Status SlideBackend::CheckOpen() const {
  if (IsClosed()) {
    return MAKE_STATUS(ErrorCodes::kUnsupportedSlide,
                       fmt::format("{} is closed", GetName()));
  }
  return absl::OkStatus();
}

absl::StatusOr<Image> SlideBackend::ReadRegion(
    const Size2i& level_zero_location, int level, const Size2i& size) const {
  RETURN_IF_ERROR(CheckOpen(), "");

  if (level < 0 || level >= GetLevelCount()) {
    return MAKE_STATUS(
        ErrorCodes::kConfiguration,
        fmt::format("Level {} out of range [0, {})", level, GetLevelCount()));
  }

  constexpr int64_t kMaxExtent = std::numeric_limits<uint32_t>::max();
  if (size[0] < 0 || size[1] < 0 || size[0] > kMaxExtent ||
      size[1] > kMaxExtent) {
    return MAKE_STATUS(
        ErrorCodes::kBounds,
        fmt::format("Invalid read size [{}, {}]", size[0], size[1]));
  }

  const ImageDimensions dimensions(static_cast<uint32_t>(size[0]),
                                   static_cast<uint32_t>(size[1]));
  return ReadRegionImpl(level_zero_location, level, dimensions);
}

absl::StatusOr<Image> SlideBackend::GetThumbnail(
    const ImageDimensions& bound) const {
  RETURN_IF_ERROR(CheckOpen(), "");

  if (bound[0] == 0 || bound[1] == 0) {
    return MAKE_STATUS(ErrorCodes::kConfiguration,
                       "Thumbnail bounding box must not be empty");
  }

  const Size2i dimensions = GetDimensions();
  const double downsample =
      std::max(static_cast<double>(dimensions[0]) / bound[0],
               static_cast<double>(dimensions[1]) / bound[1]);
  const int level = GetBestLevelForDownsample(downsample);

  DECLARE_ASSIGN_OR_RETURN(LevelInfo, level_info, GetLevelInfo(level));
  DECLARE_ASSIGN_OR_RETURN(
      Image, region,
      ReadRegion(Size2i{0, 0}, level, level_info.dimensions),
      "Failed to read thumbnail level");

  const ImageDimensions target =
      resample::FitInside(region.GetDimensions(), bound);
  if (target == region.GetDimensions()) {
    return region;
  }
  return resample::Resize(region, target, Resampling::kLanczos);
}

void SlideBackend::Close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  CloseImpl();
}

}  // namespace slidescale
