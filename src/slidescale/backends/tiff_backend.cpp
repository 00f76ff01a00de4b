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

#include "slidescale/backends/tiff_backend.h"

#include <tiffio.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "slidescale/backends/aperio_description.h"
#include "slidescale/errors.h"
#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"

namespace slidescale {

namespace {

bool IsUsableLevel(const TiffDirectoryInfo& info) {
  return info.IsTiled() && !info.IsMask() && info.bits_per_sample == 8 &&
         info.samples_per_pixel >= 1 && info.samples_per_pixel <= 4 &&
         info.planar_config == PLANARCONFIG_CONTIG;
}

}  // namespace

std::optional<double> ResolutionToMpp(float resolution, uint16_t unit) {
  if (!(resolution > 0.0f)) {
    return std::nullopt;
  }
  switch (unit) {
    case RESUNIT_CENTIMETER:
      return 10000.0 / resolution;
    case RESUNIT_INCH:
      return 25400.0 / resolution;
    default:
      return std::nullopt;
  }
}

// ============================================================================
// Creation
// ============================================================================

absl::StatusOr<std::unique_ptr<TiffBackend>> TiffBackend::Create(
    const std::filesystem::path& filename) {
  return CreateImpl(filename);
}

absl::Status TiffBackend::ValidateInput(const std::filesystem::path& filename) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(filename, ec)) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       fmt::format("Not a file: {}", filename.string()));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<TiffBackend>> TiffBackend::CreateBackendImpl(
    const std::filesystem::path& filename) {
  auto opened = TiffFile::Open(filename);
  if (!opened.ok()) {
    return MAKE_STATUS(
        ErrorCodes::kUnsupportedSlide,
        fmt::format("{} is not a readable TIFF: {}", filename.string(),
                    status::StripStackTrace(opened.status().message())));
  }
  TiffFile file = std::move(opened).value();

  DECLARE_ASSIGN_OR_RETURN(uint16_t, directory_count,
                           file.GetDirectoryCount());

  std::vector<TiffLevel> levels;
  for (uint16_t dir = 0; dir < directory_count; ++dir) {
    RETURN_IF_ERROR(file.SetDirectory(dir), "");
    DECLARE_ASSIGN_OR_RETURN(TiffDirectoryInfo, info, file.GetDirectoryInfo());
    if (!IsUsableLevel(info)) {
      VLOG(1) << "Skipping directory " << dir << " of " << filename.string();
      continue;
    }
    levels.push_back(TiffLevel{info, 1.0});
  }

  if (levels.empty()) {
    return MAKE_STATUS(
        ErrorCodes::kUnsupportedSlide,
        fmt::format("No tiled 8-bit pyramid levels in {}", filename.string()));
  }

  std::stable_sort(levels.begin(), levels.end(),
                   [](const TiffLevel& a, const TiffLevel& b) {
                     return a.directory.GetArea() > b.directory.GetArea();
                   });

  const TiffDimensions base = levels.front().directory.image_dims;
  for (auto& level : levels) {
    const TiffDimensions& dims = level.directory.image_dims;
    level.downsample = (static_cast<double>(base[0]) / dims[0] +
                        static_cast<double>(base[1]) / dims[1]) /
                       2.0;
  }

  std::unique_ptr<TiffBackend> backend(
      new TiffBackend(std::move(file), std::move(levels)));
  {
    absl::MutexLock lock(&backend->mutex_);
    RETURN_IF_ERROR(backend->LoadMetadata(), "Failed to load TIFF metadata");
  }
  return backend;
}

TiffBackend::TiffBackend(TiffFile file, std::vector<TiffLevel> levels)
    : file_(std::move(file)), levels_(std::move(levels)) {}

TiffBackend::~TiffBackend() { Close(); }

absl::Status TiffBackend::LoadMetadata() {
  RETURN_IF_ERROR(file_->SetDirectory(levels_.front().directory.index), "");

  const std::string description = file_->GetImageDescription();
  if (!description.empty()) {
    properties_.Set("tiff.ImageDescription", description);
  }
  if (const std::string software = file_->GetSoftware(); !software.empty()) {
    properties_.Set("tiff.Software", software);
  }

  vendor_ = "generic-tiff";
  if (backends::IsAperioDescription(description)) {
    vendor_ = "aperio";
    auto aperio = backends::ParseAperioDescription(description);
    if (aperio.ok()) {
      spacing_ = aperio->mpp;
      magnification_ = aperio->app_mag;
      for (const auto& [key, value] : aperio->fields) {
        properties_.Set("aperio." + key, value);
      }
    } else {
      LOG(WARNING) << "Ignoring malformed Aperio description: "
                   << status::StripStackTrace(aperio.status().message());
    }
  }

  if (!spacing_.has_value()) {
    const uint16_t unit = file_->GetResolutionUnit();
    const auto x_resolution = file_->GetXResolution();
    const auto y_resolution = file_->GetYResolution();
    if (x_resolution.has_value() && y_resolution.has_value()) {
      const auto mpp_x = ResolutionToMpp(*x_resolution, unit);
      const auto mpp_y = ResolutionToMpp(*y_resolution, unit);
      if (mpp_x.has_value() && mpp_y.has_value()) {
        spacing_ = Spacing{*mpp_x, *mpp_y};
      }
    }
    properties_.Set("tiff.ResolutionUnit", static_cast<int64_t>(unit));
  }

  color_profile_ = file_->GetIccProfile();

  properties_.Set("slidescale.vendor", vendor_);
  properties_.Set("slidescale.level-count",
                  static_cast<int64_t>(levels_.size()));
  if (spacing_.has_value()) {
    properties_.Set("slidescale.mpp-x", (*spacing_)[0]);
    properties_.Set("slidescale.mpp-y", (*spacing_)[1]);
  }
  if (magnification_.has_value()) {
    properties_.Set("slidescale.objective-power", *magnification_);
  }
  for (size_t i = 0; i < levels_.size(); ++i) {
    const TiffDirectoryInfo& dir = levels_[i].directory;
    const std::string prefix = fmt::format("slidescale.level[{}].", i);
    properties_.Set(prefix + "width", static_cast<int64_t>(dir.image_dims[0]));
    properties_.Set(prefix + "height",
                    static_cast<int64_t>(dir.image_dims[1]));
    properties_.Set(prefix + "downsample", levels_[i].downsample);
    properties_.Set(prefix + "tile-width",
                    static_cast<int64_t>((*dir.tile_dims)[0]));
    properties_.Set(prefix + "tile-height",
                    static_cast<int64_t>((*dir.tile_dims)[1]));
    properties_.Set(prefix + "directory", static_cast<int64_t>(dir.index));
  }
  return absl::OkStatus();
}

// ============================================================================
// Pyramid
// ============================================================================

absl::StatusOr<LevelInfo> TiffBackend::GetLevelInfo(int level) const {
  if (level < 0 || level >= GetLevelCount()) {
    return MAKE_STATUS(
        ErrorCodes::kConfiguration,
        fmt::format("Level {} out of range [0, {})", level, GetLevelCount()));
  }
  const TiffLevel& tiff_level = levels_[level];
  LevelInfo info;
  info.dimensions = tiff_level.directory.image_dims.Cast<int64_t>();
  info.downsample = tiff_level.downsample;
  if (spacing_.has_value()) {
    info.spacing = *spacing_ * tiff_level.downsample;
  }
  return info;
}

ImageFormat TiffBackend::GetImageFormat() const {
  if (levels_.empty()) {
    return ImageFormat::kRGB;
  }
  return FormatFromChannels(levels_[0].directory.samples_per_pixel)
      .value_or(ImageFormat::kRGB);
}

// ============================================================================
// Pixels
// ============================================================================

absl::StatusOr<Image> TiffBackend::ReadRegionImpl(
    const Size2i& level_zero_location, int level,
    const ImageDimensions& size) const {
  const TiffLevel& tiff_level = levels_[level];
  const TiffDirectoryInfo& dir = tiff_level.directory;
  const uint32_t channels = dir.samples_per_pixel;

  Image image(size, *FormatFromChannels(channels));
  if (size[0] == 0 || size[1] == 0) {
    return image;
  }

  // Top-left is the level pixel nearest to the level-zero location, which
  // the mapper's crop box is relative to. Samples outside the level stay
  // zero.
  const int64_t x0 =
      std::lround(level_zero_location[0] / tiff_level.downsample);
  const int64_t y0 =
      std::lround(level_zero_location[1] / tiff_level.downsample);
  const int64_t visible_x0 = std::max<int64_t>(x0, 0);
  const int64_t visible_y0 = std::max<int64_t>(y0, 0);
  const int64_t visible_x1 =
      std::min<int64_t>(x0 + size[0], dir.image_dims[0]);
  const int64_t visible_y1 =
      std::min<int64_t>(y0 + size[1], dir.image_dims[1]);
  if (visible_x0 >= visible_x1 || visible_y0 >= visible_y1) {
    return image;
  }

  const int64_t tile_width = (*dir.tile_dims)[0];
  const int64_t tile_height = (*dir.tile_dims)[1];
  const size_t row_stride = image.GetRowStride();

  absl::MutexLock lock(&mutex_);
  if (!file_.has_value()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF file is closed");
  }
  RETURN_IF_ERROR(file_->SetDirectory(dir.index), "");
  DECLARE_ASSIGN_OR_RETURN(size_t, tile_bytes, file_->GetTileSize());
  if (tile_bytes < static_cast<size_t>(tile_width * tile_height) * channels) {
    return MAKE_STATUS(
        absl::StatusCode::kDataLoss,
        fmt::format("Tile of {} bytes is too small for {}x{}x{}", tile_bytes,
                    tile_width, tile_height, channels));
  }
  std::vector<uint8_t> tile(tile_bytes);

  const int64_t first_tile_x = (visible_x0 / tile_width) * tile_width;
  const int64_t first_tile_y = (visible_y0 / tile_height) * tile_height;

  for (int64_t ty = first_tile_y; ty < visible_y1; ty += tile_height) {
    for (int64_t tx = first_tile_x; tx < visible_x1; tx += tile_width) {
      RETURN_IF_ERROR(file_->ReadTile(tile.data(), static_cast<uint32_t>(tx),
                                      static_cast<uint32_t>(ty)),
                      "");

      const int64_t col_begin = std::max(tx, visible_x0);
      const int64_t col_end = std::min(tx + tile_width, visible_x1);
      const int64_t row_begin = std::max(ty, visible_y0);
      const int64_t row_end = std::min(ty + tile_height, visible_y1);
      const size_t copy_bytes = static_cast<size_t>(col_end - col_begin) *
                                channels;

      for (int64_t row = row_begin; row < row_end; ++row) {
        const uint8_t* src =
            tile.data() +
            (static_cast<size_t>(row - ty) * tile_width + (col_begin - tx)) *
                channels;
        uint8_t* dst = image.GetData() +
                       static_cast<size_t>(row - y0) * row_stride +
                       static_cast<size_t>(col_begin - x0) * channels;
        std::memcpy(dst, src, copy_bytes);
      }
    }
  }
  return image;
}

void TiffBackend::CloseImpl() {
  absl::MutexLock lock(&mutex_);
  file_.reset();
}

}  // namespace slidescale
