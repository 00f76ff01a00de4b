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

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "slidescale/backends/backend_factory.h"
#include "slidescale/errors.h"
#include "slidescale/slide_image.h"

namespace slidescale {
namespace {

constexpr uint32_t kTileSize = 16;

struct TiffLayout {
  std::vector<TiffDimensions> levels = {TiffDimensions(64, 48),
                                        TiffDimensions(32, 24)};
  std::string description;
  std::optional<float> resolution;
  uint16_t resolution_unit = RESUNIT_CENTIMETER;
  std::vector<uint8_t> icc_profile;
  bool stripped_thumbnail = true;
};

// Level pixels are (x, y, 50 * level) in level coordinates.
uint8_t ExpectedValue(uint32_t x, uint32_t y, uint32_t channel, int level) {
  switch (channel) {
    case 0:
      return static_cast<uint8_t>(x % 256);
    case 1:
      return static_cast<uint8_t>(y % 256);
    default:
      return static_cast<uint8_t>(50 * level);
  }
}

void SetRgbFields(TIFF* tif, const TiffDimensions& dims) {
  TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, dims[0]);
  TIFFSetField(tif, TIFFTAG_IMAGELENGTH, dims[1]);
  TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
  TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, 3);
  TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
  TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
  TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
}

bool WriteTiff(const std::filesystem::path& path, const TiffLayout& layout) {
  TIFF* tif = TIFFOpen(path.string().c_str(), "w");
  if (tif == nullptr) {
    return false;
  }

  for (size_t level = 0; level < layout.levels.size(); ++level) {
    const TiffDimensions& dims = layout.levels[level];
    SetRgbFields(tif, dims);
    TIFFSetField(tif, TIFFTAG_TILEWIDTH, kTileSize);
    TIFFSetField(tif, TIFFTAG_TILELENGTH, kTileSize);
    if (level > 0) {
      TIFFSetField(tif, TIFFTAG_SUBFILETYPE, FILETYPE_REDUCEDIMAGE);
    } else {
      if (!layout.description.empty()) {
        TIFFSetField(tif, TIFFTAG_IMAGEDESCRIPTION,
                     layout.description.c_str());
      }
      if (layout.resolution.has_value()) {
        TIFFSetField(tif, TIFFTAG_XRESOLUTION, *layout.resolution);
        TIFFSetField(tif, TIFFTAG_YRESOLUTION, *layout.resolution);
        TIFFSetField(tif, TIFFTAG_RESOLUTIONUNIT, layout.resolution_unit);
      }
      if (!layout.icc_profile.empty()) {
        TIFFSetField(tif, TIFFTAG_ICCPROFILE,
                     static_cast<uint32_t>(layout.icc_profile.size()),
                     layout.icc_profile.data());
      }
    }

    std::vector<uint8_t> tile(kTileSize * kTileSize * 3);
    for (uint32_t ty = 0; ty < dims[1]; ty += kTileSize) {
      for (uint32_t tx = 0; tx < dims[0]; tx += kTileSize) {
        for (uint32_t y = 0; y < kTileSize; ++y) {
          for (uint32_t x = 0; x < kTileSize; ++x) {
            for (uint32_t c = 0; c < 3; ++c) {
              tile[(y * kTileSize + x) * 3 + c] = ExpectedValue(
                  tx + x, ty + y, c, static_cast<int>(level));
            }
          }
        }
        if (TIFFWriteTile(tif, tile.data(), tx, ty, 0, 0) < 0) {
          TIFFClose(tif);
          return false;
        }
      }
    }
    TIFFWriteDirectory(tif);
  }

  if (layout.stripped_thumbnail) {
    const TiffDimensions dims(8, 6);
    SetRgbFields(tif, dims);
    TIFFSetField(tif, TIFFTAG_SUBFILETYPE, FILETYPE_REDUCEDIMAGE);
    TIFFSetField(tif, TIFFTAG_ROWSPERSTRIP, dims[1]);
    std::vector<uint8_t> row(dims[0] * 3, 128);
    for (uint32_t y = 0; y < dims[1]; ++y) {
      TIFFWriteScanline(tif, row.data(), y, 0);
    }
    TIFFWriteDirectory(tif);
  }

  TIFFClose(tif);
  return true;
}

class TiffBackendTest : public ::testing::Test {
 protected:
  std::filesystem::path WriteLayout(const std::string& name,
                                    const TiffLayout& layout) {
    auto path = std::filesystem::path(::testing::TempDir()) / name;
    EXPECT_TRUE(WriteTiff(path, layout)) << path;
    paths_.push_back(path);
    return path;
  }

  void TearDown() override {
    for (const auto& path : paths_) {
      std::error_code ec;
      std::filesystem::remove(path, ec);
    }
  }

 private:
  std::vector<std::filesystem::path> paths_;
};

TEST_F(TiffBackendTest, TiledDirectoriesBecomeLevels) {
  auto backend = TiffBackend::Create(WriteLayout("levels.tif", {}));
  ASSERT_TRUE(backend.ok()) << backend.status();

  ASSERT_EQ((*backend)->GetLevelCount(), 2);
  EXPECT_EQ((*backend)->GetDimensions(), Size2i(64, 48));
  EXPECT_EQ((*backend)->GetLevelDimensions()[1], Size2i(32, 24));
  EXPECT_DOUBLE_EQ((*backend)->GetLevelDownsamples()[1], 2.0);
  EXPECT_EQ((*backend)->GetVendor(), "generic-tiff");
  EXPECT_FALSE((*backend)->GetSpacing().has_value());
  EXPECT_FALSE((*backend)->GetMagnification().has_value());
  EXPECT_FALSE((*backend)->GetColorProfile().has_value());
  EXPECT_TRUE((*backend)->GetProperties().contains(
      "slidescale.level[1].tile-width"));
}

TEST_F(TiffBackendTest, ReadsAcrossTileBoundaries) {
  auto backend = TiffBackend::Create(WriteLayout("tiles.tif", {}));
  ASSERT_TRUE(backend.ok()) << backend.status();

  auto image = (*backend)->ReadRegion(Size2i(5, 7), 0, ImageDimensions(20, 20));
  ASSERT_TRUE(image.ok()) << image.status();
  EXPECT_EQ(image->GetChannels(), 3u);
  for (uint32_t y : {0u, 8u, 9u, 19u}) {
    for (uint32_t x : {0u, 10u, 11u, 19u}) {
      for (uint32_t c = 0; c < 3; ++c) {
        EXPECT_EQ(image->At(y, x, c), ExpectedValue(5 + x, 7 + y, c, 0))
            << "x=" << x << " y=" << y << " c=" << c;
      }
    }
  }
}

TEST_F(TiffBackendTest, ReadsCoarserLevelInLevelZeroCoordinates) {
  auto backend = TiffBackend::Create(WriteLayout("coarse.tif", {}));
  ASSERT_TRUE(backend.ok()) << backend.status();

  auto image =
      (*backend)->ReadRegion(Size2i(10, 10), 1, ImageDimensions(4, 4));
  ASSERT_TRUE(image.ok()) << image.status();
  EXPECT_EQ(image->At(0, 0, 0), 5);
  EXPECT_EQ(image->At(0, 0, 1), 5);
  EXPECT_EQ(image->At(0, 0, 2), 50);
  EXPECT_EQ(image->At(3, 2, 0), 7);
  EXPECT_EQ(image->At(3, 2, 1), 8);
}

// 1001 / 250 gives a downsample of 4.004, so level-zero pixel 428 falls
// between level pixels 106 and 107.
TiffLayout NonIntegerDownsampleLayout() {
  TiffLayout layout;
  layout.levels = {TiffDimensions(1001, 1001), TiffDimensions(250, 250)};
  layout.resolution = 40000.0f;
  return layout;
}

TEST_F(TiffBackendTest, NonIntegerDownsampleStartsAtNearestLevelPixel) {
  auto backend = TiffBackend::Create(
      WriteLayout("fractional.tif", NonIntegerDownsampleLayout()));
  ASSERT_TRUE(backend.ok()) << backend.status();
  EXPECT_DOUBLE_EQ((*backend)->GetLevelDownsamples()[1], 4.004);

  auto image =
      (*backend)->ReadRegion(Size2i(428, 428), 1, ImageDimensions(1, 1));
  ASSERT_TRUE(image.ok()) << image.status();
  EXPECT_EQ(image->At(0, 0, 0), 107);
  EXPECT_EQ(image->At(0, 0, 1), 107);
  EXPECT_EQ(image->At(0, 0, 2), 50);
}

TEST_F(TiffBackendTest, NearestAtNativeScaleReturnsSameLevelPixel) {
  const auto path =
      WriteLayout("fractional_slide.tif", NonIntegerDownsampleLayout());

  SlideImageOptions options;
  options.internal_handler = InternalHandler::kBox;
  options.interpolator = Resampling::kNearest;
  auto slide = SlideImage::FromFilePath(path, ImageBackend::kTiff, options);
  ASSERT_TRUE(slide.ok()) << slide.status();

  // Just above the level 1 downsample, so level 1 is read at scale ~1.
  constexpr double kFactor = 0.9999999;
  const double scaling = kFactor / 4.004;
  for (const int64_t n : {20, 107, 200, 240}) {
    const double location = static_cast<double>(n) * kFactor;
    auto image = (*slide)->ReadRegion(Size2d(location, location), scaling,
                                      Size2i(1, 1));
    ASSERT_TRUE(image.ok()) << image.status();
    ASSERT_EQ(image->GetDimensions(), ImageDimensions(1, 1));
    EXPECT_EQ(image->At(0, 0, 0), n) << "level pixel " << n;
    EXPECT_EQ(image->At(0, 0, 1), n) << "level pixel " << n;
    EXPECT_EQ(image->At(0, 0, 2), 50) << "level pixel " << n;
  }
}

TEST_F(TiffBackendTest, ReportsLevelZeroFormat) {
  auto backend = TiffBackend::Create(WriteLayout("format.tif", {}));
  ASSERT_TRUE(backend.ok()) << backend.status();
  EXPECT_EQ((*backend)->GetImageFormat(), ImageFormat::kRGB);
}

TEST_F(TiffBackendTest, SamplesOutsideTheLevelAreZero) {
  auto backend = TiffBackend::Create(WriteLayout("edges.tif", {}));
  ASSERT_TRUE(backend.ok()) << backend.status();

  auto past_end =
      (*backend)->ReadRegion(Size2i(60, 40), 0, ImageDimensions(10, 10));
  ASSERT_TRUE(past_end.ok()) << past_end.status();
  EXPECT_EQ(past_end->At(3, 3, 0), 63);
  EXPECT_EQ(past_end->At(3, 3, 1), 43);
  EXPECT_EQ(past_end->At(0, 4, 0), 0);
  EXPECT_EQ(past_end->At(0, 4, 1), 0);
  EXPECT_EQ(past_end->At(8, 0, 1), 0);

  auto before_start =
      (*backend)->ReadRegion(Size2i(-3, -3), 0, ImageDimensions(6, 6));
  ASSERT_TRUE(before_start.ok()) << before_start.status();
  EXPECT_EQ(before_start->At(5, 4, 0), 1);
  EXPECT_EQ(before_start->At(5, 4, 1), 2);
  EXPECT_EQ(before_start->At(0, 0, 0), 0);

  auto outside =
      (*backend)->ReadRegion(Size2i(500, 500), 0, ImageDimensions(4, 4));
  ASSERT_TRUE(outside.ok()) << outside.status();
  for (size_t i = 0; i < outside->SizeBytes(); ++i) {
    ASSERT_EQ(outside->GetData()[i], 0);
  }
}

TEST_F(TiffBackendTest, AperioDescriptionProvidesCalibration) {
  TiffLayout layout;
  layout.description =
      "Aperio Image Library v12.0.15|AppMag = 40|MPP = 0.2527|"
      "ScanScope ID = SS1234";
  layout.resolution = 10000.0f;
  auto backend = TiffBackend::Create(WriteLayout("aperio.tif", layout));
  ASSERT_TRUE(backend.ok()) << backend.status();

  EXPECT_EQ((*backend)->GetVendor(), "aperio");
  ASSERT_TRUE((*backend)->GetSpacing().has_value());
  EXPECT_DOUBLE_EQ((*(*backend)->GetSpacing())[0], 0.2527);
  ASSERT_TRUE((*backend)->GetMagnification().has_value());
  EXPECT_DOUBLE_EQ(*(*backend)->GetMagnification(), 40.0);

  const Properties& properties = (*backend)->GetProperties();
  EXPECT_TRUE(properties.contains("aperio.ScanScope ID"));
  EXPECT_TRUE(properties.contains("tiff.ImageDescription"));
  EXPECT_TRUE(properties.contains("slidescale.mpp-x"));

  auto spacings = (*backend)->GetLevelSpacings();
  ASSERT_TRUE(spacings.ok()) << spacings.status();
  EXPECT_DOUBLE_EQ((*spacings)[1][0], 2 * 0.2527);
}

TEST_F(TiffBackendTest, ResolutionTagsProvideCalibration) {
  TiffLayout centimeter;
  centimeter.resolution = 40000.0f;
  auto cm_backend = TiffBackend::Create(WriteLayout("cm.tif", centimeter));
  ASSERT_TRUE(cm_backend.ok()) << cm_backend.status();
  ASSERT_TRUE((*cm_backend)->GetSpacing().has_value());
  EXPECT_NEAR((*(*cm_backend)->GetSpacing())[0], 0.25, 1e-6);

  TiffLayout inch;
  inch.resolution = 101600.0f;
  inch.resolution_unit = RESUNIT_INCH;
  auto inch_backend = TiffBackend::Create(WriteLayout("inch.tif", inch));
  ASSERT_TRUE(inch_backend.ok()) << inch_backend.status();
  ASSERT_TRUE((*inch_backend)->GetSpacing().has_value());
  EXPECT_NEAR((*(*inch_backend)->GetSpacing())[1], 0.25, 1e-6);
}

TEST_F(TiffBackendTest, IccProfileIsExposed) {
  TiffLayout layout;
  layout.icc_profile = {1, 2, 3, 4, 5, 6, 7, 8};
  auto backend = TiffBackend::Create(WriteLayout("icc.tif", layout));
  ASSERT_TRUE(backend.ok()) << backend.status();

  auto profile = (*backend)->GetColorProfile();
  ASSERT_TRUE(profile.has_value());
  EXPECT_EQ(*profile, layout.icc_profile);
}

TEST_F(TiffBackendTest, StrippedOnlyFileIsUnsupported) {
  TiffLayout layout;
  layout.levels.clear();
  auto backend = TiffBackend::Create(WriteLayout("stripped.tif", layout));
  ASSERT_FALSE(backend.ok());
  EXPECT_TRUE(IsUnsupportedSlideError(backend.status())) << backend.status();
}

TEST_F(TiffBackendTest, NonTiffIsUnsupported) {
  const auto path = std::filesystem::path(::testing::TempDir()) / "text.tif";
  {
    std::ofstream out(path);
    out << "not a tiff";
  }
  auto backend = TiffBackend::Create(path);
  ASSERT_FALSE(backend.ok());
  EXPECT_TRUE(IsUnsupportedSlideError(backend.status())) << backend.status();
  std::filesystem::remove(path);
}

TEST_F(TiffBackendTest, MissingFileIsNotFound) {
  auto backend = TiffBackend::Create(
      std::filesystem::path(::testing::TempDir()) / "does-not-exist.tif");
  EXPECT_EQ(backend.status().code(), absl::StatusCode::kNotFound);
}

TEST_F(TiffBackendTest, ReadAfterCloseFails) {
  auto backend = TiffBackend::Create(WriteLayout("closed.tif", {}));
  ASSERT_TRUE(backend.ok()) << backend.status();

  (*backend)->Close();
  EXPECT_TRUE((*backend)->IsClosed());
  auto image = (*backend)->ReadRegion(Size2i(0, 0), 0, ImageDimensions(4, 4));
  EXPECT_EQ(image.status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST_F(TiffBackendTest, SlideImageReadsAtNativeScale) {
  TiffLayout layout;
  layout.resolution = 40000.0f;
  const auto path = WriteLayout("slide.tif", layout);

  SlideImageOptions options;
  options.internal_handler = InternalHandler::kBox;
  auto slide = SlideImage::FromFilePath(path, ImageBackend::kTiff, options);
  ASSERT_TRUE(slide.ok()) << slide.status();
  EXPECT_EQ((*slide)->GetIdentifier(),
            std::filesystem::weakly_canonical(path).string());
  EXPECT_NEAR((*slide)->GetMpp(), 0.25, 1e-6);

  auto image = (*slide)->ReadRegion(Size2d(5, 7), 1.0, Size2i(8, 8));
  ASSERT_TRUE(image.ok()) << image.status();
  EXPECT_EQ(image->GetDimensions(), ImageDimensions(8, 8));
  EXPECT_EQ(image->At(0, 0, 0), 5);
  EXPECT_EQ(image->At(0, 0, 1), 7);
  EXPECT_EQ(image->At(7, 3, 0), 8);
  EXPECT_EQ(image->At(7, 3, 1), 14);
}

TEST(ResolutionToMppTest, ConvertsSupportedUnits) {
  EXPECT_DOUBLE_EQ(*ResolutionToMpp(10000.0f, RESUNIT_CENTIMETER), 1.0);
  EXPECT_DOUBLE_EQ(*ResolutionToMpp(25400.0f, RESUNIT_INCH), 1.0);
  EXPECT_FALSE(ResolutionToMpp(300.0f, RESUNIT_NONE).has_value());
  EXPECT_FALSE(ResolutionToMpp(0.0f, RESUNIT_CENTIMETER).has_value());
}

}  // namespace
}  // namespace slidescale
