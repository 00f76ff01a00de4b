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

#include "slidescale/image.h"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <vector>

namespace slidescale {

// Test basic image creation and properties
TEST(ImageTest, BasicImageCreation) {
  Image rgb_image(ImageDimensions{100, 50}, ImageFormat::kRGB);

  EXPECT_EQ(rgb_image.GetWidth(), 100);
  EXPECT_EQ(rgb_image.GetHeight(), 50);
  EXPECT_EQ(rgb_image.GetChannels(), 3);
  EXPECT_EQ(rgb_image.GetFormat(), ImageFormat::kRGB);
  EXPECT_FALSE(rgb_image.Empty());
  EXPECT_EQ(rgb_image.SizeBytes(), 100 * 50 * 3);
  EXPECT_EQ(rgb_image.GetRowStride(), 300);
  EXPECT_EQ(rgb_image.At(49, 99, 2), 0);
}

TEST(ImageTest, DefaultIsEmpty) {
  Image image;
  EXPECT_TRUE(image.Empty());
  EXPECT_EQ(image.SizeBytes(), 0);
}

TEST(ImageTest, FormatChannels) {
  EXPECT_EQ(GetFormatChannels(ImageFormat::kGray), 1);
  EXPECT_EQ(GetFormatChannels(ImageFormat::kGrayAlpha), 2);
  EXPECT_EQ(GetFormatChannels(ImageFormat::kRGBA), 4);
  EXPECT_EQ(FormatFromChannels(3), ImageFormat::kRGB);
  EXPECT_FALSE(FormatFromChannels(5).has_value());
}

TEST(ImageTest, AdoptsBuffer) {
  std::vector<uint8_t> pixels{1, 2, 3, 4, 5, 6};
  Image image(ImageDimensions{3, 2}, ImageFormat::kGray, pixels);
  EXPECT_EQ(image.At(0, 0, 0), 1);
  EXPECT_EQ(image.At(1, 2, 0), 6);

  EXPECT_THROW(Image(ImageDimensions{3, 3}, ImageFormat::kGray, pixels),
               std::invalid_argument);
}

TEST(ImageTest, AtChecksRange) {
  Image image(ImageDimensions{2, 2}, ImageFormat::kRGB);
  EXPECT_THROW((void)image.At(2, 0, 0), std::out_of_range);
  EXPECT_THROW((void)image.At(0, 0, 3), std::out_of_range);
}

TEST(ImageTest, CropCopiesRectangle) {
  Image image(ImageDimensions{4, 3}, ImageFormat::kGray);
  for (uint32_t y = 0; y < 3; ++y) {
    for (uint32_t x = 0; x < 4; ++x) {
      image.At(y, x, 0) = static_cast<uint8_t>(y * 10 + x);
    }
  }

  Image crop = image.Crop(1, 1, 2, 2);
  EXPECT_EQ(crop.GetWidth(), 2);
  EXPECT_EQ(crop.GetHeight(), 2);
  EXPECT_EQ(crop.At(0, 0, 0), 11);
  EXPECT_EQ(crop.At(0, 1, 0), 12);
  EXPECT_EQ(crop.At(1, 0, 0), 21);
  EXPECT_EQ(crop.At(1, 1, 0), 22);

  EXPECT_THROW((void)image.Crop(3, 0, 2, 1), std::out_of_range);
}

TEST(ImageTest, PasteClipsAtEdges) {
  Image canvas(ImageDimensions{4, 4}, ImageFormat::kRGB);
  Image patch(ImageDimensions{3, 3}, ImageFormat::kRGB);
  patch.Fill(200);

  canvas.Paste(patch, 2, 2);
  EXPECT_EQ(canvas.At(1, 1, 0), 0);
  EXPECT_EQ(canvas.At(2, 2, 0), 200);
  EXPECT_EQ(canvas.At(3, 3, 2), 200);
  EXPECT_EQ(canvas.At(3, 1, 1), 0);

  // Fully outside is a no-op
  canvas.Paste(patch, 10, 10);

  Image gray(ImageDimensions{1, 1}, ImageFormat::kGray);
  EXPECT_THROW(canvas.Paste(gray, 0, 0), std::invalid_argument);
}

TEST(ImageTest, StreamOutput) {
  std::ostringstream os;
  os << Image(ImageDimensions{7, 5}, ImageFormat::kRGBA);
  EXPECT_EQ(os.str(), "Image(7x5, RGBA)");
}

}  // namespace slidescale
