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

#include "slidescale/backends/backend_factory.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

#include "gtest/gtest.h"
#include "slidescale/backends/openslide_backend.h"
#include "slidescale/errors.h"

namespace slidescale {
namespace {

TEST(BackendFactoryTest, ParsesBackendNames) {
  EXPECT_EQ(*ParseImageBackend("openslide"), ImageBackend::kOpenSlide);
  EXPECT_EQ(*ParseImageBackend("OpenSlide"), ImageBackend::kOpenSlide);
  EXPECT_EQ(*ParseImageBackend("tiff"), ImageBackend::kTiff);
  EXPECT_EQ(*ParseImageBackend("tifffile"), ImageBackend::kTiff);

  auto unknown = ParseImageBackend("bioformats");
  EXPECT_TRUE(IsConfigurationError(unknown.status())) << unknown.status();
}

TEST(BackendFactoryTest, NamesRoundTrip) {
  for (ImageBackend backend : {ImageBackend::kOpenSlide, ImageBackend::kTiff}) {
    EXPECT_EQ(*ParseImageBackend(GetName(backend)), backend);
  }
}

TEST(BackendFactoryTest, MissingFileIsNotFound) {
  const auto path =
      std::filesystem::path(::testing::TempDir()) / "missing-slide.svs";
  for (ImageBackend backend : {ImageBackend::kOpenSlide, ImageBackend::kTiff}) {
    auto opened = OpenBackend(path, backend);
    EXPECT_EQ(opened.status().code(), absl::StatusCode::kNotFound)
        << GetName(backend);
  }
}

TEST(BackendFactoryTest, FactoryRejectsGarbage) {
  const auto path = std::filesystem::path(::testing::TempDir()) / "garbage.bin";
  {
    std::ofstream out(path, std::ios::binary);
    out << "definitely not a slide";
  }
  for (ImageBackend backend : {ImageBackend::kOpenSlide, ImageBackend::kTiff}) {
    auto opened = MakeBackendFactory(backend)(path);
    EXPECT_TRUE(IsUnsupportedSlideError(opened.status()))
        << GetName(backend) << ": " << opened.status();
  }
  std::filesystem::remove(path);
}

TEST(PremultipliedArgbTest, UnpremultipliesColor) {
  const std::vector<uint32_t> argb = {
      0xff102030,  // opaque
      0x00000000,  // transparent
      0x80400000,  // half alpha, red premultiplied to 64
  };
  std::vector<uint8_t> rgba(argb.size() * 4);
  PremultipliedArgbToRgba(argb.data(), argb.size(), rgba.data());

  EXPECT_EQ(rgba[0], 0x10);
  EXPECT_EQ(rgba[1], 0x20);
  EXPECT_EQ(rgba[2], 0x30);
  EXPECT_EQ(rgba[3], 0xff);

  EXPECT_EQ(rgba[4], 0);
  EXPECT_EQ(rgba[7], 0);

  EXPECT_EQ(rgba[8], 128);  // (64 * 255 + 64) / 128
  EXPECT_EQ(rgba[9], 0);
  EXPECT_EQ(rgba[11], 0x80);
}

}  // namespace
}  // namespace slidescale
