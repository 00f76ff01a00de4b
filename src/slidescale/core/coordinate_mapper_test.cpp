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

#include "slidescale/core/coordinate_mapper.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidescale/errors.h"

namespace slidescale {
namespace core {
namespace {

PyramidGeometry MakeGeometry(int64_t width, int64_t height,
                             const std::vector<double>& downsamples) {
  PyramidGeometry geometry;
  geometry.dimensions = Size2i{width, height};
  geometry.bounds = SlideBounds{Size2i{0, 0}, Size2i{width, height}};
  for (double downsample : downsamples) {
    LevelInfo level;
    level.dimensions =
        Size2i{static_cast<int64_t>(std::floor(width / downsample)),
               static_cast<int64_t>(std::floor(height / downsample))};
    level.downsample = downsample;
    geometry.levels.push_back(level);
  }
  return geometry;
}

RegionRequest MakeRequest(double x, double y, double scaling, int64_t width,
                          int64_t height) {
  RegionRequest request;
  request.location = Size2d{x, y};
  request.scaling = scaling;
  request.size = Size2i{width, height};
  return request;
}

}  // namespace

// ============================================================================
// Level selection and support
// ============================================================================

TEST(GetBestLevelForDownsampleTest, FollowsOpenSlideSemantics) {
  const std::vector<double> downsamples{1.0, 4.0, 16.0};

  EXPECT_EQ(GetBestLevelForDownsample(downsamples, 1.0), 0);
  EXPECT_EQ(GetBestLevelForDownsample(downsamples, 2.0), 0);
  EXPECT_EQ(GetBestLevelForDownsample(downsamples, 3.999), 0);
  EXPECT_EQ(GetBestLevelForDownsample(downsamples, 4.0), 1);
  EXPECT_EQ(GetBestLevelForDownsample(downsamples, 5.0), 1);
  EXPECT_EQ(GetBestLevelForDownsample(downsamples, 16.0), 2);
  EXPECT_EQ(GetBestLevelForDownsample(downsamples, 100.0), 2);
}

TEST(GetBestLevelForDownsampleTest, UpsamplingUsesFinestLevel) {
  const std::vector<double> downsamples{1.0, 2.0};
  EXPECT_EQ(GetBestLevelForDownsample(downsamples, 0.5), 0);
  EXPECT_EQ(GetBestLevelForDownsample(downsamples, 0.01), 0);
}

TEST(GetInterpolationSupportTest, WidensWhenDownsampling) {
  EXPECT_EQ(GetInterpolationSupport(2.0), 3);
  EXPECT_EQ(GetInterpolationSupport(1.0), 3);
  EXPECT_EQ(GetInterpolationSupport(0.5), 6);
  EXPECT_EQ(GetInterpolationSupport(0.4), 8);
  EXPECT_EQ(GetInterpolationSupport(0.25), 12);
}

TEST(GetScaledSizeTest, Floors) {
  EXPECT_EQ(GetScaledSize(Size2i{1001, 999}, 0.5), (Size2i{500, 499}));
  EXPECT_EQ(GetScaledSize(Size2i{1000, 1000}, 1.0), (Size2i{1000, 1000}));
  EXPECT_EQ(GetScaledSize(Size2i{3, 3}, 0.1), (Size2i{0, 0}));
}

// ============================================================================
// MapRegion scenarios
// ============================================================================

TEST(MapRegionTest, HalfScalingOnSingleLevel) {
  const auto geometry = MakeGeometry(1000, 1000, {1.0});

  auto result = MapRegion(geometry, MakeRequest(100, 100, 0.5, 50, 50));
  ASSERT_TRUE(result.ok()) << result.status();
  const NativeRegionPlan& plan = *result;

  EXPECT_EQ(plan.native_level, 0);
  EXPECT_DOUBLE_EQ(plan.native_scaling, 0.5);
  EXPECT_DOUBLE_EQ(plan.native_location[0], 200.0);
  EXPECT_DOUBLE_EQ(plan.native_location[1], 200.0);
  EXPECT_DOUBLE_EQ(plan.native_size[0], 100.0);
  EXPECT_DOUBLE_EQ(plan.native_size[1], 100.0);
  EXPECT_EQ(plan.support, 6);

  // floor(200 - 6) = 194, end = ceil(200 + 100 + 6) = 306
  EXPECT_EQ(plan.level_zero_location, (Size2i{194, 194}));
  EXPECT_EQ(plan.native_size_adapted, (Size2i{112, 112}));
  EXPECT_DOUBLE_EQ(plan.crop_box.left, 6.0);
  EXPECT_DOUBLE_EQ(plan.crop_box.top, 6.0);
  EXPECT_DOUBLE_EQ(plan.crop_box.right, 106.0);
  EXPECT_DOUBLE_EQ(plan.crop_box.bottom, 106.0);
}

TEST(MapRegionTest, OriginAtNativeResolutionIsNotNegative) {
  const auto geometry = MakeGeometry(1000, 800, {1.0, 4.0});

  auto result = MapRegion(geometry, MakeRequest(0, 0, 1.0, 64, 64));
  ASSERT_TRUE(result.ok()) << result.status();

  EXPECT_EQ(result->native_level, 0);
  EXPECT_EQ(result->level_zero_location, (Size2i{0, 0}));
  EXPECT_DOUBLE_EQ(result->native_location_adapted[0], 0.0);
  EXPECT_DOUBLE_EQ(result->native_location_adapted[1], 0.0);
  // 64 + 3 support on the right only
  EXPECT_EQ(result->native_size_adapted, (Size2i{67, 67}));
  EXPECT_DOUBLE_EQ(result->crop_box.left, 0.0);
  EXPECT_DOUBLE_EQ(result->crop_box.right, 64.0);
}

TEST(MapRegionTest, FullSlideAtUnitScaling) {
  const auto geometry = MakeGeometry(1000, 700, {1.0, 2.0});

  auto result = MapRegion(geometry, MakeRequest(0, 0, 1.0, 1000, 700));
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->native_size_adapted, (Size2i{1000, 700}));
  EXPECT_DOUBLE_EQ(result->crop_box.Width(), 1000.0);
  EXPECT_DOUBLE_EQ(result->crop_box.Height(), 700.0);
}

TEST(MapRegionTest, SelectsCoarserLevel) {
  const auto geometry = MakeGeometry(4096, 4096, {1.0, 4.0, 16.0});

  // 1 / 0.2 = 5 -> level 1 (downsample 4), native scaling 0.8
  auto result = MapRegion(geometry, MakeRequest(80, 40, 0.2, 100, 100));
  ASSERT_TRUE(result.ok()) << result.status();

  EXPECT_EQ(result->native_level, 1);
  EXPECT_DOUBLE_EQ(result->native_scaling, 0.8);
  EXPECT_DOUBLE_EQ(result->native_location[0], 100.0);
  EXPECT_DOUBLE_EQ(result->native_location[1], 50.0);
  EXPECT_DOUBLE_EQ(result->native_size[0], 125.0);
  EXPECT_EQ(result->support, 4);
  // Native start (96, 46) expressed at level 0
  EXPECT_EQ(result->level_zero_location, (Size2i{384, 184}));
}

TEST(MapRegionTest, NonIntegerDownsampleSnapsToLevelZero) {
  PyramidGeometry geometry = MakeGeometry(3000, 3000, {1.0, 3.0});
  geometry.levels[1].downsample = 3.0001;

  auto result = MapRegion(geometry, MakeRequest(333.3, 333.3, 0.3, 30, 30));
  ASSERT_TRUE(result.ok()) << result.status();

  const auto& plan = *result;
  EXPECT_EQ(plan.native_level, 1);
  for (size_t axis = 0; axis < 2; ++axis) {
    EXPECT_DOUBLE_EQ(plan.native_location_adapted[axis],
                     plan.level_zero_location[axis] / plan.downsample);
    EXPECT_LE(plan.native_location_adapted[axis],
              plan.native_location[axis] - plan.support);
  }
}

// ============================================================================
// Bounds
// ============================================================================

TEST(MapRegionTest, RegionPastTheEdgeIsBoundsError) {
  const auto geometry = MakeGeometry(1000, 1000, {1.0});

  auto result = MapRegion(geometry, MakeRequest(995, 995, 1.0, 10, 10));
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(IsBoundsError(result.status())) << result.status();
  EXPECT_NE(result.status().message().find("1005"), std::string::npos);
}

TEST(MapRegionTest, RegionEndingOnTheEdgeIsValid) {
  const auto geometry = MakeGeometry(1000, 1000, {1.0});
  auto result = MapRegion(geometry, MakeRequest(990, 990, 1.0, 10, 10));
  EXPECT_TRUE(result.ok()) << result.status();
}

TEST(MapRegionTest, NegativeLocationIsBoundsError) {
  const auto geometry = MakeGeometry(1000, 1000, {1.0});
  auto result = MapRegion(geometry, MakeRequest(-1, 0, 1.0, 10, 10));
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(IsBoundsError(result.status()));
}

TEST(MapRegionTest, NegativeSizeIsBoundsError) {
  const auto geometry = MakeGeometry(1000, 1000, {1.0});
  auto result = MapRegion(geometry, MakeRequest(0, 0, 1.0, -5, 10));
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(IsBoundsError(result.status()));
}

TEST(MapRegionTest, BoundsUseScaledLevelSize) {
  const auto geometry = MakeGeometry(1000, 1000, {1.0});
  // Level size at 0.5 is 500x500
  EXPECT_TRUE(MapRegion(geometry, MakeRequest(450, 0, 0.5, 50, 50)).ok());
  EXPECT_TRUE(IsBoundsError(
      MapRegion(geometry, MakeRequest(451, 0, 0.5, 50, 50)).status()));
}

TEST(MapRegionTest, InvalidScalingIsConfigurationError) {
  const auto geometry = MakeGeometry(1000, 1000, {1.0});
  EXPECT_TRUE(IsConfigurationError(
      MapRegion(geometry, MakeRequest(0, 0, 0.0, 1, 1)).status()));
  EXPECT_TRUE(IsConfigurationError(
      MapRegion(geometry, MakeRequest(0, 0, -1.0, 1, 1)).status()));
}

TEST(MapRegionTest, EmptyPyramidIsConfigurationError) {
  PyramidGeometry geometry;
  geometry.dimensions = Size2i{10, 10};
  EXPECT_TRUE(IsConfigurationError(
      MapRegion(geometry, MakeRequest(0, 0, 1.0, 1, 1)).status()));
}

TEST(MapRegionTest, ZeroSizeRegionMaps) {
  const auto geometry = MakeGeometry(100, 100, {1.0});
  auto result = MapRegion(geometry, MakeRequest(100, 100, 1.0, 0, 0));
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_GE(result->native_size_adapted[0], 0);
  EXPECT_GE(result->native_size_adapted[1], 0);
}

// ============================================================================
// Slide bounds coordinates
// ============================================================================

TEST(MapRegionTest, SlideBoundsCoordinatesAreTranslated) {
  PyramidGeometry geometry = MakeGeometry(2000, 2000, {1.0, 4.0});
  geometry.bounds = SlideBounds{Size2i{100, 200}, Size2i{500, 400}};

  RegionRequest request = MakeRequest(0, 0, 0.5, 250, 200);
  request.space = CoordinateSpace::kSlideBounds;

  auto result = MapRegion(geometry, request);
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_DOUBLE_EQ(result->location[0], 50.0);
  EXPECT_DOUBLE_EQ(result->location[1], 100.0);
  EXPECT_DOUBLE_EQ(result->native_location[0], 100.0);
  EXPECT_DOUBLE_EQ(result->native_location[1], 200.0);
}

TEST(MapRegionTest, SlideBoundsLimitTheRequest) {
  PyramidGeometry geometry = MakeGeometry(2000, 2000, {1.0});
  geometry.bounds = SlideBounds{Size2i{100, 200}, Size2i{500, 400}};

  RegionRequest request = MakeRequest(0, 0, 0.5, 251, 10);
  request.space = CoordinateSpace::kSlideBounds;
  EXPECT_TRUE(IsBoundsError(MapRegion(geometry, request).status()));

  // The same request is fine in full-image coordinates
  request.space = CoordinateSpace::kFullImage;
  EXPECT_TRUE(MapRegion(geometry, request).ok());
}

// ============================================================================
// Randomized properties
// ============================================================================

TEST(MapRegionPropertyTest, WindowCoversRequestAndStaysInLevel) {
  std::mt19937 rng(20250119);
  std::uniform_int_distribution<int64_t> dim_dist(64, 20000);
  std::uniform_int_distribution<int> level_count_dist(1, 5);
  std::uniform_real_distribution<double> log_scaling_dist(std::log(0.01),
                                                          std::log(2.0));
  std::uniform_real_distribution<double> unit(0.0, 1.0);

  constexpr double kEps = 1e-6;

  for (int iteration = 0; iteration < 2000; ++iteration) {
    const int64_t width = dim_dist(rng);
    const int64_t height = dim_dist(rng);
    std::vector<double> downsamples{1.0};
    const int level_count = level_count_dist(rng);
    for (int level = 1; level < level_count; ++level) {
      downsamples.push_back(downsamples.back() * (2.0 + 2.0 * unit(rng)));
    }
    const auto geometry = MakeGeometry(width, height, downsamples);

    const double scaling = std::exp(log_scaling_dist(rng));
    const Size2i level_size = GetScaledSize(geometry.dimensions, scaling);
    if (level_size[0] < 1 || level_size[1] < 1) {
      continue;
    }

    const int64_t region_w = 1 + static_cast<int64_t>(
                                     unit(rng) * (level_size[0] - 1));
    const int64_t region_h = 1 + static_cast<int64_t>(
                                     unit(rng) * (level_size[1] - 1));
    const double x = unit(rng) * static_cast<double>(level_size[0] - region_w);
    const double y = unit(rng) * static_cast<double>(level_size[1] - region_h);

    auto result =
        MapRegion(geometry, MakeRequest(x, y, scaling, region_w, region_h));
    ASSERT_TRUE(result.ok()) << result.status();
    const NativeRegionPlan& plan = *result;

    ASSERT_GE(plan.native_level, 0);
    ASSERT_LT(plan.native_level, level_count);
    EXPECT_LE(downsamples[plan.native_level], std::max(1.0, 1.0 / scaling));

    const LevelInfo& level = geometry.levels[plan.native_level];
    const double support = static_cast<double>(plan.support);

    for (size_t axis = 0; axis < 2; ++axis) {
      const double level_extent = static_cast<double>(level.dimensions[axis]);
      const double start = plan.native_location_adapted[axis];
      const double window = static_cast<double>(plan.native_size_adapted[axis]);

      EXPECT_GE(plan.level_zero_location[axis], 0);
      EXPECT_GE(start, 0.0);
      EXPECT_GE(plan.native_size_adapted[axis], 0);

      // Padded on the left unless clipped at the level origin
      EXPECT_LE(start, std::max(0.0, plan.native_location[axis] - support) +
                           kEps);
      // Padded on the right unless clipped at the level edge
      EXPECT_GE(start + window,
                std::min(plan.native_location[axis] +
                             plan.native_size[axis] + support,
                         level_extent) -
                    kEps);
      // Never more than the final ceil past the level edge
      EXPECT_LT(start + window, level_extent + 1.0 + kEps);
    }

    EXPECT_GE(plan.crop_box.left, 0.0);
    EXPECT_GE(plan.crop_box.top, 0.0);
    EXPECT_LE(plan.crop_box.right,
              static_cast<double>(plan.native_size_adapted[0]));
    EXPECT_LE(plan.crop_box.bottom,
              static_cast<double>(plan.native_size_adapted[1]));
    EXPECT_LE(plan.crop_box.Width(), plan.native_size[0] + kEps);
    EXPECT_LE(plan.crop_box.Height(), plan.native_size[1] + kEps);
    EXPECT_GT(plan.crop_box.Width(), 0.0);
    EXPECT_GT(plan.crop_box.Height(), 0.0);
  }
}

TEST(MapRegionPropertyTest, MappingIsDeterministic) {
  const auto geometry = MakeGeometry(12345, 6789, {1.0, 4.0, 16.0});
  const auto request = MakeRequest(123.25, 456.75, 0.37, 211, 97);

  auto first = MapRegion(geometry, request);
  auto second = MapRegion(geometry, request);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(first->level_zero_location, second->level_zero_location);
  EXPECT_EQ(first->native_size_adapted, second->native_size_adapted);
  EXPECT_DOUBLE_EQ(first->crop_box.left, second->crop_box.left);
  EXPECT_DOUBLE_EQ(first->crop_box.bottom, second->crop_box.bottom);
}

}  // namespace core
}  // namespace slidescale
