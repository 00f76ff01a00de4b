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

#include "slidescale/core/validation.h"

#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "absl/status/status.h"
#include "slidescale/errors.h"

namespace slidescale {
namespace core {

TEST(ValidationTest, CheckSizeAcceptsZero) {
  EXPECT_TRUE(CheckSize(Size2i{0, 0}).ok());
  EXPECT_TRUE(CheckSize(Size2i{10, 3}).ok());
}

TEST(ValidationTest, CheckSizeRejectsNegative) {
  auto status = CheckSize(Size2i{10, -1});
  EXPECT_TRUE(IsBoundsError(status)) << status;
  EXPECT_NE(status.message().find("[10, -1]"), std::string::npos);
}

TEST(ValidationTest, CheckSizeAndLocationInside) {
  const Size2i level_size{100, 50};
  EXPECT_TRUE(CheckSizeAndLocation(Size2d{0.0, 0.0}, Size2i{100, 50},
                                   level_size)
                  .ok());
  EXPECT_TRUE(CheckSizeAndLocation(Size2d{10.5, 20.25}, Size2i{10, 10},
                                   level_size)
                  .ok());
}

TEST(ValidationTest, CheckSizeAndLocationOutside) {
  const Size2i level_size{100, 50};
  EXPECT_TRUE(IsBoundsError(
      CheckSizeAndLocation(Size2d{-0.5, 0.0}, Size2i{1, 1}, level_size)));
  EXPECT_TRUE(IsBoundsError(
      CheckSizeAndLocation(Size2d{0.0, 40.5}, Size2i{1, 10}, level_size)));
  EXPECT_TRUE(IsBoundsError(
      CheckSizeAndLocation(Size2d{0.0, 0.0}, Size2i{101, 1}, level_size)));
  EXPECT_TRUE(IsBoundsError(
      CheckSizeAndLocation(Size2d{0.0, 0.0}, Size2i{-1, 1}, level_size)));
}

TEST(ValidationTest, CheckSizeAndLocationMessageListsValues) {
  auto status = CheckSizeAndLocation(Size2d{995.0, 995.0}, Size2i{10, 10},
                                     Size2i{1000, 1000});
  ASSERT_FALSE(status.ok());
  const std::string message(status.message());
  EXPECT_NE(message.find("[995, 995]"), std::string::npos) << message;
  EXPECT_NE(message.find("[1005, 1005]"), std::string::npos) << message;
  EXPECT_NE(message.find("[1000, 1000]"), std::string::npos) << message;
}

TEST(ValidationTest, CheckScaling) {
  EXPECT_TRUE(CheckScaling(1.0).ok());
  EXPECT_TRUE(CheckScaling(1e-4).ok());
  EXPECT_TRUE(IsConfigurationError(CheckScaling(0.0)));
  EXPECT_TRUE(IsConfigurationError(CheckScaling(-0.5)));
  EXPECT_TRUE(IsConfigurationError(
      CheckScaling(std::numeric_limits<double>::infinity())));
  EXPECT_TRUE(IsConfigurationError(
      CheckScaling(std::numeric_limits<double>::quiet_NaN())));
}

TEST(ValidationTest, CheckMppIsValidAcceptsSquarePixels) {
  EXPECT_TRUE(CheckMppIsValid(Spacing{0.25, 0.25}).ok());
  // 1.4% apart
  EXPECT_TRUE(CheckMppIsValid(Spacing{0.25, 0.2535}).ok());
}

TEST(ValidationTest, CheckMppIsValidRejectsAnisotropy) {
  auto status = CheckMppIsValid(Spacing{0.25, 0.26});
  EXPECT_TRUE(IsUnsupportedSlideError(status)) << status;
}

TEST(ValidationTest, CheckMppIsValidRejectsNonPositive) {
  EXPECT_TRUE(IsUnsupportedSlideError(CheckMppIsValid(Spacing{0.0, 0.0})));
  EXPECT_TRUE(IsUnsupportedSlideError(CheckMppIsValid(Spacing{-0.25, 0.25})));
}

}  // namespace core
}  // namespace slidescale
