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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_SCALED_VIEW_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_SCALED_VIEW_H_

#include <optional>

#include "absl/status/statusor.h"
#include "slidescale/image.h"
#include "slidescale/region_view.h"
#include "slidescale/utilities/numeric.h"

namespace slidescale {

class SlideImage;

/// @brief A SlideImage seen at one fixed scaling
///
/// Holds a non-owning pointer to the slide and must not outlive it. Reads go
/// through SlideImage::ReadRegion with the view's scaling.
class SlideImageView : public RegionView {
 public:
  SlideImageView(const SlideImage* slide, double scaling,
                 std::optional<BoundaryMode> boundary_mode = std::nullopt);

  /// @brief Slide mpp divided by the scaling
  double GetMpp() const override;

  /// @brief Slide size at the scaling
  Size2i GetSize() const override;

  [[nodiscard]] double GetScaling() const { return scaling_; }

 protected:
  absl::StatusOr<Image> ReadRegionImpl(const Size2d& location,
                                       const Size2i& size) const override;

 private:
  const SlideImage* slide_;
  double scaling_;
};

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_SCALED_VIEW_H_
