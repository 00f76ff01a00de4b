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

#include "slidescale/scaled_view.h"

#include "slidescale/slide_image.h"

namespace slidescale {

SlideImageView::SlideImageView(const SlideImage* slide, double scaling,
                               std::optional<BoundaryMode> boundary_mode)
    : RegionView(boundary_mode), slide_(slide), scaling_(scaling) {}

double SlideImageView::GetMpp() const { return slide_->GetMpp(scaling_); }

Size2i SlideImageView::GetSize() const {
  return slide_->GetScaledSize(scaling_);
}

absl::StatusOr<Image> SlideImageView::ReadRegionImpl(
    const Size2d& location, const Size2i& size) const {
  return slide_->ReadRegion(location, scaling_, size);
}

}  // namespace slidescale
