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

#include "slidescale/region_view.h"

#include <algorithm>
#include <cstdint>

#include "slidescale/core/validation.h"
#include "slidescale/status/status_macros.h"

namespace slidescale {

absl::StatusOr<Image> RegionView::ReadRegion(const Size2d& location,
                                             const Size2i& size) const {
  if (!boundary_mode_.has_value()) {
    return ReadRegionImpl(location, size);
  }

  RETURN_IF_ERROR(core::CheckSize(size), "");

  const Size2i view_size = GetSize();
  Size2i clipped_size;
  for (size_t i = 0; i < 2; ++i) {
    const double end = std::clamp(location[i] + static_cast<double>(size[i]),
                                  0.0, static_cast<double>(view_size[i]));
    clipped_size[i] = std::max<int64_t>(
        static_cast<int64_t>(end - location[i]), 0);
  }

  DECLARE_ASSIGN_OR_RETURN(Image, region,
                           ReadRegionImpl(location, clipped_size));

  if (*boundary_mode_ == BoundaryMode::kCrop || clipped_size == size) {
    return region;
  }

  Image padded(ImageDimensions(static_cast<uint32_t>(size[0]),
                               static_cast<uint32_t>(size[1])),
               region.GetFormat());
  if (!region.Empty()) {
    padded.Paste(region, 0, 0);
  }
  return padded;
}

}  // namespace slidescale
