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

#include "slidescale/region_extractor.h"

#include <memory>
#include <utility>

#include "absl/log/log.h"
#include "slidescale/status/status_macros.h"

namespace slidescale {

RegionExtractor::RegionExtractor(const SlideBackend* backend,
                                 std::unique_ptr<RegionResampler> resampler,
                                 Resampling interpolator,
                                 bool apply_color_profile)
    : backend_(backend),
      resampler_(std::move(resampler)),
      interpolator_(interpolator),
      apply_color_profile_(apply_color_profile) {
  if (apply_color_profile_) {
    color_profile_ = backend_->GetColorProfile();
  }
}

absl::StatusOr<NativeRegionPlan> RegionExtractor::Plan(
    const RegionRequest& request) const {
  return core::MapRegion(backend_->GetGeometry(), request);
}

absl::StatusOr<Image> RegionExtractor::Extract(
    const RegionRequest& request) const {
  DECLARE_ASSIGN_OR_RETURN(NativeRegionPlan, plan, Plan(request));
  VLOG(1) << "Region plan: " << plan;

  const ImageDimensions target(static_cast<uint32_t>(plan.size[0]),
                               static_cast<uint32_t>(plan.size[1]));
  if (target[0] == 0 || target[1] == 0) {
    return Image(target, backend_->GetImageFormat());
  }

  DECLARE_ASSIGN_OR_RETURN(
      Image, window,
      backend_->ReadRegion(plan.level_zero_location, plan.native_level,
                           plan.native_size_adapted),
      "Native read failed");

  ResampleOptions options;
  options.resampling = interpolator_;
  options.apply_color_profile = apply_color_profile_;
  if (color_profile_.has_value()) {
    options.color_profile = &*color_profile_;
  }

  DECLARE_ASSIGN_OR_RETURN(
      Image, region,
      resampler_->Resample(window, plan.crop_box, target, options));
  return region;
}

}  // namespace slidescale
