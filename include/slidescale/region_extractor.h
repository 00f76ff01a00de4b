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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_REGION_EXTRACTOR_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_REGION_EXTRACTOR_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "absl/status/statusor.h"
#include "slidescale/core/coordinate_mapper.h"
#include "slidescale/image.h"
#include "slidescale/pipeline/region_resampler.h"
#include "slidescale/resample/resampling.h"
#include "slidescale/slide_backend.h"

namespace slidescale {

/**
 * @brief Reads a region at continuous scaling from a discrete pyramid.
 *
 * Runs the coordinate mapper, issues exactly one native read for the padded
 * window and hands the window to the configured resampling pipeline.
 * Validation happens before the backend is touched; backend errors are
 * propagated with their original status code and never retried.
 *
 * The extractor does not own the backend. It is immutable after
 * construction, so Extract can be called from several threads when the
 * backend allows concurrent reads.
 */
class RegionExtractor {
 public:
  /// @param backend Slide to read from, must outlive the extractor
  /// @param resampler Pipeline turning the window into the output
  /// @param interpolator Kernel for the resize
  /// @param apply_color_profile Transform to sRGB when the slide has a profile
  RegionExtractor(const SlideBackend* backend,
                  std::unique_ptr<RegionResampler> resampler,
                  Resampling interpolator, bool apply_color_profile);

  /// @brief Mapper result for a request without reading pixels
  [[nodiscard]] absl::StatusOr<NativeRegionPlan> Plan(
      const RegionRequest& request) const;

  /// @brief Region of exactly `request.size` pixels
  [[nodiscard]] absl::StatusOr<Image> Extract(
      const RegionRequest& request) const;

  [[nodiscard]] Resampling GetInterpolator() const { return interpolator_; }

  [[nodiscard]] InternalHandler GetInternalHandler() const {
    return resampler_->GetHandler();
  }

 private:
  const SlideBackend* backend_;
  std::unique_ptr<RegionResampler> resampler_;
  Resampling interpolator_;
  bool apply_color_profile_;
  std::optional<std::vector<uint8_t>> color_profile_;
};

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_REGION_EXTRACTOR_H_
