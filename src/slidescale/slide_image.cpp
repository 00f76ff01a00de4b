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

#include "slidescale/slide_image.h"

#include <cmath>
#include <filesystem>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include "absl/log/log.h"
#include "slidescale/core/validation.h"
#include "slidescale/errors.h"
#include "slidescale/scaled_view.h"
#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"

namespace fs = std::filesystem;

namespace slidescale {

namespace {

RegionRequest MakeRequest(const Size2d& location, double scaling,
                          const Size2i& size, CoordinateSpace space) {
  RegionRequest request;
  request.location = location;
  request.scaling = scaling;
  request.size = size;
  request.space = space;
  return request;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

SlideImage::SlideImage(std::unique_ptr<SlideBackend> backend,
                       std::string identifier, double avg_mpp,
                       Resampling interpolator,
                       InternalHandler internal_handler,
                       bool apply_color_profile)
    : backend_(std::move(backend)),
      identifier_(std::move(identifier)),
      avg_mpp_(avg_mpp),
      apply_color_profile_(apply_color_profile) {
  extractor_ = std::make_unique<RegionExtractor>(
      backend_.get(), CreateRegionResampler(internal_handler), interpolator,
      apply_color_profile);
}

SlideImage::~SlideImage() { Close(); }

absl::StatusOr<std::unique_ptr<SlideImage>> SlideImage::Create(
    std::unique_ptr<SlideBackend> backend, const SlideImageOptions& options) {
  if (backend == nullptr) {
    return MAKE_STATUS(ErrorCodes::kConfiguration, "Backend must not be null");
  }

  std::string identifier = options.identifier.value_or("");

  if (options.overwrite_mpp.has_value()) {
    backend->SetSpacing(*options.overwrite_mpp);
  }

  const std::optional<Spacing>& spacing = backend->GetSpacing();
  if (!spacing.has_value()) {
    return MAKE_STATUS(
        ErrorCodes::kUnsupportedSlide,
        fmt::format("The spacing of {} cannot be derived from image and is "
                    "not explicitly set in the overwrite_mpp option.",
                    identifier.empty() ? "<unnamed slide>" : identifier));
  }
  RETURN_IF_ERROR(core::CheckMppIsValid(*spacing),
                  fmt::format("Invalid spacing for {}", identifier));
  const double avg_mpp = ((*spacing)[0] + (*spacing)[1]) / 2.0;

  if (!options.internal_handler.has_value()) {
    LOG(WARNING) << "The internal handler is not set. Defaulting to "
                 << GetName(InternalHandler::kBox)
                 << ". Set internal_handler explicitly to keep this behaviour.";
  }
  const InternalHandler internal_handler =
      options.internal_handler.value_or(InternalHandler::kBox);

  return std::unique_ptr<SlideImage>(new SlideImage(
      std::move(backend), std::move(identifier), avg_mpp, options.interpolator,
      internal_handler, options.apply_color_profile));
}

absl::StatusOr<std::unique_ptr<SlideImage>> SlideImage::FromFilePath(
    const fs::path& path, const BackendFactory& factory,
    const SlideImageOptions& options) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       fmt::format("No such file or directory: {}",
                                   path.string()));
  }
  const fs::path resolved = fs::weakly_canonical(path, ec);
  const fs::path& slide_path = ec ? path : resolved;

  auto backend = factory(slide_path);
  if (!backend.ok()) {
    return MAKE_STATUS(
        ErrorCodes::kUnsupportedSlide,
        fmt::format("Unsupported file: {} ({})", slide_path.string(),
                    status::StripStackTrace(backend.status().message())));
  }

  SlideImageOptions resolved_options = options;
  if (!resolved_options.identifier.has_value()) {
    resolved_options.identifier = slide_path.string();
  }
  return Create(std::move(backend).value(), resolved_options);
}

absl::StatusOr<std::unique_ptr<SlideImage>> SlideImage::FromFilePath(
    const fs::path& path, ImageBackend backend,
    const SlideImageOptions& options) {
  return FromFilePath(path, MakeBackendFactory(backend), options);
}

absl::StatusOr<std::unique_ptr<SlideImage>> SlideImage::FromFilePath(
    const fs::path& path, std::string_view backend_name,
    const SlideImageOptions& options) {
  DECLARE_ASSIGN_OR_RETURN(ImageBackend, backend,
                           ParseImageBackend(backend_name));
  return FromFilePath(path, backend, options);
}

// ============================================================================
// Regions
// ============================================================================

absl::StatusOr<Image> SlideImage::ReadRegion(const Size2d& location,
                                             double scaling,
                                             const Size2i& size,
                                             CoordinateSpace space) const {
  if (IsClosed()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       fmt::format("{} is closed", identifier_));
  }
  return extractor_->Extract(MakeRequest(location, scaling, size, space));
}

absl::StatusOr<NativeRegionPlan> SlideImage::PlanRegion(
    const Size2d& location, double scaling, const Size2i& size,
    CoordinateSpace space) const {
  return extractor_->Plan(MakeRequest(location, scaling, size, space));
}

SlideImageView SlideImage::GetScaledView(
    double scaling, std::optional<BoundaryMode> boundary_mode) const {
  return SlideImageView(this, scaling, boundary_mode);
}

absl::StatusOr<Image> SlideImage::GetThumbnail(
    const ImageDimensions& size) const {
  return backend_->GetThumbnail(size);
}

// ============================================================================
// Scaling and resolution
// ============================================================================

Size2i SlideImage::GetScaledSize(double scaling, bool limit_bounds) const {
  const Size2i size =
      limit_bounds ? backend_->GetSlideBounds().size : GetSize();
  return size * scaling;
}

double SlideImage::GetScaling(std::optional<double> mpp) const {
  if (!mpp.has_value() || *mpp == 0.0) {
    return 1.0;
  }
  return avg_mpp_ / *mpp;
}

int SlideImage::GetClosestNativeLevel(double mpp) const {
  const std::vector<double> downsamples = backend_->GetLevelDownsamples();
  int closest = 0;
  double best = std::numeric_limits<double>::infinity();
  for (size_t level = 0; level < downsamples.size(); ++level) {
    const double distance = std::abs(avg_mpp_ * downsamples[level] - mpp);
    if (distance < best) {
      best = distance;
      closest = static_cast<int>(level);
    }
  }
  return closest;
}

Spacing SlideImage::GetClosestNativeMpp(double mpp) const {
  const std::vector<double> downsamples = backend_->GetLevelDownsamples();
  const int level = GetClosestNativeLevel(mpp);
  if (downsamples.empty()) {
    return GetSpacing();
  }
  return GetSpacing() * downsamples[level];
}

SlideBounds SlideImage::GetScaledSlideBounds(double scaling) const {
  const SlideBounds bounds = backend_->GetSlideBounds();
  return SlideBounds{bounds.offset * scaling, bounds.size * scaling};
}

// ============================================================================
// Accessors
// ============================================================================

double SlideImage::GetAspectRatio() const {
  const Size2i size = GetSize();
  return static_cast<double>(size[0]) / static_cast<double>(size[1]);
}

std::string SlideImage::DebugString() const {
  const std::optional<double> magnification = GetMagnification();
  const Size2i size = GetSize();
  return fmt::format(
      "SlideImage(identifier={}, vendor={}, mpp={}, magnification={}, "
      "size=({}, {}), internal_handler={}, interpolator={}, backend={})",
      identifier_, GetVendor(), avg_mpp_,
      magnification.has_value() ? fmt::format("{}", *magnification) : "None",
      size[0], size[1], GetName(GetInternalHandler()),
      GetName(GetInterpolator()), backend_->GetName());
}

std::ostream& operator<<(std::ostream& os, const SlideImage& slide) {
  return os << slide.DebugString();
}

void SlideImage::Close() { backend_->Close(); }

}  // namespace slidescale
