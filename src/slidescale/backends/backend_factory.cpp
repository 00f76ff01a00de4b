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

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "absl/strings/ascii.h"
#include "slidescale/backends/openslide_backend.h"
#include "slidescale/backends/tiff_backend.h"
#include "slidescale/errors.h"
#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"

namespace slidescale {

absl::StatusOr<ImageBackend> ParseImageBackend(std::string_view name) {
  const std::string lower = absl::AsciiStrToLower(name);
  if (lower == "openslide") {
    return ImageBackend::kOpenSlide;
  }
  if (lower == "tiff" || lower == "tifffile") {
    return ImageBackend::kTiff;
  }
  return MAKE_STATUS(
      ErrorCodes::kConfiguration,
      fmt::format("Unknown backend '{}'. Expected openslide or tiff", name));
}

absl::StatusOr<std::unique_ptr<SlideBackend>> OpenBackend(
    const std::filesystem::path& path, ImageBackend backend) {
  switch (backend) {
    case ImageBackend::kOpenSlide: {
      DECLARE_ASSIGN_OR_RETURN(std::unique_ptr<OpenSlideBackend>, slide,
                               OpenSlideBackend::Create(path));
      return std::unique_ptr<SlideBackend>(std::move(slide));
    }
    case ImageBackend::kTiff: {
      DECLARE_ASSIGN_OR_RETURN(std::unique_ptr<TiffBackend>, slide,
                               TiffBackend::Create(path));
      return std::unique_ptr<SlideBackend>(std::move(slide));
    }
  }
  return MAKE_STATUS(ErrorCodes::kConfiguration, "Unknown backend");
}

BackendFactory MakeBackendFactory(ImageBackend backend) {
  return [backend](const std::filesystem::path& path) {
    return OpenBackend(path, backend);
  };
}

}  // namespace slidescale
