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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_BACKEND_FACTORY_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_BACKEND_FACTORY_H_

#include <filesystem>
#include <functional>
#include <memory>
#include <string_view>

#include "absl/status/statusor.h"
#include "slidescale/slide_backend.h"

namespace slidescale {

/// @brief Built-in slide backends
enum class ImageBackend {
  kOpenSlide,  ///< libopenslide, all formats OpenSlide understands
  kTiff,       ///< Pyramidal tiled TIFF through libtiff
};

/// @brief Lower-case name of a backend ("openslide", "tiff")
constexpr const char* GetName(ImageBackend backend) {
  return backend == ImageBackend::kOpenSlide ? "openslide" : "tiff";
}

/// @brief Parse "openslide", "tiff" or "tifffile", case-insensitive
/// @return Backend, or a configuration error for other names
[[nodiscard]] absl::StatusOr<ImageBackend> ParseImageBackend(
    std::string_view name);

/// @brief Callable opening a slide file, used to plug in custom backends
using BackendFactory =
    std::function<absl::StatusOr<std::unique_ptr<SlideBackend>>(
        const std::filesystem::path&)>;

/// @brief Open `path` with a built-in backend
[[nodiscard]] absl::StatusOr<std::unique_ptr<SlideBackend>> OpenBackend(
    const std::filesystem::path& path, ImageBackend backend);

/// @brief Factory wrapping a built-in backend
[[nodiscard]] BackendFactory MakeBackendFactory(ImageBackend backend);

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_BACKEND_FACTORY_H_
