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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_REGION_VIEW_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_REGION_VIEW_H_

#include <optional>

#include "absl/status/statusor.h"
#include "slidescale/image.h"
#include "slidescale/utilities/numeric.h"

namespace slidescale {

/// @brief What happens to the part of a request outside the view
enum class BoundaryMode {
  kCrop,  ///< Clip the output to the view
  kZero,  ///< Keep the requested size, pad with zeros
};

/// @brief Name of a boundary mode ("crop", "zero")
constexpr const char* GetName(BoundaryMode mode) {
  return mode == BoundaryMode::kCrop ? "crop" : "zero";
}

/**
 * @brief A readable 2D view with a fixed resolution.
 *
 * Subclasses provide the size, the resolution and the raw read; this class
 * applies the boundary mode. Without a boundary mode requests are forwarded
 * unchanged, so reads past the view fail in the subclass.
 */
class RegionView {
 public:
  explicit RegionView(std::optional<BoundaryMode> boundary_mode = std::nullopt)
      : boundary_mode_(boundary_mode) {}

  virtual ~RegionView() = default;

  /// @brief Microns per pixel of the view
  [[nodiscard]] virtual double GetMpp() const = 0;

  /// @brief Width and height of the view
  [[nodiscard]] virtual Size2i GetSize() const = 0;

  [[nodiscard]] std::optional<BoundaryMode> GetBoundaryMode() const {
    return boundary_mode_;
  }

  /**
   * @brief Read a region of the view.
   *
   * With BoundaryMode::kCrop the size is clipped so the region ends inside
   * the view. With BoundaryMode::kZero the clipped region is placed in the
   * top-left corner of a zero image of the requested size.
   */
  [[nodiscard]] absl::StatusOr<Image> ReadRegion(const Size2d& location,
                                                 const Size2i& size) const;

 protected:
  [[nodiscard]] virtual absl::StatusOr<Image> ReadRegionImpl(
      const Size2d& location, const Size2i& size) const = 0;

 private:
  std::optional<BoundaryMode> boundary_mode_;
};

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_REGION_VIEW_H_
