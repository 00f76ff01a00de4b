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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_CORE_SLIDE_GEOMETRY_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_CORE_SLIDE_GEOMETRY_H_

#include <cstdint>
#include <optional>
#include <vector>

#include "slidescale/utilities/numeric.h"

/**
 * @file slide_geometry.h
 * @brief Pyramid structure consumed by the coordinate mapper
 *
 * Pure data types describing the discrete levels of a slide, its tissue
 * bounds and its physical pixel pitch. Backends fill these; the mapper and
 * the slide image only read them.
 */

namespace slidescale {
namespace core {

/// @brief Microns per pixel in x and y at level zero
using Spacing = Size2d;

/// @brief Tissue-containing rectangle at level zero
///
/// Backends without bounds information report ((0, 0), dimensions).
struct SlideBounds {
  Size2i offset;  ///< Top-left corner (level 0 coordinates)
  Size2i size;    ///< Width and height (level 0 pixels)

  bool operator==(const SlideBounds& other) const = default;
};

/// @brief Pyramid level metadata
struct LevelInfo {
  Size2i dimensions;       ///< Level dimensions in pixels
  double downsample{1.0};  ///< Downsample factor relative to level 0
  std::optional<Spacing> spacing;  ///< Level spacing, when the slide has one
};

/// @brief Everything the coordinate mapper needs to know about a slide
struct PyramidGeometry {
  Size2i dimensions;              ///< Level 0 dimensions
  std::vector<LevelInfo> levels;  ///< Finest level first
  SlideBounds bounds;             ///< Tissue bounds at level 0

  [[nodiscard]] size_t GetLevelCount() const { return levels.size(); }

  /// @brief Downsample factors in level order
  [[nodiscard]] std::vector<double> GetLevelDownsamples() const {
    std::vector<double> downsamples;
    downsamples.reserve(levels.size());
    for (const auto& level : levels) {
      downsamples.push_back(level.downsample);
    }
    return downsamples;
  }
};

}  // namespace core

using core::LevelInfo;
using core::PyramidGeometry;
using core::SlideBounds;
using core::Spacing;

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_CORE_SLIDE_GEOMETRY_H_
