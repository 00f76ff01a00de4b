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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_SLIDESCALE_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_SLIDESCALE_H_

/**
 * @file slidescale.h
 * @brief Main header for the slidescale library
 *
 * slidescale reads regions of whole-slide images at any continuous scaling
 * factor. It has three layers:
 * - **Core**: coordinate mapping from a scaled request to a native read
 * - **Pipeline**: resampling of the native window to the requested size
 * - **Backends**: pixel sources (OpenSlide, pyramidal TIFF)
 *
 * SlideImage ties the layers together; SlideImageView exposes one scaling
 * as a fixed-resolution view.
 */

// ============================================================================
// Core
// ============================================================================

#include "slidescale/core/coordinate_mapper.h"
#include "slidescale/core/slide_geometry.h"
#include "slidescale/core/validation.h"
#include "slidescale/errors.h"
#include "slidescale/image.h"
#include "slidescale/properties.h"

// ============================================================================
// Pipeline
// ============================================================================

#include "slidescale/pipeline/region_resampler.h"
#include "slidescale/resample/box_resample.h"
#include "slidescale/resample/resampling.h"

// ============================================================================
// Backends
// ============================================================================

#include "slidescale/backends/backend_factory.h"
#include "slidescale/backends/openslide_backend.h"
#include "slidescale/backends/tiff_backend.h"
#include "slidescale/slide_backend.h"

// ============================================================================
// Public API
// ============================================================================

#include "slidescale/region_extractor.h"
#include "slidescale/region_view.h"
#include "slidescale/scaled_view.h"
#include "slidescale/slide_image.h"
#include "slidescale/slide_options.h"

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_SLIDESCALE_H_
