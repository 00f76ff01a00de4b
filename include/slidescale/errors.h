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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_ERRORS_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_ERRORS_H_

#include "absl/status/status.h"

namespace slidescale {

/// @brief Status codes for the error kinds reported by slidescale
///
/// Backend decode errors are not listed: they keep whatever code the backend
/// produced.
namespace ErrorCodes {

/// Slide cannot be handled (anisotropic pixels, unreadable file, closed).
inline constexpr absl::StatusCode kUnsupportedSlide =
    absl::StatusCode::kFailedPrecondition;

/// Requested region lies outside the image at the requested scaling.
inline constexpr absl::StatusCode kBounds = absl::StatusCode::kOutOfRange;

/// Unknown pipeline, kernel or backend name, or an invalid parameter.
inline constexpr absl::StatusCode kConfiguration =
    absl::StatusCode::kInvalidArgument;

}  // namespace ErrorCodes

[[nodiscard]] inline bool IsUnsupportedSlideError(const absl::Status& status) {
  return status.code() == ErrorCodes::kUnsupportedSlide;
}

[[nodiscard]] inline bool IsBoundsError(const absl::Status& status) {
  return status.code() == ErrorCodes::kBounds;
}

[[nodiscard]] inline bool IsConfigurationError(const absl::Status& status) {
  return status.code() == ErrorCodes::kConfiguration;
}

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_ERRORS_H_
