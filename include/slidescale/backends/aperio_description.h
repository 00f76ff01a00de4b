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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_APERIO_DESCRIPTION_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_APERIO_DESCRIPTION_H_

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "slidescale/core/slide_geometry.h"

namespace slidescale {
namespace backends {

/// @brief Calibration found in an Aperio ImageDescription tag
struct AperioDescription {
  std::optional<Spacing> mpp;      ///< From "MPP", isotropic
  std::optional<double> app_mag;   ///< From "AppMag"
  std::string scanner_id;          ///< From "ScanScope ID"
  std::map<std::string, std::string> fields;  ///< Every key = value pair
};

/// @brief True if the description carries the Aperio signature
bool IsAperioDescription(std::string_view description);

/**
 * @brief Parse a pipe-separated Aperio description.
 *
 * The first segment is the library banner and the image layout; every later
 * segment of the form "key = value" becomes a field. Whitespace around keys
 * and values is ignored; non-positive or unparsable MPP values are dropped.
 *
 * @return Parsed description; kInvalidArgument without the Aperio
 *         signature, kNotFound when no key = value pair is present
 */
absl::StatusOr<AperioDescription> ParseAperioDescription(
    std::string_view description);

}  // namespace backends
}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_APERIO_DESCRIPTION_H_
