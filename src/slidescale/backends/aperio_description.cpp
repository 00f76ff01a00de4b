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

#include "slidescale/backends/aperio_description.h"

#include <string>
#include <string_view>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "slidescale/status/status_macros.h"

namespace slidescale {
namespace backends {

bool IsAperioDescription(std::string_view description) {
  return description.find("Aperio") != std::string_view::npos;
}

absl::StatusOr<AperioDescription> ParseAperioDescription(
    std::string_view description) {
  if (!IsAperioDescription(description)) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Not an Aperio description: missing Aperio signature");
  }

  AperioDescription parsed;
  const std::vector<std::string_view> segments =
      absl::StrSplit(description, '|');
  for (std::string_view segment : segments) {
    const std::vector<std::string_view> key_value =
        absl::StrSplit(segment, absl::MaxSplits('=', 1));
    if (key_value.size() != 2) {
      continue;
    }
    const std::string_view key = absl::StripAsciiWhitespace(key_value[0]);
    const std::string_view value = absl::StripAsciiWhitespace(key_value[1]);
    if (key.empty()) {
      continue;
    }
    parsed.fields.insert_or_assign(std::string(key), std::string(value));
  }

  if (parsed.fields.empty()) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       "No key = value pairs in Aperio description");
  }

  if (auto it = parsed.fields.find("MPP"); it != parsed.fields.end()) {
    double mpp = 0.0;
    if (absl::SimpleAtod(it->second, &mpp) && mpp > 0.0) {
      parsed.mpp = Spacing{mpp, mpp};
    }
  }

  if (auto it = parsed.fields.find("AppMag"); it != parsed.fields.end()) {
    double app_mag = 0.0;
    if (absl::SimpleAtod(it->second, &app_mag)) {
      parsed.app_mag = app_mag;
    }
  }

  if (auto it = parsed.fields.find("ScanScope ID");
      it != parsed.fields.end()) {
    parsed.scanner_id = it->second;
  }

  return parsed;
}

}  // namespace backends
}  // namespace slidescale
