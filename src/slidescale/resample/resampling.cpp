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

#include "slidescale/resample/resampling.h"

#include <string>
#include <string_view>

#include "absl/strings/ascii.h"
#include "slidescale/errors.h"
#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"

namespace slidescale {

absl::StatusOr<Resampling> ParseResampling(std::string_view name) {
  const std::string upper = absl::AsciiStrToUpper(name);
  if (upper == "NEAREST") {
    return Resampling::kNearest;
  }
  if (upper == "LANCZOS") {
    return Resampling::kLanczos;
  }
  return MAKE_STATUS(
      ErrorCodes::kConfiguration,
      fmt::format("Unknown resampling '{}', expected NEAREST or LANCZOS",
                  name));
}

}  // namespace slidescale
