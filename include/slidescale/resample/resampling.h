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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_RESAMPLE_RESAMPLING_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_RESAMPLE_RESAMPLING_H_

#include <string_view>

#include "absl/status/statusor.h"

namespace slidescale {

/// @brief Interpolation kernel used when resizing regions
enum class Resampling {
  kNearest,  ///< Nearest neighbour, for masks
  kLanczos,  ///< Lanczos-3, for images
};

/// @brief Get string representation of a kernel ("NEAREST", "LANCZOS")
constexpr const char* GetName(Resampling resampling) {
  switch (resampling) {
    case Resampling::kNearest:
      return "NEAREST";
    case Resampling::kLanczos:
      return "LANCZOS";
  }
  return "unknown";
}

/// @brief Parse a kernel name, case-insensitive
/// @return Kernel or a configuration error for unknown names
[[nodiscard]] absl::StatusOr<Resampling> ParseResampling(std::string_view name);

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_RESAMPLE_RESAMPLING_H_
