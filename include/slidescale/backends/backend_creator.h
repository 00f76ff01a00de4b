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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_BACKEND_CREATOR_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_BACKEND_CREATOR_H_

#include <filesystem>
#include <memory>

#include "absl/status/statusor.h"
#include "slidescale/status/status_macros.h"

/**
 * @file backend_creator.h
 * @brief CRTP mixin shared by the file-based backends
 *
 * Every backend opens in two steps: a cheap input check, then construction
 * with all metadata loaded. The mixin fixes that order:
 *
 * ```cpp
 * class MyBackend : public SlideBackend, public BackendCreator<MyBackend> {
 *  public:
 *   static absl::StatusOr<std::unique_ptr<MyBackend>> Create(
 *       const std::filesystem::path& filename) {
 *     return CreateImpl(filename);
 *   }
 *
 *  private:
 *   friend class BackendCreator<MyBackend>;
 *   static absl::Status ValidateInput(const std::filesystem::path& filename);
 *   static absl::StatusOr<std::unique_ptr<MyBackend>> CreateBackendImpl(
 *       const std::filesystem::path& filename);
 * };
 * ```
 */

namespace slidescale {

template <typename Derived>
class BackendCreator {
 protected:
  /// @brief Validate the input, then construct the backend
  static absl::StatusOr<std::unique_ptr<Derived>> CreateImpl(
      const std::filesystem::path& filename) {
    RETURN_IF_ERROR(Derived::ValidateInput(filename),
                    "Failed to validate input");
    return Derived::CreateBackendImpl(filename);
  }

  BackendCreator() = default;
  ~BackendCreator() = default;

  BackendCreator(const BackendCreator&) = delete;
  BackendCreator& operator=(const BackendCreator&) = delete;
  BackendCreator(BackendCreator&&) = delete;
  BackendCreator& operator=(BackendCreator&&) = delete;
};

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_BACKENDS_BACKEND_CREATOR_H_
