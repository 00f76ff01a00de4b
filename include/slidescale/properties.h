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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_PROPERTIES_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_PROPERTIES_H_

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "absl/strings/numbers.h"

namespace slidescale {

/// @brief Key/value properties reported by a slide backend
///
/// Backends store raw vendor properties (OpenSlide keys such as
/// "openslide.mpp-x", Aperio description keys, TIFF tags) as strings and
/// derived values as numbers. Lookups that need a number parse strings on the
/// fly.
class Properties {
 public:
  /// @brief Value type for property entries
  using Value = std::variant<std::string, int64_t, double, bool>;

  /// @brief Underlying container type
  using Container = std::map<std::string, Value>;

  using const_iterator = Container::const_iterator;
  using value_type = Container::value_type;

  Properties() = default;

  Properties(std::initializer_list<value_type> init) : data_(init) {}

  Value& operator[](const std::string& key) { return data_[key]; }

  template <typename T>
  void Set(const std::string& key, T&& value) {
    data_.insert_or_assign(key, Value(std::forward<T>(value)));
  }

  [[nodiscard]] const_iterator find(const std::string& key) const {
    return data_.find(key);
  }

  [[nodiscard]] bool contains(const std::string& key) const {
    return data_.contains(key);
  }

  [[nodiscard]] size_t size() const noexcept { return data_.size(); }

  [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

  const_iterator begin() const { return data_.begin(); }

  const_iterator end() const { return data_.end(); }

  /// @brief Get value as string
  /// @param key Key to look up
  /// @return String form of the value, or nullopt if the key is missing
  [[nodiscard]] std::optional<std::string> GetString(
      const std::string& key) const {
    auto it = data_.find(key);
    if (it == data_.end()) {
      return std::nullopt;
    }
    return ValueToString(it->second);
  }

  /// @brief Get value as double
  /// @param key Key to look up
  /// @return Numeric value, or nullopt if missing or not parseable
  [[nodiscard]] std::optional<double> GetDouble(const std::string& key) const {
    auto it = data_.find(key);
    if (it == data_.end()) {
      return std::nullopt;
    }

    return std::visit(
        [](const auto& value) -> std::optional<double> {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::string>) {
            double parsed = 0.0;
            if (!absl::SimpleAtod(value, &parsed)) {
              return std::nullopt;
            }
            return parsed;
          } else {
            return static_cast<double>(value);
          }
        },
        it->second);
  }

  /// @brief String form of a single value (strings are not quoted)
  static std::string ValueToString(const Value& value) {
    return std::visit(
        [](const auto& v) -> std::string {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::string>) {
            return v;
          } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
          } else {
            return std::to_string(v);
          }
        },
        value);
  }

  bool operator==(const Properties& other) const = default;

 private:
  Container data_;
};

inline std::ostream& operator<<(std::ostream& os,
                                const Properties& properties) {
  os << "Properties {\n";
  for (const auto& [key, value] : properties) {
    os << "  " << key << ": ";
    if (std::holds_alternative<std::string>(value)) {
      os << "\"" << std::get<std::string>(value) << "\"";
    } else {
      os << Properties::ValueToString(value);
    }
    os << "\n";
  }
  os << "}";
  return os;
}

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_PROPERTIES_H_
