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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_UTILITIES_NUMERIC_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_UTILITIES_NUMERIC_H_

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <stdexcept>
#include <type_traits>

namespace slidescale {

// Concept for a number which is integral or float with arithmetic operations
template <typename T>
concept GenericNumber = (std::integral<T> || std::floating_point<T>) &&
                        requires(T a, T b) {
                          { a + b } -> std::convertible_to<T>;
                          { a - b } -> std::convertible_to<T>;
                          { a * b } -> std::convertible_to<T>;
                          { a / b } -> std::convertible_to<T>;
                          { static_cast<double>(a) } -> std::convertible_to<double>;
                        };

/// @brief Fixed-size elementwise vector used for sizes and coordinates
///
/// All arithmetic is elementwise. Binary operators between vectors of
/// different element types compute in the left operand's type.
template <GenericNumber T, std::size_t N>
class Size {
 public:
  constexpr Size() : data_{} {}

  constexpr Size(std::initializer_list<T> init) : data_{} {
    if (init.size() != N) {
      throw std::invalid_argument("Initializer list must have size N.");
    }
    std::copy(init.begin(), init.end(), data_.begin());
  }

  template <typename... Args>
  constexpr explicit Size(Args... args) requires(
      sizeof...(args) == N && (std::convertible_to<Args, T> && ...))
      : data_{static_cast<T>(args)...} {}

  constexpr T& operator[](std::size_t index) { return data_[index]; }

  constexpr const T& operator[](std::size_t index) const {
    return data_[index];
  }

  /// @brief Elementwise static_cast to another element type
  template <GenericNumber U>
  [[nodiscard]] constexpr Size<U, N> Cast() const {
    Size<U, N> result;
    for (std::size_t i = 0; i < N; ++i) {
      result[i] = static_cast<U>(data_[i]);
    }
    return result;
  }

  template <typename U>
  constexpr Size operator+(const Size<U, N>& other) const {
    Size result;
    for (std::size_t i = 0; i < N; ++i) {
      result[i] = static_cast<T>(data_[i] + other[i]);
    }
    return result;
  }

  template <typename U>
  constexpr Size operator-(const Size<U, N>& other) const {
    Size result;
    for (std::size_t i = 0; i < N; ++i) {
      result[i] = static_cast<T>(data_[i] - other[i]);
    }
    return result;
  }

  template <typename U>
  constexpr Size operator*(const Size<U, N>& other) const {
    Size result;
    for (std::size_t i = 0; i < N; ++i) {
      result[i] = static_cast<T>(data_[i] * other[i]);
    }
    return result;
  }

  template <typename U>
  constexpr Size operator/(const Size<U, N>& other) const {
    Size result;
    for (std::size_t i = 0; i < N; ++i) {
      result[i] = static_cast<T>(data_[i] / other[i]);
    }
    return result;
  }

  constexpr Size operator+(double scalar) const {
    Size result;
    for (std::size_t i = 0; i < N; ++i) {
      result[i] = static_cast<T>(data_[i] + scalar);
    }
    return result;
  }

  constexpr Size operator-(double scalar) const {
    Size result;
    for (std::size_t i = 0; i < N; ++i) {
      result[i] = static_cast<T>(data_[i] - scalar);
    }
    return result;
  }

  constexpr Size operator*(double scalar) const {
    Size result;
    for (std::size_t i = 0; i < N; ++i) {
      result[i] = static_cast<T>(data_[i] * scalar);
    }
    return result;
  }

  constexpr Size operator/(double scalar) const {
    Size result;
    for (std::size_t i = 0; i < N; ++i) {
      result[i] = static_cast<T>(data_[i] / scalar);
    }
    return result;
  }

  template <typename U>
  constexpr bool operator==(const Size<U, N>& other) const {
    for (std::size_t i = 0; i < N; ++i) {
      if (data_[i] != other[i]) {
        return false;
      }
    }
    return true;
  }

  /// @brief True if any element satisfies the predicate
  template <typename Pred>
  [[nodiscard]] constexpr bool Any(Pred pred) const {
    return std::any_of(data_.begin(), data_.end(), pred);
  }

  friend std::ostream& operator<<(std::ostream& os, const Size& size) {
    os << "{";
    for (std::size_t i = 0; i < N; ++i) {
      os << size[i];
      if (i < N - 1) {
        os << ", ";
      }
    }
    os << "}";
    return os;
  }

 private:
  std::array<T, N> data_;
};

/// @brief Integer pixel size or coordinate (signed so invalid input survives)
using Size2i = Size<int64_t, 2>;

/// @brief Real-valued coordinate or size
using Size2d = Size<double, 2>;

template <GenericNumber T, std::size_t N>
Size<T, N> Floor(const Size<T, N>& input) {
  Size<T, N> result;
  for (std::size_t i = 0; i < N; ++i) {
    result[i] = static_cast<T>(std::floor(static_cast<double>(input[i])));
  }
  return result;
}

template <GenericNumber T, std::size_t N>
Size<T, N> Ceil(const Size<T, N>& input) {
  Size<T, N> result;
  for (std::size_t i = 0; i < N; ++i) {
    result[i] = static_cast<T>(std::ceil(static_cast<double>(input[i])));
  }
  return result;
}

template <GenericNumber T, std::size_t N>
Size<T, N> Clamp(const Size<T, N>& value, const Size<T, N>& min_value,
                 const Size<T, N>& max_value) {
  Size<T, N> result;
  for (std::size_t i = 0; i < N; ++i) {
    result[i] = std::clamp(value[i], min_value[i], max_value[i]);
  }
  return result;
}

template <GenericNumber T, std::size_t N>
Size<T, N> Min(const Size<T, N>& a, const Size<T, N>& b) {
  Size<T, N> result;
  for (std::size_t i = 0; i < N; ++i) {
    result[i] = std::min(a[i], b[i]);
  }
  return result;
}

template <GenericNumber T, std::size_t N>
Size<T, N> Max(const Size<T, N>& a, const Size<T, N>& b) {
  Size<T, N> result;
  for (std::size_t i = 0; i < N; ++i) {
    result[i] = std::max(a[i], b[i]);
  }
  return result;
}

}  // namespace slidescale

namespace fmt {

// Formats Size<T, N> as "{a, b}"
template <typename T, std::size_t N>
struct formatter<slidescale::Size<T, N>> {
  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const slidescale::Size<T, N>& size, FormatContext& ctx) const
      -> decltype(ctx.out()) {
    auto out = ctx.out();
    *out++ = '{';
    for (std::size_t i = 0; i < N; ++i) {
      out = fmt::format_to(out, "{}", size[i]);
      if (i < N - 1) {
        *out++ = ',';
        *out++ = ' ';
      }
    }
    *out++ = '}';
    return out;
  }
};

}  // namespace fmt

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_UTILITIES_NUMERIC_H_
