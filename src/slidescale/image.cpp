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

#include "slidescale/image.h"

#include <algorithm>
#include <cstring>
#include <ostream>
#include <stdexcept>

namespace slidescale {

void Image::Fill(uint8_t value) {
  std::fill(data_.begin(), data_.end(), value);
}

Image Image::Crop(uint32_t x, uint32_t y, uint32_t width,
                  uint32_t height) const {
  if (static_cast<uint64_t>(x) + width > dimensions_[0] ||
      static_cast<uint64_t>(y) + height > dimensions_[1]) {
    throw std::out_of_range("Crop rectangle exceeds image dimensions");
  }

  Image result(ImageDimensions(width, height), format_);
  if (result.Empty()) {
    return result;
  }

  const size_t channels = GetChannels();
  const size_t row_bytes = static_cast<size_t>(width) * channels;
  for (uint32_t row = 0; row < height; ++row) {
    const uint8_t* src = data_.data() + GetPixelIndex(y + row, x, 0);
    uint8_t* dst = result.data_.data() + row * row_bytes;
    std::memcpy(dst, src, row_bytes);
  }
  return result;
}

void Image::Paste(const Image& source, uint32_t x, uint32_t y) {
  if (source.format_ != format_) {
    throw std::invalid_argument("Cannot paste images of different formats");
  }
  if (x >= dimensions_[0] || y >= dimensions_[1] || source.Empty()) {
    return;
  }

  const uint32_t copy_width = std::min(source.GetWidth(), dimensions_[0] - x);
  const uint32_t copy_height =
      std::min(source.GetHeight(), dimensions_[1] - y);
  const size_t row_bytes = static_cast<size_t>(copy_width) * GetChannels();

  for (uint32_t row = 0; row < copy_height; ++row) {
    const uint8_t* src = source.data_.data() + source.GetPixelIndex(row, 0, 0);
    uint8_t* dst = data_.data() + GetPixelIndex(y + row, x, 0);
    std::memcpy(dst, src, row_bytes);
  }
}

std::ostream& operator<<(std::ostream& os, const Image& image) {
  os << "Image(" << image.GetWidth() << "x" << image.GetHeight() << ", "
     << GetName(image.GetFormat()) << ")";
  return os;
}

}  // namespace slidescale
