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
#ifndef SLIDESCALE_INCLUDE_SLIDESCALE_IMAGE_H_
#define SLIDESCALE_INCLUDE_SLIDESCALE_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "slidescale/utilities/numeric.h"

namespace slidescale {

/// @brief Image dimensions
using ImageDimensions = Size<uint32_t, 2>;  // [width, height]

/// @brief Pixel layout of an 8-bit interleaved image
enum class ImageFormat {
  kGray = 1,       ///< Single channel grayscale
  kGrayAlpha = 2,  ///< Grayscale plus alpha
  kRGB = 3,        ///< 3 channels: Red, Green, Blue
  kRGBA = 4,       ///< 4 channels: Red, Green, Blue, Alpha
};

/// @brief Get string representation of image format
constexpr const char* GetName(ImageFormat format) {
  switch (format) {
    case ImageFormat::kGray:
      return "Gray";
    case ImageFormat::kGrayAlpha:
      return "GrayAlpha";
    case ImageFormat::kRGB:
      return "RGB";
    case ImageFormat::kRGBA:
      return "RGBA";
  }
  return "unknown";
}

/// @brief Get number of channels for a format
constexpr uint32_t GetFormatChannels(ImageFormat format) {
  return static_cast<uint32_t>(format);
}

/// @brief Format for a channel count, nullopt outside 1..4
constexpr std::optional<ImageFormat> FormatFromChannels(uint32_t channels) {
  switch (channels) {
    case 1:
      return ImageFormat::kGray;
    case 2:
      return ImageFormat::kGrayAlpha;
    case 3:
      return ImageFormat::kRGB;
    case 4:
      return ImageFormat::kRGBA;
    default:
      return std::nullopt;
  }
}

/// @brief 8-bit interleaved raster
///
/// Rows are stored top to bottom without padding, channels interleaved
/// (RGBRGB...). This is the currency between backends, resamplers and
/// callers.
class Image {
 public:
  /// @brief Default constructor for an empty 0x0 RGB image
  Image() : dimensions_{0, 0}, format_(ImageFormat::kRGB) {}

  /// @brief Zero-filled image
  /// @param dimensions Image dimensions [width, height]
  /// @param format Image format
  Image(const ImageDimensions& dimensions, ImageFormat format)
      : dimensions_(dimensions),
        format_(format),
        data_(static_cast<size_t>(dimensions[0]) * dimensions[1] *
                  GetFormatChannels(format),
              0) {}

  /// @brief Image adopting existing pixel data
  /// @throws std::invalid_argument if the buffer size does not match
  Image(const ImageDimensions& dimensions, ImageFormat format,
        std::vector<uint8_t> data)
      : dimensions_(dimensions), format_(format), data_(std::move(data)) {
    if (data_.size() != static_cast<size_t>(dimensions_[0]) * dimensions_[1] *
                            GetFormatChannels(format_)) {
      throw std::invalid_argument("Pixel buffer does not match dimensions");
    }
  }

  Image(const Image& other) = default;
  Image(Image&& other) noexcept = default;
  Image& operator=(const Image& other) = default;
  Image& operator=(Image&& other) noexcept = default;
  ~Image() = default;

  // Accessors

  [[nodiscard]] const ImageDimensions& GetDimensions() const noexcept {
    return dimensions_;
  }

  [[nodiscard]] uint32_t GetWidth() const noexcept { return dimensions_[0]; }

  [[nodiscard]] uint32_t GetHeight() const noexcept { return dimensions_[1]; }

  [[nodiscard]] uint32_t GetChannels() const noexcept {
    return GetFormatChannels(format_);
  }

  [[nodiscard]] ImageFormat GetFormat() const noexcept { return format_; }

  /// @brief True for zero width or zero height
  [[nodiscard]] bool Empty() const noexcept {
    return dimensions_[0] == 0 || dimensions_[1] == 0;
  }

  [[nodiscard]] size_t SizeBytes() const noexcept { return data_.size(); }

  [[nodiscard]] size_t GetPixelCount() const noexcept {
    return static_cast<size_t>(dimensions_[0]) * dimensions_[1];
  }

  /// @brief Bytes per row
  [[nodiscard]] size_t GetRowStride() const noexcept {
    return static_cast<size_t>(dimensions_[0]) * GetChannels();
  }

  // Data access

  [[nodiscard]] const uint8_t* GetData() const noexcept { return data_.data(); }

  [[nodiscard]] uint8_t* GetData() noexcept { return data_.data(); }

  [[nodiscard]] std::span<const uint8_t> GetSpan() const noexcept {
    return data_;
  }

  [[nodiscard]] std::span<uint8_t> GetSpan() noexcept { return data_; }

  /// @brief Pixel access
  /// @param y Row coordinate
  /// @param x Column coordinate
  /// @param channel Channel index
  /// @throws std::out_of_range on invalid coordinates
  [[nodiscard]] uint8_t& At(uint32_t y, uint32_t x, uint32_t channel) {
    ValidateCoordinates(y, x, channel);
    return data_[GetPixelIndex(y, x, channel)];
  }

  [[nodiscard]] const uint8_t& At(uint32_t y, uint32_t x,
                                  uint32_t channel) const {
    ValidateCoordinates(y, x, channel);
    return data_[GetPixelIndex(y, x, channel)];
  }

  /// @brief Set every sample to a constant
  void Fill(uint8_t value);

  /// @brief Copy out a rectangle
  /// @param x Left column
  /// @param y Top row
  /// @param width Width of the rectangle
  /// @param height Height of the rectangle
  /// @return New image of size [width, height]
  /// @throws std::out_of_range if the rectangle leaves the image
  [[nodiscard]] Image Crop(uint32_t x, uint32_t y, uint32_t width,
                           uint32_t height) const;

  /// @brief Copy `source` into this image with its top-left at (x, y)
  ///
  /// The part of `source` falling outside this image is dropped.
  /// @throws std::invalid_argument if the formats differ
  void Paste(const Image& source, uint32_t x, uint32_t y);

  bool operator==(const Image& other) const = default;

 private:
  [[nodiscard]] size_t GetPixelIndex(uint32_t y, uint32_t x,
                                     uint32_t channel) const noexcept {
    return (static_cast<size_t>(y) * dimensions_[0] + x) * GetChannels() +
           channel;
  }

  void ValidateCoordinates(uint32_t y, uint32_t x, uint32_t channel) const {
    if (x >= dimensions_[0] || y >= dimensions_[1] ||
        channel >= GetChannels()) {
      throw std::out_of_range("Pixel coordinates out of range");
    }
  }

  ImageDimensions dimensions_;
  ImageFormat format_;
  std::vector<uint8_t> data_;
};

/// @brief Stream output operator, prints "Image(WxH, Format)"
std::ostream& operator<<(std::ostream& os, const Image& image);

}  // namespace slidescale

#endif  // SLIDESCALE_INCLUDE_SLIDESCALE_IMAGE_H_
