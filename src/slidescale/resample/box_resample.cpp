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

#include "slidescale/resample/box_resample.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "slidescale/errors.h"
#include "slidescale/status/status_macros.h"
#include "slidescale/utilities/fmt.h"

namespace slidescale::resample {

namespace {

constexpr int kLanczosSize = 3;

uint8_t ClampFixedToByte(int64_t value) {
  return static_cast<uint8_t>(
      std::clamp<int64_t>(value >> kPrecisionBits, 0, 255));
}

Image ResizeNearest(const Image& source, const core::CropBox& box,
                    const ImageDimensions& target) {
  const auto columns = ComputeNearestIndices(box.left, box.right,
                                             source.GetWidth(), target[0]);
  const auto rows = ComputeNearestIndices(box.top, box.bottom,
                                          source.GetHeight(), target[1]);

  Image output(target, source.GetFormat());
  const size_t channels = source.GetChannels();
  const uint8_t* src = source.GetData();
  uint8_t* dst = output.GetData();

  for (uint32_t y = 0; y < target[1]; ++y) {
    const uint8_t* src_row = src + static_cast<size_t>(rows[y]) *
                                       source.GetRowStride();
    for (uint32_t x = 0; x < target[0]; ++x) {
      const uint8_t* pixel = src_row + static_cast<size_t>(columns[x]) *
                                           channels;
      std::copy(pixel, pixel + channels, dst);
      dst += channels;
    }
  }
  return output;
}

Image ResizeLanczos(const Image& source, const core::CropBox& box,
                    const ImageDimensions& target) {
  const auto horizontal = ComputeLanczosWeights(box.left, box.right,
                                                source.GetWidth(), target[0]);
  const auto vertical = ComputeLanczosWeights(box.top, box.bottom,
                                              source.GetHeight(), target[1]);

  // Only rows some output row depends on go through the horizontal pass.
  int row_begin = static_cast<int>(source.GetHeight());
  int row_end = 0;
  for (const auto& span : vertical) {
    row_begin = std::min(row_begin, span.first);
    row_end = std::max(row_end,
                       span.first + static_cast<int>(span.weights.size()));
  }

  std::vector<std::vector<int32_t>> horizontal_coefficients;
  horizontal_coefficients.reserve(horizontal.size());
  for (const auto& span : horizontal) {
    horizontal_coefficients.push_back(QuantizeWeights(span.weights));
  }

  // Both passes round to 8 bits, so the intermediate is an 8-bit image.
  const size_t channels = source.GetChannels();
  const size_t out_stride = static_cast<size_t>(target[0]) * channels;
  std::vector<uint8_t> intermediate(
      static_cast<size_t>(std::max(row_end - row_begin, 0)) * out_stride);

  const uint8_t* src = source.GetData();
  for (int y = row_begin; y < row_end; ++y) {
    const uint8_t* src_row = src + static_cast<size_t>(y) *
                                       source.GetRowStride();
    uint8_t* dst_row =
        intermediate.data() + static_cast<size_t>(y - row_begin) * out_stride;
    for (uint32_t x = 0; x < target[0]; ++x) {
      const TapSpan& span = horizontal[x];
      const std::vector<int32_t>& k = horizontal_coefficients[x];
      for (size_t c = 0; c < channels; ++c) {
        int64_t acc = kFixedPointHalf;
        for (size_t i = 0; i < k.size(); ++i) {
          acc += static_cast<int64_t>(k[i]) *
                 src_row[(static_cast<size_t>(span.first) + i) * channels + c];
        }
        dst_row[x * channels + c] = ClampFixedToByte(acc);
      }
    }
  }

  Image output(target, source.GetFormat());
  uint8_t* dst = output.GetData();
  for (uint32_t y = 0; y < target[1]; ++y) {
    const TapSpan& span = vertical[y];
    const std::vector<int32_t> k = QuantizeWeights(span.weights);
    for (size_t i = 0; i < out_stride; ++i) {
      int64_t acc = kFixedPointHalf;
      for (size_t j = 0; j < k.size(); ++j) {
        const size_t row = static_cast<size_t>(span.first - row_begin) + j;
        acc += static_cast<int64_t>(k[j]) * intermediate[row * out_stride + i];
      }
      dst[static_cast<size_t>(y) * out_stride + i] = ClampFixedToByte(acc);
    }
  }
  return output;
}

}  // namespace

std::vector<int32_t> QuantizeWeights(const std::vector<double>& weights) {
  std::vector<int32_t> coefficients(weights.size());
  for (size_t i = 0; i < weights.size(); ++i) {
    const double scaled = weights[i] * (1 << kPrecisionBits);
    coefficients[i] = static_cast<int32_t>(
        std::trunc(scaled < 0.0 ? scaled - 0.5 : scaled + 0.5));
  }
  return coefficients;
}

std::vector<TapSpan> ComputeLanczosWeights(double start, double end,
                                           uint32_t in_size,
                                           uint32_t out_size) {
  std::vector<TapSpan> spans(out_size);
  if (out_size == 0 || in_size == 0) {
    return spans;
  }

  const double scale = (end - start) / out_size;
  const double filter_scale = std::max(scale, 1.0);
  const double support = kLanczosSize * filter_scale;
  const double inv_filter_scale = 1.0 / filter_scale;
  const int last = static_cast<int>(in_size);

  for (uint32_t i = 0; i < out_size; ++i) {
    const double center = start + (i + 0.5) * scale;
    int first = std::max(static_cast<int>(std::floor(center - support + 0.5)),
                         0);
    int stop = std::min(static_cast<int>(std::floor(center + support + 0.5)),
                        last);
    if (stop <= first) {
      first = std::clamp(static_cast<int>(std::floor(center)), 0, last - 1);
      stop = first + 1;
    }

    TapSpan& span = spans[i];
    span.first = first;
    span.weights.resize(static_cast<size_t>(stop - first));

    double sum = 0.0;
    for (int x = first; x < stop; ++x) {
      const double w =
          LanczosKernel<kLanczosSize>((x - center + 0.5) * inv_filter_scale);
      span.weights[x - first] = w;
      sum += w;
    }

    if (std::abs(sum) > kNormalizationTolerance) {
      for (double& w : span.weights) {
        w /= sum;
      }
    } else {
      std::fill(span.weights.begin(), span.weights.end(), 0.0);
      const int nearest =
          std::clamp(static_cast<int>(std::floor(center)), first, stop - 1);
      span.weights[nearest - first] = 1.0;
    }
  }
  return spans;
}

std::vector<int> ComputeNearestIndices(double start, double end,
                                       uint32_t in_size, uint32_t out_size) {
  std::vector<int> indices(out_size, 0);
  if (in_size == 0) {
    return indices;
  }
  const double scale = (end - start) / out_size;
  for (uint32_t i = 0; i < out_size; ++i) {
    indices[i] = std::clamp(
        static_cast<int>(std::floor(start + (i + 0.5) * scale)), 0,
        static_cast<int>(in_size) - 1);
  }
  return indices;
}

absl::StatusOr<Image> ResizeWithBox(const Image& source,
                                    const core::CropBox& box,
                                    const ImageDimensions& target,
                                    Resampling resampling) {
  if (target[0] == 0 || target[1] == 0) {
    return Image(target, source.GetFormat());
  }
  if (source.Empty()) {
    return MAKE_STATUS(ErrorCodes::kConfiguration,
                       "Cannot resample an empty image");
  }

  core::CropBox clipped = box;
  clipped.left = std::max(clipped.left, 0.0);
  clipped.top = std::max(clipped.top, 0.0);
  clipped.right =
      std::min(clipped.right, static_cast<double>(source.GetWidth()));
  clipped.bottom =
      std::min(clipped.bottom, static_cast<double>(source.GetHeight()));

  if (!(clipped.right > clipped.left) || !(clipped.bottom > clipped.top)) {
    return MAKE_STATUS(
        ErrorCodes::kConfiguration,
        fmt::format("Degenerate resampling box [{}, {}, {}, {}] for a {}x{} "
                    "source",
                    box.left, box.top, box.right, box.bottom,
                    source.GetWidth(), source.GetHeight()));
  }

  switch (resampling) {
    case Resampling::kNearest:
      return ResizeNearest(source, clipped, target);
    case Resampling::kLanczos:
      return ResizeLanczos(source, clipped, target);
  }
  return MAKE_STATUS(ErrorCodes::kConfiguration, "Unknown resampling kernel");
}

absl::StatusOr<Image> Resize(const Image& source,
                             const ImageDimensions& target,
                             Resampling resampling) {
  core::CropBox box;
  box.right = source.GetWidth();
  box.bottom = source.GetHeight();
  return ResizeWithBox(source, box, target, resampling);
}

ImageDimensions FitInside(const ImageDimensions& size,
                          const ImageDimensions& bound) {
  if (size[0] == 0 || size[1] == 0) {
    return size;
  }
  if (size[0] <= bound[0] && size[1] <= bound[1]) {
    return size;
  }

  const double scale = std::min(static_cast<double>(bound[0]) / size[0],
                                static_cast<double>(bound[1]) / size[1]);
  const auto fit = [scale](uint32_t extent, uint32_t limit) {
    const auto scaled = static_cast<uint32_t>(std::lround(extent * scale));
    return std::clamp<uint32_t>(scaled, 1, std::max<uint32_t>(limit, 1));
  };
  return ImageDimensions(fit(size[0], bound[0]), fit(size[1], bound[1]));
}

}  // namespace slidescale::resample
