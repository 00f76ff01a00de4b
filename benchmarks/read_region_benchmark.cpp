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

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <random>

#include "slidescale/core/coordinate_mapper.h"
#include "slidescale/scaled_view.h"
#include "slidescale/slide_image.h"
#include "slidescale/testing/synthetic_backend.h"
#include "slidescale/utilities/vips.h"

namespace {

using slidescale::ImageDimensions;
using slidescale::InternalHandler;
using slidescale::Size2d;
using slidescale::Size2i;
using slidescale::SlideImage;

constexpr int64_t kSlideSize = 8192;

slidescale::testing::SyntheticConfig MakeConfig() {
  slidescale::testing::SyntheticConfig config;
  config.dimensions = Size2i(kSlideSize, kSlideSize);
  config.downsamples = {1.0, 4.0, 16.0, 64.0};
  return config;
}

// Range 0: output tile size. Range 1: scaling in percent. Range 2: handler.
class ReadRegionFixture : public benchmark::Fixture {
 public:
  void SetUp(const ::benchmark::State& state) override {
    tile_size_ = state.range(0);
    scaling_ = static_cast<double>(state.range(1)) / 100.0;

    slidescale::SlideImageOptions options;
    options.internal_handler = static_cast<InternalHandler>(state.range(2));
    auto slide = SlideImage::Create(
        slidescale::testing::MakeSyntheticBackend(MakeConfig()), options);
    if (slide.ok()) {
      slide_ = std::move(slide).value();
    }
  }

  void TearDown(const ::benchmark::State& state) override { slide_.reset(); }

 protected:
  std::unique_ptr<SlideImage> slide_;
  int64_t tile_size_ = 0;
  double scaling_ = 1.0;
};

BENCHMARK_DEFINE_F(ReadRegionFixture, RowMajor)
(benchmark::State& state) {
  if (!slide_) {
    state.SkipWithError("Failed to create slide");
    return;
  }

  const Size2i scaled = slide_->GetScaledSize(scaling_);
  const int64_t tiles_x = scaled[0] / tile_size_;
  const int64_t tiles_y = scaled[1] / tile_size_;
  int64_t index = 0;
  int64_t total_bytes = 0;

  for (auto _ : state) {
    const int64_t tx = index % tiles_x;
    const int64_t ty = (index / tiles_x) % tiles_y;
    auto image = slide_->ReadRegion(
        Size2d(tx * tile_size_ + 0.5, ty * tile_size_ + 0.5), scaling_,
        Size2i(tile_size_, tile_size_));
    if (!image.ok()) {
      state.SkipWithError("Failed to read region");
      return;
    }
    total_bytes += static_cast<int64_t>(image->SizeBytes());
    benchmark::DoNotOptimize(image->GetData());
    ++index;
  }

  state.SetItemsProcessed(state.iterations());
  state.SetBytesProcessed(total_bytes);
}

BENCHMARK_DEFINE_F(ReadRegionFixture, RandomAccess)
(benchmark::State& state) {
  if (!slide_) {
    state.SkipWithError("Failed to create slide");
    return;
  }

  const Size2i scaled = slide_->GetScaledSize(scaling_);
  std::mt19937 rng(42);
  std::uniform_real_distribution<double> x_dist(
      0.0, static_cast<double>(scaled[0] - tile_size_));
  std::uniform_real_distribution<double> y_dist(
      0.0, static_cast<double>(scaled[1] - tile_size_));
  int64_t total_bytes = 0;

  for (auto _ : state) {
    auto image = slide_->ReadRegion(Size2d(x_dist(rng), y_dist(rng)),
                                    scaling_, Size2i(tile_size_, tile_size_));
    if (!image.ok()) {
      state.SkipWithError("Failed to read region");
      return;
    }
    total_bytes += static_cast<int64_t>(image->SizeBytes());
    benchmark::DoNotOptimize(image->GetData());
  }

  state.SetItemsProcessed(state.iterations());
  state.SetBytesProcessed(total_bytes);
}

void BM_MapRegion(benchmark::State& state) {
  const auto backend = slidescale::testing::MakeSyntheticBackend(MakeConfig());
  const slidescale::PyramidGeometry geometry = backend->GetGeometry();
  const double scaling = static_cast<double>(state.range(0)) / 100.0;

  std::mt19937 rng(7);
  std::uniform_real_distribution<double> dist(0.0, kSlideSize * scaling / 2);

  for (auto _ : state) {
    slidescale::RegionRequest request;
    request.location = Size2d(dist(rng), dist(rng));
    request.scaling = scaling;
    request.size = Size2i(256, 256);
    auto plan = slidescale::core::MapRegion(geometry, request);
    benchmark::DoNotOptimize(plan);
  }
  state.SetItemsProcessed(state.iterations());
}

void BM_Thumbnail(benchmark::State& state) {
  auto slide = SlideImage::Create(
      slidescale::testing::MakeSyntheticBackend(MakeConfig()));
  if (!slide.ok()) {
    state.SkipWithError("Failed to create slide");
    return;
  }
  const auto bound = static_cast<uint32_t>(state.range(0));
  for (auto _ : state) {
    auto thumbnail = (*slide)->GetThumbnail(ImageDimensions(bound, bound));
    benchmark::DoNotOptimize(thumbnail);
  }
}

}  // namespace

BENCHMARK_REGISTER_F(ReadRegionFixture, RowMajor)
    ->ArgsProduct({{256, 512}, {100, 50, 33}, {0, 1}})
    ->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(ReadRegionFixture, RandomAccess)
    ->ArgsProduct({{256, 512}, {100, 50, 33}, {0, 1}})
    ->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_MapRegion)->Arg(100)->Arg(50)->Arg(7)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_Thumbnail)->Arg(256)->Arg(1024)->Unit(benchmark::kMillisecond);

int main(int argc, char** argv) {
  slidescale::utilities::VipsInitializer vips(argv[0]);
  benchmark::Initialize(&argc, argv);
  if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
    return 1;
  }
  benchmark::RunSpecifiedBenchmarks();
  benchmark::Shutdown();
  return 0;
}
