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

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <sstream>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidescale/slidescale.h"
#include "slidescale/utilities/vips.h"

// Common flags
ABSL_FLAG(std::string, input, "", "Path to the slide file");
ABSL_FLAG(std::string, backend, "openslide",
          "Backend used to open the slide (openslide or tiff)");
ABSL_FLAG(double, overwrite_mpp, 0.0,
          "Replace the slide's microns per pixel (0 keeps the file's value)");
ABSL_FLAG(std::string, interpolator, "lanczos",
          "Resampling kernel (nearest or lanczos)");
ABSL_FLAG(std::string, handler, "box", "Resampling pipeline (box or vips)");
ABSL_FLAG(bool, apply_color_profile, false,
          "Convert regions to sRGB with the slide's ICC profile");

// Info command flags
ABSL_FLAG(bool, verbose, false, "Show all slide properties");

// Region and plan command flags
ABSL_FLAG(double, x, 0.0, "X coordinate of the top-left at the target scale");
ABSL_FLAG(double, y, 0.0, "Y coordinate of the top-left at the target scale");
ABSL_FLAG(int64_t, width, 512, "Region width in output pixels");
ABSL_FLAG(int64_t, height, 512, "Region height in output pixels");
ABSL_FLAG(double, scaling, 1.0, "Scaling factor relative to level 0");
ABSL_FLAG(double, mpp, 0.0,
          "Target microns per pixel; overrides --scaling when positive");
ABSL_FLAG(bool, slide_bounds, false,
          "Interpret --x and --y relative to the slide bounds");
ABSL_FLAG(std::string, output, "output.png",
          "Output file path, format chosen by extension");

// Thumbnail command flags
ABSL_FLAG(uint32_t, max_size, 512, "Longest thumbnail side in pixels");

namespace {

using slidescale::SlideImage;

void PrintSeparator(char c = '=') {
  std::cout << std::string(80, c) << '\n';
}

void PrintHeader(const std::string& title) {
  std::cout << '\n';
  PrintSeparator('=');
  std::cout << " " << title << '\n';
  PrintSeparator('=');
}

void PrintSubHeader(const std::string& title) {
  std::cout << '\n';
  std::cout << "--- " << title << " ---\n";
}

void PrintKeyValue(const std::string& key, const std::string& value,
                   int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

void PrintKeyValue(const std::string& key, double value, int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << std::fixed
            << std::setprecision(6) << value << '\n';
}

void PrintKeyValue(const std::string& key, int64_t value, int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

std::string PairToString(double a, double b) {
  std::ostringstream out;
  out << a << " x " << b;
  return out.str();
}

absl::StatusOr<std::unique_ptr<SlideImage>> OpenSlideImage(
    const std::string& input_file) {
  slidescale::SlideImageOptions options;
  options.apply_color_profile = absl::GetFlag(FLAGS_apply_color_profile);

  const double overwrite_mpp = absl::GetFlag(FLAGS_overwrite_mpp);
  if (overwrite_mpp > 0.0) {
    options.overwrite_mpp = slidescale::Spacing{overwrite_mpp, overwrite_mpp};
  }

  auto interpolator =
      slidescale::ParseResampling(absl::GetFlag(FLAGS_interpolator));
  if (!interpolator.ok()) {
    return interpolator.status();
  }
  options.interpolator = *interpolator;

  auto handler =
      slidescale::ParseInternalHandler(absl::GetFlag(FLAGS_handler));
  if (!handler.ok()) {
    return handler.status();
  }
  options.internal_handler = *handler;

  std::cout << "Opening slide: " << input_file << '\n';
  return SlideImage::FromFilePath(input_file, absl::GetFlag(FLAGS_backend),
                                  options);
}

double TargetScaling(const SlideImage& slide) {
  const double mpp = absl::GetFlag(FLAGS_mpp);
  return mpp > 0.0 ? slide.GetScaling(mpp) : absl::GetFlag(FLAGS_scaling);
}

slidescale::CoordinateSpace TargetSpace() {
  return absl::GetFlag(FLAGS_slide_bounds)
             ? slidescale::CoordinateSpace::kSlideBounds
             : slidescale::CoordinateSpace::kFullImage;
}

void PrintSlideInfo(const SlideImage& slide) {
  PrintHeader("Slide Information");
  PrintKeyValue("Identifier", slide.GetIdentifier());
  PrintKeyValue("Vendor", slide.GetVendor());
  PrintKeyValue("Backend", slide.GetBackend().GetName());
  PrintKeyValue("MPP", slide.GetMpp());
  if (auto magnification = slide.GetMagnification()) {
    PrintKeyValue("Objective Magnification", *magnification);
  }
  const auto size = slide.GetSize();
  PrintKeyValue("Dimensions", std::to_string(size[0]) + " x " +
                                  std::to_string(size[1]));
  PrintKeyValue("Aspect Ratio", slide.GetAspectRatio());

  const auto bounds = slide.GetSlideBounds();
  PrintKeyValue("Slide Bounds",
                "(" + std::to_string(bounds.offset[0]) + ", " +
                    std::to_string(bounds.offset[1]) + ") " +
                    std::to_string(bounds.size[0]) + " x " +
                    std::to_string(bounds.size[1]));
  const auto profile = slide.GetColorProfile();
  PrintKeyValue("ICC Profile",
                profile.has_value()
                    ? std::to_string(profile->size()) + " bytes"
                    : std::string("none"));
  PrintKeyValue("Handler", slidescale::GetName(slide.GetInternalHandler()));
  PrintKeyValue("Interpolator", slidescale::GetName(slide.GetInterpolator()));
}

void PrintLevelInfo(const SlideImage& slide) {
  PrintHeader("Pyramid Levels");
  const slidescale::SlideBackend& backend = slide.GetBackend();
  PrintKeyValue("Number of Levels",
                static_cast<int64_t>(backend.GetLevelCount()));

  for (int level = 0; level < backend.GetLevelCount(); ++level) {
    auto info = backend.GetLevelInfo(level);
    if (!info.ok()) {
      std::cerr << "Error reading level " << level << ": " << info.status()
                << '\n';
      continue;
    }
    PrintSubHeader("Level " + std::to_string(level));
    PrintKeyValue("  Dimensions",
                  std::to_string(info->dimensions[0]) + " x " +
                      std::to_string(info->dimensions[1]),
                  25);
    PrintKeyValue("  Downsample Factor", info->downsample, 25);
    const double level_mpp = slide.GetMpp() * info->downsample;
    PrintKeyValue("  MPP", level_mpp, 25);
    PrintKeyValue("  Physical Size",
                  PairToString(info->dimensions[0] * level_mpp / 1000.0,
                               info->dimensions[1] * level_mpp / 1000.0) +
                      " mm",
                  25);
  }
}

void PrintProperties(const SlideImage& slide) {
  const slidescale::Properties& properties = slide.GetProperties();
  if (properties.empty()) {
    return;
  }
  PrintHeader("Properties");
  for (const auto& [key, value] : properties) {
    PrintKeyValue("  " + key, slidescale::Properties::ValueToString(value), 40);
  }
}

int InfoCommand(const std::string& input_file, bool verbose) {
  auto slide = OpenSlideImage(input_file);
  if (!slide.ok()) {
    std::cerr << "\nError: Failed to open slide\n";
    std::cerr << "Status: " << slide.status() << '\n';
    return 1;
  }

  PrintSlideInfo(**slide);
  PrintLevelInfo(**slide);
  if (verbose) {
    PrintProperties(**slide);
  }
  std::cout << '\n';
  return 0;
}

int PlanCommand(const std::string& input_file) {
  auto slide = OpenSlideImage(input_file);
  if (!slide.ok()) {
    std::cerr << "Error: Failed to open slide\n";
    std::cerr << "Status: " << slide.status() << '\n';
    return 1;
  }

  const double scaling = TargetScaling(**slide);
  auto plan = (*slide)->PlanRegion(
      slidescale::Size2d(absl::GetFlag(FLAGS_x), absl::GetFlag(FLAGS_y)),
      scaling,
      slidescale::Size2i(absl::GetFlag(FLAGS_width),
                         absl::GetFlag(FLAGS_height)),
      TargetSpace());
  if (!plan.ok()) {
    std::cerr << "Error: Failed to plan region\n";
    std::cerr << "Status: " << plan.status() << '\n';
    return 1;
  }

  PrintHeader("Native Read Plan");
  std::cout << *plan << '\n';
  return 0;
}

int RegionCommand(const std::string& input_file,
                  const std::string& output_file) {
  auto slide = OpenSlideImage(input_file);
  if (!slide.ok()) {
    std::cerr << "Error: Failed to open slide\n";
    std::cerr << "Status: " << slide.status() << '\n';
    return 1;
  }

  const double scaling = TargetScaling(**slide);
  const slidescale::Size2d location(absl::GetFlag(FLAGS_x),
                                    absl::GetFlag(FLAGS_y));
  const slidescale::Size2i size(absl::GetFlag(FLAGS_width),
                                absl::GetFlag(FLAGS_height));

  std::cout << "Reading region:\n";
  std::cout << "  Position: (" << std::fixed << std::setprecision(2)
            << location[0] << ", " << location[1] << ")\n";
  std::cout << "  Size: " << size[0] << " x " << size[1] << " pixels\n";
  std::cout << "  Scaling: " << std::setprecision(6) << scaling << " ("
            << (*slide)->GetMpp(scaling) << " mpp)\n";

  auto image = (*slide)->ReadRegion(location, scaling, size, TargetSpace());
  if (!image.ok()) {
    std::cerr << "Error: Failed to read region\n";
    std::cerr << "Status: " << image.status() << '\n';
    return 1;
  }

  std::cout << "Saving to: " << output_file << '\n';
  auto saved = slidescale::utilities::SaveImageToFile(*image, output_file);
  if (!saved.ok()) {
    std::cerr << "Error: Failed to save image\n";
    std::cerr << "Status: " << saved << '\n';
    return 1;
  }
  return 0;
}

int ThumbnailCommand(const std::string& input_file,
                     const std::string& output_file, uint32_t max_size) {
  auto slide = OpenSlideImage(input_file);
  if (!slide.ok()) {
    std::cerr << "Error: Failed to open slide\n";
    std::cerr << "Status: " << slide.status() << '\n';
    return 1;
  }

  auto thumbnail =
      (*slide)->GetThumbnail(slidescale::ImageDimensions(max_size, max_size));
  if (!thumbnail.ok()) {
    std::cerr << "Error: Failed to create thumbnail\n";
    std::cerr << "Status: " << thumbnail.status() << '\n';
    return 1;
  }

  std::cout << "Thumbnail: " << thumbnail->GetWidth() << " x "
            << thumbnail->GetHeight() << " pixels\n";
  auto saved = slidescale::utilities::SaveImageToFile(*thumbnail, output_file);
  if (!saved.ok()) {
    std::cerr << "Error: Failed to save image\n";
    std::cerr << "Status: " << saved << '\n';
    return 1;
  }
  return 0;
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
  std::cerr << "Commands:\n";
  std::cerr << "  info       Show slide information\n";
  std::cerr << "  region     Read a region at any scaling and save it\n";
  std::cerr << "  plan       Show the native read a region would issue\n";
  std::cerr << "  thumbnail  Save a thumbnail of the whole slide\n";
  std::cerr << "\n";
  std::cerr << "Common options:\n";
  std::cerr << "  --input=<path>           Path to slide file (required)\n";
  std::cerr << "  --backend=<name>         openslide (default) or tiff\n";
  std::cerr << "  --overwrite_mpp=<mpp>    Replace the slide calibration\n";
  std::cerr << "  --interpolator=<name>    Resampling kernel (lanczos)\n";
  std::cerr << "  --handler=<name>         box (default) or vips\n";
  std::cerr << "  --apply_color_profile    Convert to sRGB (vips handler)\n";
  std::cerr << "\n";
  std::cerr << "Region and plan options:\n";
  std::cerr << "  --x=<value> --y=<value>  Top-left at the target scale\n";
  std::cerr << "  --width=<pixels>         Output width (default: 512)\n";
  std::cerr << "  --height=<pixels>        Output height (default: 512)\n";
  std::cerr << "  --scaling=<factor>       Scaling factor (default: 1.0)\n";
  std::cerr << "  --mpp=<value>            Target mpp, overrides --scaling\n";
  std::cerr << "  --slide_bounds           Coordinates relative to bounds\n";
  std::cerr << "  --output=<path>          Output file (default: output.png)\n";
  std::cerr << "\n";
  std::cerr << "Examples:\n";
  std::cerr << "  " << program_name << " info --input=slide.svs --verbose\n";
  std::cerr << "  " << program_name
            << " region --input=slide.svs --mpp=2.0 --x=1000 --y=800\n";
  std::cerr << "  " << program_name
            << " thumbnail --input=slide.tif --backend=tiff --max_size=1024\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string command = argv[1];

  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  slidescale::utilities::VipsInitializer vips(argv[0]);

  std::string input_file = absl::GetFlag(FLAGS_input);
  if (input_file.empty()) {
    std::cerr << "Error: --input flag is required\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  if (command == "info") {
    return InfoCommand(input_file, absl::GetFlag(FLAGS_verbose));
  } else if (command == "region") {
    return RegionCommand(input_file, absl::GetFlag(FLAGS_output));
  } else if (command == "plan") {
    return PlanCommand(input_file);
  } else if (command == "thumbnail") {
    return ThumbnailCommand(input_file, absl::GetFlag(FLAGS_output),
                            absl::GetFlag(FLAGS_max_size));
  } else {
    std::cerr << "Error: Unknown command '" << command << "'\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
}
