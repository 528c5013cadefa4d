#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "vidsample/Config.h"
#include "vidsample/Errors.h"
#include "vidsample/Pipeline.h"

using namespace vidsample;

static void print_usage(const char* argv0) {
  std::cerr << "Usage:\n"
            << "  " << argv0 << " local <video_path> <output_dir> [options]\n"
            << "  " << argv0 << " batch <output_dir> <url> [<url> ...] [options]\n"
            << "Options:\n"
            << "  --sample-rate N      keep every Nth frame (default 30)\n"
            << "  --size WxH           output frame size (default 212x212)\n"
            << "  --interp NAME        nearest|linear|cubic|area (default area)\n"
            << "  --ext EXT            image extension, e.g. .png or .jpg (default .png)\n"
            << "  --jpeg-quality Q     JPEG quality 1-100 (default 95)\n"
            << "  --downloader BIN     downloader binary (default yt-dlp)\n"
            << "  --keep-downloads     keep downloaded videos after extraction\n"
            << "Example: " << argv0 << " local drones3.mov suas_dataset --sample-rate 3 --size 224x224\n";
}

static int parse_int(const std::string& flag, const std::string& value) {
  std::size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(value, &used);
  } catch (const std::logic_error&) {
    throw ConfigurationError("Invalid value for " + flag + ": " + value);
  }
  if (used != value.size()) {
    throw ConfigurationError("Invalid value for " + flag + ": " + value);
  }
  return v;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  const std::string mode = argv[1];
  if (mode == "-h" || mode == "--help") {
    print_usage(argv[0]);
    return 0;
  }

  PipelineConfig cfg;
  std::vector<std::string> positional;

  try {
    for (int i = 2; i < argc; ++i) {
      const std::string arg = argv[i];
      auto next = [&]() -> std::string {
        if (i + 1 >= argc) throw ConfigurationError("Missing value for " + arg);
        return argv[++i];
      };

      if (arg == "-h" || arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--sample-rate") {
        cfg.sampling.sample_rate = parse_int(arg, next());
      } else if (arg == "--size") {
        const FrameSize size = parseSize(next());
        cfg.sampling.target_width = size.width;
        cfg.sampling.target_height = size.height;
      } else if (arg == "--interp") {
        cfg.sampling.interpolation = interpolationFromName(next());
      } else if (arg == "--ext") {
        cfg.output.image_extension = next();
      } else if (arg == "--jpeg-quality") {
        cfg.output.jpeg_quality = parse_int(arg, next());
      } else if (arg == "--downloader") {
        cfg.download.downloader = next();
      } else if (arg == "--keep-downloads") {
        cfg.output.keep_downloads = true;
      } else if (arg.size() > 1 && arg[0] == '-') {
        throw ConfigurationError("Unknown option: " + arg);
      } else {
        positional.push_back(arg);
      }
    }
    validate(cfg);
  } catch (const ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    print_usage(argv[0]);
    return 1;
  }

  Pipeline pipeline;
  try {
    if (mode == "local") {
      if (positional.size() != 2) {
        print_usage(argv[0]);
        return 1;
      }
      const int64_t n = pipeline.processLocalVideo(positional[0], positional[1], cfg, std::cout);
      std::cout << "Done: " << n << " frames.\n";
      return 0;
    }

    if (mode == "batch") {
      if (positional.size() < 2) {
        print_usage(argv[0]);
        return 1;
      }
      const std::vector<std::string> urls(positional.begin() + 1, positional.end());
      const BatchReport report = pipeline.processVideos(urls, positional[0], cfg, std::cout);
      return report.failed() == 0 ? 0 : 1;
    }
  } catch (const Error& e) {
    std::cerr << "Error (" << toString(e.kind()) << "): " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Unexpected error: " << e.what() << "\n";
    return 2;
  }

  std::cerr << "Unknown mode: " << mode << "\n";
  print_usage(argv[0]);
  return 1;
}
