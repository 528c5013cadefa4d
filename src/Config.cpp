#include "vidsample/Config.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <opencv2/imgcodecs.hpp>

#include "vidsample/Errors.h"

namespace vidsample {

void validate(const SamplingConfig& cfg) {
  if (cfg.sample_rate < 1) {
    throw ConfigurationError("sample rate must be >= 1, got " +
                             std::to_string(cfg.sample_rate));
  }
  if (cfg.target_width < 1 || cfg.target_height < 1) {
    throw ConfigurationError("target size must be positive, got " +
                             std::to_string(cfg.target_width) + "x" +
                             std::to_string(cfg.target_height));
  }
}

void validate(const PipelineConfig& cfg) {
  validate(cfg.sampling);

  std::string ext = cfg.output.image_extension;
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext != ".png" && ext != ".jpg" && ext != ".jpeg") {
    throw ConfigurationError("image extension must be .png or .jpg, got \"" +
                             cfg.output.image_extension + "\"");
  }
  if (!cv::haveImageWriter("frame" + ext)) {
    throw ConfigurationError("OpenCV was built without an encoder for " + ext);
  }
  if (cfg.output.jpeg_quality < 1 || cfg.output.jpeg_quality > 100) {
    throw ConfigurationError("jpeg quality must be in [1, 100]");
  }
  if (cfg.output.png_compression < 0 || cfg.output.png_compression > 9) {
    throw ConfigurationError("png compression must be in [0, 9]");
  }
  if (cfg.output.frames_subdir.empty()) {
    throw ConfigurationError("frames subdirectory must not be empty");
  }
}

FrameSize parseSize(const std::string& text) {
  const auto sep = text.find_first_of("xX");
  if (sep == std::string::npos || sep == 0 || sep + 1 == text.size()) {
    throw ConfigurationError("size must be WxH, got \"" + text + "\"");
  }

  auto parseDim = [&](const std::string& part) {
    for (char c : part) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        throw ConfigurationError("size must be WxH, got \"" + text + "\"");
      }
    }
    int value = 0;
    try {
      value = std::stoi(part);
    } catch (const std::out_of_range&) {
      throw ConfigurationError("size dimension out of range: " + part);
    }
    if (value < 1) {
      throw ConfigurationError("size dimensions must be positive, got \"" + text + "\"");
    }
    return value;
  };

  FrameSize size;
  size.width = parseDim(text.substr(0, sep));
  size.height = parseDim(text.substr(sep + 1));
  return size;
}

int interpolationFromName(const std::string& name) {
  if (name == "nearest") return cv::INTER_NEAREST;
  if (name == "linear") return cv::INTER_LINEAR;
  if (name == "cubic") return cv::INTER_CUBIC;
  if (name == "area") return cv::INTER_AREA;
  throw ConfigurationError("unknown interpolation \"" + name +
                           "\" (expected nearest|linear|cubic|area)");
}

} // namespace vidsample
