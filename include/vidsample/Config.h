// Vidsample - Configuration structs
// Plain aggregates with defaults, filled in by the CLI.

#pragma once

#include <string>
#include <opencv2/imgproc.hpp>

namespace vidsample {

struct SamplingConfig {
  // Keep every Nth frame (>= 1). 1 keeps every frame.
  int sample_rate = 30;
  // Exact output size; frames are stretched, aspect ratio is not kept.
  int target_width = 212;
  int target_height = 212;
  // cv::InterpolationFlags value used for the resize
  int interpolation = cv::INTER_AREA;
};

struct DownloadConfig {
  // Downloader binary name (e.g., yt-dlp)
  std::string downloader = "yt-dlp";
  // Format selector handed to the downloader
  std::string format = "best[ext=mp4]";
  // Extra CLI arguments appended to the downloader command
  std::string extra_args;
  // Target filename (placed under the chosen directory)
  std::string output_filename = "video.mp4";
};

struct OutputConfig {
  // Extension of written frames: .png, .jpg or .jpeg
  std::string image_extension = ".png";
  // JPEG quality for .jpg output (1-100)
  int jpeg_quality = 95;
  // PNG compression level for .png output (0-9)
  int png_compression = 3;
  // Subdirectory of a video's output dir that receives the frames
  std::string frames_subdir = "frames";
  // Keep downloaded videos after extraction
  bool keep_downloads = false;
};

struct PipelineConfig {
  SamplingConfig sampling;
  DownloadConfig download;
  OutputConfig output;
};

struct FrameSize {
  int width = 0;
  int height = 0;
};

// Throws ConfigurationError when sample_rate < 1 or a target dimension < 1.
void validate(const SamplingConfig& cfg);
// Also checks output settings (extension, quality ranges).
void validate(const PipelineConfig& cfg);

// Parses "WxH" (e.g. "224x224"). Throws ConfigurationError on bad input.
FrameSize parseSize(const std::string& text);

// Maps nearest|linear|cubic|area to the OpenCV flag.
// Throws ConfigurationError on an unknown name.
int interpolationFromName(const std::string& name);

} // namespace vidsample
