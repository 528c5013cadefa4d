#include "vidsample/FrameSource.h"

#include <filesystem>
#include <system_error>

#include "vidsample/Errors.h"

namespace fs = std::filesystem;

namespace vidsample {

VideoFileSource::VideoFileSource(const std::string& video_path)
    : path_(video_path) {
  std::error_code ec;
  if (!fs::is_regular_file(video_path, ec)) {
    throw SourceUnavailable("Video file not found: " + video_path);
  }
  if (!cap_.open(video_path)) {
    throw SourceUnavailable("Failed to open video: " + video_path);
  }
}

VideoFileSource::~VideoFileSource() {
  cap_.release();
}

bool VideoFileSource::read(cv::Mat& out) {
  if (!cap_.read(out)) return false; // EOF or decode error
  return !out.empty();
}

double VideoFileSource::fps() const {
  const double fps = cap_.get(cv::CAP_PROP_FPS);
  return fps > 0.0 ? fps : 0.0;
}

int64_t VideoFileSource::frameCountHint() const {
  const double count = cap_.get(cv::CAP_PROP_FRAME_COUNT);
  return count > 0.0 ? static_cast<int64_t>(count) : 0;
}

} // namespace vidsample
