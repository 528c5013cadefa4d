// Vidsample - FrameSource
// Sequential, forward-only frame providers.

#pragma once

#include <cstdint>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace vidsample {

class FrameSource {
public:
  virtual ~FrameSource() = default;

  // Reads the next frame into `out`. Returns false at end of sequence.
  virtual bool read(cv::Mat& out) = 0;

  // Human readable name used in log lines.
  virtual std::string describe() const = 0;
};

class VideoFileSource : public FrameSource {
public:
  // Opens `video_path` or throws SourceUnavailable if the file is missing
  // or OpenCV cannot decode it.
  explicit VideoFileSource(const std::string& video_path);
  ~VideoFileSource() override;

  VideoFileSource(const VideoFileSource&) = delete;
  VideoFileSource& operator=(const VideoFileSource&) = delete;

  bool read(cv::Mat& out) override;
  std::string describe() const override { return path_; }

  // Container-reported values; 0 when unknown.
  double fps() const;
  int64_t frameCountHint() const;

private:
  std::string path_;
  cv::VideoCapture cap_;
};

} // namespace vidsample
