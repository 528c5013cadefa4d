// Vidsample - Pipeline Orchestrator
// Wires downloader, source, sampler, and writer together.

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <ostream>
#include <vector>

#include "vidsample/Config.h"
#include "vidsample/Errors.h"

namespace vidsample {

struct ItemResult {
  std::string source;
  std::string output_dir;
  bool ok = false;
  int64_t frames = 0;
  ErrorKind error_kind = ErrorKind::SourceUnavailable; // valid when !ok
  std::string error;
};

struct BatchReport {
  std::vector<ItemResult> items;

  std::size_t succeeded() const;
  std::size_t failed() const;
  int64_t totalFrames() const;

  // Totals followed by one line per failed item.
  void print(std::ostream& os) const;
};

// "video_03" for 3.
std::string videoDirName(std::size_t index);

// Runs `work` for one batch item and stores its frame count in `item`.
// Any exception is recorded in `item` instead of propagating.
// Returns item.ok.
bool runBatchItem(ItemResult& item,
                  const std::function<int64_t()>& work,
                  std::ostream& log);

class Pipeline {
public:
  // Extracts frames of a local video into `output_dir/frames`.
  // Returns the number of frames written.
  int64_t processLocalVideo(const std::string& video_path,
                            const std::string& output_dir,
                            const PipelineConfig& cfg,
                            std::ostream& log);

  // Downloads `url` into `video_dir`, extracts into `video_dir/frames`
  // and removes the download unless cfg.output.keep_downloads is set.
  int64_t processRemoteVideo(const std::string& url,
                             const std::string& video_dir,
                             const PipelineConfig& cfg,
                             std::ostream& log);

  // Processes each url into `base_output_dir/video_NN`. A failing item is
  // recorded in the report and the batch continues.
  BatchReport processVideos(const std::vector<std::string>& urls,
                            const std::string& base_output_dir,
                            const PipelineConfig& cfg,
                            std::ostream& log);

private:
  int64_t extractInto(const std::string& video_path,
                      const std::string& frames_dir,
                      const PipelineConfig& cfg,
                      std::ostream& log);
};

} // namespace vidsample
