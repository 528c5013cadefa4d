#include "vidsample/Pipeline.h"

#include <exception>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <opencv2/core.hpp>

#include "vidsample/FrameSampler.h"
#include "vidsample/FrameSource.h"
#include "vidsample/FrameWriter.h"
#include "vidsample/VideoDownloader.h"

namespace fs = std::filesystem;

namespace vidsample {

std::size_t BatchReport::succeeded() const {
  std::size_t n = 0;
  for (const auto& item : items) {
    if (item.ok) ++n;
  }
  return n;
}

std::size_t BatchReport::failed() const {
  return items.size() - succeeded();
}

int64_t BatchReport::totalFrames() const {
  int64_t total = 0;
  for (const auto& item : items) total += item.frames;
  return total;
}

void BatchReport::print(std::ostream& os) const {
  os << "[Pipeline] Batch done: " << succeeded() << "/" << items.size()
     << " videos, " << totalFrames() << " frames\n";
  for (const auto& item : items) {
    if (item.ok) continue;
    os << "[Pipeline]   FAILED " << item.source << " (" << toString(item.error_kind)
       << "): " << item.error << "\n";
  }
}

std::string videoDirName(std::size_t index) {
  std::ostringstream oss;
  oss << "video_" << std::setw(2) << std::setfill('0') << index;
  return oss.str();
}

bool runBatchItem(ItemResult& item,
                  const std::function<int64_t()>& work,
                  std::ostream& log) {
  auto fail = [&](ErrorKind kind, const char* what) {
    item.ok = false;
    item.error_kind = kind;
    item.error = what;
    log << "[Pipeline] Skipping " << item.source << " after " << toString(kind)
        << ": " << what << "\n";
  };

  try {
    item.frames = work();
    item.ok = true;
  } catch (const Error& e) {
    fail(e.kind(), e.what());
  } catch (const cv::Exception& e) {
    fail(ErrorKind::SourceUnavailable, e.what());
  } catch (const std::exception& e) {
    fail(ErrorKind::Collaborator, e.what());
  }
  return item.ok;
}

int64_t Pipeline::extractInto(const std::string& video_path,
                              const std::string& frames_dir,
                              const PipelineConfig& cfg,
                              std::ostream& log) {
  VideoFileSource source(video_path);
  log << "[Pipeline] Opened " << video_path << " (fps=" << source.fps()
      << ", frames~" << source.frameCountHint() << ")\n";

  std::error_code ec;
  fs::create_directories(frames_dir, ec);
  if (ec) {
    throw CollaboratorFailure("Failed to create directory " + frames_dir + ": " + ec.message());
  }

  FrameSampler sampler;
  FrameWriter writer;
  auto on_frame = [&](const OutputFrame& frame) {
    writer.write(frame, frames_dir, cfg.output, log);
  };
  return sampler.sample(source, cfg.sampling, on_frame, log);
}

int64_t Pipeline::processLocalVideo(const std::string& video_path,
                                    const std::string& output_dir,
                                    const PipelineConfig& cfg,
                                    std::ostream& log) {
  validate(cfg);

  const fs::path frames_dir = fs::path(output_dir) / cfg.output.frames_subdir;
  log << "[Pipeline] Extracting frames from: " << video_path << "\n";
  const int64_t count = extractInto(video_path, frames_dir.string(), cfg, log);
  log << "[Pipeline] Extracted " << count << " frames to " << frames_dir.string() << "\n";
  return count;
}

int64_t Pipeline::processRemoteVideo(const std::string& url,
                                     const std::string& video_dir,
                                     const PipelineConfig& cfg,
                                     std::ostream& log) {
  validate(cfg);

  VideoDownloader downloader;
  const std::string video_path = downloader.download(url, video_dir, cfg.download, log);

  const fs::path frames_dir = fs::path(video_dir) / cfg.output.frames_subdir;
  int64_t count = 0;
  try {
    count = extractInto(video_path, frames_dir.string(), cfg, log);
  } catch (const std::exception&) {
    if (!cfg.output.keep_downloads) {
      std::error_code ec;
      fs::remove(video_path, ec);
    }
    throw;
  }
  log << "[Pipeline] Extracted " << count << " frames to " << frames_dir.string() << "\n";

  if (!cfg.output.keep_downloads) {
    std::error_code ec;
    fs::remove(video_path, ec);
    if (ec) {
      log << "[Pipeline] Could not remove download " << video_path << ": " << ec.message() << "\n";
    }
  }
  return count;
}

BatchReport Pipeline::processVideos(const std::vector<std::string>& urls,
                                    const std::string& base_output_dir,
                                    const PipelineConfig& cfg,
                                    std::ostream& log) {
  validate(cfg);

  BatchReport report;
  for (std::size_t i = 0; i < urls.size(); ++i) {
    ItemResult item;
    item.source = urls[i];
    item.output_dir = (fs::path(base_output_dir) / videoDirName(i)).string();

    log << "[Pipeline] Video " << (i + 1) << "/" << urls.size() << ": " << urls[i] << "\n";
    runBatchItem(item, [&]() {
      return processRemoteVideo(urls[i], item.output_dir, cfg, log);
    }, log);
    report.items.push_back(item);
  }

  report.print(log);
  return report;
}

} // namespace vidsample
