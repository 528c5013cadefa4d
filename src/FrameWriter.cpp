#include "vidsample/FrameWriter.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <opencv2/imgcodecs.hpp>
#include <sstream>
#include <system_error>
#include <vector>

#include "vidsample/Errors.h"

namespace fs = std::filesystem;

namespace vidsample {

static std::string lowered(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string frameFileName(int64_t index, const std::string& extension) {
  std::ostringstream oss;
  oss << "frame_" << std::setw(5) << std::setfill('0') << index << extension;
  return oss.str();
}

std::string FrameWriter::write(const OutputFrame& frame,
                               const std::string& out_dir,
                               const OutputConfig& cfg,
                               std::ostream& log) const {
  if (frame.image.empty()) {
    throw CollaboratorFailure("Refusing to write empty frame " +
                              std::to_string(frame.saved_index));
  }

  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    log << "[Writer] Failed to create directory: " << out_dir << "\n";
    throw CollaboratorFailure("Failed to create directory " + out_dir + ": " + ec.message());
  }

  const fs::path out_path =
      fs::path(out_dir) / frameFileName(frame.saved_index, cfg.image_extension);

  std::vector<int> params;
  const std::string ext = lowered(cfg.image_extension);
  if (ext == ".jpg" || ext == ".jpeg") {
    params = {cv::IMWRITE_JPEG_QUALITY, std::max(1, std::min(100, cfg.jpeg_quality))};
  } else if (ext == ".png") {
    params = {cv::IMWRITE_PNG_COMPRESSION, std::max(0, std::min(9, cfg.png_compression))};
  }

  bool ok = false;
  try {
    ok = cv::imwrite(out_path.string(), frame.image, params);
  } catch (const cv::Exception& e) {
    log << "[Writer] Encoder error for " << out_path << ": " << e.what() << "\n";
    throw CollaboratorFailure("Failed to write " + out_path.string() + ": " + e.what());
  }
  if (!ok) {
    log << "[Writer] Failed to write: " << out_path << "\n";
    throw CollaboratorFailure("Failed to write " + out_path.string());
  }
  return out_path.string();
}

} // namespace vidsample
