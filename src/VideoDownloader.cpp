#include "vidsample/VideoDownloader.h"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "vidsample/Errors.h"

namespace fs = std::filesystem;

namespace vidsample {

std::string VideoDownloader::quote(const std::string& s) {
  std::ostringstream oss;
  oss << '"';
  for (char c : s) {
    if (c == '"' || c == '\\' || c == '$' || c == '`') oss << '\\';
    oss << c;
  }
  oss << '"';
  return oss.str();
}

std::string VideoDownloader::download(const std::string& url,
                                      const std::string& out_dir,
                                      const DownloadConfig& cfg,
                                      std::ostream& log) {
  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    log << "[Downloader] Failed to create directory: " << out_dir << "\n";
    throw SourceUnavailable("Cannot create download directory " + out_dir + ": " + ec.message());
  }

  const fs::path out_path = fs::path(out_dir) / cfg.output_filename;

  // cfg.extra_args first, then VIDSAMPLE_YTDLP_ARGS
  std::string extra = cfg.extra_args;
  const char* env_args = std::getenv("VIDSAMPLE_YTDLP_ARGS");
  if (env_args != nullptr && *env_args != '\0') {
    extra += extra.empty() ? "" : " ";
    extra += env_args;
  }

  auto run = [&](const std::string& extra_args) {
    std::string cmd = cfg.downloader;
    if (!extra_args.empty()) cmd += " " + extra_args;
    cmd += " -o " + quote(out_path.string()) + " -f " + quote(cfg.format) + " " + quote(url);
    log << "[Downloader] Running: " << cmd << "\n";
    const int status = std::system(cmd.c_str());
    if (status != 0) {
      log << "[Downloader] " << cfg.downloader << " exited with status " << status << "\n";
    }
    return status;
  };

  if (run(extra) != 0) {
    // One more attempt with a fresh yt-dlp cache, unless it was already cleared.
    if (extra.find("--rm-cache-dir") != std::string::npos) {
      throw SourceUnavailable("Download failed for " + url);
    }
    log << "[Downloader] Retrying " << url << " with --rm-cache-dir\n";
    if (run(extra.empty() ? "--rm-cache-dir" : extra + " --rm-cache-dir") != 0) {
      throw SourceUnavailable("Download failed for " + url + " after cache-clearing retry");
    }
  }

  if (!fs::is_regular_file(out_path)) {
    log << "[Downloader] " << cfg.downloader << " succeeded but " << out_path
        << " is missing\n";
    throw SourceUnavailable("Downloader produced no file for " + url);
  }

  const std::string saved = fs::absolute(out_path).string();
  log << "[Downloader] Saved " << url << " as " << saved << "\n";
  return saved;
}

} // namespace vidsample
