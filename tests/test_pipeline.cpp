#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <opencv2/imgcodecs.hpp>

#include "vidsample/Errors.h"
#include "vidsample/Pipeline.h"
#include "test_support.h"

namespace fs = std::filesystem;

namespace vidsample {

using testing_support::listFiles;
using testing_support::shellQuote;

class PipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = testing_support::makeTempDir("vidsample_pipeline");
    clip_ = dir_ / "clip.avi";
    ASSERT_TRUE(testing_support::writeTestVideo(clip_.string(), 10));

    cfg_.sampling.sample_rate = 3;
    cfg_.sampling.target_width = 224;
    cfg_.sampling.target_height = 224;
    cfg_.download.output_filename = "video.avi";
  }

  void TearDown() override { fs::remove_all(dir_); }

  // Stand-in downloader: copies the test clip to the -o target, fails for
  // urls containing "bad".
  std::string writeFakeDownloader() const {
    const fs::path script = dir_ / "fake-dl.sh";
    std::ofstream out(script);
    out << "#!/bin/sh\n"
        << "out=\"\"\n"
        << "url=\"\"\n"
        << "while [ $# -gt 0 ]; do\n"
        << "  if [ \"$1\" = \"-o\" ]; then out=\"$2\"; shift; fi\n"
        << "  url=\"$1\"\n"
        << "  shift\n"
        << "done\n"
        << "case \"$url\" in *bad*) exit 3 ;; esac\n"
        << "cp " << shellQuote(clip_.string()) << " \"$out\"\n";
    out.close();
    return "sh " + shellQuote(script.string());
  }

  fs::path dir_;
  fs::path clip_;
  PipelineConfig cfg_;
  std::ostringstream log_;
  Pipeline pipeline_;
};

TEST(VideoDirNameTest, TwoDigitZeroPadded) {
  EXPECT_EQ(videoDirName(0), "video_00");
  EXPECT_EQ(videoDirName(7), "video_07");
  EXPECT_EQ(videoDirName(42), "video_42");
}

TEST_F(PipelineTest, LocalVideoWritesSampledFrames) {
  const fs::path out = dir_ / "dataset";
  const int64_t n = pipeline_.processLocalVideo(clip_.string(), out.string(), cfg_, log_);

  EXPECT_EQ(n, 4);
  const std::vector<std::string> expected = {
      "frame_00000.png", "frame_00001.png", "frame_00002.png", "frame_00003.png"};
  EXPECT_EQ(listFiles(out / "frames"), expected);

  const cv::Mat img = cv::imread((out / "frames" / "frame_00002.png").string());
  EXPECT_EQ(img.size(), cv::Size(224, 224));
}

TEST_F(PipelineTest, MissingLocalVideoIsSourceUnavailable) {
  const fs::path out = dir_ / "dataset";
  EXPECT_THROW(pipeline_.processLocalVideo((dir_ / "missing.mov").string(), out.string(), cfg_, log_),
               SourceUnavailable);
  EXPECT_TRUE(listFiles(out / "frames").empty());
}

TEST_F(PipelineTest, InvalidConfigFailsBeforeTouchingDisk) {
  cfg_.sampling.sample_rate = 0;
  const fs::path out = dir_ / "dataset";
  EXPECT_THROW(pipeline_.processLocalVideo(clip_.string(), out.string(), cfg_, log_),
               ConfigurationError);
  EXPECT_FALSE(fs::exists(out));
}

TEST_F(PipelineTest, FailingDownloaderIsSourceUnavailable) {
  cfg_.download.downloader = "false";
  const fs::path video_dir = dir_ / "video_00";
  EXPECT_THROW(pipeline_.processRemoteVideo("https://example.invalid/v", video_dir.string(), cfg_, log_),
               SourceUnavailable);
  EXPECT_NE(log_.str().find("--rm-cache-dir"), std::string::npos);
}

TEST_F(PipelineTest, DownloaderWithoutOutputFileIsSourceUnavailable) {
  cfg_.download.downloader = "true";
  const fs::path video_dir = dir_ / "video_00";
  EXPECT_THROW(pipeline_.processRemoteVideo("https://example.invalid/v", video_dir.string(), cfg_, log_),
               SourceUnavailable);
  EXPECT_EQ(log_.str().find("Retrying"), std::string::npos);
  EXPECT_NE(log_.str().find("is missing"), std::string::npos);
}

TEST_F(PipelineTest, EnvironmentArgsAreMergedAndCacheClearSkipsRetry) {
  ::setenv("VIDSAMPLE_YTDLP_ARGS", "--rm-cache-dir --no-progress", 1);
  cfg_.download.downloader = "false";
  cfg_.download.extra_args = "--quiet";
  const fs::path video_dir = dir_ / "video_00";
  EXPECT_THROW(pipeline_.processRemoteVideo("https://example.invalid/v", video_dir.string(), cfg_, log_),
               SourceUnavailable);
  ::unsetenv("VIDSAMPLE_YTDLP_ARGS");

  const std::string log = log_.str();
  EXPECT_NE(log.find("Running: false --quiet --rm-cache-dir --no-progress -o "), std::string::npos);
  EXPECT_EQ(log.find("Retrying"), std::string::npos);
}

TEST_F(PipelineTest, RemoteVideoRemovesDownloadAfterExtraction) {
  cfg_.download.downloader = writeFakeDownloader();
  const fs::path video_dir = dir_ / "video_00";
  const int64_t n = pipeline_.processRemoteVideo("https://example.invalid/good", video_dir.string(), cfg_, log_);

  EXPECT_EQ(n, 4);
  EXPECT_FALSE(fs::exists(video_dir / "video.avi"));
  EXPECT_EQ(listFiles(video_dir / "frames").size(), 4u);
}

TEST_F(PipelineTest, RemoteVideoKeepsDownloadWhenAsked) {
  cfg_.download.downloader = writeFakeDownloader();
  cfg_.output.keep_downloads = true;
  const fs::path video_dir = dir_ / "video_00";
  pipeline_.processRemoteVideo("https://example.invalid/good", video_dir.string(), cfg_, log_);

  EXPECT_TRUE(fs::exists(video_dir / "video.avi"));
}

TEST_F(PipelineTest, BatchContinuesPastFailures) {
  cfg_.download.downloader = writeFakeDownloader();
  const std::vector<std::string> urls = {
      "https://example.invalid/good-1",
      "https://example.invalid/bad",
      "https://example.invalid/good-2",
  };
  const fs::path base = dir_ / "dataset";
  const BatchReport report = pipeline_.processVideos(urls, base.string(), cfg_, log_);

  ASSERT_EQ(report.items.size(), 3u);
  EXPECT_EQ(report.succeeded(), 2u);
  EXPECT_EQ(report.failed(), 1u);
  EXPECT_EQ(report.totalFrames(), 8);

  EXPECT_TRUE(report.items[0].ok);
  EXPECT_FALSE(report.items[1].ok);
  EXPECT_EQ(report.items[1].error_kind, ErrorKind::SourceUnavailable);
  EXPECT_TRUE(report.items[2].ok);
  EXPECT_EQ(report.items[2].output_dir, (base / "video_02").string());

  EXPECT_EQ(listFiles(base / "video_00" / "frames").size(), 4u);
  EXPECT_EQ(listFiles(base / "video_02" / "frames").size(), 4u);

  const std::string log = log_.str();
  EXPECT_NE(log.find("Batch done: 2/3 videos, 8 frames"), std::string::npos);
  EXPECT_NE(log.find("FAILED https://example.invalid/bad"), std::string::npos);
}

TEST_F(PipelineTest, BatchRejectsBadConfigUpfront) {
  cfg_.sampling.target_width = 0;
  cfg_.download.downloader = "false";
  EXPECT_THROW(pipeline_.processVideos({"https://example.invalid/v"}, (dir_ / "d").string(), cfg_, log_),
               ConfigurationError);
  EXPECT_FALSE(fs::exists(dir_ / "d"));
}

TEST(BatchItemTest, PlainExceptionIsRecordedAsCollaboratorFailure) {
  ItemResult item;
  item.source = "https://example.invalid/v";
  std::ostringstream log;
  const bool ok = runBatchItem(item, []() -> int64_t {
    throw std::runtime_error("out of memory while resizing");
  }, log);

  EXPECT_FALSE(ok);
  EXPECT_FALSE(item.ok);
  EXPECT_EQ(item.error_kind, ErrorKind::Collaborator);
  EXPECT_EQ(item.error, "out of memory while resizing");
  EXPECT_NE(log.str().find("Skipping https://example.invalid/v"), std::string::npos);
}

TEST(BatchItemTest, TypedErrorKeepsItsKind) {
  ItemResult item;
  std::ostringstream log;
  runBatchItem(item, []() -> int64_t { throw SourceUnavailable("gone"); }, log);

  EXPECT_FALSE(item.ok);
  EXPECT_EQ(item.error_kind, ErrorKind::SourceUnavailable);
  EXPECT_EQ(item.error, "gone");
}

TEST(BatchItemTest, SuccessStoresFrameCount) {
  ItemResult item;
  std::ostringstream log;
  EXPECT_TRUE(runBatchItem(item, []() -> int64_t { return 12; }, log));
  EXPECT_TRUE(item.ok);
  EXPECT_EQ(item.frames, 12);
}

TEST(BatchReportTest, PrintListsOnlyFailures) {
  BatchReport report;
  ItemResult ok;
  ok.source = "a";
  ok.ok = true;
  ok.frames = 5;
  ItemResult bad;
  bad.source = "b";
  bad.error_kind = ErrorKind::Collaborator;
  bad.error = "disk full";
  report.items = {ok, bad};

  std::ostringstream os;
  report.print(os);
  const std::string text = os.str();
  EXPECT_NE(text.find("1/2 videos, 5 frames"), std::string::npos);
  EXPECT_NE(text.find("FAILED b (collaborator failure): disk full"), std::string::npos);
  EXPECT_EQ(text.find("FAILED a"), std::string::npos);
}

} // namespace vidsample
