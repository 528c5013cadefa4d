#include "vidsample/FrameSampler.h"

#include <opencv2/imgproc.hpp>

namespace vidsample {

int64_t FrameSampler::sample(FrameSource& source,
                             const SamplingConfig& cfg,
                             const FrameCallback& on_frame,
                             std::ostream& log) const {
  validate(cfg);

  const cv::Size target(cfg.target_width, cfg.target_height);
  log << "[Sampler] Sampling " << source.describe() << ": every "
      << cfg.sample_rate << " frame(s), size=" << target.width << "x"
      << target.height << "\n";

  int64_t sample_index = 0;
  int64_t saved_index = 0;

  cv::Mat frame;
  while (source.read(frame)) {
    if (sample_index % cfg.sample_rate == 0) {
      OutputFrame out;
      out.saved_index = saved_index;
      out.sample_index = sample_index;
      if (frame.size() == target) {
        out.image = frame.clone();
      } else {
        cv::resize(frame, out.image, target, 0, 0, cfg.interpolation);
      }
      on_frame(out);
      ++saved_index;
    }
    ++sample_index;
  }

  log << "[Sampler] Read " << sample_index << " frames, emitted "
      << saved_index << "\n";
  return saved_index;
}

} // namespace vidsample
