// Vidsample - FrameSampler
// Keeps every Nth frame of a source and resizes it to a fixed size.

#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <opencv2/core.hpp>

#include "vidsample/Config.h"
#include "vidsample/FrameSource.h"

namespace vidsample {

struct OutputFrame {
  cv::Mat image;
  // Position among accepted frames, 0-based and gap-free.
  int64_t saved_index = 0;
  // Position in the source the frame was read from.
  int64_t sample_index = 0;
};

class FrameSampler {
public:
  using FrameCallback = std::function<void(const OutputFrame& frame)>;

  // Reads `source` to exhaustion and calls `on_frame` for every frame whose
  // position is a multiple of cfg.sample_rate, resized to the target size.
  // Returns number of frames emitted. Throws ConfigurationError before the
  // first read if `cfg` is invalid; exceptions from `on_frame` propagate.
  int64_t sample(FrameSource& source,
                 const SamplingConfig& cfg,
                 const FrameCallback& on_frame,
                 std::ostream& log) const;
};

} // namespace vidsample
