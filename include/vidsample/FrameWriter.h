// Vidsample - FrameWriter
// Saves sampled frames as frame_NNNNN.<ext> image files.

#pragma once

#include <cstdint>
#include <string>
#include <ostream>

#include "vidsample/Config.h"
#include "vidsample/FrameSampler.h"

namespace vidsample {

// "frame_00042.png" for (42, ".png").
std::string frameFileName(int64_t index, const std::string& extension);

class FrameWriter {
public:
  // Writes `frame` into `out_dir`, creating it if needed.
  // Returns the written file path. Throws CollaboratorFailure on failure.
  std::string write(const OutputFrame& frame,
                    const std::string& out_dir,
                    const OutputConfig& cfg,
                    std::ostream& log) const;
};

} // namespace vidsample
