#pragma once

#include <chrono>

#include "depth2mav/types.h"

namespace depth2mav {

enum class FrameStatus {
  Frame,     // `out` holds a new image
  Timeout,   // nothing new within the timeout, try again
  Failure    // camera gone, stop
};

// Where depth frames come from.
class DepthSource {
public:
  virtual ~DepthSource() = default;

  // Opens the device/stream. Throws on failure or when the stream does not
  // match the configured resolution.
  virtual void start() = 0;

  // Waits at most `timeout` for the next frame.
  virtual FrameStatus next_frame(std::chrono::milliseconds timeout, DepthImage& out) = 0;

  // Idempotent.
  virtual void stop() = 0;
};

} // namespace depth2mav
