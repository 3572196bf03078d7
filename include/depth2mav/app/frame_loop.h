#pragma once

#include <chrono>
#include <cstdint>

#include "depth2mav/app/context.h"
#include "depth2mav/depth/depth_utils.h"

namespace depth2mav::app {

// Acquisition and reduction: pull a frame, filter it, fold it into sectors
// and publish the result. Never touches the vehicle link except to close it
// when the camera is lost.
class FrameLoop {
public:
  explicit FrameLoop(AppContext& ctx);

  // One bounded-wait iteration. Returns false once the loop should end.
  bool step();

  // Steps until shutdown is requested or the camera fails.
  void run();

  uint64_t frames() const { return frames_; }

private:
  AppContext& ctx_;
  depth::DepthFilterPipeline pipeline_;
  std::chrono::milliseconds frame_timeout_;

  DepthImage raw_;
  DistanceArray distances_;   // reused every frame
  uint64_t frames_ = 0;
  std::chrono::steady_clock::time_point last_frame_{};
};

} // namespace depth2mav::app
