#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "depth2mav/camera/depth_source.h"
#include "depth2mav/ipc/depth_shm_protocol.hpp"

namespace depth2mav::ipc {

struct ShmSourceCfg {
  std::string name = kDefaultShmName;
  int width = 640, height = 480;          // expected stream resolution
  std::chrono::milliseconds disconnect_timeout{5000};
  std::chrono::milliseconds poll_interval{2};
};

// DepthSource backed by the camera bridge's shared-memory segment.
class ShmDepthSource : public DepthSource {
public:
  explicit ShmDepthSource(const ShmSourceCfg& cfg);
  ~ShmDepthSource() override;

  ShmDepthSource(const ShmDepthSource&) = delete;
  ShmDepthSource& operator=(const ShmDepthSource&) = delete;

  void start() override;
  FrameStatus next_frame(std::chrono::milliseconds timeout, DepthImage& out) override;
  void stop() override;

  float depth_scale() const { return hdr_ ? hdr_->depth_scale : 0.f; }

private:
  // copies the ready plane; false if it is busy or was overwritten meanwhile
  bool copy_latest(DepthImage& out, uint64_t seq);

  ShmSourceCfg cfg_;
  int fd_{-1};
  uint8_t* base_{nullptr};
  DepthHeader* hdr_{nullptr};
  size_t size_{0};

  uint64_t last_seq_{0};
  std::chrono::steady_clock::time_point last_frame_time_{};
};

} // namespace depth2mav::ipc
