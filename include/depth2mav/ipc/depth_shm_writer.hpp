#pragma once
#include <cstdint>
#include <string>

#include "depth2mav/ipc/depth_shm_protocol.hpp"
#include "depth2mav/types.h"

namespace depth2mav::ipc {

// Producer side of the depth segment, used by camera bridges and tests.
// Creates (or truncates) the segment; unlinks it on destruction when `owner`.
class DepthShmWriter {
public:
  DepthShmWriter(const std::string& name, uint32_t width, uint32_t height,
                 float depth_scale, bool owner = true);
  ~DepthShmWriter();

  DepthShmWriter(const DepthShmWriter&) = delete;
  DepthShmWriter& operator=(const DepthShmWriter&) = delete;

  // Throws std::invalid_argument if the image size differs from the segment's.
  void write(const DepthMatrix& frame, uint64_t stamp_us);

  // Tells readers the camera is gone.
  void close();

  uint64_t seq() const { return hdr_->seq.load(); }

private:
  std::string name_;
  bool owner_;
  int fd_{-1};
  uint8_t* base_{nullptr};
  DepthHeader* hdr_{nullptr};
  size_t size_{0};
};

} // namespace depth2mav::ipc
