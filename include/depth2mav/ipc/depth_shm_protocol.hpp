#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace depth2mav::ipc {

// Layout of the depth segment written by the camera bridge:
//   DepthHeader | PlaneHeader + z16 plane 0 | PlaneHeader + z16 plane 1
// The writer marks the plane that is not ready busy (PlaneHeader::seq = 0),
// fills it, stamps it with the new seq, flips ready_idx, then bumps seq.
// A reader accepts a plane only if its seq equals DepthHeader::seq before
// and after the copy.

enum WriterState : uint32_t { kWriterInit = 0, kWriterOpen = 1, kWriterClosed = 2 };

struct DepthHeader {
  std::atomic<uint32_t> ready_idx;
  std::atomic<uint32_t> writer_state;
  std::atomic<uint64_t> seq;
  uint32_t width, height;       // stream resolution, fixed for the segment lifetime
  float    depth_scale;         // meters per raw unit
  uint32_t _reserved;
  char     encoding[16];        // "z16"
  char     _pad[64 - 2*4 - 8 - 4*4 - 16];
};

struct PlaneHeader {
  std::atomic<uint64_t> seq;    // 0 while the writer owns the plane
  uint64_t stamp_us;            // capture time, microseconds since epoch
};

static_assert(sizeof(DepthHeader) == 64, "DepthHeader must stay 64 bytes");
static_assert(sizeof(PlaneHeader) == 16, "PlaneHeader must stay 16 bytes");
static_assert(std::atomic<uint64_t>::is_always_lock_free, "shm atomics must be lock free");

static constexpr const char* kDefaultShmName = "/d4xx_depth";
static constexpr uint32_t kMaxW = 1280;
static constexpr uint32_t kMaxH = 720;

inline size_t plane_bytes() {
  return sizeof(PlaneHeader) + size_t(kMaxW) * size_t(kMaxH) * sizeof(uint16_t);
}

inline size_t shm_size_bytes() {
  return sizeof(DepthHeader) + 2 * plane_bytes(); // double buffer
}

inline size_t plane_offset(uint32_t idx) {
  return sizeof(DepthHeader) + size_t(idx & 1) * plane_bytes();
}

} // namespace depth2mav::ipc
