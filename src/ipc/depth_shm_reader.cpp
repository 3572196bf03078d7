#include "depth2mav/ipc/depth_shm_reader.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

#include "depth2mav/errors.h"

namespace depth2mav::ipc {

ShmDepthSource::ShmDepthSource(const ShmSourceCfg& cfg)
: cfg_(cfg) {}

ShmDepthSource::~ShmDepthSource() { stop(); }

void ShmDepthSource::start()
{
  if (hdr_) return;

  fd_ = shm_open(cfg_.name.c_str(), O_RDWR, 0666);
  if (fd_ < 0) throw std::runtime_error("shm_open failed for '" + cfg_.name + "': " + std::strerror(errno));

  struct stat st{};
  if (fstat(fd_, &st) != 0 || size_t(st.st_size) < shm_size_bytes()) {
    stop();
    throw std::runtime_error("depth segment '" + cfg_.name + "' is too small");
  }

  size_ = shm_size_bytes();
  void* mem = mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
  if (mem == MAP_FAILED) {
    stop();
    throw std::runtime_error("mmap failed");
  }
  base_ = static_cast<uint8_t*>(mem);
  hdr_ = reinterpret_cast<DepthHeader*>(base_);

  if (std::strncmp(hdr_->encoding, "z16", sizeof(hdr_->encoding)) != 0) {
    stop();
    throw ConfigError("depth segment '" + cfg_.name + "' does not carry z16 frames");
  }
  if (int(hdr_->width) != cfg_.width || int(hdr_->height) != cfg_.height) {
    const std::string msg = "depth stream is " + std::to_string(hdr_->width) + "x" + std::to_string(hdr_->height)
                          + ", configured " + std::to_string(cfg_.width) + "x" + std::to_string(cfg_.height);
    stop();
    throw ConfigError(msg);
  }

  last_seq_ = hdr_->seq.load(std::memory_order_acquire);
  last_frame_time_ = std::chrono::steady_clock::now();
  spdlog::info("Depth shm '{}' opened: {}x{}, depth scale {}", cfg_.name, hdr_->width, hdr_->height, hdr_->depth_scale);
}

void ShmDepthSource::stop()
{
  if (base_) munmap(base_, size_);
  if (fd_ >= 0) close(fd_);
  base_ = nullptr;
  hdr_ = nullptr;
  fd_ = -1;
}

bool ShmDepthSource::copy_latest(DepthImage& out, uint64_t seq)
{
  const uint32_t idx = hdr_->ready_idx.load(std::memory_order_acquire);
  const uint8_t* plane = base_ + plane_offset(idx);
  const auto* ph = reinterpret_cast<const PlaneHeader*>(plane);

  // busy (0) or already holding a newer frame
  if (ph->seq.load(std::memory_order_acquire) != seq) return false;

  const uint64_t stamp_us = ph->stamp_us;
  out.data.resize(hdr_->height, hdr_->width);
  std::memcpy(out.data.data(), plane + sizeof(PlaneHeader), size_t(out.data.size()) * sizeof(uint16_t));

  std::atomic_thread_fence(std::memory_order_acquire);
  if (ph->seq.load(std::memory_order_relaxed) != seq) return false;
  if (hdr_->seq.load(std::memory_order_relaxed) != seq) return false;

  out.depth_scale = hdr_->depth_scale;
  out.seq = seq;
  out.stamp_us = stamp_us;
  return true;
}

FrameStatus ShmDepthSource::next_frame(std::chrono::milliseconds timeout, DepthImage& out)
{
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + timeout;

  while (hdr_) {
    if (hdr_->writer_state.load() == kWriterClosed) {
      spdlog::error("Depth writer closed '{}'", cfg_.name);
      return FrameStatus::Failure;
    }

    const uint64_t seq = hdr_->seq.load(std::memory_order_acquire);
    if (seq != 0 && seq != last_seq_) {
      if (copy_latest(out, seq)) {
        last_seq_ = seq;
        last_frame_time_ = clock::now();
        return FrameStatus::Frame;
      }
      // plane busy or overwritten while copying, retry after the poll interval
    }

    const auto now = clock::now();
    if (now - last_frame_time_ > cfg_.disconnect_timeout) {
      spdlog::error("No depth frame for {} ms",
                    std::chrono::duration_cast<std::chrono::milliseconds>(now - last_frame_time_).count());
      return FrameStatus::Failure;
    }
    if (now >= deadline) return FrameStatus::Timeout;

    std::this_thread::sleep_for(std::min<clock::duration>(cfg_.poll_interval, deadline - now));
  }
  return FrameStatus::Failure;
}

} // namespace depth2mav::ipc
