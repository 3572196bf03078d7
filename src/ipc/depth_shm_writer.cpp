#include "depth2mav/ipc/depth_shm_writer.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <new>
#include <stdexcept>

namespace depth2mav::ipc {

DepthShmWriter::DepthShmWriter(const std::string& name, uint32_t width, uint32_t height,
                               float depth_scale, bool owner)
: name_(name), owner_(owner)
{
  if (width == 0 || height == 0 || width > kMaxW || height > kMaxH) {
    throw std::invalid_argument("DepthShmWriter: unsupported resolution");
  }

  fd_ = shm_open(name_.c_str(), O_CREAT | O_RDWR, 0666);
  if (fd_ < 0) throw std::runtime_error("shm_open failed for '" + name_ + "': " + std::strerror(errno));

  size_ = shm_size_bytes();
  if (ftruncate(fd_, off_t(size_)) != 0) {
    ::close(fd_);
    throw std::runtime_error("ftruncate failed");
  }

  void* mem = mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
  if (mem == MAP_FAILED) {
    ::close(fd_);
    throw std::runtime_error("mmap failed");
  }
  base_ = static_cast<uint8_t*>(mem);
  std::memset(base_, 0, sizeof(DepthHeader) + 2 * sizeof(PlaneHeader));

  hdr_ = new (base_) DepthHeader();
  for (uint32_t i = 0; i < 2; ++i) new (base_ + plane_offset(i)) PlaneHeader();
  hdr_->width = width;
  hdr_->height = height;
  hdr_->depth_scale = depth_scale;
  std::strncpy(hdr_->encoding, "z16", sizeof(hdr_->encoding) - 1);
  hdr_->ready_idx.store(0);
  hdr_->seq.store(0);
  hdr_->writer_state.store(kWriterOpen, std::memory_order_release);
}

DepthShmWriter::~DepthShmWriter()
{
  if (hdr_) close();
  if (base_) munmap(base_, size_);
  if (fd_ >= 0) ::close(fd_);
  if (owner_) shm_unlink(name_.c_str());
}

void DepthShmWriter::write(const DepthMatrix& frame, uint64_t stamp_us)
{
  if (frame.rows() != Eigen::Index(hdr_->height) || frame.cols() != Eigen::Index(hdr_->width)) {
    throw std::invalid_argument("DepthShmWriter: frame size does not match the segment");
  }

  const uint32_t idx = hdr_->ready_idx.load() ^ 1u;
  const uint64_t seq = hdr_->seq.load() + 1;
  uint8_t* plane = base_ + plane_offset(idx);

  auto* ph = reinterpret_cast<PlaneHeader*>(plane);

  // busy before any byte of the plane changes
  ph->seq.store(0, std::memory_order_relaxed);
  std::atomic_thread_fence(std::memory_order_release);

  ph->stamp_us = stamp_us;
  std::memcpy(plane + sizeof(PlaneHeader), frame.data(), size_t(frame.size()) * sizeof(uint16_t));
  ph->seq.store(seq, std::memory_order_release);

  hdr_->ready_idx.store(idx, std::memory_order_release);
  hdr_->seq.store(seq, std::memory_order_release);
}

void DepthShmWriter::close()
{
  if (hdr_) hdr_->writer_state.store(kWriterClosed, std::memory_order_release);
}

} // namespace depth2mav::ipc
