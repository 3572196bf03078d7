#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "depth2mav/errors.h"
#include "depth2mav/ipc/depth_shm_reader.hpp"
#include "depth2mav/ipc/depth_shm_writer.hpp"

using namespace std::chrono_literals;
using namespace depth2mav;
using namespace depth2mav::ipc;

namespace {

constexpr int kW = 64;
constexpr int kH = 48;

std::string unique_name()
{
  static std::atomic<int> counter{0};
  return "/depth2mav_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++);
}

DepthMatrix ramp(uint16_t base)
{
  DepthMatrix m(kH, kW);
  for (int y = 0; y < kH; ++y)
    for (int x = 0; x < kW; ++x) m(y, x) = uint16_t(base + y * kW + x);
  return m;
}

struct DepthShmTest : ::testing::Test {
  void SetUp() override
  {
    name = unique_name();
    try {
      writer = std::make_unique<DepthShmWriter>(name, kW, kH, 0.001f);
    } catch (const std::runtime_error& e) {
      GTEST_SKIP() << "POSIX shared memory unavailable: " << e.what();
    }
    cfg.name = name;
    cfg.width = kW;
    cfg.height = kH;
    cfg.disconnect_timeout = 2000ms;
  }

  std::string name;
  std::unique_ptr<DepthShmWriter> writer;
  ShmSourceCfg cfg;
};

} // namespace

TEST_F(DepthShmTest, DeliversFramesWrittenAfterStart)
{
  ShmDepthSource source(cfg);
  source.start();
  EXPECT_FLOAT_EQ(source.depth_scale(), 0.001f);

  writer->write(ramp(1000), 123);

  DepthImage img;
  ASSERT_EQ(source.next_frame(500ms, img), FrameStatus::Frame);
  EXPECT_EQ(img.width(), kW);
  EXPECT_EQ(img.height(), kH);
  EXPECT_EQ(img.data, ramp(1000));
  EXPECT_FLOAT_EQ(img.depth_scale, 0.001f);
  EXPECT_EQ(img.seq, 1u);
  EXPECT_EQ(img.stamp_us, 123u);

  // nothing new yet
  EXPECT_EQ(source.next_frame(20ms, img), FrameStatus::Timeout);

  writer->write(ramp(2000), 456);
  ASSERT_EQ(source.next_frame(500ms, img), FrameStatus::Frame);
  EXPECT_EQ(img.data(0, 0), 2000);
  EXPECT_EQ(img.seq, 2u);
  EXPECT_EQ(img.stamp_us, 456u);
}

// A plane the writer is rewriting (seq 0) must not be handed out.
TEST_F(DepthShmTest, BusyPlaneIsNotDelivered)
{
  ShmDepthSource source(cfg);
  source.start();
  writer->write(ramp(1000), 7);

  const int fd = shm_open(name.c_str(), O_RDWR, 0666);
  ASSERT_GE(fd, 0);
  void* mem = mmap(nullptr, shm_size_bytes(), PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
  ::close(fd);
  ASSERT_NE(mem, MAP_FAILED);
  auto* base = static_cast<uint8_t*>(mem);
  auto* hdr = reinterpret_cast<DepthHeader*>(base);
  auto* ph = reinterpret_cast<PlaneHeader*>(base + plane_offset(hdr->ready_idx.load()));

  ph->seq.store(0);
  DepthImage img;
  EXPECT_EQ(source.next_frame(30ms, img), FrameStatus::Timeout);

  ph->seq.store(hdr->seq.load());
  ASSERT_EQ(source.next_frame(500ms, img), FrameStatus::Frame);
  EXPECT_EQ(img.data, ramp(1000));
  EXPECT_EQ(img.stamp_us, 7u);
  munmap(mem, shm_size_bytes());
}

TEST_F(DepthShmTest, FramesBeforeStartAreNotReplayed)
{
  writer->write(ramp(1000), 1);

  ShmDepthSource source(cfg);
  source.start();
  DepthImage img;
  EXPECT_EQ(source.next_frame(20ms, img), FrameStatus::Timeout);
}

TEST_F(DepthShmTest, ResolutionMismatchIsConfigError)
{
  cfg.width = 640;
  cfg.height = 480;
  ShmDepthSource source(cfg);
  EXPECT_THROW(source.start(), ConfigError);
}

TEST_F(DepthShmTest, ClosedWriterIsFailure)
{
  ShmDepthSource source(cfg);
  source.start();
  writer->close();

  DepthImage img;
  EXPECT_EQ(source.next_frame(100ms, img), FrameStatus::Failure);
}

TEST_F(DepthShmTest, StalledWriterIsFailure)
{
  cfg.disconnect_timeout = 50ms;
  ShmDepthSource source(cfg);
  source.start();

  DepthImage img;
  EXPECT_EQ(source.next_frame(10ms, img), FrameStatus::Timeout);
  std::this_thread::sleep_for(60ms);
  EXPECT_EQ(source.next_frame(10ms, img), FrameStatus::Failure);
}

TEST_F(DepthShmTest, StopIsIdempotent)
{
  ShmDepthSource source(cfg);
  source.start();
  source.stop();
  source.stop();

  DepthImage img;
  EXPECT_EQ(source.next_frame(10ms, img), FrameStatus::Failure);
}

TEST_F(DepthShmTest, WriterRejectsWrongFrameSize)
{
  EXPECT_THROW(writer->write(DepthMatrix::Zero(10, 10), 0), std::invalid_argument);
}

TEST_F(DepthShmTest, ConcurrentWriterNeverYieldsTornFrames)
{
  ShmDepthSource source(cfg);
  source.start();

  std::atomic<bool> done{false};
  std::thread producer([&] {
    for (uint16_t i = 1; i <= 300; ++i) {
      writer->write(DepthMatrix::Constant(kH, kW, i), i);
      std::this_thread::sleep_for(200us);
    }
    done = true;
  });

  int frames = 0;
  DepthImage img;
  while (!done.load()) {
    if (source.next_frame(50ms, img) != FrameStatus::Frame) continue;
    ++frames;
    const uint16_t v = img.data(0, 0);
    EXPECT_TRUE((img.data.array() == v).all()) << "mixed frame at seq " << img.seq;
    EXPECT_EQ(img.stamp_us, uint64_t(v)) << "stamp from another frame at seq " << img.seq;
  }
  producer.join();
  EXPECT_GT(frames, 0);
}

TEST(ShmDepthSource, MissingSegmentThrows)
{
  ShmSourceCfg cfg;
  cfg.name = "/depth2mav_does_not_exist";
  ShmDepthSource source(cfg);
  EXPECT_THROW(source.start(), std::runtime_error);
}
