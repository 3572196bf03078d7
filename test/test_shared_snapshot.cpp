#include <atomic>
#include <thread>

#include <gtest/gtest.h>

#include "depth2mav/shared_snapshot.h"

using namespace depth2mav;

TEST(SharedSnapshot, EmptyBeforeFirstPublish)
{
  SharedSnapshot shared;
  EXPECT_FALSE(shared.read().has_value());
  EXPECT_EQ(shared.sequence(), 0u);
}

TEST(SharedSnapshot, LatestPublishWins)
{
  SharedSnapshot shared;
  shared.publish(DistanceArray(72, 100), 10);
  shared.publish(DistanceArray(72, 250), 20);

  const auto snap = shared.read();
  ASSERT_TRUE(snap.has_value());
  EXPECT_EQ(snap->distances, DistanceArray(72, 250));
  EXPECT_EQ(snap->stamp_us, 20u);
  EXPECT_EQ(snap->seq, 2u);
  EXPECT_EQ(shared.sequence(), 2u);
}

TEST(SharedSnapshot, ReadReturnsPrivateCopy)
{
  SharedSnapshot shared;
  shared.publish(DistanceArray(8, 300), 1);

  auto snap = shared.read();
  ASSERT_TRUE(snap.has_value());
  snap->distances[0] = 1;

  EXPECT_EQ(shared.read()->distances[0], 300);
}

TEST(SharedSnapshot, SizeMayChangeBetweenPublishes)
{
  SharedSnapshot shared;
  shared.publish(DistanceArray(72, 1), 1);
  shared.publish(DistanceArray(36, 2), 2);
  shared.publish(DistanceArray(72, 3), 3);
  EXPECT_EQ(shared.read()->distances, DistanceArray(72, 3));
}

// Every published array is uniform and its value matches its stamp, so a
// reader seeing mixed values or a mismatched stamp has observed a torn write.
TEST(SharedSnapshot, ConcurrentReadersNeverSeeTornSnapshots)
{
  SharedSnapshot shared;
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};
  std::atomic<uint64_t> reads{0};

  std::thread writer([&] {
    for (uint16_t v = 1; v <= 20000; ++v) {
      shared.publish(DistanceArray(72, v), v);
    }
    done = true;
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&] {
      uint64_t last_seq = 0;
      while (!done.load()) {
        const auto snap = shared.read();
        if (!snap) continue;
        reads.fetch_add(1);
        const uint16_t v = snap->distances.front();
        bool ok = snap->distances.size() == 72 && snap->stamp_us == v && snap->seq >= last_seq;
        for (auto d : snap->distances) ok = ok && d == v;
        if (!ok) torn.fetch_add(1);
        last_seq = snap->seq;
      }
    });
  }

  writer.join();
  for (auto& t : readers) t.join();

  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(shared.sequence(), 20000u);
  EXPECT_EQ(shared.read()->distances.front(), 20000);
}
