#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

#include "depth2mav/link/protocol_encoder.h"
#include "depth2mav/telemetry/periodic_timer.h"
#include "depth2mav/telemetry/telemetry_scheduler.h"
#include "fakes.h"

using namespace std::chrono_literals;
using namespace depth2mav;
using depth2mav::testing::FakeLink;

namespace {

template <class Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 2000ms)
{
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

struct SchedulerFixture : ::testing::Test {
  SharedSnapshot snapshot;
  FakeLink vehicle;
  link::ProtocolEncoder encoder{SectorGeometry{}, RangeBounds{}};
};

} // namespace

// ---------------- PeriodicTimer ----------------
TEST(PeriodicTimer, FiresRepeatedly)
{
  std::atomic<int> calls{0};
  telemetry::PeriodicTimer timer(10ms, [&] { calls.fetch_add(1); });
  timer.start();
  EXPECT_TRUE(timer.running());
  EXPECT_TRUE(eventually([&] { return calls.load() >= 5; }));
  timer.stop();
  EXPECT_FALSE(timer.running());
  EXPECT_EQ(timer.ticks(), uint64_t(calls.load()));
}

TEST(PeriodicTimer, StopIsIdempotentAndPrompt)
{
  telemetry::PeriodicTimer timer(10s, [] {});
  timer.start();

  const auto t0 = std::chrono::steady_clock::now();
  timer.stop();
  timer.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
  EXPECT_EQ(timer.ticks(), 0u);
}

TEST(PeriodicTimer, StopWithoutStart)
{
  telemetry::PeriodicTimer timer(10ms, [] {});
  EXPECT_NO_THROW(timer.stop());
}

TEST(PeriodicTimer, SlowCallbackSkipsMissedDeadlines)
{
  std::atomic<int> calls{0};
  telemetry::PeriodicTimer timer(5ms, [&] {
    if (calls.fetch_add(1) == 0) std::this_thread::sleep_for(50ms);
  });
  timer.start();
  EXPECT_TRUE(eventually([&] { return calls.load() >= 2; }));
  timer.stop();
  EXPECT_GE(timer.skipped(), 5u);
}

// A callback using most of the period must not lower the rate: sleeping a
// full period after each callback would give about 62 ticks here.
TEST(PeriodicTimer, LongCallbackDoesNotDrift)
{
  telemetry::PeriodicTimer timer(10ms, [] { std::this_thread::sleep_for(6ms); });
  timer.start();
  std::this_thread::sleep_for(1s);
  timer.stop();

  EXPECT_GE(timer.ticks(), 90u);
  EXPECT_LE(timer.ticks(), 101u);
  EXPECT_LE(timer.skipped(), 3u);
}

TEST(PeriodicTimer, RejectsBadArguments)
{
  EXPECT_THROW(telemetry::PeriodicTimer(0ms, [] {}), std::invalid_argument);
  EXPECT_THROW(telemetry::PeriodicTimer(10ms, nullptr), std::invalid_argument);
}

// ---------------- TelemetryScheduler ----------------
TEST_F(SchedulerFixture, NothingSentBeforeFirstPublish)
{
  vehicle.set_connected(true);
  telemetry::TelemetryScheduler scheduler(snapshot, vehicle, encoder, 15.0);

  EXPECT_FALSE(scheduler.tick());
  EXPECT_TRUE(vehicle.sector_reports.empty());
  EXPECT_TRUE(vehicle.point_reports.empty());
  EXPECT_EQ(scheduler.emitted(), 0u);
}

TEST_F(SchedulerFixture, NothingSentWhileDisconnected)
{
  snapshot.publish(DistanceArray(72, 200), 1);
  telemetry::TelemetryScheduler scheduler(snapshot, vehicle, encoder, 15.0);

  EXPECT_FALSE(scheduler.tick());
  EXPECT_TRUE(vehicle.sector_reports.empty());
  EXPECT_EQ(scheduler.send_failures(), 0u);
}

TEST_F(SchedulerFixture, TickSendsBothReports)
{
  vehicle.set_connected(true);
  snapshot.publish(DistanceArray(72, 200), 1234);
  telemetry::TelemetryScheduler scheduler(snapshot, vehicle, encoder, 15.0);

  ASSERT_TRUE(scheduler.tick());
  ASSERT_EQ(vehicle.sector_reports.size(), 1u);
  ASSERT_EQ(vehicle.point_reports.size(), 1u);
  EXPECT_EQ(vehicle.sector_reports[0].time_usec, 1234u);
  EXPECT_EQ(vehicle.sector_reports[0].distances[0], 200);
  EXPECT_EQ(vehicle.point_reports[0].current_distance, 200);
  EXPECT_EQ(scheduler.emitted(), 1u);
}

TEST_F(SchedulerFixture, StaleSnapshotIsResent)
{
  vehicle.set_connected(true);
  snapshot.publish(DistanceArray(72, 300), 1);
  telemetry::TelemetryScheduler scheduler(snapshot, vehicle, encoder, 15.0, false);

  EXPECT_TRUE(scheduler.tick());
  EXPECT_TRUE(scheduler.tick());
  EXPECT_EQ(vehicle.sector_reports.size(), 2u);
  EXPECT_TRUE(vehicle.point_reports.empty());
}

TEST_F(SchedulerFixture, FailedSendIsCounted)
{
  vehicle.set_connected(true);
  vehicle.fail_sends = true;
  snapshot.publish(DistanceArray(72, 300), 1);
  telemetry::TelemetryScheduler scheduler(snapshot, vehicle, encoder, 15.0);

  EXPECT_FALSE(scheduler.tick());
  EXPECT_EQ(scheduler.send_failures(), 1u);
  EXPECT_EQ(scheduler.emitted(), 0u);
}

TEST_F(SchedulerFixture, RunsOnItsOwnClock)
{
  vehicle.set_connected(true);
  snapshot.publish(DistanceArray(72, 150), 1);
  telemetry::TelemetryScheduler scheduler(snapshot, vehicle, encoder, 100.0);

  scheduler.start();
  EXPECT_TRUE(eventually([&] { return vehicle.count_sector_reports() >= 3; }));
  scheduler.stop();
  scheduler.stop();
  EXPECT_FALSE(scheduler.running());

  const auto sent = vehicle.count_sector_reports();
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(vehicle.count_sector_reports(), sent);
}

TEST_F(SchedulerFixture, RejectsNonPositiveRate)
{
  EXPECT_THROW(telemetry::TelemetryScheduler(snapshot, vehicle, encoder, 0.0), std::invalid_argument);
}
