#pragma once

#include <atomic>
#include <deque>
#include <mutex>
#include <vector>

#include "depth2mav/camera/depth_source.h"
#include "depth2mav/link/vehicle_link.h"

namespace depth2mav::testing {

// Records everything sent; connected state is set by the test.
class FakeLink : public link::VehicleLink {
public:
  bool connect(const ShutdownSignal&) override
  {
    state_.store(link::LinkState::Connected);
    return true;
  }
  void close() override
  {
    closes.fetch_add(1);
    state_.store(link::LinkState::Disconnected);
  }
  link::LinkState state() const override { return state_.load(); }
  uint8_t target_system() const override { return 7; }

  void set_connected(bool on)
  {
    state_.store(on ? link::LinkState::Connected : link::LinkState::Disconnected);
  }

  bool send(const mavlink_obstacle_distance_t& msg) override { return record(sector_reports, msg); }
  bool send(const mavlink_distance_sensor_t& msg) override { return record(point_reports, msg); }
  bool send(const mavlink_statustext_t& msg) override { return record(status, msg); }
  bool send(const mavlink_set_gps_global_origin_t& msg) override { return record(origins, msg); }
  bool send(const mavlink_set_home_position_t& msg) override { return record(homes, msg); }

  size_t count_sector_reports() const
  {
    std::lock_guard<std::mutex> lk(mutex);
    return sector_reports.size();
  }

  mutable std::mutex mutex;
  std::vector<mavlink_obstacle_distance_t> sector_reports;
  std::vector<mavlink_distance_sensor_t> point_reports;
  std::vector<mavlink_statustext_t> status;
  std::vector<mavlink_set_gps_global_origin_t> origins;
  std::vector<mavlink_set_home_position_t> homes;
  std::atomic<int> closes{0};
  bool fail_sends = false;

private:
  template <class Msg>
  bool record(std::vector<Msg>& into, const Msg& msg)
  {
    if (!connected() || fail_sends) return false;
    std::lock_guard<std::mutex> lk(mutex);
    into.push_back(msg);
    return true;
  }

  std::atomic<link::LinkState> state_{link::LinkState::Disconnected};
};

// Replays a scripted list of results, then reports Timeout.
class FakeDepthSource : public DepthSource {
public:
  struct Step {
    FrameStatus status;
    DepthImage image;
  };

  void start() override { started = true; }
  void stop() override { stopped = true; }

  FrameStatus next_frame(std::chrono::milliseconds, DepthImage& out) override
  {
    if (script.empty()) return FrameStatus::Timeout;
    Step s = std::move(script.front());
    script.pop_front();
    if (s.status == FrameStatus::Frame) out = std::move(s.image);
    return s.status;
  }

  std::deque<Step> script;
  bool started = false;
  bool stopped = false;
};

inline DepthImage uniform_image(int width, int height, uint16_t raw, float scale = 0.001f)
{
  DepthImage img;
  img.data = DepthMatrix::Constant(height, width, raw);
  img.depth_scale = scale;
  return img;
}

} // namespace depth2mav::testing
