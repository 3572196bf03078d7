#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

#include "depth2mav/link/mavlink_msgs.h"
#include "depth2mav/link/transport.h"
#include "depth2mav/link/vehicle_link.h"

namespace depth2mav::link {

struct MavlinkLinkCfg {
  uint8_t source_system = 1;
  uint8_t source_component = MAV_COMP_ID_OBSTACLE_AVOIDANCE;
  // parser and tx sequence state inside the MAVLink helpers
  uint8_t channel = MAVLINK_COMM_0;
  std::chrono::milliseconds heartbeat_timeout{5000};
  std::chrono::milliseconds retry_delay{1000};
};

// VehicleLink over MAVLink 2. "Connected" means an autopilot heartbeat was
// seen on the transport.
class MavlinkLink : public VehicleLink {
public:
  MavlinkLink(std::unique_ptr<Transport> transport, const MavlinkLinkCfg& cfg);
  ~MavlinkLink() override;

  MavlinkLink(const MavlinkLink&) = delete;
  MavlinkLink& operator=(const MavlinkLink&) = delete;

  bool connect(const ShutdownSignal& shutdown) override;
  void close() override;
  LinkState state() const override { return state_.load(); }
  uint8_t target_system() const override { return target_system_.load(); }

  bool send(const mavlink_obstacle_distance_t& msg) override;
  bool send(const mavlink_distance_sensor_t& msg) override;
  bool send(const mavlink_statustext_t& msg) override;
  bool send(const mavlink_set_gps_global_origin_t& msg) override;
  bool send(const mavlink_set_home_position_t& msg) override;

private:
  bool wait_for_heartbeat(const ShutdownSignal& shutdown);

  // Encodes under io_mutex_ so the channel's tx sequence follows wire order.
  template <class Encode>
  bool send_encoded(Encode&& encode);

  std::unique_ptr<Transport> transport_;
  MavlinkLinkCfg cfg_;

  std::mutex io_mutex_;       // guards transport_ and the channel status

  std::atomic<LinkState> state_{LinkState::Disconnected};
  std::atomic<uint8_t> target_system_{1};
  std::atomic<bool> closed_{false};
};

} // namespace depth2mav::link
