#include "depth2mav/link/mavlink_link.h"

#include <array>
#include <utility>

#include <spdlog/spdlog.h>

namespace depth2mav::link {

namespace {
constexpr std::chrono::milliseconds kReadSlice{100};
} // anon

MavlinkLink::MavlinkLink(std::unique_ptr<Transport> transport, const MavlinkLinkCfg& cfg)
: transport_(std::move(transport)), cfg_(cfg)
{
  if (!transport_) throw LinkError("MavlinkLink: null transport");
  if (cfg_.channel >= MAVLINK_COMM_NUM_BUFFERS) throw LinkError("MavlinkLink: no such MAVLink channel");
}

MavlinkLink::~MavlinkLink() { close(); }

bool MavlinkLink::connect(const ShutdownSignal& shutdown)
{
  while (!shutdown.requested() && !closed_.load()) {
    state_.store(LinkState::Connecting);

    bool opened = false;
    {
      std::lock_guard<std::mutex> lk(io_mutex_);
      opened = !closed_.load() && transport_->open();
      if (opened) mavlink_reset_channel_status(cfg_.channel);
    }

    if (opened && wait_for_heartbeat(shutdown)) {
      state_.store(LinkState::Connected);
      spdlog::info("Vehicle connected on {} (system {})", transport_->describe(), int(target_system_.load()));
      return true;
    }

    if (shutdown.requested() || closed_.load()) break;
    state_.store(LinkState::Disconnected);
    spdlog::warn("Connection error on {}! Retrying...", transport_->describe());
    shutdown.wait_for(cfg_.retry_delay);
  }

  state_.store(LinkState::Disconnected);
  return false;
}

bool MavlinkLink::wait_for_heartbeat(const ShutdownSignal& shutdown)
{
  const auto deadline = std::chrono::steady_clock::now() + cfg_.heartbeat_timeout;
  std::array<uint8_t, 512> buf{};

  while (std::chrono::steady_clock::now() < deadline) {
    if (shutdown.requested() || closed_.load()) return false;

    std::lock_guard<std::mutex> lk(io_mutex_);
    const long n = transport_->read(buf.data(), buf.size(), kReadSlice);
    if (n < 0) return false;

    for (long i = 0; i < n; ++i) {
      mavlink_message_t msg;
      mavlink_status_t status;
      if (!mavlink_parse_char(cfg_.channel, buf[i], &msg, &status)) continue;
      if (msg.msgid != MAVLINK_MSG_ID_HEARTBEAT) continue;

      mavlink_heartbeat_t hb;
      mavlink_msg_heartbeat_decode(&msg, &hb);
      // skip ground stations and other companions
      if (hb.autopilot == MAV_AUTOPILOT_INVALID) continue;
      target_system_.store(msg.sysid);
      return true;
    }
  }
  return false;
}

void MavlinkLink::close()
{
  closed_.store(true);
  std::lock_guard<std::mutex> lk(io_mutex_);
  if (transport_->is_open()) {
    transport_->close();
    spdlog::info("Vehicle link {} closed", transport_->describe());
  }
  state_.store(LinkState::Disconnected);
}

// ---------------- send ----------------
template <class Encode>
bool MavlinkLink::send_encoded(Encode&& encode)
{
  if (state_.load() != LinkState::Connected) return false;
  std::lock_guard<std::mutex> lk(io_mutex_);
  if (!transport_->is_open()) return false;

  mavlink_message_t msg;
  encode(&msg);
  std::array<uint8_t, MAVLINK_MAX_PACKET_LEN> buf;
  const uint16_t len = mavlink_msg_to_send_buffer(buf.data(), &msg);
  return transport_->write(buf.data(), len);
}

bool MavlinkLink::send(const mavlink_obstacle_distance_t& od)
{
  return send_encoded([&](mavlink_message_t* msg) {
    mavlink_msg_obstacle_distance_encode_chan(cfg_.source_system, cfg_.source_component, cfg_.channel, msg, &od);
  });
}

bool MavlinkLink::send(const mavlink_distance_sensor_t& ds)
{
  return send_encoded([&](mavlink_message_t* msg) {
    mavlink_msg_distance_sensor_encode_chan(cfg_.source_system, cfg_.source_component, cfg_.channel, msg, &ds);
  });
}

bool MavlinkLink::send(const mavlink_statustext_t& st)
{
  return send_encoded([&](mavlink_message_t* msg) {
    mavlink_msg_statustext_encode_chan(cfg_.source_system, cfg_.source_component, cfg_.channel, msg, &st);
  });
}

bool MavlinkLink::send(const mavlink_set_gps_global_origin_t& origin)
{
  return send_encoded([&](mavlink_message_t* msg) {
    mavlink_msg_set_gps_global_origin_encode_chan(cfg_.source_system, cfg_.source_component, cfg_.channel, msg,
                                                  &origin);
  });
}

bool MavlinkLink::send(const mavlink_set_home_position_t& home)
{
  return send_encoded([&](mavlink_message_t* msg) {
    mavlink_msg_set_home_position_encode_chan(cfg_.source_system, cfg_.source_component, cfg_.channel, msg, &home);
  });
}

} // namespace depth2mav::link
