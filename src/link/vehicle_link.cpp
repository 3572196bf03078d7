#include "depth2mav/link/vehicle_link.h"

#include <algorithm>
#include <cstring>

#include <spdlog/spdlog.h>

namespace depth2mav::link {

const char* to_string(LinkState state)
{
  switch (state) {
    case LinkState::Disconnected: return "disconnected";
    case LinkState::Connecting: return "connecting";
    case LinkState::Connected: return "connected";
  }
  return "unknown";
}

// https://mavlink.io/en/messages/common.html#STATUSTEXT
void send_status(VehicleLink& link, const std::string& text)
{
  if (!link.connected()) {
    spdlog::info("Vehicle not connected. Cannot send text message to GCS: {}", text);
    return;
  }

  const std::string line = "D4xx: " + text;
  mavlink_statustext_t msg{};
  msg.severity = MAV_SEVERITY_INFO;
  std::memcpy(msg.text, line.data(), std::min(line.size(), kStatusTextLen));

  if (!link.send(msg)) spdlog::warn("Failed to send status text '{}'", text);
  spdlog::info("{}", text);
}

bool set_default_home(VehicleLink& link, const HomeLocation& home)
{
  if (!link.connected()) return false;

  mavlink_set_gps_global_origin_t origin{};
  origin.target_system = link.target_system();
  origin.latitude = home.latitude;
  origin.longitude = home.longitude;
  origin.altitude = home.altitude;

  mavlink_set_home_position_t pos{};
  pos.target_system = link.target_system();
  pos.latitude = home.latitude;
  pos.longitude = home.longitude;
  pos.altitude = home.altitude;
  pos.q[0] = 1.f;           // identity, w first
  pos.approach_z = 1.f;

  const bool ok = link.send(origin) && link.send(pos);
  if (!ok) spdlog::warn("Failed to set EKF home");
  return ok;
}

} // namespace depth2mav::link
