// Copyright (c) 2025, depth2mav contributors.
// All rights reserved.

#pragma once

#include <cstdint>
#include <string>

#include "depth2mav/link/mavlink_msgs.h"
#include "depth2mav/shutdown_signal.h"

namespace depth2mav::link {

enum class LinkState { Disconnected, Connecting, Connected };

const char* to_string(LinkState state);

// Connection to the flight controller.
//
// Disconnected -> Connecting -> Connected, and back to Disconnected on close().
// send() is safe from any thread and returns false (nothing sent) unless Connected.
class VehicleLink {
public:
  virtual ~VehicleLink() = default;

  // Blocks until Connected or until `shutdown` is requested; retries internally.
  virtual bool connect(const ShutdownSignal& shutdown) = 0;
  // Idempotent. A closed link does not reconnect.
  virtual void close() = 0;
  virtual LinkState state() const = 0;

  bool connected() const { return state() == LinkState::Connected; }

  // system id of the autopilot we are talking to
  virtual uint8_t target_system() const = 0;

  virtual bool send(const mavlink_obstacle_distance_t& msg) = 0;
  virtual bool send(const mavlink_distance_sensor_t& msg) = 0;
  virtual bool send(const mavlink_statustext_t& msg) = 0;
  virtual bool send(const mavlink_set_gps_global_origin_t& msg) = 0;
  virtual bool send(const mavlink_set_home_position_t& msg) = 0;
};

// ---------------- one-off commands ----------------
struct HomeLocation {
  int32_t latitude = 151269321;    // degE7
  int32_t longitude = 16624301;    // degE7
  int32_t altitude = 163000;       // mm
};

// Ground-station text, prefixed "D4xx: ". Logged either way.
void send_status(VehicleLink& link, const std::string& text);

// SET_GPS_GLOBAL_ORIGIN followed by SET_HOME_POSITION, so the EKF can run without GPS.
bool set_default_home(VehicleLink& link, const HomeLocation& home);

} // namespace depth2mav::link
