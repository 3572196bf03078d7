// Copyright (c) 2025, depth2mav contributors.
// All rights reserved.

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "depth2mav/link/protocol_encoder.h"
#include "depth2mav/link/vehicle_link.h"
#include "depth2mav/shared_snapshot.h"
#include "depth2mav/telemetry/periodic_timer.h"

namespace depth2mav::telemetry {

// Republishes the freshest obstacle map at a fixed rate, independent of the
// camera. A tick does nothing until the link is connected and a first
// snapshot exists.
class TelemetryScheduler {
public:
  TelemetryScheduler(const SharedSnapshot& snapshot, link::VehicleLink& link,
                     const link::ProtocolEncoder& encoder, double rate_hz,
                     bool send_single_point = true);
  ~TelemetryScheduler();

  void start();
  void stop();
  bool running() const;

  // One tick; true if the reports were handed to the link.
  bool tick();

  uint64_t emitted() const { return emitted_.load(); }
  uint64_t send_failures() const { return send_failures_.load(); }

private:
  const SharedSnapshot& snapshot_;
  link::VehicleLink& link_;
  const link::ProtocolEncoder& encoder_;
  bool send_single_point_;

  std::unique_ptr<PeriodicTimer> timer_;
  uint64_t last_seq_ = 0;   // tick() has one caller at a time

  std::atomic<uint64_t> emitted_{0};
  std::atomic<uint64_t> send_failures_{0};
};

} // namespace depth2mav::telemetry
