// Copyright (c) 2025, depth2mav contributors.
// All rights reserved.

#pragma once

#include <memory>
#include <utility>

#include "depth2mav/camera/depth_source.h"
#include "depth2mav/config.h"
#include "depth2mav/link/vehicle_link.h"
#include "depth2mav/shared_snapshot.h"
#include "depth2mav/shutdown_signal.h"

namespace depth2mav::app {

// Everything the three loops share. Built once in main, passed by reference.
struct AppContext {
  AppContext(Config cfg, std::unique_ptr<DepthSource> src, std::unique_ptr<link::VehicleLink> lnk)
  : config(std::move(cfg)), source(std::move(src)), link(std::move(lnk)) {}

  const Config config;
  SharedSnapshot snapshot;
  ShutdownSignal shutdown;
  std::unique_ptr<DepthSource> source;
  std::unique_ptr<link::VehicleLink> link;

  // Signals every loop and closes the link. Safe from any thread, idempotent.
  // The source is stopped by whoever joins the frame loop, never concurrently
  // with next_frame().
  void shutdown_all()
  {
    shutdown.request();
    if (link) link->close();
  }
};

} // namespace depth2mav::app
