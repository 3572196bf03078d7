#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

#include "depth2mav/app/command_monitor.h"
#include "depth2mav/app/context.h"
#include "depth2mav/app/frame_loop.h"
#include "depth2mav/app/loop_thread.h"
#include "depth2mav/config.h"
#include "depth2mav/ipc/depth_shm_reader.hpp"
#include "depth2mav/link/mavlink_link.h"
#include "depth2mav/link/protocol_encoder.h"
#include "depth2mav/link/transport.h"
#include "depth2mav/param.h"
#include "depth2mav/telemetry/telemetry_scheduler.h"

namespace {

std::atomic<bool> g_signal{false};

void on_signal(int) { g_signal.store(true); }

std::chrono::milliseconds to_ms(double seconds)
{
  return std::chrono::milliseconds(int64_t(seconds * 1000.0));
}

} // anon

int main(int argc, char** argv)
{
  using namespace depth2mav;

  auto vm = param::helper(argc, argv);

  std::cout << " --- depth2mav --- \n";
  std::cout << "  depth camera -> OBSTACLE_DISTANCE \n";

  try {
    Config cfg = load_config(vm);
    if (cfg.debug.enable) {
      spdlog::set_level(spdlog::level::debug);
      spdlog::debug("Debugging option enabled");
    }

    if (!cfg.telemetry.enable_obstacle_distance) {
      spdlog::info("OBSTACLE_DISTANCE disabled. Nothing to do");
      return 0;
    }

    link::MavlinkLinkCfg link_cfg;
    link_cfg.source_system = uint8_t(cfg.link.source_system);
    link_cfg.source_component = uint8_t(cfg.link.source_component);
    link_cfg.heartbeat_timeout = to_ms(cfg.link.timeout_s);
    auto vehicle = std::make_unique<link::MavlinkLink>(
        link::make_transport(cfg.link.connection, cfg.link.baudrate), link_cfg);

    ipc::ShmSourceCfg src_cfg;
    src_cfg.name = cfg.camera.shm_name;
    src_cfg.width = cfg.camera.width;
    src_cfg.height = cfg.camera.height;
    src_cfg.disconnect_timeout = to_ms(cfg.camera.disconnect_timeout_s);
    auto source = std::make_unique<ipc::ShmDepthSource>(src_cfg);

    app::AppContext ctx(std::move(cfg), std::move(source), std::move(vehicle));
    const Config& c = ctx.config;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    app::FrameLoop frame_loop(ctx);
    link::ProtocolEncoder encoder(c.geometry, c.bounds);
    telemetry::TelemetryScheduler scheduler(ctx.snapshot, *ctx.link, encoder,
                                            c.telemetry.obstacle_distance_msg_hz,
                                            c.telemetry.enable_distance_sensor);
    app::CommandMonitor commands(ctx);

    spdlog::info("Connecting to depth camera on '{}'...", c.camera.shm_name);
    ctx.source->start();

    // declared after everything they use: on any throw below they shut down
    // and join before the monitor, scheduler and context go away
    app::LoopThread frame_thread(ctx, [&] { frame_loop.run(); });

    scheduler.start();
    spdlog::info("Sending obstacle distance messages at {} Hz", c.telemetry.obstacle_distance_msg_hz);

    // connecting blocks, keep signals serviced meanwhile
    app::LoopThread link_thread(ctx, [&] {
      spdlog::info("Connecting to vehicle on {}...", c.link.connection);
      if (!ctx.link->connect(ctx.shutdown)) return;
      link::send_status(*ctx.link, "Connecting to camera...");
      link::send_status(*ctx.link, "Camera connected.");
      if (c.home.auto_set && link::set_default_home(*ctx.link, c.home.location)) {
        link::send_status(*ctx.link, "Set EKF home with default GPS location");
      }
    });

    commands.start();

    while (!ctx.shutdown.wait_for(std::chrono::milliseconds(200))) {
      if (g_signal.load()) {
        spdlog::info("Signal received, shutting down");
        ctx.shutdown_all();
      }
    }
    ctx.shutdown_all();

    scheduler.stop();
    frame_thread.join();
    link_thread.join();
    commands.join();
    ctx.source->stop();
    spdlog::info("Depth source and vehicle link closed");
  } catch (const std::exception& e) {
    spdlog::critical("{}", e.what());
    return EXIT_FAILURE;
  }
  return 0;
}
