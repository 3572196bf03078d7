#include "depth2mav/telemetry/telemetry_scheduler.h"

#include <chrono>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace depth2mav::telemetry {

TelemetryScheduler::TelemetryScheduler(const SharedSnapshot& snapshot, link::VehicleLink& link,
                                       const link::ProtocolEncoder& encoder, double rate_hz,
                                       bool send_single_point)
: snapshot_(snapshot), link_(link), encoder_(encoder), send_single_point_(send_single_point)
{
  if (!(rate_hz > 0.0)) throw std::invalid_argument("TelemetryScheduler: rate must be positive");

  const auto period = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(1.0 / rate_hz));
  timer_ = std::make_unique<PeriodicTimer>(period, [this] {
    try {
      tick();
    } catch (const std::exception& e) {
      spdlog::error("Telemetry tick failed: {}", e.what());
    }
  });
}

TelemetryScheduler::~TelemetryScheduler() { stop(); }

void TelemetryScheduler::start() { timer_->start(); }

void TelemetryScheduler::stop() { timer_->stop(); }

bool TelemetryScheduler::running() const { return timer_->running(); }

bool TelemetryScheduler::tick()
{
  if (!link_.connected()) return false;

  const auto snap = snapshot_.read();
  if (!snap) return false;

  if (snap->seq == last_seq_) {
    spdlog::debug("Resending obstacle map #{} (no new frame)", snap->seq);
  }
  last_seq_ = snap->seq;

  bool ok = link_.send(encoder_.sector_report(*snap));
  if (send_single_point_) {
    ok = link_.send(encoder_.single_point_report(*snap)) && ok;
  }
  if (!ok) {
    send_failures_.fetch_add(1);
    return false;
  }
  emitted_.fetch_add(1);
  return true;
}

} // namespace depth2mav::telemetry
