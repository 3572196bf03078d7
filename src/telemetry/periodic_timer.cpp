#include "depth2mav/telemetry/periodic_timer.h"

#include <stdexcept>
#include <utility>

namespace depth2mav::telemetry {

PeriodicTimer::PeriodicTimer(std::chrono::nanoseconds period, Callback callback)
: period_(period), callback_(std::move(callback))
{
  if (period_.count() <= 0) throw std::invalid_argument("PeriodicTimer: period must be positive");
  if (!callback_) throw std::invalid_argument("PeriodicTimer: empty callback");
}

PeriodicTimer::~PeriodicTimer() { stop(); }

void PeriodicTimer::start()
{
  std::lock_guard<std::mutex> lk(mutex_);
  if (thread_.joinable()) return;
  stop_requested_ = false;
  running_.store(true);
  thread_ = std::thread(&PeriodicTimer::loop, this);
}

void PeriodicTimer::stop()
{
  {
    std::lock_guard<std::mutex> lk(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_.store(false);
}

void PeriodicTimer::loop()
{
  using clock = std::chrono::steady_clock;
  const auto dt = std::chrono::duration_cast<clock::duration>(period_);

  auto next = clock::now() + dt;
  std::unique_lock<std::mutex> lk(mutex_);
  while (!stop_requested_) {
    if (cv_.wait_until(lk, next, [this] { return stop_requested_; })) break;

    lk.unlock();
    callback_();
    ticks_.fetch_add(1);
    lk.lock();

    next += dt;
    const auto now = clock::now();
    if (next <= now) {
      const auto missed = (now - next) / dt + 1;
      next += missed * dt;
      skipped_.fetch_add(uint64_t(missed));
    }
  }
}

} // namespace depth2mav::telemetry
