#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace depth2mav::telemetry {

// Calls `callback` every `period` on its own thread.
//
// Deadlines advance by exactly one period from the previous deadline, so a
// slow callback does not stretch the average rate. When a callback overruns
// whole periods the missed deadlines are dropped instead of fired back to back.
class PeriodicTimer {
public:
  using Callback = std::function<void()>;

  PeriodicTimer(std::chrono::nanoseconds period, Callback callback);
  ~PeriodicTimer();

  PeriodicTimer(const PeriodicTimer&) = delete;
  PeriodicTimer& operator=(const PeriodicTimer&) = delete;

  void start();
  // Wakes a sleeping timer at once and joins it. Idempotent; must not be
  // called from inside the callback.
  void stop();

  bool running() const { return running_.load(); }
  uint64_t ticks() const { return ticks_.load(); }
  uint64_t skipped() const { return skipped_.load(); }
  std::chrono::nanoseconds period() const { return period_; }

private:
  void loop();

  std::chrono::nanoseconds period_;
  Callback callback_;

  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> ticks_{0};
  std::atomic<uint64_t> skipped_{0};
};

} // namespace depth2mav::telemetry
