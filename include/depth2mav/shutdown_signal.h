#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace depth2mav {

// One-shot stop flag shared by every loop. request() is idempotent and may be
// called from any thread; waiters wake immediately.
class ShutdownSignal {
public:
  void request()
  {
    {
      std::lock_guard<std::mutex> lk(mutex_);
      requested_.store(true);
    }
    cv_.notify_all();
  }

  bool requested() const { return requested_.load(); }

  // true if shutdown was requested before the timeout elapsed
  template <class Rep, class Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const
  {
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this] { return requested_.load(); });
  }

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool> requested_{false};
};

} // namespace depth2mav
