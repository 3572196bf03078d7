#pragma once

#include <thread>
#include <utility>

#include "depth2mav/app/context.h"

namespace depth2mav::app {

// A thread running one of the application loops. Leaving scope, also by an
// exception, raises the coordinated shutdown and joins, so no joinable
// std::thread is ever destroyed.
class LoopThread {
public:
  template <class Body>
  LoopThread(AppContext& ctx, Body&& body)
  : ctx_(ctx), thread_(std::forward<Body>(body)) {}

  ~LoopThread() { join(); }

  LoopThread(const LoopThread&) = delete;
  LoopThread& operator=(const LoopThread&) = delete;

  // Requests shutdown first; the loops only return once it is raised.
  void join()
  {
    if (!thread_.joinable()) return;
    ctx_.shutdown_all();
    thread_.join();
  }

private:
  AppContext& ctx_;
  std::thread thread_;
};

} // namespace depth2mav::app
