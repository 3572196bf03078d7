#pragma once

#include <thread>

#include <unistd.h>

#include "depth2mav/app/context.h"

namespace depth2mav::app {

// Keyboard commands from the terminal: Enter sets the EKF home, 'q' quits.
// Runs on its own thread and never reads the obstacle map.
class CommandMonitor {
public:
  explicit CommandMonitor(AppContext& ctx, int fd = STDIN_FILENO);
  ~CommandMonitor();

  CommandMonitor(const CommandMonitor&) = delete;
  CommandMonitor& operator=(const CommandMonitor&) = delete;

  void start();
  // Joins the thread; returns within one poll interval of shutdown.
  void join();

  // Acts on one key. Returns false for keys that end the monitor.
  bool handle(char c);

private:
  void loop();

  AppContext& ctx_;
  int fd_;
  std::thread thread_;
};

} // namespace depth2mav::app
