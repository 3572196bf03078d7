#include "depth2mav/app/command_monitor.h"

#include <poll.h>
#include <termios.h>

#include <cerrno>

#include <spdlog/spdlog.h>

namespace depth2mav::app {

namespace {
constexpr int kPollMs = 100;
} // anon

CommandMonitor::CommandMonitor(AppContext& ctx, int fd)
: ctx_(ctx), fd_(fd) {}

CommandMonitor::~CommandMonitor() { join(); }

void CommandMonitor::start()
{
  if (thread_.joinable()) return;
  thread_ = std::thread([this] { loop(); });
}

void CommandMonitor::join()
{
  if (thread_.joinable()) thread_.join();
}

bool CommandMonitor::handle(char c)
{
  switch (c) {
    case '\n':
    case '\r':
      if (link::set_default_home(*ctx_.link, ctx_.config.home.location)) {
        link::send_status(*ctx_.link, "Set EKF home with default GPS location");
      } else {
        spdlog::warn("[KEYS] Vehicle not connected, EKF home not set");
      }
      return true;
    case 'q':
      spdlog::info("[KEYS] Quit requested");
      ctx_.shutdown_all();
      return false;
    default:
      return true;
  }
}

void CommandMonitor::loop()
{
  // raw keys when attached to a terminal, as-is for pipes
  termios oldt{};
  const bool tty = isatty(fd_) && tcgetattr(fd_, &oldt) == 0;
  if (tty) {
    termios newt = oldt;
    newt.c_lflag &= ~(ICANON | ECHO);
    tcsetattr(fd_, TCSANOW, &newt);
  }

  spdlog::info("[KEYS] Enter: set EKF home, q: quit");
  while (!ctx_.shutdown.requested()) {
    pollfd pfd{fd_, POLLIN, 0};
    const int r = poll(&pfd, 1, kPollMs);
    if (r < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("[KEYS] poll failed, command input disabled");
      break;
    }
    if (r == 0) continue;

    char c = 0;
    const ssize_t n = read(fd_, &c, 1);
    if (n <= 0) break;   // EOF: no more commands, keep running
    if (!handle(c)) break;
  }

  if (tty) tcsetattr(fd_, TCSANOW, &oldt);
}

} // namespace depth2mav::app
