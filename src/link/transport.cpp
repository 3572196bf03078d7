#include "depth2mav/link/transport.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

namespace depth2mav::link {

namespace {

std::optional<speed_t> baud_to_speed(int baud)
{
  switch (baud) {
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    case 460800: return B460800;
    case 500000: return B500000;
    case 921600: return B921600;
    case 1000000: return B1000000;
    case 1500000: return B1500000;
    default: return std::nullopt;
  }
}

long poll_read(int fd, uint8_t* buf, size_t len, std::chrono::milliseconds timeout)
{
  pollfd pfd{fd, POLLIN, 0};
  const int rv = ::poll(&pfd, 1, int(timeout.count()));
  if (rv == 0) return 0;
  if (rv < 0) return (errno == EINTR) ? 0 : -1;
  if (pfd.revents & (POLLERR | POLLNVAL)) return -1;
  return long(::read(fd, buf, len));
}

std::optional<sockaddr_in> resolve(const std::string& host, int port)
{
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  addrinfo* res = nullptr;
  if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) return std::nullopt;

  sockaddr_in addr{};
  std::memcpy(&addr, res->ai_addr, sizeof(addr));
  addr.sin_port = htons(uint16_t(port));
  ::freeaddrinfo(res);
  return addr;
}

} // anon

// ---------------- SerialTransport ----------------
SerialTransport::SerialTransport(std::string path, int baud)
: path_(std::move(path)), baud_(baud) {}

SerialTransport::~SerialTransport() { close(); }

bool SerialTransport::open()
{
  if (fd_ >= 0) return true;

  const auto speed = baud_to_speed(baud_);
  if (!speed) {
    spdlog::error("Unsupported baud rate {}", baud_);
    return false;
  }

  fd_ = ::open(path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    spdlog::error("open {}: {}", path_, std::strerror(errno));
    return false;
  }

  termios tio{};
  if (tcgetattr(fd_, &tio) != 0) {
    spdlog::error("tcgetattr {}: {}", path_, std::strerror(errno));
    close();
    return false;
  }
  cfmakeraw(&tio);
  cfsetspeed(&tio, *speed);
  tio.c_cflag |= CLOCAL | CREAD;   // ignore modem lines
  tio.c_cflag &= ~CSTOPB;          // 1 stop bit
  tio.c_cflag &= ~CRTSCTS;         // no hardware flow control
  tio.c_cflag &= ~CSIZE;
  tio.c_cflag |= CS8;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  if (tcsetattr(fd_, TCSANOW, &tio) != 0) {
    spdlog::error("tcsetattr {}: {}", path_, std::strerror(errno));
    close();
    return false;
  }
  tcflush(fd_, TCIOFLUSH);
  return true;
}

void SerialTransport::close()
{
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool SerialTransport::write(const uint8_t* data, size_t len)
{
  if (fd_ < 0) return false;
  size_t sent = 0;
  while (sent < len) {
    const ssize_t n = ::write(fd_, data + sent, len - sent);
    if (n > 0) {
      sent += size_t(n);
      continue;
    }
    if (n < 0 && errno != EAGAIN && errno != EINTR) return false;
    // output buffer full: wait until the line drains a little
    pollfd pfd{fd_, POLLOUT, 0};
    if (::poll(&pfd, 1, 100) <= 0) return false;
  }
  return true;
}

long SerialTransport::read(uint8_t* buf, size_t len, std::chrono::milliseconds timeout)
{
  if (fd_ < 0) return -1;
  return poll_read(fd_, buf, len, timeout);
}

std::string SerialTransport::describe() const
{
  return path_ + " @ " + std::to_string(baud_);
}

// ---------------- UdpTransport ----------------
UdpTransport::UdpTransport(std::string host, int port, bool listen)
: host_(std::move(host)), port_(port), listen_(listen) {}

UdpTransport::~UdpTransport() { close(); }

bool UdpTransport::open()
{
  if (fd_ >= 0) return true;

  const auto addr = resolve(host_, port_);
  if (!addr) {
    spdlog::error("Cannot resolve {}", host_);
    return false;
  }

  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    spdlog::error("socket: {}", std::strerror(errno));
    return false;
  }

  if (listen_) {
    const int reuse = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    if (::bind(fd_, reinterpret_cast<const sockaddr*>(&*addr), sizeof(*addr)) < 0) {
      spdlog::error("bind {}:{}: {}", host_, port_, std::strerror(errno));
      close();
      return false;
    }
    have_peer_ = false;
  } else {
    peer_ = *addr;
    have_peer_ = true;
  }
  return true;
}

void UdpTransport::close()
{
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool UdpTransport::write(const uint8_t* data, size_t len)
{
  if (fd_ < 0 || !have_peer_) return false;
  const ssize_t n = ::sendto(fd_, data, len, 0, reinterpret_cast<const sockaddr*>(&peer_), sizeof(peer_));
  return n == ssize_t(len);
}

long UdpTransport::read(uint8_t* buf, size_t len, std::chrono::milliseconds timeout)
{
  if (fd_ < 0) return -1;
  pollfd pfd{fd_, POLLIN, 0};
  const int rv = ::poll(&pfd, 1, int(timeout.count()));
  if (rv == 0) return 0;
  if (rv < 0) return (errno == EINTR) ? 0 : -1;

  sockaddr_in from{};
  socklen_t from_len = sizeof(from);
  const ssize_t n = ::recvfrom(fd_, buf, len, 0, reinterpret_cast<sockaddr*>(&from), &from_len);
  if (n > 0 && listen_) {
    peer_ = from;
    have_peer_ = true;
  }
  return long(n);
}

std::string UdpTransport::describe() const
{
  return std::string(listen_ ? "udp:" : "udpout:") + host_ + ":" + std::to_string(port_);
}

// ---------------- make_transport ----------------
std::unique_ptr<Transport> make_transport(const std::string& connection, int baud)
{
  const bool udp_in = connection.rfind("udp:", 0) == 0 || connection.rfind("udpin:", 0) == 0;
  const bool udp_out = connection.rfind("udpout:", 0) == 0;

  if (udp_in || udp_out) {
    const auto first = connection.find(':');
    const auto last = connection.rfind(':');
    if (first == last) throw LinkError("expected <scheme>:<host>:<port>, got '" + connection + "'");

    const std::string host = connection.substr(first + 1, last - first - 1);
    int port = 0;
    try {
      port = std::stoi(connection.substr(last + 1));
    } catch (const std::exception&) {
      throw LinkError("bad port in '" + connection + "'");
    }
    if (host.empty() || port <= 0 || port > 65535) throw LinkError("bad address in '" + connection + "'");
    return std::make_unique<UdpTransport>(host, port, udp_in);
  }

  if (connection.rfind("tcp:", 0) == 0) throw LinkError("tcp connections are not supported: '" + connection + "'");
  if (!baud_to_speed(baud)) throw LinkError("unsupported baud rate " + std::to_string(baud));
  return std::make_unique<SerialTransport>(connection, baud);
}

} // namespace depth2mav::link
