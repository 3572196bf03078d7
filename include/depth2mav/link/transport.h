#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include <netinet/in.h>

namespace depth2mav::link {

class LinkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Byte pipe to the flight controller. Not thread-safe; MavlinkLink serializes access.
class Transport {
public:
  virtual ~Transport() = default;

  virtual bool open() = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual bool write(const uint8_t* data, size_t len) = 0;
  // bytes read, 0 on timeout, -1 on error
  virtual long read(uint8_t* buf, size_t len, std::chrono::milliseconds timeout) = 0;

  virtual std::string describe() const = 0;
};

// Raw 8N1 serial device.
class SerialTransport : public Transport {
public:
  SerialTransport(std::string path, int baud);
  ~SerialTransport() override;

  SerialTransport(const SerialTransport&) = delete;
  SerialTransport& operator=(const SerialTransport&) = delete;

  bool open() override;
  void close() override;
  bool is_open() const override { return fd_ >= 0; }
  bool write(const uint8_t* data, size_t len) override;
  long read(uint8_t* buf, size_t len, std::chrono::milliseconds timeout) override;
  std::string describe() const override;

private:
  std::string path_;
  int baud_;
  int fd_ = -1;
};

// "udpout:host:port" sends to a fixed peer; "udp:host:port" binds locally and
// answers whoever talked to it last.
class UdpTransport : public Transport {
public:
  UdpTransport(std::string host, int port, bool listen);
  ~UdpTransport() override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  bool open() override;
  void close() override;
  bool is_open() const override { return fd_ >= 0; }
  bool write(const uint8_t* data, size_t len) override;
  long read(uint8_t* buf, size_t len, std::chrono::milliseconds timeout) override;
  std::string describe() const override;

private:
  std::string host_;
  int port_;
  bool listen_;
  int fd_ = -1;
  sockaddr_in peer_{};
  bool have_peer_ = false;
};

// Picks the transport from a connection string; throws LinkError on a malformed one.
std::unique_ptr<Transport> make_transport(const std::string& connection, int baud);

} // namespace depth2mav::link
