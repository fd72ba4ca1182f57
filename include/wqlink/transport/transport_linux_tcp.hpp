#pragma once
/**
 * @file transport_linux_tcp.hpp
 * @brief Linux TCP transport (header-only, POSIX sockets; bounded connect).
 *
 * Depends on: sys/socket.h, netdb.h, poll.h, fcntl.h. STL only for std::string
 * (Linux-only path).
 */

#if !defined(__linux__)
#  error "transport_linux_tcp.hpp is Linux-only."
#endif

#include "wqlink/transport/transport_base.hpp"
#include <string>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace wqlink::transport {

class LinuxTcp : public ITransport {
public:
  /// @param send_timeout_ms upper bound for a blocking write once connected.
  explicit LinuxTcp(uint32_t send_timeout_ms = 2000)
  : send_timeout_ms_(send_timeout_ms) {}

  ~LinuxTcp() override { close(); }

  LinuxTcp(const LinuxTcp&) = delete;
  LinuxTcp& operator=(const LinuxTcp&) = delete;

  // Probe: can this process create a TCP socket at all?
  bool begin() override {
    int probe = ::socket(AF_INET, SOCK_STREAM, 0);
    if (probe < 0) return false;
    ::close(probe);
    return true;
  }

  bool open(const char* host, uint16_t port, uint32_t timeout_ms) override {
    close();
    if (!host || !*host || port == 0) return false;

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const std::string port_str = std::to_string(port);
    if (::getaddrinfo(host, port_str.c_str(), &hints, &res) != 0 || !res) return false;

    bool ok = false;
    for (addrinfo* ai = res; ai && !ok; ai = ai->ai_next) {
      ok = connect_one(ai, timeout_ms);
    }
    ::freeaddrinfo(res);
    return ok;
  }

  void close() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  // Peer liveness without consuming data: a zero-length peek means orderly close.
  bool connected() const override {
    if (fd_ < 0) return false;
    char b;
    ssize_t r = ::recv(fd_, &b, 1, MSG_PEEK | MSG_DONTWAIT);
    if (r > 0) return true;
    if (r == 0) return false;
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
  }

  std::size_t available() const override {
    if (fd_ < 0) return 0;
    int n = 0;
    if (::ioctl(fd_, FIONREAD, &n) != 0) return 0;
    return n > 0 ? static_cast<std::size_t>(n) : 0;
  }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
    out_len = 0;
    if (fd_ < 0 || !out || cap == 0) return RxResult::Error;
    ssize_t r = ::recv(fd_, out, cap, MSG_DONTWAIT);
    if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
    if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return RxResult::None;
    return RxResult::Error;  // r == 0: peer closed mid-read
  }

  TxResult send(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;
    ssize_t w = ::send(fd_, data, len, MSG_NOSIGNAL);
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return TxResult::Busy;
    return (w == static_cast<ssize_t>(len)) ? TxResult::Ok : TxResult::Error;
  }

  // TCP_NODELAY is set at connect, so there is nothing buffered on our side.
  bool flush() override { return fd_ >= 0; }

  const char* name() const override { return "linux-tcp"; }

private:
  bool connect_one(const addrinfo* ai, uint32_t timeout_ms) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) return false;

    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) { ::close(fd); return false; }

    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc != 0) {
      if (errno != EINPROGRESS) { ::close(fd); return false; }
      pollfd pfd{fd, POLLOUT, 0};
      int pr = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
      if (pr <= 0) { ::close(fd); return false; }           // timeout or poll error
      int err = 0;
      socklen_t elen = sizeof(err);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen) != 0 || err != 0) {
        ::close(fd);
        return false;
      }
    }

    // Back to blocking writes, bounded by SO_SNDTIMEO; reads stay MSG_DONTWAIT.
    if (::fcntl(fd, F_SETFL, flags) != 0) { ::close(fd); return false; }
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(send_timeout_ms_ / 1000);
    tv.tv_usec = static_cast<suseconds_t>((send_timeout_ms_ % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    fd_ = fd;
    return true;
  }

  int fd_{-1};
  uint32_t send_timeout_ms_{2000};
};

} // namespace wqlink::transport
