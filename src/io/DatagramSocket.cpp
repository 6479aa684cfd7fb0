/* @file DatagramSocket.cpp
 * @brief IO abstraction layer that wraps a UDP socket - handles file descriptor, send, timed receive and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstring> // for strerror
#include <iostream>
#include <limits>
#include <utility>

// Linux headers
#include <arpa/inet.h> // inet_pton, inet_ntop
#include <errno.h>     // Error integer and strerror() function
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h> // close()

// huelink headers
#include "io/DatagramSocket.hpp"

using namespace huelink::io;

DatagramSocket::~DatagramSocket() { close(); }

DatagramSocket::DatagramSocket(DatagramSocket&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), last_errno_(other.last_errno_) {}

DatagramSocket& DatagramSocket::operator=(DatagramSocket&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    last_errno_ = other.last_errno_;
  }
  return *this;
}

bool DatagramSocket::open(std::uint16_t port) {
  close();

  fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    std::cerr << "[DatagramSocket] Error " << errno << " from socket: " << strerror(errno) << "\n";
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);

  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    std::cerr << "[DatagramSocket] Error " << errno << " from bind: " << strerror(errno) << "\n";
    close();
    return false;
  }
  return true;
}

bool DatagramSocket::sendTo(const std::string& host, std::uint16_t port, const std::string& payload) {
  if (fd_ < 0)
    return false;

  sockaddr_in dest{};
  dest.sin_family = AF_INET;
  dest.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &dest.sin_addr) != 1) {
    std::cerr << "[DatagramSocket] invalid IPv4 address: " << host << "\n";
    return false;
  }

  // datagrams go out whole or not at all, only EINTR is worth a retry
  for (;;) {
    ssize_t sent = ::sendto(fd_, payload.data(), payload.size(), 0,
                            reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent >= 0)
      return static_cast<std::size_t>(sent) == payload.size();
    if (errno == EINTR)
      continue;
    std::cerr << "[DatagramSocket] Error " << errno << " from sendto: " << strerror(errno) << "\n";
    return false;
  }
}

// -------------------------------------------------------------------
// DatagramSocket::receive
// Waits up to `timeout` for one datagram.
// Returns std::nullopt on timeout or error (error => lastError() != 0).
// -------------------------------------------------------------------
std::optional<Datagram> DatagramSocket::receive(std::chrono::milliseconds timeout) {
  last_errno_ = 0;
  if (fd_ < 0) {
    last_errno_ = EBADF;
    return std::nullopt;
  }

  constexpr std::chrono::milliseconds kMaxWait{ std::numeric_limits<int>::max() };
  pollfd pfd{ fd_, POLLIN, 0 };
  const auto deadline = std::chrono::steady_clock::now() + std::min(timeout, kMaxWait);

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(std::clamp(ms_left, std::chrono::milliseconds{ 0 }, kMaxWait).count());

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      last_errno_ = errno;
      std::cerr << "[DatagramSocket] poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & POLLIN) {
      char buf[kMaxDatagram];
      sockaddr_in from{};
      socklen_t fromLen = sizeof(from);
      ssize_t n = ::recvfrom(fd_, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &fromLen);
      if (n >= 0) {
        char ip[INET_ADDRSTRLEN] = { 0 };
        ::inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip));
        return Datagram{ std::string(buf, static_cast<std::size_t>(n)),
                         std::string(ip) + ":" + std::to_string(ntohs(from.sin_port)) };
      }
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
        continue; // transient → retry
      last_errno_ = errno;
      std::cerr << "[DatagramSocket] recvfrom: " << strerror(errno) << '\n';
      return std::nullopt;
    }

    if (pfd.revents & (POLLERR | POLLNVAL)) {
      // consume the pending error, otherwise the next poll wakes up on it again
      const int err = takePendingError();
      last_errno_ = err != 0 ? err : EIO;
      std::cerr << "[DatagramSocket] socket error condition: " << strerror(last_errno_) << '\n';
      return std::nullopt;
    }
  }
  return std::nullopt; // timeout
}

int DatagramSocket::takePendingError() {
  if (fd_ < 0)
    return EBADF;
  int err = 0;
  socklen_t len = sizeof(err);
  if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) != 0)
    return errno;
  return err;
}

std::uint16_t DatagramSocket::localPort() const {
  if (fd_ < 0)
    return 0;
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0)
    return 0;
  return ntohs(addr.sin_port);
}

void DatagramSocket::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
