/* @file UdpSession.cpp
 * @brief bound UDP socket for the measurement packets - send only, no replies read
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <iostream>
#include <string>
#include <utility>

// Linux headers
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

// rfsweep headers
#include "core/Errors.hpp"
#include "io/UdpSession.hpp"

using namespace rfsweep::io;
using rfsweep::core::TransportError;

namespace {
  sockaddr_in toSockaddr(const Endpoint& ep) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(ep.port);
    if (inet_pton(AF_INET, ep.address.c_str(), &addr.sin_addr) != 1)
      throw TransportError("invalid IPv4 address: " + ep.address);
    return addr;
  }

  [[noreturn]] void fail(const char* call, const std::string& context) {
    const int err = errno;
    std::cerr << "Error " << err << " from " << call << ": " << strerror(err) << "\n";
    throw TransportError(std::string(call) + ": " + strerror(err) + context);
  }
} // namespace

UdpSession::~UdpSession() { close(); }

UdpSession::UdpSession(UdpSession&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

UdpSession& UdpSession::operator=(UdpSession&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

void UdpSession::bind(const Endpoint& local) {
  close();

  const sockaddr_in addr = toSockaddr(local);

  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0)
    fail("socket", "");

  int enable = 1;
  ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

  if (::bind(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    const int err = errno;
    close();
    errno = err;
    fail("bind", " (" + toString(local) + ")");
  }
}

std::size_t UdpSession::send(std::span<const std::uint8_t> data, const Endpoint& destination) {
  if (fd_ < 0)
    throw TransportError("send on closed UDP session");

  const sockaddr_in dst = toSockaddr(destination);

  for (;;) {
    ssize_t n = ::sendto(fd_, data.data(), data.size(), 0, reinterpret_cast<const sockaddr*>(&dst),
                         sizeof(dst));
    if (n >= 0) {
      if (static_cast<std::size_t>(n) != data.size())
        throw TransportError("short datagram: " + std::to_string(n) + " of " +
                             std::to_string(data.size()) + " bytes");
      return static_cast<std::size_t>(n);
    }
    if (errno == EINTR)
      continue; // try again
    fail("sendto", " (" + toString(destination) + ")");
  }
}

void UdpSession::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

std::uint16_t UdpSession::localPort() const {
  if (fd_ < 0)
    return 0;
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0)
    return 0;
  return ntohs(addr.sin_port);
}
