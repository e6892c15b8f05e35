/* @file TcpChannel.cpp
 * @brief IO abstraction layer that wraps a SCPI raw socket - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <fcntl.h> // O_NONBLOCK
#include <netdb.h> // getaddrinfo
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h> // write(), read(), close()

// rfsweep headers
#include "io/TcpChannel.hpp"

using namespace rfsweep::io;

namespace {
  bool waitWritable(int fd, std::chrono::milliseconds timeout) {
    pollfd pfd{ fd, POLLOUT, 0 };
    for (;;) {
      int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
      if (rc == -1 && errno == EINTR)
        continue;
      if (rc <= 0)
        return false;
      int soErr = 0;
      socklen_t len = sizeof(soErr);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &len) != 0 || soErr != 0) {
        errno = soErr;
        return false;
      }
      return true;
    }
  }
} // namespace

TcpChannel::~TcpChannel() { close(); }

TcpChannel::TcpChannel(TcpChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)) {}

TcpChannel& TcpChannel::operator=(TcpChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool TcpChannel::open(const std::string& host, std::uint16_t port) {
  close();

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  if (int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res); rc != 0) {
    std::cerr << "Error from getaddrinfo(" << host << "): " << gai_strerror(rc) << "\n";
    return false;
  }

  for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    // open non-blocking so connect() honours kConnectTimeout
    fd_ = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd_ < 0)
      continue;

    if (::connect(fd_, ai->ai_addr, ai->ai_addrlen) == 0 ||
        (errno == EINPROGRESS && waitWritable(fd_, kConnectTimeout))) {
      int one = 1;
      ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      ::freeaddrinfo(res);
      return true;
    }
    std::cerr << "Error " << errno << " from connect: " << strerror(errno) << "\n";
    close();
  }

  ::freeaddrinfo(res);
  return false;
}

bool TcpChannel::writeLine(const std::string& line) {

  if (fd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\n")) {
    out += "\n";
  }

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::send(fd_, out.data() + total, out.size() - total, MSG_NOSIGNAL);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (!waitWritable(fd_, kConnectTimeout)) {
        std::cerr << "Error: send timed out\n";
        return false;
      }
    } else {
      std::cerr << "Error: " << errno << " from send: " << strerror(errno) << "\n";
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// TcpChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> TcpChannel::readLine(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  // a previous read may already hold the next line
  if (auto line = takeLine())
    return line;

  char temp[512];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(ms_left.count());

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP)) {
      ssize_t n = ::recv(fd_, temp, sizeof(temp), 0);
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // peer closed
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "recv: " << strerror(errno) << '\n';
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    }
  }
  return std::nullopt; // timeout/partial
}

std::optional<std::string> TcpChannel::takeLine() {
  auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return std::nullopt;
  std::string line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return line;
}

void TcpChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
  rx_buffer_.clear();
}
