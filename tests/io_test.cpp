#include "core/Errors.hpp"
#include "io/FileLogger.hpp"
#include "io/TcpChannel.hpp"
#include "io/UdpSession.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using rfsweep::core::TransportError;
using rfsweep::io::Endpoint;
using rfsweep::io::FileLogger;
using rfsweep::io::TcpChannel;
using rfsweep::io::UdpSession;

namespace {
  /// Loopback socket of \p type bound to an ephemeral port.
  int loopbackSocket(int type, std::uint16_t& port) {
    int fd = ::socket(AF_INET, type, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (fd < 0 || ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
      return -1;
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
    return fd;
  }

  /// Stands in for a LAN instrument: accepts one connection.
  class LoopbackListener {
  public:
    LoopbackListener() {
      fd_ = loopbackSocket(SOCK_STREAM, port_);
      if (fd_ >= 0)
        ::listen(fd_, 1);
    }
    ~LoopbackListener() {
      if (peer_ >= 0)
        ::close(peer_);
      if (fd_ >= 0)
        ::close(fd_);
    }

    bool ok() const { return fd_ >= 0; }
    std::uint16_t port() const { return port_; }

    int accept() {
      peer_ = ::accept(fd_, nullptr, nullptr);
      return peer_;
    }

  private:
    int fd_{ -1 };
    int peer_{ -1 };
    std::uint16_t port_{ 0 };
  };
} // namespace

// ---- UdpSession ------------------------------------------------------------

TEST(udp_session, sends_datagram_to_destination) {
  std::uint16_t rxPort = 0;
  int rx = loopbackSocket(SOCK_DGRAM, rxPort);
  ASSERT_GE(rx, 0);

  UdpSession session;
  session.bind({ "127.0.0.1", 0 });
  ASSERT_TRUE(session.isOpen());
  EXPECT_NE(session.localPort(), 0);

  const std::array<std::uint8_t, 4> payload{ 0x00, 0xAB, 0x05, 0xFF };
  EXPECT_EQ(session.send(payload, { "127.0.0.1", rxPort }), payload.size());

  std::array<std::uint8_t, 64> buf{};
  sockaddr_in from{};
  socklen_t fromLen = sizeof(from);
  ssize_t n = ::recvfrom(rx, buf.data(), buf.size(), 0, reinterpret_cast<sockaddr*>(&from), &fromLen);
  ASSERT_EQ(n, 4);
  EXPECT_EQ(std::memcmp(buf.data(), payload.data(), payload.size()), 0);
  EXPECT_EQ(ntohs(from.sin_port), session.localPort());

  ::close(rx);
}

TEST(udp_session, invalid_address_is_a_transport_error) {
  UdpSession session;
  EXPECT_THROW(session.bind({ "not-an-ip", 0 }), TransportError);

  session.bind({ "127.0.0.1", 0 });
  const std::array<std::uint8_t, 1> one{ 0x01 };
  EXPECT_THROW(session.send(one, { "999.1.1.1", 5005 }), TransportError);
}

TEST(udp_session, send_after_close_throws_and_close_is_idempotent) {
  UdpSession session;
  session.bind({ "127.0.0.1", 0 });
  session.close();
  session.close();
  EXPECT_FALSE(session.isOpen());

  const std::array<std::uint8_t, 1> one{ 0x01 };
  EXPECT_THROW(session.send(one, { "127.0.0.1", 5005 }), TransportError);
}

TEST(udp_session, move_transfers_the_socket) {
  UdpSession a;
  a.bind({ "127.0.0.1", 0 });
  const auto port = a.localPort();

  UdpSession b(std::move(a));
  EXPECT_FALSE(a.isOpen());
  EXPECT_TRUE(b.isOpen());
  EXPECT_EQ(b.localPort(), port);
}

// ---- TcpChannel ------------------------------------------------------------

TEST(tcp_channel, opens_writes_reads_closes) {
  LoopbackListener instrument;
  ASSERT_TRUE(instrument.ok());

  TcpChannel chan;
  ASSERT_TRUE(chan.open("127.0.0.1", instrument.port()));
  int peer = instrument.accept();
  ASSERT_GE(peer, 0);

  // reply side of the "instrument"
  const char* msg = "+3.10000000E+09\r\n-42.5\n";
  ASSERT_EQ(::write(peer, msg, std::strlen(msg)), static_cast<ssize_t>(std::strlen(msg)));

  auto first = chan.readLine(std::chrono::milliseconds{ 500 });
  ASSERT_TRUE(first);
  EXPECT_EQ(*first, "+3.10000000E+09");
  auto second = chan.readLine(std::chrono::milliseconds{ 500 });
  ASSERT_TRUE(second);
  EXPECT_EQ(*second, "-42.5");

  ASSERT_TRUE(chan.writeLine(":CALC:MARK:X?"));
  char buf[32] = { 0 };
  ASSERT_GT(::read(peer, buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, ":CALC:MARK:X?\n");

  chan.close();
  EXPECT_FALSE(chan.writeLine("*IDN?"));
}

TEST(tcp_channel, read_times_out_on_partial_line) {
  LoopbackListener instrument;
  ASSERT_TRUE(instrument.ok());

  TcpChannel chan;
  ASSERT_TRUE(chan.open("127.0.0.1", instrument.port()));
  int peer = instrument.accept();
  ASSERT_GE(peer, 0);

  ASSERT_EQ(::write(peer, "1", 1), 1);
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 50 }));

  ASSERT_EQ(::write(peer, "\n", 1), 1);
  auto line = chan.readLine(std::chrono::milliseconds{ 500 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "1");
}

TEST(tcp_channel, refused_connection_fails_open) {
  std::uint16_t port = 0;
  int fd = loopbackSocket(SOCK_STREAM, port); // bound, never listening
  ASSERT_GE(fd, 0);

  TcpChannel chan;
  EXPECT_FALSE(chan.open("127.0.0.1", port));
  ::close(fd);
}

// ---- FileLogger ------------------------------------------------------------

TEST(file_logger, buffers_until_flush) {
  const auto path =
      (std::filesystem::temp_directory_path() / ("rfsweep_file_logger_" + std::to_string(::getpid())))
          .string();

  {
    FileLogger log;
    ASSERT_TRUE(log.open(path));
    EXPECT_EQ(log.path(), path);
    log.write("a,b\n");
    log.write("c,d\n");
    ASSERT_TRUE(log.flush());

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "a,b\nc,d\n");

    log.write(std::string(FileLogger::kChunkSize, 'x'));
  }

  EXPECT_EQ(std::filesystem::file_size(path), 8u + FileLogger::kChunkSize);
  std::filesystem::remove(path);
}

TEST(file_logger, unopenable_path) {
  FileLogger log;
  EXPECT_FALSE(log.open("/nonexistent-dir/rfsweep/run.csv"));
  EXPECT_FALSE(log.isOpen());
  EXPECT_FALSE(log.flush());
}
