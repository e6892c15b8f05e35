#pragma once
/** @file  TcpChannel.hpp
 *  @brief Raw-socket SCPI line I/O (LAN instruments, port 5025 by default).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "io/InstrumentChannel.hpp"

namespace rfsweep {
  namespace io {

    /**
 * @class TcpChannel
 * @brief RAII wrapper around a connected TCP socket.
 *
 *  * Frames I/O as ASCII lines terminated by `\n` (a trailing `\r` is
 *    stripped on read).
 *  * *Non-copyable*, but move-constructible.
 */
    class TcpChannel : public InstrumentChannel {

    public:
      static constexpr std::uint16_t kScpiRawPort = 5025;
      static constexpr std::chrono::milliseconds kConnectTimeout{ 3000 };

      //---ctr / dtr--------------------------------------------
      TcpChannel() = default;
      ~TcpChannel() override; // close the socket at destruction

      //---public API-------------------------------------------
      bool open(const std::string& host, std::uint16_t port) override;
      bool writeLine(const std::string& line) override;
      std::optional<std::string> readLine(std::chrono::milliseconds timeout) override;
      void close() override;

      //---mv and mv assign-------------------------------------
      TcpChannel(TcpChannel&& other) noexcept;
      TcpChannel& operator=(TcpChannel&& other) noexcept;

    private:
      std::optional<std::string> takeLine();

      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string rx_buffer_{}; ///< buffer to store readLine content
    };

  } // namespace io
} // namespace rfsweep
