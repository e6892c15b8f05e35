#pragma once
/** @file  UdpSession.hpp
 *  @brief POSIX UDP socket implementing DatagramTransport.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "io/DatagramTransport.hpp"

namespace rfsweep {
  namespace io {

    /**
 * @class UdpSession
 * @brief RAII wrapper around an AF_INET/SOCK_DGRAM file descriptor.
 *
 *  * *Non-copyable*, but move-constructible.
 */
    class UdpSession : public DatagramTransport {
    public:
      UdpSession() = default;
      ~UdpSession() override; // close the socket at destruction

      void bind(const Endpoint& local) override;
      std::size_t send(std::span<const std::uint8_t> data, const Endpoint& destination) override;
      void close() override;

      /// Port actually bound (useful after binding port 0).
      std::uint16_t localPort() const;
      bool isOpen() const { return fd_ >= 0; }

      //---non-copyable-----------------------------------------
      UdpSession(const UdpSession&) = delete;
      UdpSession& operator=(const UdpSession&) = delete;

      //---mv and mv assign-------------------------------------
      UdpSession(UdpSession&& other) noexcept;
      UdpSession& operator=(UdpSession&& other) noexcept;

    private:
      int fd_{ -1 }; ///< POSIX socket (-1==closed)
    };

  } // namespace io
} // namespace rfsweep
