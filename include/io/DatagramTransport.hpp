#pragma once
/** @file  DatagramTransport.hpp
 *  @brief Send-only datagram capability used by the sweep to reach the DUT.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace rfsweep {
  namespace io {

    struct Endpoint {
      std::string address;
      std::uint16_t port{ 0 };
    };

    inline std::string toString(const Endpoint& ep) {
      return ep.address + ":" + std::to_string(ep.port);
    }

    /**
 * @class DatagramTransport
 * @brief One bound socket for the lifetime of a run.
 *
 *  * Implementations release the socket in their destructor; `close()` is
 *    idempotent.
 *  * Errors are thrown as `core::TransportError`.
 */
    class DatagramTransport {
    public:
      virtual ~DatagramTransport() = default;

      virtual void bind(const Endpoint& local) = 0;

      /// @returns bytes handed to the kernel (== data.size() on success)
      virtual std::size_t send(std::span<const std::uint8_t> data, const Endpoint& destination) = 0;

      virtual void close() = 0;
    };

  } // namespace io
} // namespace rfsweep
