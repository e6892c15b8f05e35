#pragma once
/** @file  FakeTransport.hpp
 *  @brief DatagramTransport that records packets instead of touching a socket.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <memory>
#include <set>
#include <utility>
#include <vector>

#include "core/Errors.hpp"
#include "io/DatagramTransport.hpp"
#include "protocols/PacketBuilder.hpp"

namespace rfsweep {
  namespace test {

    /// Shared between the test and every session the factory hands out.
    struct TransportLog {
      int created = 0;
      int closes = 0;
      bool failBind = false;
      std::set<int> failSends; ///< 1-based send attempt numbers that throw
      int sendAttempts = 0;
      io::Endpoint boundTo{};
      std::vector<protocols::Payload> sent;
      std::vector<io::Endpoint> destinations;
    };

    class FakeTransport : public rfsweep::io::DatagramTransport {
    public:
      explicit FakeTransport(std::shared_ptr<TransportLog> log) : log_(std::move(log)) {
        ++log_->created;
      }

      void bind(const io::Endpoint& local) override {
        if (log_->failBind)
          throw core::TransportError("bind: Address already in use");
        log_->boundTo = local;
      }

      std::size_t send(std::span<const std::uint8_t> data, const io::Endpoint& dst) override {
        if (log_->failSends.count(++log_->sendAttempts))
          throw core::TransportError("sendto: Network is unreachable");
        protocols::Payload p{};
        std::copy(data.begin(), data.end(), p.begin());
        log_->sent.push_back(p);
        log_->destinations.push_back(dst);
        return data.size();
      }

      void close() override { ++log_->closes; }

    private:
      std::shared_ptr<TransportLog> log_;
    };

  } // namespace test
} // namespace rfsweep
