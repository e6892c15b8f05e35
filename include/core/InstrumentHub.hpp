#pragma once
/** @file  InstrumentHub.hpp
 *  @brief Owns one command channel per bench instrument.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

// rfsweep headers
#include "core/ErrorMonitor.hpp"    // InstrumentHub is a client to the error monitor
#include "core/ResourceArbiter.hpp" // claims resources before opening them
#include "io/DatagramTransport.hpp" // io::Endpoint
#include "io/InstrumentChannel.hpp" // owns channels and requires full type knowledge
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace rfsweep {
  namespace core {

    enum class Instrument : std::uint8_t { Analyzer, Generator, Supply, Count };
    static_assert(static_cast<std::uint8_t>(Instrument::Count) == 3,
                  "Instrument count changed please update code that depends on it");
    inline const char* toString(Instrument d) {
      switch (d) {
      case Instrument::Analyzer:
        return "analyzer";
      case Instrument::Generator:
        return "generator";
      case Instrument::Supply:
        return "supply";
      default:
        return "unknown";
      }
    }

    /// Inverse of toString(); std::nullopt for unknown names.
    std::optional<Instrument> instrumentFromString(const std::string& name);

    /// VISA-style resource string used for arbitration, e.g. "TCPIP::10.0.0.7::5025::SOCKET".
    std::string resourceName(const io::Endpoint& ep);

    class InstrumentHub {
    public:
      using ChannelFactory = std::function<std::unique_ptr<io::InstrumentChannel>()>;

      static constexpr std::chrono::milliseconds kDefaultTimeout{ 5000 };

      /// \p arbiter must outlive the hub.
      InstrumentHub(std::shared_ptr<ErrorMonitor> errMonitor, ResourceArbiter& arbiter,
                    ChannelFactory factory = {});
      ~InstrumentHub(); ///< releases every claimed resource

      //---public APIs------------------------------------------------------
      /// Claim + open. @throws ConfigurationError if claimed elsewhere, InstrumentError if open fails.
      void connect(Instrument dev, const io::Endpoint& ep);

      /// Take ownership of an already-open channel (no arbitration).
      void attach(Instrument dev, std::unique_ptr<io::InstrumentChannel> channel);

      void disconnect(Instrument dev);
      void disconnectAll();
      bool connected(Instrument dev) const;

      void sendCommand(Instrument dev, const protocols::Command& cmd);
      protocols::Response query(Instrument dev, const protocols::Command& cmd,
                                std::chrono::milliseconds timeout = kDefaultTimeout);

      /// `*IDN?` reply, e.g. "Keysight Technologies,N9030B,MY1234,A.33.03".
      std::string identify(Instrument dev);

      InstrumentHub(const InstrumentHub&) = delete;
      InstrumentHub& operator=(const InstrumentHub&) = delete;

    private:
      struct Connection {
        std::unique_ptr<io::InstrumentChannel> channel;
        std::string resource; ///< empty when attached directly
      };

      io::InstrumentChannel& channelFor(Instrument dev);
      [[noreturn]] void fail(const std::string& message);

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      ResourceArbiter& arbiter_;
      ChannelFactory factory_;
      std::unordered_map<Instrument, Connection> connections_;
    };

  } // namespace core
} // namespace rfsweep
