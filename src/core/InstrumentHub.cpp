/* @file InstrumentHub.cpp
 * @brief manages blocking SCPI line coms with the bench instruments
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <string>
#include <utility>

// rfsweep headers
#include "core/Errors.hpp"
#include "core/InstrumentHub.hpp"
#include "io/TcpChannel.hpp"

namespace rfsweep {
  namespace core {

    std::optional<Instrument> instrumentFromString(const std::string& name) {
      for (auto dev : { Instrument::Analyzer, Instrument::Generator, Instrument::Supply }) {
        if (name == toString(dev))
          return dev;
      }
      return std::nullopt;
    }

    std::string resourceName(const io::Endpoint& ep) {
      return "TCPIP::" + ep.address + "::" + std::to_string(ep.port) + "::SOCKET";
    }

    InstrumentHub::InstrumentHub(std::shared_ptr<ErrorMonitor> errMonitor, ResourceArbiter& arbiter,
                                 ChannelFactory factory)
        : errorMonitor_(std::move(errMonitor)), arbiter_(arbiter), factory_(std::move(factory)) {
      assert(errorMonitor_ && "[InstrumentHub] error monitor is nullptr");
      if (!factory_)
        factory_ = [] { return std::make_unique<io::TcpChannel>(); };
    }

    InstrumentHub::~InstrumentHub() { disconnectAll(); }

    void InstrumentHub::connect(Instrument dev, const io::Endpoint& ep) {
      disconnect(dev);

      const std::string resource = resourceName(ep);
      if (!arbiter_.claim(resource))
        throw ConfigurationError("[InstrumentHub] " + resource + " already in use, cannot attach " +
                                 toString(dev));

      auto channel = factory_();
      if (!channel->open(ep.address, ep.port)) {
        arbiter_.release(resource);
        fail(std::string("[InstrumentHub] ") + toString(dev) + " open failed: " + resource);
      }
      connections_[dev] = Connection{ std::move(channel), resource };
    }

    void InstrumentHub::attach(Instrument dev, std::unique_ptr<io::InstrumentChannel> channel) {
      disconnect(dev);
      connections_[dev] = Connection{ std::move(channel), {} };
    }

    void InstrumentHub::disconnect(Instrument dev) {
      auto it = connections_.find(dev);
      if (it == connections_.end())
        return;
      if (it->second.channel)
        it->second.channel->close();
      if (!it->second.resource.empty())
        arbiter_.release(it->second.resource);
      connections_.erase(it);
    }

    void InstrumentHub::disconnectAll() {
      for (auto dev : { Instrument::Analyzer, Instrument::Generator, Instrument::Supply })
        disconnect(dev);
    }

    bool InstrumentHub::connected(Instrument dev) const { return connections_.count(dev) != 0; }

    void InstrumentHub::sendCommand(Instrument dev, const protocols::Command& cmd) {
      auto& channel = channelFor(dev);
      if (!channel.writeLine(cmd.toWire()))
        fail("[InstrumentHub] failed to write to " + std::string(toString(dev)) + ": " +
             cmd.payload);
    }

    protocols::Response InstrumentHub::query(Instrument dev, const protocols::Command& cmd,
                                             std::chrono::milliseconds timeout) {
      sendCommand(dev, cmd);

      auto line = channelFor(dev).readLine(timeout);
      if (!line)
        fail("[InstrumentHub] no reply from " + std::string(toString(dev)) + " to " +
             cmd.payload + " within " + std::to_string(timeout.count()) + " ms");

      auto response = protocols::Response::fromWire(*line);
      if (!response)
        fail("[InstrumentHub] empty reply from " + std::string(toString(dev)) + " to " +
             cmd.payload);
      return *response;
    }

    std::string InstrumentHub::identify(Instrument dev) { return query(dev, { "*IDN?" }).text; }

    io::InstrumentChannel& InstrumentHub::channelFor(Instrument dev) {
      auto it = connections_.find(dev);
      if (it == connections_.end() || !it->second.channel)
        throw InstrumentError(std::string("[InstrumentHub] ") + toString(dev) +
                              " is not connected");
      return *it->second.channel;
    }

    void InstrumentHub::fail(const std::string& message) {
      errorMonitor_->notifyFailure(message);
      throw InstrumentError(message);
    }

  } // namespace core
} // namespace rfsweep
