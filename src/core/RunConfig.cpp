/* @file RunConfig.cpp
 * @brief JSON schema layer for the run configuration
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// rfsweep headers
#include "core/Errors.hpp"
#include "core/RunConfig.hpp"

namespace rfsweep {
  namespace core {

    namespace {
      using nlohmann::json;

      template <typename T> void read(const json& j, const char* key, T& out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
          return;
        try {
          out = it->get<T>();
        } catch (const json::exception& e) {
          throw ConfigurationError(std::string("config key '") + key + "': " + e.what());
        }
      }

      void readMs(const json& j, const char* key, std::chrono::milliseconds& out) {
        long long ms = out.count();
        read(j, key, ms);
        if (ms < 0)
          throw ConfigurationError(std::string("config key '") + key + "' must not be negative");
        out = std::chrono::milliseconds{ ms };
      }

      const json* section(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
          return nullptr;
        if (!it->is_object())
          throw ConfigurationError(std::string("config section '") + key + "' must be an object");
        return &*it;
      }

      void readEndpoint(const json& j, const char* hostKey, const char* portKey, io::Endpoint& ep) {
        read(j, hostKey, ep.address);
        int port = ep.port;
        read(j, portKey, port);
        if (port < 0 || port > 0xFFFF)
          throw ConfigurationError(std::string("config key '") + portKey + "' out of range: " +
                                   std::to_string(port));
        ep.port = static_cast<std::uint16_t>(port);
      }
    } // namespace

    RunConfig RunConfig::fromJson(const nlohmann::json& j) {
      if (!j.is_object())
        throw ConfigurationError("run configuration must be a JSON object");

      RunConfig cfg;
      read(j, "board_no", cfg.boardNo);
      read(j, "channel_no", cfg.channelNo);
      read(j, "pulse_width", cfg.pulseWidth);
      read(j, "prt", cfg.prt);
      read(j, "pulse_offsets", cfg.pulseOffsets);
      read(j, "prt_offsets", cfg.prtOffsets);
      read(j, "sweep_offset", cfg.sweepOffset);
      read(j, "declared_total", cfg.declaredTotal);
      read(j, "log_path", cfg.logPath);

      if (const json* s = section(j, "sweep")) {
        read(*s, "start", cfg.sweep.start);
        read(*s, "stop", cfg.sweep.stop);
        read(*s, "step", cfg.sweep.step);
      }

      if (const json* udp = section(j, "udp")) {
        readEndpoint(*udp, "src_ip", "src_port", cfg.udpSource);
        readEndpoint(*udp, "dst_ip", "dst_port", cfg.udpDestination);
      }

      if (const json* a = section(j, "analyzer")) {
        read(*a, "center_hz", cfg.analyzer.centerHz);
        read(*a, "span_hz", cfg.analyzer.spanHz);
        read(*a, "rbw_hz", cfg.analyzer.rbwHz);
      }

      if (const json* d = section(j, "dwell_ms")) {
        readMs(*d, "settle", cfg.dwell.settle);
        readMs(*d, "after_send", cfg.dwell.afterSend);
        readMs(*d, "max_hold", cfg.dwell.maxHold);
        readMs(*d, "peak_search", cfg.dwell.peakSearch);
      }

      if (const json* inst = section(j, "instruments")) {
        for (const auto& [name, entry] : inst->items()) {
          if (!entry.is_object())
            throw ConfigurationError("instrument '" + name + "' must be an object");
          io::Endpoint ep{ "", 5025 };
          readEndpoint(entry, "host", "port", ep);
          if (ep.address.empty())
            throw ConfigurationError("instrument '" + name + "' has no host");
          cfg.instruments[name] = ep;
        }
      }

      return cfg;
    }

  } // namespace core
} // namespace rfsweep
