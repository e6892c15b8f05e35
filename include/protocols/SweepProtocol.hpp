#pragma once
/** @file  SweepProtocol.hpp
 *  @brief Sweep state-machine: packet per point -> DUT, marker readback from the analyzer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <memory>
#include <string>
#include <vector>

// rfsweep headers
#include "core/Logger.hpp"
#include "protocols/PacketBuilder.hpp"
#include "protocols/Progress.hpp"

namespace rfsweep::core { // forward decls only
  class Clock;
  class CancellationToken;
  class ErrorMonitor;
  struct RunConfig;
} // namespace rfsweep::core

namespace rfsweep::io {
  class DatagramTransport;
} // namespace rfsweep::io

namespace rfsweep::instruments {
  class Analyzer;
} // namespace rfsweep::instruments

namespace rfsweep::protocols {

  /**
 * @class SweepProtocol
 * @brief Drives one sweep run synchronously on the caller's thread.
 *
 *  * Fatal problems (no analyzer, bad offsets, bad hex, bind failure) throw
 *    before the first point and produce no `Completed` event.
 *  * A failed send or marker read only costs that point: an `Error` event is
 *    emitted and the loop moves on.
 *  * The transport session is opened per run and released exactly once when
 *    the loop scope exits, however it exits.
 *  * One run at a time per instance (and per analyzer); nothing here locks.
 */
  class SweepProtocol {
  public:
    enum class State {
      Idle,
      Configuring,
      Resetting,
      Sending,
      Dwelling,
      Holding,
      PeakSearching,
      Reading,
      Recording,
      Completed
    };

    using TransportFactory = std::function<std::unique_ptr<io::DatagramTransport>()>;

    /**
     * @param analyzer      may be null; run() then throws ConfigurationError
     * @param clock         dwell timer; null selects a SteadyClock
     * @param transports    creates the per-run session; empty selects io::UdpSession
     * @param errorMonitor  optional, receives isolated step failures
     * @param logger        optional CSV run log
     */
    SweepProtocol(std::shared_ptr<instruments::Analyzer> analyzer,
                  std::shared_ptr<core::Clock> clock = nullptr, TransportFactory transports = {},
                  std::shared_ptr<core::ErrorMonitor> errorMonitor = nullptr,
                  std::shared_ptr<core::Logger> logger = nullptr);
    ~SweepProtocol();

    /// Replace the observer (last registration wins).
    void setProgressSink(ProgressSink sink);
    void clearProgressSink();

    /// Execute the sweep and return one result per point that produced both readings.
    std::vector<MeasurementResult> run(const core::RunConfig& cfg,
                                       const core::CancellationToken* cancel = nullptr);

    State state() const { return state_; }

    SweepProtocol(const SweepProtocol&) = delete;
    SweepProtocol& operator=(const SweepProtocol&) = delete;

  private:
    PacketBuilder configure(const core::RunConfig& cfg) const;
    /// Best-effort call: whatever it throws is logged and dropped. Only for
    /// trace reset, max hold and peak search.
    void isolated(const char* what, const std::function<void()>& call);
    void emit(const ProgressEvent& event);
    void stepFailed(const core::RunConfig& cfg, int step, const std::string& hex,
                    const std::string& message);
    void transitionTo(State next);
    void log(core::LogLevel level, const std::string& message) const;

    std::shared_ptr<instruments::Analyzer> analyzer_;
    std::shared_ptr<core::Clock> clock_;
    TransportFactory transports_;
    std::shared_ptr<core::ErrorMonitor> errorMonitor_;
    std::shared_ptr<core::Logger> logger_;
    ProgressSink sink_{};
    State state_{ State::Idle };
  };

  const char* toString(SweepProtocol::State s);

} // namespace rfsweep::protocols
