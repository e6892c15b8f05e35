#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for rfsweep::core::SystemCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/Clock.hpp"
#include "core/ResourceArbiter.hpp"
#include "core/RunConfig.hpp"
#include "protocols/Progress.hpp"

namespace rfsweep {
  namespace core {

    class ErrorMonitor;
    class InstrumentHub;
    class Logger;

    class SystemCoordinator {

    public:
      enum class State { Boot, Init, Idle, Running, Finished, Error };

      SystemCoordinator();
      ~SystemCoordinator();

      // ---- Public API ----
      void initialize(const std::string& configPath); ///< load config, start log, connect instruments
      std::vector<protocols::MeasurementResult> run(); ///< one sweep with the loaded config
      void handleAbort();                              ///< stop at the next sweep point (signal-safe)
      void handleError(const std::string& reason);

      void setProgressSink(protocols::ProgressSink sink) { sink_ = std::move(sink); }

      State state() const { return currentState_; }
      const RunConfig& config() const { return config_; }
      ErrorMonitor& errorMonitor() { return *errorMonitor_; }

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      void transitionTo(State next);

      State currentState_{ State::Boot };
      RunConfig config_{};
      ResourceArbiter arbiter_;
      CancellationToken cancel_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      std::unique_ptr<InstrumentHub> hub_;
      protocols::ProgressSink sink_{};
    };

    const char* toString(SystemCoordinator::State s);

  } // namespace core
} // namespace rfsweep
