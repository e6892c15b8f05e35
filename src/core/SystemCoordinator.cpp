/* @file SystemCoordinator.cpp
 * @brief top-level FSM: config -> instruments -> sweep -> results
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <utility>

// rfsweep headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/InstrumentHub.hpp"
#include "core/Logger.hpp"
#include "core/SystemCoordinator.hpp"
#include "instruments/ScpiAnalyzer.hpp"
#include "protocols/SweepProtocol.hpp"

#include <nlohmann/json.hpp>

namespace rfsweep {
  namespace core {

    namespace {
      constexpr const char* kSource = "SystemCoordinator";
    } // namespace

    const char* toString(SystemCoordinator::State s) {
      using State = SystemCoordinator::State;
      switch (s) {
      case State::Boot:
        return "BOOT";
      case State::Init:
        return "INIT";
      case State::Idle:
        return "IDLE";
      case State::Running:
        return "RUNNING";
      case State::Finished:
        return "FINISHED";
      case State::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    SystemCoordinator::SystemCoordinator()
        : errorMonitor_{ std::make_shared<ErrorMonitor>() }, logger_{ std::make_shared<Logger>() } {
      errorMonitor_->registerEscalation(
          [](const std::string& msg) { std::cerr << "[fault] " << msg << "\n"; });
    }

    SystemCoordinator::~SystemCoordinator() {
      hub_.reset(); // release instrument claims before the arbiter goes away
      logger_->finishRun();
    }

    void SystemCoordinator::initialize(const std::string& configPath) {
      transitionTo(State::Init);
      try {
        config_ = RunConfig::fromJson(ConfigLoader(configPath).load());

        if (!logger_->startNewRun(config_.logPath))
          std::cerr << "[" << kSource << "] run log disabled, cannot open " << config_.logPath
                    << "\n";
        logger_->log(LogLevel::Info, kSource, "config loaded from " + configPath);

        hub_ = std::make_unique<InstrumentHub>(errorMonitor_, arbiter_);
        for (const auto& [name, ep] : config_.instruments) {
          auto dev = instrumentFromString(name);
          if (!dev)
            throw ConfigurationError("unknown instrument '" + name +
                                     "' (expected analyzer, generator or supply)");
          hub_->connect(*dev, ep);
          logger_->log(LogLevel::Info, kSource,
                       name + " @ " + resourceName(ep) + ": " + hub_->identify(*dev));
        }
      } catch (const std::exception& e) {
        handleError(e.what());
        throw;
      }
      transitionTo(State::Idle);
    }

    std::vector<protocols::MeasurementResult> SystemCoordinator::run() {
      if (currentState_ != State::Idle && currentState_ != State::Finished)
        throw std::logic_error(std::string("[SystemCoordinator] cannot run from state ") +
                               toString(currentState_));

      std::shared_ptr<instruments::Analyzer> analyzer;
      if (hub_ && hub_->connected(Instrument::Analyzer))
        analyzer = std::make_shared<instruments::ScpiAnalyzer>(*hub_);

      protocols::SweepProtocol sweep(std::move(analyzer), std::make_shared<SteadyClock>(), {},
                                     errorMonitor_, logger_);
      sweep.setProgressSink(sink_);

      errorMonitor_->reset();
      cancel_.reset();
      transitionTo(State::Running);
      try {
        auto results = sweep.run(config_, &cancel_);
        transitionTo(State::Finished);
        return results;
      } catch (const std::exception& e) {
        handleError(e.what());
        throw;
      }
    }

    void SystemCoordinator::handleAbort() { cancel_.cancel(); }

    void SystemCoordinator::handleError(const std::string& reason) {
      logger_->log(LogLevel::Error, kSource, reason);
      errorMonitor_->notifyFailure("[" + std::string(kSource) + "] " + reason);
      transitionTo(State::Error);
    }

    void SystemCoordinator::transitionTo(State next) {
      if (next == currentState_)
        return;
      logger_->log(LogLevel::Debug, kSource,
                   std::string(toString(currentState_)) + " -> " + toString(next));
      currentState_ = next;
    }

  } // namespace core
} // namespace rfsweep
