#pragma once
/** @file  ScpiAnalyzer.hpp
 *  @brief Analyzer capability for X-series signal analyzers over SCPI.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

#include "instruments/Analyzer.hpp"

namespace rfsweep::core {
  class InstrumentHub;
} // namespace rfsweep::core

namespace rfsweep::instruments {

  /**
 * @class ScpiAnalyzer
 * @brief Translates capability calls into SCPI on the hub's analyzer channel.
 *
 *  * Owns no hardware; the hub must outlive it.
 *  * Channel failures surface as `core::InstrumentError`; marker reads that
 *    fail or return garbage surface as `core::MeasurementError`.
 */
  class ScpiAnalyzer : public Analyzer {
  public:
    explicit ScpiAnalyzer(core::InstrumentHub& hub,
                          std::chrono::milliseconds queryTimeout = std::chrono::milliseconds{ 5000 });

    void setCenterFrequency(double hz) override;
    void setSpan(double hz) override;
    void setResolutionBandwidth(double hz) override;

    void resetTrace() override;
    void holdMaxTrace() override;
    void peakSearch() override;

    double readMarkerFrequency() override;
    double readMarkerPower() override;

  private:
    void write(const std::string& cmd);
    void waitOperationComplete();
    double readNumber(const std::string& query);

    core::InstrumentHub& hub_;
    std::chrono::milliseconds timeout_;
  };

} // namespace rfsweep::instruments
