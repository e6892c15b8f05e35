#pragma once
/** @file  FakeAnalyzer.hpp
 *  @brief Analyzer with fixed marker readings and scripted per-call failures.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <set>
#include <stdexcept>

#include "core/Errors.hpp"
#include "instruments/Analyzer.hpp"

namespace rfsweep {
  namespace test {

    /**
 * @class FakeAnalyzer
 * @brief Read failures are keyed by the 1-based call number of that read.
 */
    class FakeAnalyzer : public rfsweep::instruments::Analyzer {
    public:
      double frequencyHz = 3.1e9;
      double powerDbm = -42.5;

      std::set<int> failFrequencyReads; ///< throw MeasurementError on these calls
      std::set<int> failPowerReads;
      bool failBestEffort = false; ///< reset / max-hold / peak-search all throw
      bool failConfigure = false;

      int centerCalls = 0;
      int resetCalls = 0;
      int holdCalls = 0;
      int peakCalls = 0;
      int frequencyReads = 0;
      int powerReads = 0;
      double lastCenterHz = 0.0;
      double lastSpanHz = 0.0;
      double lastRbwHz = 0.0;

      void setCenterFrequency(double hz) override {
        ++centerCalls;
        if (failConfigure)
          throw core::InstrumentError("analyzer offline");
        lastCenterHz = hz;
      }
      void setSpan(double hz) override { lastSpanHz = hz; }
      void setResolutionBandwidth(double hz) override { lastRbwHz = hz; }

      void resetTrace() override {
        ++resetCalls;
        bestEffort();
      }
      void holdMaxTrace() override {
        ++holdCalls;
        bestEffort();
      }
      void peakSearch() override {
        ++peakCalls;
        bestEffort();
      }

      double readMarkerFrequency() override {
        if (failFrequencyReads.count(++frequencyReads))
          throw core::MeasurementError("marker X timeout");
        return frequencyHz;
      }

      double readMarkerPower() override {
        if (failPowerReads.count(++powerReads))
          throw core::MeasurementError("marker Y timeout");
        return powerDbm;
      }

    private:
      void bestEffort() const {
        if (failBestEffort)
          throw std::runtime_error("*OPC? timed out");
      }
    };

  } // namespace test
} // namespace rfsweep
