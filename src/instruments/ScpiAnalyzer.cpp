/* @file ScpiAnalyzer.cpp
 * @brief SCPI mapping for the analyzer capability (N9030-class command set)
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdio>

// rfsweep headers
#include "core/Errors.hpp"
#include "core/InstrumentHub.hpp"
#include "instruments/ScpiAnalyzer.hpp"

namespace rfsweep::instruments {

  namespace {
    using core::Instrument;

    // "%.0f" keeps integral Hz values free of exponents (":FREQ:CENT 3100000000")
    std::string withValue(const char* header, double hz) {
      char buf[96];
      std::snprintf(buf, sizeof(buf), "%s %.0f", header, hz);
      return buf;
    }
  } // namespace

  ScpiAnalyzer::ScpiAnalyzer(core::InstrumentHub& hub, std::chrono::milliseconds queryTimeout)
      : hub_(hub), timeout_(queryTimeout) {}

  void ScpiAnalyzer::setCenterFrequency(double hz) { write(withValue(":FREQ:CENT", hz)); }

  void ScpiAnalyzer::setSpan(double hz) { write(withValue(":FREQ:SPAN", hz)); }

  void ScpiAnalyzer::setResolutionBandwidth(double hz) { write(withValue(":BAND:RES", hz)); }

  void ScpiAnalyzer::resetTrace() {
    write(":TRAC:TYPE WRIT");
    waitOperationComplete();
  }

  void ScpiAnalyzer::holdMaxTrace() {
    write(":TRAC:TYPE MAXH");
    waitOperationComplete();
  }

  void ScpiAnalyzer::peakSearch() { write(":CALC:MARK:MAX"); }

  double ScpiAnalyzer::readMarkerFrequency() { return readNumber(":CALC:MARK:X?"); }

  double ScpiAnalyzer::readMarkerPower() { return readNumber(":CALC:MARK:Y?"); }

  void ScpiAnalyzer::write(const std::string& cmd) { hub_.sendCommand(Instrument::Analyzer, { cmd }); }

  void ScpiAnalyzer::waitOperationComplete() { hub_.query(Instrument::Analyzer, { "*OPC?" }, timeout_); }

  double ScpiAnalyzer::readNumber(const std::string& query) {
    protocols::Response reply;
    try {
      reply = hub_.query(Instrument::Analyzer, { query }, timeout_);
    } catch (const core::InstrumentError& e) {
      throw core::MeasurementError(e.what());
    }

    auto value = reply.asDouble();
    if (!value)
      throw core::MeasurementError("[ScpiAnalyzer] non-numeric reply to " + query + ": '" +
                                   reply.text + "'");
    return *value;
  }

} // namespace rfsweep::instruments
