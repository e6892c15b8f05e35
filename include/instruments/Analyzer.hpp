#pragma once
/** @file  Analyzer.hpp
 *  @brief Spectrum-analyzer capability consumed by the sweep.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace rfsweep::instruments {

  /**
 * @class Analyzer
 * @brief Every call may throw. The sweep treats resetTrace / holdMaxTrace /
 *        peakSearch as best-effort and the marker reads as step-fatal.
 */
  class Analyzer {
  public:
    virtual ~Analyzer() = default;

    virtual void setCenterFrequency(double hz) = 0;
    virtual void setSpan(double hz) = 0;
    virtual void setResolutionBandwidth(double hz) = 0;

    virtual void resetTrace() = 0;   ///< back to clear/write
    virtual void holdMaxTrace() = 0; ///< arm max-hold
    virtual void peakSearch() = 0;   ///< marker to highest peak

    virtual double readMarkerFrequency() = 0; ///< Hz
    virtual double readMarkerPower() = 0;     ///< dBm
  };

} // namespace rfsweep::instruments
