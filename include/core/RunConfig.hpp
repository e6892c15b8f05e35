#pragma once
/** @file  RunConfig.hpp
 *  @brief Everything one sweep run needs, with the bench defaults.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <map>
#include <string>
#include <vector>

// third-party headers
#include <nlohmann/json_fwd.hpp>

// rfsweep headers
#include "io/DatagramTransport.hpp"

namespace rfsweep {
  namespace core {

    struct AnalyzerSettings {
      double centerHz{ 3.1e9 };
      double spanHz{ 600e6 };
      double rbwHz{ 100e3 };
    };

    struct DwellSettings {
      std::chrono::milliseconds settle{ 100 };     ///< after trace reset, before send
      std::chrono::milliseconds afterSend{ 2000 }; ///< DUT reacts to the packet
      std::chrono::milliseconds maxHold{ 3000 };   ///< max-hold accumulates
      std::chrono::milliseconds peakSearch{ 150 };
    };

    struct SweepSettings {
      int start{ 0x00 };
      int stop{ 0x50 };
      int step{ 0x05 };
    };

    /**
 * @struct RunConfig
 * @brief Run invocation parameters + analyzer/timing knobs.
 *
 *  * Board and channel numbers are labels only; they never change the protocol.
 *  * `declaredTotal` is reported as the progress `total` verbatim (0x51 for the
 *    bench firmware) and is not derived from the sweep axis.
 */
    struct RunConfig {
      int boardNo{ 1 };
      int channelNo{ 1 };

      std::string pulseWidth{ "00 00" };
      std::string prt{ "00 00 00 00" };
      std::vector<int> pulseOffsets{ 10, 11 };
      std::vector<int> prtOffsets{ 12, 13, 14, 15 };
      int sweepOffset{ 9 };

      SweepSettings sweep{};
      int declaredTotal{ 0x51 };

      io::Endpoint udpSource{ "192.168.1.5", 6005 };
      io::Endpoint udpDestination{ "192.168.1.10", 5005 };

      AnalyzerSettings analyzer{};
      DwellSettings dwell{};

      std::map<std::string, io::Endpoint> instruments; ///< "analyzer" -> 10.0.0.7:5025
      std::string logPath{ "rfsweep_run.csv" };

      /// Missing keys keep their defaults. @throws ConfigurationError on type errors.
      static RunConfig fromJson(const nlohmann::json& j);
    };

  } // namespace core
} // namespace rfsweep
