#pragma once
/** @file  SweepAxis.hpp
 *  @brief Inclusive start/stop/step enumeration of the swept byte.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <vector>

namespace rfsweep {
  namespace protocols {

    class SweepAxis {
    public:
      /// Defaults give 0x00, 0x05, ... 0x50 (17 points).
      /// @throws core::ConfigurationError for step <= 0, start > stop, or values outside a byte.
      SweepAxis(int start = 0x00, int stop = 0x50, int step = 0x05);

      /// Ascending, no repeats, stop included when reachable.
      std::vector<std::uint8_t> values() const;
      std::size_t size() const;

      int start() const { return start_; }
      int stop() const { return stop_; }
      int step() const { return step_; }

    private:
      int start_;
      int stop_;
      int step_;
    };

  } // namespace protocols
} // namespace rfsweep
