#pragma once
/** @file  FakeClock.hpp
 *  @brief Clock that records dwells and returns immediately.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <vector>

#include "core/Clock.hpp"

namespace rfsweep {
  namespace test {

    class FakeClock : public rfsweep::core::Clock {
    public:
      std::vector<std::chrono::milliseconds> dwells;

      void sleepFor(std::chrono::milliseconds d) override { dwells.push_back(d); }
    };

  } // namespace test
} // namespace rfsweep
