#pragma once
/** @file  MockErrorMonitor.hpp
 *  @brief gmock ErrorMonitor shared by the hub and sweep tests.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <gmock/gmock.h>

#include "core/ErrorMonitor.hpp"

namespace rfsweep {
  namespace test {

    class MockErrorMonitor : public rfsweep::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

  } // namespace test
} // namespace rfsweep
