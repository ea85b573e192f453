#pragma once
/** @file  MockErrorMonitor.hpp
 *  @brief GMock ErrorMonitor for asserting escalations.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <string>

#include <gmock/gmock.h>

#include "core/ErrorMonitor.hpp"

namespace spectackler {
  namespace test {

    class MockErrorMonitor : public spectackler::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

  } // namespace test
} // namespace spectackler
