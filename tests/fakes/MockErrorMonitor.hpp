#pragma once
/** @file  MockErrorMonitor.hpp
 *  @brief GMock ErrorMonitor shared by the sequencer and coordinator tests.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <gmock/gmock.h>

#include "core/ErrorMonitor.hpp"

namespace trialflow {
  namespace test {

    class MockErrorMonitor : public trialflow::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

  } // namespace test
} // namespace trialflow
