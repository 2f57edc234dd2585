#include "observability/logger.hpp"

#include <gtest/gtest.h>

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);

  // Rejected transfers log at WARN; keep the test output readable
  ledger::observability::Logger::getInstance().setLogLevel(
      ledger::observability::LogLevel::FATAL);
  return RUN_ALL_TESTS();
}
