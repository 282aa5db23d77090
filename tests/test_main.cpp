#include "trellis/logger/ConsoleLogger.hpp"
#include "trellis/logger/Logger.hpp"
#include <gtest/gtest.h>
#include <memory>

// Global console logger for tests
std::unique_ptr<trellis::ConsoleLogger> global_console_logger;

int main(int argc, char **argv) {
    global_console_logger = std::make_unique<trellis::ConsoleLogger>();
    trellis::Logger::setGlobalLogger(global_console_logger.get());

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
