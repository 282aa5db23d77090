/**
 * Tests for file logging, log rotation and the global logger
 */

#include <gtest/gtest.h>
#include "trellis/logger/ConsoleLogger.hpp"
#include "trellis/logger/FileLogger.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace trellis;
namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "trellis_logger_test";
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    std::string readFile(const fs::path& path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    fs::path test_dir_;
};

TEST_F(LoggerTest, FileLoggerWritesLevels) {
    fs::path log_path = test_dir_ / "levels.log";
    {
        FileLogger logger(log_path.string(), true);
        logger.logMessage("Info message");
        logger.logError("Error message");
    }

    std::string content = readFile(log_path);
    EXPECT_NE(content.find("[INFO] Info message"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] Error message"), std::string::npos);
}

TEST_F(LoggerTest, FileLoggerAppendsAcrossInstances) {
    fs::path log_path = test_dir_ / "append.log";
    {
        FileLogger logger(log_path.string(), true);
        logger.logMessage("First message");
    }
    {
        FileLogger logger(log_path.string(), false);
        logger.logMessage("Second message");
        logger.flush();
    }

    std::string content = readFile(log_path);
    EXPECT_NE(content.find("First message"), std::string::npos);
    EXPECT_NE(content.find("Second message"), std::string::npos);
}

// logrotate renames the file, then the server reopens it on SIGHUP
TEST_F(LoggerTest, ReopenAfterRotation) {
    fs::path log_path = test_dir_ / "reopen.log";
    fs::path rotated_path = test_dir_ / "reopen.log.1";

    FileLogger logger(log_path.string(), true);
    logger.logMessage("Before rotation");
    fs::rename(log_path, rotated_path);

    logger.reopen();
    logger.logMessage("After rotation");
    logger.flush();

    std::string old_content = readFile(rotated_path);
    EXPECT_NE(old_content.find("Before rotation"), std::string::npos);
    EXPECT_EQ(old_content.find("After rotation"), std::string::npos);

    ASSERT_TRUE(fs::exists(log_path));
    std::string new_content = readFile(log_path);
    EXPECT_NE(new_content.find("Log file reopened"), std::string::npos);
    EXPECT_NE(new_content.find("After rotation"), std::string::npos);
    EXPECT_EQ(new_content.find("Before rotation"), std::string::npos);
}

TEST_F(LoggerTest, LogCurrentErrorAppendsException) {
    fs::path log_path = test_dir_ / "current.log";
    FileLogger logger(log_path.string(), true);

    try {
        throw std::runtime_error("disk on fire");
    } catch (...) {
        logger.logCurrentError("while serving");
    }
    logger.logCurrentError("outside handler");

    std::string content = readFile(log_path);
    EXPECT_NE(content.find("[ERROR] while serving: disk on fire"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] outside handler: no active exception"), std::string::npos);
}

TEST_F(LoggerTest, GlobalLoggerReceivesMessages) {
    fs::path log_path = test_dir_ / "global.log";
    Logger* previous = &Logger::getInstance();
    {
        FileLogger logger(log_path.string(), true);
        Logger::setGlobalLogger(&logger);
        Logger::getInstance().logMessage("through the global logger");
        Logger::setGlobalLogger(previous);
    }

    EXPECT_NE(readFile(log_path).find("through the global logger"), std::string::npos);
}

TEST_F(LoggerTest, FallsBackToConsoleWhenUnset) {
    Logger* previous = &Logger::getInstance();
    Logger::setGlobalLogger(nullptr);
    EXPECT_NE(dynamic_cast<ConsoleLogger*>(&Logger::getInstance()), nullptr);
    Logger::setGlobalLogger(previous);
}
