#include <gtest/gtest.h>
#include "televault/core/logger.hpp"
#include <filesystem>
#include <fstream>

using namespace televault::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "televault_logger_test";
        std::filesystem::remove_all(test_dir_);
        log_file_ = test_dir_ / "logs" / "televault.log";
    }

    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove_all(test_dir_);
    }

    std::string read_log() {
        Logger::get()->flush();
        std::ifstream file(log_file_);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    std::filesystem::path test_dir_;
    std::filesystem::path log_file_;
};

TEST_F(LoggerTest, CreatesLogDirectory) {
    Logger::initialize(log_file_.string(), LogLevel::Info);

    ASSERT_NE(Logger::get(), nullptr);
    EXPECT_EQ(Logger::get()->sinks().size(), 2u);
    EXPECT_TRUE(std::filesystem::exists(log_file_));
}

TEST_F(LoggerTest, FileCapturesTransferMessages) {
    Logger::initialize(log_file_.string(), LogLevel::Debug);

    LOG_DEBUG("Uploaded chunk {} of {}", 2, 5);
    LOG_INFO("Pushed file: {}", "report.pdf");
    LOG_WARN("Retrying chunk {} (attempt {})", 3, 1);
    LOG_ERROR("Catalog unreadable");

    auto content = read_log();
    EXPECT_NE(content.find("Uploaded chunk 2 of 5"), std::string::npos);
    EXPECT_NE(content.find("Pushed file: report.pdf"), std::string::npos);
    EXPECT_NE(content.find("Retrying chunk 3 (attempt 1)"), std::string::npos);
    EXPECT_NE(content.find("[error]"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersMessages) {
    Logger::initialize(log_file_.string(), LogLevel::Warn);

    LOG_DEBUG("per-chunk detail");
    LOG_INFO("per-file summary");
    LOG_WARN("discarded stale progress");

    auto content = read_log();
    EXPECT_EQ(content.find("per-chunk detail"), std::string::npos);
    EXPECT_EQ(content.find("per-file summary"), std::string::npos);
    EXPECT_NE(content.find("discarded stale progress"), std::string::npos);
}

TEST_F(LoggerTest, EmptyPathLogsToConsoleOnly) {
    Logger::initialize("", LogLevel::Info);

    ASSERT_NE(Logger::get(), nullptr);
    EXPECT_EQ(Logger::get()->sinks().size(), 1u);
}

TEST_F(LoggerTest, UnwritableFileFallsBackToConsole) {
    std::filesystem::create_directories(test_dir_);
    std::ofstream(test_dir_ / "blocker") << "not a directory";

    Logger::initialize((test_dir_ / "blocker" / "televault.log").string(), LogLevel::Info);

    ASSERT_NE(Logger::get(), nullptr);
    EXPECT_EQ(Logger::get()->sinks().size(), 1u);
}

TEST_F(LoggerTest, ShutdownLeavesUsableDefault) {
    Logger::initialize(log_file_.string(), LogLevel::Info);
    Logger::shutdown();

    EXPECT_EQ(Logger::get(), nullptr);
    ASSERT_NE(spdlog::default_logger_raw(), nullptr);
    LOG_WARN("still routed after shutdown");
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level(" WARNING "), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("err"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_log_level("loud", LogLevel::Error), LogLevel::Error);
    EXPECT_EQ(parse_log_level("", LogLevel::Trace), LogLevel::Trace);
}
