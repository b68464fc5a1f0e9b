#include <gtest/gtest.h>
#include "peerdrop/core/logger.hpp"
#include <filesystem>
#include <fstream>

using namespace peerdrop::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file_ = (std::filesystem::temp_directory_path() / "peerdrop_test.log").string();
        std::filesystem::remove(log_file_);
    }
    
    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove(log_file_);
    }
    
    std::string read_log() {
        Logger::get()->flush();
        std::ifstream file(log_file_);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }
    
    std::string log_file_;
};

TEST_F(LoggerTest, UsableBeforeInitialize) {
    auto logger = Logger::get();
    ASSERT_NE(logger, nullptr);
    LOG_INFO("logging before initialization");
}

TEST_F(LoggerTest, InitializeCreatesFile) {
    Logger::initialize(log_file_, LogLevel::Debug);
    
    EXPECT_NE(Logger::get(), nullptr);
    EXPECT_EQ(Logger::get()->name(), "peerdrop");
    EXPECT_TRUE(std::filesystem::exists(log_file_));
}

TEST_F(LoggerTest, WritesAllLevelsToFile) {
    Logger::initialize(log_file_, LogLevel::Debug);
    
    LOG_DEBUG("chunk at offset {}", 400);
    LOG_INFO("serving {}", "card.png");
    LOG_WARN("password rejected");
    LOG_ERROR("transfer stalled");
    
    auto content = read_log();
    EXPECT_NE(content.find("chunk at offset 400"), std::string::npos);
    EXPECT_NE(content.find("serving card.png"), std::string::npos);
    EXPECT_NE(content.find("password rejected"), std::string::npos);
    EXPECT_NE(content.find("transfer stalled"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersMessages) {
    Logger::initialize(log_file_, LogLevel::Warn);
    
    LOG_DEBUG("debug detail");
    LOG_INFO("info detail");
    LOG_WARN("warn detail");
    
    auto content = read_log();
    EXPECT_EQ(content.find("debug detail"), std::string::npos);
    EXPECT_EQ(content.find("info detail"), std::string::npos);
    EXPECT_NE(content.find("warn detail"), std::string::npos);
}

TEST_F(LoggerTest, UsableAfterShutdown) {
    Logger::initialize(log_file_, LogLevel::Info);
    Logger::shutdown();
    
    auto logger = Logger::get();
    ASSERT_NE(logger, nullptr);
    EXPECT_NE(logger->name(), "peerdrop");
    LOG_WARN("logging after shutdown");
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(Logger::parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_EQ(Logger::parse_level("loud"), LogLevel::Info);
    EXPECT_EQ(Logger::parse_level("loud", LogLevel::Error), LogLevel::Error);
    EXPECT_EQ(Logger::parse_level("WARN\xE9", LogLevel::Error), LogLevel::Error);
}
