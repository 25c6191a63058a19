/*
 * test_logger.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

/*************************************************

Date: 2024-11-28

Description: Tests for the shared spdlog setup

**************************************************/

#include <gtest/gtest.h>

#include "logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

using namespace warden::logging;
namespace fs = std::filesystem;

// ============================================================================
// Level Names
// ============================================================================

TEST(LogLevelTest, ParsesKnownNames) {
    EXPECT_EQ(logLevelFromString("trace"), spdlog::level::trace);
    EXPECT_EQ(logLevelFromString("debug"), spdlog::level::debug);
    EXPECT_EQ(logLevelFromString("warn"), spdlog::level::warn);
    EXPECT_EQ(logLevelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(logLevelFromString("error"), spdlog::level::err);
    EXPECT_EQ(logLevelFromString("off"), spdlog::level::off);
}

TEST(LogLevelTest, UnknownNameFallsBackToInfo) {
    EXPECT_EQ(logLevelFromString("loud"), spdlog::level::info);
    EXPECT_EQ(logLevelFromString(""), spdlog::level::info);
}

TEST(LogLevelTest, NamesRoundTrip) {
    for (auto level : {spdlog::level::trace, spdlog::level::debug,
                       spdlog::level::info, spdlog::level::err}) {
        EXPECT_EQ(logLevelFromString(logLevelToString(level)), level);
    }
}

// ============================================================================
// Configuration
// ============================================================================

TEST(LoggingConfigTest, FromJsonKeepsDefaultsForMissingKeys) {
    auto config = LoggingConfig::fromJson({{"level", "error"}, {"file", true}});
    EXPECT_EQ(config.level, spdlog::level::err);
    EXPECT_TRUE(config.fileEnabled);
    EXPECT_TRUE(config.consoleEnabled);
    EXPECT_EQ(config.filePath, LoggingConfig{}.filePath);
}

TEST(LoggingConfigTest, ToJsonUsesLevelName) {
    LoggingConfig config;
    config.level = spdlog::level::debug;
    auto j = config.toJson();
    EXPECT_EQ(j["level"], "debug");
    EXPECT_EQ(LoggingConfig::fromJson(j).level, spdlog::level::debug);
}

// ============================================================================
// Registry
// ============================================================================

class LoggerRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("warden_log_" + std::to_string(::getpid()) + ".log");
    }

    void TearDown() override {
        shutdown();
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string readLog() {
        std::ifstream file(path_);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    fs::path path_;
};

TEST_F(LoggerRegistryTest, SameNameReturnsSameLogger) {
    auto first = getLogger("sandbox.test");
    auto second = getLogger("sandbox.test");
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), "sandbox.test");
}

TEST_F(LoggerRegistryTest, NamedLoggersWriteToConfiguredFile) {
    LoggingConfig config;
    config.consoleEnabled = false;
    config.fileEnabled = true;
    config.filePath = path_.string();
    config.level = spdlog::level::debug;
    config.pattern = "%n|%l|%v";
    initialize(config);

    auto logger = getLogger("sandbox.file");
    EXPECT_EQ(logger->level(), spdlog::level::debug);
    logger->debug("worker {} ready", 7);
    spdlog::info("default logger line");
    logger->flush();
    spdlog::default_logger()->flush();

    auto text = readLog();
    EXPECT_NE(text.find("sandbox.file|debug|worker 7 ready"), std::string::npos);
    EXPECT_NE(text.find("warden|info|default logger line"), std::string::npos);
}

TEST_F(LoggerRegistryTest, ShutdownDropsNamedLoggers) {
    auto logger = getLogger("sandbox.dropped");
    ASSERT_NE(spdlog::get("sandbox.dropped"), nullptr);
    shutdown();
    EXPECT_EQ(spdlog::get("sandbox.dropped"), nullptr);
    EXPECT_NE(spdlog::default_logger_raw(), nullptr);
}
