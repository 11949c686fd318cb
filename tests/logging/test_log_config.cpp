/*
 * test_log_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Tests for the global LogConfig

**************************************************/

#include <gtest/gtest.h>

#include "logging/log_config.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <spdlog/sinks/ostream_sink.h>

using namespace mortar::logging;

class LogConfigTest : public ::testing::Test {
protected:
    void SetUp() override { LogConfig::shutdown(); }

    void TearDown() override { LogConfig::shutdown(); }

    static auto quietConfig(LogLevel level = LogLevel::INFO) -> LoggerConfig {
        LoggerConfig cfg;
        cfg.level = level;
        cfg.console_output = false;
        return cfg;
    }
};

// ============================================================================
// Level names
// ============================================================================

TEST_F(LogConfigTest, LevelNamesRoundTrip) {
    for (auto level : {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO,
                       LogLevel::WARN, LogLevel::ERROR, LogLevel::CRITICAL,
                       LogLevel::OFF}) {
        auto parsed = logLevelFromString(logLevelToString(level));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, level);
    }
}

TEST_F(LogConfigTest, WarningIsAcceptedAsAlias) {
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::WARN);
    EXPECT_FALSE(logLevelFromString("verbose").has_value());
    EXPECT_FALSE(logLevelFromString("").has_value());
}

TEST_F(LogConfigTest, ConvertLevelMapsToSpdlog) {
    EXPECT_EQ(LogConfig::convertLevel(LogLevel::WARN), spdlog::level::warn);
    EXPECT_EQ(LogConfig::convertLevel(LogLevel::ERROR), spdlog::level::err);
    EXPECT_EQ(LogConfig::convertLevel(LogLevel::OFF), spdlog::level::off);
}

// ============================================================================
// Initialization
// ============================================================================

TEST_F(LogConfigTest, InitializeOnlyOnce) {
    EXPECT_FALSE(LogConfig::isInitialized());
    EXPECT_TRUE(LogConfig::initialize(quietConfig()));
    EXPECT_TRUE(LogConfig::isInitialized());
    EXPECT_FALSE(LogConfig::initialize(quietConfig(LogLevel::DEBUG)));
    EXPECT_EQ(LogConfig::globalLevel(), LogLevel::INFO);
}

TEST_F(LogConfigTest, GetLoggerInitializesLazily) {
    auto logger = LogConfig::getLogger("lazy");
    ASSERT_NE(logger, nullptr);
    EXPECT_TRUE(LogConfig::isInitialized());
    EXPECT_EQ(logger->name(), "lazy");
}

TEST_F(LogConfigTest, GetLoggerReusesInstances) {
    LogConfig::initialize(quietConfig());
    auto first = LogConfig::getLogger("shell");
    auto second = LogConfig::getLogger("shell");
    auto other = LogConfig::getLogger("config");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_NE(first.get(), other.get());
}

TEST_F(LogConfigTest, LoggersStartAtGlobalLevel) {
    LogConfig::initialize(quietConfig(LogLevel::WARN));
    EXPECT_EQ(LogConfig::getLogger("runner")->level(), spdlog::level::warn);
}

TEST_F(LogConfigTest, SetGlobalLevelUpdatesExistingLoggers) {
    LogConfig::initialize(quietConfig());
    auto logger = LogConfig::getLogger("shell");

    LogConfig::setGlobalLevel(LogLevel::DEBUG);
    EXPECT_EQ(LogConfig::globalLevel(), LogLevel::DEBUG);
    EXPECT_EQ(logger->level(), spdlog::level::debug);
}

TEST_F(LogConfigTest, ShutdownForgetsLoggers) {
    LogConfig::initialize(quietConfig(LogLevel::ERROR));
    auto before = LogConfig::getLogger("shell");
    LogConfig::shutdown();

    EXPECT_FALSE(LogConfig::isInitialized());
    EXPECT_EQ(LogConfig::globalLevel(), LogLevel::INFO);
    auto after = LogConfig::getLogger("shell");
    EXPECT_NE(before.get(), after.get());
}

TEST_F(LogConfigTest, FileSinkReceivesMessages) {
    const auto dir =
        std::filesystem::temp_directory_path() / "mortar_log_config_test";
    std::filesystem::remove_all(dir);

    auto cfg = quietConfig();
    cfg.pattern = "%l %v";
    cfg.log_file_path = (dir / "mortar.log").string();
    ASSERT_TRUE(LogConfig::initialize(cfg));

    LogConfig::getLogger("file")->info("written to disk");
    LogConfig::flushAll();

    std::ifstream in(cfg.log_file_path);
    ASSERT_TRUE(in.is_open());
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("info written to disk"), std::string::npos);

    LogConfig::shutdown();
    std::filesystem::remove_all(dir);
}

TEST_F(LogConfigTest, MacrosRespectLevel) {
    std::ostringstream stream;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
    sink->set_pattern("%v");
    auto logger = std::make_shared<spdlog::logger>("macro", sink);
    logger->set_level(spdlog::level::warn);

    MORTAR_LOG_DEBUG(logger, "hidden {}", 1);
    MORTAR_LOG_WARN(logger, "shown {}", 2);
    EXPECT_EQ(stream.str().find("hidden"), std::string::npos);
    EXPECT_NE(stream.str().find("shown 2"), std::string::npos);

    std::shared_ptr<spdlog::logger> none;
    MORTAR_LOG_ERROR(none, "ignored");
}
