/*
 * log_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration shared by all mortar components

**************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace mortar::logging {

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

[[nodiscard]] auto logLevelToString(LogLevel level) noexcept
    -> std::string_view;

[[nodiscard]] auto logLevelFromString(std::string_view name) noexcept
    -> std::optional<LogLevel>;

struct LoggerConfig {
    LogLevel level = LogLevel::INFO;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    bool console_output = true;
    std::string log_file_path{};  // empty disables the file sink
    std::size_t max_file_size = 1048576 * 10;  // 10MB
    std::size_t max_files = 5;
    bool flush_on_error = true;
};

/**
 * @brief Process-wide logger setup
 *
 * All loggers handed out by getLogger() share the sinks created by
 * initialize(). Calling getLogger() before initialize() initializes with
 * the default LoggerConfig.
 */
class LogConfig {
public:
    /**
     * @brief Initialize global spdlog configuration
     * @param config Logger configuration
     * @return false if logging was already initialized
     */
    static bool initialize(const LoggerConfig& config = LoggerConfig{});

    /**
     * @brief Get or create a named logger sharing the global sinks
     * @param name Logger name
     * @return Shared pointer to logger
     */
    static auto getLogger(std::string_view name)
        -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Set global log level
     * @param level New log level
     */
    static void setGlobalLevel(LogLevel level) noexcept;

    [[nodiscard]] static auto globalLevel() noexcept -> LogLevel;

    [[nodiscard]] static auto isInitialized() noexcept -> bool;

    /**
     * @brief Flush all loggers
     */
    static void flushAll() noexcept;

    /**
     * @brief Drop every logger created here and forget the configuration
     */
    static void shutdown();

    static auto convertLevel(LogLevel level) noexcept
        -> spdlog::level::level_enum;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::atomic<LogLevel> global_level_{LogLevel::INFO};
};

// Convenience macros for guarded logging
#define MORTAR_LOG_DEBUG(logger, ...)                          \
    if (logger && logger->should_log(spdlog::level::debug)) { \
        logger->debug(__VA_ARGS__);                            \
    }

#define MORTAR_LOG_INFO(logger, ...)                          \
    if (logger && logger->should_log(spdlog::level::info)) { \
        logger->info(__VA_ARGS__);                            \
    }

#define MORTAR_LOG_WARN(logger, ...)                          \
    if (logger && logger->should_log(spdlog::level::warn)) { \
        logger->warn(__VA_ARGS__);                            \
    }

#define MORTAR_LOG_ERROR(logger, ...)                        \
    if (logger && logger->should_log(spdlog::level::err)) { \
        logger->error(__VA_ARGS__);                          \
    }

}  // namespace mortar::logging
