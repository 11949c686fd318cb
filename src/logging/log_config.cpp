/*
 * log_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration implementation

**************************************************/

#include "log_config.hpp"

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mortar::logging {

namespace {
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>
    logger_registry_;
std::vector<spdlog::sink_ptr> shared_sinks_;
LoggerConfig active_config_;
std::shared_mutex registry_mutex_;

auto makeSinks(const LoggerConfig& config) -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console_output) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!config.log_file_path.empty()) {
        const auto parent =
            std::filesystem::path(config.log_file_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file_path, config.max_file_size, config.max_files));
    }
    return sinks;
}

auto createLogger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    auto logger = std::make_shared<spdlog::logger>(
        name, shared_sinks_.begin(), shared_sinks_.end());
    logger->set_level(
        LogConfig::convertLevel(LogConfig::globalLevel()));
    logger->set_pattern(active_config_.pattern);
    if (active_config_.flush_on_error) {
        logger->flush_on(spdlog::level::err);
    }
    return logger;
}
}  // namespace

auto logLevelToString(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::CRITICAL: return "critical";
        case LogLevel::OFF: return "off";
    }
    return "info";
}

auto logLevelFromString(std::string_view name) noexcept
    -> std::optional<LogLevel> {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    if (name == "off") return LogLevel::OFF;
    return std::nullopt;
}

bool LogConfig::initialize(const LoggerConfig& config) {
    if (initialized_.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }

    try {
        std::unique_lock lock(registry_mutex_);
        active_config_ = config;
        shared_sinks_ = makeSinks(config);
        global_level_.store(config.level, std::memory_order_relaxed);
        spdlog::set_level(convertLevel(config.level));

        auto default_logger = createLogger("mortar");
        logger_registry_["mortar"] = default_logger;
        spdlog::set_default_logger(default_logger);

        spdlog::set_error_handler([](const std::string& msg) {
            std::fprintf(stderr, "spdlog error: %s\n", msg.c_str());
        });
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        initialized_.store(false, std::memory_order_release);
        throw;
    }

    MORTAR_LOG_DEBUG(spdlog::default_logger(), "Logging initialized at level {}",
                     logLevelToString(config.level));
    return true;
}

auto LogConfig::getLogger(std::string_view name)
    -> std::shared_ptr<spdlog::logger> {
    if (!isInitialized()) {
        initialize();
    }

    const std::string key(name);
    {
        std::shared_lock lock(registry_mutex_);
        if (auto it = logger_registry_.find(key); it != logger_registry_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(registry_mutex_);
    auto [it, inserted] = logger_registry_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = createLogger(key);
    }
    return it->second;
}

void LogConfig::setGlobalLevel(LogLevel level) noexcept {
    global_level_.store(level, std::memory_order_relaxed);
    const auto spdLevel = convertLevel(level);
    spdlog::set_level(spdLevel);

    std::shared_lock lock(registry_mutex_);
    for (auto& [name, logger] : logger_registry_) {
        logger->set_level(spdLevel);
    }
}

auto LogConfig::globalLevel() noexcept -> LogLevel {
    return global_level_.load(std::memory_order_relaxed);
}

auto LogConfig::isInitialized() noexcept -> bool {
    return initialized_.load(std::memory_order_acquire);
}

void LogConfig::flushAll() noexcept {
    std::shared_lock lock(registry_mutex_);
    for (auto& [name, logger] : logger_registry_) {
        logger->flush();
    }
}

void LogConfig::shutdown() {
    std::unique_lock lock(registry_mutex_);
    for (auto& [name, logger] : logger_registry_) {
        logger->flush();
    }
    logger_registry_.clear();
    shared_sinks_.clear();
    active_config_ = LoggerConfig{};
    global_level_.store(LogLevel::INFO, std::memory_order_relaxed);
    initialized_.store(false, std::memory_order_release);
}

auto LogConfig::convertLevel(LogLevel level) noexcept
    -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace mortar::logging
