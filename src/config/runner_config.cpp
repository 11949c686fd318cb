/*
 * runner_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Runner configuration loading and validation

**************************************************/

#include "runner_config.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "exception.hpp"

namespace mortar::config {

namespace {
auto sectionOf(const json& j, const char* key) -> json {
    if (!j.contains(key)) {
        return json::object();
    }
    const auto& section = j.at(key);
    if (!section.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION("Section '{}' must be an object", key);
    }
    return section;
}
}  // namespace

json RunnerConfig::toJson() const {
    return {{"runner", runner.toJson()},
            {"escalation", escalation.toJson()},
            {"logging", logging.toJson()}};
}

RunnerConfig RunnerConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION("Configuration root must be an object");
    }

    RunnerConfig cfg;
    try {
        cfg.runner = RunnerSection::fromJson(sectionOf(j, "runner"));
        cfg.escalation = EscalationSection::fromJson(sectionOf(j, "escalation"));
        cfg.logging = LoggingSection::fromJson(sectionOf(j, "logging"));
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIG_EXCEPTION("Invalid configuration value: {}",
                                       e.what());
    }
    cfg.validate();
    return cfg;
}

RunnerConfig RunnerConfig::parse(std::string_view text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        THROW_INVALID_CONFIG_EXCEPTION("Malformed configuration: {}", e.what());
    }
    return fromJson(document);
}

RunnerConfig RunnerConfig::loadFromFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        THROW_CONFIG_IO_EXCEPTION("Cannot open configuration file {}",
                                  path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        THROW_CONFIG_IO_EXCEPTION("Failed to read configuration file {}",
                                  path.string());
    }

    spdlog::debug("RunnerConfig: loading {}", path.string());
    return parse(buffer.str());
}

void RunnerConfig::validate() const {
    shell::RetryStrategy strategy{};
    if (!shell::retryStrategyFromString(runner.defaultRetryStrategy, strategy)) {
        THROW_INVALID_CONFIG_EXCEPTION("Unknown retry strategy '{}'",
                                       runner.defaultRetryStrategy);
    }
    if (runner.defaultTimeoutMs <= 0) {
        THROW_INVALID_CONFIG_EXCEPTION("defaultTimeoutMs must be positive, got {}",
                                       runner.defaultTimeoutMs);
    }
    if (escalation.shortTimeoutMs <= 0 || escalation.longTimeoutMs <= 0) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "Escalation timeouts must be positive, got {} and {}",
            escalation.shortTimeoutMs, escalation.longTimeoutMs);
    }
    if (escalation.shortTimeoutMs > escalation.longTimeoutMs) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "shortTimeoutMs ({}) exceeds longTimeoutMs ({})",
            escalation.shortTimeoutMs, escalation.longTimeoutMs);
    }
    if (escalation.threshold < 0) {
        THROW_INVALID_CONFIG_EXCEPTION("threshold must not be negative, got {}",
                                       escalation.threshold);
    }
    if (!::mortar::logging::logLevelFromString(logging.level)) {
        THROW_INVALID_CONFIG_EXCEPTION("Unknown log level '{}'", logging.level);
    }
}

auto RunnerConfig::runnerOptions() const -> shell::RunnerOptions {
    shell::RunnerOptions options;
    options.defaultTimeout = shell::Timeout(runner.defaultTimeoutMs);
    shell::RetryStrategy strategy = options.defaultStrategy;
    if (shell::retryStrategyFromString(runner.defaultRetryStrategy, strategy)) {
        options.defaultStrategy = strategy;
    }
    return options;
}

auto RunnerConfig::loggerConfig() const -> ::mortar::logging::LoggerConfig {
    ::mortar::logging::LoggerConfig cfg;
    cfg.level = ::mortar::logging::logLevelFromString(logging.level)
                    .value_or(::mortar::logging::LogLevel::INFO);
    cfg.pattern = logging.pattern;
    cfg.console_output = logging.console;
    cfg.log_file_path = logging.file;
    return cfg;
}

void RunnerConfig::applyEscalation(shell::RunnerSharedState& state) const {
    state.escalation().configure(shell::Timeout(escalation.shortTimeoutMs),
                                 shell::Timeout(escalation.longTimeoutMs),
                                 escalation.threshold);
}

}  // namespace mortar::config
