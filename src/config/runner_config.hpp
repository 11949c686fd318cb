/*
 * runner_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Runner, timeout escalation and logging configuration

**************************************************/

#ifndef MORTAR_CONFIG_RUNNER_CONFIG_HPP
#define MORTAR_CONFIG_RUNNER_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "logging/log_config.hpp"
#include "shell/shared_state.hpp"
#include "shell/shell_runner.hpp"

namespace mortar::config {

using json = nlohmann::json;

/**
 * @brief Facade defaults
 */
struct RunnerSection {
    std::int64_t defaultTimeoutMs{600000};          ///< Timeout when none is given
    std::string defaultRetryStrategy{"if-timeout"}; ///< none, if-timeout, if-timeout-or-failed

    [[nodiscard]] json toJson() const {
        return {{"defaultTimeoutMs", defaultTimeoutMs},
                {"defaultRetryStrategy", defaultRetryStrategy}};
    }

    [[nodiscard]] static RunnerSection fromJson(const json& j) {
        RunnerSection cfg;
        cfg.defaultTimeoutMs = j.value("defaultTimeoutMs", cfg.defaultTimeoutMs);
        cfg.defaultRetryStrategy =
            j.value("defaultRetryStrategy", cfg.defaultRetryStrategy);
        return cfg;
    }
};

/**
 * @brief Timeout escalation tuning
 */
struct EscalationSection {
    std::int64_t shortTimeoutMs{30000};   ///< Budget of fresh requests
    std::int64_t longTimeoutMs{600000};   ///< Budget after escalation
    int threshold{1};                     ///< Timeouts tolerated before starting long

    [[nodiscard]] json toJson() const {
        return {{"shortTimeoutMs", shortTimeoutMs},
                {"longTimeoutMs", longTimeoutMs},
                {"threshold", threshold}};
    }

    [[nodiscard]] static EscalationSection fromJson(const json& j) {
        EscalationSection cfg;
        cfg.shortTimeoutMs = j.value("shortTimeoutMs", cfg.shortTimeoutMs);
        cfg.longTimeoutMs = j.value("longTimeoutMs", cfg.longTimeoutMs);
        cfg.threshold = j.value("threshold", cfg.threshold);
        return cfg;
    }
};

/**
 * @brief Logging configuration
 */
struct LoggingSection {
    std::string level{"info"};
    std::string pattern{"[%H:%M:%S.%e] [%^%l%$] [%n] %v"};
    bool console{true};
    std::string file;  ///< Rotating log file, empty to disable

    [[nodiscard]] json toJson() const {
        return {{"level", level},
                {"pattern", pattern},
                {"console", console},
                {"file", file}};
    }

    [[nodiscard]] static LoggingSection fromJson(const json& j) {
        LoggingSection cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.console = j.value("console", cfg.console);
        cfg.file = j.value("file", cfg.file);
        return cfg;
    }
};

/**
 * @brief Complete configuration document
 *
 * Every section and key is optional. fromJson() validates the result and
 * throws InvalidConfigException on bad values.
 */
struct RunnerConfig {
    RunnerSection runner;
    EscalationSection escalation;
    LoggingSection logging;

    [[nodiscard]] json toJson() const;

    [[nodiscard]] static RunnerConfig fromJson(const json& j);

    /**
     * @brief Parse a JSON document
     * @throws InvalidConfigException on malformed JSON or bad values
     */
    [[nodiscard]] static RunnerConfig parse(std::string_view text);

    /**
     * @brief Read and parse a JSON file
     * @throws ConfigIOException when the file cannot be read
     * @throws InvalidConfigException on malformed JSON or bad values
     */
    [[nodiscard]] static RunnerConfig loadFromFile(
        const std::filesystem::path& path);

    void validate() const;

    [[nodiscard]] auto runnerOptions() const -> shell::RunnerOptions;

    [[nodiscard]] auto loggerConfig() const -> ::mortar::logging::LoggerConfig;

    /**
     * @brief Push escalation durations and threshold into @p state
     */
    void applyEscalation(shell::RunnerSharedState& state) const;
};

}  // namespace mortar::config

#endif  // MORTAR_CONFIG_RUNNER_CONFIG_HPP
