/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Common type definitions for resilient shell command execution
 * @date 2024-1-13
 * @version 2.1.0
 */

#ifndef MORTAR_SHELL_TYPES_HPP
#define MORTAR_SHELL_TYPES_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

#include <spdlog/fmt/fmt.h>

namespace mortar::shell {

using Timeout = std::chrono::milliseconds;

/// Exit code returned when an attempt was aborted (timeout included)
inline constexpr int kAbortedExitCode = -1;

/// Exit code returned when the process could not be run to completion
inline constexpr int kLaunchFaultExitCode = 1;

/// Upper bound of attempts for a single run (initial attempt plus retries)
inline constexpr int kMaxAttempts = 3;

/// Timeout used by the facade when the caller does not supply one
inline constexpr Timeout kDefaultTimeout = std::chrono::minutes(10);

/**
 * @brief Policy deciding whether a failed attempt is run again
 */
enum class RetryStrategy {
    None,              ///< Never retry
    IfTimeout,         ///< Retry only when the attempt timed out
    IfTimeoutOrFailed  ///< Retry on timeout or non-zero exit code
};

[[nodiscard]] inline std::string_view retryStrategyToString(
    RetryStrategy strategy) noexcept {
    switch (strategy) {
        case RetryStrategy::None: return "none";
        case RetryStrategy::IfTimeout: return "if-timeout";
        case RetryStrategy::IfTimeoutOrFailed: return "if-timeout-or-failed";
    }
    return "if-timeout";
}

/**
 * @brief Parse the string form produced by retryStrategyToString
 * @return false if the name is unknown, leaving @p out untouched
 */
[[nodiscard]] inline bool retryStrategyFromString(std::string_view name,
                                                  RetryStrategy& out) noexcept {
    if (name == "none") {
        out = RetryStrategy::None;
    } else if (name == "if-timeout") {
        out = RetryStrategy::IfTimeout;
    } else if (name == "if-timeout-or-failed") {
        out = RetryStrategy::IfTimeoutOrFailed;
    } else {
        return false;
    }
    return true;
}

/**
 * @brief One call to the runner: what to run, where, and how persistently
 *
 * Command and working directory never change across retries; only the
 * timeout may grow.
 */
struct ExecutionRequest {
    std::string command;                    ///< Shell command text
    std::filesystem::path workingDirectory; ///< Directory the shell starts in
    Timeout timeout{kDefaultTimeout};       ///< Deadline of the first attempt
    RetryStrategy strategy{RetryStrategy::IfTimeout};
};

/**
 * @brief Snapshot of the last call made through a runner
 */
struct ExecutionResult {
    int exitCode{kAbortedExitCode};  ///< Exit code of the final attempt
    std::string output;              ///< Standard output of the final attempt
    std::string errors;              ///< Standard error of the final attempt
    bool timedOut{false};            ///< Whether the final attempt timed out
    std::chrono::milliseconds runtime{0};  ///< Runtime of the final attempt
    int attempts{0};                 ///< Attempts performed by the call
};

/// The process ran to completion and reported an exit code
struct AttemptCompleted {
    int exitCode{0};
    std::chrono::milliseconds runtime{0};
};

/// The deadline elapsed before the process completed
struct AttemptTimedOut {
    std::string message;
};

/// The process could not be started or run to completion
struct AttemptFaulted {
    std::string message;
};

/// Any other failure raised while the attempt was in flight
struct AttemptAborted {
    std::string message;
};

using AttemptOutcome = std::variant<AttemptCompleted, AttemptTimedOut,
                                    AttemptFaulted, AttemptAborted>;

/// Helper for std::visit over the outcome variants
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/**
 * @brief Render a timeout as hh:mm:ss[.fff]
 */
[[nodiscard]] inline std::string formatTimeout(Timeout timeout) {
    const auto totalMs = timeout.count() < 0 ? 0 : timeout.count();
    const auto hours = totalMs / 3'600'000;
    const auto minutes = (totalMs / 60'000) % 60;
    const auto seconds = (totalMs / 1000) % 60;
    const auto millis = totalMs % 1000;

    if (millis != 0) {
        return fmt::format("{:02}:{:02}:{:02}.{:03}", hours, minutes, seconds,
                           millis);
    }
    return fmt::format("{:02}:{:02}:{:02}", hours, minutes, seconds);
}

}  // namespace mortar::shell

#endif  // MORTAR_SHELL_TYPES_HPP
