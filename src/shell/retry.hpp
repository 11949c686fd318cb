/*
 * retry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file retry.hpp
 * @brief Bounded retry loop with timeout escalation
 * @date 2024-11-29
 * @version 2.1.0
 */

#ifndef MORTAR_SHELL_RETRY_HPP
#define MORTAR_SHELL_RETRY_HPP

#include <functional>
#include <memory>

#include <spdlog/logger.h>

#include "timeout_policy.hpp"
#include "types.hpp"

namespace mortar::shell {

/**
 * @brief What one attempt reports back to the retry loop
 */
struct AttemptReport {
    int exitCode{kAbortedExitCode};
    bool timedOut{false};
};

/**
 * @brief Retry decision table
 *
 * | strategy          | retry when                     |
 * |-------------------|--------------------------------|
 * | None              | never                          |
 * | IfTimeout         | timed out                      |
 * | IfTimeoutOrFailed | timed out or exit code != 0    |
 */
[[nodiscard]] constexpr auto shouldRetry(RetryStrategy strategy,
                                         const AttemptReport& report) noexcept
    -> bool {
    switch (strategy) {
        case RetryStrategy::None:
            return false;
        case RetryStrategy::IfTimeout:
            return report.timedOut;
        case RetryStrategy::IfTimeoutOrFailed:
            return report.timedOut || report.exitCode != 0;
    }
    return false;
}

/**
 * @brief Runs an attempt up to kMaxAttempts times
 *
 * After a timed-out attempt the timeout is escalated through the shared
 * TimeoutEscalationPolicy before the next attempt. The loop never throws
 * on its own; it returns the exit code of the last attempt.
 */
class RetryExecutor {
public:
    using Attempt = std::function<AttemptReport(Timeout)>;

    RetryExecutor(TimeoutEscalationPolicy& escalation,
                  std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Execute @p attempt for @p request
     * @return Exit code of the final attempt
     */
    auto execute(const ExecutionRequest& request, const Attempt& attempt)
        -> int;

    /**
     * @brief Attempts performed by the last execute() call
     */
    [[nodiscard]] auto attemptsMade() const noexcept -> int {
        return attemptsMade_;
    }

    /**
     * @brief Timeout used by the last attempt of the last execute() call
     */
    [[nodiscard]] auto lastTimeout() const noexcept -> Timeout {
        return lastTimeout_;
    }

private:
    TimeoutEscalationPolicy& escalation_;
    std::shared_ptr<spdlog::logger> logger_;
    int attemptsMade_{0};
    Timeout lastTimeout_{0};
};

}  // namespace mortar::shell

#endif  // MORTAR_SHELL_RETRY_HPP
