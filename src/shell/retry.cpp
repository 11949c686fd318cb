/*
 * retry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file retry.cpp
 * @brief Retry loop implementation
 * @date 2024-11-29
 */

#include "retry.hpp"

#include <spdlog/spdlog.h>

namespace mortar::shell {

RetryExecutor::RetryExecutor(TimeoutEscalationPolicy& escalation,
                             std::shared_ptr<spdlog::logger> logger)
    : escalation_(escalation),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

auto RetryExecutor::execute(const ExecutionRequest& request,
                            const Attempt& attempt) -> int {
    auto timeout = request.timeout;
    lastTimeout_ = timeout;

    AttemptReport report = attempt(timeout);
    attemptsMade_ = 1;

    int remaining = kMaxAttempts - 1;
    while (remaining > 0 && shouldRetry(request.strategy, report)) {
        --remaining;
        if (report.timedOut) {
            timeout = escalation_.increase(timeout);
        }
        lastTimeout_ = timeout;
        report = attempt(timeout);
        ++attemptsMade_;
        logger_->debug(
            "EXECUTED {} in {} with exitCode {} and retryStrategy {}",
            request.command, request.workingDirectory.string(),
            report.exitCode, retryStrategyToString(request.strategy));
    }
    return report.exitCode;
}

}  // namespace mortar::shell
