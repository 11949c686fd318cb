/*
 * timeout_policy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file timeout_policy.hpp
 * @brief Timeout escalation shared by every runner of a process
 * @date 2024-11-29
 * @version 2.1.0
 */

#ifndef MORTAR_SHELL_TIMEOUT_POLICY_HPP
#define MORTAR_SHELL_TIMEOUT_POLICY_HPP

#include <atomic>
#include <chrono>

#include "types.hpp"

namespace mortar::shell {

/**
 * @brief Tracks observed timeouts and chooses timeout budgets
 *
 * Repeated timeouts are taken as evidence of a slow environment: once more
 * than `threshold` escalations were recorded, fresh requests start with the
 * long timeout instead of the short one. Retries in flight escalate
 * independently through increase().
 *
 * The counter is atomic; concurrent runners may interleave increments but
 * never lose them.
 */
class TimeoutEscalationPolicy {
public:
    static constexpr Timeout kShortTimeout = std::chrono::seconds(30);
    static constexpr Timeout kLongTimeout = std::chrono::minutes(10);
    static constexpr int kLongTimeoutThreshold = 1;

    TimeoutEscalationPolicy() = default;

    TimeoutEscalationPolicy(Timeout shortTimeout, Timeout longTimeout,
                            int threshold) noexcept;

    TimeoutEscalationPolicy(const TimeoutEscalationPolicy&) = delete;
    TimeoutEscalationPolicy& operator=(const TimeoutEscalationPolicy&) = delete;

    /**
     * @brief Record a timeout and return the budget for the next attempt
     *
     * Raises @p previous to the long timeout; never shrinks it and never
     * grows it past the long timeout.
     */
    auto increase(Timeout previous) noexcept -> Timeout;

    /**
     * @brief Budget for a fresh request
     */
    [[nodiscard]] auto startingTimeout() const noexcept -> Timeout;

    [[nodiscard]] auto failureCount() const noexcept -> int;

    [[nodiscard]] auto shortTimeout() const noexcept -> Timeout {
        return shortTimeout_;
    }

    [[nodiscard]] auto longTimeout() const noexcept -> Timeout {
        return longTimeout_;
    }

    /**
     * @brief Replace durations and threshold; the counter is kept
     *
     * Not synchronized with readers; call before runners start.
     */
    void configure(Timeout shortTimeout, Timeout longTimeout,
                   int threshold) noexcept;

    void reset() noexcept;

private:
    Timeout shortTimeout_{kShortTimeout};
    Timeout longTimeout_{kLongTimeout};
    int threshold_{kLongTimeoutThreshold};
    std::atomic<int> failures_{0};
};

}  // namespace mortar::shell

#endif  // MORTAR_SHELL_TIMEOUT_POLICY_HPP
