/*
 * timeout_policy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file timeout_policy.cpp
 * @brief Timeout escalation implementation
 * @date 2024-11-29
 */

#include "timeout_policy.hpp"

#include <spdlog/spdlog.h>

namespace mortar::shell {

TimeoutEscalationPolicy::TimeoutEscalationPolicy(Timeout shortTimeout,
                                                 Timeout longTimeout,
                                                 int threshold) noexcept
    : shortTimeout_(shortTimeout),
      longTimeout_(longTimeout),
      threshold_(threshold) {}

auto TimeoutEscalationPolicy::increase(Timeout previous) noexcept -> Timeout {
    const int failures = failures_.fetch_add(1, std::memory_order_relaxed) + 1;
    spdlog::debug("TimeoutEscalationPolicy: {} timeout(s) observed", failures);
    return previous < longTimeout_ ? longTimeout_ : previous;
}

auto TimeoutEscalationPolicy::startingTimeout() const noexcept -> Timeout {
    if (failures_.load(std::memory_order_relaxed) > threshold_) {
        return longTimeout_;
    }
    return shortTimeout_;
}

auto TimeoutEscalationPolicy::failureCount() const noexcept -> int {
    return failures_.load(std::memory_order_relaxed);
}

void TimeoutEscalationPolicy::configure(Timeout shortTimeout,
                                        Timeout longTimeout,
                                        int threshold) noexcept {
    shortTimeout_ = shortTimeout;
    longTimeout_ = longTimeout;
    threshold_ = threshold;
}

void TimeoutEscalationPolicy::reset() noexcept {
    failures_.store(0, std::memory_order_relaxed);
}

}  // namespace mortar::shell
