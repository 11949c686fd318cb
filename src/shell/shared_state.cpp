/*
 * shared_state.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-29

Description: Process-wide runner state

**************************************************/

#include "shared_state.hpp"

namespace mortar::shell {

void LastOutputChannel::store(std::string output) {
    std::lock_guard lock(mutex_);
    value_ = std::move(output);
}

auto LastOutputChannel::load() const -> std::string {
    std::lock_guard lock(mutex_);
    return value_;
}

void LastOutputChannel::clear() {
    std::lock_guard lock(mutex_);
    value_.clear();
}

RunnerSharedState::RunnerSharedState(Timeout shortTimeout, Timeout longTimeout,
                                     int threshold)
    : escalation_(shortTimeout, longTimeout, threshold) {}

auto RunnerSharedState::instance() -> RunnerSharedState& {
    static RunnerSharedState state;
    return state;
}

void RunnerSharedState::reset() {
    escalation_.reset();
    lastOutput_.clear();
}

}  // namespace mortar::shell
