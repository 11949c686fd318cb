/*
 * shared_state.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-29

Description: State shared by all runners of a process: timeout escalation
and the last successful output

**************************************************/

#ifndef MORTAR_SHELL_SHARED_STATE_HPP
#define MORTAR_SHELL_SHARED_STATE_HPP

#include <mutex>
#include <string>

#include "timeout_policy.hpp"

namespace mortar::shell {

/**
 * @brief Guarded cell holding the stdout of the latest completed attempt
 *
 * Advisory only: with several runners the value belongs to whichever
 * attempt completed last.
 */
class LastOutputChannel {
public:
    void store(std::string output);

    [[nodiscard]] auto load() const -> std::string;

    void clear();

private:
    mutable std::mutex mutex_;
    std::string value_;
};

/**
 * @brief Bundle of process-wide runner state
 *
 * Runners use instance() unless another state is injected, which lets
 * tests isolate escalation history between cases.
 */
class RunnerSharedState {
public:
    RunnerSharedState() = default;

    RunnerSharedState(Timeout shortTimeout, Timeout longTimeout,
                      int threshold);

    static auto instance() -> RunnerSharedState&;

    [[nodiscard]] auto escalation() noexcept -> TimeoutEscalationPolicy& {
        return escalation_;
    }

    [[nodiscard]] auto lastOutput() noexcept -> LastOutputChannel& {
        return lastOutput_;
    }

    void reset();

private:
    TimeoutEscalationPolicy escalation_;
    LastOutputChannel lastOutput_;
};

}  // namespace mortar::shell

#endif  // MORTAR_SHELL_SHARED_STATE_HPP
