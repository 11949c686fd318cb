/*
 * boost_process_launcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file boost_process_launcher.hpp
 * @brief Process launcher built on Boost.Process and Boost.Asio
 * @date 2024-1-13
 * @version 2.1.0
 */

#ifndef MORTAR_SHELL_EXECUTION_BOOST_PROCESS_LAUNCHER_HPP
#define MORTAR_SHELL_EXECUTION_BOOST_PROCESS_LAUNCHER_HPP

#include "process_launcher.hpp"

namespace mortar::shell {

/**
 * @brief Launches the shell as a child process
 *
 * Runs a private io_context on the calling thread:
 * - stdout and stderr are read through async pipes and pushed to the sinks
 * - a steady timer enforces the deadline and kills the child when it fires
 * - once both streams close, the child is polled until it exits
 *
 * A working directory that does not exist is a ProcessFault; nothing is
 * spawned.
 */
class BoostProcessLauncher final : public IProcessLauncher {
public:
    static constexpr std::chrono::milliseconds kExitPollInterval{5};

    auto launch(const LaunchRequest& request, IOutputSink& output,
                IOutputSink& errors) -> LaunchOutcome override;
};

}  // namespace mortar::shell

#endif  // MORTAR_SHELL_EXECUTION_BOOST_PROCESS_LAUNCHER_HPP
