/*
 * process_launcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file process_launcher.hpp
 * @brief Process launcher interface used by the shell runner
 * @date 2024-1-13
 * @version 2.1.0
 */

#ifndef MORTAR_SHELL_EXECUTION_PROCESS_LAUNCHER_HPP
#define MORTAR_SHELL_EXECUTION_PROCESS_LAUNCHER_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <variant>

#include "../output_sink.hpp"
#include "../platform.hpp"
#include "../types.hpp"

namespace mortar::shell {

/**
 * @brief Everything needed to start one shell process
 */
struct LaunchRequest {
    ShellInvocation invocation;              ///< Interpreter, flags, command
    std::filesystem::path workingDirectory;  ///< Start directory
    Timeout timeout{kDefaultTimeout};        ///< Deadline from launch
};

/// Process exited on its own
struct ProcessCompleted {
    int exitCode{0};
    std::chrono::milliseconds runtime{0};
};

/// Deadline fired before the process exited; the process was killed
struct ProcessCancelled {
    std::chrono::milliseconds runtime{0};
};

/// Process could not be started or waited for
struct ProcessFault {
    std::string message;
};

using LaunchOutcome =
    std::variant<ProcessCompleted, ProcessCancelled, ProcessFault>;

/**
 * @brief Abstract process execution collaborator
 *
 * Implementations stream stdout and stderr into the given sinks as data
 * arrives and block until the process exits or the deadline fires.
 * Exceptions thrown by a sink propagate to the caller.
 */
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    virtual auto launch(const LaunchRequest& request, IOutputSink& output,
                        IOutputSink& errors) -> LaunchOutcome = 0;
};

}  // namespace mortar::shell

#endif  // MORTAR_SHELL_EXECUTION_PROCESS_LAUNCHER_HPP
