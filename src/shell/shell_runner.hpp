/*
 * shell_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file shell_runner.hpp
 * @brief Resilient shell command runner
 * @date 2024-1-13
 * @version 2.1.0
 *
 * Runs a command through the host shell in a working directory with:
 * - Incremental stdout/stderr capture into buffers and caller sinks
 * - A deadline per attempt, enforced by killing the process
 * - Up to three attempts, driven by a RetryStrategy
 * - Timeout escalation shared by every runner of the process
 */

#ifndef MORTAR_SHELL_SHELL_RUNNER_HPP
#define MORTAR_SHELL_SHELL_RUNNER_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "execution/process_launcher.hpp"
#include "feedback/console_writer.hpp"
#include "output_sink.hpp"
#include "platform.hpp"
#include "shared_state.hpp"
#include "types.hpp"

namespace mortar::shell {

/**
 * @brief Defaults applied by the facade when the caller omits them
 */
struct RunnerOptions {
    Timeout defaultTimeout{kDefaultTimeout};
    RetryStrategy defaultStrategy{RetryStrategy::IfTimeout};
};

/**
 * @brief Collaborators of a runner; null members select the defaults
 */
struct RunnerDependencies {
    std::shared_ptr<IProcessLauncher> launcher;           ///< BoostProcessLauncher
    std::shared_ptr<feedback::IUserFeedback> feedback;    ///< ConsoleWriter::shared()
    RunnerSharedState* sharedState{nullptr};              ///< RunnerSharedState::instance()
    OsFamily osFamily{currentOsFamily()};
};

/**
 * @brief Runs shell commands with timeout, retries and output capture
 *
 * Every call returns an exit code and never throws for command failures:
 * - the process exit code when the command ran to completion
 * - 1 when the process could not be launched or run to completion
 * - -1 when the attempt timed out or was aborted by an internal failure
 *
 * output(), errors() and hasTimeout() describe the most recent attempt and
 * are reset when the next attempt starts. One call in flight per instance.
 */
class ShellRunner {
public:
    /// Reachability probe whose timeouts are not shown on the console
    static constexpr std::string_view kRemoteProbeCommand =
        "git ls-remote --heads";

    explicit ShellRunner(std::shared_ptr<spdlog::logger> logger = nullptr,
                         RunnerOptions options = {},
                         RunnerDependencies dependencies = {});
    ~ShellRunner();

    ShellRunner(const ShellRunner&) = delete;
    ShellRunner& operator=(const ShellRunner&) = delete;
    ShellRunner(ShellRunner&&) noexcept;
    ShellRunner& operator=(ShellRunner&&) noexcept;

    /**
     * @brief Run in the current directory with the default timeout and
     * strategy
     */
    auto run(std::string_view command) -> int;

    /**
     * @brief Run in the current directory
     */
    auto run(std::string_view command, Timeout timeout,
             RetryStrategy strategy = RetryStrategy::IfTimeout) -> int;

    /**
     * @brief Run in @p path with the default timeout and strategy
     */
    auto runInDirectory(const std::filesystem::path& path,
                        std::string_view command) -> int;

    /**
     * @brief Run in @p path
     */
    auto runInDirectory(const std::filesystem::path& path,
                        std::string_view command, Timeout timeout,
                        RetryStrategy strategy = RetryStrategy::IfTimeout)
        -> int;

    /**
     * @brief Single attempt without retries
     */
    auto runOnce(std::string_view command,
                 const std::filesystem::path& workingDirectory,
                 Timeout timeout) -> int;

    /// Standard output captured by the latest attempt
    [[nodiscard]] auto output() const noexcept -> const std::string&;

    /// Standard error captured by the latest attempt, plus timeout notes
    [[nodiscard]] auto errors() const noexcept -> const std::string&;

    [[nodiscard]] auto hasTimeout() const noexcept -> bool;

    /// Attempts performed by the latest run()/runInDirectory() call
    [[nodiscard]] auto attemptsMade() const noexcept -> int;

    [[nodiscard]] auto lastResult() const -> ExecutionResult;

    /// Stdout of the most recent completed attempt of any runner sharing
    /// this runner's state; advisory under concurrency
    [[nodiscard]] auto lastOutput() const -> std::string;

    [[nodiscard]] auto sharedState() noexcept -> RunnerSharedState&;

    void setOutputSink(std::shared_ptr<IOutputSink> sink);
    void setErrorSink(std::shared_ptr<IOutputSink> sink);
    void setOutputCallback(CallbackOutputSink::Callback callback);
    void setErrorCallback(CallbackOutputSink::Callback callback);

    [[nodiscard]] static auto isRemoteProbeCommand(
        std::string_view command) noexcept -> bool;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace mortar::shell

#endif  // MORTAR_SHELL_SHELL_RUNNER_HPP
