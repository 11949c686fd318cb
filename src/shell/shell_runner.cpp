/*
 * shell_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file shell_runner.cpp
 * @brief Resilient shell command runner implementation
 * @date 2024-1-13
 */

#include "shell_runner.hpp"

#include <system_error>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "execution/boost_process_launcher.hpp"
#include "logging/log_config.hpp"
#include "retry.hpp"

namespace mortar::shell {

class ShellRunner::Impl {
public:
    Impl(std::shared_ptr<spdlog::logger> logger, RunnerOptions options,
         RunnerDependencies dependencies)
        : logger_(logger ? std::move(logger)
                         : logging::LogConfig::getLogger("shell")),
          options_(options),
          launcher_(dependencies.launcher
                        ? std::move(dependencies.launcher)
                        : std::make_shared<BoostProcessLauncher>()),
          feedback_(dependencies.feedback
                        ? std::move(dependencies.feedback)
                        : feedback::ConsoleWriter::shared()),
          shared_(dependencies.sharedState ? dependencies.sharedState
                                           : &RunnerSharedState::instance()),
          osFamily_(dependencies.osFamily) {}

    auto runWithRetries(const ExecutionRequest& request) -> int {
        RetryExecutor retry(shared_->escalation(), logger_);
        const int exitCode =
            retry.execute(request, [&](Timeout timeout) {
                const int code =
                    runOnce(request.command, request.workingDirectory, timeout);
                return AttemptReport{code, hasTimeout_};
            });
        attemptsMade_ = retry.attemptsMade();
        return exitCode;
    }

    auto runOnce(std::string_view command,
                 const std::filesystem::path& workingDirectory,
                 Timeout timeout) -> int {
        const auto outcome = attempt(command, workingDirectory, timeout);
        lastExitCode_ = std::visit(
            Overloaded{
                [](const AttemptCompleted& completed) {
                    return completed.exitCode;
                },
                [&](const AttemptFaulted& fault) {
                    MORTAR_LOG_DEBUG(logger_,
                                     "Failed to run {} in {}: {}", command,
                                     workingDirectory.string(), fault.message);
                    return kLaunchFaultExitCode;
                },
                [&](const AttemptTimedOut& timedOut) {
                    if (!isRemoteProbeCommand(command)) {
                        feedback_->writeWarning(timedOut.message);
                    }
                    MORTAR_LOG_WARN(logger_, "{}", timedOut.message);
                    return kAbortedExitCode;
                },
                [&](const AttemptAborted& aborted) {
                    feedback_->writeError(aborted.message);
                    MORTAR_LOG_ERROR(logger_, "{}", aborted.message);
                    return kAbortedExitCode;
                }},
            outcome);
        return lastExitCode_;
    }

    auto attempt(std::string_view command,
                 const std::filesystem::path& workingDirectory,
                 Timeout timeout) -> AttemptOutcome {
        beforeRun();

        LaunchRequest request{selectShell(osFamily_, command), workingDirectory,
                              timeout};
        TeeOutputSink outputTee(output_, *outputSink_);
        TeeOutputSink errorTee(errors_, *errorSink_);

        try {
            // A non-positive deadline has already elapsed
            const LaunchOutcome launched =
                timeout <= Timeout::zero()
                    ? LaunchOutcome{ProcessCancelled{}}
                    : launcher_->launch(request, outputTee, errorTee);

            return std::visit(
                Overloaded{
                    [&](const ProcessCompleted& done) -> AttemptOutcome {
                        runtime_ = done.runtime;
                        shared_->lastOutput().store(output_);
                        MORTAR_LOG_INFO(
                            logger_, "EXECUTED {} in {} in {}ms with exitCode {}",
                            command, workingDirectory.string(),
                            done.runtime.count(), done.exitCode);
                        return AttemptCompleted{done.exitCode, done.runtime};
                    },
                    [&](const ProcessCancelled& cancelled) -> AttemptOutcome {
                        runtime_ = cancelled.runtime;
                        hasTimeout_ = true;
                        auto message = fmt::format(
                            "Running timeout at {} for command {} in {}",
                            formatTimeout(timeout), command,
                            workingDirectory.string());
                        errors_ += message;
                        errors_ += '\n';
                        return AttemptTimedOut{std::move(message)};
                    },
                    [](const ProcessFault& fault) -> AttemptOutcome {
                        return AttemptFaulted{fault.message};
                    }},
                launched);
        } catch (const std::exception& e) {
            return AttemptAborted{
                fmt::format("Command {} in {} aborted: {}", command,
                            workingDirectory.string(), e.what())};
        }
    }

    void beforeRun() {
        output_.clear();
        errors_.clear();
        hasTimeout_ = false;
        runtime_ = std::chrono::milliseconds{0};
    }

    auto currentDirectory() const -> std::filesystem::path {
        std::error_code ec;
        auto path = std::filesystem::current_path(ec);
        if (ec) {
            MORTAR_LOG_WARN(logger_,
                            "Cannot resolve current directory ({}), using '.'",
                            ec.message());
            return std::filesystem::path(".");
        }
        return path;
    }

    std::shared_ptr<spdlog::logger> logger_;
    RunnerOptions options_;
    std::shared_ptr<IProcessLauncher> launcher_;
    std::shared_ptr<feedback::IUserFeedback> feedback_;
    RunnerSharedState* shared_;
    OsFamily osFamily_;

    std::shared_ptr<IOutputSink> outputSink_{nullOutputSink()};
    std::shared_ptr<IOutputSink> errorSink_{nullOutputSink()};

    std::string output_;
    std::string errors_;
    bool hasTimeout_{false};
    std::chrono::milliseconds runtime_{0};
    int lastExitCode_{kAbortedExitCode};
    int attemptsMade_{0};
};

ShellRunner::ShellRunner(std::shared_ptr<spdlog::logger> logger,
                         RunnerOptions options,
                         RunnerDependencies dependencies)
    : pImpl_(std::make_unique<Impl>(std::move(logger), options,
                                    std::move(dependencies))) {}

ShellRunner::~ShellRunner() = default;

ShellRunner::ShellRunner(ShellRunner&&) noexcept = default;
ShellRunner& ShellRunner::operator=(ShellRunner&&) noexcept = default;

auto ShellRunner::run(std::string_view command) -> int {
    return run(command, pImpl_->options_.defaultTimeout,
               pImpl_->options_.defaultStrategy);
}

auto ShellRunner::run(std::string_view command, Timeout timeout,
                      RetryStrategy strategy) -> int {
    return runInDirectory(pImpl_->currentDirectory(), command, timeout,
                          strategy);
}

auto ShellRunner::runInDirectory(const std::filesystem::path& path,
                                 std::string_view command) -> int {
    return runInDirectory(path, command, pImpl_->options_.defaultTimeout,
                          pImpl_->options_.defaultStrategy);
}

auto ShellRunner::runInDirectory(const std::filesystem::path& path,
                                 std::string_view command, Timeout timeout,
                                 RetryStrategy strategy) -> int {
    return pImpl_->runWithRetries(
        ExecutionRequest{std::string(command), path, timeout, strategy});
}

auto ShellRunner::runOnce(std::string_view command,
                          const std::filesystem::path& workingDirectory,
                          Timeout timeout) -> int {
    pImpl_->attemptsMade_ = 1;
    return pImpl_->runOnce(command, workingDirectory, timeout);
}

auto ShellRunner::output() const noexcept -> const std::string& {
    return pImpl_->output_;
}

auto ShellRunner::errors() const noexcept -> const std::string& {
    return pImpl_->errors_;
}

auto ShellRunner::hasTimeout() const noexcept -> bool {
    return pImpl_->hasTimeout_;
}

auto ShellRunner::attemptsMade() const noexcept -> int {
    return pImpl_->attemptsMade_;
}

auto ShellRunner::lastResult() const -> ExecutionResult {
    return ExecutionResult{pImpl_->lastExitCode_, pImpl_->output_,
                           pImpl_->errors_,       pImpl_->hasTimeout_,
                           pImpl_->runtime_,      pImpl_->attemptsMade_};
}

auto ShellRunner::lastOutput() const -> std::string {
    return pImpl_->shared_->lastOutput().load();
}

auto ShellRunner::sharedState() noexcept -> RunnerSharedState& {
    return *pImpl_->shared_;
}

void ShellRunner::setOutputSink(std::shared_ptr<IOutputSink> sink) {
    pImpl_->outputSink_ = sink ? std::move(sink) : nullOutputSink();
}

void ShellRunner::setErrorSink(std::shared_ptr<IOutputSink> sink) {
    pImpl_->errorSink_ = sink ? std::move(sink) : nullOutputSink();
}

void ShellRunner::setOutputCallback(CallbackOutputSink::Callback callback) {
    setOutputSink(std::make_shared<CallbackOutputSink>(std::move(callback)));
}

void ShellRunner::setErrorCallback(CallbackOutputSink::Callback callback) {
    setErrorSink(std::make_shared<CallbackOutputSink>(std::move(callback)));
}

auto ShellRunner::isRemoteProbeCommand(std::string_view command) noexcept
    -> bool {
    return command == kRemoteProbeCommand;
}

}  // namespace mortar::shell
