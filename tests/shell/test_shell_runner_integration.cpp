/*
 * test_shell_runner_integration.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_shell_runner_integration.cpp
 * @brief ShellRunner against the real host shell
 */

#include <gtest/gtest.h>

#include "shell/execution/boost_process_launcher.hpp"
#include "shell/shell_runner.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <spdlog/sinks/null_sink.h>

using namespace mortar::shell;
using namespace std::chrono_literals;

namespace {

class SilentFeedback : public mortar::feedback::IUserFeedback {
public:
    void writeWarning(std::string_view text) override {
        warnings.emplace_back(text);
    }
    void writeError(std::string_view text) override {
        errors.emplace_back(text);
    }

    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

}  // namespace

class ShellRunnerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
#ifdef _WIN32
        GTEST_SKIP() << "Integration tests drive /bin/bash";
#endif
        const auto* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir_ = std::filesystem::temp_directory_path() /
                   (std::string("mortar_runner_") + info->name());
        std::filesystem::create_directories(tempDir_);

        auto logger = std::make_shared<spdlog::logger>(
            "runner-integration",
            std::make_shared<spdlog::sinks::null_sink_mt>());
        RunnerDependencies deps;
        deps.feedback = feedback_;
        deps.sharedState = &state_;
        runner_ = std::make_unique<ShellRunner>(logger, RunnerOptions{},
                                                std::move(deps));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tempDir_, ec);
    }

    std::filesystem::path tempDir_;
    RunnerSharedState state_;
    std::shared_ptr<SilentFeedback> feedback_ =
        std::make_shared<SilentFeedback>();
    std::unique_ptr<ShellRunner> runner_;
};

TEST_F(ShellRunnerIntegrationTest, EchoCapturesStdout) {
    EXPECT_EQ(runner_->runInDirectory(tempDir_, "echo hello", 10s), 0);
    EXPECT_EQ(runner_->output(), "hello\n");
    EXPECT_EQ(runner_->errors().find("hello"), std::string::npos);
    EXPECT_FALSE(runner_->hasTimeout());
    EXPECT_EQ(runner_->attemptsMade(), 1);
    EXPECT_EQ(runner_->lastOutput(), "hello\n");
}

TEST_F(ShellRunnerIntegrationTest, StderrIsCapturedSeparately) {
    EXPECT_EQ(runner_->runInDirectory(tempDir_, "echo oops 1>&2", 10s), 0);
    EXPECT_TRUE(runner_->output().empty());
    // The login profile may write to stderr ahead of the command
    const auto& errors = runner_->errors();
    ASSERT_GE(errors.size(), 5u);
    EXPECT_EQ(errors.substr(errors.size() - 5), "oops\n");
}

TEST_F(ShellRunnerIntegrationTest, FailingCommandIsRetriedWhenAsked) {
    EXPECT_EQ(runner_->runInDirectory(tempDir_, "exit 7", 10s,
                                      RetryStrategy::IfTimeoutOrFailed),
              7);
    EXPECT_EQ(runner_->attemptsMade(), 3);
}

TEST_F(ShellRunnerIntegrationTest, FailingCommandRunsOnceByDefault) {
    EXPECT_EQ(runner_->runInDirectory(tempDir_, "exit 3", 10s), 3);
    EXPECT_EQ(runner_->attemptsMade(), 1);
}

TEST_F(ShellRunnerIntegrationTest, SlowCommandIsKilledAtDeadline) {
    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(runner_->runInDirectory(tempDir_, "sleep 5", 50ms,
                                      RetryStrategy::None),
              kAbortedExitCode);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);

    EXPECT_TRUE(runner_->hasTimeout());
    EXPECT_NE(runner_->errors().find("Running timeout at 00:00:00.050 for "
                                     "command sleep 5"),
              std::string::npos);
    ASSERT_EQ(feedback_->warnings.size(), 1u);
}

TEST_F(ShellRunnerIntegrationTest, WorkingDirectoryIsHonored) {
    ASSERT_EQ(runner_->runInDirectory(tempDir_, "pwd", 10s), 0);
    const auto reported = std::filesystem::path(
        runner_->output().substr(0, runner_->output().find('\n')));
    EXPECT_TRUE(std::filesystem::equivalent(reported, tempDir_));
}

TEST_F(ShellRunnerIntegrationTest, MissingDirectoryIsLaunchFault) {
    EXPECT_EQ(runner_->runInDirectory(tempDir_ / "does-not-exist", "pwd", 10s,
                                      RetryStrategy::None),
              kLaunchFaultExitCode);
    EXPECT_FALSE(runner_->hasTimeout());
    EXPECT_TRUE(runner_->output().empty());
    EXPECT_TRUE(runner_->lastOutput().empty());
}

TEST_F(ShellRunnerIntegrationTest, RegularFileIsNotAWorkingDirectory) {
    const auto file = tempDir_ / "plain.txt";
    std::ofstream(file) << "x";
    EXPECT_EQ(runner_->runInDirectory(file, "pwd", 10s, RetryStrategy::None),
              kLaunchFaultExitCode);
    EXPECT_TRUE(runner_->output().empty());
}

TEST_F(ShellRunnerIntegrationTest, LauncherRefusesMissingDirectory) {
    BoostProcessLauncher launcher;
    std::string out;
    CallbackOutputSink sink([&](std::string_view chunk) { out.append(chunk); });
    const LaunchRequest request{selectShell(currentOsFamily(), "touch marker"),
                                tempDir_ / "missing", 10s};

    const auto outcome = launcher.launch(request, sink, sink);
    EXPECT_TRUE(std::holds_alternative<ProcessFault>(outcome));
    EXPECT_TRUE(out.empty());
    EXPECT_FALSE(std::filesystem::exists(tempDir_ / "missing"));
    std::error_code ec;
    EXPECT_FALSE(std::filesystem::exists(
        std::filesystem::current_path(ec) / "marker"));
}

TEST_F(ShellRunnerIntegrationTest, CallbackSeesStreamedOutput) {
    std::string streamed;
    runner_->setOutputCallback(
        [&](std::string_view chunk) { streamed.append(chunk); });

    EXPECT_EQ(runner_->runInDirectory(tempDir_, "printf 'a\\nb\\n'", 10s), 0);
    EXPECT_EQ(streamed, "a\nb\n");
    EXPECT_EQ(runner_->output(), "a\nb\n");
}

TEST_F(ShellRunnerIntegrationTest, OutputIsResetBetweenRuns) {
    runner_->runInDirectory(tempDir_, "echo A", 10s);
    runner_->runInDirectory(tempDir_, "echo B", 10s);
    EXPECT_EQ(runner_->output(), "B\n");
}
