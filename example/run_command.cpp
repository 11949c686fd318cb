/*
 * run_command.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file run_command.cpp
 * @brief Run one shell command through ShellRunner and stream its output
 *
 * Usage:
 *   mortar_run [--config FILE] [--dir DIR] [--timeout-ms N]
 *              [--retry none|if-timeout|if-timeout-or-failed] COMMAND...
 */

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "config/exception.hpp"
#include "config/runner_config.hpp"
#include "logging/log_config.hpp"
#include "shell/shell_runner.hpp"

using namespace mortar;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config FILE] [--dir DIR] [--timeout-ms N]"
                 " [--retry none|if-timeout|if-timeout-or-failed] COMMAND..."
              << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    std::optional<std::string> configPath;
    std::optional<std::string> directory;
    std::optional<long long> timeoutMs;
    std::optional<shell::RetryStrategy> strategy;
    std::vector<std::string> words;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--config" && hasValue) {
            configPath = argv[++i];
        } else if (arg == "--dir" && hasValue) {
            directory = argv[++i];
        } else if (arg == "--timeout-ms" && hasValue) {
            try {
                timeoutMs = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid timeout: " << argv[i] << std::endl;
                return EXIT_FAILURE;
            }
        } else if (arg == "--retry" && hasValue) {
            shell::RetryStrategy parsed{};
            if (!shell::retryStrategyFromString(argv[++i], parsed)) {
                std::cerr << "Unknown retry strategy: " << argv[i] << std::endl;
                return EXIT_FAILURE;
            }
            strategy = parsed;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            words.push_back(arg);
        }
    }

    if (words.empty()) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    config::RunnerConfig cfg;
    if (configPath) {
        try {
            cfg = config::RunnerConfig::loadFromFile(*configPath);
        } catch (const config::BadConfigException& e) {
            std::cerr << "Configuration error: " << e.what() << std::endl;
            return EXIT_FAILURE;
        }
    }

    logging::LogConfig::initialize(cfg.loggerConfig());
    cfg.applyEscalation(shell::RunnerSharedState::instance());

    std::string command;
    for (const auto& word : words) {
        if (!command.empty()) {
            command += ' ';
        }
        command += word;
    }

    shell::ShellRunner runner(logging::LogConfig::getLogger("run"),
                              cfg.runnerOptions());
    runner.setOutputCallback(
        [](std::string_view chunk) { std::cout << chunk << std::flush; });
    runner.setErrorCallback(
        [](std::string_view chunk) { std::cerr << chunk << std::flush; });

    const auto options = cfg.runnerOptions();
    const auto timeout =
        timeoutMs ? shell::Timeout(*timeoutMs) : options.defaultTimeout;
    const auto retry = strategy.value_or(options.defaultStrategy);

    const int exitCode =
        directory ? runner.runInDirectory(*directory, command, timeout, retry)
                  : runner.run(command, timeout, retry);

    logging::LogConfig::flushAll();
    return exitCode < 0 ? EXIT_FAILURE : exitCode;
}
