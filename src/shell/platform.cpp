/*
 * platform.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file platform.cpp
 * @brief Shell interpreter selection table
 * @date 2024-1-13
 */

#include "platform.hpp"

#include <array>

namespace mortar::shell {

namespace {

struct ShellProfile {
    OsFamily family;
    std::string_view interpreter;
    std::array<std::string_view, 2> flags;
    std::size_t flagCount;
};

constexpr std::array<ShellProfile, 2> kShellProfiles{{
    {OsFamily::Unix, "/bin/bash", {"-lc", ""}, 1},
    {OsFamily::Windows, "cmd", {"/D", "/C"}, 2},
}};

}  // namespace

auto ShellInvocation::commandLine() const -> std::string {
    std::string line;
    for (const auto& flag : flags) {
        line += flag;
        line += ' ';
    }
    line += '"';
    line += command;
    line += '"';
    return line;
}

auto ShellInvocation::arguments() const -> std::vector<std::string> {
    std::vector<std::string> args(flags);
    args.push_back(command);
    return args;
}

auto selectShell(OsFamily family, std::string_view command)
    -> ShellInvocation {
    const ShellProfile* profile = &kShellProfiles.front();
    for (const auto& candidate : kShellProfiles) {
        if (candidate.family == family) {
            profile = &candidate;
            break;
        }
    }

    ShellInvocation invocation;
    invocation.interpreter = std::string(profile->interpreter);
    for (std::size_t i = 0; i < profile->flagCount; ++i) {
        invocation.flags.emplace_back(profile->flags[i]);
    }
    invocation.command = std::string(command);
    return invocation;
}

}  // namespace mortar::shell
