/*
 * platform.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file platform.hpp
 * @brief Host OS family probe and shell interpreter selection
 * @date 2024-1-13
 * @version 2.1.0
 */

#ifndef MORTAR_SHELL_PLATFORM_HPP
#define MORTAR_SHELL_PLATFORM_HPP

#include <string>
#include <string_view>
#include <vector>

namespace mortar::shell {

/**
 * @brief OS families that need a distinct shell convention
 */
enum class OsFamily {
    Unix,    ///< Linux, macOS and other POSIX hosts
    Windows  ///< Windows hosts
};

/**
 * @brief OS family the binary was built for
 */
[[nodiscard]] constexpr auto currentOsFamily() noexcept -> OsFamily {
#ifdef _WIN32
    return OsFamily::Windows;
#else
    return OsFamily::Unix;
#endif
}

[[nodiscard]] constexpr auto isUnixHost() noexcept -> bool {
    return currentOsFamily() == OsFamily::Unix;
}

/**
 * @brief A fully resolved shell call for one command
 */
struct ShellInvocation {
    std::string interpreter;         ///< Interpreter binary
    std::vector<std::string> flags;  ///< Non-interactive execution flags
    std::string command;             ///< Caller's command text, untouched

    /**
     * @brief Flags followed by the quoted command, e.g. `-lc "echo hi"`
     */
    [[nodiscard]] auto commandLine() const -> std::string;

    /**
     * @brief Argument vector form: flags then the raw command
     */
    [[nodiscard]] auto arguments() const -> std::vector<std::string>;
};

/**
 * @brief Pick the interpreter and flags for @p family and bind @p command
 */
[[nodiscard]] auto selectShell(OsFamily family, std::string_view command)
    -> ShellInvocation;

}  // namespace mortar::shell

#endif  // MORTAR_SHELL_PLATFORM_HPP
