/*
 * console_writer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file console_writer.hpp
 * @brief User-facing console feedback, independent of the log
 * @date 2024-11-28
 * @version 1.0.0
 */

#ifndef MORTAR_FEEDBACK_CONSOLE_WRITER_HPP
#define MORTAR_FEEDBACK_CONSOLE_WRITER_HPP

#include <memory>
#include <string_view>

#include <spdlog/logger.h>

namespace mortar::feedback {

/**
 * @brief Destination for warnings and errors meant for the person at the
 * terminal
 */
class IUserFeedback {
public:
    virtual ~IUserFeedback() = default;

    virtual void writeWarning(std::string_view text) = 0;

    virtual void writeError(std::string_view text) = 0;
};

/**
 * @brief Prints feedback to stderr, colored by severity
 */
class ConsoleWriter final : public IUserFeedback {
public:
    ConsoleWriter();

    /**
     * @brief Write through a caller-provided logger instead of stderr
     */
    explicit ConsoleWriter(std::shared_ptr<spdlog::logger> printer);

    void writeWarning(std::string_view text) override;

    void writeError(std::string_view text) override;

    /**
     * @brief Shared writer used by runners without injected feedback
     */
    static auto shared() -> std::shared_ptr<ConsoleWriter>;

private:
    std::shared_ptr<spdlog::logger> printer_;
};

}  // namespace mortar::feedback

#endif  // MORTAR_FEEDBACK_CONSOLE_WRITER_HPP
