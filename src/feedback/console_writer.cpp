/*
 * console_writer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file console_writer.cpp
 * @brief Console feedback implementation
 * @date 2024-11-28
 */

#include "console_writer.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mortar::feedback {

namespace {
auto makeConsolePrinter() -> std::shared_ptr<spdlog::logger> {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    // Message only; the sink colors the whole line by level
    sink->set_pattern("%^%v%$");
    auto printer = std::make_shared<spdlog::logger>("console", sink);
    printer->set_level(spdlog::level::warn);
    return printer;
}
}  // namespace

ConsoleWriter::ConsoleWriter() : printer_(makeConsolePrinter()) {}

ConsoleWriter::ConsoleWriter(std::shared_ptr<spdlog::logger> printer)
    : printer_(printer ? std::move(printer) : makeConsolePrinter()) {}

void ConsoleWriter::writeWarning(std::string_view text) {
    printer_->warn("{}", text);
}

void ConsoleWriter::writeError(std::string_view text) {
    printer_->error("{}", text);
    printer_->flush();
}

auto ConsoleWriter::shared() -> std::shared_ptr<ConsoleWriter> {
    static const auto writer = std::make_shared<ConsoleWriter>();
    return writer;
}

}  // namespace mortar::feedback
