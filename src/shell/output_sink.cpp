/*
 * output_sink.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file output_sink.cpp
 * @brief Output sink implementations
 * @date 2024-1-13
 */

#include "output_sink.hpp"

namespace mortar::shell {

CallbackOutputSink::CallbackOutputSink(Callback callback)
    : callback_(std::move(callback)) {}

void CallbackOutputSink::append(std::string_view chunk) {
    if (callback_) {
        callback_(chunk);
    }
}

TeeOutputSink::TeeOutputSink(std::string& buffer,
                             IOutputSink& forward) noexcept
    : buffer_(buffer), forward_(forward) {}

void TeeOutputSink::append(std::string_view chunk) {
    buffer_.append(chunk);
    forward_.append(chunk);
}

auto nullOutputSink() -> std::shared_ptr<IOutputSink> {
    static const auto sink = std::make_shared<NullOutputSink>();
    return sink;
}

}  // namespace mortar::shell
