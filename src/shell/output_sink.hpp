/*
 * output_sink.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file output_sink.hpp
 * @brief Incremental destinations for process output streams
 * @date 2024-1-13
 * @version 2.1.0
 */

#ifndef MORTAR_SHELL_OUTPUT_SINK_HPP
#define MORTAR_SHELL_OUTPUT_SINK_HPP

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace mortar::shell {

/**
 * @brief Receives consecutive, non-overlapping chunks of one stream
 *
 * Chunks arrive in stream order. Implementations must not assume they are
 * called on the thread that started the command.
 */
class IOutputSink {
public:
    virtual ~IOutputSink() = default;

    virtual void append(std::string_view chunk) = 0;
};

/**
 * @brief Sink that discards everything
 */
class NullOutputSink final : public IOutputSink {
public:
    void append(std::string_view) override {}
};

/**
 * @brief Sink forwarding each chunk to a callable
 */
class CallbackOutputSink final : public IOutputSink {
public:
    using Callback = std::function<void(std::string_view)>;

    explicit CallbackOutputSink(Callback callback);

    void append(std::string_view chunk) override;

private:
    Callback callback_;
};

/**
 * @brief Writes every chunk into an accumulating buffer and a second sink
 *
 * Both destinations always see the chunk, buffer first.
 */
class TeeOutputSink final : public IOutputSink {
public:
    TeeOutputSink(std::string& buffer, IOutputSink& forward) noexcept;

    void append(std::string_view chunk) override;

private:
    std::string& buffer_;
    IOutputSink& forward_;
};

/**
 * @brief Shared no-op sink used as the runner default
 */
[[nodiscard]] auto nullOutputSink() -> std::shared_ptr<IOutputSink>;

}  // namespace mortar::shell

#endif  // MORTAR_SHELL_OUTPUT_SINK_HPP
