/*
 * test_output_sink.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_output_sink.cpp
 * @brief Tests for output sinks
 */

#include <gtest/gtest.h>
#include "shell/output_sink.hpp"

#include <string>
#include <vector>

using namespace mortar::shell;

TEST(OutputSinkTest, CallbackSinkForwardsChunks) {
    std::vector<std::string> chunks;
    CallbackOutputSink sink(
        [&](std::string_view chunk) { chunks.emplace_back(chunk); });
    sink.append("ab");
    sink.append("c");
    EXPECT_EQ(chunks, (std::vector<std::string>{"ab", "c"}));
}

TEST(OutputSinkTest, CallbackSinkToleratesEmptyCallback) {
    CallbackOutputSink sink(nullptr);
    EXPECT_NO_THROW(sink.append("ignored"));
}

TEST(OutputSinkTest, TeeWritesBufferAndForward) {
    std::string buffer;
    std::string forwarded;
    CallbackOutputSink forward(
        [&](std::string_view chunk) { forwarded.append(chunk); });
    TeeOutputSink tee(buffer, forward);

    tee.append("line 1\n");
    tee.append("line 2\n");

    EXPECT_EQ(buffer, "line 1\nline 2\n");
    EXPECT_EQ(forwarded, buffer);
}

TEST(OutputSinkTest, TeeFillsBufferBeforeForwarding) {
    std::string buffer;
    std::string seenByForward;
    CallbackOutputSink forward(
        [&](std::string_view) { seenByForward = buffer; });
    TeeOutputSink tee(buffer, forward);

    tee.append("x");
    EXPECT_EQ(seenByForward, "x");
}

TEST(OutputSinkTest, SharedNullSinkIsSingleton) {
    auto a = nullOutputSink();
    auto b = nullOutputSink();
    EXPECT_EQ(a.get(), b.get());
    EXPECT_NO_THROW(a->append("dropped"));
}
