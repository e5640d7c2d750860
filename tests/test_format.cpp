// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file test_format.cpp
/// @brief Tests for output rendering and end-of-tool payloads

#include <gtest/gtest.h>
#include <string>
#include <toolevents/format.hpp>

using namespace toolevents;
using namespace std::chrono_literals;

namespace
{

std::string numbered_lines(int count)
{
    std::string out;
    for (int i = 0; i < count; ++i)
        out += "line " + std::to_string(i) + "\n";
    return out;
}

} // namespace

// =============================================================================
// Truncation
// =============================================================================

TEST(TruncateTest, ShortOutputIsUnchanged)
{
    EXPECT_EQ(truncate_for_model("a\nb\n"), "a\nb\n");
    EXPECT_EQ(truncate_for_model(""), "");
}

TEST(TruncateTest, TooManyLinesKeepsHeadAndTail)
{
    auto text = truncate_for_model(numbered_lines(300));

    EXPECT_EQ(text.rfind("Total output lines: 300\n\n", 0), 0u);
    EXPECT_NE(text.find("line 0\n"), std::string::npos);
    EXPECT_NE(text.find("line 127\n"), std::string::npos);
    EXPECT_EQ(text.find("line 128\n"), std::string::npos);
    EXPECT_EQ(text.find("line 171\n"), std::string::npos);
    EXPECT_NE(text.find("line 172\n"), std::string::npos);
    EXPECT_NE(text.find("line 299\n"), std::string::npos);
    EXPECT_NE(text.find("\n[... omitted 44 of 300 lines ...]\n\n"), std::string::npos);
}

TEST(TruncateTest, ByteLimitIsRespected)
{
    OutputFormatOptions options;
    options.max_bytes = 64;
    std::string long_line(500, 'x');

    auto text = truncate_for_model(long_line + "\n" + long_line + "\n", options);

    EXPECT_LE(text.size(), 64u + 64u);
    EXPECT_NE(text.find("omitted 0 of 2 lines"), std::string::npos);
}

TEST(TruncateTest, DoesNotSplitMultibyteCharacters)
{
    OutputFormatOptions options;
    options.max_bytes = 42;
    // Each "é" is two bytes; a 21-byte head budget would cut one in half
    std::string accents;
    for (int i = 0; i < 100; ++i)
        accents += "\xC3\xA9";

    auto text = truncate_for_model(accents, options);

    auto marker = text.find("[... omitted");
    ASSERT_NE(marker, std::string::npos);
    std::string head = text.substr(0, marker);
    auto body_start = head.find("\n\n") + 2;
    EXPECT_EQ((head.size() - body_start - 1) % 2, 0u);
}

// =============================================================================
// Exec Output Rendering
// =============================================================================

TEST(FormatExecOutputTest, UsesAggregatedOutput)
{
    ExecToolCallOutput output;
    output.stdout_stream.text = "out\n";
    output.stderr_stream.text = "err\n";
    output.aggregated_output.text = "out\nerr\n";

    EXPECT_EQ(format_exec_output_str(output), "out\nerr\n");
}

TEST(FormatExecOutputTest, TimeoutAddsNotice)
{
    ExecToolCallOutput output;
    output.aggregated_output.text = "partial\n";
    output.duration = 2500ms;
    output.timed_out = true;

    EXPECT_EQ(format_exec_output_str(output), "command timed out after 2500 milliseconds\npartial\n");
}

TEST(FormatExecOutputTest, ModelRenderingIsJsonWithMetadata)
{
    ExecToolCallOutput output;
    output.exit_code = 3;
    output.aggregated_output.text = "nope\n";
    output.duration = 1234ms;

    auto model = json::parse(format_exec_output_for_model(output));

    EXPECT_EQ(model["output"], "nope\n");
    EXPECT_EQ(model["metadata"]["exit_code"], 3);
    EXPECT_DOUBLE_EQ(model["metadata"]["duration_seconds"].get<double>(), 1.2);
}

// =============================================================================
// Payloads
// =============================================================================

TEST(PayloadTest, FromOutputCopiesStreams)
{
    ExecToolCallOutput output;
    output.exit_code = 1;
    output.stdout_stream.text = "a";
    output.stderr_stream.text = "b";
    output.aggregated_output.text = "ab";
    output.duration = 40ms;

    auto payload = payload_from_output(output);

    EXPECT_EQ(payload.stdout_text, "a");
    EXPECT_EQ(payload.stderr_text, "b");
    EXPECT_EQ(payload.aggregated_output, "ab");
    EXPECT_EQ(payload.exit_code, 1);
    EXPECT_EQ(payload.duration, 40ms);
    EXPECT_EQ(payload.formatted_output, "ab");
}

TEST(PayloadTest, FromMessageMeansNoProcessRan)
{
    auto payload = payload_from_message("spawn failed");

    EXPECT_EQ(payload.stdout_text, "");
    EXPECT_EQ(payload.stderr_text, "spawn failed");
    EXPECT_EQ(payload.aggregated_output, "spawn failed");
    EXPECT_EQ(payload.formatted_output, "spawn failed");
    EXPECT_EQ(payload.exit_code, -1);
    EXPECT_EQ(payload.duration, 0ms);
}
