// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file format.hpp
/// @brief Renderings of execution output for the model and for end events

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <toolevents/types.hpp>

namespace toolevents
{

/// Limits applied when rendering output for the model
struct OutputFormatOptions
{
    std::size_t max_bytes = 10 * 1024;
    std::size_t max_lines = 256;
    std::size_t head_lines = 128;
    std::size_t tail_lines = 128;
};

inline void to_json(json& j, const OutputFormatOptions& o)
{
    j = json{
        {"maxBytes", o.max_bytes},
        {"maxLines", o.max_lines},
        {"headLines", o.head_lines},
        {"tailLines", o.tail_lines}
    };
}

inline void from_json(const json& j, OutputFormatOptions& o)
{
    if (j.contains("maxBytes"))
        j.at("maxBytes").get_to(o.max_bytes);
    if (j.contains("maxLines"))
        j.at("maxLines").get_to(o.max_lines);
    if (j.contains("headLines"))
        j.at("headLines").get_to(o.head_lines);
    if (j.contains("tailLines"))
        j.at("tailLines").get_to(o.tail_lines);
}

/// Keep the head and tail of `content` when it exceeds the byte or line limit
///
/// Truncated text looks like:
/// @code
/// Total output lines: N
///
/// <head lines>
/// [... omitted K of N lines ...]
///
/// <tail lines>
/// @endcode
/// The result never splits a UTF-8 sequence.
std::string truncate_for_model(std::string_view content, const OutputFormatOptions& options = {});

/// Aggregated output, with a timeout notice when the run timed out, truncated for display
std::string format_exec_output_str(const ExecToolCallOutput& output,
                                   const OutputFormatOptions& options = {});

/// JSON document {"output": ..., "metadata": {"exit_code": N, "duration_seconds": S}}
std::string format_exec_output_for_model(const ExecToolCallOutput& output,
                                         const OutputFormatOptions& options = {});

// =============================================================================
// End-of-Tool Payload
// =============================================================================

/// Result fields of a command end event
struct ExecCommandPayload
{
    std::string stdout_text;
    std::string stderr_text;
    std::string aggregated_output;
    int exit_code = 0;
    std::chrono::milliseconds duration{0};
    std::string formatted_output;
};

ExecCommandPayload payload_from_output(const ExecToolCallOutput& output,
                                       const OutputFormatOptions& options = {});

/// Payload for a failure where no process ran: exit code -1, zero duration
ExecCommandPayload payload_from_message(const std::string& message);

} // namespace toolevents
