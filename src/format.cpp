// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cmath>
#include <toolevents/format.hpp>
#include <vector>

namespace toolevents
{

namespace
{

bool is_utf8_continuation(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// Longest prefix of at most max_bytes that ends on a character boundary
std::string_view take_bytes_at_char_boundary(std::string_view s, std::size_t max_bytes)
{
    if (s.size() <= max_bytes)
        return s;
    std::size_t end = max_bytes;
    while (end > 0 && is_utf8_continuation(s[end]))
        --end;
    return s.substr(0, end);
}

/// Longest suffix of at most max_bytes that starts on a character boundary
std::string_view take_last_bytes_at_char_boundary(std::string_view s, std::size_t max_bytes)
{
    if (s.size() <= max_bytes)
        return s;
    std::size_t start = s.size() - max_bytes;
    while (start < s.size() && is_utf8_continuation(s[start]))
        ++start;
    return s.substr(start);
}

/// Byte offsets at which each line (newline included) starts
std::vector<std::size_t> line_starts(std::string_view content)
{
    std::vector<std::size_t> starts;
    std::size_t pos = 0;
    while (pos < content.size())
    {
        starts.push_back(pos);
        auto nl = content.find('\n', pos);
        if (nl == std::string_view::npos)
            break;
        pos = nl + 1;
    }
    return starts;
}

} // namespace

std::string truncate_for_model(std::string_view content, const OutputFormatOptions& options)
{
    auto starts = line_starts(content);
    const std::size_t total_lines = starts.size();
    if (content.size() <= options.max_bytes && total_lines <= options.max_lines)
        return std::string(content);

    const std::size_t head_take = std::min(options.head_lines, total_lines);
    const std::size_t tail_take = std::min(options.tail_lines, total_lines - head_take);
    const std::size_t omitted = total_lines - head_take - tail_take;

    const std::size_t head_end = head_take < total_lines ? starts[head_take] : content.size();
    const std::size_t tail_start =
        tail_take > 0 ? starts[total_lines - tail_take] : content.size();

    std::string result = "Total output lines: " + std::to_string(total_lines) + "\n\n";
    result += take_bytes_at_char_boundary(content.substr(0, head_end), options.max_bytes / 2);
    result += "\n[... omitted " + std::to_string(omitted) + " of " + std::to_string(total_lines) +
              " lines ...]\n\n";

    if (result.size() >= options.max_bytes)
        return result;
    result += take_last_bytes_at_char_boundary(content.substr(tail_start),
                                               options.max_bytes - result.size());
    return result;
}

std::string format_exec_output_str(const ExecToolCallOutput& output,
                                   const OutputFormatOptions& options)
{
    if (!output.timed_out)
        return truncate_for_model(output.aggregated_output.text, options);

    std::string content = "command timed out after " + std::to_string(output.duration.count()) +
                          " milliseconds\n" + output.aggregated_output.text;
    return truncate_for_model(content, options);
}

std::string format_exec_output_for_model(const ExecToolCallOutput& output,
                                         const OutputFormatOptions& options)
{
    const double seconds = static_cast<double>(output.duration.count()) / 1000.0;
    const double rounded = std::round(seconds * 10.0) / 10.0;

    json payload = {
        {"output", format_exec_output_str(output, options)},
        {"metadata", {{"exit_code", output.exit_code}, {"duration_seconds", rounded}}}
    };
    // Process output is arbitrary bytes; invalid UTF-8 becomes U+FFFD instead of throwing
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

ExecCommandPayload payload_from_output(const ExecToolCallOutput& output,
                                       const OutputFormatOptions& options)
{
    return ExecCommandPayload{
        .stdout_text = output.stdout_stream.text,
        .stderr_text = output.stderr_stream.text,
        .aggregated_output = output.aggregated_output.text,
        .exit_code = output.exit_code,
        .duration = output.duration,
        .formatted_output = format_exec_output_str(output, options)
    };
}

ExecCommandPayload payload_from_message(const std::string& message)
{
    return ExecCommandPayload{
        .stdout_text = "",
        .stderr_text = message,
        .aggregated_output = message,
        .exit_code = -1,
        .duration = std::chrono::milliseconds::zero(),
        .formatted_output = message
    };
}

} // namespace toolevents
