// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file config.hpp
/// @brief Configuration shared by the emitters of a session

#include <map>
#include <string>
#include <toolevents/format.hpp>
#include <toolevents/types.hpp>

namespace toolevents
{

/// Rejection text produced by the approval gate when the user declines a command
inline constexpr const char* kRejectedByUser = "rejected by user";

/// Replacement reported to the model and the UI for kRejectedByUser
inline constexpr const char* kExecCommandRejectedByUser = "exec command rejected by user";

/// Configuration for emitters and output rendering
struct ToolEventsConfig
{
    /// Rejection messages rewritten before they are reported; other messages pass through
    std::map<std::string, std::string> rejection_rewrites = {
        {kRejectedByUser, kExecCommandRejectedByUser},
    };

    OutputFormatOptions output_format;

    std::string log_level = "info";

    /// Reported in the end event of a call abandoned between begin and finish
    std::string cancellation_message = "tool call cancelled before completion";
};

inline void to_json(json& j, const ToolEventsConfig& c)
{
    j = json{
        {"rejectionRewrites", c.rejection_rewrites},
        {"outputFormat", c.output_format},
        {"logLevel", c.log_level},
        {"cancellationMessage", c.cancellation_message}
    };
}

inline void from_json(const json& j, ToolEventsConfig& c)
{
    if (j.contains("rejectionRewrites"))
        j.at("rejectionRewrites").get_to(c.rejection_rewrites);
    if (j.contains("outputFormat"))
        j.at("outputFormat").get_to(c.output_format);
    if (j.contains("logLevel"))
        j.at("logLevel").get_to(c.log_level);
    if (j.contains("cancellationMessage"))
        j.at("cancellationMessage").get_to(c.cancellation_message);
}

/// Read a JSON configuration file; keys that are absent keep their defaults
/// @throws ConfigError if the file cannot be read or is not valid configuration
ToolEventsConfig load_config(const std::string& path);

/// Apply the configured rejection rewrites to `message`
std::string normalize_rejection(const ToolEventsConfig& config, const std::string& message);

} // namespace toolevents
