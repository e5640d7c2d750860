// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace toolevents
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

namespace detail
{

/// Visitor built from a set of lambdas, one per alternative
template <typename... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

} // namespace detail

// =============================================================================
// Enums
// =============================================================================

/// Who started a command invocation
enum class ExecCommandSource
{
    Agent,
    UserShell,
    UnifiedExecStartup,
    UnifiedExecInteraction
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    ExecCommandSource,
    {
        {ExecCommandSource::Agent, "agent"},
        {ExecCommandSource::UserShell, "user_shell"},
        {ExecCommandSource::UnifiedExecStartup, "unified_exec_startup"},
        {ExecCommandSource::UnifiedExecInteraction, "unified_exec_interaction"},
    }
)

// =============================================================================
// Parsed Command Tokens
// =============================================================================

enum class ParsedCommandKind
{
    Read,
    ListFiles,
    Search,
    Unknown
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    ParsedCommandKind,
    {
        {ParsedCommandKind::Read, "read"},
        {ParsedCommandKind::ListFiles, "list_files"},
        {ParsedCommandKind::Search, "search"},
        {ParsedCommandKind::Unknown, "unknown"},
    }
)

/// Display-oriented decomposition of one simple command
///
/// `name` is only meaningful for Read, `query` only for Search.
struct ParsedCommand
{
    ParsedCommandKind kind = ParsedCommandKind::Unknown;
    std::string cmd;
    std::optional<std::string> name;
    std::optional<std::string> path;
    std::optional<std::string> query;

    bool operator==(const ParsedCommand&) const = default;
};

inline void to_json(json& j, const ParsedCommand& p)
{
    j = json{{"type", p.kind}, {"cmd", p.cmd}};
    switch (p.kind)
    {
    case ParsedCommandKind::Read:
        j["name"] = p.name.value_or("");
        j["path"] = p.path.value_or("");
        break;
    case ParsedCommandKind::ListFiles:
        j["path"] = p.path ? json(*p.path) : json(nullptr);
        break;
    case ParsedCommandKind::Search:
        j["query"] = p.query ? json(*p.query) : json(nullptr);
        j["path"] = p.path ? json(*p.path) : json(nullptr);
        break;
    case ParsedCommandKind::Unknown:
        break;
    }
}

inline void from_json(const json& j, ParsedCommand& p)
{
    j.at("type").get_to(p.kind);
    j.at("cmd").get_to(p.cmd);
    if (j.contains("name") && !j.at("name").is_null())
        p.name = j.at("name").get<std::string>();
    if (j.contains("path") && !j.at("path").is_null())
        p.path = j.at("path").get<std::string>();
    if (j.contains("query") && !j.at("query").is_null())
        p.query = j.at("query").get<std::string>();
}

// =============================================================================
// File Changes
// =============================================================================

enum class FileChangeKind
{
    Add,
    Delete,
    Update
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    FileChangeKind,
    {
        {FileChangeKind::Add, "add"},
        {FileChangeKind::Delete, "delete"},
        {FileChangeKind::Update, "update"},
    }
)

/// One file's part of a patch
struct FileChange
{
    FileChangeKind kind = FileChangeKind::Add;

    /// Full file content for Add and Delete
    std::string content;

    /// Hunk text for Update
    std::string unified_diff;

    /// Destination when an Update also renames the file
    std::optional<std::string> move_path;

    static FileChange add(std::string content)
    {
        return FileChange{.kind = FileChangeKind::Add, .content = std::move(content)};
    }

    static FileChange remove(std::string content)
    {
        return FileChange{.kind = FileChangeKind::Delete, .content = std::move(content)};
    }

    static FileChange update(std::string unified_diff,
                             std::optional<std::string> move_path = std::nullopt)
    {
        return FileChange{
            .kind = FileChangeKind::Update,
            .unified_diff = std::move(unified_diff),
            .move_path = std::move(move_path)
        };
    }

    bool operator==(const FileChange&) const = default;
};

inline void to_json(json& j, const FileChange& c)
{
    j = json{{"type", c.kind}};
    if (c.kind == FileChangeKind::Update)
    {
        j["unified_diff"] = c.unified_diff;
        j["move_path"] = c.move_path ? json(*c.move_path) : json(nullptr);
    }
    else
    {
        j["content"] = c.content;
    }
}

inline void from_json(const json& j, FileChange& c)
{
    j.at("type").get_to(c.kind);
    if (c.kind == FileChangeKind::Update)
    {
        j.at("unified_diff").get_to(c.unified_diff);
        if (j.contains("move_path") && !j.at("move_path").is_null())
            c.move_path = j.at("move_path").get<std::string>();
    }
    else
    {
        j.at("content").get_to(c.content);
    }
}

/// Patch contents keyed by file path
using FileChanges = std::map<std::string, FileChange>;

// =============================================================================
// Execution Output
// =============================================================================

/// Captured text of one output stream
struct StreamOutput
{
    std::string text;
    std::optional<uint32_t> truncated_after_lines;

    bool operator==(const StreamOutput&) const = default;
};

/// Result of a process run, as reported by the executor
struct ExecToolCallOutput
{
    int exit_code = 0;
    StreamOutput stdout_stream;
    StreamOutput stderr_stream;

    /// Interleaved stdout and stderr in arrival order
    StreamOutput aggregated_output;

    std::chrono::milliseconds duration{0};
    bool timed_out = false;

    bool operator==(const ExecToolCallOutput&) const = default;
};

// =============================================================================
// Turn Context
// =============================================================================

/// The conversational turn a tool call belongs to
struct TurnContext
{
    /// Turn identifier stamped on every event of the turn
    std::string sub_id;
    std::string cwd;
};

// =============================================================================
// Model-facing Output
// =============================================================================

/// Payload returned to the model for a function call
struct FunctionCallOutput
{
    std::string content;
    std::optional<bool> success;
};

inline void to_json(json& j, const FunctionCallOutput& o)
{
    j = json{{"content", o.content}};
    if (o.success)
        j["success"] = *o.success;
}

inline void from_json(const json& j, FunctionCallOutput& o)
{
    j.at("content").get_to(o.content);
    if (j.contains("success"))
        o.success = j.at("success").get<bool>();
}

} // namespace toolevents
