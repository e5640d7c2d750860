// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <toolevents/types.hpp>
#include <variant>
#include <vector>

namespace toolevents
{

// =============================================================================
// Event Exceptions
// =============================================================================

/// Exception thrown when an event cannot be decoded
class EventParseError : public std::runtime_error
{
  public:
    explicit EventParseError(const std::string& message) : std::runtime_error(message) {}
};

// =============================================================================
// Duration Encoding
// =============================================================================

namespace detail
{

inline json duration_to_json(std::chrono::milliseconds d)
{
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(d);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(d - secs);
    return json{{"secs", secs.count()}, {"nanos", nanos.count()}};
}

inline std::chrono::milliseconds duration_from_json(const json& j)
{
    auto secs = std::chrono::seconds(j.at("secs").get<int64_t>());
    auto nanos = std::chrono::nanoseconds(j.at("nanos").get<int64_t>());
    return std::chrono::duration_cast<std::chrono::milliseconds>(secs + nanos);
}

inline void put_optional(json& j, const char* key, const std::optional<std::string>& value)
{
    j[key] = value ? json(*value) : json(nullptr);
}

inline std::optional<std::string> get_optional(const json& j, const char* key)
{
    if (j.contains(key) && !j.at(key).is_null())
        return j.at(key).get<std::string>();
    return std::nullopt;
}

} // namespace detail

// =============================================================================
// Event Data Definitions
// =============================================================================

struct ExecCommandBeginEvent
{
    std::string call_id;
    std::string turn_id;
    std::vector<std::string> command;
    std::string cwd;
    std::vector<ParsedCommand> parsed_cmd;
    ExecCommandSource source = ExecCommandSource::Agent;

    /// Input written to an already running interactive process
    std::optional<std::string> interaction_input;
};

inline void to_json(json& j, const ExecCommandBeginEvent& e)
{
    j = json{
        {"call_id", e.call_id},
        {"turn_id", e.turn_id},
        {"command", e.command},
        {"cwd", e.cwd},
        {"parsed_cmd", e.parsed_cmd},
        {"source", e.source}
    };
    detail::put_optional(j, "interaction_input", e.interaction_input);
}

inline void from_json(const json& j, ExecCommandBeginEvent& e)
{
    j.at("call_id").get_to(e.call_id);
    j.at("turn_id").get_to(e.turn_id);
    j.at("command").get_to(e.command);
    j.at("cwd").get_to(e.cwd);
    j.at("parsed_cmd").get_to(e.parsed_cmd);
    j.at("source").get_to(e.source);
    e.interaction_input = detail::get_optional(j, "interaction_input");
}

struct ExecCommandEndEvent
{
    std::string call_id;
    std::string turn_id;
    std::vector<std::string> command;
    std::string cwd;
    std::vector<ParsedCommand> parsed_cmd;
    ExecCommandSource source = ExecCommandSource::Agent;
    std::optional<std::string> interaction_input;
    std::string stdout_text;
    std::string stderr_text;
    std::string aggregated_output;
    int exit_code = 0;
    std::chrono::milliseconds duration{0};

    /// Rendering shown to the user
    std::string formatted_output;
};

inline void to_json(json& j, const ExecCommandEndEvent& e)
{
    j = json{
        {"call_id", e.call_id},
        {"turn_id", e.turn_id},
        {"command", e.command},
        {"cwd", e.cwd},
        {"parsed_cmd", e.parsed_cmd},
        {"source", e.source},
        {"stdout", e.stdout_text},
        {"stderr", e.stderr_text},
        {"aggregated_output", e.aggregated_output},
        {"exit_code", e.exit_code},
        {"duration", detail::duration_to_json(e.duration)},
        {"formatted_output", e.formatted_output}
    };
    detail::put_optional(j, "interaction_input", e.interaction_input);
}

inline void from_json(const json& j, ExecCommandEndEvent& e)
{
    j.at("call_id").get_to(e.call_id);
    j.at("turn_id").get_to(e.turn_id);
    j.at("command").get_to(e.command);
    j.at("cwd").get_to(e.cwd);
    j.at("parsed_cmd").get_to(e.parsed_cmd);
    j.at("source").get_to(e.source);
    e.interaction_input = detail::get_optional(j, "interaction_input");
    j.at("stdout").get_to(e.stdout_text);
    j.at("stderr").get_to(e.stderr_text);
    j.at("aggregated_output").get_to(e.aggregated_output);
    j.at("exit_code").get_to(e.exit_code);
    e.duration = detail::duration_from_json(j.at("duration"));
    j.at("formatted_output").get_to(e.formatted_output);
}

struct PatchApplyBeginEvent
{
    std::string call_id;
    bool auto_approved = false;
    FileChanges changes;
};

inline void to_json(json& j, const PatchApplyBeginEvent& e)
{
    j = json{{"call_id", e.call_id}, {"auto_approved", e.auto_approved}, {"changes", e.changes}};
}

inline void from_json(const json& j, PatchApplyBeginEvent& e)
{
    j.at("call_id").get_to(e.call_id);
    j.at("auto_approved").get_to(e.auto_approved);
    j.at("changes").get_to(e.changes);
}

struct PatchApplyEndEvent
{
    std::string call_id;
    std::string stdout_text;
    std::string stderr_text;
    bool success = false;
};

inline void to_json(json& j, const PatchApplyEndEvent& e)
{
    j = json{
        {"call_id", e.call_id},
        {"stdout", e.stdout_text},
        {"stderr", e.stderr_text},
        {"success", e.success}
    };
}

inline void from_json(const json& j, PatchApplyEndEvent& e)
{
    j.at("call_id").get_to(e.call_id);
    j.at("stdout").get_to(e.stdout_text);
    j.at("stderr").get_to(e.stderr_text);
    j.at("success").get_to(e.success);
}

struct TurnDiffEvent
{
    std::string unified_diff;
};

inline void to_json(json& j, const TurnDiffEvent& e)
{
    j = json{{"unified_diff", e.unified_diff}};
}

inline void from_json(const json& j, TurnDiffEvent& e)
{
    j.at("unified_diff").get_to(e.unified_diff);
}

// =============================================================================
// Event Types
// =============================================================================

/// Event type enumeration
enum class EventType
{
    ExecCommandBegin,
    ExecCommandEnd,
    PatchApplyBegin,
    PatchApplyEnd,
    TurnDiff
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    EventType,
    {
        {EventType::ExecCommandBegin, "exec_command_begin"},
        {EventType::ExecCommandEnd, "exec_command_end"},
        {EventType::PatchApplyBegin, "patch_apply_begin"},
        {EventType::PatchApplyEnd, "patch_apply_end"},
        {EventType::TurnDiff, "turn_diff"},
    }
)

/// Closed set of outbound event payloads
using EventMsg = std::variant<
    ExecCommandBeginEvent,
    ExecCommandEndEvent,
    PatchApplyBeginEvent,
    PatchApplyEndEvent,
    TurnDiffEvent>;

/// Map a payload to its event type
EventType event_type(const EventMsg& msg);

/// Wire name of an event type, e.g. "exec_command_end"
const char* event_type_name(EventType type);

/// Event envelope delivered to subscribers
struct Event
{
    /// Identifier of the turn the event belongs to
    std::string id;
    EventMsg msg;

    EventType type() const
    {
        return event_type(msg);
    }

    /// Check if this is a specific event type
    template <typename T>
    bool is() const
    {
        return std::holds_alternative<T>(msg);
    }

    /// Get event data as specific type (throws if wrong type)
    template <typename T>
    const T& as() const
    {
        return std::get<T>(msg);
    }

    /// Get event data as specific type (returns nullptr if wrong type)
    template <typename T>
    const T* try_as() const
    {
        return std::get_if<T>(&msg);
    }
};

/// Encode an event as {"id": ..., "msg": {"type": ..., ...}}
json event_to_json(const Event& event);

/// Serialize an event to compact JSON text
///
/// Output captured from processes is not guaranteed to be UTF-8; invalid bytes
/// are replaced with U+FFFD rather than failing.
std::string dump_event(const Event& event);

/// Decode an event produced by event_to_json
/// @throws EventParseError on an unknown type or missing fields
Event parse_event(const json& j);

/// ADL hooks for json
inline void to_json(json& j, const Event& event)
{
    j = event_to_json(event);
}

inline void from_json(const json& j, Event& event)
{
    event = parse_event(j);
}

} // namespace toolevents
