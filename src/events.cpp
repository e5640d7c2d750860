// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <map>
#include <toolevents/events.hpp>

namespace toolevents
{

EventType event_type(const EventMsg& msg)
{
    return std::visit(
        detail::overloaded{
            [](const ExecCommandBeginEvent&) { return EventType::ExecCommandBegin; },
            [](const ExecCommandEndEvent&) { return EventType::ExecCommandEnd; },
            [](const PatchApplyBeginEvent&) { return EventType::PatchApplyBegin; },
            [](const PatchApplyEndEvent&) { return EventType::PatchApplyEnd; },
            [](const TurnDiffEvent&) { return EventType::TurnDiff; },
        },
        msg
    );
}

const char* event_type_name(EventType type)
{
    switch (type)
    {
    case EventType::ExecCommandBegin:
        return "exec_command_begin";
    case EventType::ExecCommandEnd:
        return "exec_command_end";
    case EventType::PatchApplyBegin:
        return "patch_apply_begin";
    case EventType::PatchApplyEnd:
        return "patch_apply_end";
    case EventType::TurnDiff:
        return "turn_diff";
    }
    return "unknown";
}

json event_to_json(const Event& event)
{
    json msg = std::visit([](const auto& data) -> json { return data; }, event.msg);
    msg["type"] = event_type_name(event.type());
    return json{{"id", event.id}, {"msg", std::move(msg)}};
}

std::string dump_event(const Event& event)
{
    return event_to_json(event).dump(-1, ' ', false, json::error_handler_t::replace);
}

Event parse_event(const json& j)
{
    static const std::map<std::string, EventType> type_map = {
        {"exec_command_begin", EventType::ExecCommandBegin},
        {"exec_command_end", EventType::ExecCommandEnd},
        {"patch_apply_begin", EventType::PatchApplyBegin},
        {"patch_apply_end", EventType::PatchApplyEnd},
        {"turn_diff", EventType::TurnDiff},
    };

    try
    {
        Event event;
        event.id = j.at("id").get<std::string>();
        const auto& msg = j.at("msg");
        auto type_string = msg.at("type").get<std::string>();

        auto it = type_map.find(type_string);
        if (it == type_map.end())
            throw EventParseError("Unknown event type: " + type_string);

        switch (it->second)
        {
        case EventType::ExecCommandBegin:
            event.msg = msg.get<ExecCommandBeginEvent>();
            break;
        case EventType::ExecCommandEnd:
            event.msg = msg.get<ExecCommandEndEvent>();
            break;
        case EventType::PatchApplyBegin:
            event.msg = msg.get<PatchApplyBeginEvent>();
            break;
        case EventType::PatchApplyEnd:
            event.msg = msg.get<PatchApplyEndEvent>();
            break;
        case EventType::TurnDiff:
            event.msg = msg.get<TurnDiffEvent>();
            break;
        }
        return event;
    }
    catch (const json::exception& e)
    {
        throw EventParseError(std::string("Malformed event: ") + e.what());
    }
}

} // namespace toolevents
