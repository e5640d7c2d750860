// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <toolevents/log.hpp>
#include <toolevents/session.hpp>

namespace toolevents
{

Session::Session(std::string session_id, ToolEventsConfig config)
    : session_id_(std::move(session_id)), config_(std::move(config))
{
    set_log_level(config_.log_level);
}

// =============================================================================
// Event Handling
// =============================================================================

Subscription Session::on(EventHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    int id = next_handler_id_++;
    event_handlers_.emplace_back(id, std::move(handler));

    // The handle may outlive the session
    return Subscription(
        [weak = weak_from_this(), id]()
        {
            if (auto self = weak.lock())
                self->remove_handler(id);
        }
    );
}

void Session::remove_handler(int id)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = std::find_if(
        event_handlers_.begin(), event_handlers_.end(), [id](const auto& entry) { return entry.first == id; }
    );
    if (it != event_handlers_.end())
        event_handlers_.erase(it);
}

void Session::send_event(const TurnContext& turn, EventMsg msg)
{
    Event event{.id = turn.sub_id, .msg = std::move(msg)};
    logger()->debug("session {}: {} for turn {}", session_id_, event_type_name(event.type()), event.id);
    dispatch_event(event);
}

std::size_t Session::events_sent() const
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    return events_sent_;
}

void Session::dispatch_event(const Event& event)
{
    std::vector<EventHandler> handlers_copy;

    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        ++events_sent_;
        handlers_copy.reserve(event_handlers_.size());
        for (const auto& [id, handler] : event_handlers_)
            handlers_copy.push_back(handler);
    }

    for (const auto& handler : handlers_copy)
    {
        try
        {
            handler(event);
        }
        catch (const std::exception& e)
        {
            // One failing subscriber must not starve the others
            logger()->warn("session {}: subscriber failed on {}: {}", session_id_,
                           event_type_name(event.type()), e.what());
        }
        catch (...)
        {
            logger()->warn("session {}: subscriber failed on {} with a non-standard exception",
                           session_id_, event_type_name(event.type()));
        }
    }
}

} // namespace toolevents
