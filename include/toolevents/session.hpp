// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file session.hpp
/// @brief Session that delivers tool events to its subscribers

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <toolevents/config.hpp>
#include <toolevents/events.hpp>
#include <toolevents/types.hpp>
#include <utility>
#include <vector>

namespace toolevents
{

// =============================================================================
// Subscription - RAII subscription handle
// =============================================================================

/// Keeps a subscriber attached; destroying or reassigning it detaches the subscriber
class Subscription
{
  public:
    Subscription() = default;
    explicit Subscription(std::function<void()> detach) : detach_(std::move(detach)) {}
    ~Subscription()
    {
        unsubscribe();
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept : detach_(std::exchange(other.detach_, nullptr)) {}
    Subscription& operator=(Subscription&& other) noexcept
    {
        if (this != &other)
        {
            unsubscribe();
            detach_ = std::exchange(other.detach_, nullptr);
        }
        return *this;
    }

    /// Detach now; later calls do nothing
    void unsubscribe()
    {
        if (auto detach = std::exchange(detach_, nullptr))
            detach();
    }

  private:
    std::function<void()> detach_;
};

// =============================================================================
// Session
// =============================================================================

/// A session that fans tool events out to subscribers
///
/// Tool calls of every turn share one session. Events are delivered
/// synchronously on the sending thread, in subscription order.
///
/// Example usage:
/// @code
/// auto session = std::make_shared<Session>("session-1");
/// auto sub = session->on([](const Event& evt) {
///     if (auto* end = evt.try_as<ExecCommandEndEvent>())
///         std::cout << end->formatted_output << std::endl;
/// });
/// @endcode
class Session : public std::enable_shared_from_this<Session>
{
  public:
    /// Event handler function type
    using EventHandler = std::function<void(const Event&)>;

    /// Create a session and apply `config.log_level` to the library logger
    /// @throws ConfigError if the log level is not a known level name
    explicit Session(std::string session_id, ToolEventsConfig config = {});

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& session_id() const
    {
        return session_id_;
    }

    const ToolEventsConfig& config() const
    {
        return config_;
    }

    /// Attach `handler`; it stays attached while the returned Subscription lives
    /// @note The session must be owned by a std::shared_ptr
    Subscription on(EventHandler handler);

    /// Stamp `msg` with the turn id and deliver it to every subscriber
    void send_event(const TurnContext& turn, EventMsg msg);

    /// Number of events sent so far
    std::size_t events_sent() const;

  private:
    void remove_handler(int id);
    void dispatch_event(const Event& event);

    std::string session_id_;
    ToolEventsConfig config_;

    mutable std::mutex handlers_mutex_;
    std::vector<std::pair<int, EventHandler>> event_handlers_;
    int next_handler_id_ = 0;
    std::size_t events_sent_ = 0;
};

} // namespace toolevents
