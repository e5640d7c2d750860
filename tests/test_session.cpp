// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file test_session.cpp
/// @brief Tests for event delivery and subscriptions

#include <gtest/gtest.h>
#include <stdexcept>
#include <toolevents/errors.hpp>
#include <toolevents/log.hpp>
#include <toolevents/session.hpp>
#include <vector>

using namespace toolevents;

namespace
{

TurnContext make_turn(std::string id)
{
    return TurnContext{.sub_id = std::move(id), .cwd = "/repo"};
}

} // namespace

TEST(SessionTest, StampsTurnId)
{
    auto session = std::make_shared<Session>("s-1");
    std::vector<Event> received;
    auto sub = session->on([&](const Event& e) { received.push_back(e); });

    session->send_event(make_turn("turn-3"), TurnDiffEvent{.unified_diff = "d"});

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].id, "turn-3");
    EXPECT_EQ(received[0].type(), EventType::TurnDiff);
    EXPECT_EQ(session->session_id(), "s-1");
}

TEST(SessionTest, DeliversInSubscriptionOrder)
{
    auto session = std::make_shared<Session>("s");
    std::vector<int> order;
    auto first = session->on([&](const Event&) { order.push_back(1); });
    auto second = session->on([&](const Event&) { order.push_back(2); });

    session->send_event(make_turn("t"), TurnDiffEvent{});

    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(SessionTest, UnsubscribeStopsDelivery)
{
    auto session = std::make_shared<Session>("s");
    int calls = 0;
    auto sub = session->on([&](const Event&) { ++calls; });

    session->send_event(make_turn("t"), TurnDiffEvent{});
    sub.unsubscribe();
    session->send_event(make_turn("t"), TurnDiffEvent{});

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(session->events_sent(), 2u);
}

TEST(SessionTest, SubscriptionGoesAwayWithScope)
{
    auto session = std::make_shared<Session>("s");
    int calls = 0;
    {
        auto sub = session->on([&](const Event&) { ++calls; });
        session->send_event(make_turn("t"), TurnDiffEvent{});
    }
    session->send_event(make_turn("t"), TurnDiffEvent{});

    EXPECT_EQ(calls, 1);
}

TEST(SessionTest, SubscriptionMayOutliveSession)
{
    Subscription sub;
    {
        auto session = std::make_shared<Session>("s");
        sub = session->on([](const Event&) {});
    }
    sub.unsubscribe();
    SUCCEED();
}

TEST(SessionTest, ThrowingSubscriberDoesNotBlockOthers)
{
    auto session = std::make_shared<Session>("s");
    int calls = 0;
    auto bad = session->on([](const Event&) { throw std::runtime_error("subscriber failed"); });
    auto good = session->on([&](const Event&) { ++calls; });

    EXPECT_NO_THROW(session->send_event(make_turn("t"), TurnDiffEvent{}));
    EXPECT_EQ(calls, 1);
}

TEST(SessionTest, NonStandardThrowIsContained)
{
    auto session = std::make_shared<Session>("s");
    int calls = 0;
    auto bad = session->on([](const Event&) { throw 42; });
    auto good = session->on([&](const Event&) { ++calls; });

    EXPECT_NO_THROW(session->send_event(make_turn("t"), TurnDiffEvent{}));
    EXPECT_EQ(calls, 1);
}

TEST(SessionTest, AppliesConfiguredLogLevel)
{
    ToolEventsConfig config;
    config.log_level = "debug";

    auto session = std::make_shared<Session>("s", config);
    EXPECT_EQ(logger()->level(), spdlog::level::debug);

    auto quiet = std::make_shared<Session>("s2");
    EXPECT_EQ(logger()->level(), spdlog::level::info);
}

TEST(SessionTest, UnknownLogLevelIsRejected)
{
    ToolEventsConfig config;
    config.log_level = "chatty";

    EXPECT_THROW(Session("s", config), ConfigError);
}

TEST(SessionTest, CarriesConfig)
{
    ToolEventsConfig config;
    config.cancellation_message = "stopped";

    auto session = std::make_shared<Session>("s", config);

    EXPECT_EQ(session->config().cancellation_message, "stopped");
}
