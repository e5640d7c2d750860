// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file test_events.cpp
/// @brief Tests for event wire encoding

#include <gtest/gtest.h>
#include <toolevents/events.hpp>

using namespace toolevents;
using namespace std::chrono_literals;

// =============================================================================
// Wire Shape
// =============================================================================

TEST(EventJsonTest, ExecBeginShape)
{
    Event event{
        .id = "turn-1",
        .msg = ExecCommandBeginEvent{
            .call_id = "call-1",
            .turn_id = "turn-1",
            .command = {"ls"},
            .cwd = "/repo",
            .parsed_cmd = {ParsedCommand{.kind = ParsedCommandKind::ListFiles, .cmd = "ls"}},
            .source = ExecCommandSource::UserShell
        }
    };

    json j = event_to_json(event);

    EXPECT_EQ(j["id"], "turn-1");
    EXPECT_EQ(j["msg"]["type"], "exec_command_begin");
    EXPECT_EQ(j["msg"]["call_id"], "call-1");
    EXPECT_EQ(j["msg"]["source"], "user_shell");
    EXPECT_EQ(j["msg"]["parsed_cmd"][0]["type"], "list_files");
    EXPECT_TRUE(j["msg"]["parsed_cmd"][0]["path"].is_null());
    EXPECT_TRUE(j["msg"]["interaction_input"].is_null());
}

TEST(EventJsonTest, ExecEndUsesStreamKeysAndSplitDuration)
{
    ExecCommandEndEvent end{
        .call_id = "c",
        .turn_id = "t",
        .stdout_text = "out",
        .stderr_text = "err",
        .aggregated_output = "outerr",
        .exit_code = 2,
        .duration = 1500ms,
        .formatted_output = "outerr"
    };

    json j = end;

    EXPECT_EQ(j["stdout"], "out");
    EXPECT_EQ(j["stderr"], "err");
    EXPECT_EQ(j["exit_code"], 2);
    EXPECT_EQ(j["duration"]["secs"], 1);
    EXPECT_EQ(j["duration"]["nanos"], 500000000);
    EXPECT_FALSE(j.contains("stdout_text"));
}

TEST(EventJsonTest, PatchBeginCarriesChangesByPath)
{
    PatchApplyBeginEvent begin{
        .call_id = "p",
        .auto_approved = true,
        .changes = {
            {"new.txt", FileChange::add("hello\n")},
            {"old.txt", FileChange::update("@@ -1 +1 @@\n-a\n+b\n", "moved.txt")},
        }
    };

    json j = begin;

    EXPECT_EQ(j["auto_approved"], true);
    EXPECT_EQ(j["changes"]["new.txt"]["type"], "add");
    EXPECT_EQ(j["changes"]["new.txt"]["content"], "hello\n");
    EXPECT_EQ(j["changes"]["old.txt"]["type"], "update");
    EXPECT_EQ(j["changes"]["old.txt"]["move_path"], "moved.txt");
}

TEST(EventJsonTest, TypeNames)
{
    EXPECT_STREQ(event_type_name(EventType::ExecCommandBegin), "exec_command_begin");
    EXPECT_STREQ(event_type_name(EventType::ExecCommandEnd), "exec_command_end");
    EXPECT_STREQ(event_type_name(EventType::PatchApplyBegin), "patch_apply_begin");
    EXPECT_STREQ(event_type_name(EventType::PatchApplyEnd), "patch_apply_end");
    EXPECT_STREQ(event_type_name(EventType::TurnDiff), "turn_diff");
}

TEST(EventJsonTest, DumpReplacesInvalidUtf8)
{
    Event event{.id = "t", .msg = PatchApplyEndEvent{.call_id = "p", .stderr_text = "bad \xff byte"}};

    std::string text;
    ASSERT_NO_THROW(text = dump_event(event));

    auto j = json::parse(text);
    EXPECT_EQ(j["msg"]["stderr"], "bad \xEF\xBF\xBD byte");
    EXPECT_EQ(j["msg"]["type"], "patch_apply_end");
}

// =============================================================================
// Decoding
// =============================================================================

TEST(ParseEventTest, DecodesWhatWasEncoded)
{
    Event original{
        .id = "turn-9",
        .msg = ExecCommandEndEvent{
            .call_id = "call-3",
            .turn_id = "turn-9",
            .command = {"bash", "-lc", "cat a"},
            .cwd = "/w",
            .parsed_cmd = {ParsedCommand{
                .kind = ParsedCommandKind::Read, .cmd = "cat a", .name = "a", .path = "a"
            }},
            .source = ExecCommandSource::UnifiedExecInteraction,
            .interaction_input = "y\n",
            .stdout_text = "x",
            .aggregated_output = "x",
            .exit_code = 0,
            .duration = 250ms,
            .formatted_output = "x"
        }
    };

    Event decoded = parse_event(event_to_json(original));

    EXPECT_EQ(decoded.id, "turn-9");
    ASSERT_TRUE(decoded.is<ExecCommandEndEvent>());
    const auto& end = decoded.as<ExecCommandEndEvent>();
    EXPECT_EQ(end.call_id, "call-3");
    EXPECT_EQ(end.interaction_input.value_or(""), "y\n");
    EXPECT_EQ(end.duration, 250ms);
    ASSERT_EQ(end.parsed_cmd.size(), 1u);
    EXPECT_TRUE(end.parsed_cmd[0] == original.as<ExecCommandEndEvent>().parsed_cmd[0]);
}

TEST(ParseEventTest, TurnDiff)
{
    json j = {{"id", "t"}, {"msg", {{"type", "turn_diff"}, {"unified_diff", "--- a\n+++ b\n"}}}};

    Event event = j.get<Event>();

    EXPECT_EQ(event.type(), EventType::TurnDiff);
    ASSERT_NE(event.try_as<TurnDiffEvent>(), nullptr);
    EXPECT_EQ(event.try_as<TurnDiffEvent>()->unified_diff, "--- a\n+++ b\n");
    EXPECT_EQ(event.try_as<PatchApplyEndEvent>(), nullptr);
}

TEST(ParseEventTest, UnknownTypeThrows)
{
    json j = {{"id", "t"}, {"msg", {{"type", "agent_message"}}}};

    EXPECT_THROW(parse_event(j), EventParseError);
}

TEST(ParseEventTest, MissingFieldThrows)
{
    json j = {{"id", "t"}, {"msg", {{"type", "patch_apply_end"}, {"call_id", "c"}}}};

    EXPECT_THROW(parse_event(j), EventParseError);
}
