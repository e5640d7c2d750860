// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file test_parse_command.cpp
/// @brief Tests for command classification

#include <gtest/gtest.h>
#include <toolevents/parse_command.hpp>

using namespace toolevents;

TEST(ParseCommandTest, PlainRead)
{
    auto parsed = parse_command({"cat", "src/main.cpp"});

    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0].kind, ParsedCommandKind::Read);
    EXPECT_EQ(parsed[0].cmd, "cat src/main.cpp");
    EXPECT_EQ(parsed[0].name.value_or(""), "main.cpp");
    EXPECT_EQ(parsed[0].path.value_or(""), "src/main.cpp");
}

TEST(ParseCommandTest, HeadSkipsLineCountValue)
{
    auto parsed = parse_command({"head", "-n", "50", "README.md"});

    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0].kind, ParsedCommandKind::Read);
    EXPECT_EQ(parsed[0].path.value_or(""), "README.md");
}

TEST(ParseCommandTest, ShellScriptIsUnwrapped)
{
    auto parsed = parse_command({"bash", "-lc", "cd src && rg -n \"fn main\" lib | head -n 20"});

    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0].kind, ParsedCommandKind::Search);
    EXPECT_EQ(parsed[0].query.value_or(""), "fn main");
    EXPECT_EQ(parsed[0].path.value_or(""), "lib");
    EXPECT_EQ(parsed[0].cmd, "rg -n 'fn main' lib");
}

TEST(ParseCommandTest, ListingCommands)
{
    auto ls = parse_command({"ls", "-la", "include"});
    ASSERT_EQ(ls.size(), 1u);
    EXPECT_EQ(ls[0].kind, ParsedCommandKind::ListFiles);
    EXPECT_EQ(ls[0].path.value_or(""), "include");

    auto files = parse_command({"rg", "--files"});
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].kind, ParsedCommandKind::ListFiles);
    EXPECT_FALSE(files[0].path.has_value());

    auto find = parse_command({"find", ".", "-name", "*.hpp"});
    ASSERT_EQ(find.size(), 1u);
    EXPECT_EQ(find[0].path.value_or(""), ".");
}

TEST(ParseCommandTest, GitGrepIsSearch)
{
    auto parsed = parse_command({"git", "grep", "TODO"});

    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0].kind, ParsedCommandKind::Search);
    EXPECT_EQ(parsed[0].query.value_or(""), "TODO");
    EXPECT_FALSE(parsed[0].path.has_value());
}

TEST(ParseCommandTest, SequenceOfKnownCommands)
{
    auto parsed = parse_command({"sh", "-c", "ls; cat a.txt"});

    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0].kind, ParsedCommandKind::ListFiles);
    EXPECT_EQ(parsed[1].kind, ParsedCommandKind::Read);
    EXPECT_EQ(parsed[1].name.value_or(""), "a.txt");
}

TEST(ParseCommandTest, AnyUnknownPartMakesWholeCommandUnknown)
{
    auto parsed = parse_command({"bash", "-lc", "cat a.txt && make -j8"});

    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0].kind, ParsedCommandKind::Unknown);
    EXPECT_EQ(parsed[0].cmd, "cat a.txt && make -j8");
}

TEST(ParseCommandTest, EmptyCommandIsUnknown)
{
    auto parsed = parse_command({});

    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0].kind, ParsedCommandKind::Unknown);
    EXPECT_EQ(parsed[0].cmd, "");
}

TEST(ShellJoinTest, QuotesOnlyWhenNeeded)
{
    EXPECT_EQ(shell_join({"echo", "hello world", "it's", ""}), "echo 'hello world' 'it'\"'\"'s' ''");
    EXPECT_EQ(shell_join({"ls", "-la", "/tmp"}), "ls -la /tmp");
}
