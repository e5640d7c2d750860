// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <optional>
#include <set>
#include <toolevents/parse_command.hpp>

namespace toolevents
{

namespace
{

using Words = std::vector<std::string>;

const std::set<std::string> kReadPrograms = {"cat", "head", "tail", "less", "more", "bat", "nl"};
const std::set<std::string> kListPrograms = {"ls", "tree", "fd", "find"};
const std::set<std::string> kSearchPrograms = {"rg", "grep", "egrep", "ag", "ack"};

/// Programs that only reshape the output of an earlier pipeline stage
const std::set<std::string> kFormattingPrograms = {"head", "tail", "wc", "sort", "uniq", "cut", "tr"};

// Flags whose next word is a value rather than a positional argument
const std::set<std::string> kReadValueFlags = {"-n", "-c", "--lines", "--bytes"};
const std::set<std::string> kListValueFlags = {"-name", "-iname", "-type", "-maxdepth", "-L", "--max-depth"};
const std::set<std::string> kSearchValueFlags = {
    "-e", "-f", "-m", "-A", "-B", "-C", "-g", "-t", "--glob", "--type", "--max-count"
};

std::string basename(const std::string& path)
{
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

bool is_shell(const std::string& program)
{
    auto name = basename(program);
    return name == "bash" || name == "sh" || name == "zsh";
}

std::optional<std::string> unwrap_shell_script(const Words& command)
{
    if (command.size() == 3 && is_shell(command[0]) && (command[1] == "-c" || command[1] == "-lc"))
        return command[2];
    return std::nullopt;
}

/// Split a script into simple commands, honoring quotes and backslash escapes
std::vector<Words> split_script(const std::string& script)
{
    std::vector<Words> segments(1);
    std::string word;
    bool in_word = false;
    char quote = 0;

    auto end_word = [&]()
    {
        if (in_word)
            segments.back().push_back(word);
        word.clear();
        in_word = false;
    };
    auto end_segment = [&]()
    {
        end_word();
        if (!segments.back().empty())
            segments.emplace_back();
    };

    for (std::size_t i = 0; i < script.size(); ++i)
    {
        char c = script[i];
        if (quote)
        {
            if (c == quote)
                quote = 0;
            else if (c == '\\' && quote == '"' && i + 1 < script.size())
                word += script[++i];
            else
                word += c;
            continue;
        }

        if (c == '\'' || c == '"')
        {
            quote = c;
            in_word = true;
        }
        else if (c == '\\' && i + 1 < script.size())
        {
            word += script[++i];
            in_word = true;
        }
        else if (c == ' ' || c == '\t' || c == '\n')
        {
            end_word();
        }
        else if (c == ';' || c == '|' || c == '&')
        {
            if ((c == '|' || c == '&') && i + 1 < script.size() && script[i + 1] == c)
                ++i;
            end_segment();
        }
        else
        {
            word += c;
            in_word = true;
        }
    }
    end_word();
    if (segments.back().empty())
        segments.pop_back();
    return segments;
}

Words positional_args(const Words& words, std::size_t first, const std::set<std::string>& value_flags)
{
    Words args;
    for (std::size_t i = first; i < words.size(); ++i)
    {
        const auto& w = words[i];
        if (value_flags.count(w))
        {
            ++i;
            continue;
        }
        if (!w.empty() && w[0] == '-')
            continue;
        args.push_back(w);
    }
    return args;
}

std::optional<ParsedCommand> classify(const Words& words)
{
    std::size_t first = 1;
    std::string program = basename(words[0]);
    if (program == "git" && words.size() > 1 && words[1] == "grep")
    {
        program = "grep";
        first = 2;
    }

    const std::string cmd = shell_join(words);

    if (kReadPrograms.count(program))
    {
        const Words args = positional_args(words, first, kReadValueFlags);
        if (args.empty())
            return std::nullopt;
        return ParsedCommand{
            .kind = ParsedCommandKind::Read, .cmd = cmd, .name = basename(args.back()), .path = args.back()
        };
    }

    if (kListPrograms.count(program) ||
        (program == "rg" && std::find(words.begin(), words.end(), "--files") != words.end()))
    {
        const Words args = positional_args(words, first, kListValueFlags);
        ParsedCommand parsed{.kind = ParsedCommandKind::ListFiles, .cmd = cmd};
        if (!args.empty())
            parsed.path = args.front();
        return parsed;
    }

    if (kSearchPrograms.count(program))
    {
        const Words args = positional_args(words, first, kSearchValueFlags);
        ParsedCommand parsed{.kind = ParsedCommandKind::Search, .cmd = cmd};
        if (!args.empty())
            parsed.query = args[0];
        if (args.size() > 1)
            parsed.path = args[1];
        return parsed;
    }

    return std::nullopt;
}

bool is_formatting_stage(const Words& words)
{
    return kFormattingPrograms.count(basename(words[0])) && positional_args(words, 1, kReadValueFlags).empty();
}

} // namespace

std::string shell_join(const std::vector<std::string>& words)
{
    static const std::string kSafe =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_@%+=:,./-";

    std::string out;
    for (const auto& w : words)
    {
        if (!out.empty())
            out += ' ';
        if (!w.empty() && w.find_first_not_of(kSafe) == std::string::npos)
        {
            out += w;
            continue;
        }
        out += '\'';
        for (char c : w)
        {
            if (c == '\'')
                out += "'\"'\"'";
            else
                out += c;
        }
        out += '\'';
    }
    return out;
}

std::vector<ParsedCommand> parse_command(const std::vector<std::string>& command)
{
    auto script = unwrap_shell_script(command);
    const std::string full_text = script ? *script : shell_join(command);
    const ParsedCommand unknown{.kind = ParsedCommandKind::Unknown, .cmd = full_text};

    std::vector<Words> segments;
    if (script)
        segments = split_script(*script);
    else if (!command.empty())
        segments.push_back(command);

    if (segments.size() > 1)
    {
        segments.erase(
            std::remove_if(
                segments.begin(), segments.end(),
                [](const Words& w) { return basename(w[0]) == "cd"; }
            ),
            segments.end()
        );
    }

    std::vector<ParsedCommand> parsed;
    for (std::size_t i = 0; i < segments.size(); ++i)
    {
        if (i > 0 && is_formatting_stage(segments[i]))
            continue;
        auto p = classify(segments[i]);
        if (!p)
            return {unknown};
        parsed.push_back(std::move(*p));
    }

    if (parsed.empty())
        return {unknown};
    return parsed;
}

} // namespace toolevents
