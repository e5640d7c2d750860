// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file parse_command.hpp
/// @brief Display-oriented classification of command lines

#include <functional>
#include <string>
#include <toolevents/types.hpp>
#include <vector>

namespace toolevents
{

/// Parser used by emitters to build parsed_cmd
using CommandParser = std::function<std::vector<ParsedCommand>(const std::vector<std::string>&)>;

/// Classify a command into reads, listings and searches
///
/// `bash -lc "<script>"` style invocations are unwrapped and the script is split on
/// `&&`, `||`, `;` and `|`. When any part cannot be classified, the whole command
/// is reported as a single Unknown entry.
std::vector<ParsedCommand> parse_command(const std::vector<std::string>& command);

/// Join argv into one shell-readable string, quoting words that need it
std::string shell_join(const std::vector<std::string>& words);

} // namespace toolevents
