// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file log.hpp
/// @brief Library logger

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace toolevents
{

/// The "toolevents" logger, writing to stderr
std::shared_ptr<spdlog::logger> logger();

/// Set the logger level from its name ("trace", "debug", "info", "warn", "error", "critical", "off")
/// @throws ConfigError for an unknown name
void set_log_level(const std::string& level);

} // namespace toolevents
