// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file toolevents.hpp
/// @brief Master include for the toolevents library
///
/// This header includes all public API headers for convenience.
/// You can also include individual headers for finer-grained control.

#include <toolevents/config.hpp>
#include <toolevents/diff_tracker.hpp>
#include <toolevents/emitter.hpp>
#include <toolevents/errors.hpp>
#include <toolevents/events.hpp>
#include <toolevents/format.hpp>
#include <toolevents/log.hpp>
#include <toolevents/parse_command.hpp>
#include <toolevents/session.hpp>
#include <toolevents/types.hpp>

namespace toolevents
{

/// Library version string
inline constexpr const char* kVersion = "0.1.0";

} // namespace toolevents
