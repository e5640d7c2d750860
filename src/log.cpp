// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <spdlog/sinks/stdout_color_sinks.h>
#include <toolevents/errors.hpp>
#include <toolevents/log.hpp>

namespace toolevents
{

std::shared_ptr<spdlog::logger> logger()
{
    static std::shared_ptr<spdlog::logger> instance = []()
    {
        if (auto existing = spdlog::get("toolevents"))
            return existing;
        auto created = spdlog::stderr_color_mt("toolevents");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

void set_log_level(const std::string& level)
{
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unrecognised names to "off"
    if (parsed == spdlog::level::off && level != "off")
        throw ConfigError("Unknown log level: " + level);
    logger()->set_level(parsed);
}

} // namespace toolevents
