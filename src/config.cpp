// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <fstream>
#include <toolevents/config.hpp>
#include <toolevents/errors.hpp>
#include <toolevents/log.hpp>

namespace toolevents
{

ToolEventsConfig load_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("Cannot open config file: " + path);

    try
    {
        auto config = json::parse(in).get<ToolEventsConfig>();
        logger()->debug("loaded config from {}", path);
        return config;
    }
    catch (const json::exception& e)
    {
        throw ConfigError("Invalid config file " + path + ": " + e.what());
    }
}

std::string normalize_rejection(const ToolEventsConfig& config, const std::string& message)
{
    auto it = config.rejection_rewrites.find(message);
    return it != config.rejection_rewrites.end() ? it->second : message;
}

} // namespace toolevents
