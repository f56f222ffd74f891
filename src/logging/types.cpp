/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <cctype>

namespace astrolabe::logging {

auto SinkConfig::toJson() const -> nlohmann::json {
    return {{"name", name},
            {"type", type},
            {"level", levelToString(level)},
            {"pattern", pattern},
            {"file_path", file_path},
            {"max_file_size", max_file_size},
            {"max_files", max_files},
            {"rotation_hour", rotation_hour},
            {"rotation_minute", rotation_minute}};
}

auto SinkConfig::fromJson(const nlohmann::json& j) -> SinkConfig {
    SinkConfig config;
    config.name = j.value("name", "");
    config.type = j.value("type", "console");
    config.level = levelFromString(j.value("level", "trace"));
    config.pattern = j.value("pattern", "");
    config.file_path = j.value("file_path", "");
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
    config.rotation_hour = j.value("rotation_hour", 0);
    config.rotation_minute = j.value("rotation_minute", 0);
    return config;
}

auto parseLevel(const std::string& level)
    -> std::optional<spdlog::level::level_enum> {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace")
        return spdlog::level::trace;
    if (lower == "debug")
        return spdlog::level::debug;
    if (lower == "info")
        return spdlog::level::info;
    if (lower == "warn" || lower == "warning")
        return spdlog::level::warn;
    if (lower == "error" || lower == "err")
        return spdlog::level::err;
    if (lower == "critical" || lower == "fatal")
        return spdlog::level::critical;
    if (lower == "off" || lower == "none")
        return spdlog::level::off;
    return std::nullopt;
}

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    return parseLevel(level).value_or(spdlog::level::info);
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    switch (level) {
        case spdlog::level::trace:
            return "trace";
        case spdlog::level::debug:
            return "debug";
        case spdlog::level::info:
            return "info";
        case spdlog::level::warn:
            return "warn";
        case spdlog::level::err:
            return "error";
        case spdlog::level::critical:
            return "critical";
        case spdlog::level::off:
            return "off";
        default:
            return "info";
    }
}

}  // namespace astrolabe::logging
