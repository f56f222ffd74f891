/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging type definitions shared by the sink factory and the
logger registry

**************************************************/

#ifndef ASTROLABE_LOGGING_TYPES_HPP
#define ASTROLABE_LOGGING_TYPES_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace astrolabe::logging {

/**
 * @brief Sink configuration structure
 */
struct SinkConfig {
    std::string name;
    std::string type;  // "console", "file", "rotating_file", "daily_file", "null"
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;

    // File sink options
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10MB default
    size_t max_files{5};

    // Daily file options
    int rotation_hour{0};
    int rotation_minute{0};

    /**
     * @brief Convert sink config to JSON
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Create sink config from JSON
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> SinkConfig;
};

/**
 * @brief Convert level string to spdlog enum
 *
 * Unknown strings map to info.
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

/**
 * @brief Strict variant of levelFromString
 * @return nullopt when the string names no level
 */
[[nodiscard]] auto parseLevel(const std::string& level)
    -> std::optional<spdlog::level::level_enum>;

/**
 * @brief Convert spdlog level enum to string
 */
[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace astrolabe::logging

#endif  // ASTROLABE_LOGGING_TYPES_HPP
