/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging configuration section

**************************************************/

#ifndef ASTROLABE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define ASTROLABE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <string>
#include <vector>

#include "../core/config_section.hpp"
#include "logging/types.hpp"

namespace astrolabe::config {

/**
 * @brief Logging configuration
 *
 * The engine itself only emits debug records. Console output is on and
 * file output is off unless configured.
 *
 * @example
 * ```json
 * {
 *   "astrolabe": {
 *     "logging": {
 *       "level": "debug",
 *       "enableConsole": true,
 *       "consoleLevel": "info",
 *       "enableFile": true,
 *       "logDir": "logs",
 *       "logFilename": "astrolabe",
 *       "fileLevel": "debug"
 *     }
 *   }
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/astrolabe/logging";

    std::string level{"info"};  ///< Level of loggers created by the registry

    // ========================================================================
    // Console Settings
    // ========================================================================

    bool enableConsole{true};          ///< Enable console output
    std::string consoleLevel{"info"};  ///< Console log level
    bool consoleColor{true};           ///< Enable ANSI color codes

    // ========================================================================
    // File Settings
    // ========================================================================

    bool enableFile{false};                ///< Enable file output
    std::string logDir{"logs"};            ///< Log directory path
    std::string logFilename{"astrolabe"};  ///< Base filename (without extension)
    std::string fileLevel{"debug"};        ///< File log level

    // ========================================================================
    // Rotation Settings
    // ========================================================================

    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size before rotation (10 MB)
    size_t maxFiles{5};                    ///< Max number of rotated files
    bool useDailyRotation{false};          ///< Use daily rotation instead of size-based
    int rotationHour{0};                   ///< Hour for daily rotation (0-23)
    int rotationMinute{0};                 ///< Minute for daily rotation (0-59)

    /// Record layout, see spdlog pattern flags
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};

    std::vector<logging::SinkConfig> additionalSinks;  ///< Extra sinks

    [[nodiscard]] json serialize() const {
        json sinksArray = json::array();
        for (const auto& sink : additionalSinks) {
            sinksArray.push_back(sink.toJson());
        }

        return {{"level", level},
                {"enableConsole", enableConsole},
                {"consoleLevel", consoleLevel},
                {"consoleColor", consoleColor},
                {"enableFile", enableFile},
                {"logDir", logDir},
                {"logFilename", logFilename},
                {"fileLevel", fileLevel},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"useDailyRotation", useDailyRotation},
                {"rotationHour", rotationHour},
                {"rotationMinute", rotationMinute},
                {"pattern", pattern},
                {"additionalSinks", sinksArray}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;

        cfg.level = j.value("level", cfg.level);

        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);

        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);

        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        cfg.useDailyRotation = j.value("useDailyRotation", cfg.useDailyRotation);
        cfg.rotationHour = j.value("rotationHour", cfg.rotationHour);
        cfg.rotationMinute = j.value("rotationMinute", cfg.rotationMinute);

        cfg.pattern = j.value("pattern", cfg.pattern);

        if (j.contains("additionalSinks") && j["additionalSinks"].is_array()) {
            for (const auto& sinkJson : j["additionalSinks"]) {
                cfg.additionalSinks.push_back(
                    logging::SinkConfig::fromJson(sinkJson));
            }
        }

        return cfg;
    }

    [[nodiscard]] error::Result<void> check() const {
        for (const auto* name : {&level, &consoleLevel, &fileLevel}) {
            if (!logging::parseLevel(*name)) {
                return error::makeError(error::ErrorCode::InvalidInput,
                                        "unknown log level '{}'", *name);
            }
        }
        if (rotationHour < 0 || rotationHour > 23 || rotationMinute < 0 ||
            rotationMinute > 59) {
            return error::makeError(error::ErrorCode::InvalidInput,
                                    "rotation time {}:{} out of range",
                                    rotationHour, rotationMinute);
        }
        if (maxFiles < 1) {
            return error::makeError(error::ErrorCode::InvalidInput,
                                    "maxFiles must be at least 1");
        }
        return {};
    }

    [[nodiscard]] static json generateSchema() {
        const json levels = {"trace", "debug", "info",   "warn",
                             "error", "critical", "off"};
        return {
            {"type", "object"},
            {"properties",
             {{"level", {{"type", "string"}, {"enum", levels}, {"default", "info"}}},
              {"enableConsole", {{"type", "boolean"}, {"default", true}}},
              {"consoleLevel",
               {{"type", "string"}, {"enum", levels}, {"default", "info"}}},
              {"consoleColor", {{"type", "boolean"}, {"default", true}}},
              {"enableFile", {{"type", "boolean"}, {"default", false}}},
              {"logDir", {{"type", "string"}, {"default", "logs"}}},
              {"logFilename", {{"type", "string"}, {"default", "astrolabe"}}},
              {"fileLevel",
               {{"type", "string"}, {"enum", levels}, {"default", "debug"}}},
              {"maxFileSize",
               {{"type", "integer"},
                {"minimum", 1024},
                {"maximum", 1073741824},
                {"default", 10485760}}},
              {"maxFiles",
               {{"type", "integer"}, {"minimum", 1}, {"maximum", 100}, {"default", 5}}},
              {"useDailyRotation", {{"type", "boolean"}, {"default", false}}},
              {"rotationHour",
               {{"type", "integer"}, {"minimum", 0}, {"maximum", 23}, {"default", 0}}},
              {"rotationMinute",
               {{"type", "integer"}, {"minimum", 0}, {"maximum", 59}, {"default", 0}}},
              {"pattern", {{"type", "string"}}},
              {"additionalSinks", {{"type", "array"}}}}}};
    }
};

}  // namespace astrolabe::config

#endif  // ASTROLABE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
