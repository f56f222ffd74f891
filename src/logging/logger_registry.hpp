/*
 * logger_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Registry owning the named loggers handed to calculators

**************************************************/

#ifndef ASTROLABE_LOGGING_LOGGER_REGISTRY_HPP
#define ASTROLABE_LOGGING_LOGGER_REGISTRY_HPP

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"
#include "error/error.hpp"
#include "types.hpp"

namespace astrolabe::logging {

/**
 * @brief Registry for managing named loggers
 *
 * Loggers created here share the registry's sinks and are not entered in
 * spdlog's global registry, so two registries never see each other's
 * loggers. A registry without sinks hands out loggers that discard
 * everything.
 */
class LoggerRegistry {
public:
    /// Default record layout
    static constexpr const char* DEFAULT_PATTERN =
        "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    LoggerRegistry() = default;

    /**
     * @brief Create a registry over a fixed sink set
     * @param sinks Sinks attached to every logger
     * @param default_level Level of newly created loggers
     * @param default_pattern Pattern of newly created loggers
     */
    LoggerRegistry(std::vector<spdlog::sink_ptr> sinks,
                   spdlog::level::level_enum default_level,
                   std::string default_pattern = DEFAULT_PATTERN);

    LoggerRegistry(const LoggerRegistry&) = delete;
    LoggerRegistry& operator=(const LoggerRegistry&) = delete;

    /**
     * @brief Build sinks from the logging configuration section
     * @return Registry, or InvalidInput when a sink cannot be created
     */
    [[nodiscard]] static auto fromConfig(const config::LoggingConfig& config)
        -> error::Result<std::unique_ptr<LoggerRegistry>>;

    /**
     * @brief Get or create a logger by name
     * @param name Logger name
     * @return Shared pointer to logger
     */
    auto getOrCreate(const std::string& name)
        -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Get existing logger by name
     * @param name Logger name
     * @return Logger if exists, nullptr otherwise
     */
    [[nodiscard]] auto get(const std::string& name) const
        -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Check if logger exists
     */
    [[nodiscard]] auto exists(const std::string& name) const -> bool;

    /**
     * @brief Remove a logger
     * @return true if removed, false if not found
     */
    auto remove(const std::string& name) -> bool;

    /**
     * @brief Names of all registered loggers, sorted
     */
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    /**
     * @brief Set level for a specific logger
     * @return true if the logger exists
     */
    auto setLevel(const std::string& name, spdlog::level::level_enum level)
        -> bool;

    /**
     * @brief Set level for all loggers and for loggers created later
     */
    void setGlobalLevel(spdlog::level::level_enum level);

    /**
     * @brief Set pattern for a specific logger
     * @return true if the logger exists
     */
    auto setPattern(const std::string& name, const std::string& pattern)
        -> bool;

    /**
     * @brief Get pattern for a logger
     * @return Pattern string, or empty if not found
     */
    [[nodiscard]] auto getPattern(const std::string& name) const -> std::string;

    /**
     * @brief Attach a sink to every existing and future logger
     */
    void addSink(const spdlog::sink_ptr& sink);

    /**
     * @brief Flush all loggers
     */
    void flushAll();

    /**
     * @brief Drop all loggers
     */
    void clear();

    /**
     * @brief Get count of registered loggers
     */
    [[nodiscard]] auto count() const -> size_t;

private:
    mutable std::shared_mutex mutex_;
    std::vector<spdlog::sink_ptr> sinks_;
    spdlog::level::level_enum default_level_{spdlog::level::info};
    std::string default_pattern_{DEFAULT_PATTERN};
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
    std::unordered_map<std::string, std::string> patterns_;
};

}  // namespace astrolabe::logging

#endif  // ASTROLABE_LOGGING_LOGGER_REGISTRY_HPP
