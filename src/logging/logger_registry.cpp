/*
 * logger_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logger_registry.hpp"

#include <algorithm>
#include <filesystem>

#include "sinks/sink_factory.hpp"

namespace astrolabe::logging {

using error::ErrorCode;
using error::makeError;

LoggerRegistry::LoggerRegistry(std::vector<spdlog::sink_ptr> sinks,
                               spdlog::level::level_enum default_level,
                               std::string default_pattern)
    : sinks_(std::move(sinks)),
      default_level_(default_level),
      default_pattern_(std::move(default_pattern)) {}

auto LoggerRegistry::fromConfig(const config::LoggingConfig& config)
    -> error::Result<std::unique_ptr<LoggerRegistry>> {
    auto level = parseLevel(config.level);
    if (!level) {
        return makeError(ErrorCode::InvalidInput, "unknown log level '{}'",
                         config.level);
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (config.enableConsole) {
        sinks.push_back(SinkFactory::createConsoleSink(
            levelFromString(config.consoleLevel), "", config.consoleColor));
    }

    if (config.enableFile) {
        SinkConfig fileSink;
        fileSink.name = "file";
        fileSink.type = config.useDailyRotation ? "daily_file" : "rotating_file";
        fileSink.level = levelFromString(config.fileLevel);
        fileSink.file_path =
            (std::filesystem::path(config.logDir) / (config.logFilename + ".log"))
                .string();
        fileSink.max_file_size = config.maxFileSize;
        fileSink.max_files = config.maxFiles;
        fileSink.rotation_hour = config.rotationHour;
        fileSink.rotation_minute = config.rotationMinute;

        auto sink = SinkFactory::createSink(fileSink);
        if (!sink) {
            return std::unexpected(sink.error());
        }
        sinks.push_back(*sink);
    }

    for (const auto& extra : config.additionalSinks) {
        auto sink = SinkFactory::createSink(extra);
        if (!sink) {
            return std::unexpected(sink.error());
        }
        sinks.push_back(*sink);
    }

    return std::make_unique<LoggerRegistry>(std::move(sinks), *level,
                                            config.pattern);
}

auto LoggerRegistry::getOrCreate(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    std::unique_lock lock(mutex_);

    if (auto it = loggers_.find(name); it != loggers_.end()) {
        return it->second;
    }

    auto logger =
        std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(default_level_);
    logger->set_pattern(default_pattern_);

    loggers_[name] = logger;
    patterns_[name] = default_pattern_;

    return logger;
}

auto LoggerRegistry::get(const std::string& name) const
    -> std::shared_ptr<spdlog::logger> {
    std::shared_lock lock(mutex_);
    auto it = loggers_.find(name);
    return it != loggers_.end() ? it->second : nullptr;
}

auto LoggerRegistry::exists(const std::string& name) const -> bool {
    std::shared_lock lock(mutex_);
    return loggers_.contains(name);
}

auto LoggerRegistry::remove(const std::string& name) -> bool {
    std::unique_lock lock(mutex_);
    patterns_.erase(name);
    return loggers_.erase(name) > 0;
}

auto LoggerRegistry::names() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);

    std::vector<std::string> result;
    result.reserve(loggers_.size());
    for (const auto& [name, logger] : loggers_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

auto LoggerRegistry::setLevel(const std::string& name,
                              spdlog::level::level_enum level) -> bool {
    std::unique_lock lock(mutex_);

    auto it = loggers_.find(name);
    if (it == loggers_.end()) {
        return false;
    }

    it->second->set_level(level);
    return true;
}

void LoggerRegistry::setGlobalLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);
    default_level_ = level;
    for (auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
}

auto LoggerRegistry::setPattern(const std::string& name,
                                const std::string& pattern) -> bool {
    std::unique_lock lock(mutex_);

    auto it = loggers_.find(name);
    if (it == loggers_.end()) {
        return false;
    }

    it->second->set_pattern(pattern);
    patterns_[name] = pattern;
    return true;
}

auto LoggerRegistry::getPattern(const std::string& name) const -> std::string {
    std::shared_lock lock(mutex_);

    auto it = patterns_.find(name);
    return (it != patterns_.end()) ? it->second : "";
}

void LoggerRegistry::addSink(const spdlog::sink_ptr& sink) {
    std::unique_lock lock(mutex_);

    sinks_.push_back(sink);
    for (auto& [name, logger] : loggers_) {
        logger->sinks().push_back(sink);
    }
}

void LoggerRegistry::flushAll() {
    std::shared_lock lock(mutex_);

    for (auto& [name, logger] : loggers_) {
        logger->flush();
    }
}

void LoggerRegistry::clear() {
    std::unique_lock lock(mutex_);
    loggers_.clear();
    patterns_.clear();
}

auto LoggerRegistry::count() const -> size_t {
    std::shared_lock lock(mutex_);
    return loggers_.size();
}

}  // namespace astrolabe::logging
