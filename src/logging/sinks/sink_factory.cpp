/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace astrolabe::logging {

using error::ErrorCode;
using error::makeError;

auto SinkFactory::createSink(const SinkConfig& config)
    -> error::Result<spdlog::sink_ptr> {
    bool needsPath = config.type == "file" || config.type == "basic_file" ||
                     config.type == "rotating_file" ||
                     config.type == "daily_file";
    if (needsPath && config.file_path.empty()) {
        return makeError(ErrorCode::InvalidInput,
                         "sink '{}' of type {} needs a file_path", config.name,
                         config.type);
    }

    try {
        if (config.type == "console" || config.type == "stdout") {
            return createConsoleSink(config.level, config.pattern);
        }
        if (config.type == "file" || config.type == "basic_file") {
            return createFileSink(config.file_path, config.level,
                                  config.pattern);
        }
        if (config.type == "rotating_file") {
            return createRotatingFileSink(config.file_path,
                                          config.max_file_size,
                                          config.max_files, config.level,
                                          config.pattern);
        }
        if (config.type == "daily_file") {
            return createDailyFileSink(config.file_path, config.rotation_hour,
                                       config.rotation_minute, config.level,
                                       config.pattern);
        }
        if (config.type == "null") {
            return createNullSink();
        }
    } catch (const spdlog::spdlog_ex& e) {
        return makeError(ErrorCode::InvalidInput, "failed to create sink '{}': {}",
                         config.name, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        return makeError(ErrorCode::InvalidInput, "failed to create sink '{}': {}",
                         config.name, e.what());
    }

    return makeError(ErrorCode::InvalidInput, "unknown sink type: {}",
                     config.type);
}

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    const std::string& pattern, bool color)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (color) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createFileSink(const std::string& file_path,
                                 spdlog::level::level_enum level,
                                 const std::string& pattern, bool truncate)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path,
                                                                    truncate);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createRotatingFileSink(const std::string& file_path,
                                         size_t max_size, size_t max_files,
                                         spdlog::level::level_enum level,
                                         const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file_path, max_size, max_files);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createDailyFileSink(const std::string& file_path,
                                      int rotation_hour, int rotation_minute,
                                      spdlog::level::level_enum level,
                                      const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
        file_path, rotation_hour, rotation_minute);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createNullSink() -> spdlog::sink_ptr {
    return std::make_shared<spdlog::sinks::null_sink_mt>();
}

void SinkFactory::ensureDirectoryExists(const std::string& file_path) {
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

}  // namespace astrolabe::logging
