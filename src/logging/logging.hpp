/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging entry points used by the calculators

**************************************************/

#ifndef ASTROLABE_LOGGING_LOGGING_HPP
#define ASTROLABE_LOGGING_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "logger_registry.hpp"
#include "sinks/sink_factory.hpp"
#include "types.hpp"

namespace astrolabe::logging {

/**
 * @brief Logger that discards every record.
 *
 * Used by calculators constructed without a logger.
 */
[[nodiscard]] inline auto makeNullLogger(const std::string& name = "astrolabe")
    -> std::shared_ptr<spdlog::logger> {
    auto logger =
        std::make_shared<spdlog::logger>(name, SinkFactory::createNullSink());
    logger->set_level(spdlog::level::off);
    return logger;
}

/**
 * @brief Return the given logger, or a null logger when it is empty.
 */
[[nodiscard]] inline auto orNullLogger(std::shared_ptr<spdlog::logger> logger,
                                       const std::string& name = "astrolabe")
    -> std::shared_ptr<spdlog::logger> {
    return logger ? std::move(logger) : makeNullLogger(name);
}

}  // namespace astrolabe::logging

#endif  // ASTROLABE_LOGGING_LOGGING_HPP
