/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Loads the astrolabe configuration document

**************************************************/

#include "config_loader.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>

namespace astrolabe::config {

using error::ErrorCode;
using error::makeError;

namespace {

/// Refuse documents larger than this
constexpr std::uintmax_t MAX_FILE_SIZE = 10 * 1024 * 1024;

}  // namespace

json AstrolabeConfig::toJson() const {
    json document = json::object();
    document[json::json_pointer{std::string(EngineConfig::PATH)}] =
        engine.toJson();
    document[json::json_pointer{std::string(LoggingConfig::PATH)}] =
        logging.toJson();
    return document;
}

auto ConfigLoader::fromJson(const json& document)
    -> error::Result<AstrolabeConfig> {
    if (!document.is_object()) {
        return makeError(ErrorCode::InvalidInput,
                         "configuration document must be a JSON object");
    }

    AstrolabeConfig config;
    auto engine = readSection<EngineConfig>(document);
    if (!engine) {
        return std::unexpected(engine.error());
    }
    config.engine = std::move(*engine);

    auto logging = readSection<LoggingConfig>(document);
    if (!logging) {
        return std::unexpected(logging.error());
    }
    config.logging = std::move(*logging);
    return config;
}

auto ConfigLoader::loadString(std::string_view text)
    -> error::Result<AstrolabeConfig> {
    // Comments are allowed in hand-written config files
    json document = json::parse(text, nullptr, false, true);
    if (document.is_discarded()) {
        return makeError(ErrorCode::InvalidInput,
                         "configuration is not valid JSON");
    }
    return fromJson(document);
}

auto ConfigLoader::loadFile(const fs::path& path)
    -> error::Result<AstrolabeConfig> {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return makeError(ErrorCode::InvalidInput,
                         "configuration file does not exist: {}",
                         path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec || size > MAX_FILE_SIZE) {
        return makeError(ErrorCode::InvalidInput,
                         "configuration file unreadable or too large: {}",
                         path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return makeError(ErrorCode::InvalidInput, "failed to open {}",
                         path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    auto config = loadString(content);
    if (!config) {
        return makeError(config.error().code, "{}: {}", path.string(),
                         config.error().message);
    }
    return config;
}

}  // namespace astrolabe::config
