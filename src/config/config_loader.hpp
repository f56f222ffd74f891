/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Loads the astrolabe configuration document

**************************************************/

#ifndef ASTROLABE_CONFIG_CONFIG_LOADER_HPP
#define ASTROLABE_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/config_section.hpp"
#include "error/error.hpp"
#include "sections/engine_config.hpp"
#include "sections/logging_config.hpp"

namespace astrolabe::config {

namespace fs = std::filesystem;

/**
 * @brief Every configuration section of the library
 */
struct AstrolabeConfig {
    EngineConfig engine;
    LoggingConfig logging;

    /**
     * @brief Full document, sections placed at their paths
     */
    [[nodiscard]] json toJson() const;
};

/**
 * @brief Reads configuration documents
 *
 * Sections live at their PATH inside the document, for example
 * {"astrolabe": {"engine": {...}, "logging": {...}}}. Missing sections and
 * missing keys take their defaults; type mismatches and values rejected by a
 * section's check() are reported as InvalidInput.
 */
class ConfigLoader {
public:
    /**
     * @brief Parse a JSON document held in memory
     */
    [[nodiscard]] static auto loadString(std::string_view text)
        -> error::Result<AstrolabeConfig>;

    /**
     * @brief Read and parse a JSON file
     */
    [[nodiscard]] static auto loadFile(const fs::path& path)
        -> error::Result<AstrolabeConfig>;

    /**
     * @brief Build the configuration from an already parsed document
     */
    [[nodiscard]] static auto fromJson(const json& document)
        -> error::Result<AstrolabeConfig>;

    /**
     * @brief Extract one section, defaults when it is absent
     */
    template <ConfigSectionDerived T>
    [[nodiscard]] static auto readSection(const json& document)
        -> error::Result<T> {
        const json::json_pointer pointer{std::string(T::PATH)};
        if (!document.contains(pointer)) {
            return T::defaults();
        }
        return T::tryFromJson(document.at(pointer));
    }
};

}  // namespace astrolabe::config

#endif  // ASTROLABE_CONFIG_CONFIG_LOADER_HPP
