/*
 * engine_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Chart engine configuration section

**************************************************/

#ifndef ASTROLABE_CONFIG_SECTIONS_ENGINE_CONFIG_HPP
#define ASTROLABE_CONFIG_SECTIONS_ENGINE_CONFIG_HPP

#include <map>
#include <string>
#include <vector>

#include "../core/config_section.hpp"
#include "aspects/aspect_types.hpp"
#include "chart/ayanamsa.hpp"
#include "ephemeris/body.hpp"
#include "houses/house_system.hpp"

namespace astrolabe::config {

/**
 * @brief Defaults of the chart engine
 *
 * Bodies and aspects are referred to by name. Sampling intervals are
 * half-widths of the speed sampling window in Julian centuries.
 *
 * @example
 * ```json
 * {
 *   "astrolabe": {
 *     "engine": {
 *       "houseSystem": "K",
 *       "ayanamsa": "lahiri",
 *       "samplingOverrides": {"Moon": 0.00001},
 *       "orbOverrides": {"Sextile": 6.0},
 *       "parallel": true
 *     }
 *   }
 * }
 * ```
 */
struct EngineConfig : ConfigSection<EngineConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/astrolabe/engine";

    std::string houseSystem{"P"};     ///< House system token or name
    std::string ayanamsa{"tropical"};  ///< Zodiac reference

    // ========================================================================
    // Motion Sampling
    // ========================================================================

    double samplingIntervalCenturies{0.0001};
    std::map<std::string, double> samplingOverrides{{"Moon", 0.00001},
                                                    {"Mars", 0.0002}};

    // ========================================================================
    // Kepler Solver
    // ========================================================================

    double keplerTolerance{1e-12};
    int keplerMaxIterations{50};

    // ========================================================================
    // Aspects
    // ========================================================================

    bool excludeRetrograde{true};  ///< Skip pairs with a retrograde body
    std::map<std::string, double> orbOverrides;  ///< Aspect name -> orb

    bool parallel{false};  ///< Evaluate bodies concurrently

    /// Bodies placed in a chart
    std::vector<std::string> bodies{"Sun",     "Moon",    "Mercury",
                                    "Venus",   "Mars",    "Jupiter",
                                    "Saturn",  "Uranus",  "Neptune",
                                    "Pluto",   "Mean Node"};

    [[nodiscard]] json serialize() const {
        return {{"houseSystem", houseSystem},
                {"ayanamsa", ayanamsa},
                {"samplingIntervalCenturies", samplingIntervalCenturies},
                {"samplingOverrides", samplingOverrides},
                {"keplerTolerance", keplerTolerance},
                {"keplerMaxIterations", keplerMaxIterations},
                {"excludeRetrograde", excludeRetrograde},
                {"orbOverrides", orbOverrides},
                {"parallel", parallel},
                {"bodies", bodies}};
    }

    [[nodiscard]] static EngineConfig deserialize(const json& j) {
        EngineConfig cfg;

        cfg.houseSystem = j.value("houseSystem", cfg.houseSystem);
        cfg.ayanamsa = j.value("ayanamsa", cfg.ayanamsa);

        cfg.samplingIntervalCenturies =
            j.value("samplingIntervalCenturies", cfg.samplingIntervalCenturies);
        if (j.contains("samplingOverrides")) {
            cfg.samplingOverrides =
                j["samplingOverrides"].get<std::map<std::string, double>>();
        }

        cfg.keplerTolerance = j.value("keplerTolerance", cfg.keplerTolerance);
        cfg.keplerMaxIterations =
            j.value("keplerMaxIterations", cfg.keplerMaxIterations);

        cfg.excludeRetrograde =
            j.value("excludeRetrograde", cfg.excludeRetrograde);
        if (j.contains("orbOverrides")) {
            cfg.orbOverrides =
                j["orbOverrides"].get<std::map<std::string, double>>();
        }

        cfg.parallel = j.value("parallel", cfg.parallel);
        if (j.contains("bodies")) {
            cfg.bodies = j["bodies"].get<std::vector<std::string>>();
        }

        return cfg;
    }

    [[nodiscard]] error::Result<void> check() const {
        using error::ErrorCode;
        using error::makeError;

        if (auto system = houses::parseHouseSystem(houseSystem); !system) {
            return makeError(ErrorCode::InvalidInput, "{}",
                             system.error().message);
        }
        if (auto zodiac = chart::parseAyanamsa(ayanamsa); !zodiac) {
            return std::unexpected(zodiac.error());
        }
        if (!(samplingIntervalCenturies > 0.0)) {
            return makeError(ErrorCode::InvalidInput,
                             "samplingIntervalCenturies must be positive");
        }
        for (const auto& [name, interval] : samplingOverrides) {
            if (!ephemeris::parseBody(name)) {
                return makeError(ErrorCode::InvalidInput,
                                 "unknown body '{}' in samplingOverrides",
                                 name);
            }
            if (!(interval > 0.0)) {
                return makeError(ErrorCode::InvalidInput,
                                 "sampling interval of {} must be positive",
                                 name);
            }
        }
        if (!(keplerTolerance > 0.0) || keplerMaxIterations < 1) {
            return makeError(ErrorCode::InvalidInput,
                             "invalid Kepler settings (tolerance {}, "
                             "maxIterations {})",
                             keplerTolerance, keplerMaxIterations);
        }
        for (const auto& [name, orb] : orbOverrides) {
            if (!aspects::parseAspectType(name)) {
                return makeError(ErrorCode::InvalidInput,
                                 "unknown aspect '{}' in orbOverrides", name);
            }
            if (orb < 0.0 || orb > 180.0) {
                return makeError(ErrorCode::InvalidInput,
                                 "orb of {} out of range: {}", name, orb);
            }
        }
        if (bodies.empty()) {
            return makeError(ErrorCode::InvalidInput, "body list is empty");
        }
        for (const auto& name : bodies) {
            if (!ephemeris::parseBody(name)) {
                return makeError(ErrorCode::InvalidInput, "unknown body '{}'",
                                 name);
            }
        }
        return {};
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties",
             {{"houseSystem", {{"type", "string"}, {"default", "P"}}},
              {"ayanamsa",
               {{"type", "string"},
                {"enum", {"tropical", "lahiri", "fagan_bradley"}},
                {"default", "tropical"}}},
              {"samplingIntervalCenturies",
               {{"type", "number"},
                {"exclusiveMinimum", 0},
                {"default", 0.0001}}},
              {"samplingOverrides",
               {{"type", "object"},
                {"additionalProperties",
                 {{"type", "number"}, {"exclusiveMinimum", 0}}}}},
              {"keplerTolerance",
               {{"type", "number"}, {"exclusiveMinimum", 0}, {"default", 1e-12}}},
              {"keplerMaxIterations",
               {{"type", "integer"}, {"minimum", 1}, {"default", 50}}},
              {"excludeRetrograde", {{"type", "boolean"}, {"default", true}}},
              {"orbOverrides",
               {{"type", "object"},
                {"additionalProperties",
                 {{"type", "number"}, {"minimum", 0}, {"maximum", 180}}}}},
              {"parallel", {{"type", "boolean"}, {"default", false}}},
              {"bodies",
               {{"type", "array"}, {"items", {{"type", "string"}}}}}}}};
    }
};

}  // namespace astrolabe::config

#endif  // ASTROLABE_CONFIG_SECTIONS_ENGINE_CONFIG_HPP
