/**
 * @file types.hpp
 * @brief Chart requests, options and results.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_CHART_TYPES_HPP
#define ASTROLABE_CHART_TYPES_HPP

#include <optional>
#include <string>
#include <vector>

#include "aspects/aspect_detector.hpp"
#include "ayanamsa.hpp"
#include "calculation/julian.hpp"
#include "ephemeris/body.hpp"
#include "ephemeris/kepler.hpp"
#include "ephemeris/position.hpp"
#include "ephemeris/velocity.hpp"
#include "error/error.hpp"
#include "houses/house_calculator.hpp"

namespace astrolabe::config {
struct EngineConfig;
}

namespace astrolabe::chart {

/**
 * @struct ChartRequest
 * @brief Moment and place of a chart.
 *
 * Empty optionals take the calculator's defaults.
 */
struct ChartRequest {
    calculation::DateTime dateTime;
    double timezoneOffset{0.0};  ///< Hours east of UTC
    double latitude{0.0};        ///< Degrees, north positive
    double longitude{0.0};       ///< Degrees, east positive
    std::optional<std::string> houseSystem;  ///< Token or name
    std::optional<std::string> ayanamsa;     ///< "tropical", "lahiri", ...
};

/**
 * @struct ChartOptions
 * @brief Calculator defaults.
 */
struct ChartOptions {
    houses::HouseSystem houseSystem{houses::HouseSystem::Placidus};
    Ayanamsa ayanamsa{Ayanamsa::Tropical};
    ephemeris::SamplingIntervals sampling;
    aspects::AspectOptions aspects;
    bool parallel{false};  ///< Evaluate bodies with std::async
    std::vector<ephemeris::Body> bodies{ephemeris::defaultBodies()};

    /**
     * @brief Translate an engine configuration section.
     * @return InvalidInput when the section fails its checks.
     */
    [[nodiscard]] static auto fromConfig(const config::EngineConfig& config)
        -> error::Result<ChartOptions>;
};

/**
 * @brief Solver settings of an engine configuration section.
 */
[[nodiscard]] auto keplerOptionsFromConfig(const config::EngineConfig& config)
    -> ephemeris::KeplerOptions;

/**
 * @struct Chart
 * @brief Positions, houses and aspects of one moment and place.
 */
struct Chart {
    double julianDate{0.0};
    double latitude{0.0};
    double longitude{0.0};
    Ayanamsa ayanamsa{Ayanamsa::Tropical};
    double ayanamsaDegrees{0.0};
    std::vector<ephemeris::BodyPosition> bodies;
    houses::HouseCusps houses;
    std::vector<aspects::Aspect> aspects;

    /**
     * @brief Position of a body, nullptr when the chart does not hold it.
     */
    [[nodiscard]] const ephemeris::BodyPosition* find(
        ephemeris::Body body) const noexcept;
};

/**
 * @struct ChartComparison
 * @brief Two charts and the aspects between them (transits, synastry).
 */
struct ChartComparison {
    Chart inner;  ///< Natal chart, or the first partner
    Chart outer;  ///< Transit chart, or the second partner
    std::vector<aspects::Aspect> crossAspects;
};

}  // namespace astrolabe::chart

#endif  // ASTROLABE_CHART_TYPES_HPP
