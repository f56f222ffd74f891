/**
 * @file chart_serializer.hpp
 * @brief JSON form of charts for the API and rendering layers.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_CHART_CHART_SERIALIZER_HPP
#define ASTROLABE_CHART_CHART_SERIALIZER_HPP

#include <nlohmann/json.hpp>

#include "ephemeris/position.hpp"
#include "types.hpp"

namespace astrolabe::chart {

using json = nlohmann::json;

/**
 * @brief {name, longitude, latitude, speed, retrograde, house?}
 *
 * "house" is omitted until the body has been placed.
 */
[[nodiscard]] json toJson(const ephemeris::BodyPosition& position);

/**
 * @brief Whole chart.
 *
 * @example
 * ```json
 * {
 *   "julian_date": 2443440.7055556,
 *   "location": {"latitude": 14.65, "longitude": 121.05},
 *   "zodiac": {"ayanamsa": "tropical", "offset": 0.0},
 *   "house_system": "Placidus",
 *   "bodies": [{"name": "Sun", "longitude": ..., "house": ...}, ...],
 *   "houses": [{"number": 1, "longitude": ...}, ...],
 *   "angles": {"ascendant": ..., "midheaven": ..., ...},
 *   "aspects": [{"body_a": "Sun", "body_b": "Mercury",
 *                "type": "Conjunction", "orb": ..., "applying": false}]
 * }
 * ```
 */
[[nodiscard]] json toJson(const Chart& chart);

/**
 * @brief Both charts plus their cross aspects.
 */
[[nodiscard]] json toJson(const ChartComparison& comparison);

}  // namespace astrolabe::chart

#endif  // ASTROLABE_CHART_CHART_SERIALIZER_HPP
