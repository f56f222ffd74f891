/**
 * @file position.hpp
 * @brief Computed position of a chart body.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_EPHEMERIS_POSITION_HPP
#define ASTROLABE_EPHEMERIS_POSITION_HPP

#include <optional>

#include "body.hpp"

namespace astrolabe::ephemeris {

/**
 * @struct BodyPosition
 * @brief Geocentric position and motion of one body at one instant.
 */
struct BodyPosition {
    Body body{Body::Sun};
    double longitude{0.0};   ///< Ecliptic longitude in degrees [0, 360)
    double latitude{0.0};    ///< Ecliptic latitude in degrees [-90, 90]
    double distance{0.0};    ///< Distance in AU (0 when not modelled)
    double speed{0.0};       ///< Longitude speed in degrees per day
    bool retrograde{false};  ///< speed < 0
    std::optional<int> house;  ///< House 1-12 once assigned
};

}  // namespace astrolabe::ephemeris

#endif  // ASTROLABE_EPHEMERIS_POSITION_HPP
