/**
 * @file geocentric.cpp
 * @brief Heliocentric to geocentric conversion.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "geocentric.hpp"

#include "calculation/transform.hpp"

namespace astrolabe::ephemeris {

EclipticCoordinates toGeocentric(const CartesianCoordinates& body,
                                 const CartesianCoordinates& earth) noexcept {
    return calculation::rectangularToEcliptic(body - earth);
}

EclipticCoordinates toGeocentric(const EclipticCoordinates& body,
                                 const EclipticCoordinates& earth) noexcept {
    return toGeocentric(calculation::eclipticToRectangular(body),
                        calculation::eclipticToRectangular(earth));
}

}  // namespace astrolabe::ephemeris
