/**
 * @file geocentric.hpp
 * @brief Heliocentric to geocentric conversion.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_EPHEMERIS_GEOCENTRIC_HPP
#define ASTROLABE_EPHEMERIS_GEOCENTRIC_HPP

#include "astronomy/coordinates.hpp"

namespace astrolabe::ephemeris {

using astronomy::CartesianCoordinates;
using astronomy::EclipticCoordinates;

/**
 * @brief Geocentric ecliptic position from two heliocentric vectors.
 *
 * Subtracts the Earth vector from the body vector and returns the
 * difference in spherical form: longitude in [0, 360), latitude in
 * [-90, 90] and the Earth-body distance in AU.
 *
 * @param body Heliocentric rectangular position of the body (AU).
 * @param earth Heliocentric rectangular position of the Earth (AU), same
 * instant.
 */
[[nodiscard]] EclipticCoordinates toGeocentric(
    const CartesianCoordinates& body,
    const CartesianCoordinates& earth) noexcept;

/**
 * @brief Spherical overload: both positions given as heliocentric ecliptic
 * coordinates in degrees with radius in AU.
 */
[[nodiscard]] EclipticCoordinates toGeocentric(
    const EclipticCoordinates& body,
    const EclipticCoordinates& earth) noexcept;

}  // namespace astrolabe::ephemeris

#endif  // ASTROLABE_EPHEMERIS_GEOCENTRIC_HPP
