/**
 * @file transform.hpp
 * @brief Coordinate system transformations.
 *
 * Provides conversions between the ecliptic, equatorial and horizontal
 * frames and between spherical and rectangular forms. Outputs are
 * normalized to [0, 360) in longitude/right ascension/azimuth; inputs at
 * or beyond a pole map to a fixed value instead of dividing by zero.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_CALCULATION_TRANSFORM_HPP
#define ASTROLABE_CALCULATION_TRANSFORM_HPP

#include <algorithm>
#include <cmath>

#include "astronomy/constants.hpp"
#include "astronomy/coordinates.hpp"
#include "error/error.hpp"
#include "sidereal.hpp"

namespace astrolabe::calculation {

using namespace astrolabe::astronomy;

// ============================================================================
// Ecliptic <-> Equatorial
// ============================================================================

/**
 * @brief Convert ecliptic coordinates to equatorial coordinates.
 *
 * At |latitude| >= 90 the input is an ecliptic pole, which sits at
 * RA 270 (north) or 90 (south) and declination +/-(90 - obliquity).
 *
 * @param longitude Ecliptic longitude in degrees.
 * @param latitude Ecliptic latitude in degrees.
 * @param obliquity Obliquity of the ecliptic in degrees.
 * @return Equatorial coordinates in degrees.
 */
[[nodiscard]] inline EquatorialCoordinates eclipticToEquatorial(
    double longitude, double latitude, double obliquity) noexcept {
    if (std::abs(latitude) >= 90.0) {
        double sign = latitude > 0.0 ? 1.0 : -1.0;
        return {sign > 0.0 ? 270.0 : 90.0, sign * (90.0 - obliquity)};
    }

    double lonRad = toRadians(normalizeAngle360(longitude));
    double latRad = toRadians(latitude);
    double epsRad = toRadians(obliquity);

    double sinEps = std::sin(epsRad);
    double cosEps = std::cos(epsRad);

    double ra = std::atan2(std::sin(lonRad) * cosEps - std::tan(latRad) * sinEps,
                           std::cos(lonRad));
    double sinDec = std::sin(latRad) * cosEps +
                    std::cos(latRad) * sinEps * std::sin(lonRad);
    double dec = std::asin(std::clamp(sinDec, -1.0, 1.0));

    return {normalizeAngle360(toDegrees(ra)), toDegrees(dec)};
}

/**
 * @brief Convert equatorial coordinates to ecliptic coordinates.
 *
 * At |declination| >= 90 the input is a celestial pole, which sits at
 * ecliptic longitude 90 (north) or 270 (south) and latitude
 * +/-(90 - obliquity).
 *
 * @param ra Right ascension in degrees.
 * @param dec Declination in degrees.
 * @param obliquity Obliquity of the ecliptic in degrees.
 * @return Ecliptic coordinates in degrees (radius 0).
 */
[[nodiscard]] inline EclipticCoordinates equatorialToEcliptic(
    double ra, double dec, double obliquity) noexcept {
    if (std::abs(dec) >= 90.0) {
        double sign = dec > 0.0 ? 1.0 : -1.0;
        return {sign > 0.0 ? 90.0 : 270.0, sign * (90.0 - obliquity)};
    }

    double raRad = toRadians(normalizeAngle360(ra));
    double decRad = toRadians(dec);
    double epsRad = toRadians(obliquity);

    double sinEps = std::sin(epsRad);
    double cosEps = std::cos(epsRad);

    double lon = std::atan2(std::sin(raRad) * cosEps + std::tan(decRad) * sinEps,
                            std::cos(raRad));
    double sinLat = std::sin(decRad) * cosEps -
                    std::cos(decRad) * sinEps * std::sin(raRad);
    double lat = std::asin(std::clamp(sinLat, -1.0, 1.0));

    return {normalizeAngle360(toDegrees(lon)), toDegrees(lat)};
}

// ============================================================================
// Equatorial <-> Horizontal
// ============================================================================

/**
 * @brief Convert equatorial coordinates to horizontal coordinates.
 *
 * Azimuth is measured from north through east. The atan2 form stays
 * defined at the geographic poles and at the zenith.
 *
 * @param ra Right ascension in degrees.
 * @param dec Declination in degrees.
 * @param latitude Observer latitude in degrees.
 * @param lst Local sidereal time in degrees.
 * @return HorizontalCoordinates (altitude, azimuth in degrees).
 */
[[nodiscard]] inline HorizontalCoordinates equatorialToHorizontal(
    double ra, double dec, double latitude, double lst) noexcept {
    double ha = toRadians(lst - ra);
    double decRad = toRadians(clampLatitude(dec));
    double latRad = toRadians(clampLatitude(latitude));

    double sinDec = std::sin(decRad);
    double cosDec = std::cos(decRad);
    double sinLat = std::sin(latRad);
    double cosLat = std::cos(latRad);
    double cosHA = std::cos(ha);
    double sinHA = std::sin(ha);

    double sinAlt = std::clamp(sinDec * sinLat + cosDec * cosLat * cosHA,
                               -1.0, 1.0);
    double altitude = toDegrees(std::asin(sinAlt));

    double azimuth = toDegrees(std::atan2(-sinHA * cosDec,
                                          cosLat * sinDec -
                                              sinLat * cosDec * cosHA));

    return {altitude, normalizeAngle360(azimuth)};
}

/**
 * @brief Convert horizontal coordinates to equatorial coordinates.
 * @param alt Altitude in degrees.
 * @param az Azimuth in degrees (north through east).
 * @param latitude Observer latitude in degrees.
 * @param lst Local sidereal time in degrees.
 * @return Equatorial coordinates in degrees.
 */
[[nodiscard]] inline EquatorialCoordinates horizontalToEquatorial(
    double alt, double az, double latitude, double lst) noexcept {
    double altRad = toRadians(clampLatitude(alt));
    double azRad = toRadians(az);
    double latRad = toRadians(clampLatitude(latitude));

    double sinAlt = std::sin(altRad);
    double cosAlt = std::cos(altRad);
    double sinAz = std::sin(azRad);
    double cosAz = std::cos(azRad);
    double sinLat = std::sin(latRad);
    double cosLat = std::cos(latRad);

    double sinDec = std::clamp(sinAlt * sinLat + cosAlt * cosLat * cosAz,
                               -1.0, 1.0);
    double dec = toDegrees(std::asin(sinDec));

    double ha = toDegrees(
        std::atan2(-sinAz * cosAlt, cosLat * sinAlt - sinLat * cosAlt * cosAz));

    return {normalizeAngle360(lst - ha), dec};
}

/**
 * @brief Horizontal position of an equatorial point for an observer at a
 * Julian Date.
 * @return CoordinateError when the location or input is not finite or out
 * of range.
 */
[[nodiscard]] auto toHorizontal(const EquatorialCoordinates& eq,
                                const ObserverLocation& location, double jd)
    -> error::Result<HorizontalCoordinates>;

// ============================================================================
// Spherical <-> Rectangular
// ============================================================================

/**
 * @brief Convert spherical coordinates to rectangular.
 * @param r Radius.
 * @param azimuth Azimuth (longitude) in radians.
 * @param altitude Altitude (latitude) in radians.
 */
[[nodiscard]] inline CartesianCoordinates sphericalToRectangular(
    double r, double azimuth, double altitude) noexcept {
    double cosAlt = std::cos(altitude);
    return {r * cosAlt * std::cos(azimuth), r * cosAlt * std::sin(azimuth),
            r * std::sin(altitude)};
}

/**
 * @brief Spherical form of a rectangular vector.
 *
 * The zero vector maps to (0, 0, 0).
 *
 * @return Radius, azimuth in [0, 2*pi) and altitude in [-pi/2, pi/2],
 * angles in radians, packed as (radius, longitude, latitude).
 */
[[nodiscard]] inline EclipticCoordinates rectangularToSpherical(
    const CartesianCoordinates& v) noexcept {
    double r = v.magnitude();
    if (r == 0.0) {
        return {0.0, 0.0, 0.0};
    }
    double azimuth = normalizeRadians(std::atan2(v.y, v.x));
    double altitude = std::asin(std::clamp(v.z / r, -1.0, 1.0));
    return {azimuth, altitude, r};
}

/**
 * @brief Rectangular vector of an ecliptic position given in degrees.
 */
[[nodiscard]] inline CartesianCoordinates eclipticToRectangular(
    const EclipticCoordinates& ecl) noexcept {
    return sphericalToRectangular(ecl.radius, toRadians(ecl.longitude),
                                  toRadians(ecl.latitude));
}

/**
 * @brief Ecliptic position in degrees of a rectangular vector.
 */
[[nodiscard]] inline EclipticCoordinates rectangularToEcliptic(
    const CartesianCoordinates& v) noexcept {
    auto sph = rectangularToSpherical(v);
    return {normalizeAngle360(toDegrees(sph.longitude)),
            toDegrees(sph.latitude), sph.radius};
}

}  // namespace astrolabe::calculation

#endif  // ASTROLABE_CALCULATION_TRANSFORM_HPP
