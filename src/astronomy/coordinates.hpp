/**
 * @file coordinates.hpp
 * @brief Coordinate types used across the engine.
 *
 * This file defines the reference frames the engine works in:
 * - Ecliptic coordinates (longitude/latitude, optional radius)
 * - Equatorial coordinates (RA/Dec)
 * - Horizontal coordinates (Alt/Az)
 * - Rectangular coordinates
 * - Observer location (geographic coordinates)
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_ASTRONOMY_COORDINATES_HPP
#define ASTROLABE_ASTRONOMY_COORDINATES_HPP

#include <cmath>

#include <nlohmann/json.hpp>

#include "constants.hpp"

namespace astrolabe::astronomy {

using json = nlohmann::json;

// ============================================================================
// Ecliptic Coordinates
// ============================================================================

/**
 * @struct EclipticCoordinates
 * @brief Spherical position referred to the ecliptic and equinox of date.
 *
 * Heliocentric positions carry a radius vector in AU; geocentric positions
 * produced by the engine carry the Earth-body distance.
 */
struct EclipticCoordinates {
    double longitude{0.0};  ///< Ecliptic longitude in degrees [0, 360)
    double latitude{0.0};   ///< Ecliptic latitude in degrees [-90, 90]
    double radius{0.0};     ///< Distance in AU (0 when not applicable)

    EclipticCoordinates() = default;

    EclipticCoordinates(double lon, double lat, double r = 0.0)
        : longitude(lon), latitude(lat), radius(r) {}

    [[nodiscard]] bool isValid() const noexcept {
        return longitude >= 0.0 && longitude < 360.0 && latitude >= -90.0 &&
               latitude <= 90.0;
    }

    [[nodiscard]] json toJson() const {
        return {{"longitude", longitude},
                {"latitude", latitude},
                {"radius", radius}};
    }
};

// ============================================================================
// Equatorial Coordinates
// ============================================================================

/**
 * @struct EquatorialCoordinates
 * @brief Right ascension and declination, both in degrees.
 */
struct EquatorialCoordinates {
    double rightAscension{0.0};  ///< Right Ascension in degrees [0, 360)
    double declination{0.0};     ///< Declination in degrees [-90, 90]

    EquatorialCoordinates() = default;

    EquatorialCoordinates(double ra, double dec)
        : rightAscension(ra), declination(dec) {}

    [[nodiscard]] double raHours() const noexcept {
        return rightAscension / HOURS_TO_DEG;
    }

    [[nodiscard]] json toJson() const {
        return {{"ra", rightAscension}, {"dec", declination}};
    }
};

// ============================================================================
// Horizontal Coordinates (Alt/Az)
// ============================================================================

/**
 * @struct HorizontalCoordinates
 * @brief Altitude and azimuth coordinates.
 *
 * Azimuth is measured from north through east.
 */
struct HorizontalCoordinates {
    double altitude{
        0.0};  ///< Altitude in degrees (0-90, negative below horizon)
    double azimuth{0.0};  ///< Azimuth in degrees (0-360, N=0, E=90)

    HorizontalCoordinates() = default;

    HorizontalCoordinates(double alt, double az) : altitude(alt), azimuth(az) {}

    /**
     * @brief Check if object is above the horizon.
     * @return true if altitude > 0.
     */
    [[nodiscard]] bool isAboveHorizon() const noexcept {
        return altitude > 0.0;
    }

    [[nodiscard]] json toJson() const {
        return {{"altitude", altitude}, {"azimuth", azimuth}};
    }
};

// ============================================================================
// Rectangular Coordinates
// ============================================================================

/**
 * @struct CartesianCoordinates
 * @brief Rectangular coordinates in AU.
 */
struct CartesianCoordinates {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    [[nodiscard]] double magnitude() const noexcept {
        return std::sqrt(x * x + y * y + z * z);
    }

    CartesianCoordinates operator-(const CartesianCoordinates& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }
};

// ============================================================================
// Observer Location
// ============================================================================

/**
 * @struct ObserverLocation
 * @brief Geographic location of the observer.
 */
struct ObserverLocation {
    double latitude{0.0};   ///< Latitude in degrees (-90 to +90)
    double longitude{0.0};  ///< Longitude in degrees (-180 to +180), east positive

    ObserverLocation() = default;

    ObserverLocation(double lat, double lon) : latitude(lat), longitude(lon) {}

    /**
     * @brief Check if location is valid.
     * @return true if coordinates are within valid ranges.
     */
    [[nodiscard]] bool isValid() const noexcept {
        return latitude >= -90.0 && latitude <= 90.0 && longitude >= -180.0 &&
               longitude <= 180.0;
    }

    [[nodiscard]] json toJson() const {
        return {{"latitude", latitude}, {"longitude", longitude}};
    }
};

}  // namespace astrolabe::astronomy

#endif  // ASTROLABE_ASTRONOMY_COORDINATES_HPP
