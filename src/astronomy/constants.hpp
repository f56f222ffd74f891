/**
 * @file constants.hpp
 * @brief Astronomical constants and angle helpers shared by the engine.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_ASTRONOMY_CONSTANTS_HPP
#define ASTROLABE_ASTRONOMY_CONSTANTS_HPP

#include <algorithm>
#include <cmath>
#include <numbers>

namespace astrolabe::astronomy {

// ============================================================================
// Mathematical Constants
// ============================================================================

/// Pi constant using std::numbers for precision
inline constexpr double K_PI = std::numbers::pi;
/// Two times Pi
inline constexpr double K_TWO_PI = 2.0 * K_PI;
/// Half of Pi
inline constexpr double K_HALF_PI = K_PI / 2.0;

// ============================================================================
// Angular Conversion Constants
// ============================================================================

/// Conversion factor: degrees to radians
inline constexpr double DEG_TO_RAD = K_PI / 180.0;
/// Conversion factor: radians to degrees
inline constexpr double RAD_TO_DEG = 180.0 / K_PI;
/// Conversion factor: hours to degrees (1 hour = 15 degrees)
inline constexpr double HOURS_TO_DEG = 15.0;
/// Degrees in a full circle
inline constexpr double DEGREES_IN_CIRCLE = 360.0;
/// Degrees in a zodiac sign
inline constexpr double DEGREES_PER_SIGN = 30.0;

// ============================================================================
// Time Constants
// ============================================================================

/// Hours in a day
inline constexpr double HOURS_IN_DAY = 24.0;
/// Minutes in an hour
inline constexpr double MINUTES_IN_HOUR = 60.0;
/// Seconds in an hour
inline constexpr double SECONDS_IN_HOUR = 3600.0;
/// Seconds in a day
inline constexpr double SECONDS_IN_DAY = 86400.0;

// ============================================================================
// Julian Date Constants
// ============================================================================

/// Julian Date of Unix epoch (1970-01-01 00:00:00 UTC)
inline constexpr double JD_UNIX_EPOCH = 2440587.5;
/// J2000.0 epoch in Julian Date
inline constexpr double JD_J2000 = 2451545.0;
/// Days in a Julian century
inline constexpr double JULIAN_CENTURY = 36525.0;

// ============================================================================
// Earth Orientation
// ============================================================================

/// Mean obliquity of the ecliptic at J2000.0 in degrees
inline constexpr double OBLIQUITY_J2000 = 23.43929111;

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Convert degrees to radians.
 * @param degrees Angle in degrees.
 * @return Angle in radians.
 */
[[nodiscard]] constexpr double toRadians(double degrees) noexcept {
    return degrees * DEG_TO_RAD;
}

/**
 * @brief Convert radians to degrees.
 * @param radians Angle in radians.
 * @return Angle in degrees.
 */
[[nodiscard]] constexpr double toDegrees(double radians) noexcept {
    return radians * RAD_TO_DEG;
}

/**
 * @brief Normalize angle to range [0, 360) degrees.
 *
 * Tiny negative inputs round to exactly 360 after the shift; those fold
 * back to 0 so the result never leaves the half-open range.
 *
 * @param angle Angle in degrees.
 * @return Normalized angle in degrees.
 */
[[nodiscard]] inline double normalizeAngle360(double angle) noexcept {
    angle = std::fmod(angle, DEGREES_IN_CIRCLE);
    if (angle < 0.0) {
        angle += DEGREES_IN_CIRCLE;
    }
    if (angle >= DEGREES_IN_CIRCLE) {
        angle = 0.0;
    }
    return angle;
}

/**
 * @brief Normalize angle to range [-180, 180) degrees.
 * @param angle Angle in degrees.
 * @return Normalized angle in degrees.
 */
[[nodiscard]] inline double normalizeAngle180(double angle) noexcept {
    angle = normalizeAngle360(angle);
    if (angle >= 180.0) {
        angle -= DEGREES_IN_CIRCLE;
    }
    return angle;
}

/**
 * @brief Normalize an angle in radians to [0, 2*pi).
 */
[[nodiscard]] inline double normalizeRadians(double angle) noexcept {
    angle = std::fmod(angle, K_TWO_PI);
    if (angle < 0.0) {
        angle += K_TWO_PI;
    }
    if (angle >= K_TWO_PI) {
        angle = 0.0;
    }
    return angle;
}

/**
 * @brief Shortest arc between two longitudes.
 * @return Separation in degrees, in [0, 180].
 */
[[nodiscard]] inline double angularSeparation(double lon1,
                                              double lon2) noexcept {
    double diff = normalizeAngle360(lon1 - lon2);
    return diff > 180.0 ? DEGREES_IN_CIRCLE - diff : diff;
}

/**
 * @brief Clamp a latitude or declination to [-90, 90] degrees.
 */
[[nodiscard]] inline double clampLatitude(double lat) noexcept {
    return std::clamp(lat, -90.0, 90.0);
}

}  // namespace astrolabe::astronomy

#endif  // ASTROLABE_ASTRONOMY_CONSTANTS_HPP
