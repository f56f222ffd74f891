/**
 * @file sidereal.hpp
 * @brief Sidereal time and obliquity of the ecliptic.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_CALCULATION_SIDEREAL_HPP
#define ASTROLABE_CALCULATION_SIDEREAL_HPP

#include <cmath>

#include "julian.hpp"
#include "astronomy/constants.hpp"

namespace astrolabe::calculation {

using namespace astrolabe::astronomy;

// ============================================================================
// Sidereal Time Calculations
// ============================================================================

/**
 * @brief Calculate Greenwich Mean Sidereal Time (GMST).
 * @param jd Julian Date (UT).
 * @return GMST in degrees (0-360).
 */
[[nodiscard]] inline double calculateGMST(double jd) noexcept {
    double T = centuriesSinceJ2000(jd);

    double gmst = 280.46061837 + 360.98564736629 * (jd - JD_J2000) +
                  0.000387933 * T * T - T * T * T / 38710000.0;

    return normalizeAngle360(gmst);
}

/**
 * @brief Calculate Local Sidereal Time (LST).
 *
 * The LST expressed in degrees is the right ascension of the meridian
 * (RAMC) used by the house calculator.
 *
 * @param jd Julian Date.
 * @param longitude Observer longitude in degrees (positive east).
 * @return LST in degrees (0-360).
 */
[[nodiscard]] inline double calculateLST(double jd, double longitude) noexcept {
    return normalizeAngle360(calculateGMST(jd) + longitude);
}

/**
 * @brief Calculate Local Sidereal Time in hours.
 * @param jd Julian Date.
 * @param longitude Observer longitude in degrees.
 * @return LST in hours (0-24).
 */
[[nodiscard]] inline double calculateLSTHours(double jd,
                                              double longitude) noexcept {
    return calculateLST(jd, longitude) / HOURS_TO_DEG;
}

/**
 * @brief Calculate hour angle in degrees.
 * @param lstDeg Local sidereal time in degrees.
 * @param raDeg Right ascension in degrees.
 * @return Hour angle in degrees [-180, 180).
 */
[[nodiscard]] inline double calculateHourAngleDeg(double lstDeg,
                                                  double raDeg) noexcept {
    return normalizeAngle180(lstDeg - raDeg);
}

// ============================================================================
// Obliquity
// ============================================================================

/**
 * @brief Mean obliquity of the ecliptic.
 * @param T Julian centuries since J2000.0.
 * @return Obliquity in degrees.
 */
[[nodiscard]] constexpr double calculateObliquity(double T) noexcept {
    return OBLIQUITY_J2000 - 0.013004167 * T - 0.0000001639 * T * T +
           0.0000005036 * T * T * T;
}

/**
 * @brief Mean obliquity of the ecliptic at a Julian Date.
 */
[[nodiscard]] constexpr double calculateObliquityJD(double jd) noexcept {
    return calculateObliquity(centuriesSinceJ2000(jd));
}

}  // namespace astrolabe::calculation

#endif  // ASTROLABE_CALCULATION_SIDEREAL_HPP
