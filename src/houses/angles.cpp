/**
 * @file angles.cpp
 * @brief Chart angle calculations.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "angles.hpp"

#include <cmath>

#include "astronomy/constants.hpp"

namespace astrolabe::houses {

using namespace astrolabe::astronomy;

double raToLongitude(double rightAscension, double obliquity) noexcept {
    const double ra = toRadians(rightAscension);
    return normalizeAngle360(toDegrees(
        std::atan2(std::sin(ra), std::cos(ra) * std::cos(toRadians(obliquity)))));
}

double eclipticIntersection(double obliqueAscension, double poleHeight,
                            double obliquity) noexcept {
    const double oa = toRadians(obliqueAscension);
    const double eps = toRadians(obliquity);
    const double y = std::sin(oa);
    const double x = std::cos(oa) * std::cos(eps) -
                     std::tan(toRadians(poleHeight)) * std::sin(eps);
    return normalizeAngle360(toDegrees(std::atan2(y, x)));
}

double calculateMidheaven(double ramc, double obliquity) noexcept {
    return raToLongitude(ramc, obliquity);
}

double calculateAscendant(double ramc, double obliquity,
                          double latitude) noexcept {
    double asc = eclipticIntersection(ramc + 90.0, latitude, obliquity);
    const double mc = calculateMidheaven(ramc, obliquity);
    if (normalizeAngle360(asc - mc) >= 180.0) {
        asc = normalizeAngle360(asc + 180.0);
    }
    return asc;
}

Angles calculateAngles(double ramc, double obliquity,
                       double latitude) noexcept {
    Angles angles;
    angles.midheaven = calculateMidheaven(ramc, obliquity);
    angles.ascendant = calculateAscendant(ramc, obliquity, latitude);
    angles.descendant = normalizeAngle360(angles.ascendant + 180.0);
    angles.imumCoeli = normalizeAngle360(angles.midheaven + 180.0);
    return angles;
}

}  // namespace astrolabe::houses
