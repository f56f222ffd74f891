/**
 * @file angles.hpp
 * @brief Chart angles and the ecliptic/great-circle intersections used by
 * the house algorithms.
 *
 * All inputs and outputs are in degrees. RAMC is the right ascension of the
 * meridian, i.e. the local sidereal time expressed in degrees.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_HOUSES_ANGLES_HPP
#define ASTROLABE_HOUSES_ANGLES_HPP

#include <nlohmann/json.hpp>

namespace astrolabe::houses {

/**
 * @struct Angles
 * @brief The four chart angles, ecliptic longitudes in degrees.
 */
struct Angles {
    double ascendant{0.0};
    double midheaven{0.0};
    double descendant{0.0};
    double imumCoeli{0.0};

    [[nodiscard]] nlohmann::json toJson() const {
        return {{"ascendant", ascendant},
                {"midheaven", midheaven},
                {"descendant", descendant},
                {"imum_coeli", imumCoeli}};
    }
};

/**
 * @brief Ecliptic longitude of a point on the equator projected along
 * hour circles.
 * @param rightAscension Right ascension in degrees.
 * @param obliquity Obliquity of the ecliptic in degrees.
 */
[[nodiscard]] double raToLongitude(double rightAscension,
                                   double obliquity) noexcept;

/**
 * @brief Ecliptic point cut by the great circle that crosses the equator at
 * @p obliqueAscension with pole height @p poleHeight.
 *
 * With the oblique ascension RAMC + 90 and the geographic latitude as pole
 * this is the ascendant, up to a half-turn at the polar circles. The result
 * lies in the same half of the circle as @p obliqueAscension, in [0, 360).
 */
[[nodiscard]] double eclipticIntersection(double obliqueAscension,
                                          double poleHeight,
                                          double obliquity) noexcept;

/**
 * @brief Midheaven from RAMC.
 */
[[nodiscard]] double calculateMidheaven(double ramc, double obliquity) noexcept;

/**
 * @brief Ascendant from RAMC and latitude.
 *
 * The horizon meets the ecliptic twice; the eastern point is the one
 * less than 180 degrees ahead of the midheaven.
 */
[[nodiscard]] double calculateAscendant(double ramc, double obliquity,
                                        double latitude) noexcept;

/**
 * @brief All four angles.
 */
[[nodiscard]] Angles calculateAngles(double ramc, double obliquity,
                                     double latitude) noexcept;

}  // namespace astrolabe::houses

#endif  // ASTROLABE_HOUSES_ANGLES_HPP
