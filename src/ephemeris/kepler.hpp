/**
 * @file kepler.hpp
 * @brief Newton solver for Kepler's equation E - e*sin(E) = M.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_EPHEMERIS_KEPLER_HPP
#define ASTROLABE_EPHEMERIS_KEPLER_HPP

#include "error/error.hpp"

namespace astrolabe::ephemeris {

/**
 * @struct KeplerOptions
 * @brief Stopping rule of the Newton iteration.
 */
struct KeplerOptions {
    double tolerance{1e-12};  ///< Stop once |dE| falls below this (radians)
    int maxIterations{50};    ///< Give up with ConvergenceError after this
};

/**
 * @struct KeplerSolution
 */
struct KeplerSolution {
    double eccentricAnomaly{0.0};  ///< E in radians
    int iterations{0};             ///< Newton steps taken
};

/**
 * @brief Solve Kepler's equation for an elliptic orbit.
 *
 * Newton iteration seeded at E0 = M.
 *
 * @param meanAnomaly M in radians.
 * @param eccentricity e in [0, 1).
 * @param options Tolerance and iteration cap.
 * @return Eccentric anomaly, InvalidInput for a non-elliptic or non-finite
 * input, or ConvergenceError when the cap is reached first.
 */
[[nodiscard]] auto solveKepler(double meanAnomaly, double eccentricity,
                               const KeplerOptions& options = {})
    -> error::Result<KeplerSolution>;

/**
 * @brief True anomaly from eccentric anomaly, both in radians.
 *
 * v = 2 atan2(sqrt(1+e) sin(E/2), sqrt(1-e) cos(E/2)).
 */
[[nodiscard]] double trueAnomaly(double eccentricAnomaly,
                                 double eccentricity) noexcept;

}  // namespace astrolabe::ephemeris

#endif  // ASTROLABE_EPHEMERIS_KEPLER_HPP
