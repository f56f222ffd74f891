/**
 * @file kepler.cpp
 * @brief Kepler equation solver implementation.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "kepler.hpp"

#include <cmath>

namespace astrolabe::ephemeris {

using error::ErrorCode;
using error::makeError;

auto solveKepler(double meanAnomaly, double eccentricity,
                 const KeplerOptions& options)
    -> error::Result<KeplerSolution> {
    if (!std::isfinite(meanAnomaly) || !std::isfinite(eccentricity)) {
        return makeError(ErrorCode::InvalidInput,
                         "non-finite Kepler input (M={}, e={})", meanAnomaly,
                         eccentricity);
    }
    if (eccentricity < 0.0 || eccentricity >= 1.0) {
        return makeError(ErrorCode::InvalidInput,
                         "eccentricity {} is not elliptic", eccentricity);
    }
    if (options.maxIterations < 1 || !(options.tolerance > 0.0)) {
        return makeError(ErrorCode::InvalidInput,
                         "invalid Kepler options (tolerance={}, cap={})",
                         options.tolerance, options.maxIterations);
    }

    double E = meanAnomaly;
    double lastStep = 0.0;
    for (int iter = 1; iter <= options.maxIterations; ++iter) {
        double dE = (E - eccentricity * std::sin(E) - meanAnomaly) /
                    (1.0 - eccentricity * std::cos(E));
        E -= dE;
        lastStep = dE;
        if (std::abs(dE) < options.tolerance) {
            return KeplerSolution{E, iter};
        }
    }

    return makeError(ErrorCode::ConvergenceError,
                     "Kepler solver did not converge after {} iterations "
                     "(M={}, e={}, last step {:.3e})",
                     options.maxIterations, meanAnomaly, eccentricity,
                     lastStep);
}

double trueAnomaly(double eccentricAnomaly, double eccentricity) noexcept {
    double half = eccentricAnomaly / 2.0;
    return 2.0 * std::atan2(std::sqrt(1.0 + eccentricity) * std::sin(half),
                            std::sqrt(1.0 - eccentricity) * std::cos(half));
}

}  // namespace astrolabe::ephemeris
