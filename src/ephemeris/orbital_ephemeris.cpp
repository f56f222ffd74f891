/**
 * @file orbital_ephemeris.cpp
 * @brief Built-in ephemeris implementation.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "orbital_ephemeris.hpp"

#include <cmath>

#include "calculation/julian.hpp"

namespace astrolabe::ephemeris {

using error::ErrorCode;
using error::makeError;

OrbitalEphemeris::OrbitalEphemeris(KeplerOptions options,
                                   std::shared_ptr<spdlog::logger> logger)
    : model_(options, std::move(logger)) {}

auto OrbitalEphemeris::position(Body body, double jd,
                                const CalculationFlags& flags) const
    -> error::Result<astronomy::EclipticCoordinates> {
    if (!std::isfinite(jd)) {
        return makeError(ErrorCode::InvalidInput, "non-finite Julian Date");
    }
    if (!supports(body)) {
        return makeError(ErrorCode::InvalidBody,
                         "{} is not covered by the {} ephemeris",
                         bodyName(body), name());
    }

    const double T = calculation::centuriesSinceJ2000(jd);
    if (flags.heliocentric) {
        return model_.heliocentric(body, T);
    }
    return model_.geocentric(body, T);
}

bool OrbitalEphemeris::supports(Body body) const noexcept {
    return isPlanet(body) || body == Body::Sun || body == Body::Moon ||
           body == Body::MeanNode;
}

}  // namespace astrolabe::ephemeris
