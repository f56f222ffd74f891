/**
 * @file velocity.hpp
 * @brief Longitude speed, retrograde motion and stations.
 *
 * Speeds come from a symmetric finite difference of the provider's
 * longitude at jd - dt and jd + dt.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_EPHEMERIS_VELOCITY_HPP
#define ASTROLABE_EPHEMERIS_VELOCITY_HPP

#include <map>
#include <vector>

#include "astronomy/coordinates.hpp"
#include "body.hpp"
#include "error/error.hpp"
#include "position.hpp"
#include "provider.hpp"

namespace astrolabe::ephemeris {

/**
 * @struct SamplingIntervals
 * @brief Half-width of the sampling window per body, in Julian centuries.
 */
struct SamplingIntervals {
    double defaultCenturies{0.0001};  ///< 3.65 days
    std::map<Body, double> overrides{{Body::Moon, 0.00001},
                                     {Body::Mars, 0.0002}};

    [[nodiscard]] double forBody(Body body) const;
};

/**
 * @struct BodyMotion
 */
struct BodyMotion {
    astronomy::EclipticCoordinates position;
    double speed{0.0};  ///< Degrees per day
    bool retrograde{false};
};

/**
 * @brief Longitude speed from two samples 2*dt apart.
 *
 * The difference is wrapped into [-180, 180) first, so a body crossing
 * 0 Aries still moves forward.
 *
 * @param lonBefore Longitude at t - dt, degrees.
 * @param lonAfter Longitude at t + dt, degrees.
 * @param dtCenturies Half-width dt in Julian centuries.
 * @return Degrees per day.
 */
[[nodiscard]] double longitudeSpeed(double lonBefore, double lonAfter,
                                    double dtCenturies) noexcept;

/**
 * @brief Position, speed and direction of a body.
 * @return The provider's error if any of the three samples fails, or
 * InvalidInput for a non-positive interval.
 */
[[nodiscard]] auto computeMotion(const IEphemerisProvider& provider, Body body,
                                 double jd,
                                 const SamplingIntervals& intervals = {},
                                 const CalculationFlags& flags = {})
    -> error::Result<BodyMotion>;

/**
 * @brief A station lies between two evaluations whose speeds differ in
 * sign.
 */
[[nodiscard]] constexpr bool isStation(double previousSpeed,
                                       double currentSpeed) noexcept {
    return (previousSpeed < 0.0) != (currentSpeed < 0.0);
}

/**
 * @brief Bodies that turned direct or retrograde between two position
 * sets. Bodies missing from either set are skipped.
 */
[[nodiscard]] auto detectStations(const std::vector<BodyPosition>& previous,
                                  const std::vector<BodyPosition>& current)
    -> std::vector<Body>;

/**
 * @brief Locate a station inside a bracket by bisection on the speed sign.
 * @param jdStart Start of the bracket.
 * @param jdEnd End of the bracket.
 * @param toleranceDays Width at which bisection stops.
 * @return Julian Date of the station, InvalidInput when the speeds at the
 * two ends have the same sign, or the provider's error.
 */
[[nodiscard]] auto findStation(const IEphemerisProvider& provider, Body body,
                               double jdStart, double jdEnd,
                               const SamplingIntervals& intervals = {},
                               double toleranceDays = 1e-4)
    -> error::Result<double>;

}  // namespace astrolabe::ephemeris

#endif  // ASTROLABE_EPHEMERIS_VELOCITY_HPP
