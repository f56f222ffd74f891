/**
 * @file velocity.cpp
 * @brief Speed and station detection implementation.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "velocity.hpp"

#include <algorithm>
#include <cmath>

#include "astronomy/constants.hpp"

namespace astrolabe::ephemeris {

using namespace astrolabe::astronomy;
using error::ErrorCode;
using error::makeError;

namespace {

constexpr int MAX_BISECTION_STEPS = 200;

auto speedAt(const IEphemerisProvider& provider, Body body, double jd,
             const SamplingIntervals& intervals) -> error::Result<double> {
    return computeMotion(provider, body, jd, intervals)
        .transform([](const BodyMotion& motion) { return motion.speed; });
}

}  // namespace

double SamplingIntervals::forBody(Body body) const {
    auto it = overrides.find(body);
    return it != overrides.end() ? it->second : defaultCenturies;
}

double longitudeSpeed(double lonBefore, double lonAfter,
                      double dtCenturies) noexcept {
    double diff = lonAfter - lonBefore;
    if (diff > 180.0) {
        diff -= DEGREES_IN_CIRCLE;
    } else if (diff < -180.0) {
        diff += DEGREES_IN_CIRCLE;
    }
    return diff / (2.0 * dtCenturies * JULIAN_CENTURY);
}

auto computeMotion(const IEphemerisProvider& provider, Body body, double jd,
                   const SamplingIntervals& intervals,
                   const CalculationFlags& flags) -> error::Result<BodyMotion> {
    const double dt = intervals.forBody(body);
    if (!(dt > 0.0)) {
        return makeError(ErrorCode::InvalidInput,
                         "sampling interval for {} must be positive, got {}",
                         bodyName(body), dt);
    }
    const double dtDays = dt * JULIAN_CENTURY;

    auto now = provider.position(body, jd, flags);
    if (!now) {
        return std::unexpected(now.error());
    }
    auto before = provider.position(body, jd - dtDays, flags);
    if (!before) {
        return std::unexpected(before.error());
    }
    auto after = provider.position(body, jd + dtDays, flags);
    if (!after) {
        return std::unexpected(after.error());
    }

    const double speed =
        longitudeSpeed(before->longitude, after->longitude, dt);
    return BodyMotion{*now, speed, speed < 0.0};
}

auto detectStations(const std::vector<BodyPosition>& previous,
                    const std::vector<BodyPosition>& current)
    -> std::vector<Body> {
    std::vector<Body> stations;
    for (const auto& curr : current) {
        auto prev = std::ranges::find_if(
            previous,
            [&curr](const BodyPosition& p) { return p.body == curr.body; });
        if (prev != previous.end() && isStation(prev->speed, curr.speed)) {
            stations.push_back(curr.body);
        }
    }
    return stations;
}

auto findStation(const IEphemerisProvider& provider, Body body, double jdStart,
                 double jdEnd, const SamplingIntervals& intervals,
                 double toleranceDays) -> error::Result<double> {
    if (!(toleranceDays > 0.0) || !(jdEnd > jdStart)) {
        return makeError(ErrorCode::InvalidInput,
                         "invalid station bracket [{}, {}] (tolerance {})",
                         jdStart, jdEnd, toleranceDays);
    }

    auto lowSpeed = speedAt(provider, body, jdStart, intervals);
    if (!lowSpeed) {
        return std::unexpected(lowSpeed.error());
    }
    auto highSpeed = speedAt(provider, body, jdEnd, intervals);
    if (!highSpeed) {
        return std::unexpected(highSpeed.error());
    }
    if (!isStation(*lowSpeed, *highSpeed)) {
        return makeError(ErrorCode::InvalidInput,
                         "{} does not change direction between {} and {}",
                         bodyName(body), jdStart, jdEnd);
    }

    double lo = jdStart;
    double hi = jdEnd;
    double loSpeed = *lowSpeed;
    for (int step = 0; step < MAX_BISECTION_STEPS && hi - lo > toleranceDays;
         ++step) {
        const double mid = 0.5 * (lo + hi);
        auto midSpeed = speedAt(provider, body, mid, intervals);
        if (!midSpeed) {
            return std::unexpected(midSpeed.error());
        }
        if (isStation(loSpeed, *midSpeed)) {
            hi = mid;
        } else {
            lo = mid;
            loSpeed = *midSpeed;
        }
    }
    return 0.5 * (lo + hi);
}

}  // namespace astrolabe::ephemeris
