/**
 * @file house_algorithms.cpp
 * @brief House division formulas.
 *
 * Intermediate cusps of the quadrant systems are intersections of the
 * ecliptic with a great circle through the north and south points of the
 * horizon, found with eclipticIntersection(). Only cusps 11, 12, 2 and 3
 * are computed; their opposites follow by adding 180 degrees.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "house_algorithms.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "astronomy/constants.hpp"

namespace astrolabe::houses {

using namespace astrolabe::astronomy;
using error::ErrorCode;
using error::makeError;

namespace {

constexpr int PLACIDUS_MAX_ITERATIONS = 100;
constexpr double PLACIDUS_TOLERANCE = 1e-10;

// Array indices of the cusps computed directly by the quadrant systems
constexpr int HOUSE_2 = 1;
constexpr int HOUSE_3 = 2;
constexpr int HOUSE_10 = 9;
constexpr int HOUSE_11 = 10;
constexpr int HOUSE_12 = 11;

void fillOpposites(CuspArray& cusps) noexcept {
    for (int idx : {0, HOUSE_2, HOUSE_3, HOUSE_10, HOUSE_11, HOUSE_12}) {
        cusps[(idx + 6) % 12] = normalizeAngle360(cusps[idx] + 180.0);
    }
}

auto quadrantFrame(const HouseContext& ctx) -> CuspArray {
    CuspArray cusps{};
    cusps[0] = ctx.angles.ascendant;
    cusps[HOUSE_10] = ctx.angles.midheaven;
    return cusps;
}

auto equalFrom(double start) -> CuspArray {
    CuspArray cusps{};
    for (int i = 0; i < 12; ++i) {
        cusps[i] = normalizeAngle360(start + DEGREES_PER_SIGN * i);
    }
    return cusps;
}

auto polarError(HouseSystem system, const HouseContext& ctx)
    -> std::unexpected<error::Error> {
    return makeError(ErrorCode::HouseSystemError,
                     "{} houses are undefined at latitude {:.4f} (polar "
                     "circle at {:.4f})",
                     houseSystemName(system), ctx.latitude,
                     90.0 - ctx.obliquity);
}

/**
 * Placidus cusp by fixed-point iteration on the cusp's declination.
 *
 * Upper cusps sit at fraction f of the diurnal semi-arc east of the
 * meridian, lower cusps at fraction f of the nocturnal semi-arc west of
 * the lower meridian.
 */
auto placidusCusp(const HouseContext& ctx, double start, double fraction,
                  bool lower) -> error::Result<double> {
    const double tanPhi = std::tan(toRadians(ctx.latitude));
    const double sinEps = std::sin(toRadians(ctx.obliquity));

    double lon = start;
    for (int i = 0; i < PLACIDUS_MAX_ITERATIONS; ++i) {
        const double dec = std::asin(std::sin(toRadians(lon)) * sinEps);
        const double x = -tanPhi * std::tan(dec);
        if (x < -1.0 || x > 1.0) {
            return makeError(ErrorCode::HouseSystemError,
                             "Placidus semi-arc undefined at latitude {:.4f}",
                             ctx.latitude);
        }
        const double sda = toDegrees(std::acos(x));
        const double ra = lower ? ctx.ramc + 180.0 - fraction * (180.0 - sda)
                                : ctx.ramc + fraction * sda;
        const double next = raToLongitude(ra, ctx.obliquity);
        const double delta = std::abs(normalizeAngle180(next - lon));
        lon = next;
        if (delta < PLACIDUS_TOLERANCE) {
            return lon;
        }
    }
    return makeError(ErrorCode::ConvergenceError,
                     "Placidus cusp did not converge after {} iterations",
                     PLACIDUS_MAX_ITERATIONS);
}

}  // namespace

// ============================================================================
// HouseContext
// ============================================================================

HouseContext HouseContext::make(double ramc, double obliquity,
                                double latitude) noexcept {
    return {normalizeAngle360(ramc), obliquity, latitude,
            calculateAngles(ramc, obliquity, latitude)};
}

bool HouseContext::isPolar() const noexcept {
    return std::abs(latitude) >= 90.0 - obliquity;
}

// ============================================================================
// Quadrant systems
// ============================================================================

auto PlacidusHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    if (ctx.isPolar()) {
        return polarError(system(), ctx);
    }

    struct Target {
        int index;
        double fraction;
        bool lower;
    };
    constexpr Target TARGETS[] = {{HOUSE_11, 1.0 / 3.0, false},
                                  {HOUSE_12, 2.0 / 3.0, false},
                                  {HOUSE_2, 2.0 / 3.0, true},
                                  {HOUSE_3, 1.0 / 3.0, true}};

    auto cusps = quadrantFrame(ctx);
    for (const auto& target : TARGETS) {
        // Seed with the equal-house position counted from the MC
        const double seed = ctx.angles.midheaven +
                            DEGREES_PER_SIGN * ((target.index - HOUSE_10 + 12) % 12);
        auto cusp = placidusCusp(ctx, normalizeAngle360(seed), target.fraction,
                                 target.lower);
        if (!cusp) {
            return std::unexpected(cusp.error());
        }
        cusps[target.index] = *cusp;
    }
    fillOpposites(cusps);
    return cusps;
}

auto KochHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    if (ctx.isPolar()) {
        return polarError(system(), ctx);
    }

    const double phi = toRadians(ctx.latitude);
    double sinA = std::sin(toRadians(ctx.angles.midheaven)) *
                  std::sin(toRadians(ctx.obliquity)) / std::cos(phi);
    sinA = std::clamp(sinA, -1.0, 1.0);
    const double cosA = std::sqrt(1.0 - sinA * sinA);
    const double c = std::atan(std::tan(phi) / cosA);
    // A third of the MC's ascensional difference under the birthplace pole
    const double ad3 = toDegrees(std::asin(std::sin(c) * sinA)) / 3.0;

    auto cusps = quadrantFrame(ctx);
    const double r = ctx.ramc;
    cusps[HOUSE_11] =
        eclipticIntersection(r + 30.0 - 2.0 * ad3, ctx.latitude, ctx.obliquity);
    cusps[HOUSE_12] =
        eclipticIntersection(r + 60.0 - ad3, ctx.latitude, ctx.obliquity);
    cusps[HOUSE_2] =
        eclipticIntersection(r + 120.0 + ad3, ctx.latitude, ctx.obliquity);
    cusps[HOUSE_3] =
        eclipticIntersection(r + 150.0 + 2.0 * ad3, ctx.latitude, ctx.obliquity);
    fillOpposites(cusps);
    return cusps;
}

auto PorphyryHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    auto cusps = quadrantFrame(ctx);
    const double asc = ctx.angles.ascendant;
    const double mc = ctx.angles.midheaven;

    const double upper = normalizeAngle360(asc - mc);
    const double lower = normalizeAngle360(ctx.angles.imumCoeli - asc);
    cusps[HOUSE_11] = normalizeAngle360(mc + upper / 3.0);
    cusps[HOUSE_12] = normalizeAngle360(mc + 2.0 * upper / 3.0);
    cusps[HOUSE_2] = normalizeAngle360(asc + lower / 3.0);
    cusps[HOUSE_3] = normalizeAngle360(asc + 2.0 * lower / 3.0);
    fillOpposites(cusps);
    return cusps;
}

auto RegiomontanusHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    auto cusps = quadrantFrame(ctx);
    const double tanPhi = std::tan(toRadians(ctx.latitude));

    for (auto [index, h] : {std::pair{HOUSE_11, 30.0}, std::pair{HOUSE_12, 60.0},
                            std::pair{HOUSE_2, 120.0}, std::pair{HOUSE_3, 150.0}}) {
        const double pole =
            toDegrees(std::atan(tanPhi * std::sin(toRadians(h))));
        cusps[index] =
            eclipticIntersection(ctx.ramc + h, pole, ctx.obliquity);
    }
    fillOpposites(cusps);
    return cusps;
}

auto CampanusHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    auto cusps = quadrantFrame(ctx);
    const double phi = toRadians(ctx.latitude);

    for (auto [index, h] : {std::pair{HOUSE_11, 30.0}, std::pair{HOUSE_12, 60.0},
                            std::pair{HOUSE_2, 120.0}, std::pair{HOUSE_3, 150.0}}) {
        const double hr = toRadians(h);
        // Prime vertical division h seen on the equator
        const double equatorOffset = toDegrees(
            std::atan2(std::sin(hr) * std::cos(phi), std::cos(hr)));
        const double pole = toDegrees(std::asin(std::sin(phi) * std::sin(hr)));
        cusps[index] = eclipticIntersection(ctx.ramc + equatorOffset, pole,
                                            ctx.obliquity);
    }
    fillOpposites(cusps);
    return cusps;
}

auto AlcabitiusHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    const double ascDec =
        std::asin(std::sin(toRadians(ctx.angles.ascendant)) *
                  std::sin(toRadians(ctx.obliquity)));
    const double arg = std::tan(toRadians(ctx.latitude)) * std::tan(ascDec);
    if (arg < -1.0 || arg > 1.0) {
        return polarError(system(), ctx);
    }

    const double diurnal = 90.0 + toDegrees(std::asin(arg));
    const double nocturnal = 180.0 - diurnal;
    const double r = ctx.ramc;

    auto cusps = quadrantFrame(ctx);
    cusps[HOUSE_11] = raToLongitude(r + diurnal / 3.0, ctx.obliquity);
    cusps[HOUSE_12] = raToLongitude(r + 2.0 * diurnal / 3.0, ctx.obliquity);
    cusps[HOUSE_2] =
        raToLongitude(r + diurnal + nocturnal / 3.0, ctx.obliquity);
    cusps[HOUSE_3] =
        raToLongitude(r + diurnal + 2.0 * nocturnal / 3.0, ctx.obliquity);
    fillOpposites(cusps);
    return cusps;
}

// ============================================================================
// Equal-arc systems
// ============================================================================

auto EqualHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    return equalFrom(ctx.angles.ascendant);
}

auto EqualMCHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    // MC on the tenth cusp, so the first cusp is MC + 90
    return equalFrom(ctx.angles.midheaven + 90.0);
}

auto WholeSignHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    return equalFrom(std::floor(ctx.angles.ascendant / DEGREES_PER_SIGN) *
                     DEGREES_PER_SIGN);
}

auto VehlowHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    return equalFrom(ctx.angles.ascendant - DEGREES_PER_SIGN / 2.0);
}

auto MeridianHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    CuspArray cusps{};
    for (int i = 0; i < 12; ++i) {
        cusps[i] = raToLongitude(ctx.ramc + 90.0 + DEGREES_PER_SIGN * i,
                                 ctx.obliquity);
    }
    return cusps;
}

auto MorinusHouses::compute(const HouseContext& ctx) const
    -> error::Result<CuspArray> {
    const double cosEps = std::cos(toRadians(ctx.obliquity));
    CuspArray cusps{};
    for (int i = 0; i < 12; ++i) {
        const double h = toRadians(ctx.ramc + 90.0 + DEGREES_PER_SIGN * i);
        cusps[i] = normalizeAngle360(
            toDegrees(std::atan2(std::sin(h) * cosEps, std::cos(h))));
    }
    return cusps;
}

auto createBuiltinAlgorithms()
    -> std::vector<std::unique_ptr<IHouseAlgorithm>> {
    std::vector<std::unique_ptr<IHouseAlgorithm>> algorithms;
    algorithms.push_back(std::make_unique<PlacidusHouses>());
    algorithms.push_back(std::make_unique<KochHouses>());
    algorithms.push_back(std::make_unique<PorphyryHouses>());
    algorithms.push_back(std::make_unique<RegiomontanusHouses>());
    algorithms.push_back(std::make_unique<CampanusHouses>());
    algorithms.push_back(std::make_unique<EqualHouses>());
    algorithms.push_back(std::make_unique<EqualMCHouses>());
    algorithms.push_back(std::make_unique<WholeSignHouses>());
    algorithms.push_back(std::make_unique<VehlowHouses>());
    algorithms.push_back(std::make_unique<MeridianHouses>());
    algorithms.push_back(std::make_unique<AlcabitiusHouses>());
    algorithms.push_back(std::make_unique<MorinusHouses>());
    return algorithms;
}

}  // namespace astrolabe::houses
