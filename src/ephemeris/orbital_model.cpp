/**
 * @file orbital_model.cpp
 * @brief Orbital position model implementation.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "orbital_model.hpp"

#include <cmath>

#include "astronomy/constants.hpp"
#include "calculation/transform.hpp"
#include "geocentric.hpp"
#include "logging/logging.hpp"

namespace astrolabe::ephemeris {

using namespace astrolabe::astronomy;
using error::ErrorCode;
using error::makeError;

namespace {

/// Sine of an angle given in degrees
double sinDeg(double degrees) { return std::sin(toRadians(degrees)); }

}  // namespace

OrbitalModel::OrbitalModel(KeplerOptions options,
                           std::shared_ptr<spdlog::logger> logger)
    : options_(options),
      logger_(logging::orNullLogger(std::move(logger), "astrolabe.orbit")) {}

auto OrbitalModel::heliocentricRectangular(
    const OrbitalCoefficients& coefficients, double T) const
    -> error::Result<CartesianCoordinates> {
    const OrbitalElements elements = coefficients.evaluate(T);
    const double e = elements.eccentricity;
    const double meanAnomaly = toRadians(elements.meanAnomalyDeg());

    auto solution = solveKepler(meanAnomaly, e, options_);
    if (!solution) {
        logger_->debug("Kepler solver failed at T={}: {}", T,
                       solution.error().message);
        return std::unexpected(solution.error());
    }
    logger_->debug("Kepler solver converged in {} iterations (M={:.6f}, e={:.6f})",
                   solution->iterations, meanAnomaly, e);

    const double v = trueAnomaly(solution->eccentricAnomaly, e);
    const double r =
        elements.semiMajorAxisAU * (1.0 - e * e) / (1.0 + e * std::cos(v));
    const double u = v + toRadians(elements.argumentOfPerihelionDeg());

    const double node = toRadians(elements.longitudeOfAscendingNodeDeg);
    const double incl = toRadians(elements.inclinationDeg);

    const double cosU = std::cos(u);
    const double sinU = std::sin(u);
    const double cosNode = std::cos(node);
    const double sinNode = std::sin(node);
    const double cosI = std::cos(incl);

    return CartesianCoordinates{
        r * (cosNode * cosU - sinNode * sinU * cosI),
        r * (sinNode * cosU + cosNode * sinU * cosI),
        r * sinU * std::sin(incl)};
}

auto OrbitalModel::heliocentric(const OrbitalCoefficients& coefficients,
                                double T) const
    -> error::Result<EclipticCoordinates> {
    return heliocentricRectangular(coefficients, T)
        .transform([](const CartesianCoordinates& v) {
            return calculation::rectangularToEcliptic(v);
        });
}

auto OrbitalModel::heliocentric(Body body, double T) const
    -> error::Result<EclipticCoordinates> {
    const auto* coefficients = planetCoefficients(body);
    if (coefficients == nullptr) {
        return makeError(ErrorCode::InvalidBody,
                         "{} has no heliocentric orbit in the built-in model",
                         bodyName(body));
    }
    return heliocentric(*coefficients, T);
}

auto OrbitalModel::earth(double T) const
    -> error::Result<EclipticCoordinates> {
    return heliocentric(earthCoefficients(), T);
}

auto OrbitalModel::geocentricPlanet(Body body, double T) const
    -> error::Result<EclipticCoordinates> {
    const auto* coefficients = planetCoefficients(body);
    if (coefficients == nullptr) {
        return makeError(ErrorCode::InvalidBody, "{} is not a planet",
                         bodyName(body));
    }

    auto planetVec = heliocentricRectangular(*coefficients, T);
    if (!planetVec) {
        return std::unexpected(planetVec.error());
    }
    auto earthVec = heliocentricRectangular(earthCoefficients(), T);
    if (!earthVec) {
        return std::unexpected(earthVec.error());
    }
    return toGeocentric(*planetVec, *earthVec);
}

auto OrbitalModel::sun(double T) const -> error::Result<EclipticCoordinates> {
    auto earthPos = earth(T);
    if (!earthPos) {
        return std::unexpected(earthPos.error());
    }
    return EclipticCoordinates{normalizeAngle360(earthPos->longitude + 180.0),
                               0.0, earthPos->radius};
}

EclipticCoordinates OrbitalModel::moon(double T) const noexcept {
    const double d = T * JULIAN_CENTURY;

    const double meanLongitude = 218.316 + 13.176396 * d;
    const double meanAnomaly = 134.963 + 13.064993 * d;
    const double argLatitude = 93.272 + 13.229350 * d;
    const double elongation = 297.850 + 12.190749 * d;
    const double sunAnomaly = 357.529 + 0.98560028 * d;

    const double longitude =
        meanLongitude + 6.289 * sinDeg(meanAnomaly) +
        1.274 * sinDeg(2.0 * elongation - meanAnomaly) +
        0.658 * sinDeg(2.0 * elongation) +
        0.214 * sinDeg(2.0 * meanAnomaly) - 0.186 * sinDeg(sunAnomaly) -
        0.114 * sinDeg(2.0 * argLatitude);
    const double latitude = 5.128 * sinDeg(argLatitude);
    const double distanceKm =
        385001.0 - 20905.0 * std::cos(toRadians(meanAnomaly));

    return {normalizeAngle360(longitude), latitude, distanceKm / AU_KM};
}

EclipticCoordinates OrbitalModel::meanNode(double T) const noexcept {
    return {normalizeAngle360(125.04452 - 1934.136261 * T), 0.0, 0.0};
}

auto OrbitalModel::geocentric(Body body, double T) const
    -> error::Result<EclipticCoordinates> {
    if (isPlanet(body)) {
        return geocentricPlanet(body, T);
    }
    switch (body) {
        case Body::Sun:
            return sun(T);
        case Body::Moon:
            return moon(T);
        case Body::MeanNode:
            return meanNode(T);
        default:
            return makeError(ErrorCode::InvalidBody,
                             "{} is not covered by the built-in orbital model",
                             bodyName(body));
    }
}

}  // namespace astrolabe::ephemeris
