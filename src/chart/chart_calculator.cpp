/**
 * @file chart_calculator.cpp
 * @brief Chart assembly.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "chart_calculator.hpp"

#include <algorithm>
#include <future>

#include "astronomy/constants.hpp"
#include "astronomy/coordinates.hpp"
#include "calculation/julian.hpp"
#include "config/sections/engine_config.hpp"
#include "ephemeris/velocity.hpp"
#include "logging/logging.hpp"

namespace astrolabe::chart {

using namespace astrolabe::astronomy;
using ephemeris::Body;
using ephemeris::BodyPosition;
using error::ErrorCode;
using error::makeError;

namespace {

void applyAyanamsa(Chart& chart, double offset) {
    for (auto& body : chart.bodies) {
        body.longitude = normalizeAngle360(body.longitude - offset);
    }
    for (auto& cusp : chart.houses.cusps) {
        cusp = normalizeAngle360(cusp - offset);
    }
    auto& angles = chart.houses.angles;
    for (double* angle : {&angles.ascendant, &angles.midheaven,
                          &angles.descendant, &angles.imumCoeli}) {
        *angle = normalizeAngle360(*angle - offset);
    }
}

}  // namespace

// ============================================================================
// Options
// ============================================================================

auto ChartOptions::fromConfig(const config::EngineConfig& config)
    -> error::Result<ChartOptions> {
    if (auto valid = config.check(); !valid) {
        return std::unexpected(valid.error());
    }

    ChartOptions options;
    // Both parses succeed after check()
    options.houseSystem = *houses::parseHouseSystem(config.houseSystem);
    options.ayanamsa = *parseAyanamsa(config.ayanamsa);

    options.sampling.defaultCenturies = config.samplingIntervalCenturies;
    options.sampling.overrides.clear();
    for (const auto& [name, interval] : config.samplingOverrides) {
        options.sampling.overrides[*ephemeris::parseBody(name)] = interval;
    }

    options.aspects.excludeRetrograde = config.excludeRetrograde;
    for (const auto& [name, orb] : config.orbOverrides) {
        options.aspects.orbOverrides[*aspects::parseAspectType(name)] = orb;
    }

    options.parallel = config.parallel;
    options.bodies.clear();
    for (const auto& name : config.bodies) {
        options.bodies.push_back(*ephemeris::parseBody(name));
    }
    return options;
}

auto keplerOptionsFromConfig(const config::EngineConfig& config)
    -> ephemeris::KeplerOptions {
    return {config.keplerTolerance, config.keplerMaxIterations};
}

const BodyPosition* Chart::find(Body body) const noexcept {
    auto it = std::ranges::find_if(
        bodies, [body](const BodyPosition& p) { return p.body == body; });
    return it != bodies.end() ? &*it : nullptr;
}

// ============================================================================
// ChartCalculator
// ============================================================================

ChartCalculator::ChartCalculator(const ephemeris::IEphemerisProvider& provider,
                                 ChartOptions options,
                                 std::shared_ptr<spdlog::logger> logger)
    : provider_(provider),
      options_(std::move(options)),
      logger_(logging::orNullLogger(std::move(logger), "astrolabe.chart")),
      houses_(logger_),
      aspects_(options_.aspects, logger_) {}

auto ChartCalculator::bodyPosition(Body body, double jd) const
    -> error::Result<BodyPosition> {
    return ephemeris::computeMotion(provider_, body, jd, options_.sampling)
        .transform([body](const ephemeris::BodyMotion& motion) {
            return BodyPosition{body,
                                motion.position.longitude,
                                motion.position.latitude,
                                motion.position.radius,
                                motion.speed,
                                motion.retrograde,
                                std::nullopt};
        });
}

auto ChartCalculator::calculatePositions(double jd) const
    -> error::Result<std::vector<BodyPosition>> {
    std::vector<error::Result<BodyPosition>> results;
    results.reserve(options_.bodies.size());

    if (options_.parallel) {
        std::vector<std::future<error::Result<BodyPosition>>> futures;
        futures.reserve(options_.bodies.size());
        for (Body body : options_.bodies) {
            futures.push_back(std::async(std::launch::async, [this, body, jd]() {
                return bodyPosition(body, jd);
            }));
        }
        for (auto& future : futures) {
            results.push_back(future.get());
        }
    } else {
        for (Body body : options_.bodies) {
            results.push_back(bodyPosition(body, jd));
        }
    }

    std::vector<BodyPosition> positions;
    positions.reserve(results.size());
    for (auto& result : results) {
        if (!result) {
            logger_->debug("Body evaluation failed at JD {}: {}", jd,
                           result.error().toString());
            return std::unexpected(result.error());
        }
        positions.push_back(*result);
    }
    return positions;
}

auto ChartCalculator::calculateAt(double jd, double latitude, double longitude,
                                  houses::HouseSystem system,
                                  Ayanamsa ayanamsa) const
    -> error::Result<Chart> {
    if (!ObserverLocation(latitude, longitude).isValid()) {
        return makeError(ErrorCode::InvalidInput,
                         "location ({}, {}) out of range", latitude, longitude);
    }

    auto positions = calculatePositions(jd);
    if (!positions) {
        return std::unexpected(positions.error());
    }
    auto cusps = houses_.calculate(jd, latitude, longitude, system);
    if (!cusps) {
        return std::unexpected(cusps.error());
    }

    Chart chart;
    chart.julianDate = jd;
    chart.latitude = latitude;
    chart.longitude = longitude;
    chart.ayanamsa = ayanamsa;
    chart.ayanamsaDegrees =
        ayanamsaDegrees(ayanamsa, calculation::centuriesSinceJ2000(jd));
    chart.bodies = std::move(*positions);
    chart.houses = std::move(*cusps);
    if (ayanamsa != Ayanamsa::Tropical) {
        applyAyanamsa(chart, chart.ayanamsaDegrees);
    }

    houses::assignHouses(chart.bodies, chart.houses.cusps);
    chart.aspects = aspects_.calculateAspects(chart.bodies);

    logger_->debug("Chart at JD {:.6f} ({}, {}): {} bodies, {} aspects", jd,
                   latitude, longitude, chart.bodies.size(),
                   chart.aspects.size());
    return chart;
}

auto ChartCalculator::calculate(const ChartRequest& request) const
    -> error::Result<Chart> {
    auto jd =
        calculation::julianDateChecked(request.dateTime, request.timezoneOffset);
    if (!jd) {
        return std::unexpected(jd.error());
    }

    auto system = options_.houseSystem;
    if (request.houseSystem) {
        auto parsed = houses::parseHouseSystem(*request.houseSystem);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        system = *parsed;
    }

    auto ayanamsa = options_.ayanamsa;
    if (request.ayanamsa) {
        auto parsed = parseAyanamsa(*request.ayanamsa);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        ayanamsa = *parsed;
    }

    return calculateAt(*jd, request.latitude, request.longitude, system,
                       ayanamsa);
}

auto ChartCalculator::compare(const ChartRequest& inner,
                              const ChartRequest& outer) const
    -> error::Result<ChartComparison> {
    auto innerChart = calculate(inner);
    if (!innerChart) {
        return std::unexpected(innerChart.error());
    }
    auto outerChart = calculate(outer);
    if (!outerChart) {
        return std::unexpected(outerChart.error());
    }

    ChartComparison comparison;
    comparison.crossAspects =
        aspects_.calculateCrossAspects(innerChart->bodies, outerChart->bodies);
    comparison.inner = std::move(*innerChart);
    comparison.outer = std::move(*outerChart);
    return comparison;
}

auto ChartCalculator::calculateTransits(const ChartRequest& natal,
                                        const ChartRequest& transit) const
    -> error::Result<ChartComparison> {
    return compare(natal, transit);
}

auto ChartCalculator::calculateSynastry(const ChartRequest& first,
                                        const ChartRequest& second) const
    -> error::Result<ChartComparison> {
    return compare(first, second);
}

}  // namespace astrolabe::chart
