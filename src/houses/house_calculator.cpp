/**
 * @file house_calculator.cpp
 * @brief House system dispatch and house assignment.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "house_calculator.hpp"

#include <cmath>

#include "astronomy/constants.hpp"
#include "astronomy/coordinates.hpp"
#include "calculation/sidereal.hpp"
#include "logging/logging.hpp"

namespace astrolabe::houses {

using namespace astrolabe::astronomy;
using error::ErrorCode;
using error::makeError;

// ============================================================================
// HouseCusps
// ============================================================================

nlohmann::json HouseCusps::toJson() const {
    nlohmann::json houses = nlohmann::json::array();
    for (int i = 0; i < 12; ++i) {
        houses.push_back({{"number", i + 1}, {"longitude", cusps[i]}});
    }
    return {{"system", houseSystemName(system)},
            {"houses", std::move(houses)},
            {"angles", angles.toJson()}};
}

// ============================================================================
// House assignment
// ============================================================================

int findHouse(double longitude, const CuspArray& cusps) noexcept {
    const double pos = normalizeAngle360(longitude);
    for (int i = 0; i < 12; ++i) {
        const double start = cusps[i];
        const double end = cusps[(i + 1) % 12];
        const bool inside = start <= end ? (pos >= start && pos < end)
                                         : (pos >= start || pos < end);
        if (inside) {
            return i + 1;
        }
    }

    // Degenerate cusp sets (coincident cusps): nearest cusp behind pos
    int house = 1;
    double best = DEGREES_IN_CIRCLE;
    for (int i = 0; i < 12; ++i) {
        const double behind = normalizeAngle360(pos - cusps[i]);
        if (behind < best) {
            best = behind;
            house = i + 1;
        }
    }
    return house;
}

void assignHouses(std::vector<ephemeris::BodyPosition>& positions,
                  const CuspArray& cusps) {
    for (auto& position : positions) {
        position.house = findHouse(position.longitude, cusps);
    }
}

// ============================================================================
// HouseCalculator
// ============================================================================

HouseCalculator::HouseCalculator(std::shared_ptr<spdlog::logger> logger)
    : logger_(logging::orNullLogger(std::move(logger), "astrolabe.houses")) {
    for (auto& algorithm : createBuiltinAlgorithms()) {
        registerAlgorithm(std::move(algorithm));
    }
}

void HouseCalculator::registerAlgorithm(
    std::unique_ptr<IHouseAlgorithm> algorithm) {
    if (!algorithm) {
        return;
    }
    const auto system = algorithm->system();
    algorithms_[system] = std::move(algorithm);
    logger_->debug("Registered house algorithm: {}", houseSystemName(system));
}

bool HouseCalculator::isSupported(HouseSystem system) const noexcept {
    return algorithms_.contains(system);
}

auto HouseCalculator::supportedSystems() const -> std::vector<HouseSystem> {
    std::vector<HouseSystem> systems;
    systems.reserve(algorithms_.size());
    for (const auto& [system, algorithm] : algorithms_) {
        systems.push_back(system);
    }
    return systems;
}

auto HouseCalculator::calculate(double jd, double latitude, double longitude,
                                HouseSystem system) const
    -> error::Result<HouseCusps> {
    if (!std::isfinite(jd)) {
        return makeError(ErrorCode::InvalidInput, "non-finite Julian Date");
    }
    if (!ObserverLocation(latitude, longitude).isValid()) {
        return makeError(ErrorCode::InvalidInput,
                         "location ({}, {}) out of range", latitude, longitude);
    }

    const double ramc = calculation::calculateLST(jd, longitude);
    const double obliquity = calculation::calculateObliquityJD(jd);
    return calculateFromRamc(ramc, obliquity, latitude, system);
}

auto HouseCalculator::calculate(double jd, double latitude, double longitude,
                                std::string_view token) const
    -> error::Result<HouseCusps> {
    return parseHouseSystem(token).and_then([&](HouseSystem system) {
        return calculate(jd, latitude, longitude, system);
    });
}

auto HouseCalculator::calculateFromRamc(double ramc, double obliquity,
                                        double latitude,
                                        HouseSystem system) const
    -> error::Result<HouseCusps> {
    auto it = algorithms_.find(system);
    if (it == algorithms_.end()) {
        logger_->debug("House system {} requested but not registered",
                       houseSystemName(system));
        return makeError(ErrorCode::HouseSystemError,
                         "house system {} is not supported",
                         houseSystemName(system));
    }
    if (!std::isfinite(ramc) || !std::isfinite(obliquity) ||
        !std::isfinite(latitude) || std::abs(latitude) > 90.0) {
        return makeError(ErrorCode::InvalidInput,
                         "invalid sky orientation (RAMC {}, obliquity {}, "
                         "latitude {})",
                         ramc, obliquity, latitude);
    }

    const auto ctx = HouseContext::make(ramc, obliquity, latitude);
    logger_->debug("Dispatching {} houses: RAMC={:.6f} eps={:.6f} lat={:.4f}",
                   houseSystemName(system), ctx.ramc, obliquity, latitude);

    auto cusps = it->second->compute(ctx);
    if (!cusps) {
        logger_->debug("{} houses failed: {}", houseSystemName(system),
                       cusps.error().message);
        return std::unexpected(cusps.error());
    }
    return HouseCusps{system, *cusps, ctx.angles, ctx.ramc};
}

}  // namespace astrolabe::houses
