/**
 * @file aspect_detector.cpp
 * @brief Aspect detection implementation.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "aspect_detector.hpp"

#include <cmath>

#include "astronomy/constants.hpp"
#include "logging/logging.hpp"

namespace astrolabe::aspects {

using namespace astrolabe::astronomy;
using ephemeris::BodyPosition;

namespace {

auto allTypes() -> std::vector<AspectType> {
    std::vector<AspectType> types;
    types.reserve(ASPECT_TABLE.size());
    for (const auto& def : ASPECT_TABLE) {
        types.push_back(def.type);
    }
    return types;
}

}  // namespace

nlohmann::json Aspect::toJson() const {
    return {{"body_a", ephemeris::bodyName(bodyA)},
            {"body_b", ephemeris::bodyName(bodyB)},
            {"type", aspectName(type)},
            {"angle", exactAngle},
            {"orb", orb},
            {"applying", applying}};
}

double AspectOptions::orbFor(AspectType type) const {
    auto it = orbOverrides.find(type);
    return it != orbOverrides.end() ? it->second : defaultOrb(type);
}

// ============================================================================
// Pair geometry
// ============================================================================

double signedSeparation(double lonA, double lonB) noexcept {
    return normalizeAngle180(lonA - lonB);
}

double separationRate(const BodyPosition& a, const BodyPosition& b) noexcept {
    const double relative = a.speed - b.speed;
    const double s = signedSeparation(a.longitude, b.longitude);
    if (s > 0.0) {
        return relative;
    }
    if (s < 0.0) {
        return -relative;
    }
    // From zero the separation can only grow
    return std::abs(relative);
}

bool isApplying(const BodyPosition& a, const BodyPosition& b,
                double exactAngle) noexcept {
    const double deviation =
        angularSeparation(a.longitude, b.longitude) - exactAngle;
    return deviation * separationRate(a, b) < 0.0;
}

auto findAspect(const BodyPosition& a, const BodyPosition& b, AspectType type,
                double maxOrb) -> std::optional<Aspect> {
    const double angle = aspectAngle(type);
    const double orb =
        std::abs(angularSeparation(a.longitude, b.longitude) - angle);
    if (orb > maxOrb) {
        return std::nullopt;
    }
    return Aspect{a.body, b.body, type, angle, orb, isApplying(a, b, angle)};
}

auto timeToExact(const BodyPosition& a, const BodyPosition& b,
                 AspectType type) -> std::optional<double> {
    const double deviation =
        angularSeparation(a.longitude, b.longitude) - aspectAngle(type);
    if (deviation == 0.0) {
        return 0.0;
    }
    const double rate = separationRate(a, b);
    if (rate == 0.0 || deviation * rate > 0.0) {
        return std::nullopt;
    }
    return std::abs(deviation / rate);
}

// ============================================================================
// AspectDetector
// ============================================================================

AspectDetector::AspectDetector(AspectOptions options,
                               std::shared_ptr<spdlog::logger> logger)
    : options_(std::move(options)),
      types_(options_.types.empty() ? allTypes() : options_.types),
      logger_(logging::orNullLogger(std::move(logger), "astrolabe.aspects")) {}

void AspectDetector::scanPair(const BodyPosition& a, const BodyPosition& b,
                              std::vector<Aspect>& out) const {
    if (options_.excludeRetrograde && (a.retrograde || b.retrograde)) {
        return;
    }
    for (AspectType type : types_) {
        if (auto aspect = findAspect(a, b, type, options_.orbFor(type))) {
            out.push_back(*aspect);
        }
    }
}

auto AspectDetector::calculateAspects(
    const std::vector<BodyPosition>& positions) const -> std::vector<Aspect> {
    std::vector<Aspect> aspects;
    std::size_t pairs = 0;
    for (std::size_t i = 0; i < positions.size(); ++i) {
        for (std::size_t j = i + 1; j < positions.size(); ++j) {
            scanPair(positions[i], positions[j], aspects);
            ++pairs;
        }
    }
    logger_->debug("Aspect scan: {} bodies, {} pairs, {} types, {} aspects",
                   positions.size(), pairs, types_.size(), aspects.size());
    return aspects;
}

auto AspectDetector::calculateCrossAspects(
    const std::vector<BodyPosition>& inner,
    const std::vector<BodyPosition>& outer) const -> std::vector<Aspect> {
    std::vector<Aspect> aspects;
    for (const auto& a : inner) {
        for (const auto& b : outer) {
            scanPair(a, b, aspects);
        }
    }
    logger_->debug("Cross-aspect scan: {}x{} pairs, {} aspects", inner.size(),
                   outer.size(), aspects.size());
    return aspects;
}

}  // namespace astrolabe::aspects
