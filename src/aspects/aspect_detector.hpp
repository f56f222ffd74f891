/**
 * @file aspect_detector.hpp
 * @brief Aspect detection between body positions.
 *
 * Separation is the shortest arc between two longitudes, in [0, 180]. A
 * pair forms an aspect when |separation - exact angle| <= orb.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_ASPECTS_ASPECT_DETECTOR_HPP
#define ASTROLABE_ASPECTS_ASPECT_DETECTOR_HPP

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "aspect_types.hpp"
#include "ephemeris/position.hpp"

namespace astrolabe::aspects {

/**
 * @struct Aspect
 * @brief One aspect between two bodies.
 */
struct Aspect {
    ephemeris::Body bodyA{ephemeris::Body::Sun};
    ephemeris::Body bodyB{ephemeris::Body::Sun};
    AspectType type{AspectType::Conjunction};
    double exactAngle{0.0};  ///< Degrees
    double orb{0.0};         ///< |separation - exact angle|, degrees
    bool applying{false};    ///< Deviation from exact is shrinking

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @struct AspectOptions
 */
struct AspectOptions {
    /// Skip every pair that contains a retrograde body
    bool excludeRetrograde{true};
    /// Aspects to look for, in table order when empty
    std::vector<AspectType> types;
    /// Orb per aspect type replacing the table default
    std::map<AspectType, double> orbOverrides;

    [[nodiscard]] double orbFor(AspectType type) const;
};

/**
 * @brief Signed shortest arc from b to a, in [-180, 180).
 */
[[nodiscard]] double signedSeparation(double lonA, double lonB) noexcept;

/**
 * @brief Rate of change of the unsigned separation, degrees per day.
 */
[[nodiscard]] double separationRate(const ephemeris::BodyPosition& a,
                                    const ephemeris::BodyPosition& b) noexcept;

/**
 * @brief Whether an aspect between two moving bodies is applying.
 *
 * The deviation from exact is separation - angle; the aspect applies when
 * the deviation and its rate have opposite signs. Equal speeds never apply.
 */
[[nodiscard]] bool isApplying(const ephemeris::BodyPosition& a,
                              const ephemeris::BodyPosition& b,
                              double exactAngle) noexcept;

/**
 * @brief Test a single aspect type between two positions.
 * @param maxOrb Largest accepted deviation in degrees.
 */
[[nodiscard]] auto findAspect(const ephemeris::BodyPosition& a,
                              const ephemeris::BodyPosition& b,
                              AspectType type, double maxOrb)
    -> std::optional<Aspect>;

/**
 * @brief Days until the aspect becomes exact at the current speeds.
 * @return 0 when already exact, nothing when the bodies are separating from
 * it or move at the same speed.
 */
[[nodiscard]] auto timeToExact(const ephemeris::BodyPosition& a,
                               const ephemeris::BodyPosition& b,
                               AspectType type) -> std::optional<double>;

/**
 * @class AspectDetector
 * @brief Scans position sets for aspects.
 */
class AspectDetector {
public:
    explicit AspectDetector(AspectOptions options = {},
                            std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Aspects between every unordered pair of one chart.
     */
    [[nodiscard]] auto calculateAspects(
        const std::vector<ephemeris::BodyPosition>& positions) const
        -> std::vector<Aspect>;

    /**
     * @brief Aspects from every body of @p inner to every body of @p outer,
     * as between a natal chart and transits or a partner's chart.
     */
    [[nodiscard]] auto calculateCrossAspects(
        const std::vector<ephemeris::BodyPosition>& inner,
        const std::vector<ephemeris::BodyPosition>& outer) const
        -> std::vector<Aspect>;

    [[nodiscard]] const AspectOptions& options() const noexcept {
        return options_;
    }

private:
    void scanPair(const ephemeris::BodyPosition& a,
                  const ephemeris::BodyPosition& b,
                  std::vector<Aspect>& out) const;

    AspectOptions options_;
    std::vector<AspectType> types_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace astrolabe::aspects

#endif  // ASTROLABE_ASPECTS_ASPECT_DETECTOR_HPP
