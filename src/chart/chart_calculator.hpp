/**
 * @file chart_calculator.hpp
 * @brief Assembles charts from an ephemeris provider.
 *
 * A chart is computed in two stages. Stage one evaluates the position and
 * speed of every body; bodies are independent and may run concurrently.
 * Stage two needs all positions: it computes the houses, places each body
 * in a house and scans for aspects.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_CHART_CHART_CALCULATOR_HPP
#define ASTROLABE_CHART_CHART_CALCULATOR_HPP

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "aspects/aspect_detector.hpp"
#include "ephemeris/provider.hpp"
#include "error/error.hpp"
#include "houses/house_calculator.hpp"
#include "types.hpp"

namespace astrolabe::chart {

/**
 * @class ChartCalculator
 * @brief Request to Chart pipeline.
 *
 * The provider is borrowed and must outlive the calculator. All methods
 * are const and may be called from several threads.
 */
class ChartCalculator {
public:
    explicit ChartCalculator(const ephemeris::IEphemerisProvider& provider,
                             ChartOptions options = {},
                             std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Natal chart for a civil moment and place.
     * @return The chart, or InvalidInput for a malformed request,
     * HouseSystemError for an unsupported or undefined house system, or the
     * provider's error for a body it cannot compute.
     */
    [[nodiscard]] auto calculate(const ChartRequest& request) const
        -> error::Result<Chart>;

    /**
     * @brief Chart for a Julian Date (UT) and place.
     */
    [[nodiscard]] auto calculateAt(double jd, double latitude,
                                   double longitude,
                                   houses::HouseSystem system,
                                   Ayanamsa ayanamsa) const
        -> error::Result<Chart>;

    /**
     * @brief Stage one: tropical positions and speeds of the configured
     * bodies, in configuration order.
     */
    [[nodiscard]] auto calculatePositions(double jd) const
        -> error::Result<std::vector<ephemeris::BodyPosition>>;

    /**
     * @brief Natal chart, transit chart and the aspects from transiting to
     * natal bodies.
     */
    [[nodiscard]] auto calculateTransits(const ChartRequest& natal,
                                         const ChartRequest& transit) const
        -> error::Result<ChartComparison>;

    /**
     * @brief Both partners' charts and the aspects between them.
     */
    [[nodiscard]] auto calculateSynastry(const ChartRequest& first,
                                         const ChartRequest& second) const
        -> error::Result<ChartComparison>;

    [[nodiscard]] const ChartOptions& options() const noexcept {
        return options_;
    }

    [[nodiscard]] const houses::HouseCalculator& houseCalculator()
        const noexcept {
        return houses_;
    }

private:
    [[nodiscard]] auto bodyPosition(ephemeris::Body body, double jd) const
        -> error::Result<ephemeris::BodyPosition>;

    [[nodiscard]] auto compare(const ChartRequest& inner,
                               const ChartRequest& outer) const
        -> error::Result<ChartComparison>;

    const ephemeris::IEphemerisProvider& provider_;
    ChartOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    houses::HouseCalculator houses_;
    aspects::AspectDetector aspects_;
};

}  // namespace astrolabe::chart

#endif  // ASTROLABE_CHART_CHART_CALCULATOR_HPP
