/**
 * @file house_calculator.hpp
 * @brief House cusps from time and place, and body-to-house assignment.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_HOUSES_HOUSE_CALCULATOR_HPP
#define ASTROLABE_HOUSES_HOUSE_CALCULATOR_HPP

#include <map>
#include <memory>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "angles.hpp"
#include "ephemeris/position.hpp"
#include "error/error.hpp"
#include "house_algorithms.hpp"
#include "house_system.hpp"

namespace astrolabe::houses {

/**
 * @struct HouseCusps
 * @brief Twelve cusps of one house system.
 *
 * Cusps are ordered by house number; consecutive values may wrap through
 * 0 degrees.
 */
struct HouseCusps {
    HouseSystem system{HouseSystem::Placidus};
    CuspArray cusps{};
    Angles angles;
    double ramc{0.0};

    /**
     * @brief Cusp of a house.
     * @param house House number 1-12.
     */
    [[nodiscard]] double cusp(int house) const { return cusps.at(house - 1); }

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief House containing a longitude.
 *
 * House i spans [cusp i, cusp i+1) going forward around the circle; a house
 * whose end cusp is numerically smaller than its start cusp spans 0 degrees.
 * A longitude on a cusp belongs to the house that starts there.
 *
 * @param longitude Ecliptic longitude in degrees, any range.
 * @param cusps Cusps ordered by house number.
 * @return House number 1-12.
 */
[[nodiscard]] int findHouse(double longitude, const CuspArray& cusps) noexcept;

/**
 * @brief Set the house of every position.
 */
void assignHouses(std::vector<ephemeris::BodyPosition>& positions,
                  const CuspArray& cusps);

/**
 * @class HouseCalculator
 * @brief Dispatches to the registered algorithm of a house system.
 *
 * The built-in algorithms are registered on construction. Systems without
 * an algorithm fail with HouseSystemError. A calculator is immutable after
 * setup, so concurrent calculate() calls are safe.
 */
class HouseCalculator {
public:
    explicit HouseCalculator(std::shared_ptr<spdlog::logger> logger = nullptr);

    HouseCalculator(const HouseCalculator&) = delete;
    HouseCalculator& operator=(const HouseCalculator&) = delete;
    HouseCalculator(HouseCalculator&&) noexcept = default;
    HouseCalculator& operator=(HouseCalculator&&) noexcept = default;

    /**
     * @brief Register or replace the algorithm of a system.
     */
    void registerAlgorithm(std::unique_ptr<IHouseAlgorithm> algorithm);

    [[nodiscard]] bool isSupported(HouseSystem system) const noexcept;

    [[nodiscard]] auto supportedSystems() const -> std::vector<HouseSystem>;

    /**
     * @brief Cusps for a Julian Date (UT) and place.
     * @param jd Julian Date.
     * @param latitude Geographic latitude in degrees [-90, 90].
     * @param longitude Geographic longitude in degrees [-180, 180], east
     * positive.
     * @param system House system.
     * @return The cusps, InvalidInput for an out-of-range location,
     * HouseSystemError for an unregistered or undefined system.
     */
    [[nodiscard]] auto calculate(double jd, double latitude, double longitude,
                                 HouseSystem system) const
        -> error::Result<HouseCusps>;

    /**
     * @brief Same as above, with the system given as a request token.
     */
    [[nodiscard]] auto calculate(double jd, double latitude, double longitude,
                                 std::string_view token) const
        -> error::Result<HouseCusps>;

    /**
     * @brief Cusps from an explicit sky orientation.
     * @param ramc Right ascension of the meridian in degrees.
     * @param obliquity Obliquity of the ecliptic in degrees.
     * @param latitude Geographic latitude in degrees.
     */
    [[nodiscard]] auto calculateFromRamc(double ramc, double obliquity,
                                         double latitude,
                                         HouseSystem system) const
        -> error::Result<HouseCusps>;

private:
    std::map<HouseSystem, std::unique_ptr<IHouseAlgorithm>> algorithms_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace astrolabe::houses

#endif  // ASTROLABE_HOUSES_HOUSE_CALCULATOR_HPP
