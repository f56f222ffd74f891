/**
 * @file house_system.hpp
 * @brief House system selector and its request tokens.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_HOUSES_HOUSE_SYSTEM_HPP
#define ASTROLABE_HOUSES_HOUSE_SYSTEM_HPP

#include <array>
#include <string_view>

#include "error/error.hpp"

namespace astrolabe::houses {

/**
 * @brief Known house division methods
 */
enum class HouseSystem {
    Placidus,
    Koch,
    Porphyry,
    Regiomontanus,
    Campanus,
    Equal,
    EqualMC,
    WholeSign,
    Vehlow,
    Meridian,
    Alcabitius,
    Morinus,
    Krusinski,
    Topocentric,
    Vedic
};

inline constexpr std::array<HouseSystem, 15> ALL_HOUSE_SYSTEMS = {
    HouseSystem::Placidus,   HouseSystem::Koch,      HouseSystem::Porphyry,
    HouseSystem::Regiomontanus, HouseSystem::Campanus, HouseSystem::Equal,
    HouseSystem::EqualMC,    HouseSystem::WholeSign, HouseSystem::Vehlow,
    HouseSystem::Meridian,   HouseSystem::Alcabitius, HouseSystem::Morinus,
    HouseSystem::Krusinski,  HouseSystem::Topocentric, HouseSystem::Vedic};

/**
 * @brief Display name ("Placidus", "Whole Sign", ...).
 */
[[nodiscard]] auto houseSystemName(HouseSystem system) noexcept
    -> std::string_view;

/**
 * @brief Single-letter request code ('P', 'K', 'O', ...).
 */
[[nodiscard]] char houseSystemCode(HouseSystem system) noexcept;

/**
 * @brief Parse a request token.
 *
 * Accepts the single-letter code or the full name, case-insensitive.
 * Both 'A' and 'E' select Equal; spaces, '-' and '_' in names are ignored.
 *
 * @return The system, or HouseSystemError for an unknown token.
 */
[[nodiscard]] auto parseHouseSystem(std::string_view token)
    -> error::Result<HouseSystem>;

}  // namespace astrolabe::houses

#endif  // ASTROLABE_HOUSES_HOUSE_SYSTEM_HPP
