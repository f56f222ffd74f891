/**
 * @file house_system.cpp
 * @brief House system names and token parsing.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "house_system.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace astrolabe::houses {

using error::ErrorCode;
using error::makeError;

namespace {

/// Alternative spellings used by request clients
constexpr std::pair<std::string_view, HouseSystem> NAME_ALIASES[] = {
    {"WHOLE", HouseSystem::WholeSign},
    {"PORPHYRIUS", HouseSystem::Porphyry},
    {"EQUALMIDHEAVEN", HouseSystem::EqualMC}};

auto normalizeToken(std::string_view token) -> std::string {
    std::string key;
    key.reserve(token.size());
    for (char c : token) {
        if (c == ' ' || c == '_' || c == '-') {
            continue;
        }
        key.push_back(
            static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return key;
}

}  // namespace

auto houseSystemName(HouseSystem system) noexcept -> std::string_view {
    switch (system) {
        case HouseSystem::Placidus:
            return "Placidus";
        case HouseSystem::Koch:
            return "Koch";
        case HouseSystem::Porphyry:
            return "Porphyry";
        case HouseSystem::Regiomontanus:
            return "Regiomontanus";
        case HouseSystem::Campanus:
            return "Campanus";
        case HouseSystem::Equal:
            return "Equal";
        case HouseSystem::EqualMC:
            return "Equal MC";
        case HouseSystem::WholeSign:
            return "Whole Sign";
        case HouseSystem::Vehlow:
            return "Vehlow";
        case HouseSystem::Meridian:
            return "Meridian";
        case HouseSystem::Alcabitius:
            return "Alcabitius";
        case HouseSystem::Morinus:
            return "Morinus";
        case HouseSystem::Krusinski:
            return "Krusinski";
        case HouseSystem::Topocentric:
            return "Topocentric";
        case HouseSystem::Vedic:
            return "Vedic";
        default:
            return "Unknown";
    }
}

char houseSystemCode(HouseSystem system) noexcept {
    switch (system) {
        case HouseSystem::Placidus:
            return 'P';
        case HouseSystem::Koch:
            return 'K';
        case HouseSystem::Porphyry:
            return 'O';
        case HouseSystem::Regiomontanus:
            return 'R';
        case HouseSystem::Campanus:
            return 'C';
        case HouseSystem::Equal:
            return 'A';
        case HouseSystem::EqualMC:
            return 'D';
        case HouseSystem::WholeSign:
            return 'W';
        case HouseSystem::Vehlow:
            return 'V';
        case HouseSystem::Meridian:
            return 'X';
        case HouseSystem::Alcabitius:
            return 'B';
        case HouseSystem::Morinus:
            return 'M';
        case HouseSystem::Krusinski:
            return 'U';
        case HouseSystem::Topocentric:
            return 'T';
        case HouseSystem::Vedic:
            return 'Y';
        default:
            return '?';
    }
}

auto parseHouseSystem(std::string_view token) -> error::Result<HouseSystem> {
    const auto key = normalizeToken(token);
    if (key.empty()) {
        return makeError(ErrorCode::HouseSystemError,
                         "empty house system token");
    }

    if (key.size() == 1) {
        if (key[0] == 'E') {
            return HouseSystem::Equal;
        }
        auto it = std::ranges::find_if(ALL_HOUSE_SYSTEMS, [&key](auto s) {
            return houseSystemCode(s) == key[0];
        });
        if (it != ALL_HOUSE_SYSTEMS.end()) {
            return *it;
        }
    } else {
        auto it = std::ranges::find_if(ALL_HOUSE_SYSTEMS, [&key](auto s) {
            return normalizeToken(houseSystemName(s)) == key;
        });
        if (it != ALL_HOUSE_SYSTEMS.end()) {
            return *it;
        }
        for (const auto& [alias, system] : NAME_ALIASES) {
            if (key == alias) {
                return system;
            }
        }
    }

    return makeError(ErrorCode::HouseSystemError, "unknown house system '{}'",
                     token);
}

}  // namespace astrolabe::houses
