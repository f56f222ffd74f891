/**
 * @file ayanamsa.cpp
 * @brief Ayanamsa name lookup.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "ayanamsa.hpp"

#include <cctype>
#include <string>

namespace astrolabe::chart {

auto parseAyanamsa(std::string_view name) -> error::Result<Ayanamsa> {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        key.push_back(c == '-' || c == ' '
                          ? '_'
                          : static_cast<char>(
                                std::tolower(static_cast<unsigned char>(c))));
    }

    if (key.empty() || key == "tropical") {
        return Ayanamsa::Tropical;
    }
    if (key == "lahiri") {
        return Ayanamsa::Lahiri;
    }
    if (key == "fagan_bradley") {
        return Ayanamsa::FaganBradley;
    }
    return error::makeError(error::ErrorCode::InvalidInput,
                            "unknown ayanamsa '{}'", name);
}

auto ayanamsaName(Ayanamsa ayanamsa) noexcept -> std::string_view {
    switch (ayanamsa) {
        case Ayanamsa::Lahiri:
            return "lahiri";
        case Ayanamsa::FaganBradley:
            return "fagan_bradley";
        default:
            return "tropical";
    }
}

}  // namespace astrolabe::chart
