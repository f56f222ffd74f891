/**
 * @file ayanamsa.hpp
 * @brief Sidereal zodiac offsets.
 *
 * The ayanamsa is the longitude of the tropical zero point in a sidereal
 * zodiac. It is modelled as linear in time, which stays within a few arc
 * seconds of the published tables over several centuries.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_CHART_AYANAMSA_HPP
#define ASTROLABE_CHART_AYANAMSA_HPP

#include <string_view>

#include "error/error.hpp"

namespace astrolabe::chart {

enum class Ayanamsa { Tropical, Lahiri, FaganBradley };

/// Precession of the equinoxes, degrees per Julian century
inline constexpr double PRECESSION_PER_CENTURY = 1.396971;
/// Lahiri (Chitrapaksha) ayanamsa at J2000.0, degrees
inline constexpr double LAHIRI_J2000 = 23.857092;
/// Fagan-Bradley ayanamsa at J2000.0, degrees
inline constexpr double FAGAN_BRADLEY_J2000 = 24.740300;

/**
 * @brief Parse "tropical", "lahiri" or "fagan_bradley" (case-insensitive).
 * @return InvalidInput for anything else.
 */
[[nodiscard]] auto parseAyanamsa(std::string_view name)
    -> error::Result<Ayanamsa>;

[[nodiscard]] auto ayanamsaName(Ayanamsa ayanamsa) noexcept -> std::string_view;

/**
 * @brief Offset subtracted from tropical longitudes.
 * @param T Julian centuries since J2000.0.
 * @return Degrees, 0 for the tropical zodiac.
 */
[[nodiscard]] constexpr double ayanamsaDegrees(Ayanamsa ayanamsa,
                                               double T) noexcept {
    switch (ayanamsa) {
        case Ayanamsa::Lahiri:
            return LAHIRI_J2000 + PRECESSION_PER_CENTURY * T;
        case Ayanamsa::FaganBradley:
            return FAGAN_BRADLEY_J2000 + PRECESSION_PER_CENTURY * T;
        default:
            return 0.0;
    }
}

}  // namespace astrolabe::chart

#endif  // ASTROLABE_CHART_AYANAMSA_HPP
