/**
 * @file provider.hpp
 * @brief Interface of an ephemeris source.
 *
 * The built-in OrbitalEphemeris implements it; a binding to a native
 * high-precision library can implement it too and be handed to the chart
 * calculator instead. Providers are owned by the caller and passed by
 * reference, so their lifetime (data paths, open files) ends with the
 * owning scope.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_EPHEMERIS_PROVIDER_HPP
#define ASTROLABE_EPHEMERIS_PROVIDER_HPP

#include <string_view>

#include "astronomy/coordinates.hpp"
#include "body.hpp"
#include "error/error.hpp"

namespace astrolabe::ephemeris {

/**
 * @struct CalculationFlags
 * @brief Options of a single position request.
 */
struct CalculationFlags {
    bool heliocentric{false};  ///< Sun-centred instead of Earth-centred
};

/**
 * @class IEphemerisProvider
 * @brief Body position source.
 *
 * Implementations must be safe to call concurrently from several threads.
 */
class IEphemerisProvider {
public:
    virtual ~IEphemerisProvider() = default;

    /**
     * @brief Ecliptic position of a body.
     * @param body Body to locate.
     * @param jd Julian Date (UT).
     * @param flags Request options.
     * @return Longitude [0, 360) and latitude in degrees, distance in AU,
     * or an error naming why the body could not be computed.
     */
    [[nodiscard]] virtual auto position(Body body, double jd,
                                        const CalculationFlags& flags) const
        -> error::Result<astronomy::EclipticCoordinates> = 0;

    /**
     * @brief Whether position() can answer for this body.
     */
    [[nodiscard]] virtual bool supports(Body body) const noexcept = 0;

    /**
     * @brief Short provider name for logs.
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace astrolabe::ephemeris

#endif  // ASTROLABE_EPHEMERIS_PROVIDER_HPP
