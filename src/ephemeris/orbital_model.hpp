/**
 * @file orbital_model.hpp
 * @brief Simplified orbital position model of the Sun, Moon and planets.
 *
 * Planets are solved from time-varying Keplerian elements. The Sun is the
 * Earth's heliocentric direction reversed. The Moon and its mean node use
 * closed-form series and are geocentric from the start.
 *
 * All times are Julian centuries since J2000.0.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_EPHEMERIS_ORBITAL_MODEL_HPP
#define ASTROLABE_EPHEMERIS_ORBITAL_MODEL_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "astronomy/coordinates.hpp"
#include "body.hpp"
#include "error/error.hpp"
#include "kepler.hpp"
#include "orbital_elements.hpp"

namespace astrolabe::ephemeris {

using astronomy::CartesianCoordinates;
using astronomy::EclipticCoordinates;

/// Astronomical unit in kilometres
inline constexpr double AU_KM = 149597870.7;

/**
 * @class OrbitalModel
 * @brief Evaluates the coefficient table at an arbitrary instant.
 *
 * Stateless apart from its solver options and logger; safe to share
 * between threads.
 */
class OrbitalModel {
public:
    explicit OrbitalModel(KeplerOptions options = {},
                          std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Heliocentric rectangular position from a coefficient set.
     * @param coefficients Element polynomials of the body.
     * @param T Julian centuries since J2000.0.
     * @return Position in AU, or the solver error.
     */
    [[nodiscard]] auto heliocentricRectangular(
        const OrbitalCoefficients& coefficients, double T) const
        -> error::Result<CartesianCoordinates>;

    /**
     * @brief Heliocentric ecliptic position from a coefficient set.
     */
    [[nodiscard]] auto heliocentric(const OrbitalCoefficients& coefficients,
                                    double T) const
        -> error::Result<EclipticCoordinates>;

    /**
     * @brief Heliocentric position of a planet.
     * @return InvalidBody when the body is not a planet.
     */
    [[nodiscard]] auto heliocentric(Body body, double T) const
        -> error::Result<EclipticCoordinates>;

    /**
     * @brief Heliocentric position of the Earth.
     */
    [[nodiscard]] auto earth(double T) const
        -> error::Result<EclipticCoordinates>;

    /**
     * @brief Geocentric position of a planet.
     * @return InvalidBody when the body is not a planet.
     */
    [[nodiscard]] auto geocentricPlanet(Body body, double T) const
        -> error::Result<EclipticCoordinates>;

    /**
     * @brief Geocentric Sun: Earth's heliocentric longitude + 180,
     * latitude 0, Earth-Sun distance.
     */
    [[nodiscard]] auto sun(double T) const
        -> error::Result<EclipticCoordinates>;

    /**
     * @brief Geocentric Moon from mean elements plus the leading
     * periodic terms (about 0.3 degree accuracy).
     */
    [[nodiscard]] EclipticCoordinates moon(double T) const noexcept;

    /**
     * @brief Mean ascending node of the lunar orbit.
     */
    [[nodiscard]] EclipticCoordinates meanNode(double T) const noexcept;

    /**
     * @brief Geocentric position of any body the model covers.
     * @return InvalidBody for True Node, Lilith and Chiron.
     */
    [[nodiscard]] auto geocentric(Body body, double T) const
        -> error::Result<EclipticCoordinates>;

    [[nodiscard]] const KeplerOptions& options() const noexcept {
        return options_;
    }

private:
    KeplerOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace astrolabe::ephemeris

#endif  // ASTROLABE_EPHEMERIS_ORBITAL_MODEL_HPP
