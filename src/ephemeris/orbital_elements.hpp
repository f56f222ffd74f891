/**
 * @file orbital_elements.hpp
 * @brief Time-varying Keplerian elements of the planets.
 *
 * Each element is a polynomial c0 + c1*T + c2*T^2 in Julian centuries
 * since J2000.0. The table covers the Earth-Moon barycenter and the
 * planets Mercury through Pluto.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_EPHEMERIS_ORBITAL_ELEMENTS_HPP
#define ASTROLABE_EPHEMERIS_ORBITAL_ELEMENTS_HPP

#include <optional>

#include "body.hpp"

namespace astrolabe::ephemeris {

/**
 * @struct ElementPolynomial
 * @brief Constant, linear and quadratic term of one element.
 */
struct ElementPolynomial {
    double c0{0.0};
    double c1{0.0};
    double c2{0.0};

    [[nodiscard]] constexpr double evaluate(double T) const noexcept {
        return c0 + (c1 + c2 * T) * T;
    }
};

/**
 * @struct OrbitalElements
 * @brief Six osculating elements at one instant. Angles in degrees.
 */
struct OrbitalElements {
    double semiMajorAxisAU{0.0};
    double eccentricity{0.0};
    double inclinationDeg{0.0};
    double meanLongitudeDeg{0.0};
    double longitudeOfPerihelionDeg{0.0};
    double longitudeOfAscendingNodeDeg{0.0};

    /**
     * @brief Mean anomaly M = L - perihelion, in [0, 360).
     */
    [[nodiscard]] double meanAnomalyDeg() const noexcept;

    /**
     * @brief Argument of perihelion = perihelion - node.
     */
    [[nodiscard]] double argumentOfPerihelionDeg() const noexcept {
        return longitudeOfPerihelionDeg - longitudeOfAscendingNodeDeg;
    }
};

/**
 * @struct OrbitalCoefficients
 * @brief Coefficient set of one body; evaluate() yields its elements.
 */
struct OrbitalCoefficients {
    ElementPolynomial semiMajorAxis;
    ElementPolynomial eccentricity;
    ElementPolynomial inclination;
    ElementPolynomial meanLongitude;
    ElementPolynomial longitudeOfPerihelion;
    ElementPolynomial longitudeOfAscendingNode;

    [[nodiscard]] constexpr OrbitalElements evaluate(double T) const noexcept {
        return {semiMajorAxis.evaluate(T),
                eccentricity.evaluate(T),
                inclination.evaluate(T),
                meanLongitude.evaluate(T),
                longitudeOfPerihelion.evaluate(T),
                longitudeOfAscendingNode.evaluate(T)};
    }
};

/**
 * @brief Coefficients of the Earth-Moon barycenter.
 */
[[nodiscard]] auto earthCoefficients() noexcept -> const OrbitalCoefficients&;

/**
 * @brief Coefficients of a planet.
 * @return nullptr for bodies that are not solved from orbital elements
 * (Sun, Moon, lunar points, Chiron).
 */
[[nodiscard]] auto planetCoefficients(Body body) noexcept
    -> const OrbitalCoefficients*;

}  // namespace astrolabe::ephemeris

#endif  // ASTROLABE_EPHEMERIS_ORBITAL_ELEMENTS_HPP
