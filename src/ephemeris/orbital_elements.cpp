/**
 * @file orbital_elements.cpp
 * @brief Keplerian element table (J2000 mean elements with secular rates).
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "orbital_elements.hpp"

#include "astronomy/constants.hpp"

namespace astrolabe::ephemeris {

namespace {

// a [AU], e, i [deg], L [deg], longitude of perihelion [deg], node [deg]
constexpr OrbitalCoefficients EARTH{
    {1.00000261, 0.0, 0.0},
    {0.01671123, -0.00004392, 0.0},
    {-0.00001531, -0.01294668, 0.0},
    {100.46457166, 35999.37244981, 0.0},
    {102.93768193, 0.32327364, 0.0},
    {0.0, 0.0, 0.0}};

constexpr OrbitalCoefficients MERCURY{
    {0.38709843, 0.0, 0.0},
    {0.20563661, 0.00002123, 0.0},
    {7.00497902, -0.00594749, 0.0},
    {252.25032350, 149472.67411175, 0.0},
    {77.45779628, 0.15940013, 0.0},
    {48.33076593, -0.12534081, 0.0}};

constexpr OrbitalCoefficients VENUS{
    {0.72332102, 0.0, 0.0},
    {0.00676399, -0.00005107, 0.0},
    {3.39777545, -0.00043494, 0.0},
    {181.97909950, 58517.81538729, 0.0},
    {131.60246718, 0.00268329, 0.0},
    {76.67984255, -0.27769418, 0.0}};

constexpr OrbitalCoefficients MARS{
    {1.52371243, 0.0, 0.0},
    {0.09336511, 0.00009149, 0.0},
    {1.85181869, -0.00724757, 0.0},
    {355.45332620, 19140.30268499, 0.0},
    {336.04084219, 0.44390164, 0.0},
    {49.71355184, -0.29257343, 0.0}};

constexpr OrbitalCoefficients JUPITER{
    {5.20248019, 0.0, 0.0},
    {0.04853590, 0.00018026, 0.0},
    {1.29861416, -0.00322699, 0.0},
    {34.33479152, 3034.90371757, 0.0},
    {14.72847983, 0.21252668, 0.0},
    {100.29282654, 0.13032614, 0.0}};

constexpr OrbitalCoefficients SATURN{
    {9.54149883, 0.0, 0.0},
    {0.05550825, -0.00034664, 0.0},
    {2.49424102, 0.00451969, 0.0},
    {49.55953891, 1222.11379404, 0.0},
    {92.86136063, 0.54179478, 0.0},
    {113.63998702, -0.25015002, 0.0}};

constexpr OrbitalCoefficients URANUS{
    {19.18797948, 0.0, 0.0},
    {0.04731826, 0.00000745, 0.0},
    {0.77298127, -0.00180155, 0.0},
    {313.23810451, 428.48202785, 0.0},
    {172.43404441, 0.09266985, 0.0},
    {74.22992501, 0.04240589, 0.0}};

constexpr OrbitalCoefficients NEPTUNE{
    {30.06952752, 0.0, 0.0},
    {0.00860648, 0.00000215, 0.0},
    {1.77005520, 0.00022400, 0.0},
    {304.88003403, 218.45945325, 0.0},
    {46.68158724, 0.01009938, 0.0},
    {131.78635853, -0.00606302, 0.0}};

constexpr OrbitalCoefficients PLUTO{
    {39.48686035, 0.0, 0.0},
    {0.24885238, 0.00006016, 0.0},
    {17.14104260, 0.00000501, 0.0},
    {238.96535011, 145.18042903, 0.0},
    {224.09702598, -0.00968827, 0.0},
    {110.30167986, -0.00809981, 0.0}};

}  // namespace

double OrbitalElements::meanAnomalyDeg() const noexcept {
    return astronomy::normalizeAngle360(meanLongitudeDeg -
                                        longitudeOfPerihelionDeg);
}

auto earthCoefficients() noexcept -> const OrbitalCoefficients& {
    return EARTH;
}

auto planetCoefficients(Body body) noexcept -> const OrbitalCoefficients* {
    switch (body) {
        case Body::Mercury:
            return &MERCURY;
        case Body::Venus:
            return &VENUS;
        case Body::Mars:
            return &MARS;
        case Body::Jupiter:
            return &JUPITER;
        case Body::Saturn:
            return &SATURN;
        case Body::Uranus:
            return &URANUS;
        case Body::Neptune:
            return &NEPTUNE;
        case Body::Pluto:
            return &PLUTO;
        default:
            return nullptr;
    }
}

}  // namespace astrolabe::ephemeris
