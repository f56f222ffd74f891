/**
 * @file body.hpp
 * @brief Chart bodies and their canonical names.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_EPHEMERIS_BODY_HPP
#define ASTROLABE_EPHEMERIS_BODY_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace astrolabe::ephemeris {

/**
 * @brief Points that can appear in a chart
 */
enum class Body {
    Sun,
    Moon,
    Mercury,
    Venus,
    Mars,
    Jupiter,
    Saturn,
    Uranus,
    Neptune,
    Pluto,
    MeanNode,
    TrueNode,
    Lilith,
    Chiron
};

/// Every body in enumeration order
inline constexpr std::array<Body, 14> ALL_BODIES = {
    Body::Sun,     Body::Moon,     Body::Mercury,  Body::Venus,
    Body::Mars,    Body::Jupiter,  Body::Saturn,   Body::Uranus,
    Body::Neptune, Body::Pluto,    Body::MeanNode, Body::TrueNode,
    Body::Lilith,  Body::Chiron};

/**
 * @brief Sun through Pluto plus the mean lunar node.
 */
[[nodiscard]] auto defaultBodies() -> std::vector<Body>;

/**
 * @brief Canonical display name ("Sun", "Mean Node", ...).
 */
[[nodiscard]] auto bodyName(Body body) -> std::string_view;

/**
 * @brief Parse a body name.
 *
 * Matching ignores case, spaces and underscores, so "mean_node",
 * "MeanNode" and "Mean Node" are the same body.
 */
[[nodiscard]] auto parseBody(std::string_view name) -> std::optional<Body>;

/**
 * @brief Whether the body orbits the Sun and is solved with Kepler's
 * equation by the built-in model.
 */
[[nodiscard]] constexpr bool isPlanet(Body body) noexcept {
    switch (body) {
        case Body::Mercury:
        case Body::Venus:
        case Body::Mars:
        case Body::Jupiter:
        case Body::Saturn:
        case Body::Uranus:
        case Body::Neptune:
        case Body::Pluto:
            return true;
        default:
            return false;
    }
}

}  // namespace astrolabe::ephemeris

#endif  // ASTROLABE_EPHEMERIS_BODY_HPP
