/**
 * @file body.cpp
 * @brief Body name lookup.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "body.hpp"

#include <algorithm>
#include <cctype>

namespace astrolabe::ephemeris {

namespace {

auto canonicalKey(std::string_view name) -> std::string {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == ' ' || c == '_' || c == '-') {
            continue;
        }
        key.push_back(
            static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return key;
}

}  // namespace

auto defaultBodies() -> std::vector<Body> {
    return {Body::Sun,     Body::Moon,   Body::Mercury, Body::Venus,
            Body::Mars,    Body::Jupiter, Body::Saturn, Body::Uranus,
            Body::Neptune, Body::Pluto,  Body::MeanNode};
}

auto bodyName(Body body) -> std::string_view {
    switch (body) {
        case Body::Sun:
            return "Sun";
        case Body::Moon:
            return "Moon";
        case Body::Mercury:
            return "Mercury";
        case Body::Venus:
            return "Venus";
        case Body::Mars:
            return "Mars";
        case Body::Jupiter:
            return "Jupiter";
        case Body::Saturn:
            return "Saturn";
        case Body::Uranus:
            return "Uranus";
        case Body::Neptune:
            return "Neptune";
        case Body::Pluto:
            return "Pluto";
        case Body::MeanNode:
            return "Mean Node";
        case Body::TrueNode:
            return "True Node";
        case Body::Lilith:
            return "Lilith";
        case Body::Chiron:
            return "Chiron";
        default:
            return "Unknown";
    }
}

auto parseBody(std::string_view name) -> std::optional<Body> {
    auto key = canonicalKey(name);
    auto it = std::ranges::find_if(ALL_BODIES, [&key](Body body) {
        return canonicalKey(bodyName(body)) == key;
    });
    if (it == ALL_BODIES.end()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace astrolabe::ephemeris
