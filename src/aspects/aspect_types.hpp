/**
 * @file aspect_types.hpp
 * @brief Aspect table: exact angles and default orbs.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_ASPECTS_ASPECT_TYPES_HPP
#define ASTROLABE_ASPECTS_ASPECT_TYPES_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace astrolabe::aspects {

/**
 * @brief Angular relationships between two bodies
 */
enum class AspectType {
    Conjunction,
    Opposition,
    Trine,
    Square,
    Sextile,
    Quincunx,
    SemiSextile,
    SemiSquare,
    Sesquisquare,
    Quintile,
    BiQuintile,
    Septile,
    BiSeptile,
    TriSeptile,
    Novile,
    BiNovile,
    QuadNovile
};

/**
 * @struct AspectDefinition
 */
struct AspectDefinition {
    AspectType type;
    std::string_view name;
    double angle;       ///< Exact angle in degrees
    double defaultOrb;  ///< Largest accepted deviation in degrees
};

/// The aspect table, major aspects first
inline constexpr std::array<AspectDefinition, 17> ASPECT_TABLE = {{
    {AspectType::Conjunction, "Conjunction", 0.0, 10.0},
    {AspectType::Opposition, "Opposition", 180.0, 10.0},
    {AspectType::Trine, "Trine", 120.0, 10.0},
    {AspectType::Square, "Square", 90.0, 10.0},
    {AspectType::Sextile, "Sextile", 60.0, 8.0},
    {AspectType::Quincunx, "Quincunx", 150.0, 3.0},
    {AspectType::SemiSextile, "Semi-sextile", 30.0, 3.0},
    {AspectType::SemiSquare, "Semi-square", 45.0, 3.0},
    {AspectType::Sesquisquare, "Sesquisquare", 135.0, 3.0},
    {AspectType::Quintile, "Quintile", 72.0, 3.0},
    {AspectType::BiQuintile, "Bi-quintile", 144.0, 3.0},
    {AspectType::Septile, "Septile", 360.0 / 7.0, 2.0},
    {AspectType::BiSeptile, "Bi-septile", 720.0 / 7.0, 2.0},
    {AspectType::TriSeptile, "Tri-septile", 1080.0 / 7.0, 2.0},
    {AspectType::Novile, "Novile", 40.0, 2.0},
    {AspectType::BiNovile, "Bi-novile", 80.0, 2.0},
    {AspectType::QuadNovile, "Quad-novile", 160.0, 2.0},
}};

[[nodiscard]] constexpr const AspectDefinition& aspectDefinition(
    AspectType type) noexcept {
    return ASPECT_TABLE[static_cast<std::size_t>(type)];
}

[[nodiscard]] constexpr double aspectAngle(AspectType type) noexcept {
    return aspectDefinition(type).angle;
}

[[nodiscard]] constexpr double defaultOrb(AspectType type) noexcept {
    return aspectDefinition(type).defaultOrb;
}

[[nodiscard]] constexpr std::string_view aspectName(AspectType type) noexcept {
    return aspectDefinition(type).name;
}

/**
 * @brief Conjunction, opposition, trine, square and sextile.
 */
[[nodiscard]] constexpr bool isMajor(AspectType type) noexcept {
    return static_cast<int>(type) <= static_cast<int>(AspectType::Sextile);
}

/**
 * @brief Parse an aspect name, ignoring case, spaces, '-' and '_'.
 */
[[nodiscard]] auto parseAspectType(std::string_view name)
    -> std::optional<AspectType>;

}  // namespace astrolabe::aspects

#endif  // ASTROLABE_ASPECTS_ASPECT_TYPES_HPP
