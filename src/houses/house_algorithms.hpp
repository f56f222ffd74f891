/**
 * @file house_algorithms.hpp
 * @brief One class per computable house system.
 *
 * Every algorithm receives the same context (RAMC, obliquity, latitude and
 * the chart angles) and returns twelve cusp longitudes indexed by house
 * number minus one. Systems without an implementation have no class here
 * and are simply never registered with the HouseCalculator.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_HOUSES_HOUSE_ALGORITHMS_HPP
#define ASTROLABE_HOUSES_HOUSE_ALGORITHMS_HPP

#include <array>
#include <memory>
#include <vector>

#include "angles.hpp"
#include "error/error.hpp"
#include "house_system.hpp"

namespace astrolabe::houses {

/// Cusp longitudes, index 0 is the first house
using CuspArray = std::array<double, 12>;

/**
 * @struct HouseContext
 * @brief Sky orientation shared by all house algorithms, degrees.
 */
struct HouseContext {
    double ramc{0.0};       ///< Right ascension of the meridian
    double obliquity{0.0};  ///< Obliquity of the ecliptic
    double latitude{0.0};   ///< Geographic latitude, north positive
    Angles angles;          ///< Ascendant, MC, Descendant, IC

    /**
     * @brief Build a context and derive its angles.
     */
    [[nodiscard]] static HouseContext make(double ramc, double obliquity,
                                           double latitude) noexcept;

    /**
     * @brief Inside a polar circle, where the ecliptic can be circumpolar.
     */
    [[nodiscard]] bool isPolar() const noexcept;
};

/**
 * @class IHouseAlgorithm
 * @brief House division strategy.
 */
class IHouseAlgorithm {
public:
    virtual ~IHouseAlgorithm() = default;

    [[nodiscard]] virtual HouseSystem system() const noexcept = 0;

    /**
     * @brief Compute the cusps.
     * @return Twelve longitudes in [0, 360), or HouseSystemError when the
     * system is undefined for this latitude.
     */
    [[nodiscard]] virtual auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> = 0;
};

// ============================================================================
// Quadrant systems
// ============================================================================

/**
 * @brief Trisection of the diurnal and nocturnal semi-arcs in time.
 * Undefined inside the polar circles.
 */
class PlacidusHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::Placidus;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

/**
 * @brief Birthplace system: trisection of the MC's semi-arc, projected with
 * the geographic pole. Undefined inside the polar circles.
 */
class KochHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::Koch;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

/**
 * @brief Trisection of each quadrant in ecliptic longitude.
 */
class PorphyryHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::Porphyry;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

/**
 * @brief Equal division of the celestial equator, projected through the
 * north and south points of the horizon.
 */
class RegiomontanusHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::Regiomontanus;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

/**
 * @brief Equal division of the prime vertical.
 */
class CampanusHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::Campanus;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

/**
 * @brief Trisection of the ascendant's semi-arcs in right ascension.
 */
class AlcabitiusHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::Alcabitius;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

// ============================================================================
// Equal-arc systems
// ============================================================================

class EqualHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::Equal;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

class EqualMCHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::EqualMC;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

class WholeSignHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::WholeSign;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

/**
 * @brief Equal houses with the ascendant in the middle of the first house.
 */
class VehlowHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::Vehlow;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

/**
 * @brief Equal division of the equator from the meridian, projected along
 * hour circles (axial rotation system).
 */
class MeridianHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::Meridian;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

/**
 * @brief Equal division of the equator, projected along circles of
 * ecliptic longitude.
 */
class MorinusHouses final : public IHouseAlgorithm {
public:
    [[nodiscard]] HouseSystem system() const noexcept override {
        return HouseSystem::Morinus;
    }
    [[nodiscard]] auto compute(const HouseContext& ctx) const
        -> error::Result<CuspArray> override;
};

/**
 * @brief Every algorithm shipped with the library.
 */
[[nodiscard]] auto createBuiltinAlgorithms()
    -> std::vector<std::unique_ptr<IHouseAlgorithm>>;

}  // namespace astrolabe::houses

#endif  // ASTROLABE_HOUSES_HOUSE_ALGORITHMS_HPP
