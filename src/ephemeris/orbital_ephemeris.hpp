/**
 * @file orbital_ephemeris.hpp
 * @brief Built-in ephemeris backed by the orbital model.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_EPHEMERIS_ORBITAL_EPHEMERIS_HPP
#define ASTROLABE_EPHEMERIS_ORBITAL_EPHEMERIS_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "orbital_model.hpp"
#include "provider.hpp"

namespace astrolabe::ephemeris {

/**
 * @class OrbitalEphemeris
 * @brief IEphemerisProvider over OrbitalModel.
 *
 * Covers Sun, Moon, Mercury through Pluto and the mean lunar node.
 * Heliocentric requests are answered for the planets only.
 */
class OrbitalEphemeris final : public IEphemerisProvider {
public:
    explicit OrbitalEphemeris(KeplerOptions options = {},
                              std::shared_ptr<spdlog::logger> logger = nullptr);

    [[nodiscard]] auto position(Body body, double jd,
                                const CalculationFlags& flags) const
        -> error::Result<astronomy::EclipticCoordinates> override;

    [[nodiscard]] bool supports(Body body) const noexcept override;

    [[nodiscard]] std::string_view name() const noexcept override {
        return "orbital";
    }

    [[nodiscard]] const OrbitalModel& model() const noexcept { return model_; }

private:
    OrbitalModel model_;
};

}  // namespace astrolabe::ephemeris

#endif  // ASTROLABE_EPHEMERIS_ORBITAL_EPHEMERIS_HPP
