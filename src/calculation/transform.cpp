/**
 * @file transform.cpp
 * @brief Checked coordinate transformations.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "transform.hpp"

#include <cmath>

namespace astrolabe::calculation {

using error::ErrorCode;
using error::makeError;

auto toHorizontal(const EquatorialCoordinates& eq,
                  const ObserverLocation& location, double jd)
    -> error::Result<HorizontalCoordinates> {
    if (!location.isValid()) {
        return makeError(ErrorCode::CoordinateError,
                         "observer location ({}, {}) out of range",
                         location.latitude, location.longitude);
    }
    if (!std::isfinite(eq.rightAscension) || !std::isfinite(eq.declination) ||
        !std::isfinite(jd)) {
        return makeError(ErrorCode::CoordinateError,
                         "non-finite equatorial input");
    }
    if (std::abs(eq.declination) > 90.0) {
        return makeError(ErrorCode::CoordinateError,
                         "declination {} outside [-90, 90]", eq.declination);
    }
    double lst = calculateLST(jd, location.longitude);
    return equatorialToHorizontal(eq.rightAscension, eq.declination,
                                  location.latitude, lst);
}

}  // namespace astrolabe::calculation
