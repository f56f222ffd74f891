/**
 * @file error.cpp
 * @brief Error kind names.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "error.hpp"

namespace astrolabe::error {

auto errorCodeToString(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::CalculationError:
            return "CalculationError";
        case ErrorCode::ConvergenceError:
            return "ConvergenceError";
        case ErrorCode::InvalidBody:
            return "InvalidBody";
        case ErrorCode::HouseSystemError:
            return "HouseSystemError";
        case ErrorCode::CoordinateError:
            return "CoordinateError";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::EphemerisUnavailable:
            return "EphemerisUnavailable";
    }
    return "Unknown";
}

auto Error::toString() const -> std::string {
    return std::format("{}: {}", errorCodeToString(code), message);
}

}  // namespace astrolabe::error
