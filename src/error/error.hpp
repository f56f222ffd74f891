/**
 * @file error.hpp
 * @brief Error kinds and result type returned by every fallible operation.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_ERROR_ERROR_HPP
#define ASTROLABE_ERROR_ERROR_HPP

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace astrolabe::error {

/**
 * @brief Failure kinds surfaced by the engine
 */
enum class ErrorCode {
    CalculationError,     ///< Numeric failure
    ConvergenceError,     ///< Iterative solver exhausted its iteration cap
    InvalidBody,          ///< Body has no model in the active provider
    HouseSystemError,     ///< House system unknown or not computable here
    CoordinateError,      ///< Invalid frame parameters
    InvalidInput,         ///< Malformed date, location or option
    EphemerisUnavailable  ///< External ephemeris could not answer
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] auto errorCodeToString(ErrorCode code) -> std::string_view;

/**
 * @brief Tagged failure carrying a human readable message
 */
struct Error {
    ErrorCode code{ErrorCode::CalculationError};
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] auto toString() const -> std::string;

    bool operator==(const Error& other) const = default;
};

/**
 * @brief Result type for engine operations
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Build an unexpected value with a formatted message.
 */
template <typename... Args>
[[nodiscard]] auto makeError(ErrorCode code,
                             std::format_string<Args...> fmt,
                             Args&&... args) -> std::unexpected<Error> {
    return std::unexpected<Error>(
        Error{code, std::format(fmt, std::forward<Args>(args)...)});
}

}  // namespace astrolabe::error

#endif  // ASTROLABE_ERROR_ERROR_HPP
