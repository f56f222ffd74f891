/**
 * @file julian.hpp
 * @brief Civil date/time to Julian Date conversion and input validation.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ASTROLABE_CALCULATION_JULIAN_HPP
#define ASTROLABE_CALCULATION_JULIAN_HPP

#include <chrono>
#include <cmath>
#include <concepts>
#include <ctime>

#include "astronomy/constants.hpp"
#include "error/error.hpp"

namespace astrolabe::calculation {

using namespace astrolabe::astronomy;

// ============================================================================
// DateTime Structure
// ============================================================================

/**
 * @struct DateTime
 * @brief Proleptic Gregorian civil date and time of day.
 */
struct DateTime {
    int year{2000};
    int month{1};
    int day{1};
    int hour{0};
    int minute{0};
    double second{0.0};

    DateTime() = default;

    DateTime(int y, int m, int d, int h = 0, int min = 0, double sec = 0.0)
        : year(y), month(m), day(d), hour(h), minute(min), second(sec) {}

    /**
     * @brief Create from system time point (UTC).
     */
    [[nodiscard]] static DateTime fromTimePoint(
        std::chrono::system_clock::time_point tp) {
        auto time_t_val = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_val{};
#ifdef _WIN32
        gmtime_s(&tm_val, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_val);
#endif
        return {tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                tm_val.tm_hour, tm_val.tm_min,
                static_cast<double>(tm_val.tm_sec)};
    }

    /**
     * @brief Fractional hour of the day.
     */
    [[nodiscard]] double fractionalHour() const noexcept {
        return hour + minute / MINUTES_IN_HOUR + second / SECONDS_IN_HOUR;
    }

    bool operator==(const DateTime& other) const = default;
};

// ============================================================================
// Calendar Helpers
// ============================================================================

/// Widest timezone offset accepted, in hours
inline constexpr double MAX_TIMEZONE_OFFSET = 14.0;

[[nodiscard]] constexpr bool isLeapYear(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

/**
 * @brief Number of days in a month of the proleptic Gregorian calendar.
 * @return Day count, or 0 when the month is out of range.
 */
[[nodiscard]] constexpr int daysInMonth(int year, int month) noexcept {
    constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

/**
 * @brief Validate calendar components.
 *
 * Accepts month 1-12, a day that exists in that month, hour 0-23,
 * minute 0-59 and second in [0, 60).
 */
[[nodiscard]] auto validateDateTime(const DateTime& dt) -> error::Result<void>;

/**
 * @brief Validate a timezone offset in hours, [-14, +14].
 */
[[nodiscard]] auto validateTimezone(double tzOffsetHours)
    -> error::Result<void>;

// ============================================================================
// Julian Date Calculations
// ============================================================================

/**
 * @brief Calculate Julian Date from a civil date/time and timezone offset.
 *
 * January and February are counted as months 13 and 14 of the previous
 * year. The offset (hours east of UTC) is subtracted from the time of day,
 * so local noon at UTC+2 is 10:00 UT.
 *
 * @tparam T Floating-point type.
 * @param dt Civil date and time, assumed valid.
 * @param tzOffsetHours Timezone offset in hours.
 * @return Julian Date.
 */
template <std::floating_point T = double>
[[nodiscard]] auto calculateJulianDate(const DateTime& dt,
                                       T tzOffsetHours = 0) -> T {
    int y = dt.year;
    int m = dt.month;
    if (m <= 2) {
        y -= 1;
        m += 12;
    }

    T a = std::floor(static_cast<T>(y) / 100);
    T b = 2 - a + std::floor(a / 4);

    T dayNumber = std::floor(static_cast<T>(365.25) * (y + 4716)) +
                  std::floor(static_cast<T>(30.6001) * (m + 1)) +
                  static_cast<T>(dt.day) + b - static_cast<T>(1524.5);

    T dayFraction =
        (static_cast<T>(dt.fractionalHour()) - tzOffsetHours) /
        static_cast<T>(HOURS_IN_DAY);

    return dayNumber + dayFraction;
}

/**
 * @brief Validate and convert in one step.
 * @return Julian Date, or InvalidInput when a component is out of range.
 */
[[nodiscard]] auto julianDateChecked(const DateTime& dt, double tzOffsetHours)
    -> error::Result<double>;

/**
 * @brief Convert a Julian Date back to a UTC civil date/time.
 */
[[nodiscard]] DateTime julianDateToDateTime(double jd);

/**
 * @brief Convert system time to Julian Date.
 * @param time System time point.
 * @return Julian Date.
 */
[[nodiscard]] inline double timeToJD(
    const std::chrono::system_clock::time_point& time) {
    auto duration = time.time_since_epoch();
    auto seconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(duration)
            .count();
    return JD_UNIX_EPOCH + seconds / SECONDS_IN_DAY;
}

/**
 * @brief Calculate centuries since J2000.0.
 * @param jd Julian Date.
 * @return Julian centuries since J2000.0.
 */
[[nodiscard]] constexpr double centuriesSinceJ2000(double jd) noexcept {
    return (jd - JD_J2000) / JULIAN_CENTURY;
}

/**
 * @brief Inverse of centuriesSinceJ2000.
 */
[[nodiscard]] constexpr double centuriesToJD(double t) noexcept {
    return JD_J2000 + t * JULIAN_CENTURY;
}

}  // namespace astrolabe::calculation

#endif  // ASTROLABE_CALCULATION_JULIAN_HPP
