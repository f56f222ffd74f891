/**
 * @file julian.cpp
 * @brief Julian Date calculations implementation.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "julian.hpp"

#include <cmath>

namespace astrolabe::calculation {

using error::ErrorCode;
using error::makeError;

auto validateDateTime(const DateTime& dt) -> error::Result<void> {
    if (dt.month < 1 || dt.month > 12) {
        return makeError(ErrorCode::InvalidInput, "month {} out of range 1-12",
                         dt.month);
    }
    int maxDay = daysInMonth(dt.year, dt.month);
    if (dt.day < 1 || dt.day > maxDay) {
        return makeError(ErrorCode::InvalidInput,
                         "day {} out of range 1-{} for {:04}-{:02}", dt.day,
                         maxDay, dt.year, dt.month);
    }
    if (dt.hour < 0 || dt.hour > 23) {
        return makeError(ErrorCode::InvalidInput, "hour {} out of range 0-23",
                         dt.hour);
    }
    if (dt.minute < 0 || dt.minute > 59) {
        return makeError(ErrorCode::InvalidInput,
                         "minute {} out of range 0-59", dt.minute);
    }
    if (!(dt.second >= 0.0 && dt.second < 60.0)) {
        return makeError(ErrorCode::InvalidInput,
                         "second {} out of range [0, 60)", dt.second);
    }
    return {};
}

auto validateTimezone(double tzOffsetHours) -> error::Result<void> {
    if (!(std::abs(tzOffsetHours) <= MAX_TIMEZONE_OFFSET)) {
        return makeError(ErrorCode::InvalidInput,
                         "timezone offset {} outside [-14, 14] hours",
                         tzOffsetHours);
    }
    return {};
}

auto julianDateChecked(const DateTime& dt, double tzOffsetHours)
    -> error::Result<double> {
    if (auto valid = validateDateTime(dt); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = validateTimezone(tzOffsetHours); !valid) {
        return std::unexpected(valid.error());
    }
    return calculateJulianDate(dt, tzOffsetHours);
}

DateTime julianDateToDateTime(double jd) {
    double shifted = jd + 0.5;
    double z = std::floor(shifted);
    // Round to the millisecond so 12:00 does not come back as 11:59:59.999
    double seconds =
        std::round((shifted - z) * SECONDS_IN_DAY * 1000.0) / 1000.0;
    if (seconds >= SECONDS_IN_DAY) {
        z += 1.0;
        seconds -= SECONDS_IN_DAY;
    }

    double a = z;
    if (z >= 2299161.0) {
        double alpha = std::floor((z - 1867216.25) / 36524.25);
        a = z + 1 + alpha - std::floor(alpha / 4);
    }
    double b = a + 1524;
    double c = std::floor((b - 122.1) / 365.25);
    double d = std::floor(365.25 * c);
    double e = std::floor((b - d) / 30.6001);

    int day = static_cast<int>(b - d - std::floor(30.6001 * e));
    int month = static_cast<int>(e < 14 ? e - 1 : e - 13);
    int year = static_cast<int>(month > 2 ? c - 4716 : c - 4715);

    int hour = static_cast<int>(seconds / SECONDS_IN_HOUR);
    seconds -= hour * SECONDS_IN_HOUR;
    int minute = static_cast<int>(seconds / MINUTES_IN_HOUR);
    seconds -= minute * MINUTES_IN_HOUR;

    return {year, month, day, hour, minute, seconds};
}

}  // namespace astrolabe::calculation
