/**
 * @file test_error.cpp
 * @brief Tests for error kind names and formatted errors.
 */

#include <gtest/gtest.h>

#include "error/error.hpp"

#include <set>
#include <string>

using namespace astrolabe::error;

TEST(ErrorCodeTest, EveryKindHasItsOwnName) {
    std::set<std::string> names;
    for (auto code : {ErrorCode::CalculationError, ErrorCode::ConvergenceError,
                      ErrorCode::InvalidBody, ErrorCode::HouseSystemError,
                      ErrorCode::CoordinateError, ErrorCode::InvalidInput,
                      ErrorCode::EphemerisUnavailable}) {
        auto name = errorCodeToString(code);
        EXPECT_NE(name, "Unknown");
        names.emplace(name);
    }
    EXPECT_EQ(names.size(), 7u);
    EXPECT_EQ(errorCodeToString(ErrorCode::HouseSystemError),
              "HouseSystemError");
}

TEST(ErrorCodeTest, OutOfRangeValueIsUnknown) {
    EXPECT_EQ(errorCodeToString(static_cast<ErrorCode>(99)), "Unknown");
}

TEST(ErrorTest, MakeErrorFormatsMessage) {
    Result<int> result = makeError(ErrorCode::InvalidInput,
                                   "latitude {} out of range", 91.5);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
    EXPECT_EQ(result.error().message, "latitude 91.5 out of range");
    EXPECT_EQ(result.error().toString(),
              "InvalidInput: latitude 91.5 out of range");
}
