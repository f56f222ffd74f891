/**
 * @file test_ayanamsa.cpp
 * @brief Tests for sidereal zodiac offsets.
 */

#include <gtest/gtest.h>

#include "chart/ayanamsa.hpp"

using namespace astrolabe::chart;
using astrolabe::error::ErrorCode;

TEST(AyanamsaTest, ParseNames) {
    EXPECT_EQ(parseAyanamsa("tropical"), Ayanamsa::Tropical);
    EXPECT_EQ(parseAyanamsa(""), Ayanamsa::Tropical);
    EXPECT_EQ(parseAyanamsa("Lahiri"), Ayanamsa::Lahiri);
    EXPECT_EQ(parseAyanamsa("fagan_bradley"), Ayanamsa::FaganBradley);
    EXPECT_EQ(parseAyanamsa("Fagan-Bradley"), Ayanamsa::FaganBradley);
    EXPECT_EQ(parseAyanamsa("FAGAN BRADLEY"), Ayanamsa::FaganBradley);
}

TEST(AyanamsaTest, UnknownName) {
    auto result = parseAyanamsa("raman");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST(AyanamsaTest, NamesRoundTrip) {
    for (Ayanamsa a :
         {Ayanamsa::Tropical, Ayanamsa::Lahiri, Ayanamsa::FaganBradley}) {
        EXPECT_EQ(parseAyanamsa(ayanamsaName(a)), a);
    }
    EXPECT_EQ(ayanamsaName(Ayanamsa::Lahiri), "lahiri");
}

TEST(AyanamsaTest, Degrees) {
    EXPECT_DOUBLE_EQ(ayanamsaDegrees(Ayanamsa::Tropical, 0.5), 0.0);
    EXPECT_DOUBLE_EQ(ayanamsaDegrees(Ayanamsa::Lahiri, 0.0), LAHIRI_J2000);
    EXPECT_DOUBLE_EQ(ayanamsaDegrees(Ayanamsa::FaganBradley, 0.0),
                     FAGAN_BRADLEY_J2000);
    EXPECT_NEAR(ayanamsaDegrees(Ayanamsa::Lahiri, 1.0), 25.254063, 1e-9);
    // Roughly 50.3 arc seconds per year
    EXPECT_NEAR((ayanamsaDegrees(Ayanamsa::Lahiri, 0.01) -
                 ayanamsaDegrees(Ayanamsa::Lahiri, 0.0)) *
                    3600.0,
                50.29, 0.01);
}
