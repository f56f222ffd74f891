/**
 * @file test_sidereal.cpp
 * @brief Tests for sidereal time and obliquity.
 */

#include <gtest/gtest.h>

#include "calculation/julian.hpp"
#include "calculation/sidereal.hpp"

using namespace astrolabe::calculation;

class SiderealTest : public ::testing::Test {};

TEST_F(SiderealTest, GmstAtJ2000) {
    EXPECT_NEAR(calculateGMST(JD_J2000), 280.46061837, 1e-8);
}

TEST_F(SiderealTest, GmstAdvancesPerSolarDay) {
    // One solar day is slightly longer than a sidereal rotation
    double advance =
        normalizeAngle360(calculateGMST(JD_J2000 + 1.0) - calculateGMST(JD_J2000));
    EXPECT_NEAR(advance, 0.98564736629, 1e-6);
}

TEST_F(SiderealTest, GmstInRange) {
    for (double jd = 2415020.5; jd < 2488070.5; jd += 3333.3) {
        double gmst = calculateGMST(jd);
        EXPECT_GE(gmst, 0.0);
        EXPECT_LT(gmst, 360.0);
    }
}

TEST_F(SiderealTest, LocalSiderealTimeAddsLongitude) {
    double gmst = calculateGMST(2460389.5);
    EXPECT_NEAR(calculateLST(2460389.5, 0.0), gmst, 1e-10);
    EXPECT_NEAR(calculateLST(2460389.5, 90.0), normalizeAngle360(gmst + 90.0),
                1e-10);
    EXPECT_NEAR(calculateLST(2460389.5, -75.0),
                normalizeAngle360(gmst - 75.0), 1e-10);
    EXPECT_NEAR(calculateLSTHours(2460389.5, 0.0), gmst / 15.0, 1e-10);
}

TEST_F(SiderealTest, ObliquityAtJ2000) {
    EXPECT_NEAR(calculateObliquity(0.0), 23.43929111, 1e-10);
    EXPECT_NEAR(calculateObliquityJD(JD_J2000), 23.43929111, 1e-10);
}

TEST_F(SiderealTest, ObliquityDecreasesThisEra) {
    EXPECT_LT(calculateObliquity(0.5), calculateObliquity(0.0));
    EXPECT_GT(calculateObliquity(-0.5), calculateObliquity(0.0));
    EXPECT_NEAR(calculateObliquity(1.0), 23.43929111 - 0.013004167, 1e-6);
}

TEST_F(SiderealTest, HourAngle) {
    EXPECT_NEAR(calculateHourAngleDeg(100.0, 70.0), 30.0, 1e-10);
    EXPECT_NEAR(calculateHourAngleDeg(10.0, 350.0), 20.0, 1e-10);
}
