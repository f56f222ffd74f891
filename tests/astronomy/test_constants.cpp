/**
 * @file test_constants.cpp
 * @brief Tests for angle constants and normalization helpers.
 */

#include <gtest/gtest.h>

#include <cmath>

#include "astronomy/constants.hpp"
#include "astronomy/coordinates.hpp"

using namespace astrolabe::astronomy;

class AstronomyConstantsTest : public ::testing::Test {};

TEST_F(AstronomyConstantsTest, MathematicalConstants) {
    EXPECT_DOUBLE_EQ(K_PI, std::numbers::pi);
    EXPECT_DOUBLE_EQ(K_TWO_PI, 2.0 * std::numbers::pi);
    EXPECT_DOUBLE_EQ(K_HALF_PI, std::numbers::pi / 2.0);
}

TEST_F(AstronomyConstantsTest, EpochConstants) {
    EXPECT_DOUBLE_EQ(JD_J2000, 2451545.0);
    EXPECT_DOUBLE_EQ(JULIAN_CENTURY, 36525.0);
    EXPECT_DOUBLE_EQ(OBLIQUITY_J2000, 23.43929111);
}

TEST_F(AstronomyConstantsTest, ToRadians) {
    EXPECT_NEAR(toRadians(0.0), 0.0, 1e-10);
    EXPECT_NEAR(toRadians(90.0), K_HALF_PI, 1e-10);
    EXPECT_NEAR(toRadians(180.0), K_PI, 1e-10);
    EXPECT_NEAR(toRadians(360.0), K_TWO_PI, 1e-10);
}

TEST_F(AstronomyConstantsTest, DegreesRadiansAreInverse) {
    for (int deg = 0; deg <= 360; deg += 15) {
        double value = static_cast<double>(deg);
        EXPECT_NEAR(toDegrees(toRadians(value)), value, 1e-10) << deg;
    }
}

// ============================================================================
// Normalization
// ============================================================================

TEST_F(AstronomyConstantsTest, NormalizeAngle360) {
    EXPECT_NEAR(normalizeAngle360(0.0), 0.0, 1e-10);
    EXPECT_NEAR(normalizeAngle360(360.0), 0.0, 1e-10);
    EXPECT_NEAR(normalizeAngle360(720.0), 0.0, 1e-10);
    EXPECT_NEAR(normalizeAngle360(540.0), 180.0, 1e-10);
    EXPECT_NEAR(normalizeAngle360(-90.0), 270.0, 1e-10);
    EXPECT_NEAR(normalizeAngle360(-360.0), 0.0, 1e-10);
    EXPECT_NEAR(normalizeAngle360(-720.0), 0.0, 1e-10);
}

TEST_F(AstronomyConstantsTest, NormalizeAngle360StaysInRange) {
    for (double angle = -1000.0; angle <= 1000.0; angle += 7.3) {
        double n = normalizeAngle360(angle);
        EXPECT_GE(n, 0.0) << angle;
        EXPECT_LT(n, 360.0) << angle;
        EXPECT_NEAR(std::remainder(n - angle, 360.0), 0.0, 1e-9) << angle;
    }
}

TEST_F(AstronomyConstantsTest, NormalizeAngle360TinyNegative) {
    // fmod(-1e-17, 360) + 360 rounds to exactly 360
    EXPECT_LT(normalizeAngle360(-1e-17), 360.0);
}

TEST_F(AstronomyConstantsTest, NormalizeAngle180) {
    EXPECT_NEAR(normalizeAngle180(0.0), 0.0, 1e-10);
    EXPECT_NEAR(normalizeAngle180(270.0), -90.0, 1e-10);
    EXPECT_NEAR(normalizeAngle180(-270.0), 90.0, 1e-10);
    EXPECT_NEAR(normalizeAngle180(179.0), 179.0, 1e-10);
    EXPECT_NEAR(normalizeAngle180(180.0), -180.0, 1e-10);
}

TEST_F(AstronomyConstantsTest, NormalizeRadians) {
    EXPECT_NEAR(normalizeRadians(K_TWO_PI), 0.0, 1e-10);
    EXPECT_NEAR(normalizeRadians(-K_HALF_PI), 1.5 * K_PI, 1e-10);
}

TEST_F(AstronomyConstantsTest, AngularSeparation) {
    EXPECT_NEAR(angularSeparation(10.0, 350.0), 20.0, 1e-10);
    EXPECT_NEAR(angularSeparation(350.0, 10.0), 20.0, 1e-10);
    EXPECT_NEAR(angularSeparation(0.0, 180.0), 180.0, 1e-10);
    EXPECT_NEAR(angularSeparation(90.0, 90.0), 0.0, 1e-10);
}

// ============================================================================
// Coordinate records
// ============================================================================

TEST_F(AstronomyConstantsTest, EclipticValidity) {
    EXPECT_TRUE(EclipticCoordinates(0.0, 0.0).isValid());
    EXPECT_TRUE(EclipticCoordinates(359.9, -90.0).isValid());
    EXPECT_FALSE(EclipticCoordinates(360.0, 0.0).isValid());
    EXPECT_FALSE(EclipticCoordinates(10.0, 91.0).isValid());
}

TEST_F(AstronomyConstantsTest, ObserverLocationValidity) {
    EXPECT_TRUE(ObserverLocation(14.65, 121.05).isValid());
    EXPECT_TRUE(ObserverLocation(-90.0, -180.0).isValid());
    EXPECT_FALSE(ObserverLocation(91.0, 0.0).isValid());
    EXPECT_FALSE(ObserverLocation(0.0, 181.0).isValid());
}

TEST_F(AstronomyConstantsTest, CartesianMagnitude) {
    CartesianCoordinates v{3.0, 4.0, 12.0};
    EXPECT_DOUBLE_EQ(v.magnitude(), 13.0);
    auto d = v - CartesianCoordinates{1.0, 1.0, 1.0};
    EXPECT_DOUBLE_EQ(d.x, 2.0);
    EXPECT_DOUBLE_EQ(d.y, 3.0);
    EXPECT_DOUBLE_EQ(d.z, 11.0);
}

TEST_F(AstronomyConstantsTest, CoordinateHelpers) {
    EXPECT_DOUBLE_EQ(EquatorialCoordinates(90.0, 10.0).raHours(), 6.0);
    HorizontalCoordinates up;
    up.altitude = 0.5;
    EXPECT_TRUE(up.isAboveHorizon());
    up.altitude = 0.0;
    EXPECT_FALSE(up.isAboveHorizon());
}
