/**
 * @file test_house_calculator.cpp
 * @brief Tests for house cusps, angles and house assignment.
 */

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <vector>

#include "astronomy/constants.hpp"
#include "calculation/sidereal.hpp"
#include "houses/angles.hpp"
#include "houses/house_calculator.hpp"

using namespace astrolabe::houses;
using astrolabe::astronomy::angularSeparation;
using astrolabe::astronomy::normalizeAngle360;
using astrolabe::ephemeris::Body;
using astrolabe::ephemeris::BodyPosition;
using astrolabe::error::ErrorCode;

namespace {

constexpr double EPS = 23.43929111;

/// Each cusp follows the previous one by less than half a circle
bool isOrdered(const CuspArray& cusps) {
    for (std::size_t i = 0; i < cusps.size(); ++i) {
        double step = normalizeAngle360(cusps[(i + 1) % 12] - cusps[i]);
        if (!(step > 0.0 && step < 180.0)) {
            return false;
        }
    }
    return true;
}

/// Stand-in for a system without a built-in algorithm
class FixedHouses final : public IHouseAlgorithm {
public:
    HouseSystem system() const noexcept override {
        return HouseSystem::Topocentric;
    }
    auto compute(const HouseContext& ctx) const
        -> astrolabe::error::Result<CuspArray> override {
        CuspArray cusps{};
        for (int i = 0; i < 12; ++i) {
            cusps[i] = normalizeAngle360(ctx.angles.ascendant + 30.0 * i);
        }
        return cusps;
    }
};

}  // namespace

class HouseCalculatorTest : public ::testing::Test {
protected:
    HouseCalculator calculator_;
};

// ============================================================================
// Angles
// ============================================================================

TEST_F(HouseCalculatorTest, AnglesAtEquatorAndEquinox) {
    auto angles = calculateAngles(0.0, EPS, 0.0);
    EXPECT_NEAR(angles.midheaven, 0.0, 1e-10);
    EXPECT_NEAR(angles.ascendant, 90.0, 1e-10);
    EXPECT_NEAR(angles.descendant, 270.0, 1e-10);
    EXPECT_NEAR(angles.imumCoeli, 180.0, 1e-10);
}

TEST_F(HouseCalculatorTest, AnglesAtMidLatitude) {
    auto angles = calculateAngles(30.0, EPS, 40.0);
    EXPECT_NEAR(angles.midheaven, 32.1812592, 1e-6);
    EXPECT_NEAR(angles.ascendant, 132.4622026, 1e-6);
}

TEST_F(HouseCalculatorTest, AscendantAlwaysEastOfMidheaven) {
    for (double lat = -65.0; lat <= 65.0; lat += 13.0) {
        for (double ramc = 0.0; ramc < 360.0; ramc += 20.0) {
            auto angles = calculateAngles(ramc, EPS, lat);
            double arc = normalizeAngle360(angles.ascendant - angles.midheaven);
            EXPECT_GT(arc, 0.0) << ramc << "," << lat;
            EXPECT_LT(arc, 180.0) << ramc << "," << lat;
        }
    }
}

TEST_F(HouseCalculatorTest, RaToLongitude) {
    EXPECT_NEAR(raToLongitude(0.0, EPS), 0.0, 1e-10);
    EXPECT_NEAR(raToLongitude(90.0, EPS), 90.0, 1e-10);
    EXPECT_NEAR(raToLongitude(180.0, EPS), 180.0, 1e-10);
}

// ============================================================================
// Registry
// ============================================================================

TEST_F(HouseCalculatorTest, BuiltinSystems) {
    EXPECT_EQ(calculator_.supportedSystems().size(), 12u);
    EXPECT_TRUE(calculator_.isSupported(HouseSystem::Placidus));
    EXPECT_TRUE(calculator_.isSupported(HouseSystem::Morinus));
    EXPECT_FALSE(calculator_.isSupported(HouseSystem::Krusinski));
    EXPECT_FALSE(calculator_.isSupported(HouseSystem::Topocentric));
    EXPECT_FALSE(calculator_.isSupported(HouseSystem::Vedic));
}

TEST_F(HouseCalculatorTest, UnregisteredSystemIsError) {
    for (HouseSystem system : {HouseSystem::Krusinski,
                               HouseSystem::Topocentric, HouseSystem::Vedic}) {
        auto cusps = calculator_.calculateFromRamc(30.0, EPS, 40.0, system);
        ASSERT_FALSE(cusps.has_value()) << houseSystemName(system);
        EXPECT_EQ(cusps.error().code, ErrorCode::HouseSystemError);
    }
}

TEST_F(HouseCalculatorTest, RegisterAdditionalAlgorithm) {
    calculator_.registerAlgorithm(std::make_unique<FixedHouses>());
    EXPECT_TRUE(calculator_.isSupported(HouseSystem::Topocentric));
    EXPECT_EQ(calculator_.supportedSystems().size(), 13u);

    auto cusps =
        calculator_.calculateFromRamc(30.0, EPS, 40.0, HouseSystem::Topocentric);
    ASSERT_TRUE(cusps.has_value());
    EXPECT_EQ(cusps->system, HouseSystem::Topocentric);
    EXPECT_NEAR(cusps->cusp(1), cusps->angles.ascendant, 1e-12);
}

TEST_F(HouseCalculatorTest, NullAlgorithmIsIgnored) {
    calculator_.registerAlgorithm(nullptr);
    EXPECT_EQ(calculator_.supportedSystems().size(), 12u);
}

// ============================================================================
// Cusp geometry
// ============================================================================

TEST_F(HouseCalculatorTest, AllSystemsProduceOrderedCusps) {
    for (HouseSystem system : calculator_.supportedSystems()) {
        for (double lat = -65.0; lat <= 65.0; lat += 5.0) {
            for (double ramc = 0.0; ramc < 360.0; ramc += 15.0) {
                auto result =
                    calculator_.calculateFromRamc(ramc, EPS, lat, system);
                ASSERT_TRUE(result.has_value())
                    << houseSystemName(system) << " " << ramc << "," << lat;
                for (double cusp : result->cusps) {
                    EXPECT_GE(cusp, 0.0);
                    EXPECT_LT(cusp, 360.0);
                }
                EXPECT_TRUE(isOrdered(result->cusps))
                    << houseSystemName(system) << " " << ramc << "," << lat;
            }
        }
    }
}

TEST_F(HouseCalculatorTest, OppositeCuspsDifferBy180) {
    for (HouseSystem system : calculator_.supportedSystems()) {
        auto result = calculator_.calculateFromRamc(75.0, EPS, 51.5, system);
        ASSERT_TRUE(result.has_value()) << houseSystemName(system);
        for (int house = 1; house <= 6; ++house) {
            EXPECT_NEAR(angularSeparation(result->cusp(house),
                                          result->cusp(house + 6)),
                        180.0, 1e-9)
                << houseSystemName(system) << " house " << house;
        }
    }
}

TEST_F(HouseCalculatorTest, QuadrantSystemsAnchorOnAngles) {
    for (HouseSystem system :
         {HouseSystem::Placidus, HouseSystem::Koch, HouseSystem::Porphyry,
          HouseSystem::Regiomontanus, HouseSystem::Campanus,
          HouseSystem::Alcabitius}) {
        auto result = calculator_.calculateFromRamc(200.0, EPS, -33.9, system);
        ASSERT_TRUE(result.has_value()) << houseSystemName(system);
        EXPECT_NEAR(result->cusp(1), result->angles.ascendant, 1e-10);
        EXPECT_NEAR(result->cusp(10), result->angles.midheaven, 1e-10);
    }
}

TEST_F(HouseCalculatorTest, KochReferenceCusps) {
    auto result = calculator_.calculateFromRamc(30.0, EPS, 40.0,
                                                HouseSystem::Koch);
    ASSERT_TRUE(result.has_value());
    const double expected[12] = {132.4622, 158.8700, 185.5828, 212.1813,
                                 254.7206, 285.5565, 312.4622, 338.8700,
                                 5.5828,   32.1813,  74.7206,  105.5565};
    for (int i = 0; i < 12; ++i) {
        EXPECT_NEAR(angularSeparation(result->cusps[i], expected[i]), 0.0,
                    1e-3)
            << "house " << i + 1;
    }
}

TEST_F(HouseCalculatorTest, PlacidusReferenceCusps) {
    auto result = calculator_.calculateFromRamc(30.0, EPS, 40.0,
                                                HouseSystem::Placidus);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->cusp(11), 68.2476, 1e-3);
    EXPECT_NEAR(result->cusp(12), 102.6933, 1e-3);
    EXPECT_NEAR(result->cusp(2), 153.8315, 1e-3);
    EXPECT_NEAR(angularSeparation(result->cusp(3), 180.0), 0.0, 1e-3);
}

TEST_F(HouseCalculatorTest, RegiomontanusReferenceCusps) {
    auto result = calculator_.calculateFromRamc(30.0, EPS, 40.0,
                                                HouseSystem::Regiomontanus);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->cusp(11), 71.3760, 1e-3);
    EXPECT_NEAR(result->cusp(12), 106.1223, 1e-3);
    EXPECT_NEAR(result->cusp(2), 155.2306, 1e-3);
}

TEST_F(HouseCalculatorTest, EqualHousesStepFromAscendant) {
    auto result =
        calculator_.calculateFromRamc(30.0, EPS, 40.0, HouseSystem::Equal);
    ASSERT_TRUE(result.has_value());
    for (int house = 1; house <= 12; ++house) {
        EXPECT_NEAR(result->cusp(house),
                    normalizeAngle360(result->angles.ascendant +
                                      30.0 * (house - 1)),
                    1e-10);
    }
}

TEST_F(HouseCalculatorTest, EqualMCPutsMidheavenOnTenth) {
    auto result =
        calculator_.calculateFromRamc(30.0, EPS, 40.0, HouseSystem::EqualMC);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(angularSeparation(result->cusp(10), result->angles.midheaven),
                0.0, 1e-10);
}

TEST_F(HouseCalculatorTest, WholeSignStartsOnSignBoundary) {
    auto result =
        calculator_.calculateFromRamc(30.0, EPS, 40.0, HouseSystem::WholeSign);
    ASSERT_TRUE(result.has_value());
    // Ascendant 132.46 lies in Leo
    EXPECT_NEAR(result->cusp(1), 120.0, 1e-10);
    for (double cusp : result->cusps) {
        EXPECT_NEAR(std::fmod(cusp, 30.0), 0.0, 1e-10);
    }
}

TEST_F(HouseCalculatorTest, VehlowCentersAscendantInFirstHouse) {
    auto result =
        calculator_.calculateFromRamc(30.0, EPS, 40.0, HouseSystem::Vehlow);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->cusp(1), result->angles.ascendant - 15.0, 1e-10);
}

TEST_F(HouseCalculatorTest, MeridianAndMorinusIgnoreLatitude) {
    for (HouseSystem system : {HouseSystem::Meridian, HouseSystem::Morinus}) {
        auto low = calculator_.calculateFromRamc(30.0, EPS, 0.0, system);
        auto high = calculator_.calculateFromRamc(30.0, EPS, 60.0, system);
        ASSERT_TRUE(low.has_value());
        ASSERT_TRUE(high.has_value());
        for (int i = 0; i < 12; ++i) {
            EXPECT_NEAR(low->cusps[i], high->cusps[i], 1e-10);
        }
    }
    auto meridian =
        calculator_.calculateFromRamc(30.0, EPS, 40.0, HouseSystem::Meridian);
    ASSERT_TRUE(meridian.has_value());
    EXPECT_NEAR(meridian->cusp(10), meridian->angles.midheaven, 1e-10);
}

// ============================================================================
// Polar and invalid input
// ============================================================================

TEST_F(HouseCalculatorTest, TimeBasedSystemsFailInsidePolarCircle) {
    for (HouseSystem system : {HouseSystem::Placidus, HouseSystem::Koch}) {
        for (double lat : {70.0, -70.0, 89.0}) {
            auto result = calculator_.calculateFromRamc(30.0, EPS, lat, system);
            ASSERT_FALSE(result.has_value())
                << houseSystemName(system) << " " << lat;
            EXPECT_EQ(result.error().code, ErrorCode::HouseSystemError);
        }
    }
}

TEST_F(HouseCalculatorTest, SpaceBasedSystemsWorkInsidePolarCircle) {
    for (HouseSystem system :
         {HouseSystem::Porphyry, HouseSystem::Equal, HouseSystem::WholeSign,
          HouseSystem::Regiomontanus, HouseSystem::Campanus,
          HouseSystem::Meridian, HouseSystem::Morinus}) {
        auto result = calculator_.calculateFromRamc(30.0, EPS, 70.0, system);
        ASSERT_TRUE(result.has_value()) << houseSystemName(system);
        for (double cusp : result->cusps) {
            EXPECT_GE(cusp, 0.0);
            EXPECT_LT(cusp, 360.0);
        }
    }
}

TEST_F(HouseCalculatorTest, InvalidLocation) {
    auto north = calculator_.calculate(2451545.0, 91.0, 0.0, HouseSystem::Equal);
    ASSERT_FALSE(north.has_value());
    EXPECT_EQ(north.error().code, ErrorCode::InvalidInput);

    auto east = calculator_.calculate(2451545.0, 10.0, 181.0, HouseSystem::Equal);
    ASSERT_FALSE(east.has_value());
    EXPECT_EQ(east.error().code, ErrorCode::InvalidInput);

    auto date =
        calculator_.calculate(std::nan(""), 10.0, 10.0, HouseSystem::Equal);
    ASSERT_FALSE(date.has_value());
    EXPECT_EQ(date.error().code, ErrorCode::InvalidInput);
}

TEST_F(HouseCalculatorTest, CalculateUsesLocalSiderealTime) {
    const double jd = 2443440.7055556;
    auto result = calculator_.calculate(jd, 14.65, 121.05, HouseSystem::Placidus);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->ramc,
                astrolabe::calculation::calculateLST(jd, 121.05), 1e-10);
    EXPECT_EQ(result->system, HouseSystem::Placidus);
}

TEST_F(HouseCalculatorTest, CalculateByToken) {
    auto byToken = calculator_.calculate(2451545.0, 51.5, 0.0, "koch");
    auto byEnum = calculator_.calculate(2451545.0, 51.5, 0.0, HouseSystem::Koch);
    ASSERT_TRUE(byToken.has_value());
    ASSERT_TRUE(byEnum.has_value());
    EXPECT_EQ(byToken->cusps, byEnum->cusps);

    auto unknown = calculator_.calculate(2451545.0, 51.5, 0.0, "nonsense");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::HouseSystemError);
}

TEST_F(HouseCalculatorTest, CuspsJson) {
    auto result =
        calculator_.calculateFromRamc(30.0, EPS, 40.0, HouseSystem::Equal);
    ASSERT_TRUE(result.has_value());
    auto j = result->toJson();
    EXPECT_EQ(j["system"], "Equal");
    ASSERT_EQ(j["houses"].size(), 12u);
    EXPECT_EQ(j["houses"][0]["number"], 1);
    EXPECT_TRUE(j["angles"].contains("imum_coeli"));
}

// ============================================================================
// House assignment
// ============================================================================

TEST_F(HouseCalculatorTest, FindHouseRegularCusps) {
    CuspArray cusps{};
    for (int i = 0; i < 12; ++i) {
        cusps[i] = 30.0 * i;
    }
    EXPECT_EQ(findHouse(15.0, cusps), 1);
    EXPECT_EQ(findHouse(30.0, cusps), 2);
    EXPECT_EQ(findHouse(345.0, cusps), 12);
    EXPECT_EQ(findHouse(0.0, cusps), 1);
    EXPECT_EQ(findHouse(359.99, cusps), 12);
    EXPECT_EQ(findHouse(360.0, cusps), 1);
    EXPECT_EQ(findHouse(-15.0, cusps), 12);
}

TEST_F(HouseCalculatorTest, FindHouseFirstCuspBeforeAries) {
    const CuspArray cusps{350.0, 20.0,  50.0,  80.0,  110.0, 140.0,
                          170.0, 200.0, 230.0, 260.0, 290.0, 320.0};
    EXPECT_EQ(findHouse(10.0, cusps), 1);
    EXPECT_EQ(findHouse(20.0, cusps), 2);
    // Between the first cusp and 0 Aries is still the first house
    EXPECT_EQ(findHouse(355.0, cusps), 1);
    EXPECT_EQ(findHouse(349.0, cusps), 12);
    EXPECT_EQ(findHouse(325.0, cusps), 12);
}

TEST_F(HouseCalculatorTest, FindHouseCoincidentCusps) {
    CuspArray cusps{};
    cusps.fill(100.0);
    int house = findHouse(150.0, cusps);
    EXPECT_GE(house, 1);
    EXPECT_LE(house, 12);
}

TEST_F(HouseCalculatorTest, FindHouseMatchesCuspOrder) {
    auto result =
        calculator_.calculateFromRamc(250.0, EPS, 48.0, HouseSystem::Placidus);
    ASSERT_TRUE(result.has_value());
    for (int house = 1; house <= 12; ++house) {
        double start = result->cusp(house);
        double width =
            normalizeAngle360(result->cusp(house % 12 + 1) - start);
        EXPECT_EQ(findHouse(start + width / 2.0, result->cusps), house);
        EXPECT_EQ(findHouse(start, result->cusps), house);
    }
}

TEST_F(HouseCalculatorTest, AssignHouses) {
    CuspArray cusps{};
    for (int i = 0; i < 12; ++i) {
        cusps[i] = 30.0 * i;
    }
    std::vector<BodyPosition> bodies(3);
    bodies[0].body = Body::Sun;
    bodies[0].longitude = 215.0;
    bodies[1].body = Body::Moon;
    bodies[1].longitude = 343.03;
    bodies[2].body = Body::Mars;
    bodies[2].longitude = 0.0;

    assignHouses(bodies, cusps);
    EXPECT_EQ(bodies[0].house, 8);
    EXPECT_EQ(bodies[1].house, 12);
    EXPECT_EQ(bodies[2].house, 1);
}

TEST_F(HouseCalculatorTest, AssignHousesJustBeforeCusp) {
    CuspArray cusps{};
    for (int i = 0; i < 12; ++i) {
        cusps[i] = 30.0 * i;
    }
    std::vector<BodyPosition> bodies(2);
    bodies[0].body = Body::Sun;
    bodies[0].longitude = 209.78;
    bodies[1].body = Body::Moon;
    bodies[1].longitude = 210.0;

    assignHouses(bodies, cusps);
    EXPECT_EQ(bodies[0].house, 7);
    EXPECT_EQ(bodies[1].house, 8);
}
