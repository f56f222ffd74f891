/**
 * @file test_chart_calculator.cpp
 * @brief Tests for chart assembly, transits and synastry.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <map>

#include "astronomy/constants.hpp"
#include "chart/chart_calculator.hpp"
#include "config/sections/engine_config.hpp"
#include "ephemeris/orbital_ephemeris.hpp"

using namespace astrolabe::chart;
using astrolabe::astronomy::EclipticCoordinates;
using astrolabe::astronomy::angularSeparation;
using astrolabe::astronomy::normalizeAngle360;
using astrolabe::config::EngineConfig;
using astrolabe::ephemeris::Body;
using astrolabe::ephemeris::CalculationFlags;
using astrolabe::ephemeris::IEphemerisProvider;
using astrolabe::ephemeris::OrbitalEphemeris;
using astrolabe::error::ErrorCode;
using astrolabe::error::Result;
using astrolabe::houses::HouseSystem;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

using PositionResult = Result<EclipticCoordinates>;

class MockProvider : public IEphemerisProvider {
public:
    MOCK_METHOD(PositionResult, position,
                (Body body, double jd, const CalculationFlags& flags),
                (const, override));
    MOCK_METHOD(bool, supports, (Body body), (const, noexcept, override));
    MOCK_METHOD(std::string_view, name, (), (const, noexcept, override));
};

constexpr double EPOCH = 2451545.0;

/// Bodies move linearly from a per-body origin
struct LinearSky {
    std::map<Body, std::pair<double, double>> motion;  // origin, deg/day

    PositionResult operator()(Body body, double jd,
                              const CalculationFlags&) const {
        auto it = motion.find(body);
        if (it == motion.end()) {
            return astrolabe::error::makeError(ErrorCode::EphemerisUnavailable,
                                               "no data");
        }
        const auto [origin, rate] = it->second;
        return EclipticCoordinates{normalizeAngle360(origin + rate * (jd - EPOCH)),
                                   0.0, 1.0};
    }
};

ChartRequest manila1977() {
    ChartRequest request;
    request.dateTime = {1977, 10, 24, 4, 56, 0.0};
    request.latitude = 14.65;
    request.longitude = 121.05;
    return request;
}

}  // namespace

class ChartCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(mock_, name()).WillByDefault(Return("mock"));
        ON_CALL(mock_, supports(_)).WillByDefault(Return(true));
    }

    void useSky(const LinearSky& sky) {
        ON_CALL(mock_, position(_, _, _))
            .WillByDefault([sky](Body body, double jd,
                                 const CalculationFlags& flags) {
                return sky(body, jd, flags);
            });
    }

    OrbitalEphemeris ephemeris_;
    NiceMock<MockProvider> mock_;
};

// ============================================================================
// Natal charts
// ============================================================================

TEST_F(ChartCalculatorTest, NatalChart) {
    ChartCalculator calculator(ephemeris_);
    auto chart = calculator.calculate(manila1977());
    ASSERT_TRUE(chart.has_value()) << chart.error().toString();

    EXPECT_NEAR(chart->julianDate, 2443440.7055556, 1e-6);
    EXPECT_EQ(chart->houses.system, HouseSystem::Placidus);
    EXPECT_EQ(chart->ayanamsa, Ayanamsa::Tropical);
    EXPECT_DOUBLE_EQ(chart->ayanamsaDegrees, 0.0);
    ASSERT_EQ(chart->bodies.size(), 11u);
    EXPECT_EQ(chart->bodies.front().body, Body::Sun);
    EXPECT_EQ(chart->bodies.back().body, Body::MeanNode);

    for (const auto& body : chart->bodies) {
        ASSERT_TRUE(body.house.has_value());
        EXPECT_EQ(*body.house,
                  astrolabe::houses::findHouse(body.longitude,
                                               chart->houses.cusps));
        EXPECT_GE(body.longitude, 0.0);
        EXPECT_LT(body.longitude, 360.0);
    }

    const auto* sun = chart->find(Body::Sun);
    ASSERT_NE(sun, nullptr);
    EXPECT_NEAR(sun->longitude, 210.984, 1e-2);
    EXPECT_NEAR(sun->speed, 0.9956, 5e-3);
    EXPECT_EQ(chart->find(Body::Chiron), nullptr);

    const auto* node = chart->find(Body::MeanNode);
    ASSERT_NE(node, nullptr);
    EXPECT_TRUE(node->retrograde);
    for (const auto& aspect : chart->aspects) {
        EXPECT_NE(aspect.bodyA, Body::MeanNode);
        EXPECT_NE(aspect.bodyB, Body::MeanNode);
    }
}

TEST_F(ChartCalculatorTest, ParallelMatchesSequential) {
    ChartOptions parallel;
    parallel.parallel = true;
    ChartCalculator sequentialCalc(ephemeris_);
    ChartCalculator parallelCalc(ephemeris_, parallel);

    auto a = sequentialCalc.calculate(manila1977());
    auto b = parallelCalc.calculate(manila1977());
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(a->bodies.size(), b->bodies.size());
    for (std::size_t i = 0; i < a->bodies.size(); ++i) {
        EXPECT_EQ(a->bodies[i].body, b->bodies[i].body);
        EXPECT_DOUBLE_EQ(a->bodies[i].longitude, b->bodies[i].longitude);
        EXPECT_DOUBLE_EQ(a->bodies[i].speed, b->bodies[i].speed);
        EXPECT_EQ(a->bodies[i].house, b->bodies[i].house);
    }
    EXPECT_EQ(a->aspects.size(), b->aspects.size());
}

TEST_F(ChartCalculatorTest, RequestOverridesHouseSystem) {
    ChartCalculator calculator(ephemeris_);
    auto request = manila1977();
    request.houseSystem = "W";
    auto chart = calculator.calculate(request);
    ASSERT_TRUE(chart.has_value());
    EXPECT_EQ(chart->houses.system, HouseSystem::WholeSign);
    EXPECT_DOUBLE_EQ(std::fmod(chart->houses.cusp(1), 30.0), 0.0);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ChartCalculatorTest, InvalidDate) {
    ChartCalculator calculator(ephemeris_);
    auto request = manila1977();
    request.dateTime.month = 13;
    auto chart = calculator.calculate(request);
    ASSERT_FALSE(chart.has_value());
    EXPECT_EQ(chart.error().code, ErrorCode::InvalidInput);
}

TEST_F(ChartCalculatorTest, InvalidLocation) {
    ChartCalculator calculator(ephemeris_);
    auto request = manila1977();
    request.latitude = 91.0;
    auto chart = calculator.calculate(request);
    ASSERT_FALSE(chart.has_value());
    EXPECT_EQ(chart.error().code, ErrorCode::InvalidInput);
}

TEST_F(ChartCalculatorTest, UnknownHouseSystem) {
    ChartCalculator calculator(ephemeris_);
    auto request = manila1977();
    request.houseSystem = "Z";
    auto chart = calculator.calculate(request);
    ASSERT_FALSE(chart.has_value());
    EXPECT_EQ(chart.error().code, ErrorCode::HouseSystemError);
}

TEST_F(ChartCalculatorTest, UnknownAyanamsa) {
    ChartCalculator calculator(ephemeris_);
    auto request = manila1977();
    request.ayanamsa = "raman";
    auto chart = calculator.calculate(request);
    ASSERT_FALSE(chart.has_value());
    EXPECT_EQ(chart.error().code, ErrorCode::InvalidInput);
}

TEST_F(ChartCalculatorTest, PolarLatitude) {
    ChartCalculator calculator(ephemeris_);
    auto request = manila1977();
    request.latitude = 70.0;
    auto placidus = calculator.calculate(request);
    ASSERT_FALSE(placidus.has_value());
    EXPECT_EQ(placidus.error().code, ErrorCode::HouseSystemError);

    request.houseSystem = "W";
    auto wholeSign = calculator.calculate(request);
    EXPECT_TRUE(wholeSign.has_value());
}

// ============================================================================
// Sidereal zodiac
// ============================================================================

TEST_F(ChartCalculatorTest, LahiriShiftsEverything) {
    ChartCalculator calculator(ephemeris_);
    auto tropical = calculator.calculate(manila1977());
    auto request = manila1977();
    request.ayanamsa = "lahiri";
    auto sidereal = calculator.calculate(request);
    ASSERT_TRUE(tropical.has_value());
    ASSERT_TRUE(sidereal.has_value());

    const double offset = sidereal->ayanamsaDegrees;
    EXPECT_NEAR(offset, 23.54713, 1e-4);
    EXPECT_EQ(sidereal->ayanamsa, Ayanamsa::Lahiri);
    for (std::size_t i = 0; i < tropical->bodies.size(); ++i) {
        EXPECT_NEAR(normalizeAngle360(tropical->bodies[i].longitude - offset),
                    sidereal->bodies[i].longitude, 1e-9);
        EXPECT_EQ(tropical->bodies[i].house, sidereal->bodies[i].house);
    }
    for (int house = 1; house <= 12; ++house) {
        EXPECT_NEAR(angularSeparation(tropical->houses.cusp(house) - offset,
                                      sidereal->houses.cusp(house)),
                    0.0, 1e-9);
    }
    EXPECT_NEAR(angularSeparation(tropical->houses.angles.ascendant - offset,
                                  sidereal->houses.angles.ascendant),
                0.0, 1e-9);
    EXPECT_EQ(tropical->aspects.size(), sidereal->aspects.size());
}

// ============================================================================
// Provider interaction
// ============================================================================

TEST_F(ChartCalculatorTest, ThreeSamplesPerBody) {
    LinearSky sky;
    sky.motion = {{Body::Sun, {10.0, 1.0}}, {Body::Moon, {100.0, 13.0}}};
    useSky(sky);

    ChartOptions options;
    options.bodies = {Body::Sun, Body::Moon};
    ChartCalculator calculator(mock_, options);

    EXPECT_CALL(mock_, position(Body::Sun, _, _)).Times(3);
    EXPECT_CALL(mock_, position(Body::Moon, _, _)).Times(3);
    auto positions = calculator.calculatePositions(EPOCH);
    ASSERT_TRUE(positions.has_value());
    ASSERT_EQ(positions->size(), 2u);
    EXPECT_NEAR((*positions)[0].longitude, 10.0, 1e-12);
    EXPECT_NEAR((*positions)[0].speed, 1.0, 1e-8);
    EXPECT_NEAR((*positions)[1].speed, 13.0, 1e-8);
    EXPECT_FALSE((*positions)[1].house.has_value());
}

TEST_F(ChartCalculatorTest, ProviderErrorPropagates) {
    LinearSky sky;
    sky.motion = {{Body::Sun, {10.0, 1.0}}, {Body::Moon, {100.0, 13.0}}};
    useSky(sky);

    for (bool parallel : {false, true}) {
        ChartOptions options;
        options.bodies = {Body::Sun, Body::Chiron, Body::Moon};
        options.parallel = parallel;
        ChartCalculator calculator(mock_, options);

        auto chart = calculator.calculateAt(EPOCH, 0.0, 0.0,
                                            HouseSystem::Equal,
                                            Ayanamsa::Tropical);
        ASSERT_FALSE(chart.has_value()) << "parallel=" << parallel;
        EXPECT_EQ(chart.error().code, ErrorCode::EphemerisUnavailable);
    }
}

TEST_F(ChartCalculatorTest, RetrogradePairsSkippedByDefault) {
    LinearSky sky;
    sky.motion = {{Body::Sun, {10.0, 1.0}}, {Body::Saturn, {12.0, -0.05}}};
    useSky(sky);

    ChartOptions options;
    options.bodies = {Body::Sun, Body::Saturn};
    ChartCalculator calculator(mock_, options);
    auto chart = calculator.calculateAt(EPOCH, 0.0, 0.0, HouseSystem::Equal,
                                        Ayanamsa::Tropical);
    ASSERT_TRUE(chart.has_value());
    ASSERT_NE(chart->find(Body::Saturn), nullptr);
    EXPECT_TRUE(chart->find(Body::Saturn)->retrograde);
    EXPECT_TRUE(chart->aspects.empty());

    options.aspects.excludeRetrograde = false;
    ChartCalculator inclusive(mock_, options);
    auto full = inclusive.calculateAt(EPOCH, 0.0, 0.0, HouseSystem::Equal,
                                      Ayanamsa::Tropical);
    ASSERT_TRUE(full.has_value());
    ASSERT_EQ(full->aspects.size(), 1u);
    EXPECT_EQ(full->aspects[0].type, astrolabe::aspects::AspectType::Conjunction);
    EXPECT_NEAR(full->aspects[0].orb, 2.0, 1e-9);
}

// ============================================================================
// Transits and synastry
// ============================================================================

TEST_F(ChartCalculatorTest, Transits) {
    ChartCalculator calculator(ephemeris_);
    auto transit = manila1977();
    transit.dateTime = {2024, 3, 20, 3, 6, 0.0};
    auto comparison = calculator.calculateTransits(manila1977(), transit);
    ASSERT_TRUE(comparison.has_value()) << comparison.error().toString();

    EXPECT_NEAR(comparison->inner.julianDate, 2443440.7055556, 1e-6);
    EXPECT_GT(comparison->outer.julianDate, comparison->inner.julianDate);

    astrolabe::aspects::AspectDetector detector;
    auto expected = detector.calculateCrossAspects(comparison->inner.bodies,
                                                   comparison->outer.bodies);
    ASSERT_EQ(comparison->crossAspects.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(comparison->crossAspects[i].bodyA, expected[i].bodyA);
        EXPECT_EQ(comparison->crossAspects[i].bodyB, expected[i].bodyB);
        EXPECT_EQ(comparison->crossAspects[i].type, expected[i].type);
        EXPECT_EQ(comparison->crossAspects[i].applying, expected[i].applying);
    }
}

TEST_F(ChartCalculatorTest, SynastryWithItself) {
    ChartCalculator calculator(ephemeris_);
    auto comparison = calculator.calculateSynastry(manila1977(), manila1977());
    ASSERT_TRUE(comparison.has_value());

    std::size_t direct = 0;
    for (const auto& body : comparison->inner.bodies) {
        if (!body.retrograde) {
            ++direct;
        }
    }
    std::size_t selfConjunctions = 0;
    for (const auto& aspect : comparison->crossAspects) {
        if (aspect.bodyA == aspect.bodyB) {
            EXPECT_EQ(aspect.type, astrolabe::aspects::AspectType::Conjunction);
            EXPECT_DOUBLE_EQ(aspect.orb, 0.0);
            ++selfConjunctions;
        }
    }
    EXPECT_EQ(selfConjunctions, direct);
}

TEST_F(ChartCalculatorTest, ComparisonStopsOnBadRequest) {
    ChartCalculator calculator(ephemeris_);
    auto bad = manila1977();
    bad.longitude = 200.0;
    auto comparison = calculator.calculateSynastry(manila1977(), bad);
    ASSERT_FALSE(comparison.has_value());
    EXPECT_EQ(comparison.error().code, ErrorCode::InvalidInput);
}

// ============================================================================
// Configuration
// ============================================================================

TEST_F(ChartCalculatorTest, OptionsFromConfig) {
    EngineConfig config;
    config.houseSystem = "koch";
    config.ayanamsa = "lahiri";
    config.bodies = {"Sun", "Moon", "mean node"};
    config.orbOverrides = {{"Trine", 5.0}};
    config.samplingOverrides = {{"Moon", 0.00002}};
    config.excludeRetrograde = false;
    config.parallel = true;

    auto options = ChartOptions::fromConfig(config);
    ASSERT_TRUE(options.has_value()) << options.error().toString();
    EXPECT_EQ(options->houseSystem, HouseSystem::Koch);
    EXPECT_EQ(options->ayanamsa, Ayanamsa::Lahiri);
    EXPECT_EQ(options->bodies,
              (std::vector<Body>{Body::Sun, Body::Moon, Body::MeanNode}));
    EXPECT_DOUBLE_EQ(
        options->aspects.orbFor(astrolabe::aspects::AspectType::Trine), 5.0);
    EXPECT_DOUBLE_EQ(options->sampling.forBody(Body::Moon), 0.00002);
    EXPECT_DOUBLE_EQ(options->sampling.forBody(Body::Mars), 0.0001);
    EXPECT_FALSE(options->aspects.excludeRetrograde);
    EXPECT_TRUE(options->parallel);
}

TEST_F(ChartCalculatorTest, OptionsFromBadConfig) {
    EngineConfig config;
    config.bodies = {"Sun", "Vulcan"};
    auto options = ChartOptions::fromConfig(config);
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error().code, ErrorCode::InvalidInput);
}

TEST_F(ChartCalculatorTest, KeplerOptionsFromConfig) {
    EngineConfig config;
    config.keplerTolerance = 1e-9;
    config.keplerMaxIterations = 20;
    auto options = keplerOptionsFromConfig(config);
    EXPECT_DOUBLE_EQ(options.tolerance, 1e-9);
    EXPECT_EQ(options.maxIterations, 20);
}

TEST_F(ChartCalculatorTest, ExposesHouseRegistry) {
    ChartCalculator calculator(ephemeris_);
    EXPECT_EQ(calculator.houseCalculator().supportedSystems().size(), 12u);
    EXPECT_FALSE(calculator.houseCalculator().isSupported(astrolabe::houses::HouseSystem::Vedic));
    EXPECT_EQ(calculator.options().houseSystem, astrolabe::houses::HouseSystem::Placidus);
}
