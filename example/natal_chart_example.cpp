/*
 * natal_chart_example.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Computes a natal chart and prints it as JSON

Usage: natal_chart_example [config.json]

*************************************************/

#include <iostream>

#include "chart/chart_calculator.hpp"
#include "chart/chart_serializer.hpp"
#include "config/config_loader.hpp"
#include "ephemeris/orbital_ephemeris.hpp"
#include "logging/logging.hpp"

using namespace astrolabe;

namespace {

auto loadConfig(int argc, char** argv) -> error::Result<config::AstrolabeConfig> {
    if (argc > 1) {
        return config::ConfigLoader::loadFile(argv[1]);
    }
    return config::AstrolabeConfig{};
}

}  // namespace

int main(int argc, char** argv) {
    auto cfg = loadConfig(argc, argv);
    if (!cfg) {
        std::cerr << cfg.error().toString() << "\n";
        return 1;
    }

    auto registry = logging::LoggerRegistry::fromConfig(cfg->logging);
    if (!registry) {
        std::cerr << registry.error().toString() << "\n";
        return 1;
    }
    auto logger = (*registry)->getOrCreate("astrolabe");

    auto options = chart::ChartOptions::fromConfig(cfg->engine);
    if (!options) {
        logger->error("Invalid engine configuration: {}",
                      options.error().toString());
        return 1;
    }

    ephemeris::OrbitalEphemeris provider(
        chart::keplerOptionsFromConfig(cfg->engine), logger);
    chart::ChartCalculator calculator(provider, *options, logger);

    // 24 October 1977, 04:56 UT, Manila
    chart::ChartRequest natal;
    natal.dateTime = {1977, 10, 24, 4, 56, 0.0};
    natal.timezoneOffset = 0.0;
    natal.latitude = 14.65;
    natal.longitude = 121.05;

    chart::ChartRequest transit = natal;
    transit.dateTime = {2024, 3, 20, 3, 6, 0.0};

    auto comparison = calculator.calculateTransits(natal, transit);
    if (!comparison) {
        logger->error("Chart calculation failed: {}",
                      comparison.error().toString());
        return 1;
    }

    logger->info("Natal chart: {} bodies, {} aspects, {} transit aspects",
                 comparison->inner.bodies.size(),
                 comparison->inner.aspects.size(),
                 comparison->crossAspects.size());
    std::cout << chart::toJson(*comparison).dump(2) << "\n";

    (*registry)->flushAll();
    return 0;
}
