/**
 * @file chart_serializer.cpp
 * @brief Chart to JSON conversion.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "chart_serializer.hpp"

namespace astrolabe::chart {

namespace {

json aspectsToJson(const std::vector<aspects::Aspect>& list) {
    json array = json::array();
    for (const auto& aspect : list) {
        array.push_back(aspect.toJson());
    }
    return array;
}

}  // namespace

json toJson(const ephemeris::BodyPosition& position) {
    json j = {{"name", ephemeris::bodyName(position.body)},
              {"longitude", position.longitude},
              {"latitude", position.latitude},
              {"speed", position.speed},
              {"retrograde", position.retrograde}};
    if (position.house) {
        j["house"] = *position.house;
    }
    return j;
}

json toJson(const Chart& chart) {
    json bodies = json::array();
    for (const auto& body : chart.bodies) {
        bodies.push_back(toJson(body));
    }

    auto houses = chart.houses.toJson();
    return {{"julian_date", chart.julianDate},
            {"location",
             {{"latitude", chart.latitude}, {"longitude", chart.longitude}}},
            {"zodiac",
             {{"ayanamsa", ayanamsaName(chart.ayanamsa)},
              {"offset", chart.ayanamsaDegrees}}},
            {"house_system", houses["system"]},
            {"bodies", std::move(bodies)},
            {"houses", houses["houses"]},
            {"angles", houses["angles"]},
            {"aspects", aspectsToJson(chart.aspects)}};
}

json toJson(const ChartComparison& comparison) {
    return {{"inner", toJson(comparison.inner)},
            {"outer", toJson(comparison.outer)},
            {"cross_aspects", aspectsToJson(comparison.crossAspects)}};
}

}  // namespace astrolabe::chart
