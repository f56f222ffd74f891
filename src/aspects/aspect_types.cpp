/**
 * @file aspect_types.cpp
 * @brief Aspect name lookup.
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#include "aspect_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace astrolabe::aspects {

namespace {

auto canonicalKey(std::string_view name) -> std::string {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == ' ' || c == '_' || c == '-') {
            continue;
        }
        key.push_back(
            static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return key;
}

}  // namespace

auto parseAspectType(std::string_view name) -> std::optional<AspectType> {
    const auto key = canonicalKey(name);
    auto it = std::ranges::find_if(ASPECT_TABLE, [&key](const auto& def) {
        return canonicalKey(def.name) == key;
    });
    if (it == ASPECT_TABLE.end()) {
        return std::nullopt;
    }
    return it->type;
}

}  // namespace astrolabe::aspects
