/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef ASTROLABE_CONFIG_CORE_CONFIG_SECTION_HPP
#define ASTROLABE_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "error/error.hpp"

namespace astrolabe::config {

using json = nlohmann::json;

/**
 * @brief Concept for types that can be serialized to/from JSON
 */
template <typename T>
concept JsonSerializable = requires(T value, json j) {
    { j = value } -> std::convertible_to<json>;
    { j.get<T>() } -> std::convertible_to<T>;
};

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief Concept for sections that check their values after parsing
 */
template <typename T>
concept SelfValidating = requires(const T t) {
    { t.check() } -> std::same_as<error::Result<void>>;
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr PATH member for the configuration path
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&) to create from JSON
 * 4. Implement static generateSchema() to return JSON Schema
 *
 * and may implement check() to reject out-of-range values.
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the configuration path for this section
     * @return Configuration path (e.g., "/astrolabe/engine")
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    /**
     * @brief Convert this config to JSON
     */
    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Create a configuration from JSON
     * @throws nlohmann::json::exception on a type mismatch
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    /**
     * @brief Create a configuration from JSON, reporting type mismatches
     * and failed checks as InvalidInput
     */
    [[nodiscard]] static error::Result<Derived> tryFromJson(const json& j) {
        if (!j.is_object()) {
            return error::makeError(error::ErrorCode::InvalidInput,
                                    "{} must be a JSON object", Derived::PATH);
        }
        try {
            Derived config = Derived::deserialize(j);
            if constexpr (SelfValidating<Derived>) {
                if (auto valid = config.check(); !valid) {
                    return std::unexpected(valid.error());
                }
            }
            return config;
        } catch (const json::exception& e) {
            return error::makeError(error::ErrorCode::InvalidInput, "{}: {}",
                                    Derived::PATH, e.what());
        }
    }

    /**
     * @brief Get the JSON Schema for this configuration section
     */
    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    /**
     * @brief Get a default-constructed configuration
     */
    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Merge a partial JSON document into this configuration
     *
     * Values from partial override values in this config. Null values are
     * skipped and nested objects merge key by key.
     */
    void mergeJson(const json& partial) {
        auto thisJson = toJson();
        mergeInto(thisJson, partial);
        *static_cast<Derived*>(this) = Derived::deserialize(thisJson);
    }

    /**
     * @brief Create a diff between this config and another
     * @return JSON object containing only the differences
     */
    [[nodiscard]] json diff(const Derived& other) const {
        return computeDiff(toJson(), other.toJson());
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }

protected:
    /**
     * @brief Helper to add a property to a JSON Schema
     */
    template <JsonSerializable T>
    static void addSchemaProperty(json& schema, const std::string& name,
                                  const std::string& type,
                                  const T& defaultValue,
                                  const std::string& description = "") {
        if (!schema.contains("properties")) {
            schema["properties"] = json::object();
        }
        json& prop = schema["properties"][name];
        prop["type"] = type;
        prop["default"] = defaultValue;
        if (!description.empty()) {
            prop["description"] = description;
        }
    }

    /**
     * @brief Helper to add range constraint to a numeric property
     */
    static void addRange(json& schema, const std::string& name,
                         std::optional<double> minimum = std::nullopt,
                         std::optional<double> maximum = std::nullopt) {
        if (schema.contains("properties") &&
            schema["properties"].contains(name)) {
            auto& prop = schema["properties"][name];
            if (minimum) {
                prop["minimum"] = *minimum;
            }
            if (maximum) {
                prop["maximum"] = *maximum;
            }
        }
    }

private:
    static void mergeInto(json& target, const json& source) {
        if (source.is_object()) {
            for (auto& [key, value] : source.items()) {
                if (value.is_object() && target.contains(key) &&
                    target[key].is_object()) {
                    mergeInto(target[key], value);
                } else if (!value.is_null()) {
                    target[key] = value;
                }
            }
        }
    }

    [[nodiscard]] static json computeDiff(const json& a, const json& b) {
        json result = json::object();

        if (a.is_object() && b.is_object()) {
            for (auto& [key, value] : a.items()) {
                if (!b.contains(key)) {
                    result[key] = {{"_deleted", true}, {"_old", value}};
                } else if (value != b[key]) {
                    if (value.is_object() && b[key].is_object()) {
                        auto nested = computeDiff(value, b[key]);
                        if (!nested.empty()) {
                            result[key] = nested;
                        }
                    } else {
                        result[key] = {{"_old", value}, {"_new", b[key]}};
                    }
                }
            }
            for (auto& [key, value] : b.items()) {
                if (!a.contains(key)) {
                    result[key] = {{"_added", true}, {"_new", value}};
                }
            }
        }

        return result;
    }
};

}  // namespace astrolabe::config

#endif  // ASTROLABE_CONFIG_CORE_CONFIG_SECTION_HPP
