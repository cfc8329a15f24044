#pragma once

#include <combopanel/layout/GroupLayout.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

// Lenient readers shared by the JSON codecs. A missing key gives the default
// silently; a key holding the wrong kind of value gives the default and is
// logged under "Config".
namespace CP::Serialization::Detail {

using Json = nlohmann::json;

inline auto log_wrong_kind([[maybe_unused]] std::string_view key, [[maybe_unused]] std::string_view expected) -> void {
    cp_log("Config key '" + std::string(key) + "' is not " + std::string(expected) + ", using default", "Config");
}

[[nodiscard]] inline auto find_key(Json const& json, char const* key) -> Json const* {
    if (!json.is_object()) {
        return nullptr;
    }
    auto it = json.find(key);
    return it == json.end() || it->is_null() ? nullptr : &*it;
}

[[nodiscard]] inline auto read_number(Json const& json, char const* key, double default_value) -> double {
    auto const* value = find_key(json, key);
    if (value == nullptr) {
        return default_value;
    }
    if (!value->is_number() || !std::isfinite(value->get<double>())) {
        log_wrong_kind(key, "a finite number");
        return default_value;
    }
    return value->get<double>();
}

[[nodiscard]] inline auto read_boolean(Json const& json, char const* key, bool default_value) -> bool {
    auto const* value = find_key(json, key);
    if (value == nullptr) {
        return default_value;
    }
    if (!value->is_boolean()) {
        log_wrong_kind(key, "a bool");
        return default_value;
    }
    return value->get<bool>();
}

[[nodiscard]] inline auto read_uint64(Json const& json, char const* key, std::uint64_t default_value) -> std::uint64_t {
    auto const* value = find_key(json, key);
    if (value == nullptr) {
        return default_value;
    }
    if (value->is_number_unsigned()) {
        return value->get<std::uint64_t>();
    }
    if (value->is_number_integer() && value->get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(value->get<std::int64_t>());
    }
    log_wrong_kind(key, "a non-negative integer");
    return default_value;
}

[[nodiscard]] inline auto read_uint32(Json const& json, char const* key, std::uint32_t default_value) -> std::uint32_t {
    auto const wide = read_uint64(json, key, default_value);
    if (wide > std::numeric_limits<std::uint32_t>::max()) {
        log_wrong_kind(key, "a 32-bit integer");
        return default_value;
    }
    return static_cast<std::uint32_t>(wide);
}

[[nodiscard]] inline auto read_string(Json const& json, char const* key, std::string default_value) -> std::string {
    auto const* value = find_key(json, key);
    if (value == nullptr) {
        return default_value;
    }
    if (!value->is_string()) {
        log_wrong_kind(key, "a string");
        return default_value;
    }
    return value->get<std::string>();
}

// Object or array under key, or nullptr when absent or of another kind.
[[nodiscard]] inline auto read_object(Json const& json, char const* key) -> Json const* {
    auto const* value = find_key(json, key);
    if (value != nullptr && !value->is_object()) {
        log_wrong_kind(key, "an object");
        return nullptr;
    }
    return value;
}

[[nodiscard]] inline auto read_array(Json const& json, char const* key) -> Json const* {
    auto const* value = find_key(json, key);
    if (value != nullptr && !value->is_array()) {
        log_wrong_kind(key, "an array");
        return nullptr;
    }
    return value;
}

[[nodiscard]] inline auto orientation_id(Layout::SplitOrientation orientation) -> std::string_view {
    return orientation == Layout::SplitOrientation::Horizontal ? "horizontal" : "vertical";
}

[[nodiscard]] inline auto read_orientation(Json const& json, char const* key, Layout::SplitOrientation default_value) -> Layout::SplitOrientation {
    auto const text = read_string(json, key, std::string(orientation_id(default_value)));
    if (text == "horizontal") {
        return Layout::SplitOrientation::Horizontal;
    }
    if (text == "vertical") {
        return Layout::SplitOrientation::Vertical;
    }
    log_wrong_kind(key, "\"horizontal\" or \"vertical\"");
    return default_value;
}

} // namespace CP::Serialization::Detail
