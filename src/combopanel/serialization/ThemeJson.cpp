#include <combopanel/serialization/ComboJson.hpp>

#include "serialization/JsonDetail.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace CP::Serialization {
namespace {

using Detail::find_key;
using Detail::read_number;
using Detail::read_string;

[[nodiscard]] auto read_theme_index(Json const& value) -> std::optional<int> {
    if (!value.is_number_integer()) {
        return std::nullopt;
    }
    auto const raw = value.get<std::int64_t>();
    return static_cast<int>(std::clamp<std::int64_t>(raw, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
}

[[nodiscard]] auto looks_like_color(Json const& json) -> bool {
    return json.is_object() && (json.contains("r") || json.contains("g") || json.contains("b"));
}

[[nodiscard]] auto read_color(Json const& json, char const* key, Theme::Color const& default_value) -> Theme::Color {
    auto const* value = Detail::read_object(json, key);
    return value == nullptr ? default_value : colorFromJson(*value);
}

} // namespace

auto colorToJson(Theme::Color const& color) -> Json {
    return Json{{"r", color.r}, {"g", color.g}, {"b", color.b}, {"a", color.a}};
}

auto colorFromJson(Json const& json) -> Theme::Color {
    if (!json.is_object()) {
        Detail::log_wrong_kind("color", "an object");
        return Theme::Color{};
    }
    return Theme::Color{
        read_number(json, "r", 0.0),
        read_number(json, "g", 0.0),
        read_number(json, "b", 0.0),
        read_number(json, "a", 1.0),
    };
}

auto colorSourceToJson(Theme::ColorSource const& source) -> Json {
    if (auto index = source.theme_index()) {
        return Json{{"theme", *index}};
    }
    return Json{{"custom", colorToJson(*source.custom_color())}};
}

auto colorSourceFromJson(Json const& json, Theme::ColorSource const& fallback) -> Theme::ColorSource {
    if (auto const* theme = find_key(json, "theme")) {
        if (auto index = read_theme_index(*theme)) {
            return Theme::ColorSource{Theme::ColorSource::ThemeRef{*index}};
        }
        Detail::log_wrong_kind("theme", "an integer");
        return fallback;
    }
    if (auto const* custom = find_key(json, "custom")) {
        if (custom->is_object()) {
            return Theme::ColorSource::custom(colorFromJson(*custom));
        }
        Detail::log_wrong_kind("custom", "an object");
        return fallback;
    }
    if (looks_like_color(json)) {
        return Theme::ColorSource::custom(colorFromJson(json));
    }
    Detail::log_wrong_kind("color source", "a theme reference or color");
    return fallback;
}

auto fontSourceToJson(Theme::FontSource const& source) -> Json {
    if (auto index = source.theme_index()) {
        return Json{{"theme", *index}};
    }
    auto const& custom = std::get<Theme::FontSource::Custom>(source.value());
    return Json{{"custom", Json{{"family", custom.family}, {"size", custom.size}}}};
}

auto fontSourceFromJson(Json const& json, Theme::FontSource const& fallback) -> Theme::FontSource {
    if (json.is_string()) {
        return Theme::FontSource::custom(json.get<std::string>(), 12.0);
    }
    if (auto const* theme = find_key(json, "theme")) {
        if (auto index = read_theme_index(*theme)) {
            return Theme::FontSource{Theme::FontSource::ThemeRef{*index}};
        }
        Detail::log_wrong_kind("theme", "an integer");
        return fallback;
    }
    if (auto const* custom = find_key(json, "custom"); custom != nullptr && custom->is_object()) {
        return Theme::FontSource::custom(read_string(*custom, "family", "Sans"), read_number(*custom, "size", 12.0));
    }
    Detail::log_wrong_kind("font source", "a theme reference, custom font or family name");
    return fallback;
}

auto colorStopsToJson(std::vector<Theme::ColorStopSource> const& stops) -> Json {
    auto out = Json::array();
    for (auto const& stop : stops) {
        out.push_back(Json{{"position", stop.position}, {"color", colorSourceToJson(stop.color)}});
    }
    return out;
}

auto colorStopsFromJson(Json const& json, std::vector<Theme::ColorStopSource> const& fallback) -> std::vector<Theme::ColorStopSource> {
    if (!json.is_array()) {
        Detail::log_wrong_kind("stops", "an array");
        return fallback;
    }
    std::vector<Theme::ColorStopSource> stops;
    stops.reserve(json.size());
    for (auto const& entry : json) {
        if (!entry.is_object()) {
            Detail::log_wrong_kind("stop", "an object");
            continue;
        }
        Theme::ColorStopSource stop;
        stop.position = read_number(entry, "position", 0.0);
        if (auto const* color = find_key(entry, "color")) {
            stop.color = colorSourceFromJson(*color, stop.color);
        }
        stops.push_back(std::move(stop));
    }
    return stops;
}

auto gradientToJson(Theme::LinearGradientSourceConfig const& gradient) -> Json {
    return Json{{"angle", gradient.angle}, {"stops", colorStopsToJson(gradient.stops)}};
}

auto gradientFromJson(Json const& json) -> Theme::LinearGradientSourceConfig {
    Theme::LinearGradientSourceConfig gradient;
    if (!json.is_object()) {
        Detail::log_wrong_kind("gradient", "an object");
        return gradient;
    }
    gradient.angle = read_number(json, "angle", gradient.angle);
    if (auto const* stops = find_key(json, "stops")) {
        gradient.stops = colorStopsFromJson(*stops, gradient.stops);
    }
    return gradient;
}

auto themeToJson(Theme::ComboThemeConfig const& theme) -> Json {
    return Json{
        {"color1", colorToJson(theme.color1)},
        {"color2", colorToJson(theme.color2)},
        {"color3", colorToJson(theme.color3)},
        {"color4", colorToJson(theme.color4)},
        {"gradient", gradientToJson(theme.gradient)},
        {"font1_family", theme.font1_family},
        {"font1_size", theme.font1_size},
        {"font2_family", theme.font2_family},
        {"font2_size", theme.font2_size},
    };
}

auto themeFromJson(Json const& json, Theme::ComboThemeConfig const& defaults) -> Theme::ComboThemeConfig {
    if (!json.is_object()) {
        Detail::log_wrong_kind("theme", "an object");
        return defaults;
    }
    Theme::ComboThemeConfig theme = defaults;
    theme.color1 = read_color(json, "color1", defaults.color1);
    theme.color2 = read_color(json, "color2", defaults.color2);
    theme.color3 = read_color(json, "color3", defaults.color3);
    theme.color4 = read_color(json, "color4", defaults.color4);
    if (auto const* gradient = find_key(json, "gradient")) {
        theme.gradient = gradientFromJson(*gradient);
    }
    theme.font1_family = read_string(json, "font1_family", defaults.font1_family);
    theme.font1_size   = read_number(json, "font1_size", defaults.font1_size);
    theme.font2_family = read_string(json, "font2_family", defaults.font2_family);
    theme.font2_size   = read_number(json, "font2_size", defaults.font2_size);
    return theme;
}

} // namespace CP::Serialization
