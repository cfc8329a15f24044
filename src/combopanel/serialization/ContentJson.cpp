#include <combopanel/serialization/ComboJson.hpp>

#include "serialization/JsonDetail.hpp"

#include <array>
#include <utility>

namespace CP::Serialization {
namespace {

using Content::BarStyle;
using Detail::find_key;
using Detail::read_boolean;
using Detail::read_number;
using Detail::read_string;
using Detail::read_uint32;
using Detail::orientation_id;
using Detail::read_orientation;
using Layout::SplitOrientation;

constexpr std::array<std::pair<BarStyle, std::string_view>, 3> kBarStyles{{
    {BarStyle::Full, "full"},
    {BarStyle::Rectangle, "rectangle"},
    {BarStyle::Segmented, "segmented"},
}};

[[nodiscard]] auto bar_style_id(BarStyle style) -> std::string_view {
    for (auto const& [value, id] : kBarStyles) {
        if (value == style) {
            return id;
        }
    }
    return "full";
}

[[nodiscard]] auto read_bar_style(Json const& json, char const* key, BarStyle default_value) -> BarStyle {
    auto const text = read_string(json, key, std::string(bar_style_id(default_value)));
    for (auto const& [value, id] : kBarStyles) {
        if (id == text) {
            return value;
        }
    }
    Detail::log_wrong_kind(key, "a bar style");
    return default_value;
}

[[nodiscard]] auto read_color_source(Json const& json, char const* key, Theme::ColorSource const& default_value) -> Theme::ColorSource {
    auto const* value = find_key(json, key);
    return value == nullptr ? default_value : colorSourceFromJson(*value, default_value);
}

[[nodiscard]] auto read_font_source(Json const& json, char const* key, Theme::FontSource const& default_value) -> Theme::FontSource {
    auto const* value = find_key(json, key);
    return value == nullptr ? default_value : fontSourceFromJson(*value, default_value);
}

[[nodiscard]] auto read_gradient(Json const& json, char const* key, Theme::LinearGradientSourceConfig const& default_value)
        -> Theme::LinearGradientSourceConfig {
    auto const* value = Detail::read_object(json, key);
    return value == nullptr ? default_value : gradientFromJson(*value);
}

[[nodiscard]] auto read_stops(Json const& json, char const* key, std::vector<Theme::ColorStopSource> const& default_value)
        -> std::vector<Theme::ColorStopSource> {
    auto const* value = find_key(json, key);
    return value == nullptr ? default_value : colorStopsFromJson(*value, default_value);
}

[[nodiscard]] auto bar_to_json(Content::BarDisplayConfig const& bar) -> Json {
    return Json{
        {"style", std::string(bar_style_id(bar.style))},
        {"orientation", std::string(orientation_id(bar.orientation))},
        {"reverse_fill", bar.reverse_fill},
        {"foreground", gradientToJson(bar.foreground)},
        {"background", colorSourceToJson(bar.background)},
        {"corner_radius", bar.corner_radius},
        {"padding", bar.padding},
        {"segment_count", bar.segment_count},
        {"segment_spacing", bar.segment_spacing},
        {"border_enabled", bar.border_enabled},
        {"border_color", colorSourceToJson(bar.border_color)},
        {"border_width", bar.border_width},
        {"smooth_animation", bar.smooth_animation},
        {"animation_speed", bar.animation_speed},
    };
}

[[nodiscard]] auto bar_from_json(Json const& json) -> Content::BarDisplayConfig {
    Content::BarDisplayConfig bar;
    bar.style            = read_bar_style(json, "style", bar.style);
    bar.orientation      = read_orientation(json, "orientation", bar.orientation);
    bar.reverse_fill     = read_boolean(json, "reverse_fill", bar.reverse_fill);
    bar.foreground       = read_gradient(json, "foreground", bar.foreground);
    bar.background       = read_color_source(json, "background", bar.background);
    bar.corner_radius    = read_number(json, "corner_radius", bar.corner_radius);
    bar.padding          = read_number(json, "padding", bar.padding);
    bar.segment_count    = read_uint32(json, "segment_count", bar.segment_count);
    bar.segment_spacing  = read_number(json, "segment_spacing", bar.segment_spacing);
    bar.border_enabled   = read_boolean(json, "border_enabled", bar.border_enabled);
    bar.border_color     = read_color_source(json, "border_color", bar.border_color);
    bar.border_width     = read_number(json, "border_width", bar.border_width);
    bar.smooth_animation = read_boolean(json, "smooth_animation", bar.smooth_animation);
    bar.animation_speed  = read_number(json, "animation_speed", bar.animation_speed);
    return bar;
}

[[nodiscard]] auto graph_to_json(Content::GraphDisplayConfig const& graph) -> Json {
    return Json{
        {"line_color", colorSourceToJson(graph.line_color)},
        {"line_width", graph.line_width},
        {"fill_enabled", graph.fill_enabled},
        {"fill_gradient", gradientToJson(graph.fill_gradient)},
        {"max_data_points", graph.max_data_points},
        {"auto_scale", graph.auto_scale},
        {"min_value", graph.min_value},
        {"max_value", graph.max_value},
        {"show_grid", graph.show_grid},
        {"grid_color", colorSourceToJson(graph.grid_color)},
    };
}

[[nodiscard]] auto graph_from_json(Json const& json) -> Content::GraphDisplayConfig {
    Content::GraphDisplayConfig graph;
    graph.line_color      = read_color_source(json, "line_color", graph.line_color);
    graph.line_width      = read_number(json, "line_width", graph.line_width);
    graph.fill_enabled    = read_boolean(json, "fill_enabled", graph.fill_enabled);
    graph.fill_gradient   = read_gradient(json, "fill_gradient", graph.fill_gradient);
    graph.max_data_points = read_uint32(json, "max_data_points", graph.max_data_points);
    graph.auto_scale      = read_boolean(json, "auto_scale", graph.auto_scale);
    graph.min_value       = read_number(json, "min_value", graph.min_value);
    graph.max_value       = read_number(json, "max_value", graph.max_value);
    graph.show_grid       = read_boolean(json, "show_grid", graph.show_grid);
    graph.grid_color      = read_color_source(json, "grid_color", graph.grid_color);
    return graph;
}

[[nodiscard]] auto core_bars_to_json(Content::CoreBarsConfig const& bars) -> Json {
    return Json{
        {"start_core", bars.start_core},
        {"end_core", bars.end_core},
        {"bar_style", std::string(bar_style_id(bars.bar_style))},
        {"orientation", std::string(orientation_id(bars.orientation))},
        {"foreground", gradientToJson(bars.foreground)},
        {"background", colorSourceToJson(bars.background)},
        {"corner_radius", bars.corner_radius},
        {"bar_spacing", bars.bar_spacing},
        {"segment_count", bars.segment_count},
        {"segment_spacing", bars.segment_spacing},
        {"show_labels", bars.show_labels},
        {"label_prefix", bars.label_prefix},
        {"label_font", fontSourceToJson(bars.label_font)},
        {"label_color", colorSourceToJson(bars.label_color)},
        {"animate", bars.animate},
        {"animation_speed", bars.animation_speed},
    };
}

[[nodiscard]] auto core_bars_from_json(Json const& json) -> Content::CoreBarsConfig {
    Content::CoreBarsConfig bars;
    bars.start_core      = read_uint32(json, "start_core", bars.start_core);
    bars.end_core        = read_uint32(json, "end_core", bars.end_core);
    bars.bar_style       = read_bar_style(json, "bar_style", bars.bar_style);
    bars.orientation     = read_orientation(json, "orientation", bars.orientation);
    bars.foreground      = read_gradient(json, "foreground", bars.foreground);
    bars.background      = read_color_source(json, "background", bars.background);
    bars.corner_radius   = read_number(json, "corner_radius", bars.corner_radius);
    bars.bar_spacing     = read_number(json, "bar_spacing", bars.bar_spacing);
    bars.segment_count   = read_uint32(json, "segment_count", bars.segment_count);
    bars.segment_spacing = read_number(json, "segment_spacing", bars.segment_spacing);
    bars.show_labels     = read_boolean(json, "show_labels", bars.show_labels);
    bars.label_prefix    = read_string(json, "label_prefix", bars.label_prefix);
    bars.label_font      = read_font_source(json, "label_font", bars.label_font);
    bars.label_color     = read_color_source(json, "label_color", bars.label_color);
    bars.animate         = read_boolean(json, "animate", bars.animate);
    bars.animation_speed = read_number(json, "animation_speed", bars.animation_speed);
    return bars;
}

[[nodiscard]] auto static_to_json(Content::StaticDisplayConfig const& config) -> Json {
    return Json{
        {"background", colorSourceToJson(config.background)},
        {"text", config.text},
        {"font", fontSourceToJson(config.font)},
        {"color", colorSourceToJson(config.color)},
    };
}

[[nodiscard]] auto static_from_json(Json const& json) -> Content::StaticDisplayConfig {
    Content::StaticDisplayConfig config;
    config.background = read_color_source(json, "background", config.background);
    config.text       = read_string(json, "text", config.text);
    config.font       = read_font_source(json, "font", config.font);
    config.color      = read_color_source(json, "color", config.color);
    return config;
}

[[nodiscard]] auto arc_to_json(Content::ArcDisplayConfig const& arc) -> Json {
    return Json{
        {"start_angle", arc.start_angle},
        {"end_angle", arc.end_angle},
        {"arc_width", arc.arc_width},
        {"radius_percent", arc.radius_percent},
        {"segmented", arc.segmented},
        {"segment_count", arc.segment_count},
        {"segment_spacing", arc.segment_spacing},
        {"color_stops", colorStopsToJson(arc.color_stops)},
        {"show_background_arc", arc.show_background_arc},
        {"background_color", colorSourceToJson(arc.background_color)},
        {"animate", arc.animate},
        {"animation_duration", arc.animation_duration},
    };
}

[[nodiscard]] auto arc_from_json(Json const& json) -> Content::ArcDisplayConfig {
    Content::ArcDisplayConfig arc;
    arc.start_angle         = read_number(json, "start_angle", arc.start_angle);
    arc.end_angle           = read_number(json, "end_angle", arc.end_angle);
    arc.arc_width           = read_number(json, "arc_width", arc.arc_width);
    arc.radius_percent      = read_number(json, "radius_percent", arc.radius_percent);
    arc.segmented           = read_boolean(json, "segmented", arc.segmented);
    arc.segment_count       = read_uint32(json, "segment_count", arc.segment_count);
    arc.segment_spacing     = read_number(json, "segment_spacing", arc.segment_spacing);
    arc.color_stops         = read_stops(json, "color_stops", arc.color_stops);
    arc.show_background_arc = read_boolean(json, "show_background_arc", arc.show_background_arc);
    arc.background_color    = read_color_source(json, "background_color", arc.background_color);
    arc.animate             = read_boolean(json, "animate", arc.animate);
    arc.animation_duration  = read_number(json, "animation_duration", arc.animation_duration);
    return arc;
}

[[nodiscard]] auto speedometer_to_json(Content::SpeedometerConfig const& gauge) -> Json {
    return Json{
        {"start_angle", gauge.start_angle},
        {"end_angle", gauge.end_angle},
        {"arc_width", gauge.arc_width},
        {"radius_percent", gauge.radius_percent},
        {"show_track", gauge.show_track},
        {"track_color", colorSourceToJson(gauge.track_color)},
        {"track_color_stops", colorStopsToJson(gauge.track_color_stops)},
        {"major_tick_count", gauge.major_tick_count},
        {"minor_tick_count", gauge.minor_tick_count},
        {"needle_color", colorSourceToJson(gauge.needle_color)},
        {"needle_length", gauge.needle_length},
        {"needle_width", gauge.needle_width},
        {"tick_label_font", fontSourceToJson(gauge.tick_label_font)},
        {"animate", gauge.animate},
        {"animation_duration", gauge.animation_duration},
    };
}

[[nodiscard]] auto speedometer_from_json(Json const& json) -> Content::SpeedometerConfig {
    Content::SpeedometerConfig gauge;
    gauge.start_angle        = read_number(json, "start_angle", gauge.start_angle);
    gauge.end_angle          = read_number(json, "end_angle", gauge.end_angle);
    gauge.arc_width          = read_number(json, "arc_width", gauge.arc_width);
    gauge.radius_percent     = read_number(json, "radius_percent", gauge.radius_percent);
    gauge.show_track         = read_boolean(json, "show_track", gauge.show_track);
    gauge.track_color        = read_color_source(json, "track_color", gauge.track_color);
    gauge.track_color_stops  = read_stops(json, "track_color_stops", gauge.track_color_stops);
    gauge.major_tick_count   = read_uint32(json, "major_tick_count", gauge.major_tick_count);
    gauge.minor_tick_count   = read_uint32(json, "minor_tick_count", gauge.minor_tick_count);
    gauge.needle_color       = read_color_source(json, "needle_color", gauge.needle_color);
    gauge.needle_length      = read_number(json, "needle_length", gauge.needle_length);
    gauge.needle_width       = read_number(json, "needle_width", gauge.needle_width);
    gauge.tick_label_font    = read_font_source(json, "tick_label_font", gauge.tick_label_font);
    gauge.animate            = read_boolean(json, "animate", gauge.animate);
    gauge.animation_duration = read_number(json, "animation_duration", gauge.animation_duration);
    return gauge;
}

template <typename Config, typename Reader>
[[nodiscard]] auto read_sub_config(Json const& json, char const* key, Reader reader) -> Config {
    auto const* value = Detail::read_object(json, key);
    return value == nullptr ? Config{} : reader(*value);
}

} // namespace

auto contentItemToJson(Content::ContentItemConfig const& item) -> Json {
    return Json{
        {"display_as", std::string(Content::DisplayTypeId(item.display_as))},
        {"auto_height", item.auto_height},
        {"item_height", item.item_height},
        {"bar_config", bar_to_json(item.bar_config)},
        {"graph_config", graph_to_json(item.graph_config)},
        {"core_bars_config", core_bars_to_json(item.core_bars_config)},
        {"static_config", static_to_json(item.static_config)},
        {"arc_config", arc_to_json(item.arc_config)},
        {"speedometer_config", speedometer_to_json(item.speedometer_config)},
    };
}

auto contentItemFromJson(Json const& json) -> Content::ContentItemConfig {
    Content::ContentItemConfig item;
    if (!json.is_object()) {
        Detail::log_wrong_kind("content item", "an object");
        return item;
    }
    auto const display_as = read_string(json, "display_as", std::string(Content::DisplayTypeId(item.display_as)));
    if (auto parsed = Content::ParseDisplayType(display_as)) {
        item.display_as = *parsed;
    } else {
        Detail::log_wrong_kind("display_as", "a display type");
    }
    item.auto_height        = read_boolean(json, "auto_height", item.auto_height);
    item.item_height        = read_number(json, "item_height", item.item_height);
    item.bar_config         = read_sub_config<Content::BarDisplayConfig>(json, "bar_config", bar_from_json);
    item.graph_config       = read_sub_config<Content::GraphDisplayConfig>(json, "graph_config", graph_from_json);
    item.core_bars_config   = read_sub_config<Content::CoreBarsConfig>(json, "core_bars_config", core_bars_from_json);
    item.static_config      = read_sub_config<Content::StaticDisplayConfig>(json, "static_config", static_from_json);
    item.arc_config         = read_sub_config<Content::ArcDisplayConfig>(json, "arc_config", arc_from_json);
    item.speedometer_config = read_sub_config<Content::SpeedometerConfig>(json, "speedometer_config", speedometer_from_json);
    return item;
}

} // namespace CP::Serialization
