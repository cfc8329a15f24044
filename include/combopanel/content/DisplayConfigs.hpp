#pragma once

#include <combopanel/core/Error.hpp>
#include <combopanel/layout/GroupLayout.hpp>
#include <combopanel/theme/ThemeSources.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CP::Content {

using Theme::Color;
using Theme::ColorSource;
using Theme::ColorStopSource;
using Theme::FontSource;
using Theme::LinearGradientSourceConfig;

enum class ContentDisplayType {
    Bar,
    Text,
    Graph,
    LevelBar,
    CoreBars,
    Static,
    Arc,
    Speedometer,
};

[[nodiscard]] auto DisplayTypeId(ContentDisplayType type) -> std::string_view;
[[nodiscard]] auto ParseDisplayType(std::string_view id) -> Expected<ContentDisplayType>;

enum class BarStyle {
    Full,
    Rectangle,
    Segmented,
};

struct BarDisplayConfig {
    BarStyle                   style       = BarStyle::Full;
    Layout::SplitOrientation   orientation = Layout::SplitOrientation::Horizontal;
    bool                       reverse_fill     = false;
    LinearGradientSourceConfig foreground{};
    ColorSource                background    = ColorSource::custom(Color{0.15, 0.15, 0.15, 0.8});
    double                     corner_radius = 5.0;
    double                     padding       = 4.0;
    std::uint32_t              segment_count   = 10;
    double                     segment_spacing = 2.0;
    bool                       border_enabled  = false;
    ColorSource                border_color    = ColorSource::theme(1);
    double                     border_width    = 1.0;
    bool                       smooth_animation = true;
    double                     animation_speed  = 0.3;

    auto operator==(BarDisplayConfig const&) const -> bool = default;
};

struct GraphDisplayConfig {
    ColorSource                line_color = ColorSource::theme(1);
    double                     line_width = 2.0;
    bool                       fill_enabled = true;
    LinearGradientSourceConfig fill_gradient{};
    std::uint32_t              max_data_points = 60;
    bool                       auto_scale      = true;
    double                     min_value       = 0.0;
    double                     max_value       = 100.0;
    bool                       show_grid       = true;
    ColorSource                grid_color = ColorSource::custom(Color{0.3, 0.3, 0.3, 0.5});

    auto operator==(GraphDisplayConfig const&) const -> bool = default;
};

struct CoreBarsConfig {
    std::uint32_t              start_core  = 0;
    std::uint32_t              end_core    = 15;
    BarStyle                   bar_style   = BarStyle::Full;
    Layout::SplitOrientation   orientation = Layout::SplitOrientation::Horizontal;
    LinearGradientSourceConfig foreground{};
    ColorSource                background    = ColorSource::custom(Color{0.15, 0.15, 0.15, 0.8});
    double                     corner_radius = 3.0;
    double                     bar_spacing   = 4.0;
    std::uint32_t              segment_count   = 10;
    double                     segment_spacing = 1.0;
    bool                       show_labels  = true;
    std::string                label_prefix = "CPU";
    FontSource                 label_font   = FontSource::theme(2);
    ColorSource                label_color  = ColorSource::theme(3);
    bool                       animate         = true;
    double                     animation_speed = 8.0;

    auto operator==(CoreBarsConfig const&) const -> bool = default;
};

struct StaticDisplayConfig {
    ColorSource background = ColorSource::theme(4);
    std::string text{};
    FontSource  font  = FontSource::theme(2);
    ColorSource color = ColorSource::theme(3);

    auto operator==(StaticDisplayConfig const&) const -> bool = default;
};

struct ArcDisplayConfig {
    double                       start_angle    = 135.0;
    double                       end_angle      = 45.0;
    double                       arc_width      = 0.15;
    double                       radius_percent = 0.85;
    bool                         segmented       = false;
    std::uint32_t                segment_count   = 20;
    double                       segment_spacing = 2.0;
    std::vector<ColorStopSource> color_stops{
        ColorStopSource::custom(0.0, Color{0.0, 0.8, 0.0, 1.0}),
        ColorStopSource::custom(0.7, Color{1.0, 0.8, 0.0, 1.0}),
        ColorStopSource::custom(0.9, Color{1.0, 0.0, 0.0, 1.0}),
    };
    bool        show_background_arc = true;
    ColorSource background_color    = ColorSource::custom(Color{0.2, 0.2, 0.2, 0.5});
    bool        animate             = false;
    double      animation_duration  = 0.3;

    auto operator==(ArcDisplayConfig const&) const -> bool = default;
};

struct SpeedometerConfig {
    double                       start_angle    = 135.0;
    double                       end_angle      = 45.0;
    double                       arc_width      = 0.15;
    double                       radius_percent = 0.85;
    bool                         show_track  = true;
    ColorSource                  track_color = ColorSource::custom(Color{0.2, 0.2, 0.2, 1.0});
    std::vector<ColorStopSource> track_color_stops{
        ColorStopSource::custom(0.0, Color{0.0, 0.8, 0.0, 1.0}),
        ColorStopSource::custom(0.7, Color{1.0, 0.8, 0.0, 1.0}),
        ColorStopSource::custom(0.9, Color{1.0, 0.0, 0.0, 1.0}),
    };
    std::uint32_t major_tick_count = 10;
    std::uint32_t minor_tick_count = 5;
    ColorSource   needle_color     = ColorSource::custom(Color{0.9, 0.1, 0.1, 1.0});
    double        needle_length    = 0.75;
    double        needle_width     = 3.0;
    FontSource    tick_label_font  = FontSource::custom("Sans", 12.0);
    bool          animate            = true;
    double        animation_duration = 0.3;

    auto operator==(SpeedometerConfig const&) const -> bool = default;
};

/**
 * Display settings for one slot.
 *
 * Every sub-config is kept regardless of display_as so switching the display
 * type back and forth never loses settings; only the one matching
 * display_as is used when drawing.
 */
struct ContentItemConfig {
    ContentDisplayType  display_as  = ContentDisplayType::Bar;
    bool                auto_height = true;
    double              item_height = 60.0;
    BarDisplayConfig    bar_config{};
    GraphDisplayConfig  graph_config{};
    CoreBarsConfig      core_bars_config{};
    StaticDisplayConfig static_config{};
    ArcDisplayConfig    arc_config{};
    SpeedometerConfig   speedometer_config{};

    // Graphs and items with auto_height off keep item_height along the item axis.
    [[nodiscard]] auto fixed_extent() const -> std::optional<double> {
        if (!auto_height || display_as == ContentDisplayType::Graph) {
            return item_height;
        }
        return std::nullopt;
    }

    auto operator==(ContentItemConfig const&) const -> bool = default;
};

} // namespace CP::Content
