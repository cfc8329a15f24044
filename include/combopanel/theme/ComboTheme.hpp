#pragma once

#include <combopanel/theme/Color.hpp>
#include <combopanel/theme/ThemeSources.hpp>

#include <string>

namespace CP::Theme {

// Resolution context shared by every element of a combo panel: four colors,
// two fonts and one gradient. Default values are the LCARS palette.
struct ComboThemeConfig {
    Color                      color1{1.0, 0.6, 0.0, 1.0};
    Color                      color2{0.8, 0.6, 0.8, 1.0};
    Color                      color3{0.6, 0.6, 1.0, 1.0};
    Color                      color4{0.0, 0.0, 0.0, 1.0};
    LinearGradientSourceConfig gradient{};
    std::string                font1_family = "Sans Bold";
    double                     font1_size   = 14.0;
    std::string                font2_family = "Sans";
    double                     font2_size   = 12.0;

    // index 1..4; other values give kFallbackColor.
    [[nodiscard]] auto get_color(int index) const -> Color;
    // index 1..2; other values give font 1.
    [[nodiscard]] auto get_font(int index) const -> FontSpec;

    [[nodiscard]] auto resolved_gradient() const -> LinearGradient;

    auto operator==(ComboThemeConfig const&) const -> bool = default;
};

} // namespace CP::Theme
