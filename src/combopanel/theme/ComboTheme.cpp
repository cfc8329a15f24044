#include <combopanel/theme/ComboTheme.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace CP::Theme {

auto ComboThemeConfig::get_color(int index) const -> Color {
    switch (index) {
    case 1:
        return color1;
    case 2:
        return color2;
    case 3:
        return color3;
    case 4:
        return color4;
    default:
        cp_log("Theme color index " + std::to_string(index) + " out of range, using fallback", "Theme");
        return kFallbackColor;
    }
}

auto ComboThemeConfig::get_font(int index) const -> FontSpec {
    if (index == 2) {
        return FontSpec{font2_family, font2_size};
    }
    if (index != 1) {
        cp_log("Theme font index " + std::to_string(index) + " out of range, using font 1", "Theme");
    }
    return FontSpec{font1_family, font1_size};
}

auto ComboThemeConfig::resolved_gradient() const -> LinearGradient {
    return gradient.resolve(*this);
}

} // namespace CP::Theme
