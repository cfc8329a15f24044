#include <combopanel/theme/ComboStyle.hpp>

#include <string>

namespace CP::Theme {

namespace {

struct StyleEntry {
    ComboStyle       style;
    std::string_view id;
    std::string_view display_name;
};

constexpr std::array kStyleTable{
    StyleEntry{ComboStyle::Lcars, "lcars", "LCARS"},
    StyleEntry{ComboStyle::Cyberpunk, "cyberpunk", "Cyberpunk HUD"},
    StyleEntry{ComboStyle::Material, "material", "Material Design"},
    StyleEntry{ComboStyle::Industrial, "industrial", "Industrial"},
    StyleEntry{ComboStyle::RetroTerminal, "retro_terminal", "Retro Terminal"},
    StyleEntry{ComboStyle::FighterHud, "fighter_hud", "Fighter HUD"},
    StyleEntry{ComboStyle::Synthwave, "synthwave", "Synthwave"},
    StyleEntry{ComboStyle::ArtDeco, "art_deco", "Art Deco"},
    StyleEntry{ComboStyle::ArtNouveau, "art_nouveau", "Art Nouveau"},
    StyleEntry{ComboStyle::Steampunk, "steampunk", "Steampunk"},
};

auto entry_for(ComboStyle style) -> StyleEntry const& {
    for (auto const& entry : kStyleTable) {
        if (entry.style == style) {
            return entry;
        }
    }
    return kStyleTable.front();
}

auto make_theme(Color c1, Color c2, Color c3, Color c4, int gradient_end, std::string font1, double size1, std::string font2, double size2) -> ComboThemeConfig {
    ComboThemeConfig theme;
    theme.color1       = c1;
    theme.color2       = c2;
    theme.color3       = c3;
    theme.color4       = c4;
    theme.gradient     = LinearGradientSourceConfig{180.0, {ColorStopSource::theme(0.0, 1), ColorStopSource::theme(1.0, gradient_end)}};
    theme.font1_family = std::move(font1);
    theme.font1_size   = size1;
    theme.font2_family = std::move(font2);
    theme.font2_size   = size2;
    return theme;
}

} // namespace

auto StyleId(ComboStyle style) -> std::string_view {
    return entry_for(style).id;
}

auto StyleDisplayName(ComboStyle style) -> std::string_view {
    return entry_for(style).display_name;
}

auto ParseComboStyle(std::string_view id) -> Expected<ComboStyle> {
    for (auto const& entry : kStyleTable) {
        if (entry.id == id) {
            return entry.style;
        }
    }
    return std::unexpected(Error{Error::Code::UnknownStyle, "unknown combo style '" + std::string(id) + "'"});
}

auto DefaultThemeFor(ComboStyle style) -> ComboThemeConfig {
    switch (style) {
    case ComboStyle::Lcars:
        return ComboThemeConfig{};
    case ComboStyle::Cyberpunk:
        return make_theme({0.0, 1.0, 1.0, 1.0}, {1.0, 0.0, 0.5, 1.0}, {0.5, 0.0, 1.0, 1.0}, {0.04, 0.04, 0.1, 1.0},
                          2, "Monospace Bold", 14.0, "Monospace", 11.0);
    case ComboStyle::Material:
        return MaterialDarkTheme();
    case ComboStyle::Industrial:
        return make_theme({0.7, 0.7, 0.7, 1.0}, {1.0, 0.6, 0.0, 1.0}, {0.35, 0.35, 0.35, 1.0}, {0.15, 0.15, 0.15, 1.0},
                          3, "Sans Bold", 14.0, "Sans", 11.0);
    case ComboStyle::RetroTerminal:
        return make_theme({0.2, 1.0, 0.2, 1.0}, {0.1, 0.6, 0.1, 1.0}, {1.0, 0.7, 0.0, 1.0}, {0.0, 0.05, 0.0, 1.0},
                          2, "Monospace", 14.0, "Monospace", 11.0);
    case ComboStyle::FighterHud:
        return make_theme({0.0, 1.0, 0.4, 1.0}, {0.0, 0.7, 0.3, 1.0}, {1.0, 0.8, 0.0, 1.0}, {0.0, 0.0, 0.0, 0.0},
                          2, "Monospace Bold", 13.0, "Monospace", 10.0);
    case ComboStyle::Synthwave:
        return make_theme({1.0, 0.2, 0.8, 1.0}, {0.2, 0.8, 1.0, 1.0}, {1.0, 0.6, 0.2, 1.0}, {0.1, 0.02, 0.18, 1.0},
                          2, "Sans Bold", 14.0, "Sans", 11.0);
    case ComboStyle::ArtDeco:
        return make_theme({0.831, 0.686, 0.216, 1.0}, {0.722, 0.451, 0.200, 1.0}, {0.804, 0.608, 0.114, 1.0},
                          {0.102, 0.102, 0.102, 1.0}, 2, "Sans Bold", 14.0, "Sans", 11.0);
    case ComboStyle::ArtNouveau:
        return make_theme({0.545, 0.647, 0.365, 1.0}, {0.722, 0.525, 0.043, 1.0}, {0.502, 0.282, 0.361, 1.0},
                          {0.157, 0.133, 0.110, 1.0}, 2, "Serif Bold", 14.0, "Serif", 11.0);
    case ComboStyle::Steampunk:
        return make_theme({0.831, 0.686, 0.216, 1.0}, {0.722, 0.451, 0.200, 1.0}, {0.804, 0.498, 0.196, 1.0},
                          {0.137, 0.102, 0.075, 1.0}, 2, "Sans Bold", 14.0, "Sans", 11.0);
    }
    return ComboThemeConfig{};
}

auto MaterialLightTheme() -> ComboThemeConfig {
    return make_theme({0.384, 0.0, 0.933, 1.0}, {0.012, 0.855, 0.776, 1.0}, {0.129, 0.129, 0.129, 1.0},
                      {0.98, 0.98, 0.98, 1.0}, 2, "Roboto Medium", 14.0, "Roboto", 12.0);
}

auto MaterialDarkTheme() -> ComboThemeConfig {
    return make_theme({0.733, 0.525, 0.988, 1.0}, {0.012, 0.855, 0.776, 1.0}, {0.878, 0.878, 0.878, 1.0},
                      {0.071, 0.071, 0.071, 1.0}, 2, "Roboto Medium", 14.0, "Roboto", 12.0);
}

auto DividerGeometryFor(ComboStyle style, double divider_width, double divider_padding) -> Layout::DividerGeometry {
    switch (style) {
    case ComboStyle::Material:
        return Layout::DividerGeometry{divider_width, 0.0};
    case ComboStyle::Industrial:
        return Layout::DividerGeometry{divider_width, 4.0};
    case ComboStyle::RetroTerminal:
    case ComboStyle::Synthwave:
    case ComboStyle::FighterHud:
        return Layout::DividerGeometry{2.0, divider_padding};
    default:
        return Layout::DividerGeometry{divider_width, divider_padding};
    }
}

} // namespace CP::Theme
