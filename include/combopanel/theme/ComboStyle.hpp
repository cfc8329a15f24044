#pragma once

#include <combopanel/core/Error.hpp>
#include <combopanel/layout/GroupLayout.hpp>
#include <combopanel/theme/ComboTheme.hpp>

#include <array>
#include <string_view>

namespace CP::Theme {

enum class ComboStyle {
    Lcars,
    Cyberpunk,
    Material,
    Industrial,
    RetroTerminal,
    FighterHud,
    Synthwave,
    ArtDeco,
    ArtNouveau,
    Steampunk,
};

inline constexpr std::array kAllComboStyles{
    ComboStyle::Lcars,
    ComboStyle::Cyberpunk,
    ComboStyle::Material,
    ComboStyle::Industrial,
    ComboStyle::RetroTerminal,
    ComboStyle::FighterHud,
    ComboStyle::Synthwave,
    ComboStyle::ArtDeco,
    ComboStyle::ArtNouveau,
    ComboStyle::Steampunk,
};

[[nodiscard]] auto StyleId(ComboStyle style) -> std::string_view;
[[nodiscard]] auto StyleDisplayName(ComboStyle style) -> std::string_view;
[[nodiscard]] auto ParseComboStyle(std::string_view id) -> Expected<ComboStyle>;

[[nodiscard]] auto DefaultThemeFor(ComboStyle style) -> ComboThemeConfig;
[[nodiscard]] auto MaterialLightTheme() -> ComboThemeConfig;
[[nodiscard]] auto MaterialDarkTheme() -> ComboThemeConfig;

// Maps a style's own divider settings onto layout geometry. Material only
// uses the spacing, Industrial pads by a fixed 4, and the thin-line styles
// (Retro Terminal, Synthwave, Fighter HUD) always draw a 2 unit line.
[[nodiscard]] auto DividerGeometryFor(ComboStyle style, double divider_width, double divider_padding) -> Layout::DividerGeometry;

} // namespace CP::Theme
