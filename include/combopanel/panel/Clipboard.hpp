#pragma once

#include <combopanel/content/DisplayConfigs.hpp>
#include <combopanel/theme/Color.hpp>
#include <combopanel/theme/ComboTheme.hpp>
#include <combopanel/theme/ThemeSources.hpp>

#include <optional>
#include <string>
#include <vector>

namespace CP::Panel {

struct ClipboardFont {
    std::string family = "Sans";
    double      size   = 12.0;
    bool        bold   = false;
    bool        italic = false;

    auto operator==(ClipboardFont const&) const -> bool = default;
};

// Copy/paste buffer shared by the editors of one session. Each kind of value
// has its own slot; pasting leaves the slot filled.
class Clipboard {
public:
    auto copy_color(Theme::Color color) -> void { color_ = color; }
    [[nodiscard]] auto paste_color() const -> std::optional<Theme::Color> { return color_; }

    auto copy_font(ClipboardFont font) -> void { font_ = std::move(font); }
    [[nodiscard]] auto paste_font() const -> std::optional<ClipboardFont> { return font_; }

    auto copy_gradient_stops(std::vector<Theme::ColorStopSource> stops) -> void { gradient_stops_ = std::move(stops); }
    [[nodiscard]] auto paste_gradient_stops() const -> std::optional<std::vector<Theme::ColorStopSource>> { return gradient_stops_; }

    auto copy_content_item(Content::ContentItemConfig item) -> void { content_item_ = std::move(item); }
    [[nodiscard]] auto paste_content_item() const -> std::optional<Content::ContentItemConfig> { return content_item_; }

    auto copy_theme(Theme::ComboThemeConfig theme) -> void { theme_ = std::move(theme); }
    [[nodiscard]] auto paste_theme() const -> std::optional<Theme::ComboThemeConfig> { return theme_; }

    auto clear() -> void;

private:
    std::optional<Theme::Color>                         color_;
    std::optional<ClipboardFont>                        font_;
    std::optional<std::vector<Theme::ColorStopSource>>  gradient_stops_;
    std::optional<Content::ContentItemConfig>           content_item_;
    std::optional<Theme::ComboThemeConfig>              theme_;
};

inline auto Clipboard::clear() -> void {
    color_.reset();
    font_.reset();
    gradient_stops_.reset();
    content_item_.reset();
    theme_.reset();
}

} // namespace CP::Panel
