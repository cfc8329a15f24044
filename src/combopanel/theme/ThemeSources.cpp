#include <combopanel/theme/ComboTheme.hpp>
#include <combopanel/theme/ThemeSources.hpp>

#include <algorithm>

namespace CP::Theme {

auto ColorSource::custom(Color color) -> ColorSource {
    return ColorSource{Custom{color}};
}

auto ColorSource::theme(int index) -> ColorSource {
    return ColorSource{ThemeRef{std::clamp(index, 1, kThemeColorCount)}};
}

auto ColorSource::theme_index() const -> std::optional<int> {
    if (auto const* ref = std::get_if<ThemeRef>(&value_)) {
        return ref->index;
    }
    return std::nullopt;
}

auto ColorSource::custom_color() const -> std::optional<Color> {
    if (auto const* custom = std::get_if<Custom>(&value_)) {
        return custom->color;
    }
    return std::nullopt;
}

auto ColorSource::resolve(ComboThemeConfig const& theme) const -> Color {
    if (auto const* custom = std::get_if<Custom>(&value_)) {
        return custom->color;
    }
    return theme.get_color(std::get<ThemeRef>(value_).index);
}

auto FontSource::custom(std::string family, double size) -> FontSource {
    return FontSource{Custom{std::move(family), size}};
}

auto FontSource::theme(int index) -> FontSource {
    return FontSource{ThemeRef{std::clamp(index, 1, kThemeFontCount)}};
}

auto FontSource::theme_index() const -> std::optional<int> {
    if (auto const* ref = std::get_if<ThemeRef>(&value_)) {
        return ref->index;
    }
    return std::nullopt;
}

auto FontSource::resolve(ComboThemeConfig const& theme) const -> FontSpec {
    if (auto const* custom = std::get_if<Custom>(&value_)) {
        return FontSpec{custom->family, custom->size};
    }
    return theme.get_font(std::get<ThemeRef>(value_).index);
}

auto ColorStopSource::theme(double position, int index) -> ColorStopSource {
    return ColorStopSource{position, ColorSource::theme(index)};
}

auto ColorStopSource::custom(double position, Color color) -> ColorStopSource {
    return ColorStopSource{position, ColorSource::custom(color)};
}

auto ColorStopSource::resolve(ComboThemeConfig const& theme) const -> ColorStop {
    return ColorStop{position, color.resolve(theme)};
}

auto LinearGradientSourceConfig::resolve(ComboThemeConfig const& theme) const -> LinearGradient {
    LinearGradient out;
    out.angle = angle;
    out.stops.clear();
    out.stops.reserve(stops.size());
    for (auto const& stop : stops) {
        out.stops.push_back(stop.resolve(theme));
    }
    return out;
}

} // namespace CP::Theme
