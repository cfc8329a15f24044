#pragma once

#include <combopanel/theme/Color.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace CP::Theme {

struct ComboThemeConfig;

inline constexpr int kThemeColorCount = 4;
inline constexpr int kThemeFontCount  = 2;

// Used when a theme color index read from persisted state is outside 1..4.
inline constexpr Color kFallbackColor{0.5, 0.5, 0.5, 1.0};

struct FontSpec {
    std::string family = "Sans";
    double      size   = 12.0;

    auto operator==(FontSpec const&) const -> bool = default;
};

/**
 * Either a literal color or a reference to one of the four theme colors.
 *
 * The factories clamp the theme index into range. A ColorSource built from a
 * raw Value (the deserializer does this) keeps whatever index it was given and
 * resolve() falls back to kFallbackColor for indices outside 1..4.
 */
class ColorSource {
public:
    struct Custom {
        Color color{};
        auto  operator==(Custom const&) const -> bool = default;
    };
    struct ThemeRef {
        int  index = 1;
        auto operator==(ThemeRef const&) const -> bool = default;
    };
    using Value = std::variant<Custom, ThemeRef>;

    ColorSource() = default;
    explicit ColorSource(Value value)
        : value_(std::move(value)) {}

    [[nodiscard]] static auto custom(Color color) -> ColorSource;
    [[nodiscard]] static auto theme(int index) -> ColorSource;

    [[nodiscard]] auto is_theme() const -> bool { return std::holds_alternative<ThemeRef>(value_); }
    [[nodiscard]] auto theme_index() const -> std::optional<int>;
    [[nodiscard]] auto custom_color() const -> std::optional<Color>;
    [[nodiscard]] auto value() const -> Value const& { return value_; }

    [[nodiscard]] auto resolve(ComboThemeConfig const& theme) const -> Color;

    auto operator==(ColorSource const&) const -> bool = default;

private:
    Value value_{ThemeRef{1}};
};

// Font counterpart of ColorSource; theme indices are 1..2 and anything else
// resolves to font 1.
class FontSource {
public:
    struct Custom {
        std::string family = "Sans";
        double      size   = 12.0;
        auto        operator==(Custom const&) const -> bool = default;
    };
    struct ThemeRef {
        int  index = 1;
        auto operator==(ThemeRef const&) const -> bool = default;
    };
    using Value = std::variant<Custom, ThemeRef>;

    FontSource() = default;
    explicit FontSource(Value value)
        : value_(std::move(value)) {}

    [[nodiscard]] static auto custom(std::string family, double size) -> FontSource;
    [[nodiscard]] static auto theme(int index) -> FontSource;

    [[nodiscard]] auto is_theme() const -> bool { return std::holds_alternative<ThemeRef>(value_); }
    [[nodiscard]] auto theme_index() const -> std::optional<int>;
    [[nodiscard]] auto value() const -> Value const& { return value_; }

    [[nodiscard]] auto resolve(ComboThemeConfig const& theme) const -> FontSpec;

    auto operator==(FontSource const&) const -> bool = default;

private:
    Value value_{ThemeRef{1}};
};

struct ColorStopSource {
    double      position = 0.0;
    ColorSource color{};

    [[nodiscard]] static auto theme(double position, int index) -> ColorStopSource;
    [[nodiscard]] static auto custom(double position, Color color) -> ColorStopSource;

    [[nodiscard]] auto resolve(ComboThemeConfig const& theme) const -> ColorStop;

    auto operator==(ColorStopSource const&) const -> bool = default;
};

struct LinearGradientSourceConfig {
    double                       angle = 90.0;
    std::vector<ColorStopSource> stops{
        ColorStopSource::theme(0.0, 1),
        ColorStopSource::theme(1.0, 2),
    };

    // Resolves every stop independently; stop order is kept as stored.
    [[nodiscard]] auto resolve(ComboThemeConfig const& theme) const -> LinearGradient;

    auto operator==(LinearGradientSourceConfig const&) const -> bool = default;
};

} // namespace CP::Theme
