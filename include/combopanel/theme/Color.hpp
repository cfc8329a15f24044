#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

namespace CP::Theme {

struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;

    auto operator==(Color const&) const -> bool = default;
};

[[nodiscard]] inline auto FromRgba8(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a = 255) -> Color {
    return Color{r / 255.0, g / 255.0, b / 255.0, a / 255.0};
}

[[nodiscard]] inline auto ToRgba8(Color const& color) -> std::array<std::uint8_t, 4> {
    auto channel = [](double value) {
        return static_cast<std::uint8_t>(std::clamp(value, 0.0, 1.0) * 255.0 + 0.5);
    };
    return {channel(color.r), channel(color.g), channel(color.b), channel(color.a)};
}

inline auto Mix(Color base, Color target, double amount) -> Color {
    amount = std::clamp(amount, 0.0, 1.0);
    auto blend = [amount](double from, double to) {
        return std::clamp(from * (1.0 - amount) + to * amount, 0.0, 1.0);
    };
    return Color{blend(base.r, target.r), blend(base.g, target.g), blend(base.b, target.b), std::clamp(base.a, 0.0, 1.0)};
}

inline auto Lighten(Color color, double amount) -> Color {
    return Mix(color, Color{1.0, 1.0, 1.0, color.a}, amount);
}

inline auto Desaturate(Color color, double amount) -> Color {
    return Mix(color, Color{0.5, 0.5, 0.5, color.a}, amount);
}

struct ColorStop {
    double position = 0.0;
    Color  color{};

    auto operator==(ColorStop const&) const -> bool = default;
};

// Concrete gradient handed to the renderer. Angle in degrees, 90 is top to bottom.
struct LinearGradient {
    double                 angle = 90.0;
    std::vector<ColorStop> stops{
        ColorStop{0.0, Color{0.2, 0.2, 0.2, 1.0}},
        ColorStop{1.0, Color{0.1, 0.1, 0.1, 1.0}},
    };

    auto operator==(LinearGradient const&) const -> bool = default;
};

// Color at t in [0,1]; stops are sorted internally, values outside the ramp
// take the nearest end stop. An empty gradient samples as opaque black.
[[nodiscard]] auto SampleGradient(LinearGradient const& gradient, double t) -> Color;

} // namespace CP::Theme
