#include <combopanel/theme/Color.hpp>

#include <algorithm>

namespace CP::Theme {

auto SampleGradient(LinearGradient const& gradient, double t) -> Color {
    if (gradient.stops.empty()) {
        return Color{};
    }
    auto stops = gradient.stops;
    std::ranges::stable_sort(stops, {}, &ColorStop::position);

    if (t <= stops.front().position) {
        return stops.front().color;
    }
    if (t >= stops.back().position) {
        return stops.back().color;
    }
    for (std::size_t i = 1; i < stops.size(); ++i) {
        auto const& lo = stops[i - 1];
        auto const& hi = stops[i];
        if (t > hi.position) {
            continue;
        }
        auto const span = hi.position - lo.position;
        if (span <= 0.0) {
            return hi.color;
        }
        auto const f = (t - lo.position) / span;
        return Color{
            lo.color.r + (hi.color.r - lo.color.r) * f,
            lo.color.g + (hi.color.g - lo.color.g) * f,
            lo.color.b + (hi.color.b - lo.color.b) * f,
            lo.color.a + (hi.color.a - lo.color.a) * f,
        };
    }
    return stops.back().color;
}

} // namespace CP::Theme
