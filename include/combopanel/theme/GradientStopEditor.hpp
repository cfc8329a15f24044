#pragma once

#include <combopanel/core/Error.hpp>
#include <combopanel/theme/ThemeSources.hpp>

#include <cstddef>

namespace CP::Theme {

inline constexpr double      kMinStopSpacing  = 0.01;
inline constexpr std::size_t kMaxGradientStops = 101;
inline constexpr Color       kNewStopColor{0.5, 0.5, 0.5, 1.0};

/**
 * Edits the stops of a gradient in place.
 *
 * Construction normalizes the gradient: it is padded to two stops, positions
 * are clamped to [0,1], sorted, thinned to kMaxGradientStops evenly picked
 * stops (always keeping the first and last), and spread to kMinStopSpacing. Every edit
 * leaves the stops sorted ascending with at least two entries and at least
 * kMinStopSpacing between neighbours; edits that cannot keep that shape fail
 * and leave the gradient unchanged.
 */
class GradientStopEditor {
public:
    explicit GradientStopEditor(LinearGradientSourceConfig& gradient);

    // Inserts a mid-gray custom stop in the middle of the widest gap,
    // counting the gaps before the first and after the last stop. Returns the
    // index of the new stop.
    auto add_stop() -> Expected<std::size_t>;
    auto remove_stop(std::size_t index) -> Expected<void>;
    // Moves a stop as close to position as spacing allows. Returns the stop's
    // index after re-sorting.
    auto move_stop(std::size_t index, double position) -> Expected<std::size_t>;
    auto set_stop_color(std::size_t index, ColorSource color) -> Expected<void>;
    auto set_angle(double degrees) -> void;

    [[nodiscard]] auto gradient() const -> LinearGradientSourceConfig const& { return gradient_; }
    [[nodiscard]] auto stop_count() const -> std::size_t { return gradient_.stops.size(); }

private:
    auto check_index(std::size_t index) const -> Expected<void>;
    auto sort_stops() -> void;

    LinearGradientSourceConfig& gradient_;
};

} // namespace CP::Theme
