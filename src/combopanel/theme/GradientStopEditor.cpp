#include <combopanel/theme/GradientStopEditor.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace CP::Theme {

namespace {

constexpr double kSpacingTolerance = 1e-9;

auto is_clear_of(double position, std::vector<double> const& others) -> bool {
    return std::ranges::all_of(others, [position](double other) {
        return std::abs(position - other) >= kMinStopSpacing - kSpacingTolerance;
    });
}

auto pad_to_two(LinearGradientSourceConfig& gradient) -> void {
    if (gradient.stops.empty()) {
        gradient.stops.push_back(ColorStopSource::theme(0.0, 1));
    }
    if (gradient.stops.size() == 1) {
        auto second     = gradient.stops.front();
        second.position = gradient.stops.front().position >= 1.0 ? 0.0 : 1.0;
        gradient.stops.push_back(second);
    }
}

// More stops than fit at kMinStopSpacing in [0,1]; keep an even selection.
auto thin_to_max(std::vector<ColorStopSource>& stops) -> void {
    if (stops.size() <= kMaxGradientStops) {
        return;
    }
    [[maybe_unused]] auto const original = stops.size();
    std::vector<ColorStopSource> kept;
    kept.reserve(kMaxGradientStops);
    for (std::size_t i = 0; i < kMaxGradientStops; ++i) {
        kept.push_back(stops[i * (stops.size() - 1) / (kMaxGradientStops - 1)]);
    }
    stops = std::move(kept);
    cp_log("Gradient had " + std::to_string(original) + " stops, kept " + std::to_string(stops.size()), "Theme");
}

} // namespace

GradientStopEditor::GradientStopEditor(LinearGradientSourceConfig& gradient)
    : gradient_(gradient) {
    pad_to_two(gradient_);
    for (auto& stop : gradient_.stops) {
        stop.position = std::clamp(stop.position, 0.0, 1.0);
    }
    this->sort_stops();

    auto& stops = gradient_.stops;
    thin_to_max(stops);
    for (std::size_t i = 1; i < stops.size(); ++i) {
        stops[i].position = std::max(stops[i].position, stops[i - 1].position + kMinStopSpacing);
    }
    stops.back().position = std::min(stops.back().position, 1.0);
    for (std::size_t i = stops.size() - 1; i > 0; --i) {
        stops[i - 1].position = std::min(stops[i - 1].position, stops[i].position - kMinStopSpacing);
    }
    // Rounding at exactly kMaxGradientStops can leave the first stop a hair below 0.
    stops.front().position = std::max(stops.front().position, 0.0);
}

auto GradientStopEditor::add_stop() -> Expected<std::size_t> {
    auto const& stops = gradient_.stops;

    double best_gap = stops.front().position;
    double best_pos = stops.front().position / 2.0;
    for (std::size_t i = 0; i + 1 < stops.size(); ++i) {
        auto const gap = stops[i + 1].position - stops[i].position;
        if (gap > best_gap) {
            best_gap = gap;
            best_pos = (stops[i].position + stops[i + 1].position) / 2.0;
        }
    }
    auto const tail = 1.0 - stops.back().position;
    if (tail > best_gap) {
        best_gap = tail;
        best_pos = stops.back().position + tail / 2.0;
    }

    std::vector<double> positions;
    positions.reserve(stops.size());
    for (auto const& stop : stops) {
        positions.push_back(stop.position);
    }
    if (!is_clear_of(best_pos, positions)) {
        return std::unexpected(Error{Error::Code::OutOfRange, "no gap wide enough for another stop"});
    }

    gradient_.stops.push_back(ColorStopSource::custom(best_pos, kNewStopColor));
    this->sort_stops();
    auto it = std::ranges::find_if(gradient_.stops, [best_pos](ColorStopSource const& stop) { return stop.position == best_pos; });
    return static_cast<std::size_t>(std::distance(gradient_.stops.begin(), it));
}

auto GradientStopEditor::remove_stop(std::size_t index) -> Expected<void> {
    if (auto ok = this->check_index(index); !ok) {
        return std::unexpected(ok.error());
    }
    if (gradient_.stops.size() <= 2) {
        return std::unexpected(Error{Error::Code::OutOfRange, "a gradient needs at least two stops"});
    }
    gradient_.stops.erase(gradient_.stops.begin() + static_cast<std::ptrdiff_t>(index));
    return {};
}

auto GradientStopEditor::move_stop(std::size_t index, double position) -> Expected<std::size_t> {
    if (auto ok = this->check_index(index); !ok) {
        return std::unexpected(ok.error());
    }
    auto const target = std::clamp(position, 0.0, 1.0);

    std::vector<double> others;
    others.reserve(gradient_.stops.size());
    for (std::size_t i = 0; i < gradient_.stops.size(); ++i) {
        if (i != index) {
            others.push_back(gradient_.stops[i].position);
        }
    }

    std::vector<double> candidates{target, 0.0, 1.0};
    for (double other : others) {
        candidates.push_back(other - kMinStopSpacing);
        candidates.push_back(other + kMinStopSpacing);
    }

    double best          = target;
    double best_distance = std::numeric_limits<double>::infinity();
    for (double candidate : candidates) {
        if (candidate < 0.0 || candidate > 1.0 || !is_clear_of(candidate, others)) {
            continue;
        }
        auto const distance = std::abs(candidate - target);
        if (distance < best_distance) {
            best          = candidate;
            best_distance = distance;
        }
    }
    if (!std::isfinite(best_distance)) {
        return std::unexpected(Error{Error::Code::OutOfRange, "no room to move stop " + std::to_string(index)});
    }

    auto moved     = gradient_.stops[index];
    moved.position = best;
    gradient_.stops.erase(gradient_.stops.begin() + static_cast<std::ptrdiff_t>(index));
    auto insert_at = std::ranges::upper_bound(gradient_.stops, best, {}, &ColorStopSource::position);
    auto placed    = gradient_.stops.insert(insert_at, std::move(moved));
    return static_cast<std::size_t>(std::distance(gradient_.stops.begin(), placed));
}

auto GradientStopEditor::set_stop_color(std::size_t index, ColorSource color) -> Expected<void> {
    if (auto ok = this->check_index(index); !ok) {
        return std::unexpected(ok.error());
    }
    gradient_.stops[index].color = std::move(color);
    return {};
}

auto GradientStopEditor::set_angle(double degrees) -> void {
    gradient_.angle = degrees;
}

auto GradientStopEditor::check_index(std::size_t index) const -> Expected<void> {
    if (index >= gradient_.stops.size()) {
        return std::unexpected(Error{Error::Code::OutOfRange,
                                     "stop index " + std::to_string(index) + " out of range (" + std::to_string(gradient_.stops.size()) + " stops)"});
    }
    return {};
}

auto GradientStopEditor::sort_stops() -> void {
    std::ranges::stable_sort(gradient_.stops, {}, &ColorStopSource::position);
}

} // namespace CP::Theme
