#include <combopanel/config/DebugFlags.hpp>
#include <combopanel/layout/GroupLayout.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <numeric>
#include <string>

namespace CP::Layout {

namespace {

struct AxisSpan {
    double start  = 0.0;
    double extent = 0.0;
};

auto main_span(Rect const& rect, SplitOrientation orientation) -> AxisSpan {
    return orientation == SplitOrientation::Horizontal ? AxisSpan{rect.x, rect.width} : AxisSpan{rect.y, rect.height};
}

auto make_rect(Rect const& container, SplitOrientation orientation, double main_start, double main_extent) -> Rect {
    if (orientation == SplitOrientation::Horizontal) {
        return Rect{main_start, container.y, main_extent, container.height};
    }
    return Rect{container.x, main_start, container.width, main_extent};
}

// A weight list that does not cover every group is ignored as a whole.
auto effective_weights(std::vector<double> const& weights, std::size_t count) -> std::vector<double> {
    if (weights.size() < count) {
        return std::vector<double>(count, 1.0);
    }
    return std::vector<double>(weights.begin(), weights.begin() + static_cast<std::ptrdiff_t>(count));
}

} // namespace

auto ComputeGroupLayout(GroupLayoutParams const& params) -> GroupLayoutResult {
    GroupLayoutResult result;

    auto const count         = std::max<std::size_t>(params.group_count, 1);
    auto const weights       = effective_weights(params.weights, count);
    auto const divider_count = count - 1;
    auto const gap           = params.divider_width + params.divider_padding * 2.0;
    auto const span          = main_span(params.content, params.orientation);
    auto const available     = span.extent - static_cast<double>(divider_count) * gap;

    if (available < 0.0 && Config::LayoutDiagnosticsEnabled()) {
        cp_log("Group layout overflow: dividers need " + std::to_string(static_cast<double>(divider_count) * gap)
                       + " but content extent is " + std::to_string(span.extent),
               "Layout");
    }

    auto const total_weight = std::accumulate(weights.begin(), weights.end(), 0.0);

    result.groups.reserve(count);
    result.dividers.reserve(divider_count);

    double offset = span.start;
    for (std::size_t i = 0; i < count; ++i) {
        auto const share  = total_weight > 0.0 ? weights[i] / total_weight : 1.0 / static_cast<double>(count);
        auto const extent = available * share;
        auto const group  = make_rect(params.content, params.orientation, offset, extent);
        result.groups.push_back(group);
        offset += extent;

        if (i < divider_count) {
            result.dividers.push_back(
                    make_rect(group, params.orientation, offset + params.divider_padding, params.divider_width));
            offset += gap;
        }
    }
    return result;
}

auto ComputeItemLayout(Rect const&                               group,
                       std::size_t                               item_count,
                       double                                    spacing,
                       std::vector<std::optional<double>> const& fixed_sizes,
                       SplitOrientation                          orientation) -> std::vector<ItemPlacement> {
    std::vector<ItemPlacement> placements;
    if (item_count == 0) {
        return placements;
    }

    auto fixed_for = [&](std::size_t index) -> std::optional<double> {
        return index < fixed_sizes.size() ? fixed_sizes[index] : std::nullopt;
    };

    double      fixed_total = 0.0;
    std::size_t flex_count  = 0;
    for (std::size_t i = 0; i < item_count; ++i) {
        if (auto fixed = fixed_for(i)) {
            fixed_total += *fixed;
        } else {
            ++flex_count;
        }
    }

    auto const span          = main_span(group, orientation);
    auto const total_spacing = static_cast<double>(item_count - 1) * spacing;
    auto const flex_total    = std::max(span.extent - fixed_total - total_spacing, 0.0);
    auto const flex_size     = flex_count > 0 ? flex_total / static_cast<double>(flex_count) : 0.0;

    placements.reserve(item_count);
    double cursor = span.start;
    for (std::size_t i = 0; i < item_count; ++i) {
        auto extent = fixed_for(i).value_or(flex_size);
        extent      = std::min(extent, span.extent - (cursor - span.start));
        if (extent <= 0.0) {
            continue;
        }
        placements.push_back(ItemPlacement{i, make_rect(group, orientation, cursor, extent)});
        cursor += extent + spacing;
    }
    return placements;
}

} // namespace CP::Layout
