#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace CP::Layout {

// Vertical stacks groups (or items) top to bottom; Horizontal lays them out
// left to right.
enum class SplitOrientation {
    Horizontal,
    Vertical,
};

struct Rect {
    double x      = 0.0;
    double y      = 0.0;
    double width  = 0.0;
    double height = 0.0;

    auto operator==(Rect const&) const -> bool = default;
};

// Divider thickness and the gap kept on each side of it.
struct DividerGeometry {
    double width   = 0.0;
    double padding = 0.0;

    auto operator==(DividerGeometry const&) const -> bool = default;
};

struct GroupLayoutParams {
    Rect                content{};
    std::size_t         group_count     = 1;
    std::vector<double> weights{};
    double              divider_width   = 0.0;
    double              divider_padding = 0.0;
    SplitOrientation    orientation     = SplitOrientation::Vertical;
};

struct GroupLayoutResult {
    std::vector<Rect> groups;
    // One per gap between consecutive groups. A divider is divider_width
    // thick, starts divider_padding past the end of the preceding group and
    // spans that group's cross-axis extent.
    std::vector<Rect> dividers;
};

/**
 * Partitions params.content into group_count rectangles along the split axis.
 *
 * Weights shorter than group_count are ignored and every group gets 1.0;
 * extra weights are ignored. A total weight
 * of zero splits evenly. When the dividers need more room than the content
 * has, group extents come out negative; they are not clamped.
 */
[[nodiscard]] auto ComputeGroupLayout(GroupLayoutParams const& params) -> GroupLayoutResult;

struct ItemPlacement {
    std::size_t index = 0;
    Rect        rect{};

    auto operator==(ItemPlacement const&) const -> bool = default;
};

/**
 * Places item_count items inside a group rectangle.
 *
 * fixed_sizes[i], when set, is the main-axis extent of item i; the rest of
 * the space (minus spacing) is shared evenly by the other items. Each item is
 * cut to the space left in the group, and items left with no space are
 * dropped, so the result may hold fewer entries than item_count.
 */
[[nodiscard]] auto ComputeItemLayout(Rect const&                               group,
                                     std::size_t                               item_count,
                                     double                                    spacing,
                                     std::vector<std::optional<double>> const& fixed_sizes,
                                     SplitOrientation                          orientation) -> std::vector<ItemPlacement>;

} // namespace CP::Layout
