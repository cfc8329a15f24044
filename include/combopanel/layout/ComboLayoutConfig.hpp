#pragma once

#include <combopanel/content/ContentItemRegistry.hpp>
#include <combopanel/layout/GroupLayout.hpp>
#include <combopanel/source/ComboSourceConfig.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace CP::Layout {

inline constexpr std::size_t kMinGroupCount = 1;
inline constexpr std::size_t kMaxGroupCount = 8;

struct SlotPlacement {
    std::string   slot_name;
    std::uint32_t group = 1;
    std::uint32_t index = 1;
    Rect          rect{};

    auto operator==(SlotPlacement const&) const -> bool = default;
};

/**
 * How a combo panel splits its content area: groups, their weights, and how
 * items are arranged inside each group.
 *
 * The group count is group_item_counts.size(). group_size_weights and
 * group_item_orientations may be shorter; missing weights count as 1.0 and
 * missing orientations follow layout_orientation.
 */
struct ComboLayoutConfig {
    SplitOrientation              layout_orientation = SplitOrientation::Vertical;
    std::vector<std::uint32_t>    group_item_counts{2};
    std::vector<double>           group_size_weights{1.0};
    std::vector<SplitOrientation> group_item_orientations{};
    double                        divider_width   = 10.0;
    double                        divider_padding = 4.0;
    double                        item_spacing    = 5.0;
    double                        content_padding = 5.0;
    // Legacy, read from old files only.
    std::uint32_t primary_count   = 0;
    std::uint32_t secondary_count = 0;

    [[nodiscard]] auto group_count() const -> std::size_t { return group_item_counts.size(); }

    /**
     * Resizes the per-group vectors to count (clamped to 1..8). New groups get
     * one item and weight 1.0; orientations are only extended when the list
     * was already in use. Retained groups keep their settings.
     */
    auto set_group_count(std::size_t count) -> void;
    [[nodiscard]] auto group_weight(std::size_t group) const -> double;
    [[nodiscard]] auto item_orientation(std::size_t group) const -> SplitOrientation;

    [[nodiscard]] auto slot_names() const -> std::vector<std::string>;

    // Adopts the group count and item counts of source, keeping retained weights.
    auto sync_to_source(Source::ComboSourceConfig const& source) -> void;
    // Returns true when legacy counts were turned into groups.
    auto migrate_legacy() -> bool;

    [[nodiscard]] auto group_rects(Rect const& content, DividerGeometry geometry) const -> GroupLayoutResult;
    [[nodiscard]] auto group_rects(Rect const& content) const -> GroupLayoutResult;
    // Item rectangles for every slot; graphs and items without auto height
    // take their item_height from registry.
    [[nodiscard]] auto item_rects(Rect const&                         content,
                                  DividerGeometry                     geometry,
                                  Content::ContentItemRegistry const& registry) const -> std::vector<SlotPlacement>;

    auto operator==(ComboLayoutConfig const&) const -> bool = default;
};

} // namespace CP::Layout
