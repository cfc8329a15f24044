#include <combopanel/content/SlotKey.hpp>
#include <combopanel/layout/ComboLayoutConfig.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace CP::Layout {

auto ComboLayoutConfig::set_group_count(std::size_t count) -> void {
    count = std::clamp(count, kMinGroupCount, kMaxGroupCount);
    group_item_counts.resize(count, 1);
    group_size_weights.resize(count, 1.0);
    if (!group_item_orientations.empty()) {
        group_item_orientations.resize(count, layout_orientation);
    }
}

auto ComboLayoutConfig::group_weight(std::size_t group) const -> double {
    if (group_size_weights.size() < group_count() || group >= group_size_weights.size()) {
        return 1.0;
    }
    return group_size_weights[group];
}

auto ComboLayoutConfig::item_orientation(std::size_t group) const -> SplitOrientation {
    return group < group_item_orientations.size() ? group_item_orientations[group] : layout_orientation;
}

auto ComboLayoutConfig::slot_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (std::size_t g = 0; g < group_item_counts.size(); ++g) {
        for (std::uint32_t i = 1; i <= group_item_counts[g]; ++i) {
            names.push_back(Content::SlotName(static_cast<std::uint32_t>(g + 1), i));
        }
    }
    return names;
}

auto ComboLayoutConfig::sync_to_source(Source::ComboSourceConfig const& source) -> void {
    this->set_group_count(source.groups.size());
    for (std::size_t g = 0; g < group_item_counts.size() && g < source.groups.size(); ++g) {
        group_item_counts[g] = std::clamp(source.groups[g].item_count, Source::kMinGroupItems, Source::kMaxGroupItems);
    }
}

auto ComboLayoutConfig::migrate_legacy() -> bool {
    bool migrated = false;
    if (group_item_counts.empty() && (primary_count > 0 || secondary_count > 0)) {
        cp_log("Migrating legacy layout counts: primary=" + std::to_string(primary_count)
                       + " secondary=" + std::to_string(secondary_count),
               "Migration");
        if (primary_count > 0) {
            group_item_counts.push_back(std::clamp(primary_count, Source::kMinGroupItems, Source::kMaxGroupItems));
        }
        if (secondary_count > 0) {
            group_item_counts.push_back(std::clamp(secondary_count, Source::kMinGroupItems, Source::kMaxGroupItems));
        }
        primary_count   = 0;
        secondary_count = 0;
        migrated        = true;
    }
    if (group_item_counts.empty()) {
        group_item_counts.push_back(2);
    }
    return migrated;
}

auto ComboLayoutConfig::group_rects(Rect const& content, DividerGeometry geometry) const -> GroupLayoutResult {
    GroupLayoutParams params{
        .content         = content,
        .group_count     = std::max(group_count(), kMinGroupCount),
        .weights         = group_size_weights,
        .divider_width   = geometry.width,
        .divider_padding = geometry.padding,
        .orientation     = layout_orientation,
    };
    return ComputeGroupLayout(params);
}

auto ComboLayoutConfig::group_rects(Rect const& content) const -> GroupLayoutResult {
    return this->group_rects(content, DividerGeometry{divider_width, divider_padding});
}

auto ComboLayoutConfig::item_rects(Rect const&                         content,
                                   DividerGeometry                     geometry,
                                   Content::ContentItemRegistry const& registry) const -> std::vector<SlotPlacement> {
    std::vector<SlotPlacement> placements;
    auto const                 groups = this->group_rects(content, geometry).groups;

    for (std::size_t g = 0; g < groups.size(); ++g) {
        auto const item_count = g < group_item_counts.size() ? group_item_counts[g] : std::uint32_t{1};
        auto const group_id   = static_cast<std::uint32_t>(g + 1);

        std::vector<std::optional<double>> fixed_sizes(item_count);
        for (std::uint32_t i = 0; i < item_count; ++i) {
            if (auto const* item = registry.find(Content::SlotName(group_id, i + 1))) {
                fixed_sizes[i] = item->fixed_extent();
            }
        }

        for (auto const& item : ComputeItemLayout(groups[g], item_count, item_spacing, fixed_sizes, this->item_orientation(g))) {
            auto const index = static_cast<std::uint32_t>(item.index + 1);
            placements.push_back(SlotPlacement{Content::SlotName(group_id, index), group_id, index, item.rect});
        }
    }
    return placements;
}

} // namespace CP::Layout
