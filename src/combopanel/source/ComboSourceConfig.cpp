#include <combopanel/content/SlotKey.hpp>
#include <combopanel/source/ComboSourceConfig.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <numeric>

namespace CP::Source {

auto ComboSourceConfig::migrate_legacy() -> void {
    if (groups.empty() && (primary_count > 0 || secondary_count > 0)) {
        if (primary_count > 0) {
            groups.push_back(GroupConfig{std::clamp(primary_count, kMinGroupItems, kMaxGroupItems), 1.0});
        }
        if (secondary_count > 0) {
            groups.push_back(GroupConfig{std::clamp(secondary_count, kMinGroupItems, kMaxGroupItems), 1.0});
        }
        [[maybe_unused]] auto const rewritten = Content::MigrateLegacySlotKeys(slots);
        cp_log("Migrated legacy source config: primary=" + std::to_string(primary_count) + " secondary="
                       + std::to_string(secondary_count) + " slots rewritten=" + std::to_string(rewritten),
               "Migration");
        primary_count   = 0;
        secondary_count = 0;
    }

    if (groups.empty()) {
        groups.push_back(GroupConfig{2, 1.0});
    }
}

auto ComboSourceConfig::total_item_count() const -> std::uint32_t {
    return std::accumulate(groups.begin(), groups.end(), std::uint32_t{0},
                           [](std::uint32_t sum, GroupConfig const& group) { return sum + group.item_count; });
}

auto ComboSourceConfig::slot_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(total_item_count());
    for (std::size_t g = 0; g < groups.size(); ++g) {
        for (std::uint32_t i = 1; i <= groups[g].item_count; ++i) {
            names.push_back(Content::SlotName(static_cast<std::uint32_t>(g + 1), i));
        }
    }
    return names;
}

} // namespace CP::Source
