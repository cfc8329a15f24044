#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace CP::Source {

inline constexpr std::uint32_t kMinGroupItems = 1;
inline constexpr std::uint32_t kMaxGroupItems = 8;

// Binding of one slot to a child data source. source_config is handed to the
// child source untouched.
struct SlotConfig {
    std::string    source_id;
    std::string    caption_override;
    nlohmann::json source_config = nlohmann::json::object();

    auto operator==(SlotConfig const&) const -> bool = default;
};

struct GroupConfig {
    std::uint32_t item_count  = 1;
    double        size_weight = 1.0;

    auto operator==(GroupConfig const&) const -> bool = default;
};

/**
 * Data-source side of a combo panel: the groups, and which child source feeds
 * each "group{G}_{N}" slot.
 *
 * Files written before groups existed carry primary_count/secondary_count and
 * "primary"/"secondary" prefixed slot keys instead; migrate_legacy() converts them and
 * runs on every load. The legacy counts are read but never written back.
 */
struct ComboSourceConfig {
    std::string                       mode = "lcars";
    std::vector<GroupConfig>          groups{GroupConfig{2, 1.0}};
    std::uint32_t                     primary_count   = 0;
    std::uint32_t                     secondary_count = 0;
    std::map<std::string, SlotConfig> slots;
    std::uint64_t                     update_interval_ms = 1000;

    // No-op once groups is non-empty. Afterwards groups is never empty
    // (one group of two items when there was nothing to migrate) and the
    // legacy counts are zero.
    auto migrate_legacy() -> void;

    [[nodiscard]] auto total_item_count() const -> std::uint32_t;
    [[nodiscard]] auto update_interval() const -> std::chrono::milliseconds { return std::chrono::milliseconds(update_interval_ms); }
    // "group{G}_{N}" for every item, group by group.
    [[nodiscard]] auto slot_names() const -> std::vector<std::string>;

    auto operator==(ComboSourceConfig const&) const -> bool = default;
};

} // namespace CP::Source
