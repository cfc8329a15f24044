#pragma once

#include <combopanel/core/Error.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace CP::Content {

enum class LegacyRole {
    Primary,
    Secondary,
};

// "primary3", "secondary_2_value": the role plus the first digit run.
struct LegacySlot {
    LegacyRole    role  = LegacyRole::Primary;
    std::uint32_t index = 1;

    auto operator==(LegacySlot const&) const -> bool = default;
};

// "group{G}_{N}", both 1-based.
struct GroupedSlot {
    std::uint32_t group = 1;
    std::uint32_t index = 1;

    auto operator==(GroupedSlot const&) const -> bool = default;
};

using SlotKey = std::variant<LegacySlot, GroupedSlot>;

namespace Detail {
auto LogSlotCollision(std::string const& from, std::string const& to) -> void;
} // namespace Detail

// Fails with InvalidSlotName for anything that is neither a grouped name nor a
// legacy name carrying a nonzero digit run. Leading zeros are dropped, so
// "primary01" is the same slot as "primary1".
[[nodiscard]] auto ParseSlotKey(std::string_view name) -> Expected<SlotKey>;
[[nodiscard]] auto SlotName(GroupedSlot slot) -> std::string;
[[nodiscard]] auto SlotName(std::uint32_t group, std::uint32_t index) -> std::string;
// Primary maps to group 1 and Secondary to group 2; grouped keys pass through.
[[nodiscard]] auto ToGrouped(SlotKey const& key) -> GroupedSlot;

/**
 * Rewrites legacy keys of a slot-keyed map to grouped names.
 *
 * Keys that are not legacy (or carry no digits) are left alone. When the
 * grouped name already exists the existing entry wins and the legacy entry is
 * dropped. Returns the number of keys rewritten.
 */
template <typename T>
auto MigrateLegacySlotKeys(std::map<std::string, T>& entries) -> std::size_t {
    std::vector<std::pair<std::string, std::string>> renames;
    for (auto const& [name, value] : entries) {
        auto key = ParseSlotKey(name);
        if (key && std::holds_alternative<LegacySlot>(*key)) {
            renames.emplace_back(name, SlotName(ToGrouped(*key)));
        }
    }

    std::size_t migrated = 0;
    for (auto const& [from, to] : renames) {
        auto node = entries.extract(from);
        if (entries.contains(to)) {
            Detail::LogSlotCollision(from, to);
            continue;
        }
        node.key() = to;
        entries.insert(std::move(node));
        ++migrated;
    }
    return migrated;
}

} // namespace CP::Content
