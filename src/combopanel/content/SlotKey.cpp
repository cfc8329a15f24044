#include <combopanel/content/SlotKey.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace CP::Content {

namespace {

constexpr std::string_view kGroupPrefix     = "group";
constexpr std::string_view kPrimaryPrefix   = "primary";
constexpr std::string_view kSecondaryPrefix = "secondary";

auto is_digit(char ch) -> bool {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

auto parse_number(std::string_view digits) -> std::optional<std::uint32_t> {
    if (digits.empty()) {
        return std::nullopt;
    }
    std::uint32_t value = 0;
    auto [ptr, ec]      = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

auto first_digit_run(std::string_view text) -> std::string_view {
    auto begin = std::ranges::find_if(text, is_digit);
    if (begin == text.end()) {
        return {};
    }
    auto end = std::find_if_not(begin, text.end(), is_digit);
    return text.substr(static_cast<std::size_t>(begin - text.begin()), static_cast<std::size_t>(end - begin));
}

auto invalid(std::string_view name) -> Error {
    return Error{Error::Code::InvalidSlotName, "invalid slot name '" + std::string(name) + "'"};
}

auto parse_grouped(std::string_view name) -> std::optional<GroupedSlot> {
    auto rest = name.substr(kGroupPrefix.size());
    auto sep  = rest.find('_');
    if (sep == std::string_view::npos) {
        return std::nullopt;
    }
    auto group = parse_number(rest.substr(0, sep));
    auto index = parse_number(rest.substr(sep + 1));
    if (!group || !index || *group == 0 || *index == 0) {
        return std::nullopt;
    }
    return GroupedSlot{*group, *index};
}

} // namespace

namespace Detail {

auto LogSlotCollision(std::string const& from, std::string const& to) -> void {
    cp_log("Slot '" + from + "' dropped: '" + to + "' already exists", "Migration");
}

} // namespace Detail

auto ParseSlotKey(std::string_view name) -> Expected<SlotKey> {
    if (name.starts_with(kGroupPrefix)) {
        if (auto grouped = parse_grouped(name)) {
            return SlotKey{*grouped};
        }
        return std::unexpected(invalid(name));
    }

    std::optional<LegacyRole> role;
    if (name.starts_with(kPrimaryPrefix)) {
        role = LegacyRole::Primary;
    } else if (name.starts_with(kSecondaryPrefix)) {
        role = LegacyRole::Secondary;
    }
    if (!role) {
        return std::unexpected(invalid(name));
    }
    auto index = parse_number(first_digit_run(name));
    if (!index || *index == 0) {
        return std::unexpected(invalid(name));
    }
    return SlotKey{LegacySlot{*role, *index}};
}

auto SlotName(GroupedSlot slot) -> std::string {
    return SlotName(slot.group, slot.index);
}

auto SlotName(std::uint32_t group, std::uint32_t index) -> std::string {
    return std::string(kGroupPrefix) + std::to_string(group) + "_" + std::to_string(index);
}

auto ToGrouped(SlotKey const& key) -> GroupedSlot {
    if (auto const* legacy = std::get_if<LegacySlot>(&key)) {
        return GroupedSlot{legacy->role == LegacyRole::Primary ? 1u : 2u, legacy->index};
    }
    return std::get<GroupedSlot>(key);
}

} // namespace CP::Content
