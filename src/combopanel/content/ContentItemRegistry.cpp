#include <combopanel/content/ContentItemRegistry.hpp>
#include <combopanel/content/SlotKey.hpp>

#include "log/TaggedLogger.hpp"

#include <vector>

namespace CP::Content {

auto ContentItemRegistry::get_or_create_default(std::string const& slot_name, std::span<FieldMetadata const> fields) -> ContentItemConfig& {
    if (auto it = items_.find(slot_name); it != items_.end()) {
        return it->second;
    }
    auto const         matching = FieldsForSlot(fields, slot_name);
    ContentItemConfig  config;
    config.display_as = matching.empty() ? ContentDisplayType::Bar : SuggestDisplayType(matching);
    return items_.emplace(slot_name, std::move(config)).first->second;
}

auto ContentItemRegistry::find(std::string_view slot_name) const -> ContentItemConfig const* {
    auto it = items_.find(std::string(slot_name));
    return it == items_.end() ? nullptr : &it->second;
}

auto ContentItemRegistry::find(std::string_view slot_name) -> ContentItemConfig* {
    auto it = items_.find(std::string(slot_name));
    return it == items_.end() ? nullptr : &it->second;
}

auto ContentItemRegistry::set(std::string const& slot_name, ContentItemConfig config) -> void {
    items_.insert_or_assign(slot_name, std::move(config));
}

auto ContentItemRegistry::erase(std::string_view slot_name) -> bool {
    return items_.erase(std::string(slot_name)) > 0;
}

auto ContentItemRegistry::rename_prefix(std::string_view old_prefix, std::string_view new_prefix) -> std::size_t {
    if (old_prefix == new_prefix) {
        return 0;
    }
    std::vector<std::string> matching;
    for (auto const& [name, config] : items_) {
        if (name.starts_with(old_prefix)) {
            matching.push_back(name);
        }
    }

    std::size_t renamed = 0;
    for (auto const& name : matching) {
        auto target = std::string(new_prefix) + name.substr(old_prefix.size());
        auto node   = items_.extract(name);
        if (items_.contains(target)) {
            cp_log("Content item '" + name + "' dropped: '" + target + "' already exists", "Migration");
            continue;
        }
        node.key() = std::move(target);
        items_.insert(std::move(node));
        ++renamed;
    }
    return renamed;
}

auto ContentItemRegistry::migrate_legacy_keys() -> std::size_t {
    return MigrateLegacySlotKeys(items_);
}

} // namespace CP::Content
