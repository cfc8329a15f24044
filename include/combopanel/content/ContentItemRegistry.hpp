#pragma once

#include <combopanel/content/DisplayConfigs.hpp>
#include <combopanel/content/FieldMetadata.hpp>

#include <map>
#include <span>
#include <string>
#include <string_view>

namespace CP::Content {

// Display configuration per slot name, ordered by name.
class ContentItemRegistry {
public:
    using Map = std::map<std::string, ContentItemConfig>;

    ContentItemRegistry() = default;
    explicit ContentItemRegistry(Map items)
        : items_(std::move(items)) {}

    /**
     * Returns the config for slot_name, inserting one first if needed.
     *
     * A new entry's display type is suggested from the fields whose id starts
     * with "{slot_name}_"; when no field matches it is a Bar.
     */
    auto get_or_create_default(std::string const& slot_name, std::span<FieldMetadata const> fields) -> ContentItemConfig&;

    [[nodiscard]] auto find(std::string_view slot_name) const -> ContentItemConfig const*;
    [[nodiscard]] auto find(std::string_view slot_name) -> ContentItemConfig*;
    auto set(std::string const& slot_name, ContentItemConfig config) -> void;
    auto erase(std::string_view slot_name) -> bool;

    // Moves every entry whose key starts with old_prefix to new_prefix + rest.
    // Entries already present under the new key are kept.
    auto rename_prefix(std::string_view old_prefix, std::string_view new_prefix) -> std::size_t;
    // primary*/secondary* keys become group1_*/group2_*.
    auto migrate_legacy_keys() -> std::size_t;

    [[nodiscard]] auto contains(std::string_view slot_name) const -> bool { return find(slot_name) != nullptr; }
    [[nodiscard]] auto size() const -> std::size_t { return items_.size(); }
    [[nodiscard]] auto empty() const -> bool { return items_.empty(); }
    [[nodiscard]] auto items() const -> Map const& { return items_; }

    auto operator==(ContentItemRegistry const&) const -> bool = default;

private:
    Map items_;
};

} // namespace CP::Content
