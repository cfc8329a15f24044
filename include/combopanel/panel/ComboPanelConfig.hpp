#pragma once

#include <combopanel/content/ContentItemRegistry.hpp>
#include <combopanel/layout/ComboLayoutConfig.hpp>
#include <combopanel/theme/ComboStyle.hpp>
#include <combopanel/theme/ComboTheme.hpp>

#include <span>

namespace CP::Panel {

// The part of a panel that survives switching it to another combo style.
struct TransferableComboConfig {
    Layout::ComboLayoutConfig    layout{};
    Content::ContentItemRegistry content_items{};
    bool                         animation_enabled = true;
    double                       animation_speed   = 8.0;

    auto operator==(TransferableComboConfig const&) const -> bool = default;
};

struct ComboPanelConfig {
    Theme::ComboStyle            style = Theme::ComboStyle::Lcars;
    Theme::ComboThemeConfig      theme{};
    Layout::ComboLayoutConfig    layout{};
    Content::ContentItemRegistry content_items{};
    bool                         animation_enabled = true;
    double                       animation_speed   = 8.0;

    // Defaults for style, with that style's theme preset.
    [[nodiscard]] static auto ForStyle(Theme::ComboStyle style) -> ComboPanelConfig;

    // Migrates the layout's legacy counts and, when that happened, the legacy
    // content item keys along with them.
    auto migrate_legacy() -> void;

    // Makes sure every slot of the layout has a content item, suggesting
    // display types from fields for the new ones.
    auto ensure_content_items(std::span<Content::FieldMetadata const> fields) -> void;

    [[nodiscard]] auto divider_geometry() const -> Layout::DividerGeometry;
    // Canvas inset by the layout's content padding on every side.
    [[nodiscard]] auto content_rect(Layout::Rect const& canvas) const -> Layout::Rect;
    [[nodiscard]] auto group_layout(Layout::Rect const& canvas) const -> Layout::GroupLayoutResult;
    [[nodiscard]] auto item_layout(Layout::Rect const& canvas) const -> std::vector<Layout::SlotPlacement>;

    [[nodiscard]] auto to_transferable() const -> TransferableComboConfig;
    // Replaces layout, content items and animation settings; style and theme stay.
    auto apply_transferable(TransferableComboConfig const& transfer) -> void;

    auto operator==(ComboPanelConfig const&) const -> bool = default;
};

} // namespace CP::Panel
