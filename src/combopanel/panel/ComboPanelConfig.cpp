#include <combopanel/panel/ComboPanelConfig.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace CP::Panel {

auto ComboPanelConfig::ForStyle(Theme::ComboStyle style) -> ComboPanelConfig {
    ComboPanelConfig config;
    config.style = style;
    config.theme = Theme::DefaultThemeFor(style);
    return config;
}

auto ComboPanelConfig::migrate_legacy() -> void {
    if (layout.migrate_legacy()) {
        [[maybe_unused]] auto const rewritten = content_items.migrate_legacy_keys();
        cp_log("Migrated " + std::to_string(rewritten) + " legacy content item keys", "Migration");
    }
}

auto ComboPanelConfig::ensure_content_items(std::span<Content::FieldMetadata const> fields) -> void {
    for (auto const& name : layout.slot_names()) {
        content_items.get_or_create_default(name, fields);
    }
}

auto ComboPanelConfig::divider_geometry() const -> Layout::DividerGeometry {
    return Theme::DividerGeometryFor(style, layout.divider_width, layout.divider_padding);
}

auto ComboPanelConfig::content_rect(Layout::Rect const& canvas) const -> Layout::Rect {
    auto const pad = layout.content_padding;
    return Layout::Rect{canvas.x + pad, canvas.y + pad, canvas.width - 2.0 * pad, canvas.height - 2.0 * pad};
}

auto ComboPanelConfig::group_layout(Layout::Rect const& canvas) const -> Layout::GroupLayoutResult {
    return layout.group_rects(this->content_rect(canvas), this->divider_geometry());
}

auto ComboPanelConfig::item_layout(Layout::Rect const& canvas) const -> std::vector<Layout::SlotPlacement> {
    return layout.item_rects(this->content_rect(canvas), this->divider_geometry(), content_items);
}

auto ComboPanelConfig::to_transferable() const -> TransferableComboConfig {
    return TransferableComboConfig{
        .layout            = layout,
        .content_items     = content_items,
        .animation_enabled = animation_enabled,
        .animation_speed   = animation_speed,
    };
}

auto ComboPanelConfig::apply_transferable(TransferableComboConfig const& transfer) -> void {
    layout            = transfer.layout;
    content_items     = transfer.content_items;
    animation_enabled = transfer.animation_enabled;
    animation_speed   = transfer.animation_speed;
}

} // namespace CP::Panel
