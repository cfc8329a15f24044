#include <combopanel/content/SlotKey.hpp>
#include <combopanel/panel/EditorSession.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <variant>

namespace CP::Panel {

namespace {

auto check_color_index(int index) -> Expected<void> {
    if (index < 1 || index > Theme::kThemeColorCount) {
        return std::unexpected(Error{Error::Code::OutOfRange, "theme color index " + std::to_string(index) + " not in 1..4"});
    }
    return {};
}

auto theme_color_slot(Theme::ComboThemeConfig& theme, int index) -> Theme::Color& {
    switch (index) {
    case 1:
        return theme.color1;
    case 2:
        return theme.color2;
    case 3:
        return theme.color3;
    default:
        return theme.color4;
    }
}

} // namespace

EditorSession::EditorSession(ComboPanelConfig config)
    : panel_(std::move(config)) {}

auto EditorSession::subscribe(Theme::ThemeRefreshBus::Callback callback) -> Theme::ThemeRefreshBus::SubscriptionId {
    return bus_.subscribe(std::move(callback));
}

auto EditorSession::set_theme_color(int index, Theme::Color color) -> Expected<void> {
    if (auto ok = check_color_index(index); !ok) {
        return ok;
    }
    Theme::UpdateScope scope(gate_);
    theme_color_slot(panel_.theme, index) = color;
    this->theme_changed(scope);
    return {};
}

auto EditorSession::set_theme_font(int index, std::string family, double size) -> Expected<void> {
    if (index < 1 || index > Theme::kThemeFontCount) {
        return std::unexpected(Error{Error::Code::OutOfRange, "theme font index " + std::to_string(index) + " not in 1..2"});
    }
    if (!(size > 0.0)) {
        return std::unexpected(Error{Error::Code::OutOfRange, "font size must be positive"});
    }
    Theme::UpdateScope scope(gate_);
    if (index == 1) {
        panel_.theme.font1_family = std::move(family);
        panel_.theme.font1_size   = size;
    } else {
        panel_.theme.font2_family = std::move(family);
        panel_.theme.font2_size   = size;
    }
    this->theme_changed(scope);
    return {};
}

auto EditorSession::set_theme_gradient(Theme::LinearGradientSourceConfig gradient) -> void {
    Theme::UpdateScope scope(gate_);
    panel_.theme.gradient = std::move(gradient);
    this->theme_changed(scope);
}

auto EditorSession::apply_preset(Theme::ComboThemeConfig const& preset) -> void {
    Theme::UpdateScope scope(gate_);
    panel_.theme = preset;
    this->theme_changed(scope);
}

auto EditorSession::apply_style_preset(Theme::ComboStyle style) -> void {
    this->apply_preset(Theme::DefaultThemeFor(style));
}

auto EditorSession::set_group_count(std::size_t count) -> void {
    panel_.layout.set_group_count(count);
}

auto EditorSession::set_display_type(std::string const& slot_name, Content::ContentDisplayType type) -> Expected<void> {
    auto item = this->mutable_content_item(slot_name);
    if (!item) {
        return std::unexpected(item.error());
    }
    (*item)->display_as = type;
    return {};
}

auto EditorSession::mutable_content_item(std::string const& slot_name) -> Expected<Content::ContentItemConfig*> {
    auto key = Content::ParseSlotKey(slot_name);
    if (!key) {
        return std::unexpected(key.error());
    }
    // Only canonical grouped names; legacy keys are rewritten on load.
    auto const* grouped = std::get_if<Content::GroupedSlot>(&*key);
    if (grouped == nullptr || Content::SlotName(*grouped) != slot_name) {
        return std::unexpected(Error{Error::Code::InvalidSlotName, "'" + slot_name + "' is not a group{G}_{N} slot name"});
    }
    return &panel_.content_items.get_or_create_default(slot_name, {});
}

auto EditorSession::copy_theme_color(int index) -> Expected<void> {
    if (auto ok = check_color_index(index); !ok) {
        return ok;
    }
    clipboard_.copy_color(panel_.theme.get_color(index));
    return {};
}

auto EditorSession::paste_theme_color(int index) -> Expected<void> {
    auto color = clipboard_.paste_color();
    if (!color) {
        return std::unexpected(Error{Error::Code::NotFound, "clipboard holds no color"});
    }
    return this->set_theme_color(index, *color);
}

auto EditorSession::copy_content_item(std::string const& slot_name) -> Expected<void> {
    auto const* item = panel_.content_items.find(slot_name);
    if (item == nullptr) {
        return std::unexpected(Error{Error::Code::NotFound, "no content item for slot '" + slot_name + "'"});
    }
    clipboard_.copy_content_item(*item);
    return {};
}

auto EditorSession::paste_content_item(std::string const& slot_name) -> Expected<void> {
    auto item = clipboard_.paste_content_item();
    if (!item) {
        return std::unexpected(Error{Error::Code::NotFound, "clipboard holds no content item"});
    }
    auto target = this->mutable_content_item(slot_name);
    if (!target) {
        return std::unexpected(target.error());
    }
    **target = std::move(*item);
    return {};
}

auto EditorSession::theme_changed(Theme::UpdateScope const& scope) -> void {
    dirty_ = true;
    if (scope.is_outermost()) {
        this->flush();
    }
}

auto EditorSession::flush() -> void {
    // A listener may change the theme again; keep notifying until it settles.
    while (dirty_) {
        dirty_ = false;
        cp_log("Theme changed, notifying " + std::to_string(bus_.size()) + " listeners", "Theme");
        bus_.refresh(panel_.theme);
    }
}

} // namespace CP::Panel
