#pragma once

#include <combopanel/core/Error.hpp>
#include <combopanel/panel/Clipboard.hpp>
#include <combopanel/panel/ComboPanelConfig.hpp>
#include <combopanel/theme/ThemeRefreshBus.hpp>
#include <combopanel/theme/UpdateGate.hpp>

#include <string>
#include <utility>

namespace CP::Panel {

/**
 * Editing state of one panel: the config being edited, the clipboard shared
 * by its editors and the listeners that show theme-derived values.
 *
 * Theme setters validate their input, apply it and notify the refresh bus
 * once. Inside batch(), or while listeners are being notified, setters only
 * apply; the outermost batch sends a single notification at the end.
 * Listeners that write back into the session should check is_updating() and
 * return early.
 */
class EditorSession {
public:
    explicit EditorSession(ComboPanelConfig config = ComboPanelConfig{});

    [[nodiscard]] auto panel() const -> ComboPanelConfig const& { return panel_; }
    [[nodiscard]] auto theme() const -> Theme::ComboThemeConfig const& { return panel_.theme; }
    [[nodiscard]] auto clipboard() -> Clipboard& { return clipboard_; }
    [[nodiscard]] auto refresh_bus() -> Theme::ThemeRefreshBus& { return bus_; }
    [[nodiscard]] auto is_updating() const -> bool { return gate_.is_updating(); }

    auto subscribe(Theme::ThemeRefreshBus::Callback callback) -> Theme::ThemeRefreshBus::SubscriptionId;

    auto set_theme_color(int index, Theme::Color color) -> Expected<void>;
    auto set_theme_font(int index, std::string family, double size) -> Expected<void>;
    auto set_theme_gradient(Theme::LinearGradientSourceConfig gradient) -> void;
    auto apply_preset(Theme::ComboThemeConfig const& preset) -> void;
    auto apply_style_preset(Theme::ComboStyle style) -> void;

    auto set_group_count(std::size_t count) -> void;
    auto set_display_type(std::string const& slot_name, Content::ContentDisplayType type) -> Expected<void>;
    auto mutable_content_item(std::string const& slot_name) -> Expected<Content::ContentItemConfig*>;

    auto copy_theme_color(int index) -> Expected<void>;
    auto paste_theme_color(int index) -> Expected<void>;
    auto copy_content_item(std::string const& slot_name) -> Expected<void>;
    auto paste_content_item(std::string const& slot_name) -> Expected<void>;

    // Runs fn(*this) as one update; listeners are notified at most once.
    template <typename Fn>
    auto batch(Fn&& fn) -> void {
        Theme::UpdateScope scope(gate_);
        std::forward<Fn>(fn)(*this);
        if (scope.is_outermost()) {
            this->flush();
        }
    }

private:
    auto theme_changed(Theme::UpdateScope const& scope) -> void;
    auto flush() -> void;

    ComboPanelConfig       panel_;
    Clipboard              clipboard_;
    Theme::ThemeRefreshBus bus_;
    Theme::UpdateGate      gate_;
    bool                   dirty_ = false;
};

} // namespace CP::Panel
