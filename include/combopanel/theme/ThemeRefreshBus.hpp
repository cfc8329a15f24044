#pragma once

#include <combopanel/core/Error.hpp>
#include <combopanel/theme/ComboTheme.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace CP::Theme {

/**
 * Ordered list of theme listeners, one per widget or resolver that shows
 * theme-derived values.
 *
 * refresh() calls every listener once, in subscription order, with the new
 * theme. Subscriptions are keyed by a stable id so a listener can be replaced
 * or removed without disturbing the order of the others. Calls made from
 * inside a listener are deferred: subscribe/replace take effect after the
 * current pass, unsubscribe silences the entry immediately, and a nested
 * refresh() runs one more pass with the latest theme once the current pass
 * finishes. A listener that throws ends the pass; the exception propagates
 * and the bus stays usable.
 */
class ThemeRefreshBus {
public:
    using Callback       = std::function<void(ComboThemeConfig const&)>;
    using SubscriptionId = std::uint64_t;

    auto subscribe(Callback callback) -> SubscriptionId;
    auto replace(SubscriptionId id, Callback callback) -> Expected<void>;
    auto unsubscribe(SubscriptionId id) -> bool;

    auto refresh(ComboThemeConfig const& theme) -> void;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto is_dispatching() const -> bool { return dispatching_; }

private:
    struct Entry {
        SubscriptionId id = 0;
        Callback       callback;
        bool           removed = false;
    };

    // Marks a pass as dispatching. Closing it, normally or because a listener
    // threw, reopens the bus and applies the changes queued during the pass.
    class DispatchScope {
    public:
        explicit DispatchScope(ThemeRefreshBus& bus) : bus_(bus) { bus_.dispatching_ = true; }
        ~DispatchScope() {
            bus_.dispatching_ = false;
            bus_.apply_pending();
        }

        DispatchScope(DispatchScope const&)            = delete;
        DispatchScope& operator=(DispatchScope const&) = delete;

    private:
        ThemeRefreshBus& bus_;
    };

    auto find(SubscriptionId id) -> Entry*;
    auto apply_pending() -> void;

    std::vector<Entry>                                 entries_;
    std::vector<Entry>                                 pending_subscriptions_;
    std::vector<std::pair<SubscriptionId, Callback>>   pending_replacements_;
    std::optional<ComboThemeConfig>                    pending_theme_;
    SubscriptionId                                     next_id_     = 1;
    bool                                               dispatching_ = false;
};

} // namespace CP::Theme
