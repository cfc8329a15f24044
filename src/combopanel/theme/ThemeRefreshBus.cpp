#include <combopanel/theme/ThemeRefreshBus.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace CP::Theme {

auto ThemeRefreshBus::subscribe(Callback callback) -> SubscriptionId {
    auto const id = next_id_++;
    if (dispatching_) {
        pending_subscriptions_.push_back(Entry{id, std::move(callback)});
    } else {
        entries_.push_back(Entry{id, std::move(callback)});
    }
    return id;
}

auto ThemeRefreshBus::replace(SubscriptionId id, Callback callback) -> Expected<void> {
    auto* entry = this->find(id);
    if (entry == nullptr) {
        return std::unexpected(Error{Error::Code::NotFound, "no theme subscription with id " + std::to_string(id)});
    }
    if (dispatching_) {
        pending_replacements_.emplace_back(id, std::move(callback));
    } else {
        entry->callback = std::move(callback);
    }
    return {};
}

auto ThemeRefreshBus::unsubscribe(SubscriptionId id) -> bool {
    auto* entry = this->find(id);
    if (entry == nullptr) {
        return false;
    }
    entry->removed = true;
    if (!dispatching_) {
        std::erase_if(entries_, [](Entry const& e) { return e.removed; });
        std::erase_if(pending_subscriptions_, [](Entry const& e) { return e.removed; });
    }
    return true;
}

auto ThemeRefreshBus::refresh(ComboThemeConfig const& theme) -> void {
    if (dispatching_) {
        cp_log("Nested theme refresh deferred until the current pass completes", "Theme");
        pending_theme_ = theme;
        return;
    }

    // Left over from a pass that a throwing listener cut short.
    pending_theme_.reset();

    std::optional<ComboThemeConfig> current{theme};
    while (current) {
        auto const pass_theme = std::move(*current);
        current.reset();

        {
            DispatchScope scope{*this};
            auto const    count = entries_.size();
            for (std::size_t i = 0; i < count; ++i) {
                if (entries_[i].removed || !entries_[i].callback) {
                    continue;
                }
                entries_[i].callback(pass_theme);
            }
        }

        if (pending_theme_) {
            current = std::move(pending_theme_);
            pending_theme_.reset();
        }
    }
}

auto ThemeRefreshBus::size() const -> std::size_t {
    auto const live = [](Entry const& e) { return !e.removed; };
    return static_cast<std::size_t>(std::ranges::count_if(entries_, live) + std::ranges::count_if(pending_subscriptions_, live));
}

auto ThemeRefreshBus::find(SubscriptionId id) -> Entry* {
    for (auto* list : {&entries_, &pending_subscriptions_}) {
        auto it = std::ranges::find_if(*list, [id](Entry const& e) { return e.id == id && !e.removed; });
        if (it != list->end()) {
            return &*it;
        }
    }
    return nullptr;
}

auto ThemeRefreshBus::apply_pending() -> void {
    for (auto& entry : pending_subscriptions_) {
        entries_.push_back(std::move(entry));
    }
    pending_subscriptions_.clear();
    for (auto& [id, callback] : pending_replacements_) {
        if (auto* entry = this->find(id)) {
            entry->callback = std::move(callback);
        }
    }
    pending_replacements_.clear();
    std::erase_if(entries_, [](Entry const& e) { return e.removed; });
}

} // namespace CP::Theme
