#pragma once

#include <combopanel/core/Error.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace CP::Fonts {

/**
 * Cache of installed font family names.
 *
 * warm() may run on a worker thread: it only calls the enumerator and stores
 * the sorted, de-duplicated result. The UI thread reads the cache afterwards
 * through families() and contains(). Once warm, later warm() calls return the
 * cached count without enumerating again.
 */
class FontFamilyCatalog {
public:
    using Enumerator = std::function<Expected<std::vector<std::string>>()>;

    auto warm(Enumerator const& enumerate) -> Expected<std::size_t>;

    [[nodiscard]] auto is_warm() const -> bool { return warm_.load(std::memory_order_acquire); }
    [[nodiscard]] auto families() const -> std::vector<std::string>;
    [[nodiscard]] auto contains(std::string_view family) const -> bool;

private:
    mutable std::mutex       mutex_;
    std::vector<std::string> families_;
    std::atomic<bool>        warm_{false};
};

} // namespace CP::Fonts
