#include <combopanel/fonts/FontFamilyCatalog.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <functional>

namespace CP::Fonts {

auto FontFamilyCatalog::warm(Enumerator const& enumerate) -> Expected<std::size_t> {
    if (this->is_warm()) {
        std::lock_guard<std::mutex> lock(mutex_);
        return families_.size();
    }
    if (!enumerate) {
        return std::unexpected(Error{Error::Code::InvalidError, "no font enumerator"});
    }

    auto enumerated = enumerate();
    if (!enumerated) {
        cp_log("Font enumeration failed: " + describeError(enumerated.error()), "Fonts");
        return std::unexpected(enumerated.error());
    }

    auto names = std::move(*enumerated);
    std::erase_if(names, [](std::string const& name) { return name.empty(); });
    std::ranges::sort(names);
    auto duplicates = std::ranges::unique(names);
    names.erase(duplicates.begin(), duplicates.end());

    std::lock_guard<std::mutex> lock(mutex_);
    if (!warm_.load(std::memory_order_relaxed)) {
        families_ = std::move(names);
        warm_.store(true, std::memory_order_release);
        cp_log("Font catalog warmed with " + std::to_string(families_.size()) + " families", "Fonts");
    }
    return families_.size();
}

auto FontFamilyCatalog::families() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return families_;
}

auto FontFamilyCatalog::contains(std::string_view family) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::binary_search(families_.begin(), families_.end(), family, std::less<>{});
}

} // namespace CP::Fonts
