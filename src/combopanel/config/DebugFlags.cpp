#include <combopanel/config/DebugFlags.hpp>

#include <array>
#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>

namespace {

constexpr auto kLayoutEnvFlags = std::to_array({
    "COMBOPANEL_DEBUG_LAYOUT",
    "COMBOPANEL_DEBUG",
});

auto is_space(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n';
}

auto env_layout_debug_enabled() -> bool {
    for (auto const* name : kLayoutEnvFlags) {
        if (CP::Config::ParseTruthy(std::getenv(name))) {
            return true;
        }
    }
    return false;
}

} // namespace

namespace CP::Config {

auto ParseTruthy(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    std::string_view text{value};
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

auto LayoutDiagnosticsEnabled() -> bool {
    static bool enabled = env_layout_debug_enabled();
    return enabled;
}

} // namespace CP::Config
