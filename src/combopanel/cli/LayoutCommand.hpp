#pragma once

#include <combopanel/core/Error.hpp>
#include <combopanel/panel/ComboPanelConfig.hpp>
#include <combopanel/theme/ComboStyle.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace CP::Cli {

struct LayoutOptions {
    std::string                      config_path;
    double                           width  = 0.0;
    double                           height = 0.0;
    std::optional<Theme::ComboStyle> style;
    bool                             pretty    = false;
    bool                             show_help = false;
};

// Parses "--config F --width W --height H [--style ID] [--pretty] [--help]".
// Every problem is reported through error_logger; the first one is returned.
[[nodiscard]] auto ParseLayoutArgs(int                                     argc,
                                   char const* const*                      argv,
                                   std::function<void(std::string const&)> error_logger = {}) -> Expected<LayoutOptions>;

[[nodiscard]] auto LayoutUsage() -> std::string;

// Groups, dividers and slot rectangles of panel laid out on canvas.
[[nodiscard]] auto LayoutReport(Panel::ComboPanelConfig const& panel, Layout::Rect const& canvas) -> nlohmann::json;

// Loads the panel file named by options and renders its layout report.
[[nodiscard]] auto RunLayout(LayoutOptions const& options) -> Expected<std::string>;

} // namespace CP::Cli
