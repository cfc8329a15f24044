#include "LayoutCommand.hpp"
#include "OptionParser.hpp"

#include <combopanel/serialization/ComboJson.hpp>

#include "log/TaggedLogger.hpp"

#include <cmath>

namespace CP::Cli {

namespace {

constexpr char const* kProgramName = "combopanel_layout";

auto rect_json(Layout::Rect const& rect) -> nlohmann::json {
    return nlohmann::json{
        {"x", rect.x},
        {"y", rect.y},
        {"width", rect.width},
        {"height", rect.height},
    };
}

auto configure(OptionParser& parser, LayoutOptions& options, std::optional<Error>& first_error) -> void {
    parser.set_program_name(kProgramName);
    parser.add_string("--config", options.config_path, "panel configuration file (JSON)");

    auto positive = [](char const* name, double& target) {
        return OptionParser::DoubleOption{
            .on_value = [name, &target](double value) -> OptionParser::ParseError {
                if (value <= 0.0) {
                    return std::string(name) + " must be greater than zero";
                }
                target = value;
                return std::nullopt;
            },
            .help = "canvas extent in pixels",
        };
    };
    parser.add_double("--width", positive("--width", options.width));
    parser.add_double("--height", positive("--height", options.height));

    parser.add_value("--style",
                     OptionParser::ValueOption{
                         .on_value = [&options, &first_error](std::string_view token) -> OptionParser::ParseError {
                             auto style = Theme::ParseComboStyle(token);
                             if (!style) {
                                 if (!first_error) {
                                     first_error = style.error();
                                 }
                                 return "unknown style '" + std::string(token) + "'";
                             }
                             options.style = *style;
                             return std::nullopt;
                         },
                         .help       = "override the panel's combo style",
                         .value_name = "ID",
                     });
    parser.add_flag("--pretty", OptionParser::FlagOption{.on_set = [&options] { options.pretty = true; }, .help = "indent the output"});
    parser.add_flag("--help", OptionParser::FlagOption{.on_set = [&options] { options.show_help = true; }, .help = "show this message"});
    parser.add_alias("-h", "--help");
}

} // namespace

auto ParseLayoutArgs(int argc, char const* const* argv, std::function<void(std::string const&)> error_logger)
        -> Expected<LayoutOptions> {
    LayoutOptions        options;
    std::optional<Error> first_error;
    std::string          first_message;

    OptionParser parser;
    parser.set_error_logger([&](std::string const& message) {
        if (first_message.empty()) {
            first_message = message;
        }
        if (error_logger) {
            error_logger(message);
        }
    });
    configure(parser, options, first_error);

    if (!parser.parse(argc, argv)) {
        if (first_error) {
            return std::unexpected(*first_error);
        }
        return std::unexpected(Error{Error::Code::InvalidError, first_message});
    }
    if (options.show_help) {
        return options;
    }

    auto missing = [&](char const* what) {
        std::string message = std::string(kProgramName) + ": " + what + " is required";
        if (error_logger) {
            error_logger(message);
        }
        return std::unexpected(Error{Error::Code::InvalidError, message});
    };
    if (options.config_path.empty()) {
        return missing("--config");
    }
    if (options.width <= 0.0) {
        return missing("--width");
    }
    if (options.height <= 0.0) {
        return missing("--height");
    }
    return options;
}

auto LayoutUsage() -> std::string {
    LayoutOptions        options;
    std::optional<Error> unused;
    OptionParser         parser;
    configure(parser, options, unused);
    return parser.usage();
}

auto LayoutReport(Panel::ComboPanelConfig const& panel, Layout::Rect const& canvas) -> nlohmann::json {
    auto const content = panel.content_rect(canvas);
    auto const groups  = panel.group_layout(canvas);
    auto const items   = panel.item_layout(canvas);

    nlohmann::json report = nlohmann::json::object();
    report["style"]       = std::string(Theme::StyleId(panel.style));
    report["canvas"]      = rect_json(canvas);
    report["content"]     = rect_json(content);

    auto& group_array = report["groups"] = nlohmann::json::array();
    for (auto const& rect : groups.groups) {
        group_array.push_back(rect_json(rect));
    }
    auto& divider_array = report["dividers"] = nlohmann::json::array();
    for (auto const& rect : groups.dividers) {
        divider_array.push_back(rect_json(rect));
    }
    auto& item_array = report["items"] = nlohmann::json::array();
    for (auto const& placement : items) {
        item_array.push_back(nlohmann::json{
            {"slot", placement.slot_name},
            {"group", placement.group},
            {"index", placement.index},
            {"rect", rect_json(placement.rect)},
        });
    }
    return report;
}

auto RunLayout(LayoutOptions const& options) -> Expected<std::string> {
    auto document = Serialization::loadPanelFile(options.config_path);
    if (!document) {
        cp_log("Failed to load " + options.config_path + ": " + describeError(document.error()), "Cli", "Error");
        return std::unexpected(document.error());
    }

    auto panel = std::move(document->panel);
    if (options.style && *options.style != panel.style) {
        // Switching style keeps layout and content; the theme follows the new style.
        auto transfer = panel.to_transferable();
        panel         = Panel::ComboPanelConfig::ForStyle(*options.style);
        panel.apply_transferable(transfer);
    }
    panel.ensure_content_items({});

    Layout::Rect const canvas{0.0, 0.0, options.width, options.height};
    auto               report = LayoutReport(panel, canvas);
    return options.pretty ? report.dump(2) : report.dump();
}

} // namespace CP::Cli
