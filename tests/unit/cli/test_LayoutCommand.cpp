#include <doctest/doctest.h>

#include "cli/LayoutCommand.hpp"
#include "cli/OptionParser.hpp"

#include <combopanel/serialization/ComboJson.hpp>

#include <filesystem>
#include <string>
#include <vector>

using namespace CP::Cli;

namespace {

struct Args {
    explicit Args(std::vector<std::string> tokens)
        : storage(std::move(tokens)) {
        storage.insert(storage.begin(), "combopanel_layout");
        for (auto const& token : storage) {
            pointers.push_back(token.c_str());
        }
    }

    [[nodiscard]] auto argc() const -> int { return static_cast<int>(pointers.size()); }
    [[nodiscard]] auto argv() const -> char const* const* { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char const*> pointers;
};

} // namespace

TEST_SUITE("cli.option_parser") {
    TEST_CASE("Flags, values and aliases") {
        OptionParser parser;
        bool         verbose = false;
        std::string  name;
        double       scale   = 0.0;
        parser.add_flag("--verbose", OptionParser::FlagOption{.on_set = [&] { verbose = true; }});
        parser.add_alias("-v", "--verbose");
        parser.add_string("--name", name, "");
        parser.add_double("--scale", OptionParser::DoubleOption{.on_value = [&](double v) -> OptionParser::ParseError {
                              scale = v;
                              return std::nullopt;
                          }});

        Args args{{"-v", "--name=panel", "--scale", "1.5"}};
        CHECK(parser.parse(args.argc(), args.argv()));
        CHECK_FALSE(parser.had_errors());
        CHECK(verbose);
        CHECK(name == "panel");
        CHECK(scale == 1.5);
    }

    TEST_CASE("Errors are reported through the logger") {
        OptionParser             parser;
        std::vector<std::string> errors;
        double                   scale = 0.0;
        parser.set_program_name("tool");
        parser.set_error_logger([&](std::string const& message) { errors.push_back(message); });
        parser.add_double("--scale", OptionParser::DoubleOption{.on_value = [&](double v) -> OptionParser::ParseError {
                              scale = v;
                              return std::nullopt;
                          }});

        Args args{{"--scale", "abc", "--bogus", "--scale"}};
        CHECK_FALSE(parser.parse(args.argc(), args.argv()));
        CHECK(parser.had_errors());
        REQUIRE(errors.size() == 3);
        CHECK(errors[0] == "tool: --scale expects a floating-point value");
        CHECK(errors[1] == "tool: unknown argument '--bogus'");
        CHECK(errors[2] == "tool: --scale requires a value");
        CHECK(scale == 0.0);
    }

    TEST_CASE("Usage lists every option") {
        OptionParser parser;
        std::string  path;
        parser.set_program_name("tool");
        parser.add_string("--config", path, "config file");
        auto const usage = parser.usage();
        CHECK(usage.find("usage: tool") != std::string::npos);
        CHECK(usage.find("--config VALUE") != std::string::npos);
        CHECK(usage.find("config file") != std::string::npos);
    }
}

TEST_SUITE("cli.layout") {
    TEST_CASE("Parsing layout arguments") {
        Args args{{"--config", "panel.json", "--width", "640", "--height=480", "--style", "material", "--pretty"}};
        auto options = ParseLayoutArgs(args.argc(), args.argv());
        REQUIRE(options.has_value());
        CHECK(options->config_path == "panel.json");
        CHECK(options->width == 640.0);
        CHECK(options->height == 480.0);
        CHECK(options->style == CP::Theme::ComboStyle::Material);
        CHECK(options->pretty);
    }

    TEST_CASE("Bad layout arguments fail") {
        std::vector<std::string> errors;
        auto                     logger = [&](std::string const& message) { errors.push_back(message); };

        SUBCASE("Unknown style") {
            Args args{{"--config", "p.json", "--width", "1", "--height", "1", "--style", "gothic"}};
            auto options = ParseLayoutArgs(args.argc(), args.argv(), logger);
            REQUIRE_FALSE(options.has_value());
            CHECK(options.error().code == CP::Error::Code::UnknownStyle);
        }
        SUBCASE("Missing config") {
            Args args{{"--width", "1", "--height", "1"}};
            auto options = ParseLayoutArgs(args.argc(), args.argv(), logger);
            REQUIRE_FALSE(options.has_value());
            CHECK(options.error().code == CP::Error::Code::InvalidError);
        }
        SUBCASE("Non-positive size") {
            Args args{{"--config", "p.json", "--width", "0", "--height", "1"}};
            CHECK_FALSE(ParseLayoutArgs(args.argc(), args.argv(), logger).has_value());
        }
        SUBCASE("Unknown argument") {
            Args args{{"--config", "p.json", "--width", "1", "--height", "1", "--depth", "3"}};
            CHECK_FALSE(ParseLayoutArgs(args.argc(), args.argv(), logger).has_value());
        }
        CHECK_FALSE(errors.empty());
    }

    TEST_CASE("Help needs no other arguments") {
        Args args{{"-h"}};
        auto options = ParseLayoutArgs(args.argc(), args.argv());
        REQUIRE(options.has_value());
        CHECK(options->show_help);
        CHECK(LayoutUsage().find("--config") != std::string::npos);
    }

    TEST_CASE("Layout report") {
        CP::Panel::ComboPanelConfig panel;
        panel.layout.group_item_counts = {1, 2};
        panel.layout.content_padding   = 0.0;
        panel.ensure_content_items({});

        auto const report = LayoutReport(panel, CP::Layout::Rect{0.0, 0.0, 100.0, 118.0});
        CHECK(report["style"] == "lcars");
        REQUIRE(report["groups"].size() == 2);
        CHECK(report["groups"][0]["height"].get<double>() == doctest::Approx(50.0));
        REQUIRE(report["dividers"].size() == 1);
        CHECK(report["dividers"][0]["y"].get<double>() == doctest::Approx(54.0));
        REQUIRE(report["items"].size() == 3);
        CHECK(report["items"][2]["slot"] == "group2_2");
        CHECK(report["items"][2]["group"] == 2);
    }

    TEST_CASE("Running against a panel file") {
        auto const path = std::filesystem::temp_directory_path() / "combopanel_cli_panel.json";
        CP::Serialization::PanelDocument document;
        document.panel.layout.group_item_counts = {3};
        REQUIRE(CP::Serialization::savePanelFile(path, document).has_value());

        LayoutOptions options;
        options.config_path = path.string();
        options.width       = 200.0;
        options.height      = 100.0;
        options.style       = CP::Theme::ComboStyle::RetroTerminal;

        auto output = RunLayout(options);
        REQUIRE(output.has_value());
        auto const report = nlohmann::json::parse(*output);
        CHECK(report["style"] == "retro_terminal");
        CHECK(report["items"].size() == 3);
        std::filesystem::remove(path);

        options.config_path = (std::filesystem::temp_directory_path() / "combopanel_cli_missing.json").string();
        auto missing = RunLayout(options);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == CP::Error::Code::IoFailure);
    }
}
