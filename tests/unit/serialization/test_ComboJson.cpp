#include <doctest/doctest.h>

#include <combopanel/serialization/ComboJson.hpp>

#include <filesystem>
#include <fstream>

using namespace CP::Serialization;
using CP::Content::ContentDisplayType;
using CP::Theme::ColorSource;
using CP::Theme::ComboStyle;

namespace {

auto temp_file(std::string const& name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / ("combopanel_" + name + ".json");
}

auto sample_panel() -> CP::Panel::ComboPanelConfig {
    auto panel                        = CP::Panel::ComboPanelConfig::ForStyle(ComboStyle::Industrial);
    panel.theme.color2                = CP::Theme::Color{0.25, 0.5, 0.75, 1.0};
    panel.theme.gradient.stops.push_back(CP::Theme::ColorStopSource::custom(0.5, CP::Theme::Color{1.0, 0.0, 0.0, 0.5}));
    panel.layout.group_item_counts    = {2, 1};
    panel.layout.group_size_weights   = {2.0, 1.0};
    panel.layout.group_item_orientations = {CP::Layout::SplitOrientation::Horizontal, CP::Layout::SplitOrientation::Vertical};
    panel.layout.layout_orientation   = CP::Layout::SplitOrientation::Horizontal;
    panel.animation_speed             = 4.0;

    CP::Content::ContentItemConfig graph;
    graph.display_as                  = ContentDisplayType::Graph;
    graph.graph_config.line_color     = ColorSource::theme(3);
    graph.graph_config.max_data_points = 120;
    graph.bar_config.style            = CP::Content::BarStyle::Segmented;
    graph.core_bars_config.label_font = CP::Theme::FontSource::custom("Mono", 9.0);
    graph.static_config.text          = "CPU";
    graph.arc_config.segmented        = true;
    graph.speedometer_config.major_tick_count = 8;
    panel.content_items.set("group1_1", graph);
    panel.content_items.set("group2_1", CP::Content::ContentItemConfig{});
    return panel;
}

} // namespace

TEST_SUITE("serialization.json") {
    TEST_CASE("Panels survive a save and load") {
        PanelDocument document{.panel = sample_panel(), .source = std::nullopt};
        auto const    text   = serializePanel(document);
        auto          loaded = deserializePanel(text);
        REQUIRE(loaded.has_value());
        CHECK(loaded->panel == document.panel);
        CHECK_FALSE(loaded->source.has_value());
    }

    TEST_CASE("Color sources keep their variant") {
        auto const theme_json = colorSourceToJson(ColorSource::theme(2));
        CHECK(theme_json == Json{{"theme", 2}});
        CHECK(colorSourceFromJson(theme_json, ColorSource{}) == ColorSource::theme(2));

        auto const custom = colorSourceFromJson(Json{{"custom", {{"r", 1.0}, {"g", 0.5}}}}, ColorSource{});
        REQUIRE(custom.custom_color().has_value());
        CHECK(*custom.custom_color() == CP::Theme::Color{1.0, 0.5, 0.0, 1.0});

        auto const bare = colorSourceFromJson(Json{{"r", 0.2}, {"g", 0.2}, {"b", 0.2}}, ColorSource{});
        CHECK_FALSE(bare.is_theme());
    }

    TEST_CASE("Out of range theme indices are kept and fall back on resolve") {
        auto const source = colorSourceFromJson(Json{{"theme", 9}}, ColorSource{});
        CHECK(source.theme_index() == 9);
        CHECK(source.resolve(CP::Theme::ComboThemeConfig{}) == CP::Theme::kFallbackColor);
    }

    TEST_CASE("Wrong kinds fall back to defaults") {
        CHECK(colorSourceFromJson(Json{{"theme", "two"}}, ColorSource::theme(4)) == ColorSource::theme(4));
        CHECK(colorSourceFromJson(Json(17), ColorSource::theme(3)) == ColorSource::theme(3));
        CHECK(fontSourceFromJson(Json("Serif"), CP::Theme::FontSource{}) == CP::Theme::FontSource::custom("Serif", 12.0));

        auto item = contentItemFromJson(Json{{"display_as", "hologram"}, {"item_height", "tall"}, {"auto_height", false}});
        CHECK(item.display_as == ContentDisplayType::Bar);
        CHECK(item.item_height == 60.0);
        CHECK_FALSE(item.auto_height);
    }

    TEST_CASE("Missing keys take defaults") {
        auto loaded = deserializePanel(R"({"style": "synthwave"})");
        REQUIRE(loaded.has_value());
        CHECK(loaded->panel.style == ComboStyle::Synthwave);
        CHECK(loaded->panel.theme == CP::Theme::DefaultThemeFor(ComboStyle::Synthwave));
        CHECK(loaded->panel.layout.group_item_counts == std::vector<std::uint32_t>{2});
        CHECK(loaded->panel.content_items.empty());
    }

    TEST_CASE("Unknown styles load as LCARS") {
        auto loaded = deserializePanel(R"({"style": "baroque"})");
        REQUIRE(loaded.has_value());
        CHECK(loaded->panel.style == ComboStyle::Lcars);
    }

    TEST_CASE("Malformed documents are rejected") {
        for (auto const* text : {"", "{", "[1, 2]", "42", "\"panel\""}) {
            CAPTURE(text);
            auto loaded = deserializePanel(text);
            REQUIRE_FALSE(loaded.has_value());
            CHECK(loaded.error().code == CP::Error::Code::MalformedInput);
        }
        CHECK_FALSE(deserializeSourceConfig("null").has_value());
    }

    TEST_CASE("Legacy panels migrate on load") {
        auto loaded = deserializePanel(R"({
            "style": "lcars",
            "layout": {"primary_count": 3, "secondary_count": 1, "group_size_weights": [1.0, -2.0]},
            "content_items": {"primary2": {"display_as": "graph"}, "secondary1": {"display_as": "arc"}}
        })");
        REQUIRE(loaded.has_value());
        auto const& panel = loaded->panel;
        CHECK(panel.layout.group_item_counts == std::vector<std::uint32_t>{3, 1});
        CHECK(panel.layout.group_size_weights == std::vector<double>{1.0, 1.0});
        CHECK(panel.layout.primary_count == 0);
        REQUIRE(panel.content_items.find("group1_2") != nullptr);
        CHECK(panel.content_items.find("group1_2")->display_as == ContentDisplayType::Graph);
        CHECK(panel.content_items.find("group2_1")->display_as == ContentDisplayType::Arc);

        auto const written = panelToJson(panel);
        CHECK_FALSE(written["layout"].contains("primary_count"));
    }

    TEST_CASE("Legacy source configs migrate on load") {
        auto loaded = deserializeSourceConfig(R"({
            "primary_count": 2,
            "secondary_count": 1,
            "slots": {"primary_1": {"source_id": "cpu", "source_config": {"core": 3}}}
        })");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->groups.size() == 2);
        CHECK(loaded->groups[0].item_count == 2);
        CHECK(loaded->groups[1].item_count == 1);
        REQUIRE(loaded->slots.contains("group1_1"));
        CHECK(loaded->slots.at("group1_1").source_config == Json{{"core", 3}});

        auto reparsed = deserializeSourceConfig(serializeSourceConfig(*loaded));
        REQUIRE(reparsed.has_value());
        CHECK(*reparsed == *loaded);
    }

    TEST_CASE("Huge legacy counts load clamped") {
        auto source = deserializeSourceConfig(R"({"primary_count": 500, "secondary_count": 1})");
        REQUIRE(source.has_value());
        REQUIRE(source->groups.size() == 2);
        CHECK(source->groups[0].item_count == CP::Source::kMaxGroupItems);
        CHECK(source->groups[1].item_count == 1);

        auto panel = deserializePanel(R"({"layout": {"primary_count": 500}})");
        REQUIRE(panel.has_value());
        CHECK(panel->panel.layout.group_item_counts == std::vector<std::uint32_t>{CP::Source::kMaxGroupItems});
        auto const placements = panel->panel.item_layout(CP::Layout::Rect{0.0, 0.0, 800.0, 1000.0});
        CHECK(placements.size() == CP::Source::kMaxGroupItems);
    }

    TEST_CASE("A panel with a source follows the source's groups") {
        auto loaded = deserializePanel(R"({
            "layout": {"group_item_counts": [1], "group_size_weights": [3.0]},
            "source": {"groups": [{"item_count": 2}, {"item_count": 4}]}
        })");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->source.has_value());
        CHECK(loaded->panel.layout.group_item_counts == std::vector<std::uint32_t>{2, 4});
        CHECK(loaded->panel.layout.group_size_weights == std::vector<double>{3.0, 1.0});
    }

    TEST_CASE("Panel files") {
        auto const path = temp_file("panel_roundtrip");
        PanelDocument document{.panel = sample_panel(), .source = CP::Source::ComboSourceConfig{}};
        document.panel.layout.group_item_counts = {2};
        document.panel.layout.group_size_weights = {1.0};
        document.panel.layout.group_item_orientations.clear();
        REQUIRE(savePanelFile(path, document).has_value());

        auto loaded = loadPanelFile(path);
        REQUIRE(loaded.has_value());
        CHECK(loaded->panel == document.panel);
        REQUIRE(loaded->source.has_value());
        CHECK(*loaded->source == *document.source);
        std::filesystem::remove(path);

        auto missing = loadPanelFile(temp_file("does_not_exist"));
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == CP::Error::Code::IoFailure);
    }
}
