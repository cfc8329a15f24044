#include <doctest/doctest.h>

#include <combopanel/panel/Clipboard.hpp>
#include <combopanel/panel/ComboPanelConfig.hpp>

using namespace CP::Panel;
using CP::Content::ContentDisplayType;
using CP::Layout::Rect;
using CP::Theme::ComboStyle;

TEST_SUITE("panel.config") {
    TEST_CASE("Style defaults carry the style preset") {
        auto const panel = ComboPanelConfig::ForStyle(ComboStyle::Cyberpunk);
        CHECK(panel.style == ComboStyle::Cyberpunk);
        CHECK(panel.theme == CP::Theme::DefaultThemeFor(ComboStyle::Cyberpunk));
    }

    TEST_CASE("Content rect is inset by the content padding") {
        ComboPanelConfig panel;
        panel.layout.content_padding = 8.0;
        CHECK(panel.content_rect(Rect{0.0, 0.0, 200.0, 100.0}) == Rect{8.0, 8.0, 184.0, 84.0});
    }

    TEST_CASE("Group layout uses the style's divider geometry") {
        auto panel                    = ComboPanelConfig::ForStyle(ComboStyle::Material);
        panel.layout.group_item_counts = {1, 1};
        panel.layout.content_padding  = 0.0;
        panel.layout.divider_width    = 10.0;
        panel.layout.divider_padding  = 6.0;

        auto const groups = panel.group_layout(Rect{0.0, 0.0, 100.0, 110.0});
        REQUIRE(groups.groups.size() == 2);
        CHECK(groups.groups[0].height == doctest::Approx(50.0));
        CHECK(groups.groups[1].y == doctest::Approx(60.0));
        REQUIRE(groups.dividers.size() == 1);
        CHECK(groups.dividers[0] == Rect{0.0, 50.0, 100.0, 10.0});
    }

    TEST_CASE("Every slot gets a content item") {
        ComboPanelConfig panel;
        panel.layout.group_item_counts = {2, 3};
        std::vector<CP::Content::FieldMetadata> fields{
            {.id = "group2_3_name", .name = "Name", .description = "", .type = CP::Content::FieldType::Text, .purpose = CP::Content::FieldPurpose::Caption},
        };
        panel.ensure_content_items(fields);
        CHECK(panel.content_items.size() == 5);
        REQUIRE(panel.content_items.find("group2_3") != nullptr);
        CHECK(panel.content_items.find("group2_3")->display_as == ContentDisplayType::Text);
        CHECK(panel.content_items.find("group1_1")->display_as == ContentDisplayType::Bar);

        auto const placements = panel.item_layout(Rect{0.0, 0.0, 400.0, 300.0});
        CHECK(placements.size() == 5);
    }

    TEST_CASE("Legacy layout migration carries content items along") {
        ComboPanelConfig panel;
        panel.layout.group_item_counts.clear();
        panel.layout.primary_count   = 1;
        panel.layout.secondary_count = 2;
        CP::Content::ContentItemConfig graph;
        graph.display_as = ContentDisplayType::Graph;
        panel.content_items.set("secondary2", graph);

        panel.migrate_legacy();
        CHECK(panel.layout.group_item_counts == std::vector<std::uint32_t>{1, 2});
        REQUIRE(panel.content_items.find("group2_2") != nullptr);
        CHECK(panel.content_items.find("group2_2")->display_as == ContentDisplayType::Graph);
    }

    TEST_CASE("Grouped layouts leave odd content keys alone") {
        ComboPanelConfig panel;
        panel.content_items.set("primary1", CP::Content::ContentItemConfig{});
        panel.migrate_legacy();
        CHECK(panel.content_items.contains("primary1"));
    }

    TEST_CASE("Transferring settings to another style") {
        auto source                      = ComboPanelConfig::ForStyle(ComboStyle::Lcars);
        source.layout.group_item_counts  = {3};
        source.layout.group_size_weights = {2.0};
        source.animation_enabled         = false;
        source.animation_speed           = 3.0;
        source.content_items.set("group1_1", CP::Content::ContentItemConfig{.display_as = ContentDisplayType::Arc});

        auto target = ComboPanelConfig::ForStyle(ComboStyle::Steampunk);
        target.apply_transferable(source.to_transferable());

        CHECK(target.style == ComboStyle::Steampunk);
        CHECK(target.theme == CP::Theme::DefaultThemeFor(ComboStyle::Steampunk));
        CHECK(target.layout == source.layout);
        CHECK(target.content_items == source.content_items);
        CHECK_FALSE(target.animation_enabled);
        CHECK(target.animation_speed == 3.0);
    }
}

TEST_SUITE("panel.clipboard") {
    TEST_CASE("Each kind of value has its own slot") {
        Clipboard clipboard;
        CHECK_FALSE(clipboard.paste_color().has_value());

        clipboard.copy_color(CP::Theme::Color{1.0, 0.0, 0.0, 1.0});
        clipboard.copy_font(ClipboardFont{.family = "Serif", .size = 18.0, .bold = true});
        clipboard.copy_gradient_stops({CP::Theme::ColorStopSource::theme(0.0, 2), CP::Theme::ColorStopSource::theme(1.0, 3)});

        CHECK(clipboard.paste_color() == CP::Theme::Color{1.0, 0.0, 0.0, 1.0});
        CHECK(clipboard.paste_color().has_value());
        REQUIRE(clipboard.paste_font().has_value());
        CHECK(clipboard.paste_font()->bold);
        REQUIRE(clipboard.paste_gradient_stops().has_value());
        CHECK(clipboard.paste_gradient_stops()->size() == 2);
        CHECK_FALSE(clipboard.paste_content_item().has_value());
        CHECK_FALSE(clipboard.paste_theme().has_value());

        clipboard.clear();
        CHECK_FALSE(clipboard.paste_color().has_value());
        CHECK_FALSE(clipboard.paste_font().has_value());
    }
}
