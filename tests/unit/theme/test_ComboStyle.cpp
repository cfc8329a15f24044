#include <doctest/doctest.h>

#include <combopanel/theme/ComboStyle.hpp>

#include <set>
#include <string>

using namespace CP::Theme;
using CP::Layout::DividerGeometry;

TEST_SUITE("theme.style") {
    TEST_CASE("Style ids round trip and are unique") {
        std::set<std::string> ids;
        for (auto style : kAllComboStyles) {
            auto const id = StyleId(style);
            CHECK_FALSE(id.empty());
            CHECK_FALSE(StyleDisplayName(style).empty());
            ids.emplace(id);

            auto parsed = ParseComboStyle(id);
            REQUIRE(parsed.has_value());
            CHECK(*parsed == style);
        }
        CHECK(ids.size() == kAllComboStyles.size());
    }

    TEST_CASE("Unknown style ids are rejected") {
        auto parsed = ParseComboStyle("vaporwave");
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().code == CP::Error::Code::UnknownStyle);
        CHECK_FALSE(ParseComboStyle("LCARS").has_value());
    }

    TEST_CASE("LCARS preset is the default theme") {
        CHECK(DefaultThemeFor(ComboStyle::Lcars) == ComboThemeConfig{});
        CHECK(DefaultThemeFor(ComboStyle::Material) == MaterialDarkTheme());
        CHECK_FALSE(MaterialLightTheme() == MaterialDarkTheme());
    }

    TEST_CASE("Presets reference theme colors in their gradient") {
        for (auto style : kAllComboStyles) {
            auto const theme = DefaultThemeFor(style);
            REQUIRE(theme.gradient.stops.size() >= 2);
            for (auto const& stop : theme.gradient.stops) {
                CHECK(stop.color.is_theme());
            }
            CHECK(theme.font1_size > 0.0);
            CHECK(theme.font2_size > 0.0);
        }
    }

    TEST_CASE("Divider geometry per style") {
        CHECK(DividerGeometryFor(ComboStyle::Lcars, 10.0, 4.0) == DividerGeometry{10.0, 4.0});
        CHECK(DividerGeometryFor(ComboStyle::Material, 10.0, 4.0) == DividerGeometry{10.0, 0.0});
        CHECK(DividerGeometryFor(ComboStyle::Industrial, 6.0, 1.0) == DividerGeometry{6.0, 4.0});
        CHECK(DividerGeometryFor(ComboStyle::RetroTerminal, 10.0, 3.0) == DividerGeometry{2.0, 3.0});
        CHECK(DividerGeometryFor(ComboStyle::Synthwave, 10.0, 3.0) == DividerGeometry{2.0, 3.0});
        CHECK(DividerGeometryFor(ComboStyle::FighterHud, 10.0, 3.0) == DividerGeometry{2.0, 3.0});
        CHECK(DividerGeometryFor(ComboStyle::Steampunk, 8.0, 2.0) == DividerGeometry{8.0, 2.0});
    }
}
