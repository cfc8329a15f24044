#include <doctest/doctest.h>

#include <combopanel/theme/ThemeRefreshBus.hpp>
#include <combopanel/theme/UpdateGate.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace CP::Theme;

TEST_SUITE("theme.refresh_bus") {
    TEST_CASE("Listeners run in subscription order once per refresh") {
        ThemeRefreshBus  bus;
        std::vector<char> calls;
        bus.subscribe([&](ComboThemeConfig const&) { calls.push_back('A'); });
        bus.subscribe([&](ComboThemeConfig const&) { calls.push_back('B'); });
        bus.subscribe([&](ComboThemeConfig const&) { calls.push_back('C'); });

        bus.refresh(ComboThemeConfig{});
        CHECK(calls == std::vector<char>{'A', 'B', 'C'});

        bus.refresh(ComboThemeConfig{});
        CHECK(calls == std::vector<char>{'A', 'B', 'C', 'A', 'B', 'C'});
    }

    TEST_CASE("Later listeners see the theme earlier ones saw") {
        ThemeRefreshBus bus;
        ComboThemeConfig theme;
        theme.color1 = Color{0.3, 0.2, 0.1, 1.0};

        Color first_seen{};
        Color second_seen{};
        bus.subscribe([&](ComboThemeConfig const& t) { first_seen = t.get_color(1); });
        bus.subscribe([&](ComboThemeConfig const& t) { second_seen = t.get_color(1); });
        bus.refresh(theme);
        CHECK(first_seen == theme.color1);
        CHECK(second_seen == theme.color1);
    }

    TEST_CASE("Replace keeps the position and unsubscribe removes") {
        ThemeRefreshBus     bus;
        std::string         trace;
        auto const          a = bus.subscribe([&](ComboThemeConfig const&) { trace += "a"; });
        auto const          b = bus.subscribe([&](ComboThemeConfig const&) { trace += "b"; });
        bus.subscribe([&](ComboThemeConfig const&) { trace += "c"; });

        REQUIRE(bus.replace(a, [&](ComboThemeConfig const&) { trace += "A"; }).has_value());
        CHECK(bus.unsubscribe(b));
        CHECK_FALSE(bus.unsubscribe(b));
        CHECK(bus.size() == 2);

        bus.refresh(ComboThemeConfig{});
        CHECK(trace == "Ac");

        auto missing = bus.replace(999, [](ComboThemeConfig const&) {});
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == CP::Error::Code::NotFound);
    }

    TEST_CASE("Changes made while dispatching are deferred") {
        ThemeRefreshBus bus;
        std::string     trace;
        ThemeRefreshBus::SubscriptionId victim = 0;
        bool                            first  = true;

        bus.subscribe([&](ComboThemeConfig const&) {
            trace += "1";
            if (first) {
                first = false;
                CHECK(bus.is_dispatching());
                bus.subscribe([&](ComboThemeConfig const&) { trace += "N"; });
                bus.unsubscribe(victim);
            }
        });
        victim = bus.subscribe([&](ComboThemeConfig const&) { trace += "V"; });
        bus.subscribe([&](ComboThemeConfig const&) { trace += "3"; });

        bus.refresh(ComboThemeConfig{});
        CHECK(trace == "13");
        CHECK_FALSE(bus.is_dispatching());

        trace.clear();
        bus.refresh(ComboThemeConfig{});
        CHECK(trace == "13N");
    }

    TEST_CASE("A throwing listener does not wedge the bus") {
        ThemeRefreshBus bus;
        int             calls      = 0;
        bool            late_added = false;

        bus.subscribe([&](ComboThemeConfig const&) {
            ++calls;
            if (calls == 1) {
                bus.subscribe([&](ComboThemeConfig const&) { late_added = true; });
                bus.refresh(ComboThemeConfig{});
                throw std::runtime_error("listener failed");
            }
        });

        CHECK_THROWS_AS(bus.refresh(ComboThemeConfig{}), std::runtime_error);
        CHECK_FALSE(bus.is_dispatching());
        CHECK(bus.size() == 2);

        bus.refresh(ComboThemeConfig{});
        bus.refresh(ComboThemeConfig{});
        CHECK(calls == 3);
        CHECK(late_added);

        std::string trace;
        bus.subscribe([&](ComboThemeConfig const&) { trace += "x"; });
        bus.refresh(ComboThemeConfig{});
        CHECK(trace == "x");
        CHECK(calls == 4);
    }

    TEST_CASE("A nested refresh runs one more pass with the latest theme") {
        ThemeRefreshBus     bus;
        std::vector<double> seen;
        bus.subscribe([&](ComboThemeConfig const& theme) {
            seen.push_back(theme.font1_size);
            if (seen.size() == 1) {
                ComboThemeConfig newer;
                newer.font1_size = 30.0;
                bus.refresh(newer);
            }
        });

        ComboThemeConfig first;
        first.font1_size = 10.0;
        bus.refresh(first);
        CHECK(seen == std::vector<double>{10.0, 30.0});
    }
}

TEST_SUITE("theme.update_gate") {
    TEST_CASE("Scopes nest and only the outer one is outermost") {
        UpdateGate gate;
        CHECK_FALSE(gate.is_updating());
        {
            UpdateScope outer{gate};
            CHECK(outer.is_outermost());
            CHECK(gate.depth() == 1);
            {
                UpdateScope inner{gate};
                CHECK_FALSE(inner.is_outermost());
                CHECK(gate.depth() == 2);
            }
            CHECK(gate.is_updating());
        }
        CHECK_FALSE(gate.is_updating());
        CHECK(gate.depth() == 0);
    }

    TEST_CASE("Guarded handlers do not recurse") {
        UpdateGate gate;
        double     slider  = 0.0;
        double     spin    = 0.0;
        int        updates = 0;

        std::function<void(double)> set_spin;
        auto set_slider = [&](double value) {
            if (gate.is_updating()) {
                return;
            }
            UpdateScope scope{gate};
            ++updates;
            slider = value;
            set_spin(value);
        };
        set_spin = [&](double value) {
            spin = value;
            if (!gate.is_updating()) {
                set_slider(value);
            }
        };

        set_slider(0.4);
        CHECK(slider == 0.4);
        CHECK(spin == 0.4);
        CHECK(updates == 1);
    }
}
