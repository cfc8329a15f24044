#include <doctest/doctest.h>

#include <combopanel/config/DebugFlags.hpp>

using CP::Config::ParseTruthy;

TEST_SUITE("config.debug_flags") {
    TEST_CASE("Truthy values") {
        CHECK_FALSE(ParseTruthy(nullptr));
        CHECK(ParseTruthy(""));
        CHECK(ParseTruthy("  "));
        CHECK(ParseTruthy("1"));
        CHECK(ParseTruthy("yes"));
        CHECK(ParseTruthy("layout"));
    }

    TEST_CASE("Falsy values ignore case and whitespace") {
        for (auto const* value : {"0", "false", "FALSE", "Off", "no", " no ", "\tfalse\n"}) {
            CAPTURE(value);
            CHECK_FALSE(ParseTruthy(value));
        }
    }
}
