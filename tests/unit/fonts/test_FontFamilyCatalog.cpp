#include <doctest/doctest.h>

#include <combopanel/fonts/FontFamilyCatalog.hpp>

#include <thread>

using namespace CP::Fonts;

TEST_SUITE("fonts.catalog") {
    TEST_CASE("Warming sorts and de-duplicates") {
        FontFamilyCatalog catalog;
        CHECK_FALSE(catalog.is_warm());
        CHECK_FALSE(catalog.contains("Sans"));

        auto warmed = catalog.warm([]() -> CP::Expected<std::vector<std::string>> {
            return std::vector<std::string>{"Serif", "Sans", "", "Monospace", "Sans"};
        });
        REQUIRE(warmed.has_value());
        CHECK(*warmed == 3);
        CHECK(catalog.is_warm());
        CHECK(catalog.families() == std::vector<std::string>{"Monospace", "Sans", "Serif"});
        CHECK(catalog.contains("Serif"));
        CHECK_FALSE(catalog.contains("Comic"));
    }

    TEST_CASE("A warm catalog does not enumerate again") {
        FontFamilyCatalog catalog;
        int               calls     = 0;
        auto              enumerate = [&]() -> CP::Expected<std::vector<std::string>> {
            ++calls;
            return std::vector<std::string>{"Sans"};
        };
        REQUIRE(catalog.warm(enumerate).has_value());
        auto again = catalog.warm(enumerate);
        REQUIRE(again.has_value());
        CHECK(*again == 1);
        CHECK(calls == 1);
    }

    TEST_CASE("Enumeration failures propagate and leave the catalog cold") {
        FontFamilyCatalog catalog;
        auto failed = catalog.warm([]() -> CP::Expected<std::vector<std::string>> {
            return std::unexpected(CP::Error{CP::Error::Code::IoFailure, "fontconfig unavailable"});
        });
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == CP::Error::Code::IoFailure);
        CHECK_FALSE(catalog.is_warm());

        auto missing = catalog.warm(FontFamilyCatalog::Enumerator{});
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == CP::Error::Code::InvalidError);
    }

    TEST_CASE("Warming on a worker thread") {
        FontFamilyCatalog                     catalog;
        CP::Expected<std::size_t>             result = std::unexpected(CP::Error{CP::Error::Code::UnknownError, "not run"});
        std::thread worker([&] {
            result = catalog.warm([]() -> CP::Expected<std::vector<std::string>> {
                return std::vector<std::string>{"DejaVu Sans", "Noto Sans"};
            });
        });
        worker.join();
        REQUIRE(result.has_value());
        CHECK(catalog.is_warm());
        CHECK(catalog.contains("Noto Sans"));
    }
}
