#include <catch2/catch.hpp>
#include "deep_link_url.hpp"

using namespace statisfy;

TEST_CASE("Scheme names follow RFC 3986", "[url]") {
    REQUIRE(is_valid_scheme("statisfy"));
    REQUIRE(is_valid_scheme("web+music"));
    REQUIRE(is_valid_scheme("a1.b-c"));
    REQUIRE_FALSE(is_valid_scheme(""));
    REQUIRE_FALSE(is_valid_scheme("1abc"));
    REQUIRE_FALSE(is_valid_scheme("stat isfy"));
    REQUIRE_FALSE(is_valid_scheme("statisfy:"));
}

TEST_CASE("Deep link parsing", "[url]") {
    SECTION("Accepts URLs of the registered scheme") {
        REQUIRE(parse_deep_link("statisfy://open/42", "statisfy") == "statisfy://open/42");
        REQUIRE(parse_deep_link("statisfy://callback?code=abc&state=x", "statisfy").has_value());
        REQUIRE(parse_deep_link("statisfy:open", "statisfy").has_value());
    }

    SECTION("Scheme comparison ignores case and keeps the text as given") {
        REQUIRE(parse_deep_link("Statisfy://open/42", "statisfy") == "Statisfy://open/42");
    }

    SECTION("Rejects other schemes and non-URLs") {
        REQUIRE_FALSE(parse_deep_link("https://example.com", "statisfy"));
        REQUIRE_FALSE(parse_deep_link("statisfyx://open", "statisfy"));
        REQUIRE_FALSE(parse_deep_link("notaurl", "statisfy"));
        REQUIRE_FALSE(parse_deep_link("--flag", "statisfy"));
        REQUIRE_FALSE(parse_deep_link("", "statisfy"));
    }

    SECTION("Rejects malformed URLs of the right scheme") {
        REQUIRE_FALSE(parse_deep_link("statisfy:", "statisfy"));
        REQUIRE_FALSE(parse_deep_link("statisfy://open 42", "statisfy"));
        REQUIRE_FALSE(parse_deep_link("statisfy://open\n42", "statisfy"));
        REQUIRE_FALSE(parse_deep_link("statisfy://open/%4", "statisfy"));
        REQUIRE_FALSE(parse_deep_link("statisfy://open/%zz", "statisfy"));
        REQUIRE(parse_deep_link("statisfy://open/%20x", "statisfy").has_value());
    }

    SECTION("An invalid registered scheme matches nothing") {
        REQUIRE_FALSE(parse_deep_link("1x://open", "1x"));
    }
}

TEST_CASE("Deep links are extracted from arguments in order", "[url]") {
    SECTION("Flags and plain words are skipped") {
        const std::vector<std::string> args{"--flag", "statisfy://open/42", "notaurl"};
        REQUIRE(extract_deep_links(args, "statisfy") == std::vector<std::string>{"statisfy://open/42"});
    }

    SECTION("Order follows the arguments") {
        const std::vector<std::string> args{"/usr/bin/statisfy", "statisfy://b", "x", "statisfy://a"};
        REQUIRE(extract_deep_links(args, "statisfy") ==
                std::vector<std::string>{"statisfy://b", "statisfy://a"});
    }

    SECTION("No arguments, no links") {
        REQUIRE(extract_deep_links({}, "statisfy").empty());
    }
}

TEST_CASE("has_scheme only looks at the prefix", "[url]") {
    REQUIRE(has_scheme("statisfy://x y", "statisfy"));
    REQUIRE(has_scheme("STATISFY:x", "statisfy"));
    REQUIRE_FALSE(has_scheme("statisfy", "statisfy"));
    REQUIRE_FALSE(has_scheme("statisfyx:", "statisfy"));
}
