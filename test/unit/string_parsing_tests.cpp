// Unit tests for string parsing utilities
#include <catch2/catch_all.hpp>
#include "util/string_parsing.hpp"

using namespace topowatch::util;

TEST_CASE("SafeParseInt - bounds and junk", "[util][string_parsing]") {
    SECTION("Values inside the range parse") {
        REQUIRE(SafeParseInt("42", 0, 100) == 42);
        REQUIRE(SafeParseInt("-50", -100, 100) == -50);
        REQUIRE(SafeParseInt("0", 0, 100) == 0);
        REQUIRE(SafeParseInt("100", 0, 100) == 100);
    }

    SECTION("Out of range is rejected") {
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("99999999999999999999", 0, 100).has_value());
    }

    SECTION("Malformed input is rejected") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("4 2", 0, 100).has_value());
    }
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
    REQUIRE(SafeParsePort("8728") == uint16_t{8728});
    REQUIRE(SafeParsePort("1") == uint16_t{1});
    REQUIRE(SafeParsePort("65535") == uint16_t{65535});
    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("23/tcp").has_value());
}

TEST_CASE("Text helpers", "[util][string_parsing]") {
    SECTION("Trim strips both ends only") {
        REQUIRE(Trim("  sw1 core \r\n") == "sw1 core");
        REQUIRE(Trim("   ").empty());
        REQUIRE(Trim("") == "");
    }

    SECTION("ToLower") {
        REQUIRE(ToLower("Router SWITCH") == "router switch");
    }

    SECTION("SplitString drops empty pieces and trims") {
        auto parts = SplitString(" ether1 , ,bridge1,", ',');
        REQUIRE(parts == std::vector<std::string>{"ether1", "bridge1"});
        REQUIRE(SplitString("", ',').empty());
    }
}
