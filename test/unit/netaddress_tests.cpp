// Unit tests for address normalization and subnet expansion
#include <catch2/catch_all.hpp>
#include "util/netaddress.hpp"

using namespace topowatch::util;

TEST_CASE("ValidateAndNormalizeIP", "[util][netaddress]") {
    SECTION("IPv4 is returned unchanged") {
        REQUIRE(ValidateAndNormalizeIP("192.168.1.1") == std::string("192.168.1.1"));
    }

    SECTION("IPv4-mapped IPv6 collapses to IPv4") {
        REQUIRE(ValidateAndNormalizeIP("::ffff:10.0.0.1") == std::string("10.0.0.1"));
    }

    SECTION("IPv6 is lower-cased and compressed") {
        REQUIRE(ValidateAndNormalizeIP("2001:DB8:0:0:0:0:0:1") == std::string("2001:db8::1"));
    }

    SECTION("Hostnames and junk are rejected") {
        REQUIRE_FALSE(ValidateAndNormalizeIP("").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("switch-1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("256.1.1.1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("1.1.1").has_value());
    }
}

TEST_CASE("ParseIPPort", "[util][netaddress]") {
    std::string ip;
    uint16_t port = 0;

    REQUIRE(ParseIPPort("10.0.0.1:8728", ip, port));
    REQUIRE(ip == "10.0.0.1");
    REQUIRE(port == 8728);

    REQUIRE(ParseIPPort("[2001:db8::1]:23", ip, port));
    REQUIRE(ip == "2001:db8::1");
    REQUIRE(port == 23);

    REQUIRE_FALSE(ParseIPPort("2001:db8::1:23", ip, port));
    REQUIRE_FALSE(ParseIPPort("10.0.0.1", ip, port));
    REQUIRE_FALSE(ParseIPPort("10.0.0.1:0", ip, port));
    REQUIRE_FALSE(ParseIPPort("router:23", ip, port));
}

TEST_CASE("NormalizeMac", "[util][netaddress]") {
    SECTION("Every vendor notation maps to one form") {
        const std::string expected = "aa:bb:cc:dd:ee:ff";
        REQUIRE(NormalizeMac("AA:BB:CC:DD:EE:FF") == expected);
        REQUIRE(NormalizeMac("aa-bb-cc-dd-ee-ff") == expected);
        REQUIRE(NormalizeMac("aabb.ccdd.eeff") == expected);
        REQUIRE(NormalizeMac("AABBCCDDEEFF") == expected);
    }

    SECTION("Wrong length and non-hex are rejected") {
        REQUIRE_FALSE(NormalizeMac("aa:bb:cc:dd:ee").has_value());
        REQUIRE_FALSE(NormalizeMac("aa:bb:cc:dd:ee:ff:00").has_value());
        REQUIRE_FALSE(NormalizeMac("zz:bb:cc:dd:ee:ff").has_value());
        REQUIRE_FALSE(NormalizeMac("").has_value());
    }

    SECTION("All-zero and broadcast never identify a device") {
        REQUIRE_FALSE(NormalizeMac("00:00:00:00:00:00").has_value());
        REQUIRE_FALSE(NormalizeMac("ff:ff:ff:ff:ff:ff").has_value());
    }
}

TEST_CASE("FormatMac", "[util][netaddress]") {
    REQUIRE(FormatMac({0x00, 0x1b, 0x2c, 0x3d, 0x4e, 0x5f}) == "00:1b:2c:3d:4e:5f");
}

TEST_CASE("ExpandSubnet", "[util][netaddress]") {
    SECTION("Single host") {
        auto hosts = ExpandSubnet(" 10.0.0.7 ", 16);
        REQUIRE(hosts.has_value());
        REQUIRE(*hosts == std::vector<std::string>{"10.0.0.7"});
    }

    SECTION("Prefix excludes network and broadcast") {
        auto hosts = ExpandSubnet("10.0.0.0/30", 16);
        REQUIRE(hosts.has_value());
        REQUIRE(*hosts == std::vector<std::string>{"10.0.0.1", "10.0.0.2"});
    }

    SECTION("/29 yields six hosts") {
        auto hosts = ExpandSubnet("192.168.10.0/29", 16);
        REQUIRE(hosts.has_value());
        REQUIRE(hosts->size() == 6);
        REQUIRE(hosts->front() == "192.168.10.1");
        REQUIRE(hosts->back() == "192.168.10.6");
    }

    SECTION("/31 point-to-point keeps both addresses") {
        auto hosts = ExpandSubnet("10.1.1.0/31", 16);
        REQUIRE(hosts.has_value());
        REQUIRE(*hosts == std::vector<std::string>{"10.1.1.0", "10.1.1.1"});
    }

    SECTION("Too many hosts is refused") {
        REQUIRE_FALSE(ExpandSubnet("10.0.0.0/16", 1024).has_value());
        REQUIRE(ExpandSubnet("10.0.0.0/22", 1024).has_value());
    }

    SECTION("Invalid entries") {
        REQUIRE_FALSE(ExpandSubnet("10.0.0.0/33", 1024).has_value());
        REQUIRE_FALSE(ExpandSubnet("core-switch", 1024).has_value());
        REQUIRE_FALSE(ExpandSubnet("", 1024).has_value());
    }
}
