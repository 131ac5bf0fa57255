// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license
// Unit tests for IPv4 address validation and classification

#include <catch2/catch_test_macros.hpp>

#include "util/netaddress.hpp"

using namespace lanscan::util;

TEST_CASE("IsValidIPv4Address - valid addresses", "[util][netaddress]") {
    SECTION("Standard dotted quads") {
        REQUIRE(IsValidIPv4Address("192.168.1.1"));
        REQUIRE(IsValidIPv4Address("10.0.0.1"));
        REQUIRE(IsValidIPv4Address("0.0.0.0"));
        REQUIRE(IsValidIPv4Address("255.255.255.255"));
    }

    SECTION("IPv4-mapped IPv6") {
        REQUIRE(IsValidIPv4Address("::ffff:192.168.1.1"));
    }
}

TEST_CASE("IsValidIPv4Address - invalid addresses", "[util][netaddress]") {
    SECTION("Empty and malformed") {
        REQUIRE_FALSE(IsValidIPv4Address(""));
        REQUIRE_FALSE(IsValidIPv4Address("192.168.1"));
        REQUIRE_FALSE(IsValidIPv4Address("192.168.1.256"));
        REQUIRE_FALSE(IsValidIPv4Address("192.168.1.1.1"));
        REQUIRE_FALSE(IsValidIPv4Address("192.168.-1.1"));
    }

    SECTION("Native IPv6") {
        REQUIRE_FALSE(IsValidIPv4Address("::1"));
        REQUIRE_FALSE(IsValidIPv4Address("fe80::1"));
        REQUIRE_FALSE(IsValidIPv4Address("2001:db8::1"));
    }

    SECTION("Hostnames") {
        REQUIRE_FALSE(IsValidIPv4Address("localhost"));
        REQUIRE_FALSE(IsValidIPv4Address("printer.lan"));
    }

    SECTION("With port or prefix") {
        REQUIRE_FALSE(IsValidIPv4Address("192.168.1.1:44444"));
        REQUIRE_FALSE(IsValidIPv4Address("192.168.1.0/24"));
    }
}

TEST_CASE("ValidateAndNormalizeIPv4", "[util][netaddress]") {
    SECTION("Standard IPv4 is returned unchanged") {
        auto result = ValidateAndNormalizeIPv4("192.168.1.1");
        REQUIRE(result.has_value());
        REQUIRE(*result == "192.168.1.1");
    }

    SECTION("IPv4-mapped IPv6 normalizes to dotted quad") {
        auto result = ValidateAndNormalizeIPv4("::ffff:10.1.2.3");
        REQUIRE(result.has_value());
        REQUIRE(*result == "10.1.2.3");
    }

    SECTION("Invalid input") {
        REQUIRE_FALSE(ValidateAndNormalizeIPv4("").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIPv4("256.1.1.1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIPv4("::1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIPv4("example.com").has_value());
    }
}

TEST_CASE("IsIPv6Address", "[util][netaddress]") {
    REQUIRE(IsIPv6Address("::1"));
    REQUIRE(IsIPv6Address("fe80::1"));
    REQUIRE_FALSE(IsIPv6Address("::ffff:192.168.1.1"));
    REQUIRE_FALSE(IsIPv6Address("192.168.1.1"));
    REQUIRE_FALSE(IsIPv6Address("garbage"));
}

TEST_CASE("RFC classification", "[util][netaddress]") {
    SECTION("RFC 1918 private ranges") {
        REQUIRE(IsRFC1918("10.0.0.1"));
        REQUIRE(IsRFC1918("10.255.255.255"));
        REQUIRE(IsRFC1918("172.16.0.1"));
        REQUIRE(IsRFC1918("172.31.255.254"));
        REQUIRE(IsRFC1918("192.168.0.1"));
        REQUIRE(IsRFC1918("::ffff:192.168.1.1"));

        REQUIRE_FALSE(IsRFC1918("172.15.255.255"));
        REQUIRE_FALSE(IsRFC1918("172.32.0.0"));
        REQUIRE_FALSE(IsRFC1918("192.169.0.1"));
        REQUIRE_FALSE(IsRFC1918("8.8.8.8"));
        REQUIRE_FALSE(IsRFC1918("not-an-ip"));
    }

    SECTION("RFC 3927 link-local") {
        REQUIRE(IsRFC3927("169.254.1.1"));
        REQUIRE_FALSE(IsRFC3927("169.253.1.1"));
    }

    SECTION("RFC 6598 shared address space") {
        REQUIRE(IsRFC6598("100.64.0.1"));
        REQUIRE(IsRFC6598("100.127.255.255"));
        REQUIRE_FALSE(IsRFC6598("100.63.255.255"));
        REQUIRE_FALSE(IsRFC6598("100.128.0.0"));
    }

    SECTION("Local") {
        REQUIRE(IsLocal("127.0.0.1"));
        REQUIRE(IsLocal("0.0.0.0"));
        REQUIRE(IsLocal("169.254.10.10"));
        REQUIRE_FALSE(IsLocal("192.168.1.1"));
        REQUIRE_FALSE(IsLocal(""));
    }
}

TEST_CASE("Byte-based IPv4 helpers", "[util][netaddress]") {
    REQUIRE(IsIPv4Loopback(127));
    REQUIRE(IsIPv4Loopback(0));
    REQUIRE_FALSE(IsIPv4Loopback(128));

    REQUIRE(IsIPv4Private(10, 0));
    REQUIRE(IsIPv4Private(172, 20));
    REQUIRE(IsIPv4Private(192, 168));
    REQUIRE_FALSE(IsIPv4Private(172, 32));

    REQUIRE(IsIPv4LinkLocal(169, 254));
    REQUIRE_FALSE(IsIPv4LinkLocal(169, 255));

    REQUIRE(IsIPv4Multicast(224));
    REQUIRE(IsIPv4Multicast(239));
    REQUIRE_FALSE(IsIPv4Multicast(240));
    REQUIRE_FALSE(IsIPv4Multicast(223));
}
