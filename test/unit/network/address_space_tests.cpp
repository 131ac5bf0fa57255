// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license
// Unit tests for AddressSpace candidate enumeration

#include <catch2/catch_test_macros.hpp>

#include "network/address_space.hpp"
#include "network/discovery_errors.hpp"

#include <algorithm>
#include <thread>
#include <vector>

using namespace lanscan::network;

namespace {

std::vector<IPv4Address> Collect(const AddressRange& range) {
    std::vector<IPv4Address> out;
    for (const auto& address : range) {
        out.push_back(address);
    }
    return out;
}

}  // namespace

TEST_CASE("AddressSpace: /24 yields every address in order", "[network][address_space]") {
    const auto range = AddressSpace::Iterate("192.168.1.17", 24);
    const auto addresses = Collect(range);

    REQUIRE(addresses.size() == 256);
    REQUIRE(range.size() == 256);
    CHECK(addresses.front().ToString() == "192.168.1.0");
    CHECK(addresses.back().ToString() == "192.168.1.255");
    CHECK(std::is_sorted(addresses.begin(), addresses.end()));
    CHECK(std::adjacent_find(addresses.begin(), addresses.end()) == addresses.end());

    // Successor of the last address is outside the subnet
    const IPv4Address after = addresses.back().Next();
    CHECK(after.ToString() == "192.168.2.0");
    CHECK_FALSE(range.subnet().Contains(after));
    CHECK(std::find(addresses.begin(), addresses.end(), after) == addresses.end());

    for (const auto& a : addresses) {
        REQUIRE(range.subnet().Contains(a));
    }
}

TEST_CASE("AddressSpace: carries across octets", "[network][address_space]") {
    const auto addresses = Collect(AddressSpace::Iterate("10.0.0.77", 23));
    REQUIRE(addresses.size() == 512);
    CHECK(addresses[255].ToString() == "10.0.0.255");
    CHECK(addresses[256].ToString() == "10.0.1.0");
    CHECK(addresses.back().ToString() == "10.0.1.255");
}

TEST_CASE("AddressSpace: /16 regression", "[network][address_space]") {
    const auto range = AddressSpace::Iterate("172.16.99.1", 16);
    uint64_t count = 0;
    IPv4Address last;
    for (const auto& a : range) {
        ++count;
        last = a;
    }
    CHECK(count == 65536);
    CHECK(range.size() == 65536);
    CHECK(range.first().ToString() == "172.16.0.0");
    CHECK(last.ToString() == "172.16.255.255");
}

TEST_CASE("AddressSpace: extreme prefix lengths", "[network][address_space]") {
    SECTION("/32 yields the address itself") {
        const auto addresses = Collect(AddressSpace::Iterate("10.9.8.7", 32));
        REQUIRE(addresses.size() == 1);
        CHECK(addresses[0].ToString() == "10.9.8.7");
    }

    SECTION("/31 yields two addresses") {
        const auto addresses = Collect(AddressSpace::Iterate("10.9.8.7", 31));
        REQUIRE(addresses.size() == 2);
        CHECK(addresses[0].ToString() == "10.9.8.6");
        CHECK(addresses[1].ToString() == "10.9.8.7");
    }

    SECTION("/0 spans the whole address space") {
        const auto range = AddressSpace::Iterate("203.0.113.5", 0);
        CHECK(range.size() == (uint64_t{1} << 32));
        CHECK(range.first().ToString() == "0.0.0.0");
        CHECK(range.last().ToString() == "255.255.255.255");

        // Only the first few are walked; the sequence is lazy
        auto it = range.begin();
        CHECK(it->ToString() == "0.0.0.0");
        ++it;
        ++it;
        CHECK(it->ToString() == "0.0.0.2");
    }

    SECTION("Top of the address space terminates") {
        const auto addresses = Collect(AddressSpace::Iterate("255.255.255.250", 29));
        REQUIRE(addresses.size() == 8);
        CHECK(addresses.back().ToString() == "255.255.255.255");
    }
}

TEST_CASE("AddressSpace: reserved address exclusion", "[network][address_space]") {
    AddressSpace::Options options;
    options.exclude_reserved = true;

    SECTION("/24 drops network and broadcast") {
        const auto addresses = Collect(AddressSpace::Iterate("192.168.1.17", 24, options));
        REQUIRE(addresses.size() == 254);
        CHECK(addresses.front().ToString() == "192.168.1.1");
        CHECK(addresses.back().ToString() == "192.168.1.254");
    }

    SECTION("/30 keeps two hosts") {
        const auto addresses = Collect(AddressSpace::Iterate("10.0.0.1", 30, options));
        REQUIRE(addresses.size() == 2);
        CHECK(addresses[0].ToString() == "10.0.0.1");
        CHECK(addresses[1].ToString() == "10.0.0.2");
    }

    SECTION("/31 and /32 are never trimmed") {
        CHECK(Collect(AddressSpace::Iterate("10.0.0.1", 31, options)).size() == 2);
        CHECK(Collect(AddressSpace::Iterate("10.0.0.1", 32, options)).size() == 1);
    }

    SECTION("Default keeps them") {
        CHECK(Collect(AddressSpace::Iterate("192.168.1.17", 24)).size() == 256);
    }

    SECTION("Options value and defaulted argument agree") {
        const AddressSpaceOptions defaults;
        CHECK_FALSE(defaults.exclude_reserved);
        CHECK(Collect(AddressSpace::Iterate(IPv4Address::Parse("10.1.2.3"), 28, defaults)) ==
              Collect(AddressSpace::Iterate(IPv4Address::Parse("10.1.2.3"), 28)));
        CHECK(Collect(AddressSpace::Iterate("10.1.2.3", 28, AddressSpaceOptions{true})).size() == 14);
    }
}

TEST_CASE("AddressSpace: ranges are restartable values", "[network][address_space]") {
    const auto range = AddressSpace::Iterate("192.168.50.3", 26);

    SECTION("Iterating twice gives the same sequence") {
        CHECK(Collect(range) == Collect(range));
    }

    SECTION("Independent iterators do not interfere") {
        auto a = range.begin();
        auto b = range.begin();
        ++a;
        ++a;
        CHECK(b->ToString() == "192.168.50.0");
        CHECK(a->ToString() == "192.168.50.2");
    }

    SECTION("Concurrent walks") {
        std::vector<std::vector<IPv4Address>> results(4);
        std::vector<std::thread> threads;
        for (size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&, i]() { results[i] = Collect(range); });
        }
        for (auto& t : threads) {
            t.join();
        }
        for (const auto& r : results) {
            CHECK(r.size() == 64);
            CHECK(r == results[0]);
        }
    }

    SECTION("Copies iterate independently of the original") {
        auto copy = range;
        CHECK(Collect(copy) == Collect(range));
    }
}

TEST_CASE("AddressSpace: invalid input fails at call time", "[network][address_space]") {
    REQUIRE_THROWS_AS(AddressSpace::Iterate("192.168.1.1", 33), InvalidMaskError);
    REQUIRE_THROWS_AS(AddressSpace::Iterate("192.168.1.1", -1), InvalidMaskError);
    REQUIRE_THROWS_AS(AddressSpace::Iterate("192.168.1.256", 24), InvalidAddressError);
    REQUIRE_THROWS_AS(AddressSpace::Iterate("", 24), InvalidAddressError);
    REQUIRE_THROWS_AS(AddressSpace::Iterate(IPv4Address::Parse("10.0.0.1"), 40), InvalidMaskError);
}
