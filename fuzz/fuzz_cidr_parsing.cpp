// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

// Fuzz target for subnet and address parsing
// Tests Subnet::Parse, IPv4Address::TryParse and AddressSpace ranges
//
// Subnet text comes straight from the command line and interface
// enumeration. Parsing must either succeed with a well-formed Subnet or
// throw one of the documented invalid_argument subclasses. Anything else
// (other exception types, inconsistent results, a range that escapes its
// subnet) is a bug.
//
// Target code:
// - src/network/ipv4.cpp (IPv4Address::Parse, MaskBitsFromDotted, Subnet::Parse)
// - src/network/address_space.cpp (AddressRange)

#include "network/address_space.hpp"
#include "network/discovery_errors.hpp"
#include "network/ipv4.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

using namespace lanscan::network;

namespace {

class FuzzInput {
public:
    FuzzInput(const uint8_t* data, size_t size) : data_(data), size_(size), offset_(0) {}

    std::string read_remaining() {
        if (offset_ >= size_) {
            return "";
        }
        std::string result(reinterpret_cast<const char*>(data_ + offset_), size_ - offset_);
        offset_ = size_;
        return result;
    }

    template <typename T>
    T read() {
        if (offset_ + sizeof(T) > size_) {
            return T{};
        }
        T value;
        memcpy(&value, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};

// Walks at most max_steps addresses of range and checks each stays inside
void CheckRangePrefix(const AddressRange& range, int max_steps) {
    int steps = 0;
    IPv4Address previous;
    for (const auto& address : range) {
        if (!range.subnet().Contains(address)) {
            __builtin_trap();
        }
        if (steps > 0 && !(previous < address)) {
            // Sequence must be strictly ascending
            __builtin_trap();
        }
        previous = address;
        if (++steps >= max_steps) {
            break;
        }
    }
    if (static_cast<uint64_t>(steps) > range.size()) {
        __builtin_trap();
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) {
        return 0;
    }

    FuzzInput input(data, size);
    const uint8_t mode = input.read<uint8_t>();

    // TEST 1: Subnet::Parse on arbitrary text
    if ((mode & 0x03) == 0) {
        const std::string text = input.read_remaining();
        try {
            const Subnet subnet = Subnet::Parse(text);

            if (subnet.prefix_length() < 0 || subnet.prefix_length() > 32) {
                __builtin_trap();
            }
            // Host bits are always cleared
            if ((subnet.network().value() & ~subnet.mask()) != 0) {
                __builtin_trap();
            }
            // Canonical text parses back to the same subnet
            if (!(Subnet::Parse(subnet.ToString()) == subnet)) {
                __builtin_trap();
            }
        } catch (const InvalidAddressError&) {
        } catch (const InvalidMaskError&) {
        } catch (...) {
            // Any other exception type is a bug
            __builtin_trap();
        }
    }

    // TEST 2: TryParse and Parse agree
    if ((mode & 0x03) == 1) {
        const std::string text = input.read_remaining();
        const auto parsed = IPv4Address::TryParse(text);
        bool threw = false;
        try {
            const IPv4Address address = IPv4Address::Parse(text);
            if (!parsed || *parsed != address) {
                __builtin_trap();
            }
            // Formatting round trip
            if (IPv4Address::Parse(address.ToString()) != address) {
                __builtin_trap();
            }
        } catch (const InvalidAddressError&) {
            threw = true;
        } catch (...) {
            __builtin_trap();
        }
        if (threw == parsed.has_value()) {
            __builtin_trap();
        }
    }

    // TEST 3: ranges from arbitrary (address, mask) pairs
    if ((mode & 0x03) == 2) {
        const uint32_t raw = input.read<uint32_t>();
        const int mask_bits = static_cast<int>(input.read<uint8_t>() % 40);
        const bool exclude_reserved = (mode & 0x04) != 0;
        try {
            AddressSpace::Options options;
            options.exclude_reserved = exclude_reserved;
            const auto range = AddressSpace::Iterate(IPv4Address(raw), mask_bits, options);
            if (mask_bits > 32) {
                // Must have thrown
                __builtin_trap();
            }
            CheckRangePrefix(range, 1024);
            if (!exclude_reserved && range.size() != range.subnet().size()) {
                __builtin_trap();
            }
        } catch (const InvalidMaskError&) {
            if (mask_bits <= 32) {
                __builtin_trap();
            }
        } catch (...) {
            __builtin_trap();
        }
    }

    // TEST 4: successor carries
    if ((mode & 0x03) == 3) {
        const IPv4Address address(input.read<uint32_t>());
        const IPv4Address next = address.Next();
        if (next.value() != static_cast<uint32_t>(address.value() + 1u)) {
            __builtin_trap();
        }
    }

    return 0;
}
