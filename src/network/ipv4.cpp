// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "network/ipv4.hpp"

#include "network/discovery_errors.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <bit>

namespace lanscan {
namespace network {

// ============================================================================
// IPv4Address
// ============================================================================

IPv4Address IPv4Address::FromBytes(const Bytes& bytes) {
  return IPv4Address((uint32_t{bytes[0]} << 24) | (uint32_t{bytes[1]} << 16) | (uint32_t{bytes[2]} << 8) |
                     uint32_t{bytes[3]});
}

IPv4Address IPv4Address::FromAsio(const asio::ip::address_v4& addr) {
  return IPv4Address(addr.to_uint());
}

IPv4Address IPv4Address::Parse(const std::string& text) {
  auto parsed = TryParse(text);
  if (!parsed) {
    throw InvalidAddressError(text);
  }
  return *parsed;
}

std::optional<IPv4Address> IPv4Address::TryParse(const std::string& text) {
  auto normalized = util::ValidateAndNormalizeIPv4(text);
  if (!normalized) {
    return std::nullopt;
  }
  asio::error_code ec;
  auto v4 = asio::ip::make_address_v4(*normalized, ec);
  if (ec) {
    return std::nullopt;
  }
  return FromAsio(v4);
}

IPv4Address::Bytes IPv4Address::bytes() const {
  return Bytes{static_cast<uint8_t>(value_ >> 24), static_cast<uint8_t>(value_ >> 16),
               static_cast<uint8_t>(value_ >> 8), static_cast<uint8_t>(value_)};
}

asio::ip::address_v4 IPv4Address::to_asio() const {
  return asio::ip::address_v4(value_);
}

std::string IPv4Address::ToString() const {
  return to_asio().to_string();
}

IPv4Address IPv4Address::Next() const {
  Bytes b = bytes();
  for (int i = 3; i >= 0; --i) {
    if (b[i] != 255) {
      ++b[i];
      break;
    }
    // 255 rolls over to 0 and carries into the next octet
    b[i] = 0;
  }
  return FromBytes(b);
}

bool IPv4Address::IsPrivate() const {
  auto b = bytes();
  return util::IsIPv4Private(b[0], b[1]);
}

bool IPv4Address::IsLoopback() const {
  return util::IsIPv4Loopback(bytes()[0]);
}

// ============================================================================
// Masks
// ============================================================================

uint32_t MaskFromBits(int mask_bits) {
  if (mask_bits < 0 || mask_bits > 32) {
    throw InvalidMaskError("mask length out of range [0, 32]: " + std::to_string(mask_bits));
  }
  if (mask_bits == 0) {
    return 0;
  }
  return ~uint32_t{0} << (32 - mask_bits);
}

int MaskBitsFromDotted(const std::string& mask) {
  const uint32_t value = IPv4Address::Parse(mask).value();
  const int bits = std::popcount(value);
  // Contiguous iff the mask equals the canonical mask with the same number of ones
  if (value != MaskFromBits(bits)) {
    throw InvalidMaskError("non-contiguous netmask: " + mask);
  }
  return bits;
}

// ============================================================================
// Subnet
// ============================================================================

Subnet::Subnet(IPv4Address address, int mask_bits)
    : mask_(MaskFromBits(mask_bits)), prefix_length_(mask_bits) {
  network_ = IPv4Address(address.value() & mask_);
}

Subnet Subnet::Parse(const std::string& cidr) {
  const size_t slash = cidr.find('/');
  if (slash == std::string::npos) {
    return Subnet(IPv4Address::Parse(cidr), 32);
  }

  const std::string address_part = cidr.substr(0, slash);
  const std::string mask_part = cidr.substr(slash + 1);
  const IPv4Address address = IPv4Address::Parse(address_part);

  if (mask_part.find('.') != std::string::npos) {
    return Subnet(address, MaskBitsFromDotted(mask_part));
  }

  auto bits = util::SafeParseInt(mask_part, 0, 32);
  if (!bits) {
    throw InvalidMaskError("invalid mask length in '" + cidr + "'");
  }
  return Subnet(address, *bits);
}

std::string Subnet::ToString() const {
  return network_.ToString() + "/" + std::to_string(prefix_length_);
}

}  // namespace network
}  // namespace lanscan
