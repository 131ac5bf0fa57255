// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

/*
 IPv4 value types

 IPv4Address - immutable 32-bit address, ordered by integer value
 Subnet      - network identifier plus prefix length (CIDR), always stored
               with host bits cleared
*/

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <asio/ip/address_v4.hpp>

namespace lanscan {
namespace network {

class IPv4Address {
public:
  using Bytes = std::array<uint8_t, 4>;

  constexpr IPv4Address() = default;
  constexpr explicit IPv4Address(uint32_t value) : value_(value) {}

  // Bytes in network order (b[0] is the most significant octet)
  static IPv4Address FromBytes(const Bytes& bytes);
  static IPv4Address FromAsio(const asio::ip::address_v4& addr);

  // Parse dotted-quad (or IPv4-mapped IPv6) text. Throws InvalidAddressError.
  static IPv4Address Parse(const std::string& text);
  static std::optional<IPv4Address> TryParse(const std::string& text);

  constexpr uint32_t value() const { return value_; }
  Bytes bytes() const;
  asio::ip::address_v4 to_asio() const;
  std::string ToString() const;

  // Successor address. Increments the last octet and carries into the next
  // more significant octet on overflow from 255 to 0; 255.255.255.255 wraps
  // to 0.0.0.0. Returns a new value, this one is unchanged.
  IPv4Address Next() const;

  bool IsPrivate() const;
  bool IsLoopback() const;

  constexpr auto operator<=>(const IPv4Address&) const = default;

private:
  uint32_t value_{0};
};

// Netmask with the top mask_bits bits set. Throws InvalidMaskError outside [0, 32].
uint32_t MaskFromBits(int mask_bits);

// "255.255.254.0" -> 23. Throws InvalidMaskError for non-contiguous masks and
// InvalidAddressError for text that is not an address at all.
int MaskBitsFromDotted(const std::string& mask);

class Subnet {
public:
  // Clears host bits of address. Throws InvalidMaskError.
  Subnet(IPv4Address address, int mask_bits);

  // "192.168.1.17/24" or "192.168.1.17/255.255.255.0"; a bare address is a /32.
  static Subnet Parse(const std::string& cidr);

  IPv4Address network() const { return network_; }
  IPv4Address broadcast() const { return IPv4Address(network_.value() | ~mask_); }
  uint32_t mask() const { return mask_; }
  int prefix_length() const { return prefix_length_; }

  // 2^(32 - prefix_length)
  uint64_t size() const { return uint64_t{1} << (32 - prefix_length_); }

  bool Contains(IPv4Address address) const { return (address.value() & mask_) == network_.value(); }

  std::string ToString() const;

  bool operator==(const Subnet& other) const = default;

private:
  IPv4Address network_;
  uint32_t mask_{0};
  int prefix_length_{0};
};

}  // namespace network
}  // namespace lanscan

namespace std {
template <>
struct hash<lanscan::network::IPv4Address> {
  size_t operator()(const lanscan::network::IPv4Address& addr) const noexcept {
    return std::hash<uint32_t>{}(addr.value());
  }
};
}  // namespace std
