// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "util/netaddress.hpp"

#include "util/logging.hpp"

#include <asio/ip/address.hpp>

namespace lanscan {
namespace util {

// ============================================================================
// Byte-based helpers
// ============================================================================

bool IsIPv4Loopback(uint8_t b0) noexcept {
  // 127.0.0.0/8 - Loopback (RFC 1122)
  // 0.0.0.0/8 - "This network" (RFC 1122) - treated as local
  return b0 == 127 || b0 == 0;
}

bool IsIPv4Private(uint8_t b0, uint8_t b1) noexcept {
  // 10.0.0.0/8
  if (b0 == 10)
    return true;
  // 172.16.0.0/12
  if (b0 == 172 && (b1 >= 16 && b1 <= 31))
    return true;
  // 192.168.0.0/16
  if (b0 == 192 && b1 == 168)
    return true;
  return false;
}

bool IsIPv4LinkLocal(uint8_t b0, uint8_t b1) noexcept {
  return b0 == 169 && b1 == 254;
}

bool IsIPv4Multicast(uint8_t b0) noexcept {
  return (b0 & 0xF0) == 224;
}

// ============================================================================
// String-based functions (parse then delegate to byte helpers)
// ============================================================================

static std::optional<asio::ip::address_v4> ParseV4(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  if (ip.is_v4()) {
    return ip.to_v4();
  }
  // Example: ::ffff:192.168.1.1 -> 192.168.1.1
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    return asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6());
  }
  return std::nullopt;
}

std::optional<std::string> ValidateAndNormalizeIPv4(const std::string& address) {
  try {
    auto v4 = ParseV4(address);
    if (!v4) {
      return std::nullopt;
    }
    return v4->to_string();
  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIPv4: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPv4Address(const std::string& address) {
  return ValidateAndNormalizeIPv4(address).has_value();
}

bool IsIPv6Address(const std::string& address) {
  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec) {
    return false;
  }
  return ip.is_v6() && !ip.to_v6().is_v4_mapped();
}

bool IsRFC1918(const std::string& address) {
  auto v4 = ParseV4(address);
  if (!v4)
    return false;
  auto bytes = v4->to_bytes();
  return IsIPv4Private(bytes[0], bytes[1]);
}

bool IsRFC3927(const std::string& address) {
  auto v4 = ParseV4(address);
  if (!v4)
    return false;
  auto bytes = v4->to_bytes();
  return IsIPv4LinkLocal(bytes[0], bytes[1]);
}

bool IsRFC6598(const std::string& address) {
  auto v4 = ParseV4(address);
  if (!v4)
    return false;
  auto bytes = v4->to_bytes();

  // 100.64.0.0/10
  return bytes[0] == 100 && (bytes[1] >= 64 && bytes[1] <= 127);
}

bool IsLocal(const std::string& address) {
  auto v4 = ParseV4(address);
  if (!v4)
    return false;
  auto bytes = v4->to_bytes();
  return IsIPv4Loopback(bytes[0]) || IsIPv4LinkLocal(bytes[0], bytes[1]);
}

}  // namespace util
}  // namespace lanscan
