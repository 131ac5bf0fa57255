// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IPv4 address strings coming from the command line,
   from interface enumeration and from command-line subnet arguments
 - Classify IPv4 addresses (private, loopback, link-local, multicast) so that
   interface filters can decide which subnets are worth scanning

 Key functions:
 - ValidateAndNormalizeIPv4: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - IsRFC1918 / IsLocal: classification used by the default "private only" filter
*/

#include <cstdint>
#include <optional>
#include <string>

namespace lanscan {
namespace util {

/**
 * Validate and normalize an IPv4 address string
 *
 * Wraps asio::ip::make_address() and:
 * 1. Accepts dotted-quad IPv4 ("192.168.1.10")
 * 2. Accepts IPv4-mapped IPv6 ("::ffff:192.168.1.10") and returns the IPv4 form
 * 3. Rejects everything else, including native IPv6, hostnames and empty input
 *
 * @return Canonical dotted-quad string, or std::nullopt if not an IPv4 address
 *
 * Examples:
 *   "192.168.1.1"        -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "fe80::1"            -> std::nullopt
 *   "192.168.1"          -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIPv4(const std::string& address);

bool IsValidIPv4Address(const std::string& address);

// True for textual IPv6 addresses that are not IPv4-mapped
bool IsIPv6Address(const std::string& address);

// RFC Compliance Checks (string-based, IPv4 only; false for anything unparseable)
bool IsRFC1918(const std::string& address);  // Private IPv4
bool IsRFC3927(const std::string& address);  // Link-local IPv4
bool IsRFC6598(const std::string& address);  // Shared CGNAT

// Loopback (127/8, 0/8) or link-local
bool IsLocal(const std::string& address);

// ============================================================================
// Byte-based helpers (shared by IPv4Address methods and string functions)
// ============================================================================

// 127.0.0.0/8 and 0.0.0.0/8
bool IsIPv4Loopback(uint8_t b0) noexcept;

// 10/8, 172.16/12, 192.168/16
bool IsIPv4Private(uint8_t b0, uint8_t b1) noexcept;

// 169.254/16
bool IsIPv4LinkLocal(uint8_t b0, uint8_t b1) noexcept;

// 224/4
bool IsIPv4Multicast(uint8_t b0) noexcept;

}  // namespace util
}  // namespace lanscan
