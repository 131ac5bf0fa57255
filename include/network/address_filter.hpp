// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

#include "network/interface_source.hpp"

#include <functional>
#include <string>
#include <vector>

namespace lanscan {
namespace network {

// Decides whether the subnet of an interface address is scanned at all
using AddressFilter = std::function<bool(const InterfaceAddress&)>;

namespace filters {

// Accepts everything (non-IPv4 entries are still skipped by the orchestrator)
AddressFilter Any();

// IPv4 entries only
AddressFilter IPv4Only();

// IPv4 entries in RFC 1918 space (10/8, 172.16/12, 192.168/16). The default.
AddressFilter PrivateIPv4();

// Textual prefix match on the address, e.g. "192.168."
AddressFilter PrefixMatches(const std::string& prefix);

// Prefix length at least min_bits, e.g. 16 to refuse /8 interfaces
AddressFilter MinPrefixLength(int min_bits);

// Interface name is one of names
AddressFilter InterfaceNamed(const std::vector<std::string>& names);

// Interface is up and not a loopback interface
AddressFilter UpAndNotLoopback();

// Conjunction; an empty list accepts everything
AddressFilter AllOf(std::vector<AddressFilter> filters);

// Command-line form: "private", "ipv4", "all" or "prefix:<text>".
// Throws ConfigError for anything else.
AddressFilter FromSpec(const std::string& spec);

}  // namespace filters
}  // namespace network
}  // namespace lanscan
