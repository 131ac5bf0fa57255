// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "network/address_filter.hpp"

#include "network/discovery_errors.hpp"
#include "util/netaddress.hpp"

#include <algorithm>
#include <utility>

namespace lanscan {
namespace network {
namespace filters {

AddressFilter Any() {
  return [](const InterfaceAddress&) { return true; };
}

AddressFilter IPv4Only() {
  return [](const InterfaceAddress& entry) { return entry.family == AddressFamily::IPV4; };
}

AddressFilter PrivateIPv4() {
  return [](const InterfaceAddress& entry) {
    return entry.family == AddressFamily::IPV4 && util::IsRFC1918(entry.address);
  };
}

AddressFilter PrefixMatches(const std::string& prefix) {
  return [prefix](const InterfaceAddress& entry) { return entry.address.starts_with(prefix); };
}

AddressFilter MinPrefixLength(int min_bits) {
  return [min_bits](const InterfaceAddress& entry) { return entry.prefix_length >= min_bits; };
}

AddressFilter InterfaceNamed(const std::vector<std::string>& names) {
  return [names](const InterfaceAddress& entry) {
    return std::find(names.begin(), names.end(), entry.interface_name) != names.end();
  };
}

AddressFilter UpAndNotLoopback() {
  return [](const InterfaceAddress& entry) { return entry.is_up && !entry.is_loopback; };
}

AddressFilter AllOf(std::vector<AddressFilter> filters) {
  return [filters = std::move(filters)](const InterfaceAddress& entry) {
    for (const auto& filter : filters) {
      if (filter && !filter(entry)) {
        return false;
      }
    }
    return true;
  };
}

AddressFilter FromSpec(const std::string& spec) {
  if (spec == "private") {
    return PrivateIPv4();
  }
  if (spec == "ipv4") {
    return IPv4Only();
  }
  if (spec == "all") {
    return Any();
  }
  static const std::string kPrefix = "prefix:";
  if (spec.starts_with(kPrefix) && spec.size() > kPrefix.size()) {
    return AllOf({IPv4Only(), PrefixMatches(spec.substr(kPrefix.size()))});
  }
  throw ConfigError("unknown address filter '" + spec + "' (expected private, ipv4, all or prefix:<text>)");
}

}  // namespace filters
}  // namespace network
}  // namespace lanscan
