// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "network/interface_source.hpp"

#include "network/discovery_errors.hpp"
#include "util/logging.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <bit>
#include <memory>

namespace lanscan {
namespace network {

const char* AddressFamilyToString(AddressFamily family) {
  switch (family) {
  case AddressFamily::IPV4:
    return "ipv4";
  case AddressFamily::IPV6:
    return "ipv6";
  case AddressFamily::OTHER:
    return "other";
  }
  return "unknown";
}

InterfaceAddress InterfaceAddress::IPv4(const std::string& interface_name, const std::string& address,
                                        int prefix_length) {
  InterfaceAddress entry;
  entry.interface_name = interface_name;
  entry.family = AddressFamily::IPV4;
  entry.address = address;
  entry.prefix_length = prefix_length;
  return entry;
}

namespace {

int CountPrefixBits(const uint8_t* bytes, size_t len) {
  int bits = 0;
  for (size_t i = 0; i < len; ++i) {
    bits += std::popcount(static_cast<unsigned>(bytes[i]));
  }
  return bits;
}

struct IfAddrsDeleter {
  void operator()(ifaddrs* list) const { freeifaddrs(list); }
};

}  // namespace

std::vector<InterfaceAddress> SystemInterfaceSource::Enumerate() {
  ifaddrs* raw = nullptr;
  if (getifaddrs(&raw) != 0) {
    throw InterfaceEnumerationError(std::string("getifaddrs failed: ") + std::strerror(errno));
  }
  std::unique_ptr<ifaddrs, IfAddrsDeleter> list(raw);

  std::vector<InterfaceAddress> result;
  for (ifaddrs* ifa = list.get(); ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_addr == nullptr) {
      continue;
    }

    InterfaceAddress entry;
    entry.interface_name = ifa->ifa_name ? ifa->ifa_name : "";
    entry.is_up = (ifa->ifa_flags & IFF_UP) != 0;
    entry.is_loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;

    char text[INET6_ADDRSTRLEN] = {};
    const int family = ifa->ifa_addr->sa_family;

    if (family == AF_INET) {
      const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
      if (inet_ntop(AF_INET, &sin->sin_addr, text, sizeof(text)) == nullptr) {
        continue;
      }
      entry.family = AddressFamily::IPV4;
      entry.address = text;
      if (ifa->ifa_netmask) {
        const auto* mask = reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask);
        entry.prefix_length = CountPrefixBits(reinterpret_cast<const uint8_t*>(&mask->sin_addr), 4);
      } else {
        entry.prefix_length = 32;
      }
    } else if (family == AF_INET6) {
      const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_addr);
      if (inet_ntop(AF_INET6, &sin6->sin6_addr, text, sizeof(text)) == nullptr) {
        continue;
      }
      entry.family = AddressFamily::IPV6;
      entry.address = text;
      if (ifa->ifa_netmask) {
        const auto* mask = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_netmask);
        entry.prefix_length = CountPrefixBits(mask->sin6_addr.s6_addr, 16);
      } else {
        entry.prefix_length = 128;
      }
    } else {
      // Link-layer (AF_PACKET) entries carry no IP address
      continue;
    }

    LOG_NET_TRACE("interface {}: {} {}/{}{}{}", entry.interface_name, AddressFamilyToString(entry.family),
                  entry.address, entry.prefix_length, entry.is_up ? "" : " (down)",
                  entry.is_loopback ? " (loopback)" : "");
    result.push_back(std::move(entry));
  }

  LOG_NET_DEBUG("enumerated {} interface addresses", result.size());
  return result;
}

}  // namespace network
}  // namespace lanscan
