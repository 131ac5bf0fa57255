// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

/*
 InterfaceSource — where the local (address, prefix length) pairs come from

 StaticInterfaceSource  fixed list (tests, --subnet on the command line)
 SystemInterfaceSource  host interfaces via getifaddrs(3)
*/

#include <string>
#include <utility>
#include <vector>

namespace lanscan {
namespace network {

enum class AddressFamily { IPV4, IPV6, OTHER };

const char* AddressFamilyToString(AddressFamily family);

// One address bound to a host interface. Read-only to the discovery core.
struct InterfaceAddress {
  std::string interface_name;
  AddressFamily family{AddressFamily::IPV4};
  std::string address;
  int prefix_length{0};
  bool is_loopback{false};
  bool is_up{true};

  // Convenience for IPv4 entries
  static InterfaceAddress IPv4(const std::string& interface_name, const std::string& address, int prefix_length);
};

class InterfaceSource {
public:
  virtual ~InterfaceSource() = default;

  // Throws InterfaceEnumerationError if the list cannot be obtained
  virtual std::vector<InterfaceAddress> Enumerate() = 0;
};

class StaticInterfaceSource : public InterfaceSource {
public:
  StaticInterfaceSource() = default;
  explicit StaticInterfaceSource(std::vector<InterfaceAddress> addresses) : addresses_(std::move(addresses)) {}

  void Add(const InterfaceAddress& address) { addresses_.push_back(address); }

  std::vector<InterfaceAddress> Enumerate() override { return addresses_; }

private:
  std::vector<InterfaceAddress> addresses_;
};

class SystemInterfaceSource : public InterfaceSource {
public:
  std::vector<InterfaceAddress> Enumerate() override;
};

}  // namespace network
}  // namespace lanscan
