// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "network/address_space.hpp"

namespace lanscan {
namespace network {

// Prefixes longer than this have no network/broadcast addresses (RFC 3021 for /31)
static constexpr int MAX_TRIMMABLE_PREFIX = 30;

AddressRange::AddressRange(const Subnet& subnet, bool exclude_reserved)
    : subnet_(subnet), first_(subnet.network()), last_(subnet.broadcast()) {
  if (exclude_reserved && subnet.prefix_length() <= MAX_TRIMMABLE_PREFIX) {
    first_ = IPv4Address(first_.value() + 1);
    last_ = IPv4Address(last_.value() - 1);
  }
}

uint64_t AddressRange::size() const {
  return uint64_t{last_.value()} - uint64_t{first_.value()} + 1;
}

AddressRange::Iterator& AddressRange::Iterator::operator++() {
  if (done_) {
    return *this;
  }
  if (current_ == last_) {
    done_ = true;
    return *this;
  }

  const IPv4Address next = current_.Next();
  // Leaving the subnet ends the sequence; for /0 the successor of
  // 255.255.255.255 wraps back into the subnet, which the last_ check covers.
  if (!subnet_.Contains(next)) {
    done_ = true;
    return *this;
  }
  current_ = next;
  return *this;
}

AddressRange AddressSpace::Iterate(IPv4Address address, int mask_bits, const Options& options) {
  return AddressRange(Subnet(address, mask_bits), options.exclude_reserved);
}

AddressRange AddressSpace::Iterate(const std::string& address, int mask_bits, const Options& options) {
  return Iterate(IPv4Address::Parse(address), mask_bits, options);
}

}  // namespace network
}  // namespace lanscan
