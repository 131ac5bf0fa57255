// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

/*
 AddressSpace — candidate address enumeration for one subnet

 Purpose
 - Turn a local (address, mask length) pair into the ascending sequence of
   every address in the attached subnet

 Behaviour
 - The sequence starts at the network identifier (address AND mask) and
   advances with IPv4Address::Next(). It stops as soon as the successor is no
   longer contained in the subnet (mask test), so 192.168.1.255 -> 192.168.2.0
   ends a /24.
 - By default the network identifier and the broadcast address are ordinary
   candidates. AddressSpaceOptions::exclude_reserved drops both for prefixes
   up to /30; /31 and /32 have no reserved addresses and are never trimmed.
 - AddressRange is a value: iterating it does not modify it, any number of
   iterators (on any threads) can walk it, and iterating it again yields the
   same sequence.
 - Invalid input throws at call time (InvalidAddressError, InvalidMaskError);
   iteration itself never throws.
*/

#include "network/ipv4.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>

namespace lanscan {
namespace network {

class AddressRange {
public:
  class Iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = IPv4Address;
    using difference_type = std::ptrdiff_t;
    using pointer = const IPv4Address*;
    using reference = const IPv4Address&;

    Iterator() = default;

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }

    Iterator& operator++();
    Iterator operator++(int) {
      Iterator tmp = *this;
      ++*this;
      return tmp;
    }

    bool operator==(const Iterator& other) const {
      if (done_ || other.done_) {
        return done_ == other.done_;
      }
      return current_ == other.current_;
    }

  private:
    friend class AddressRange;
    Iterator(const AddressRange& range, bool done)
        : subnet_(range.subnet_), last_(range.last_), current_(range.first_), done_(done) {}

    // Copied from the range so an iterator never dangles
    Subnet subnet_{IPv4Address(), 0};
    IPv4Address last_;
    IPv4Address current_;
    bool done_{true};
  };

  AddressRange(const Subnet& subnet, bool exclude_reserved);

  Iterator begin() const { return Iterator(*this, empty()); }
  Iterator end() const { return Iterator(); }

  const Subnet& subnet() const { return subnet_; }
  IPv4Address first() const { return first_; }
  IPv4Address last() const { return last_; }

  // Number of addresses the range yields
  uint64_t size() const;
  bool empty() const { return size() == 0; }

private:
  Subnet subnet_;
  IPv4Address first_;
  IPv4Address last_;
};

// Declared outside AddressSpace so it is complete where Iterate() defaults it
struct AddressSpaceOptions {
  // Skip the network identifier and broadcast address (prefixes up to /30)
  bool exclude_reserved = false;
};

class AddressSpace {
public:
  using Options = AddressSpaceOptions;

  // Lazy sequence of every address of the subnet containing address.
  // Throws InvalidMaskError if mask_bits is outside [0, 32].
  static AddressRange Iterate(IPv4Address address, int mask_bits, const Options& options = {});

  // Same, parsing the address. Throws InvalidAddressError or InvalidMaskError.
  static AddressRange Iterate(const std::string& address, int mask_bits, const Options& options = {});
};

}  // namespace network
}  // namespace lanscan
