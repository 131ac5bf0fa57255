// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

/*
 Discovery error taxonomy

 Exceptions are reserved for input and configuration errors, which fail the
 call synchronously and before any probe is sent. Per-probe failures
 (timeouts, refused connections) are ProbeStatus values and cancellation is
 a RunStatus, so neither ever surfaces as an exception.
*/

#include <stdexcept>
#include <string>

namespace lanscan {
namespace network {

// Address text that is not a valid IPv4 address
class InvalidAddressError : public std::invalid_argument {
public:
  explicit InvalidAddressError(const std::string& address)
      : std::invalid_argument("invalid IPv4 address: '" + address + "'"), address_(address) {}

  const std::string& address() const noexcept { return address_; }

private:
  std::string address_;
};

// Mask length outside [0, 32], or a dotted mask with non-contiguous bits
class InvalidMaskError : public std::invalid_argument {
public:
  explicit InvalidMaskError(const std::string& what) : std::invalid_argument(what) {}
};

// Rejected discovery or probe configuration (port, timeout, concurrency, threads)
class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// The interface source could not produce an interface list. Aborts the run.
class InterfaceEnumerationError : public std::runtime_error {
public:
  explicit InterfaceEnumerationError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace network
}  // namespace lanscan
