// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

/*
 DiscoveryOrchestrator — LAN peer discovery run

 Purpose
 - Turn the host's interface list into a set of subnets, probe every
   candidate address in them on the well-known port, and report the
   addresses where something accepted the connection

 Flow
 1. InterfaceSource::Enumerate() (failure aborts the run)
 2. Plan(): drop non-IPv4 entries and entries rejected by the filter,
    collapse interfaces that share a subnet (or sit inside a larger one)
 3. Chain one AddressRange per planned subnet into a single candidate
    stream for ProbeWorkerPool, so concurrency_limit bounds the whole run
 4. Accumulate reachable results into the DiscoverySet. Results arrive on
    the pool strand, which makes the accumulator single-writer.

 Every call to Discover() starts from an empty DiscoverySet; no results are
 kept between runs. Finding no matching interface is a normal, empty result.
*/

#include "network/address_filter.hpp"
#include "network/address_space.hpp"
#include "network/connector.hpp"
#include "network/interface_source.hpp"
#include "network/ipv4.hpp"
#include "network/probe_worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace lanscan {
namespace network {

// A subnet selected for scanning and the interface it was found on
struct ScanTarget {
  Subnet subnet;
  std::string interface_name;
  IPv4Address local_address;
};

// "Candidate found" marker for one address
struct DiscoveredPeer {
  IPv4Address address;
  uint16_t port{0};
  std::string interface_name;
  std::chrono::milliseconds latency{0};
};

// Confirmed-reachable addresses of one run, keyed (and ordered) by address
using DiscoverySet = std::map<IPv4Address, DiscoveredPeer>;

struct DiscoveryResult {
  RunStatus status{RunStatus::COMPLETED};
  DiscoverySet peers;
  // Only filled when Config::record_unreachable is set
  std::map<IPv4Address, ProbeStatus> unreachable;
  std::vector<ScanTarget> targets;
  ProbeWorkerPool::Stats stats;
  uint16_t port{0};

  bool completed() const { return status == RunStatus::COMPLETED; }

  nlohmann::json ToJson() const;
};

class DiscoveryOrchestrator {
public:
  struct Config {
    uint16_t port = DEFAULT_PROBE_PORT;
    std::chrono::milliseconds timeout{500};
    size_t concurrency_limit = 64;
    size_t io_threads = 1;
    std::chrono::milliseconds run_deadline{0};

    // Skip network identifier and broadcast address of each subnet
    bool exclude_reserved = false;
    // Do not probe this host's own addresses
    bool skip_local_addresses = false;
    // Diagnostic mode: keep failed probes in DiscoveryResult::unreachable
    bool record_unreachable = false;

    AddressFilter filter = filters::PrivateIPv4();

    // Throws ConfigError
    void Validate() const;
    ProbeWorkerPool::Config ToPoolConfig() const;
  };

  // Throws ConfigError for an invalid config or missing collaborators
  DiscoveryOrchestrator(std::shared_ptr<InterfaceSource> interfaces, std::shared_ptr<Connector> connector,
                        const Config& config);
  ~DiscoveryOrchestrator();

  DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
  DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

  // Enumerate interfaces, then discover. Blocking.
  // Throws InterfaceEnumerationError if enumeration fails, InvalidAddressError or
  // InvalidMaskError for malformed entries that pass the filter.
  DiscoveryResult Discover();

  // Discover over an explicit interface list. Blocking.
  DiscoveryResult Discover(const std::vector<InterfaceAddress>& interfaces);

  // Thread-safe. The running Discover() returns promptly with status
  // CANCELLED and the peers found so far. A request made while no Discover()
  // is running is held and ends the next one before its first probe.
  void Cancel();

  // Subnets Discover() would scan for this interface list
  std::vector<ScanTarget> Plan(const std::vector<InterfaceAddress>& interfaces) const;

  const Config& config() const { return config_; }

private:
  std::shared_ptr<InterfaceSource> interfaces_;
  Config config_;
  std::unique_ptr<ProbeWorkerPool> pool_;
  // Set by Cancel(), consumed when a Discover() returns
  std::atomic<bool> cancel_requested_{false};
};

}  // namespace network
}  // namespace lanscan
