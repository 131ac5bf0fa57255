// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "network/discovery_orchestrator.hpp"

#include "network/discovery_errors.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lanscan {
namespace network {

// ============================================================================
// Config
// ============================================================================

void DiscoveryOrchestrator::Config::Validate() const {
  ToPoolConfig().Validate();
  if (!filter) {
    throw ConfigError("address filter must be set");
  }
}

ProbeWorkerPool::Config DiscoveryOrchestrator::Config::ToPoolConfig() const {
  ProbeWorkerPool::Config pool;
  pool.port = port;
  pool.timeout = timeout;
  pool.concurrency_limit = concurrency_limit;
  pool.io_threads = io_threads;
  pool.run_deadline = run_deadline;
  return pool;
}

// ============================================================================
// DiscoveryResult
// ============================================================================

json DiscoveryResult::ToJson() const {
  json j;
  j["status"] = RunStatusToString(status);
  j["port"] = port;

  j["subnets"] = json::array();
  for (const auto& target : targets) {
    j["subnets"].push_back({{"subnet", target.subnet.ToString()},
                            {"interface", target.interface_name},
                            {"local_address", target.local_address.ToString()}});
  }

  j["peers"] = json::array();
  for (const auto& [address, peer] : peers) {
    j["peers"].push_back({{"address", address.ToString()},
                          {"port", peer.port},
                          {"interface", peer.interface_name},
                          {"latency_ms", peer.latency.count()}});
  }

  if (!unreachable.empty()) {
    j["unreachable"] = json::array();
    for (const auto& [address, probe_status] : unreachable) {
      j["unreachable"].push_back({{"address", address.ToString()}, {"status", ProbeStatusToString(probe_status)}});
    }
  }

  j["stats"] = {{"probes_started", stats.started},   {"probes_completed", stats.completed},
                {"reachable", stats.reachable},       {"timed_out", stats.timed_out},
                {"refused", stats.refused},           {"unreachable", stats.unreachable},
                {"errors", stats.errors},             {"cancelled", stats.cancelled},
                {"peak_in_flight", stats.peak_in_flight}, {"elapsed_ms", stats.elapsed.count()}};
  return j;
}

// ============================================================================
// DiscoveryOrchestrator
// ============================================================================

DiscoveryOrchestrator::DiscoveryOrchestrator(std::shared_ptr<InterfaceSource> interfaces,
                                             std::shared_ptr<Connector> connector, const Config& config)
    : interfaces_(std::move(interfaces)), config_(config) {
  if (!interfaces_) {
    throw ConfigError("DiscoveryOrchestrator requires an interface source");
  }
  config_.Validate();
  pool_ = std::make_unique<ProbeWorkerPool>(std::move(connector), config_.ToPoolConfig());
}

DiscoveryOrchestrator::~DiscoveryOrchestrator() = default;

void DiscoveryOrchestrator::Cancel() {
  LOG_DISC_DEBUG("discovery cancellation requested");
  // Flag first: a run registered after this point sees it, one registered
  // before is reached by the pool
  cancel_requested_ = true;
  pool_->Cancel();
}

std::vector<ScanTarget> DiscoveryOrchestrator::Plan(const std::vector<InterfaceAddress>& interfaces) const {
  std::vector<ScanTarget> candidates;
  for (const auto& entry : interfaces) {
    if (entry.family != AddressFamily::IPV4) {
      LOG_DISC_TRACE("skipping {} address {} on {}", AddressFamilyToString(entry.family), entry.address,
                     entry.interface_name);
      continue;
    }
    if (!config_.filter(entry)) {
      LOG_DISC_TRACE("filter rejected {}/{} on {}", entry.address, entry.prefix_length, entry.interface_name);
      continue;
    }
    // Malformed input fails the whole call
    const IPv4Address local = IPv4Address::Parse(entry.address);
    candidates.push_back(ScanTarget{Subnet(local, entry.prefix_length), entry.interface_name, local});
  }

  // Widest subnets first, so a narrower one that sits inside is recognised as covered
  std::stable_sort(candidates.begin(), candidates.end(), [](const ScanTarget& a, const ScanTarget& b) {
    return a.subnet.prefix_length() < b.subnet.prefix_length();
  });

  std::vector<ScanTarget> plan;
  for (auto& candidate : candidates) {
    const bool covered = std::any_of(plan.begin(), plan.end(), [&](const ScanTarget& planned) {
      return planned.subnet.Contains(candidate.subnet.network());
    });
    if (covered) {
      LOG_DISC_DEBUG("{} on {} already covered, not scanning twice", candidate.subnet.ToString(),
                     candidate.interface_name);
      continue;
    }
    plan.push_back(std::move(candidate));
  }
  return plan;
}

DiscoveryResult DiscoveryOrchestrator::Discover() {
  std::vector<InterfaceAddress> interfaces;
  try {
    interfaces = interfaces_->Enumerate();
  } catch (const InterfaceEnumerationError&) {
    cancel_requested_ = false;
    throw;
  } catch (const std::exception& e) {
    cancel_requested_ = false;
    throw InterfaceEnumerationError(std::string("interface enumeration failed: ") + e.what());
  }
  return Discover(interfaces);
}

DiscoveryResult DiscoveryOrchestrator::Discover(const std::vector<InterfaceAddress>& interfaces) {
  struct ConsumeCancel {
    std::atomic<bool>& flag;
    ~ConsumeCancel() { flag = false; }
  } consume_cancel{cancel_requested_};

  DiscoveryResult result;
  result.port = config_.port;
  result.targets = Plan(interfaces);

  if (cancel_requested_) {
    LOG_DISC_INFO("discovery cancelled before probing");
    result.status = RunStatus::CANCELLED;
    return result;
  }

  if (result.targets.empty()) {
    LOG_DISC_INFO("no interface attached to a matching network, nothing to scan");
    return result;
  }

  AddressSpace::Options space_options;
  space_options.exclude_reserved = config_.exclude_reserved;

  std::vector<AddressRange> ranges;
  std::unordered_set<IPv4Address> local_addresses;
  uint64_t total = 0;
  for (const auto& target : result.targets) {
    ranges.push_back(AddressSpace::Iterate(target.subnet.network(), target.subnet.prefix_length(), space_options));
    total += ranges.back().size();
    local_addresses.insert(target.local_address);
    LOG_DISC_INFO("scanning {} via {} ({} candidates)", target.subnet.ToString(), target.interface_name,
                  ranges.back().size());
  }
  if (config_.skip_local_addresses) {
    for (const auto& entry : interfaces) {
      if (auto addr = IPv4Address::TryParse(entry.address)) {
        local_addresses.insert(*addr);
      }
    }
  }
  LOG_DISC_INFO("probing {} candidates on port {} (timeout {}ms, concurrency {})", total, config_.port,
                config_.timeout.count(), config_.concurrency_limit);

  // Candidate stream: ranges in plan order, each in ascending address order
  size_t range_index = 0;
  std::optional<AddressRange::Iterator> cursor;
  auto next_candidate = [&]() -> std::optional<IPv4Address> {
    while (range_index < ranges.size()) {
      if (!cursor) {
        cursor = ranges[range_index].begin();
      }
      if (*cursor == ranges[range_index].end()) {
        cursor.reset();
        ++range_index;
        continue;
      }
      const IPv4Address address = **cursor;
      ++*cursor;
      if (config_.skip_local_addresses && local_addresses.count(address) > 0) {
        continue;
      }
      return address;
    }
    return std::nullopt;
  };

  auto interface_for = [&](IPv4Address address) -> const std::string& {
    for (const auto& target : result.targets) {
      if (target.subnet.Contains(address)) {
        return target.interface_name;
      }
    }
    static const std::string kUnknown;
    return kUnknown;
  };

  auto on_result = [&](const ProbeResult& probe) {
    if (probe.reachable()) {
      DiscoveredPeer peer;
      peer.address = probe.address;
      peer.port = config_.port;
      peer.interface_name = interface_for(probe.address);
      peer.latency = probe.elapsed;
      result.peers[probe.address] = std::move(peer);
      LOG_DISC_INFO("found candidate peer {}:{} ({}ms)", probe.address.ToString(), config_.port,
                    probe.elapsed.count());
      return;
    }
    if (config_.record_unreachable) {
      result.unreachable[probe.address] = probe.status;
    }
  };

  const auto outcome = pool_->Run(next_candidate, on_result, &cancel_requested_);
  result.status = outcome.status;
  result.stats = outcome.stats;

  if (result.status == RunStatus::COMPLETED) {
    LOG_DISC_INFO("discovery complete: {} peer(s) found in {}ms", result.peers.size(), result.stats.elapsed.count());
  } else {
    LOG_DISC_WARN("discovery {} after {}ms: {} of {} candidates probed, {} peer(s) found so far",
                  RunStatusToString(result.status), result.stats.elapsed.count(), result.stats.started, total,
                  result.peers.size());
  }
  return result;
}

}  // namespace network
}  // namespace lanscan
