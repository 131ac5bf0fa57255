// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

/*
 Connector — abstract single-shot reachability probe

 A Connector starts one bounded-timeout TCP connection attempt per call and
 reports its outcome exactly once. AsioConnector is the socket
 implementation; tests substitute a fake with scripted latency.

 Contract for implementations
 - start_probe() never invokes the callback inline; the callback runs later
   on a thread running the io_context passed in
 - the callback is invoked exactly once, including after cancel()
 - a successful connection is closed immediately; no data is exchanged
*/

#include "network/ipv4.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <asio/io_context.hpp>

namespace lanscan {
namespace network {

enum class ProbeStatus {
  REACHABLE,    // connection established (and closed)
  TIMEOUT,      // no answer within the probe timeout
  REFUSED,      // host answered with RST: nothing listening on the port
  UNREACHABLE,  // host or network unreachable
  CANCELLED,    // abandoned because the run was cancelled
  ERROR,        // local failure (socket could not be opened, ...)
};

const char* ProbeStatusToString(ProbeStatus status);

struct ProbeResult {
  IPv4Address address;
  ProbeStatus status{ProbeStatus::ERROR};
  std::chrono::milliseconds elapsed{0};
  std::string detail;

  bool reachable() const { return status == ProbeStatus::REACHABLE; }
};

// Handle on an in-flight attempt
class ProbeAttempt {
public:
  virtual ~ProbeAttempt() = default;

  // Abandon the attempt and close its socket. Thread-safe, idempotent.
  // The callback still fires once, with CANCELLED unless the attempt had
  // already finished.
  virtual void cancel() = 0;
};

using ProbeAttemptPtr = std::shared_ptr<ProbeAttempt>;

class Connector {
public:
  using ProbeCallback = std::function<void(ProbeStatus status, const std::string& detail)>;

  virtual ~Connector() = default;

  virtual ProbeAttemptPtr start_probe(asio::io_context& io_context, IPv4Address address, uint16_t port,
                                      std::chrono::milliseconds timeout, ProbeCallback callback) = 0;
};

}  // namespace network
}  // namespace lanscan
