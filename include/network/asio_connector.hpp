// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

#include "network/connector.hpp"

#include <atomic>
#include <chrono>
#include <memory>

#include <asio.hpp>
#include <asio/strand.hpp>

namespace lanscan {
namespace network {

// AsioProbeAttempt - one non-blocking TCP connect raced against a steady_timer.
// Whichever of connect completion, timer expiry and cancel() happens first
// decides the status; the socket is closed in every case.
class AsioProbeAttempt : public ProbeAttempt, public std::enable_shared_from_this<AsioProbeAttempt> {
public:
  static std::shared_ptr<AsioProbeAttempt> create(asio::io_context& io_context, IPv4Address address, uint16_t port,
                                                  std::chrono::milliseconds timeout,
                                                  Connector::ProbeCallback callback);

  ~AsioProbeAttempt() override = default;

  AsioProbeAttempt(const AsioProbeAttempt&) = delete;
  AsioProbeAttempt& operator=(const AsioProbeAttempt&) = delete;

  void cancel() override;

private:
  AsioProbeAttempt(asio::io_context& io_context, IPv4Address address, uint16_t port,
                   std::chrono::milliseconds timeout, Connector::ProbeCallback callback);

  // Strand-serialized internals
  void start_impl();
  void finish(ProbeStatus status, const std::string& detail);

  static ProbeStatus classify(const asio::error_code& ec);

  asio::ip::tcp::socket socket_;
  asio::steady_timer timer_;
  asio::strand<asio::any_io_executor> strand_;
  asio::ip::tcp::endpoint endpoint_;
  std::chrono::milliseconds timeout_;
  Connector::ProbeCallback callback_;

  // Set once on the strand by the first of connect/timeout/cancel
  std::atomic<bool> done_{false};
};

// AsioConnector - Connector backed by real TCP sockets on the caller's io_context
class AsioConnector : public Connector {
public:
  AsioConnector() = default;

  ProbeAttemptPtr start_probe(asio::io_context& io_context, IPv4Address address, uint16_t port,
                              std::chrono::milliseconds timeout, ProbeCallback callback) override;
};

}  // namespace network
}  // namespace lanscan
