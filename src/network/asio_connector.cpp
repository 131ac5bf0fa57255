// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "network/asio_connector.hpp"

#include "util/logging.hpp"

namespace lanscan {
namespace network {

// ============================================================================
// AsioProbeAttempt
// ============================================================================

std::shared_ptr<AsioProbeAttempt> AsioProbeAttempt::create(asio::io_context& io_context, IPv4Address address,
                                                           uint16_t port, std::chrono::milliseconds timeout,
                                                           Connector::ProbeCallback callback) {
  auto attempt = std::shared_ptr<AsioProbeAttempt>(
      new AsioProbeAttempt(io_context, address, port, timeout, std::move(callback)));
  // Defer onto the strand so the callback can never run inside start_probe()
  asio::post(attempt->strand_, [attempt]() { attempt->start_impl(); });
  return attempt;
}

AsioProbeAttempt::AsioProbeAttempt(asio::io_context& io_context, IPv4Address address, uint16_t port,
                                   std::chrono::milliseconds timeout, Connector::ProbeCallback callback)
    : socket_(io_context)
    , timer_(io_context)
    , strand_(io_context.get_executor())
    , endpoint_(address.to_asio(), port)
    , timeout_(timeout)
    , callback_(std::move(callback))
{
}

void AsioProbeAttempt::start_impl() {
  if (done_) {
    return;  // cancelled before the attempt got going
  }

  asio::error_code ec;
  socket_.open(asio::ip::tcp::v4(), ec);
  if (ec) {
    // EMFILE and friends: a local problem, not a property of the remote host
    LOG_NET_WARN_RL("cannot open probe socket for {}: {}", endpoint_.address().to_string(), ec.message());
    finish(ProbeStatus::ERROR, ec.message());
    return;
  }

  timer_.expires_after(timeout_);
  timer_.async_wait(asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted || self->done_) {
      return;
    }
    LOG_NET_TRACE("probe to {} timed out after {}ms", self->endpoint_.address().to_string(),
                  self->timeout_.count());
    self->finish(ProbeStatus::TIMEOUT, "timed out");
  }));

  socket_.async_connect(endpoint_, asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec) {
    if (self->done_) {
      return;
    }
    if (ec) {
      LOG_NET_TRACE("probe to {}:{} failed: {}", self->endpoint_.address().to_string(), self->endpoint_.port(),
                    ec.message());
      self->finish(classify(ec), ec.message());
      return;
    }
    self->finish(ProbeStatus::REACHABLE, "");
  }));
}

void AsioProbeAttempt::cancel() {
  asio::post(strand_, [self = shared_from_this()]() { self->finish(ProbeStatus::CANCELLED, "cancelled"); });
}

void AsioProbeAttempt::finish(ProbeStatus status, const std::string& detail) {
  if (done_.exchange(true)) {
    return;
  }

  (void)timer_.cancel();
  asio::error_code ignored;
  if (status == ProbeStatus::REACHABLE) {
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  }
  socket_.close(ignored);

  auto callback = std::move(callback_);
  callback_ = nullptr;
  if (!callback) {
    return;
  }
  try {
    callback(status, detail);
  } catch (const std::exception& e) {
    LOG_NET_ERROR("exception in probe callback for {}: {}", endpoint_.address().to_string(), e.what());
  }
}

ProbeStatus AsioProbeAttempt::classify(const asio::error_code& ec) {
  if (ec == asio::error::connection_refused) {
    return ProbeStatus::REFUSED;
  }
  if (ec == asio::error::host_unreachable || ec == asio::error::network_unreachable) {
    return ProbeStatus::UNREACHABLE;
  }
  if (ec == asio::error::timed_out) {
    return ProbeStatus::TIMEOUT;
  }
  if (ec == asio::error::operation_aborted) {
    return ProbeStatus::CANCELLED;
  }
  return ProbeStatus::ERROR;
}

// ============================================================================
// AsioConnector
// ============================================================================

ProbeAttemptPtr AsioConnector::start_probe(asio::io_context& io_context, IPv4Address address, uint16_t port,
                                           std::chrono::milliseconds timeout, ProbeCallback callback) {
  return AsioProbeAttempt::create(io_context, address, port, timeout, std::move(callback));
}

}  // namespace network
}  // namespace lanscan
