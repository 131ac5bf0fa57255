// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <asio.hpp>

namespace lanscan {

namespace test {
class ProbeResponderTestAccess;
}

namespace network {

// ProbeResponder - makes this host discoverable by other instances.
// Listens on the well-known port and closes every accepted connection
// straight away. Uses an external io_context; the caller runs it.
class ProbeResponder {
public:
  // Pause before accepting again after a failed accept (EMFILE and the like)
  static constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

  explicit ProbeResponder(asio::io_context& io_context);
  ~ProbeResponder();

  ProbeResponder(const ProbeResponder&) = delete;
  ProbeResponder& operator=(const ProbeResponder&) = delete;

  // Bind and start accepting. port 0 picks an ephemeral port (tests).
  // Returns false if the address cannot be bound.
  bool Listen(uint16_t port, const std::string& bind_address = "0.0.0.0");

  // Call from the io_context thread, or once the io_context has stopped
  void Stop();

  // Bound port, 0 if not listening
  uint16_t listening_port() const;

  uint64_t accepted_count() const { return accepted_.load(); }
  uint64_t accept_error_count() const { return accept_errors_.load(); }

private:
  friend class test::ProbeResponderTestAccess;

  void start_accept();
  void on_accept_error(const asio::error_code& ec);

  asio::io_context& io_context_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  asio::steady_timer retry_timer_;
  bool retry_pending_{false};
  std::atomic<uint64_t> accepted_{0};
  std::atomic<uint64_t> accept_errors_{0};
  std::atomic<bool> listening_{false};
};

}  // namespace network
}  // namespace lanscan
