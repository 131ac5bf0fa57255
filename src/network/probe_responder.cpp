// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "network/probe_responder.hpp"

#include "util/logging.hpp"

namespace lanscan {
namespace network {

ProbeResponder::ProbeResponder(asio::io_context& io_context) : io_context_(io_context), retry_timer_(io_context) {}

ProbeResponder::~ProbeResponder() {
  Stop();
}

bool ProbeResponder::Listen(uint16_t port, const std::string& bind_address) {
  asio::error_code ec;
  auto address = asio::ip::make_address(bind_address, ec);
  if (ec) {
    LOG_NET_ERROR("invalid bind address '{}': {}", bind_address, ec.message());
    return false;
  }

  auto acceptor = std::make_unique<asio::ip::tcp::acceptor>(io_context_);
  const asio::ip::tcp::endpoint endpoint(address, port);

  acceptor->open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor->set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor->bind(endpoint, ec);
  }
  if (!ec) {
    acceptor->listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    LOG_NET_ERROR("failed to listen on {}:{}: {}", bind_address, port, ec.message());
    return false;
  }

  acceptor_ = std::move(acceptor);
  listening_ = true;
  LOG_NET_INFO("answering discovery probes on {}:{}", bind_address, listening_port());
  start_accept();
  return true;
}

void ProbeResponder::start_accept() {
  if (!acceptor_ || !listening_) {
    return;
  }
  acceptor_->async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        on_accept_error(ec);
      }
      return;
    }

    ++accepted_;
    asio::error_code ignored;
    auto remote = socket.remote_endpoint(ignored);
    LOG_NET_DEBUG("discovery probe from {}", ignored ? std::string("unknown") : remote.address().to_string());
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket.close(ignored);

    start_accept();
  });
}

void ProbeResponder::on_accept_error(const asio::error_code& ec) {
  ++accept_errors_;
  LOG_NET_WARN_RL("accept failed: {}, retrying in {}ms", ec.message(), ACCEPT_RETRY_DELAY.count());
  if (!listening_ || retry_pending_) {
    return;
  }
  // Errors such as EMFILE persist; accepting again at once would spin
  retry_pending_ = true;
  retry_timer_.expires_after(ACCEPT_RETRY_DELAY);
  retry_timer_.async_wait([this](const asio::error_code& wait_ec) {
    if (wait_ec == asio::error::operation_aborted) {
      return;
    }
    retry_pending_ = false;
    start_accept();
  });
}

void ProbeResponder::Stop() {
  if (!listening_.exchange(false)) {
    return;
  }
  (void)retry_timer_.cancel();
  retry_pending_ = false;
  if (acceptor_) {
    asio::error_code ignored;
    acceptor_->cancel(ignored);
    acceptor_->close(ignored);
  }
}

uint16_t ProbeResponder::listening_port() const {
  if (!acceptor_) {
    return 0;
  }
  asio::error_code ec;
  auto endpoint = acceptor_->local_endpoint(ec);
  if (ec) {
    return 0;
  }
  return endpoint.port();
}

}  // namespace network
}  // namespace lanscan
