// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "application.hpp"

#include "network/asio_connector.hpp"
#include "network/discovery_errors.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <unistd.h>  // For write(), STDERR_FILENO (async-signal-safe)

#include <nlohmann/json.hpp>

namespace lanscan {
namespace app {

// Static instance for signal handling
Application* Application::instance_ = nullptr;

// Exit codes
static constexpr int EXIT_OK = 0;
static constexpr int EXIT_RUNTIME_ERROR = 1;
static constexpr int EXIT_CONFIG_ERROR = 2;
static constexpr int EXIT_INTERRUPTED = 130;

Application::Application(const AppConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop_cancel_watcher();
  stop_responder();
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

std::shared_ptr<network::InterfaceSource> Application::make_interface_source() const {
  if (config_.subnets.empty()) {
    return std::make_shared<network::SystemInterfaceSource>();
  }

  auto source = std::make_shared<network::StaticInterfaceSource>();
  for (const auto& text : config_.subnets) {
    // Validate up front so a typo is reported before anything is probed
    const auto subnet = network::Subnet::Parse(text);
    const size_t slash = text.find('/');
    const std::string address = slash == std::string::npos ? text : text.substr(0, slash);
    source->Add(network::InterfaceAddress::IPv4("cli", address, subnet.prefix_length()));
  }
  return source;
}

network::AddressFilter Application::make_filter() const {
  std::vector<network::AddressFilter> parts;

  // Subnets typed on the command line are scanned as given unless a filter was asked for
  if (config_.subnets.empty() || config_.filter_explicit) {
    parts.push_back(network::filters::FromSpec(config_.filter_spec));
  }
  if (config_.subnets.empty()) {
    parts.push_back(network::filters::UpAndNotLoopback());
  }
  if (config_.min_prefix_length > 0) {
    parts.push_back(network::filters::MinPrefixLength(config_.min_prefix_length));
  }
  if (!config_.interface_names.empty()) {
    parts.push_back(network::filters::InterfaceNamed(config_.interface_names));
  }
  return network::filters::AllOf(std::move(parts));
}

int Application::run(std::ostream& out) {
  LOG_APP_INFO("{} starting", GetFullVersionString());
  setup_signal_handlers();

  try {
    auto discovery = config_.discovery;
    discovery.filter = make_filter();
    orchestrator_ = std::make_unique<network::DiscoveryOrchestrator>(
        make_interface_source(), std::make_shared<network::AsioConnector>(), discovery);
  } catch (const std::invalid_argument& e) {
    LOG_APP_ERROR("invalid configuration: {}", e.what());
    return EXIT_CONFIG_ERROR;
  }

  if (config_.listen && !start_responder()) {
    return EXIT_RUNTIME_ERROR;
  }

  start_cancel_watcher();

  network::DiscoveryResult result;
  try {
    result = orchestrator_->Discover();
  } catch (const network::InterfaceEnumerationError& e) {
    LOG_APP_ERROR("discovery aborted: {}", e.what());
    return EXIT_RUNTIME_ERROR;
  } catch (const std::invalid_argument& e) {
    LOG_APP_ERROR("discovery aborted: {}", e.what());
    return EXIT_CONFIG_ERROR;
  }

  stop_cancel_watcher();
  print_report(out, result);

  if (config_.listen && !shutdown_requested_) {
    LOG_APP_INFO("Still answering probes on port {}. Press Ctrl+C to stop", config_.discovery.port);
    while (!shutdown_requested_) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
  stop_responder();

  if (result.status == network::RunStatus::CANCELLED) {
    return EXIT_INTERRUPTED;
  }
  return EXIT_OK;
}

bool Application::start_responder() {
  responder_ = std::make_unique<network::ProbeResponder>(responder_io_);
  if (!responder_->Listen(config_.discovery.port)) {
    LOG_APP_ERROR("cannot answer probes on port {}", config_.discovery.port);
    responder_.reset();
    return false;
  }
  responder_work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(responder_io_));
  responder_thread_ = std::thread([this]() { responder_io_.run(); });
  return true;
}

void Application::stop_responder() {
  if (!responder_) {
    return;
  }
  // Acceptor operations must happen on the io_context thread
  asio::post(responder_io_, [this]() { responder_->Stop(); });
  responder_work_.reset();
  if (responder_thread_.joinable()) {
    responder_thread_.join();
  }
  LOG_APP_INFO("answered {} discovery probe(s)", responder_->accepted_count());
  responder_.reset();
}

void Application::start_cancel_watcher() {
  watcher_stop_ = false;
  cancel_watcher_ = std::thread([this]() {
    while (!watcher_stop_) {
      if (shutdown_requested_) {
        LOG_APP_INFO("shutdown requested, cancelling discovery");
        orchestrator_->Cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });
}

void Application::stop_cancel_watcher() {
  watcher_stop_ = true;
  if (cancel_watcher_.joinable()) {
    cancel_watcher_.join();
  }
}

void Application::print_report(std::ostream& out, const network::DiscoveryResult& result) const {
  if (config_.json_output) {
    out << result.ToJson().dump(2) << std::endl;
    return;
  }

  if (result.targets.empty()) {
    out << "No matching network interfaces; nothing scanned.\n";
    return;
  }

  for (const auto& target : result.targets) {
    out << "Scanned " << target.subnet.ToString() << " via " << target.interface_name << "\n";
  }
  if (result.status != network::RunStatus::COMPLETED) {
    out << "Scan " << network::RunStatusToString(result.status) << " after " << result.stats.started
        << " probes; results are partial.\n";
  }

  out << "Found " << result.peers.size() << " peer(s) on port " << result.port << ":\n";
  for (const auto& [address, peer] : result.peers) {
    out << "  " << std::left << std::setw(16) << address.ToString() << std::setw(12) << peer.interface_name
        << peer.latency.count() << "ms\n";
  }

  if (config_.verbose && !result.unreachable.empty()) {
    out << "Unreachable:\n";
    for (const auto& [address, status] : result.unreachable) {
      out << "  " << std::left << std::setw(16) << address.ToString() << network::ProbeStatusToString(status)
          << "\n";
    }
  }
  out << std::flush;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // Ignore SIGPIPE; a probed host may reset the connection
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    static const char msg[] = "\nReceived signal, stopping\n";
    (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
    instance_->request_shutdown();
  }
}

}  // namespace app
}  // namespace lanscan
