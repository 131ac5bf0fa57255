// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

#include "network/discovery_orchestrator.hpp"
#include "network/probe_responder.hpp"

#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <asio/executor_work_guard.hpp>

namespace lanscan {
namespace app {

struct AppConfig {
  network::DiscoveryOrchestrator::Config discovery;

  // Explicit CIDR subnets; when non-empty, host interfaces are not enumerated
  std::vector<std::string> subnets;
  // Restrict to these interface names (empty = all)
  std::vector<std::string> interface_names;

  std::string filter_spec = "private";
  bool filter_explicit = false;
  int min_prefix_length = 0;

  bool json_output = false;
  bool verbose = false;
  // Answer probes from other instances, and stay up after the scan
  bool listen = false;

  std::string log_level = "info";
  bool log_to_file = false;
  std::string log_file = "lanscan.log";
};

class Application {
public:
  explicit Application(const AppConfig& config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  // Run one discovery (and the responder, with --listen). Returns the process exit code.
  int run(std::ostream& out);

  // Async-signal-safe
  void request_shutdown() { shutdown_requested_ = true; }
  bool shutdown_requested() const { return shutdown_requested_; }

  static Application* instance();

  // Interface source and filter for this configuration. Throws on invalid subnets or filter specs.
  std::shared_ptr<network::InterfaceSource> make_interface_source() const;
  network::AddressFilter make_filter() const;

private:
  bool start_responder();
  void stop_responder();
  void start_cancel_watcher();
  void stop_cancel_watcher();
  void print_report(std::ostream& out, const network::DiscoveryResult& result) const;

  void setup_signal_handlers();
  static void signal_handler(int signal);

  AppConfig config_;
  std::unique_ptr<network::DiscoveryOrchestrator> orchestrator_;

  // Responder runs on its own io_context thread so it keeps answering while
  // the orchestrator blocks in Discover()
  asio::io_context responder_io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> responder_work_;
  std::unique_ptr<network::ProbeResponder> responder_;
  std::thread responder_thread_;

  // Polls shutdown_requested_ (set from the signal handler) and turns it into
  // a single DiscoveryOrchestrator::Cancel()
  std::thread cancel_watcher_;
  std::atomic<bool> watcher_stop_{false};

  std::atomic<bool> shutdown_requested_{false};

  static Application* instance_;
};

}  // namespace app
}  // namespace lanscan
