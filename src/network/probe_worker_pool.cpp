// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "network/probe_worker_pool.hpp"

#include "network/discovery_errors.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace lanscan {
namespace network {

const char* RunStatusToString(RunStatus status) {
  switch (status) {
  case RunStatus::COMPLETED:
    return "completed";
  case RunStatus::CANCELLED:
    return "cancelled";
  case RunStatus::DEADLINE_EXCEEDED:
    return "deadline_exceeded";
  }
  return "unknown";
}

void ProbeWorkerPool::Config::Validate() const {
  if (port == 0) {
    throw ConfigError("probe port must be in [1, 65535]");
  }
  if (timeout.count() <= 0) {
    throw ConfigError("probe timeout must be positive");
  }
  if (concurrency_limit < 1) {
    throw ConfigError("concurrency limit must be at least 1");
  }
  if (concurrency_limit > MAX_CONCURRENCY_LIMIT) {
    throw ConfigError("concurrency limit " + std::to_string(concurrency_limit) + " exceeds maximum of " +
                      std::to_string(MAX_CONCURRENCY_LIMIT));
  }
  if (io_threads < 1 || io_threads > MAX_IO_THREADS) {
    throw ConfigError("io thread count must be in [1, " + std::to_string(MAX_IO_THREADS) + "]");
  }
  if (run_deadline.count() < 0) {
    throw ConfigError("run deadline must not be negative");
  }
}

ProbeWorkerPool::ProbeWorkerPool(std::shared_ptr<Connector> connector, const Config& config)
    : connector_(std::move(connector)), config_(config) {
  if (!connector_) {
    throw ConfigError("ProbeWorkerPool requires a connector");
  }
  config_.Validate();
  LOG_NET_TRACE("ProbeWorkerPool created (port {}, timeout {}ms, concurrency {}, io threads {})", config_.port,
                config_.timeout.count(), config_.concurrency_limit, config_.io_threads);
}

ProbeWorkerPool::~ProbeWorkerPool() = default;

bool ProbeWorkerPool::is_running() const {
  std::lock_guard<std::mutex> lock(run_mutex_);
  return current_run_ != nullptr;
}

ProbeWorkerPool::Outcome ProbeWorkerPool::Run(CandidateSource source, ResultCallback on_result,
                                              const std::atomic<bool>* stop_requested) {
  auto state = std::make_shared<RunState>(io_context_);
  state->source = std::move(source);
  state->on_result = std::move(on_result);
  state->stop_requested = stop_requested;

  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (current_run_) {
      throw std::logic_error("ProbeWorkerPool::Run: a run is already active");
    }
    current_run_ = state;
  }

  io_context_.restart();
  state->started_at = std::chrono::steady_clock::now();

  asio::post(state->strand, [this, state]() {
    // Cancel() may have won the race to the strand
    if (state->finished) {
      return;
    }
    // A stop requested before this run was registered, where Cancel() had nothing to act on
    if (state->stop_requested && state->stop_requested->load()) {
      LOG_NET_DEBUG("probe run stopped before the first probe");
      stop_run(state, RunStatus::CANCELLED);
      return;
    }
    if (config_.run_deadline.count() > 0) {
      state->deadline_timer.expires_after(config_.run_deadline);
      state->deadline_timer.async_wait(asio::bind_executor(state->strand, [this, state](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
          return;
        }
        LOG_NET_DEBUG("probe run deadline of {}ms reached", config_.run_deadline.count());
        stop_run(state, RunStatus::DEADLINE_EXCEEDED);
      }));
    }
    fill_slots(state);
  });

  std::vector<std::thread> helpers;
  helpers.reserve(config_.io_threads - 1);
  for (size_t i = 1; i < config_.io_threads; ++i) {
    helpers.emplace_back([this]() { io_context_.run(); });
  }
  io_context_.run();
  for (auto& thread : helpers) {
    if (thread.joinable()) {
      thread.join();
    }
  }

  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    current_run_.reset();
  }

  if (state->error) {
    std::rethrow_exception(state->error);
  }

  const auto& s = state->stats;
  LOG_NET_DEBUG("probe run {}: {} started, {} reachable, {} timeout, {} refused, {} cancelled, peak {} in flight, "
                "{}ms",
                RunStatusToString(state->status), s.started, s.reachable, s.timed_out, s.refused, s.cancelled,
                s.peak_in_flight, s.elapsed.count());

  return Outcome{state->status, state->stats};
}

void ProbeWorkerPool::Cancel() {
  RunStatePtr state;
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    state = current_run_;
  }
  if (!state) {
    return;
  }
  asio::post(state->strand, [this, state]() { stop_run(state, RunStatus::CANCELLED); });
}

void ProbeWorkerPool::fill_slots(const RunStatePtr& state) {
  if (!state->stopping && state->stop_requested && state->stop_requested->load()) {
    stop_run(state, RunStatus::CANCELLED);
    return;
  }
  while (!state->stopping && !state->exhausted && state->in_flight.size() < config_.concurrency_limit) {
    std::optional<IPv4Address> next;
    try {
      next = state->source();
    } catch (...) {
      state->error = std::current_exception();
      stop_run(state, RunStatus::CANCELLED);
      return;
    }
    if (!next) {
      state->exhausted = true;
      break;
    }
    launch(state, *next);
  }
  maybe_finish(state);
}

void ProbeWorkerPool::launch(const RunStatePtr& state, IPv4Address address) {
  const uint64_t id = state->next_attempt_id++;
  const auto started = std::chrono::steady_clock::now();
  ++state->stats.started;

  auto on_done = [this, state, id, address, started](ProbeStatus status, const std::string& detail) {
    ProbeResult result;
    result.address = address;
    result.status = status;
    result.elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    result.detail = detail;
    asio::post(state->strand, [this, state, id, result = std::move(result)]() mutable {
      on_probe_complete(state, id, std::move(result));
    });
  };

  ProbeAttemptPtr attempt;
  try {
    attempt = connector_->start_probe(io_context_, address, config_.port, config_.timeout, std::move(on_done));
  } catch (const std::exception& e) {
    // A failure to start one probe is local to that candidate
    LOG_NET_WARN_RL("failed to start probe to {}: {}", address.ToString(), e.what());
    ++state->stats.completed;
    ++state->stats.errors;
    return;
  }

  state->in_flight.emplace(id, std::move(attempt));
  state->stats.peak_in_flight = std::max(state->stats.peak_in_flight, state->in_flight.size());
}

void ProbeWorkerPool::on_probe_complete(const RunStatePtr& state, uint64_t attempt_id, ProbeResult result) {
  auto it = state->in_flight.find(attempt_id);
  if (it == state->in_flight.end()) {
    return;
  }
  state->in_flight.erase(it);
  ++state->stats.completed;

  if (state->stopping) {
    // Only results that completed before cancellation are reported
    ++state->stats.cancelled;
    maybe_finish(state);
    return;
  }

  tally(state->stats, result.status);

  if (state->on_result) {
    try {
      state->on_result(result);
    } catch (...) {
      state->error = std::current_exception();
      stop_run(state, RunStatus::CANCELLED);
      return;
    }
  }

  fill_slots(state);
}

void ProbeWorkerPool::stop_run(const RunStatePtr& state, RunStatus status) {
  if (state->finished || state->stopping) {
    return;
  }
  state->stopping = true;
  state->status = status;

  LOG_NET_DEBUG("stopping probe run ({}), abandoning {} in-flight probes", RunStatusToString(status),
                state->in_flight.size());
  for (auto& [id, attempt] : state->in_flight) {
    if (attempt) {
      attempt->cancel();
    }
  }
  maybe_finish(state);
}

void ProbeWorkerPool::maybe_finish(const RunStatePtr& state) {
  if (state->finished || !state->in_flight.empty()) {
    return;
  }
  if (!state->exhausted && !state->stopping) {
    return;
  }
  state->finished = true;
  (void)state->deadline_timer.cancel();
  state->stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                               state->started_at);
}

void ProbeWorkerPool::tally(Stats& stats, ProbeStatus status) {
  switch (status) {
  case ProbeStatus::REACHABLE:
    ++stats.reachable;
    break;
  case ProbeStatus::TIMEOUT:
    ++stats.timed_out;
    break;
  case ProbeStatus::REFUSED:
    ++stats.refused;
    break;
  case ProbeStatus::UNREACHABLE:
    ++stats.unreachable;
    break;
  case ProbeStatus::CANCELLED:
    ++stats.cancelled;
    break;
  case ProbeStatus::ERROR:
    ++stats.errors;
    break;
  }
}

}  // namespace network
}  // namespace lanscan
