// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

/*
 ProbeWorkerPool — bounded-concurrency reachability prober

 Purpose
 - Probe a stream of candidate addresses on one port with at most
   concurrency_limit connection attempts outstanding at any instant

 Design
 - The pool owns an io_context. Run() drives it on the calling thread plus
   (io_threads - 1) helper threads and returns when the run has finished.
 - All run bookkeeping (candidate cursor, in-flight table, statistics) lives
   on a single strand. A slot is refilled from the candidate source in the
   completion handler of the probe that freed it, so the number of open
   sockets never exceeds concurrency_limit, whatever the subnet size.
 - Results are delivered to the ResultCallback on that strand, one at a
   time, in completion order (not submission order).
 - Cancel(), the caller's stop flag or the run deadline stops launching,
   cancels every outstanding attempt (closing its socket) and drops results
   that arrive afterwards. Run() then returns with the partial statistics.
 - Exceptions thrown by the candidate source or the result callback stop the
   run and are rethrown from Run() on the calling thread.
*/

#include "network/connector.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include <asio.hpp>
#include <asio/strand.hpp>

namespace lanscan {
namespace network {

// Terminal state of a probe run
enum class RunStatus {
  COMPLETED,          // every candidate was probed
  CANCELLED,          // Cancel() was called
  DEADLINE_EXCEEDED,  // run_deadline elapsed
};

const char* RunStatusToString(RunStatus status);

// Default well-known port of the cooperating application
inline constexpr uint16_t DEFAULT_PROBE_PORT = 44444;

class ProbeWorkerPool {
public:
  // Upper bound on concurrency_limit; keeps a run well below common
  // per-process descriptor limits
  static constexpr size_t MAX_CONCURRENCY_LIMIT = 4096;
  static constexpr size_t MAX_IO_THREADS = 64;

  struct Config {
    uint16_t port = DEFAULT_PROBE_PORT;
    std::chrono::milliseconds timeout{500};
    size_t concurrency_limit = 64;
    size_t io_threads = 1;
    // Whole-run time limit; zero means none
    std::chrono::milliseconds run_deadline{0};

    // Throws ConfigError
    void Validate() const;
  };

  struct Stats {
    uint64_t started{0};
    uint64_t completed{0};
    uint64_t reachable{0};
    uint64_t timed_out{0};
    uint64_t refused{0};
    uint64_t unreachable{0};
    uint64_t errors{0};
    uint64_t cancelled{0};
    size_t peak_in_flight{0};
    std::chrono::milliseconds elapsed{0};
  };

  struct Outcome {
    RunStatus status{RunStatus::COMPLETED};
    Stats stats;
  };

  // Next candidate, or nullopt when exhausted. Called on the run strand only.
  using CandidateSource = std::function<std::optional<IPv4Address>()>;
  using ResultCallback = std::function<void(const ProbeResult&)>;

  // Throws ConfigError if config is invalid or connector is null
  ProbeWorkerPool(std::shared_ptr<Connector> connector, const Config& config);
  ~ProbeWorkerPool();

  ProbeWorkerPool(const ProbeWorkerPool&) = delete;
  ProbeWorkerPool& operator=(const ProbeWorkerPool&) = delete;

  // Blocking. Only one run at a time per pool.
  // If stop_requested is given and set (before or during the run), the run
  // stops as if Cancel() had been called. Callers that set it must also call
  // Cancel() to interrupt probes already in flight.
  Outcome Run(CandidateSource source, ResultCallback on_result, const std::atomic<bool>* stop_requested = nullptr);

  // Thread-safe. No-op when no run is active.
  void Cancel();

  bool is_running() const;
  const Config& config() const { return config_; }

private:
  struct RunState {
    explicit RunState(asio::io_context& io_context)
        : strand(io_context.get_executor()), deadline_timer(io_context) {}

    asio::strand<asio::any_io_executor> strand;
    asio::steady_timer deadline_timer;

    CandidateSource source;
    ResultCallback on_result;
    const std::atomic<bool>* stop_requested{nullptr};

    std::unordered_map<uint64_t, ProbeAttemptPtr> in_flight;
    uint64_t next_attempt_id{0};

    bool exhausted{false};
    bool stopping{false};
    bool finished{false};
    RunStatus status{RunStatus::COMPLETED};
    Stats stats;
    std::exception_ptr error;
    std::chrono::steady_clock::time_point started_at;
  };
  using RunStatePtr = std::shared_ptr<RunState>;

  // Strand-serialized internals (must be called on state->strand)
  void fill_slots(const RunStatePtr& state);
  void launch(const RunStatePtr& state, IPv4Address address);
  void on_probe_complete(const RunStatePtr& state, uint64_t attempt_id, ProbeResult result);
  void stop_run(const RunStatePtr& state, RunStatus status);
  void maybe_finish(const RunStatePtr& state);

  static void tally(Stats& stats, ProbeStatus status);

  std::shared_ptr<Connector> connector_;
  Config config_;
  asio::io_context io_context_;

  mutable std::mutex run_mutex_;
  RunStatePtr current_run_;
};

}  // namespace network
}  // namespace lanscan
