// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace lanscan {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "network", "discovery", "app"),
 * all sharing the same sinks. Components not in that list resolve to the
 * default logger.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use from probe handlers.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call performs initialization.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "lanscan.log");

  // Flush and drop all loggers. Later logging calls auto-reinitialize.
  static void Shutdown();

  // Get logger for a component. Auto-initializes if not initialized.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a single component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace lanscan

#define LOG_TRACE(...) lanscan::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) lanscan::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) lanscan::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) lanscan::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) lanscan::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) lanscan::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) lanscan::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) lanscan::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) lanscan::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) lanscan::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_DISC_TRACE(...) lanscan::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...) lanscan::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...) lanscan::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...) lanscan::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...) lanscan::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

#define LOG_APP_INFO(...) lanscan::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...) lanscan::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) lanscan::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// A /16 scan can produce tens of thousands of failed probes in a few seconds.
// Messages that fire once per candidate go through these macros so that each
// callsite logs at most 100 lines per minute.

#include "util/rate_limiter.hpp"

#define LANSCAN_CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_NET_WARN_RL(...)                                                                                           \
  do {                                                                                                                 \
    if (lanscan::util::RateLimiter::instance().should_log(LANSCAN_CALLSITE_KEY_, 100, 60)) {                           \
      lanscan::util::LogManager::GetLogger("network")->warn(__VA_ARGS__);                                              \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_ERROR_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (lanscan::util::RateLimiter::instance().should_log(LANSCAN_CALLSITE_KEY_, 100, 60)) {                           \
      lanscan::util::LogManager::GetLogger("network")->error(__VA_ARGS__);                                             \
    }                                                                                                                  \
  } while (0)

#define LOG_DISC_WARN_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (lanscan::util::RateLimiter::instance().should_log(LANSCAN_CALLSITE_KEY_, 100, 60)) {                           \
      lanscan::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__);                                            \
    }                                                                                                                  \
  } while (0)
