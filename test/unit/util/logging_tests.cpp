// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license
// Unit tests for LogManager

#include <catch2/catch_test_macros.hpp>

#include "util/logging.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace lanscan::util;

// LogManager::Initialize() uses std::call_once, so only the first call in the
// process takes effect. The tests work within that.

TEST_CASE("LogManager: GetLogger returns component loggers", "[logging]") {
    LogManager::Initialize("debug", false, "");

    SECTION("Default logger") {
        auto logger = LogManager::GetLogger();
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "default");
    }

    SECTION("Named component loggers") {
        for (const char* name : {"network", "discovery", "app"}) {
            auto logger = LogManager::GetLogger(name);
            REQUIRE(logger != nullptr);
            REQUIRE(logger->name() == name);
        }
    }

    SECTION("Unknown component returns default logger") {
        auto unknown = LogManager::GetLogger("chain");
        REQUIRE(unknown != nullptr);
        REQUIRE(unknown->name() == "default");
    }

    SECTION("Same logger returned for same component") {
        REQUIRE(LogManager::GetLogger("discovery").get() == LogManager::GetLogger("discovery").get());
    }
}

TEST_CASE("LogManager: level changes", "[logging]") {
    LogManager::Initialize("info", false, "");

    SECTION("SetLogLevel applies to every component") {
        LogManager::SetLogLevel("trace");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::trace);
        REQUIRE(LogManager::GetLogger("network")->level() == spdlog::level::trace);
        REQUIRE(LogManager::GetLogger("discovery")->level() == spdlog::level::trace);
    }

    SECTION("SetComponentLevel touches one component") {
        LogManager::SetLogLevel("info");
        LogManager::SetComponentLevel("discovery", "debug");
        REQUIRE(LogManager::GetLogger("discovery")->level() == spdlog::level::debug);
        REQUIRE(LogManager::GetLogger("network")->level() == spdlog::level::info);
    }

    SECTION("Unknown component is ignored") {
        LogManager::SetLogLevel("warn");
        LogManager::SetComponentLevel("nonexistent", "trace");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::warn);
    }

    SECTION("Level names") {
        LogManager::SetLogLevel("error");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::err);
        LogManager::SetLogLevel("off");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::off);
    }

    SECTION("Invalid level turns logging off") {
        LogManager::SetLogLevel("loud");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::off);
    }

    LogManager::SetLogLevel("off");
}

TEST_CASE("LogManager: logging macros", "[logging]") {
    LogManager::Initialize("trace", false, "");
    LogManager::SetLogLevel("off");

    LOG_TRACE("trace {}", 1);
    LOG_DEBUG("debug {}", "two");
    LOG_INFO("info {} {}", 3, 4.0);
    LOG_WARN("warn");
    LOG_ERROR("error {:x}", 255);

    LOG_NET_TRACE("net trace");
    LOG_NET_DEBUG("net debug");
    LOG_NET_INFO("net info");
    LOG_NET_WARN("net warn");
    LOG_NET_ERROR("net error");

    LOG_DISC_TRACE("discovery trace");
    LOG_DISC_DEBUG("discovery debug");
    LOG_DISC_INFO("discovery info {}", "192.168.1.24");
    LOG_DISC_WARN("discovery warn");
    LOG_DISC_ERROR("discovery error");

    LOG_APP_INFO("app info");
    LOG_APP_WARN("app warn");
    LOG_APP_ERROR("app error");

    for (int i = 0; i < 200; ++i) {
        LOG_NET_WARN_RL("probe failed {}", i);
        LOG_NET_ERROR_RL("socket failed {}", i);
        LOG_DISC_WARN_RL("discovery warning {}", i);
    }
    SUCCEED("macros expand and run with logging off");
}

TEST_CASE("LogManager: rate-limited macros are bounded per callsite", "[logging][rate_limiter]") {
    LogManager::Initialize("info", false, "");
    LogManager::SetLogLevel("off");
    RateLimiter::instance().Reset();

    for (int i = 0; i < 150; ++i) {
        LOG_NET_WARN_RL("bounded {}", i);
    }
    // 100 tokens per callsite, the rest dropped (refill over a few ms is negligible)
    REQUIRE(RateLimiter::instance().suppressed() >= 49);
    REQUIRE(RateLimiter::instance().suppressed() <= 50);
    RateLimiter::instance().Reset();
}

TEST_CASE("LogManager: Shutdown then log", "[logging]") {
    LogManager::Initialize("info", false, "");
    LogManager::Shutdown();

    // Loggers come back after Shutdown()
    auto logger = LogManager::GetLogger("network");
    REQUIRE(logger != nullptr);
    REQUIRE(logger->name() == "network");
    LogManager::SetLogLevel("off");
}

TEST_CASE("LogManager: thread safety", "[logging][threading]") {
    LogManager::Initialize("info", false, "");
    LogManager::SetLogLevel("off");

    const int num_threads = 8;
    const int ops_per_thread = 100;
    std::atomic<int> success_count{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&success_count, ops_per_thread, t]() {
            for (int i = 0; i < ops_per_thread; ++i) {
                auto logger = LogManager::GetLogger("discovery");
                if (logger != nullptr) {
                    logger->trace("thread {} iteration {}", t, i);
                    success_count++;
                }
                if (i % 20 == 0) {
                    LogManager::SetComponentLevel("discovery", "off");
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(success_count == num_threads * ops_per_thread);
}
