// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license
// Real sockets on 127.0.0.1: AsioConnector against ProbeResponder

#include <catch2/catch_test_macros.hpp>

#include "infra/test_access.hpp"
#include "network/asio_connector.hpp"
#include "network/discovery_orchestrator.hpp"
#include "network/probe_responder.hpp"
#include "network/probe_worker_pool.hpp"

#include <asio/executor_work_guard.hpp>
#include <chrono>
#include <future>
#include <optional>
#include <thread>

using namespace lanscan::network;
using lanscan::test::ProbeResponderTestAccess;
using namespace std::chrono_literals;

namespace {

// Helper to manage io_context + thread for tests
class TestIoContext {
public:
    TestIoContext()
        : io_context_(), work_guard_(asio::make_work_guard(io_context_)), thread_([this]() { io_context_.run(); }) {}

    ~TestIoContext() {
        work_guard_.reset();
        io_context_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    asio::io_context& get() { return io_context_; }

private:
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread thread_;
};

// Listen on an ephemeral loopback port from the io thread
uint16_t StartResponder(TestIoContext& io, ProbeResponder& responder) {
    std::promise<uint16_t> bound;
    asio::post(io.get(), [&]() {
        bound.set_value(responder.Listen(0, "127.0.0.1") ? responder.listening_port() : 0);
    });
    return bound.get_future().get();
}

void StopResponder(TestIoContext& io, ProbeResponder& responder) {
    std::promise<void> stopped;
    asio::post(io.get(), [&]() {
        responder.Stop();
        stopped.set_value();
    });
    stopped.get_future().wait();
}

// Runs fn on the io thread and waits for its result
template <typename Fn>
auto OnIo(TestIoContext& io, Fn fn) -> decltype(fn()) {
    std::promise<decltype(fn())> done;
    asio::post(io.get(), [&]() { done.set_value(fn()); });
    return done.get_future().get();
}

// A loopback port with nothing listening on it
uint16_t ClosedPort() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

ProbeResult ProbeOnce(uint16_t port, std::chrono::milliseconds timeout = 2000ms) {
    ProbeWorkerPool::Config config;
    config.port = port;
    config.timeout = timeout;
    config.concurrency_limit = 1;
    ProbeWorkerPool pool(std::make_shared<AsioConnector>(), config);

    bool given = false;
    std::optional<ProbeResult> result;
    pool.Run(
        [&]() -> std::optional<IPv4Address> {
            if (given) {
                return std::nullopt;
            }
            given = true;
            return IPv4Address::Parse("127.0.0.1");
        },
        [&](const ProbeResult& r) { result = r; });
    REQUIRE(result.has_value());
    return *result;
}

}  // namespace

TEST_CASE("AsioConnector: listening port is reachable", "[network][loopback]") {
    TestIoContext io;
    ProbeResponder responder(io.get());
    const uint16_t port = StartResponder(io, responder);
    REQUIRE(port != 0);

    const auto result = ProbeOnce(port);
    CHECK(result.status == ProbeStatus::REACHABLE);
    CHECK(result.reachable());
    CHECK(result.address == IPv4Address::Parse("127.0.0.1"));

    // The responder sees the connection shortly after
    for (int i = 0; i < 100 && responder.accepted_count() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    CHECK(responder.accepted_count() == 1);

    StopResponder(io, responder);
}

TEST_CASE("AsioConnector: closed port is refused", "[network][loopback]") {
    const uint16_t port = ClosedPort();
    const auto result = ProbeOnce(port);
    CHECK(result.status == ProbeStatus::REFUSED);
    CHECK_FALSE(result.reachable());
}

TEST_CASE("ProbeResponder: lifecycle", "[network][loopback]") {
    TestIoContext io;
    ProbeResponder responder(io.get());
    CHECK(responder.listening_port() == 0);

    const uint16_t port = StartResponder(io, responder);
    REQUIRE(port != 0);

    SECTION("Second listener on the same port fails") {
        TestIoContext other_io;
        ProbeResponder other(other_io.get());
        std::promise<bool> listened;
        asio::post(other_io.get(), [&]() { listened.set_value(other.Listen(port, "127.0.0.1")); });
        CHECK_FALSE(listened.get_future().get());
    }

    SECTION("Invalid bind address") {
        std::promise<bool> listened;
        asio::post(io.get(), [&]() {
            ProbeResponder bad(io.get());
            listened.set_value(bad.Listen(0, "not-an-address"));
        });
        CHECK_FALSE(listened.get_future().get());
    }

    SECTION("Stop is idempotent") {
        StopResponder(io, responder);
        StopResponder(io, responder);
        CHECK(responder.listening_port() == 0);
    }

    StopResponder(io, responder);
}

TEST_CASE("ProbeResponder: accept errors pause before accepting again", "[network][loopback]") {
    TestIoContext io;
    ProbeResponder responder(io.get());
    const uint16_t port = StartResponder(io, responder);
    REQUIRE(port != 0);

    const auto failed_at = std::chrono::steady_clock::now();
    const bool pending = OnIo(io, [&]() {
        ProbeResponderTestAccess::FailAccept(responder, asio::error::no_descriptors);
        // A second failure during the pause does not arm another retry
        ProbeResponderTestAccess::FailAccept(responder, asio::error::no_descriptors);
        return ProbeResponderTestAccess::RetryPending(responder);
    });
    CHECK(pending);
    CHECK(responder.accept_error_count() == 2);

    SECTION("Accepting resumes after the pause") {
        bool still_pending = true;
        while (still_pending && std::chrono::steady_clock::now() - failed_at < 2s) {
            std::this_thread::sleep_for(10ms);
            still_pending = OnIo(io, [&]() { return ProbeResponderTestAccess::RetryPending(responder); });
        }
        CHECK_FALSE(still_pending);
        CHECK(std::chrono::steady_clock::now() - failed_at >= ProbeResponder::ACCEPT_RETRY_DELAY);
        CHECK(ProbeOnce(port).status == ProbeStatus::REACHABLE);
    }

    SECTION("Stop during the pause cancels the retry") {
        StopResponder(io, responder);
        CHECK_FALSE(OnIo(io, [&]() { return ProbeResponderTestAccess::RetryPending(responder); }));
        CHECK(responder.listening_port() == 0);
    }

    StopResponder(io, responder);
}

TEST_CASE("Discovery over loopback finds the responder", "[network][loopback][discovery]") {
    TestIoContext io;
    ProbeResponder responder(io.get());
    const uint16_t port = StartResponder(io, responder);
    REQUIRE(port != 0);

    DiscoveryOrchestrator::Config config;
    config.port = port;
    config.timeout = 2000ms;
    config.concurrency_limit = 4;
    config.filter = filters::Any();

    auto interfaces = std::make_shared<StaticInterfaceSource>();
    interfaces->Add(InterfaceAddress::IPv4("lo", "127.0.0.1", 32));
    DiscoveryOrchestrator orchestrator(interfaces, std::make_shared<AsioConnector>(), config);

    auto result = orchestrator.Discover();

    REQUIRE(result.completed());
    REQUIRE(result.peers.size() == 1);
    CHECK(result.peers.begin()->first == IPv4Address::Parse("127.0.0.1"));
    CHECK(result.peers.begin()->second.port == port);
    CHECK(result.peers.begin()->second.interface_name == "lo");

    StopResponder(io, responder);
}
