// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "infra/fake_http_client.hpp"
#include "infra/test_support.hpp"
#include "network/peer_health_monitor.hpp"

#include <thread>

using namespace signage::network;
using signage::test::FakeHttpClient;
using signage::test::WaitFor;

namespace {

PeerRegistry::Config FastProbeConfig() {
    PeerRegistry::Config config;
    config.display_name = "Self";
    config.liveness_timeout = std::chrono::milliseconds(200);
    return config;
}

}  // namespace

TEST_CASE("PeerHealthMonitor: CheckAll probes every peer in parallel", "[network][health]") {
    asio::io_context io;
    auto http = std::make_shared<FakeHttpClient>();
    PeerRegistry registry(FastProbeConfig(), http);
    PeerHealthMonitor monitor(io, registry);

    registry.AddManual("10.0.0.1", "A");
    registry.AddManual("10.0.0.2", "B");
    registry.AddManual("10.0.0.3", "C");
    http->SetBehavior("10.0.0.1", 3000, FakeHttpClient::Online("A"));
    http->SetBehavior("10.0.0.2", 3000, FakeHttpClient::Hang());
    http->SetBehavior("10.0.0.3", 3000, FakeHttpClient::Hang());

    auto start = std::chrono::steady_clock::now();
    REQUIRE(monitor.CheckAll() == 1);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(380));

    REQUIRE(registry.Get("10.0.0.1:3000")->online);
    REQUIRE_FALSE(registry.Get("10.0.0.2:3000")->online);
}

TEST_CASE("PeerHealthMonitor: empty registry", "[network][health]") {
    asio::io_context io;
    PeerRegistry registry(FastProbeConfig(), std::make_shared<FakeHttpClient>());
    PeerHealthMonitor monitor(io, registry);
    REQUIRE(monitor.CheckAll() == 0);
}

TEST_CASE("PeerHealthMonitor: periodic rounds flip online state", "[network][health]") {
    asio::io_context io;
    auto work = asio::make_work_guard(io);
    std::thread io_thread([&io]() { io.run(); });

    auto http = std::make_shared<FakeHttpClient>();
    PeerRegistry registry(FastProbeConfig(), http);
    registry.AddManual("10.0.0.1", "A");
    http->SetBehavior("10.0.0.1", 3000, FakeHttpClient::Online("A"));

    PeerHealthMonitor::Config config;
    config.interval = std::chrono::milliseconds(30);
    PeerHealthMonitor monitor(io, registry, config);
    monitor.Start();
    REQUIRE(monitor.is_running());

    REQUIRE(WaitFor([&]() { return registry.Get("10.0.0.1:3000")->online; }));

    http->SetBehavior("10.0.0.1", 3000, FakeHttpClient::Refused());
    REQUIRE(WaitFor([&]() { return !registry.Get("10.0.0.1:3000")->online; }));
    REQUIRE(monitor.rounds_completed() >= 2);

    monitor.Stop();
    REQUIRE_FALSE(monitor.is_running());
    auto rounds = monitor.rounds_completed();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(monitor.rounds_completed() == rounds);

    work.reset();
    io.stop();
    io_thread.join();
}

TEST_CASE("PeerHealthMonitor: slow rounds are not overlapped", "[network][health]") {
    asio::io_context io;
    auto work = asio::make_work_guard(io);
    std::thread io_thread([&io]() { io.run(); });

    auto http = std::make_shared<FakeHttpClient>();
    PeerRegistry registry(FastProbeConfig(), http);
    registry.AddManual("10.0.0.1", "A");
    http->SetBehavior("10.0.0.1", 3000, FakeHttpClient::Hang());

    PeerHealthMonitor::Config config;
    config.interval = std::chrono::milliseconds(20);
    PeerHealthMonitor monitor(io, registry, config);
    monitor.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    monitor.Stop();

    // Each probe hangs for 200ms, so at most one probe per 200ms window
    REQUIRE(http->request_count() <= 4);
    REQUIRE(http->request_count() >= 1);

    work.reset();
    io.stop();
    io_thread.join();
}
