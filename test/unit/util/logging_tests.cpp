// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license
// Unit tests for LogManager

#include <catch2/catch_test_macros.hpp>

#include "util/logging.hpp"

#include <algorithm>
#include <thread>
#include <vector>

using namespace signage::util;

// Note: LogManager uses std::call_once, so Initialize() only runs once per process.

TEST_CASE("LogManager: GetLogger returns component loggers", "[logging]") {
    LogManager::Initialize("info", false, "");

    SECTION("Default logger") {
        auto logger = LogManager::GetLogger();
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "default");
    }

    SECTION("Every component has its own logger") {
        for (const auto& name : LogManager::Components()) {
            auto logger = LogManager::GetLogger(name);
            REQUIRE(logger != nullptr);
            REQUIRE(logger->name() == name);
        }
        const auto& components = LogManager::Components();
        REQUIRE(std::find(components.begin(), components.end(), "addon") != components.end());
        REQUIRE(std::find(components.begin(), components.end(), "network") != components.end());
    }

    SECTION("Unknown component returns default logger") {
        auto unknown = LogManager::GetLogger("chain");
        REQUIRE(unknown != nullptr);
        REQUIRE(unknown->name() == "default");
    }

    SECTION("Same logger returned for same component") {
        REQUIRE(LogManager::GetLogger("addon").get() == LogManager::GetLogger("addon").get());
    }
}

TEST_CASE("LogManager: runtime level changes", "[logging]") {
    LogManager::Initialize("info", false, "");

    SECTION("Component level") {
        REQUIRE(LogManager::SetComponentLevel("network", "debug"));
        REQUIRE(LogManager::GetLogger("network")->level() == spdlog::level::debug);
        REQUIRE(LogManager::SetComponentLevel("network", "info"));
    }

    SECTION("Unknown component is rejected") {
        REQUIRE_FALSE(LogManager::SetComponentLevel("nonexistent", "debug"));
    }

    SECTION("Global level") {
        LogManager::SetLogLevel("warn");
        for (const auto& name : LogManager::Components()) {
            REQUIRE(LogManager::GetLogger(name)->level() == spdlog::level::warn);
        }
        LogManager::SetLogLevel("info");
    }
}

TEST_CASE("LogManager: concurrent logging", "[logging][concurrency]") {
    LogManager::Initialize("info", false, "");
    LogManager::SetComponentLevel("addon", "off");

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([i]() {
            for (int n = 0; n < 100; ++n) {
                LOG_ADDON_INFO("thread {} message {}", i, n);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    LogManager::SetComponentLevel("addon", "info");
    SUCCEED();
}
