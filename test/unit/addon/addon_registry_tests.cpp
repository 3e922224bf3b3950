// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "addon/addon_registry.hpp"
#include "infra/test_support.hpp"
#include "util/error.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace signage;
using namespace signage::addon;
using signage::test::MemoryConfigStore;
using signage::test::TempDir;

TEST_CASE("AddonRegistry: scan finds valid addons and skips broken ones", "[addon][registry]") {
    TempDir dir;
    MemoryConfigStore store;
    AddonRegistry registry(store, dir / "fonts");
    const auto addons_dir = dir / "addons";

    test::WriteManifest(addons_dir, "ticker", test::BasicManifest("Ticker"));
    test::WriteManifest(addons_dir, "clock", test::BasicManifest("Clock"));
    test::WriteFile(addons_dir / "broken" / "addon.json", "{ nope");
    test::WriteManifest(addons_dir, "noversion", {{"info", {{"name", "No Version"}}}});
    test::WriteFile(addons_dir / "stray.txt", "not an addon");
    std::filesystem::create_directories(addons_dir / "empty");

    auto found = registry.Scan(addons_dir);
    REQUIRE(found.size() == 2);
    REQUIRE(found[0].id == "clock");
    REQUIRE(found[1].id == "ticker");
    REQUIRE(registry.Get("broken") == nullptr);
    REQUIRE(registry.Get("noversion") == nullptr);

    auto ticker = registry.Get("ticker");
    REQUIRE(ticker);
    REQUIRE(ticker->state() == AddonState::Unloaded);
    REQUIRE(ticker->enabled());
    REQUIRE(ticker->config() == nlohmann::json({{"enabled", true}, {"speed", 5}, {"color", "#FFFFFF"}}));
    REQUIRE(ticker->dir() == addons_dir / "ticker");
}

TEST_CASE("AddonRegistry: missing addons directory is created", "[addon][registry]") {
    TempDir dir;
    MemoryConfigStore store;
    AddonRegistry registry(store, {});

    REQUIRE(registry.Scan(dir / "addons").empty());
    REQUIRE(std::filesystem::is_directory(dir / "addons"));
}

TEST_CASE("AddonRegistry: saved config overlays manifest defaults", "[addon][registry]") {
    TempDir dir;
    MemoryConfigStore store({{"addons", {{"ticker", {{"speed", 9}, {"enabled", false}, {"extra", "kept"}}}}}});
    AddonRegistry registry(store, {});
    test::WriteManifest(dir / "addons", "ticker", test::BasicManifest());

    registry.Scan(dir / "addons");
    auto ticker = registry.Get("ticker");
    REQUIRE(ticker->config()["speed"] == 9);
    REQUIRE(ticker->config()["color"] == "#FFFFFF");
    REQUIRE(ticker->config()["extra"] == "kept");
    REQUIRE_FALSE(ticker->enabled());

    auto summary = registry.GetAddonConfigs().at("ticker").ToJson();
    REQUIRE(summary["enabled"] == false);
    REQUIRE(summary["state"] == "unloaded");
    REQUIRE(summary["hasBackend"] == true);
    REQUIRE(summary["hasFrontend"] == false);
    REQUIRE(summary["info"]["description"] == "test addon");
    REQUIRE(summary["settings"].size() == 3);
    REQUIRE_FALSE(summary.contains("lastError"));
}

TEST_CASE("AddonRegistry: UpdateConfig validates, persists and reconfigures", "[addon][registry]") {
    TempDir dir;
    MemoryConfigStore store;
    AddonRegistry registry(store, {});
    test::WriteManifest(dir / "addons", "ticker", test::BasicManifest());
    registry.Scan(dir / "addons");

    std::vector<nlohmann::json> applied;
    registry.SetReconfigureCallback([&](const std::string& id, const nlohmann::json& patch) {
        REQUIRE(id == "ticker");
        auto lock = registry.LockFor(id);
        std::lock_guard<std::mutex> guard(*lock);
        auto inst = registry.Get(id);
        auto merged = registry.CommitConfig(*inst, patch);
        applied.push_back(merged);
        inst->set_config(merged);
    });

    SECTION("Valid partial merges over the current config") {
        auto summary = registry.UpdateConfig("ticker", {{"speed", 7}, {"note", "free text"}});
        REQUIRE(summary.config["speed"] == 7);
        REQUIRE(summary.config["color"] == "#FFFFFF");
        REQUIRE(summary.config["note"] == "free text");
        REQUIRE(applied.size() == 1);
        REQUIRE(store.AddonConfig("ticker")["speed"] == 7);
    }

    SECTION("Credential fields are dropped in any case") {
        registry.UpdateConfig("ticker", {{"Password", "p"}, {"TOKEN", "t"}, {"secret", "s"}, {"speed", 2}});
        auto saved = store.AddonConfig("ticker");
        REQUIRE_FALSE(saved.contains("Password"));
        REQUIRE_FALSE(saved.contains("TOKEN"));
        REQUIRE_FALSE(saved.contains("secret"));
        REQUIRE(saved["speed"] == 2);
    }

    SECTION("Invalid values change nothing") {
        const int writes = store.write_count();
        REQUIRE_THROWS_AS(registry.UpdateConfig("ticker", {{"speed", 42}}), CoreError);
        REQUIRE_THROWS_AS(registry.UpdateConfig("ticker", {{"color", "blue"}}), CoreError);
        REQUIRE_THROWS_AS(registry.UpdateConfig("ticker", {{"enabled", "no"}}), CoreError);
        REQUIRE_THROWS_AS(registry.UpdateConfig("ticker", nlohmann::json::array()), CoreError);
        REQUIRE(store.write_count() == writes);
        REQUIRE(applied.empty());
        REQUIRE(registry.Get("ticker")->config()["speed"] == 5);
    }

    SECTION("Unknown addon is NotFound") {
        try {
            registry.UpdateConfig("ghost", {{"speed", 1}});
            FAIL("expected NotFound");
        } catch (const CoreError& e) {
            REQUIRE(e.code() == ErrorCode::NotFound);
        }
    }

    SECTION("Persist failure propagates and skips reconfigure") {
        store.set_fail_writes(true);
        REQUIRE_THROWS_AS(registry.UpdateConfig("ticker", {{"speed", 3}}), std::runtime_error);
        REQUIRE(applied.empty());
        REQUIRE(registry.Get("ticker")->config()["speed"] == 5);
    }

    SECTION("Disabling flips the enabled flag") {
        auto summary = registry.UpdateConfig("ticker", {{"enabled", false}});
        REQUIRE_FALSE(summary.enabled);
    }
}

TEST_CASE("AddonRegistry: UpdateConfig without a reconfigure callback stores config", "[addon][registry]") {
    TempDir dir;
    MemoryConfigStore store;
    AddonRegistry registry(store, {});
    test::WriteManifest(dir / "addons", "ticker", test::BasicManifest());
    registry.Scan(dir / "addons");

    registry.UpdateConfig("ticker", {{"speed", 4}});
    REQUIRE(registry.Get("ticker")->config()["speed"] == 4);
}

TEST_CASE("AddonRegistry: concurrent partial updates of one addon both land", "[addon][registry]") {
    TempDir dir;
    MemoryConfigStore store;
    AddonRegistry registry(store, {});
    auto manifest = test::BasicManifest();
    manifest["settings"].push_back({{"id", "label"}, {"type", "text"}, {"name", "Label"}, {"default", ""}});
    test::WriteManifest(dir / "addons", "ticker", manifest);
    registry.Scan(dir / "addons");

    // Slow reconfigure, standing in for Stop and Init hooks
    registry.SetReconfigureCallback([&](const std::string& id, const nlohmann::json& patch) {
        auto lock = registry.LockFor(id);
        std::lock_guard<std::mutex> guard(*lock);
        auto inst = registry.Get(id);
        auto merged = registry.CommitConfig(*inst, patch);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        inst->set_config(merged);
    });

    std::thread first([&]() { registry.UpdateConfig("ticker", {{"speed", 7}}); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    std::thread second([&]() { registry.UpdateConfig("ticker", {{"label", "hello"}}); });
    first.join();
    second.join();

    auto live = registry.Get("ticker")->config();
    REQUIRE(live["speed"] == 7);
    REQUIRE(live["label"] == "hello");
    auto saved = store.AddonConfig("ticker");
    REQUIRE(saved["speed"] == 7);
    REQUIRE(saved["label"] == "hello");
}

TEST_CASE("AddonRegistry: Replace returns the previous set", "[addon][registry]") {
    TempDir dir;
    MemoryConfigStore store;
    AddonRegistry registry(store, {});
    test::WriteManifest(dir / "a", "one", test::BasicManifest("One"));
    test::WriteManifest(dir / "b", "two", test::BasicManifest("Two"));

    registry.Scan(dir / "a");
    auto staged = registry.ScanDirectory(dir / "b");
    // Scanning alone does not touch the live set
    REQUIRE(registry.Get("one"));
    REQUIRE_FALSE(registry.Get("two"));

    auto previous = registry.Replace(std::move(staged));
    REQUIRE(previous.size() == 1);
    REQUIRE(previous[0]->id() == "one");
    REQUIRE(registry.Get("two"));
    REQUIRE_FALSE(registry.Get("one"));
}

TEST_CASE("AddonRegistry: lifecycle locks are stable per id", "[addon][registry]") {
    MemoryConfigStore store;
    AddonRegistry registry(store, {});
    auto a1 = registry.LockFor("a");
    auto a2 = registry.LockFor("a");
    auto b = registry.LockFor("b");
    REQUIRE(a1 == a2);
    REQUIRE(a1 != b);
}

TEST_CASE("AddonRegistry: frontend and assets need a loaded module", "[addon][registry]") {
    TempDir dir;
    MemoryConfigStore store;
    AddonRegistry registry(store, {});
    test::WriteManifest(dir / "addons", "ticker", test::BasicManifest());
    registry.Scan(dir / "addons");

    REQUIRE_FALSE(registry.FrontendScript("ticker").has_value());
    REQUIRE_FALSE(registry.AssetData("ticker", "fonts").has_value());
    REQUIRE_THROWS_AS(registry.FrontendScript("ghost"), CoreError);
    REQUIRE_THROWS_AS(registry.AssetData("ghost", "x"), CoreError);
}

TEST_CASE("AddonRegistry: StripCredentials", "[addon][registry]") {
    auto out = StripCredentials({{"passWord", 1}, {"tokens", 2}, {"mySecret", 3}, {"secret", 4}});
    REQUIRE(out == nlohmann::json({{"tokens", 2}, {"mySecret", 3}}));
    REQUIRE(AddonStateName(AddonState::Stopped) == std::string("stopped"));
}
