// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "addon/addon_lifecycle_manager.hpp"
#include "addon/addon_registry.hpp"
#include "infra/test_module_loader.hpp"
#include "infra/test_support.hpp"
#include "util/error.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

using namespace signage;
using namespace signage::addon;
using signage::test::MemoryConfigStore;
using signage::test::TempDir;
using signage::test::TestModuleLoader;

namespace {

struct LifecycleFixture {
    TempDir dir{"signage_life"};
    MemoryConfigStore store;
    AddonRegistry registry{store, {}};
    std::shared_ptr<TestModuleLoader> loader = std::make_shared<TestModuleLoader>();

    std::mutex emitted_mutex;
    std::vector<std::pair<std::string, nlohmann::json>> emitted;
    std::atomic<int> restart_requests{0};
    bool allow_restart{true};

    std::unique_ptr<AddonLifecycleManager> lifecycle;

    LifecycleFixture() {
        AddonLifecycleManager::HostServices services;
        services.fonts_dir = dir / "fonts";
        services.emit = [this](const std::string& id, const nlohmann::json& message) {
            std::lock_guard<std::mutex> lock(emitted_mutex);
            emitted.emplace_back(id, message);
        };
        services.request_restart = [this]() {
            restart_requests++;
            return allow_restart;
        };
        lifecycle = std::make_unique<AddonLifecycleManager>(registry, loader, std::move(services));
    }

    std::filesystem::path addons_dir() const { return dir / "addons"; }

    void Add(const std::string& id, bool enabled = true) {
        test::WriteManifest(addons_dir(), id, test::BasicManifest(id, enabled));
    }

    size_t ScanAndStart() {
        registry.Scan(addons_dir());
        return lifecycle->StartAll();
    }

    AddonState State(const std::string& id) { return registry.Get(id)->state(); }
};

}  // namespace

TEST_CASE("AddonLifecycle: StartAll runs enabled addons only", "[addon][lifecycle]") {
    LifecycleFixture f;
    f.Add("ticker");
    f.Add("weather", false);

    REQUIRE(f.ScanAndStart() == 1);
    REQUIRE(f.State("ticker") == AddonState::Running);
    REQUIRE(f.State("weather") == AddonState::Stopped);

    // Disabled addons are instantiated but never initialised
    REQUIRE(f.loader->load_count("weather") == 1);
    REQUIRE(f.loader->Probe("weather")->init_calls == 0);
    REQUIRE(f.loader->Probe("ticker")->init_calls == 1);
    REQUIRE(f.loader->Probe("ticker")->LastInitConfig()["speed"] == 5);

    // A second start is a no-op for running addons
    REQUIRE(f.lifecycle->LoadAndStart("ticker"));
    REQUIRE(f.loader->Probe("ticker")->init_calls == 1);
    REQUIRE(f.loader->load_count("ticker") == 1);
}

TEST_CASE("AddonLifecycle: unknown ids are NotFound", "[addon][lifecycle]") {
    LifecycleFixture f;
    f.ScanAndStart();
    try {
        f.lifecycle->LoadAndStart("ghost");
        FAIL("expected NotFound");
    } catch (const CoreError& e) {
        REQUIRE(e.code() == ErrorCode::NotFound);
    }
    REQUIRE_THROWS_AS(f.lifecycle->ApplyConfigUpdate("ghost", nlohmann::json::object()), CoreError);
}

TEST_CASE("AddonLifecycle: config update restarts with the merged config", "[addon][lifecycle]") {
    LifecycleFixture f;
    f.Add("ticker");
    f.ScanAndStart();
    auto probe = f.loader->Probe("ticker");

    f.registry.UpdateConfig("ticker", {{"speed", 9}});

    REQUIRE(probe->Events() == std::vector<std::string>{"init", "stop", "update", "init"});
    REQUIRE(probe->LastInitConfig()["speed"] == 9);
    REQUIRE(probe->LastInitConfig()["color"] == "#FFFFFF");
    REQUIRE(f.State("ticker") == AddonState::Running);
    // Same instance, no reload
    REQUIRE(f.loader->load_count("ticker") == 1);
}

TEST_CASE("AddonLifecycle: disabling stops once without re-init", "[addon][lifecycle]") {
    LifecycleFixture f;
    f.Add("ticker");
    f.ScanAndStart();
    auto probe = f.loader->Probe("ticker");

    f.registry.UpdateConfig("ticker", {{"enabled", false}});
    REQUIRE(probe->stop_calls == 1);
    REQUIRE(probe->init_calls == 1);
    REQUIRE(f.State("ticker") == AddonState::Stopped);

    SECTION("A further update while disabled does not stop again") {
        f.registry.UpdateConfig("ticker", {{"speed", 2}});
        REQUIRE(probe->stop_calls == 1);
        REQUIRE(probe->init_calls == 1);
        REQUIRE(probe->update_calls == 2);
    }

    SECTION("Re-enabling starts the same instance") {
        f.registry.UpdateConfig("ticker", {{"enabled", true}});
        REQUIRE(probe->init_calls == 2);
        REQUIRE(f.State("ticker") == AddonState::Running);
        REQUIRE(f.loader->load_count("ticker") == 1);
    }
}

TEST_CASE("AddonLifecycle: enabling an addon that was never loaded loads it", "[addon][lifecycle]") {
    LifecycleFixture f;
    f.Add("ticker", false);
    f.registry.Scan(f.addons_dir());
    // Not started at all yet
    REQUIRE(f.State("ticker") == AddonState::Unloaded);

    f.registry.UpdateConfig("ticker", {{"enabled", true}});
    REQUIRE(f.loader->load_count("ticker") == 1);
    REQUIRE(f.State("ticker") == AddonState::Running);
}

TEST_CASE("AddonLifecycle: a failing Init isolates that addon", "[addon][lifecycle]") {
    LifecycleFixture f;
    f.Add("bad");
    f.Add("good");
    f.loader->Probe("bad")->throw_on_init = true;

    REQUIRE(f.ScanAndStart() == 1);
    REQUIRE(f.State("good") == AddonState::Running);
    REQUIRE(f.State("bad") == AddonState::Stopped);
    REQUIRE(f.registry.Get("bad")->last_error() == "init failed on purpose");

    auto summary = f.registry.GetAddonConfigs().at("bad").ToJson();
    REQUIRE(summary["lastError"] == "init failed on purpose");

    // A later successful start clears the error
    f.loader->Probe("bad")->throw_on_init = false;
    REQUIRE(f.lifecycle->LoadAndStart("bad"));
    REQUIRE(f.registry.Get("bad")->last_error().empty());
}

TEST_CASE("AddonLifecycle: a module that fails to load stays Stopped", "[addon][lifecycle]") {
    LifecycleFixture f;
    f.Add("ticker");
    f.Add("clock");
    f.loader->FailLoad("clock");

    REQUIRE(f.ScanAndStart() == 1);
    REQUIRE(f.State("clock") == AddonState::Stopped);
    REQUIRE(f.registry.Get("clock")->module == nullptr);
    REQUIRE(f.registry.Get("clock")->last_error().find("failed to load") != std::string::npos);
    REQUIRE(f.State("ticker") == AddonState::Running);
}

TEST_CASE("AddonLifecycle: transient I/O errors on stop are not reported", "[addon][lifecycle]") {
    LifecycleFixture f;
    f.Add("ticker");
    f.ScanAndStart();
    f.loader->Probe("ticker")->throw_on_stop = true;

    auto report = f.lifecycle->ReloadAll(f.addons_dir());
    REQUIRE(report.scan_ok);
    REQUIRE(report.stop_errors.empty());
    REQUIRE(report.ToJson().contains("stopErrors") == false);
    REQUIRE(f.loader->Probe("ticker")->stop_calls == 1);
}

TEST_CASE("AddonLifecycle: ReloadAll swaps in the rescanned set", "[addon][lifecycle]") {
    LifecycleFixture f;
    f.Add("ticker");
    f.Add("clock");
    f.ScanAndStart();
    auto ticker = f.loader->Probe("ticker");

    std::filesystem::remove_all(f.addons_dir() / "clock");
    f.Add("weather", false);

    auto report = f.lifecycle->ReloadAll(f.addons_dir());
    REQUIRE(report.scan_ok);
    REQUIRE(report.loaded == 2);
    REQUIRE(report.running == 1);

    REQUIRE(f.registry.Get("clock") == nullptr);
    REQUIRE(f.State("weather") == AddonState::Stopped);
    REQUIRE(f.State("ticker") == AddonState::Running);

    // Old instances were stopped and destroyed, fresh ones created
    REQUIRE(ticker->stop_calls == 1);
    REQUIRE(ticker->destroyed == 1);
    REQUIRE(ticker->init_calls == 2);
    REQUIRE(f.loader->load_count("ticker") == 2);
    REQUIRE(f.loader->Probe("clock")->destroyed == 1);

    auto j = report.ToJson();
    REQUIRE(j["success"] == true);
    REQUIRE(j["loaded"] == 2);
}

TEST_CASE("AddonLifecycle: ReloadAll keeps the current set if the scan fails", "[addon][lifecycle]") {
    LifecycleFixture f;
    f.Add("ticker");
    f.ScanAndStart();

    // A regular file where the directory should be cannot be listed
    test::WriteFile(f.dir / "not-a-dir", "x");
    auto report = f.lifecycle->ReloadAll(f.dir / "not-a-dir");

    REQUIRE_FALSE(report.scan_ok);
    REQUIRE_FALSE(report.scan_error.empty());
    REQUIRE(report.ToJson()["success"] == false);
    REQUIRE(report.ToJson().contains("error"));
    REQUIRE(f.State("ticker") == AddonState::Running);
    REQUIRE(f.loader->Probe("ticker")->stop_calls == 0);
}

TEST_CASE("AddonLifecycle: hooks never overlap under concurrent reload and update", "[addon][lifecycle][concurrency]") {
    LifecycleFixture f;
    f.Add("ticker");
    f.Add("clock");
    f.ScanAndStart();
    f.loader->Probe("ticker")->hook_delay_ms = 2;
    f.loader->Probe("clock")->hook_delay_ms = 2;

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    threads.emplace_back([&]() {
        for (int i = 0; i < 5; ++i) {
            if (!f.lifecycle->ReloadAll(f.addons_dir()).scan_ok) {
                failures++;
            }
        }
    });
    for (const char* id : {"ticker", "clock"}) {
        threads.emplace_back([&, id]() {
            for (int i = 0; i < 10; ++i) {
                try {
                    f.registry.UpdateConfig(id, {{"speed", 1 + i % 10}});
                } catch (const std::exception&) {
                    failures++;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(failures == 0);
    REQUIRE_FALSE(f.loader->Probe("ticker")->overlapped);
    REQUIRE_FALSE(f.loader->Probe("clock")->overlapped);
    REQUIRE(f.State("ticker") == AddonState::Running);
    REQUIRE(f.State("clock") == AddonState::Running);
    REQUIRE(f.registry.Get("ticker")->config()["speed"] == 10);
}

TEST_CASE("AddonLifecycle: concurrent partial updates merge in order", "[addon][lifecycle][concurrency]") {
    LifecycleFixture f;
    f.Add("ticker");
    f.ScanAndStart();
    f.loader->Probe("ticker")->hook_delay_ms = 30;

    std::thread first([&]() { f.registry.UpdateConfig("ticker", {{"speed", 7}}); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    std::thread second([&]() { f.registry.UpdateConfig("ticker", {{"color", "#FF0000"}}); });
    first.join();
    second.join();

    auto live = f.registry.Get("ticker")->config();
    REQUIRE(live["speed"] == 7);
    REQUIRE(live["color"] == "#FF0000");
    REQUIRE(f.store.AddonConfig("ticker")["speed"] == 7);
    REQUIRE(f.store.AddonConfig("ticker")["color"] == "#FF0000");
    REQUIRE(f.loader->Probe("ticker")->LastInitConfig() == live);
    REQUIRE_FALSE(f.loader->Probe("ticker")->overlapped);
}

TEST_CASE("AddonLifecycle: host services reach the addon", "[addon][lifecycle][host]") {
    LifecycleFixture f;
    f.Add("ticker");
    f.ScanAndStart();
    AddonHost* host = f.loader->last_host("ticker");
    REQUIRE(host != nullptr);

    REQUIRE(host->addon_id() == "ticker");
    REQUIRE(host->addon_dir() == f.addons_dir() / "ticker");
    REQUIRE(host->fonts_dir() == f.dir / "fonts");
    REQUIRE(host->logger()->name() == "addon:ticker");
    REQUIRE_FALSE(host->shutting_down());

    host->Emit({{"type", "restart-warning"}, {"seconds", 300}});
    {
        std::lock_guard<std::mutex> lock(f.emitted_mutex);
        REQUIRE(f.emitted.size() == 1);
        REQUIRE(f.emitted[0].first == "ticker");
        REQUIRE(f.emitted[0].second["type"] == "restart-warning");
    }

    REQUIRE(host->RequestSystemRestart());
    f.allow_restart = false;
    REQUIRE_FALSE(host->RequestSystemRestart());
    REQUIRE(f.restart_requests == 2);

    f.lifecycle->StopAll();
    REQUIRE(host->shutting_down());
    REQUIRE(f.State("ticker") == AddonState::Stopped);
}

TEST_CASE("AddonLifecycle: host without services refuses quietly", "[addon][lifecycle][host]") {
    TempDir dir;
    MemoryConfigStore store;
    AddonRegistry registry(store, {});
    auto loader = std::make_shared<TestModuleLoader>();
    AddonLifecycleManager lifecycle(registry, loader, {});
    test::WriteManifest(dir / "addons", "ticker", test::BasicManifest());
    registry.Scan(dir / "addons");
    lifecycle.StartAll();

    AddonHost* host = loader->last_host("ticker");
    REQUIRE_NOTHROW(host->Emit({{"type", "x"}}));
    REQUIRE_FALSE(host->RequestSystemRestart());
}

TEST_CASE("AddonLifecycle: emit failures are contained", "[addon][lifecycle][host]") {
    TempDir dir;
    MemoryConfigStore store;
    AddonRegistry registry(store, {});
    auto loader = std::make_shared<TestModuleLoader>();
    AddonLifecycleManager::HostServices services;
    services.emit = [](const std::string&, const nlohmann::json&) {
        throw std::system_error(std::make_error_code(std::errc::broken_pipe), "display gone");
    };
    AddonLifecycleManager lifecycle(registry, loader, std::move(services));
    test::WriteManifest(dir / "addons", "ticker", test::BasicManifest());
    registry.Scan(dir / "addons");
    lifecycle.StartAll();

    REQUIRE_NOTHROW(loader->last_host("ticker")->Emit({{"type", "x"}}));
}

TEST_CASE("AddonLifecycle: UnloadAll and destruction release every module", "[addon][lifecycle]") {
    auto f = std::make_unique<LifecycleFixture>();
    f->Add("ticker");
    f->Add("clock", false);
    f->ScanAndStart();
    auto ticker = f->loader->Probe("ticker");
    auto clock = f->loader->Probe("clock");

    f->lifecycle->UnloadAll();
    REQUIRE(ticker->stop_calls == 1);
    REQUIRE(clock->stop_calls == 0);
    REQUIRE(ticker->destroyed == 1);
    REQUIRE(clock->destroyed == 1);
    REQUIRE(f->State("ticker") == AddonState::Unloaded);

    f->lifecycle->StartAll();
    REQUIRE(f->loader->load_count("ticker") == 2);
    f->lifecycle.reset();
    REQUIRE(ticker->destroyed == 2);
}
