// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "datetime/datetime_addon.hpp"
#include "infra/fake_addon_host.hpp"
#include "infra/test_support.hpp"
#include "scheduled-restart/scheduled_restart_addon.hpp"

#include <chrono>
#include <filesystem>
#include <thread>

using namespace signage;
using namespace signage::addons;
using namespace std::chrono_literals;
using signage::test::FakeAddonHost;
using signage::test::TempDir;

namespace {

const std::filesystem::path kSourceAddons = std::filesystem::path(SIGNAGE_SOURCE_DIR) / "addons";

}  // namespace

TEST_CASE("DateTimeAddon: frontend script carries the config", "[addon][builtin][datetime]") {
    TempDir dir;
    FakeAddonHost host("datetime", kSourceAddons / "datetime", dir / "fonts");
    DateTimeAddon addon(host);

    addon.Init({{"enabled", true}, {"fontSize", 36}, {"style", "bouncing"}});
    auto script = addon.FrontendScript();
    REQUIRE(script.has_value());
    REQUIRE(script->rfind("window.addonConfig = ", 0) == 0);
    REQUIRE(script->find("\"fontSize\":36") != std::string::npos);
    REQUIRE(script->find("DateTimeOverlay") != std::string::npos);

    addon.UpdateConfig({{"enabled", true}, {"fontSize", 48}});
    REQUIRE(addon.config()["fontSize"] == 48);
    REQUIRE(addon.FrontendScript()->find("\"fontSize\":48") != std::string::npos);
}

TEST_CASE("DateTimeAddon: Init creates the fonts directory", "[addon][builtin][datetime]") {
    TempDir dir;
    FakeAddonHost host("datetime", kSourceAddons / "datetime", dir / "fonts");
    DateTimeAddon addon(host);

    addon.Init(nlohmann::json::object());
    REQUIRE(std::filesystem::is_directory(dir / "fonts"));
    REQUIRE(std::filesystem::exists(dir / "fonts" / "README.txt"));
}

TEST_CASE("DateTimeAddon: fonts are served as data URLs", "[addon][builtin][datetime]") {
    TempDir dir;
    test::WriteFile(dir / "fonts" / "Mono.woff", "abc");
    FakeAddonHost host("datetime", kSourceAddons / "datetime", dir / "fonts");
    DateTimeAddon addon(host);
    addon.Init(nlohmann::json::object());

    auto url = addon.AssetData("Mono.woff");
    REQUIRE(url == std::optional<std::string>("data:font/woff;base64,YWJj"));

    // Served from cache even after the file is gone
    std::filesystem::remove(dir / "fonts" / "Mono.woff");
    REQUIRE(addon.AssetData("Mono.woff") == url);

    // Stop drops the cache
    addon.Stop();
    REQUIRE_FALSE(addon.AssetData("Mono.woff").has_value());
    REQUIRE_FALSE(addon.AssetData("../etc/passwd.ttf").has_value());
}

TEST_CASE("DateTimeAddon: missing frontend script", "[addon][builtin][datetime]") {
    TempDir dir;
    FakeAddonHost host("datetime", dir / "nowhere", dir / "fonts");
    DateTimeAddon addon(host);
    addon.Init(nlohmann::json::object());
    REQUIRE_FALSE(addon.FrontendScript().has_value());
}

TEST_CASE("ScheduledRestartAddon: FormatRemaining", "[addon][builtin][restart]") {
    using ms = std::chrono::milliseconds;
    REQUIRE(ScheduledRestartAddon::FormatRemaining(ms(3723000), false) == "1h 2m 3s");
    REQUIRE(ScheduledRestartAddon::FormatRemaining(ms(86398000), false) == "23h 59m 58s");
    REQUIRE(ScheduledRestartAddon::FormatRemaining(ms(123000), false) == "2m 3s");
    REQUIRE(ScheduledRestartAddon::FormatRemaining(ms(3999), false) == "3s");
    REQUIRE(ScheduledRestartAddon::FormatRemaining(ms(0), false) == "0s");
    // Test mode counts minutes past the hour
    REQUIRE(ScheduledRestartAddon::FormatRemaining(ms(3723000), true) == "62m 3s");
}

TEST_CASE("ScheduledRestartAddon: disabled does not schedule", "[addon][builtin][restart]") {
    TempDir dir;
    FakeAddonHost host("scheduled-restart", kSourceAddons / "scheduled-restart", dir / "fonts");
    ScheduledRestartAddon addon(host);

    addon.Init({{"enabled", false}});
    REQUIRE_FALSE(addon.is_scheduled());
    REQUIRE(addon.TimeRemaining() == "Not scheduled");
    REQUIRE(addon.AssetData("timeRemaining") == std::optional<std::string>("Not scheduled"));
    addon.Stop();
    REQUIRE(host.messages().empty());
}

TEST_CASE("ScheduledRestartAddon: schedule and countdown", "[addon][builtin][restart]") {
    TempDir dir;
    FakeAddonHost host("scheduled-restart", kSourceAddons / "scheduled-restart", dir / "fonts");
    ScheduledRestartAddon addon(host);

    addon.Init({{"enabled", true}, {"restartInterval", 24}, {"warningTime", 5}});
    REQUIRE(addon.is_scheduled());
    const std::string remaining = addon.TimeRemaining();
    REQUIRE((remaining == "23h 59m 59s" || remaining == "24h 0m 0s"));
    REQUIRE_FALSE(addon.warning_active());

    auto script = addon.FrontendScript();
    REQUIRE(script.has_value());
    REQUIRE(script->find("\"restartInterval\":24") != std::string::npos);

    addon.Stop();
    REQUIRE_FALSE(addon.is_scheduled());
    // No warning was showing, so nothing to remove
    REQUIRE(host.messages().empty());
}

TEST_CASE("ScheduledRestartAddon: warning flow ends in a restart request", "[addon][builtin][restart]") {
    TempDir dir;
    FakeAddonHost host("scheduled-restart", kSourceAddons / "scheduled-restart", dir / "fonts");
    ScheduledRestartAddon::Timing timing;
    timing.minute = 40ms;
    timing.restart_delay = 20ms;
    ScheduledRestartAddon addon(host, timing);

    // 3 "minutes" total, warning 2 before
    addon.Init({{"enabled", true}, {"testMode", true}, {"testInterval", 3}, {"warningTime", 2}});
    REQUIRE(test::WaitFor([&] { return host.restart_requests.load() > 0; }, 3000ms));

    auto types = host.message_types();
    REQUIRE(types.size() >= 2);
    REQUIRE(types.front() == "restart-warning");
    REQUIRE(types.back() == "restart-now");
    REQUIRE(host.messages().front()["warningTime"] == 2);
    for (size_t i = 1; i + 1 < types.size(); ++i) {
        REQUIRE(types[i] == "update-warning");
    }
    REQUIRE(host.restart_requests == 1);

    addon.Stop();
    // The warning was still up when stopped
    REQUIRE(host.message_types().back() == "remove-warning");
}

TEST_CASE("ScheduledRestartAddon: Stop during the warning clears it", "[addon][builtin][restart]") {
    TempDir dir;
    FakeAddonHost host("scheduled-restart", kSourceAddons / "scheduled-restart", dir / "fonts");
    ScheduledRestartAddon::Timing timing;
    timing.minute = 50ms;
    ScheduledRestartAddon addon(host, timing);

    // Warning equals the interval, so it shows immediately
    addon.Init({{"enabled", true}, {"testMode", true}, {"testInterval", 60}, {"warningTime", 30}});
    std::this_thread::sleep_for(20ms);
    REQUIRE_FALSE(addon.warning_active());

    addon.Init({{"enabled", true}, {"testMode", true}, {"testInterval", 1}, {"warningTime", 1}});
    REQUIRE(test::WaitFor([&] { return addon.warning_active(); }, 1000ms));
    addon.Stop();

    auto types = host.message_types();
    REQUIRE(types.front() == "restart-warning");
    REQUIRE(types.back() == "remove-warning");
    REQUIRE(host.restart_requests == 0);
    REQUIRE_FALSE(addon.warning_active());
}
