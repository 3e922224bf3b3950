// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "app/config_store.hpp"
#include "infra/test_support.hpp"
#include "util/files.hpp"

#include <sys/stat.h>

using namespace signage;
using namespace signage::app;
using signage::test::TempDir;

namespace {

nlohmann::json ReadJson(const std::filesystem::path& path) {
    auto content = util::read_file_string(path);
    REQUIRE(content.has_value());
    return nlohmann::json::parse(*content);
}

}  // namespace

TEST_CASE("ConfigStore: DeepMerge", "[app][config]") {
    nlohmann::json target = {{"a", 1}, {"nested", {{"x", 1}, {"y", 2}}}, {"list", {1, 2, 3}}};

    DeepMerge(target, {{"b", 2}, {"nested", {{"y", 20}, {"z", 30}}}, {"list", {9}}});
    REQUIRE(target["a"] == 1);
    REQUIRE(target["b"] == 2);
    REQUIRE(target["nested"] == nlohmann::json({{"x", 1}, {"y", 20}, {"z", 30}}));
    // Arrays are replaced, not merged
    REQUIRE(target["list"] == nlohmann::json::array({9}));

    // Null is stored rather than deleting the key
    DeepMerge(target, {{"a", nullptr}});
    REQUIRE(target.contains("a"));
    REQUIRE(target["a"].is_null());

    nlohmann::json scalar = 5;
    DeepMerge(scalar, {{"k", 1}});
    REQUIRE(scalar == nlohmann::json({{"k", 1}}));
}

TEST_CASE("ConfigStore: defaults", "[app][config]") {
    auto defaults = DefaultConfig();
    REQUIRE(defaults["port"] == 3000);
    REQUIRE(defaults["wsPort"] == 3001);
    REQUIRE(defaults["discoveryPort"] == 3002);
    REQUIRE(defaults["staticIp"] == "");
    REQUIRE(defaults["displayName"] == util::get_hostname());
    REQUIRE(defaults["manualPeers"].is_array());
    REQUIRE(defaults["addons"].is_object());
}

TEST_CASE("JsonConfigStore: missing file is created with defaults", "[app][config]") {
    TempDir dir;
    JsonConfigStore store(dir / "config.json");
    REQUIRE(store.Load());
    REQUIRE(std::filesystem::exists(dir / "config.json"));
    REQUIRE(ReadJson(dir / "config.json")["port"] == 3000);
    REQUIRE(store.Snapshot()["port"] == 3000);
}

TEST_CASE("JsonConfigStore: stored values merge over defaults", "[app][config]") {
    TempDir dir;
    test::WriteFile(dir / "config.json",
                    R"({"displayName":"Lobby","port":3100,"theme":"dark","addons":{"datetime":{"fontSize":40}}})");

    JsonConfigStore store(dir / "config.json");
    REQUIRE(store.Load());
    auto config = store.Snapshot();
    REQUIRE(config["displayName"] == "Lobby");
    REQUIRE(config["port"] == 3100);
    REQUIRE(config["wsPort"] == 3001);
    // Keys the core does not know are kept
    REQUIRE(config["theme"] == "dark");
    REQUIRE(store.AddonConfig("datetime")["fontSize"] == 40);
    REQUIRE(store.AddonConfig("nothing").is_null());
}

TEST_CASE("JsonConfigStore: corrupt file fails to load", "[app][config]") {
    TempDir dir;
    SECTION("Not JSON") {
        test::WriteFile(dir / "config.json", "{ port: 3000");
    }
    SECTION("Not an object") {
        test::WriteFile(dir / "config.json", "[1,2,3]");
    }
    JsonConfigStore store(dir / "config.json");
    REQUIRE_FALSE(store.Load());
    // Defaults still answer reads
    REQUIRE(store.Snapshot()["port"] == 3000);
}

TEST_CASE("JsonConfigStore: writes persist atomically", "[app][config]") {
    TempDir dir;
    const auto path = dir / "config.json";
    JsonConfigStore store(path);
    REQUIRE(store.Load());

    auto merged = store.Merge({{"displayName", "Hall"}, {"rotation", 90}});
    REQUIRE(merged["displayName"] == "Hall");
    REQUIRE(merged["port"] == 3000);

    store.Set("manualPeers", nlohmann::json::array({{{"ip", "10.0.0.2"}, {"name", "B"}, {"port", 3000}}}));
    store.SetAddonConfig("datetime", {{"fontSize", 30}});

    auto on_disk = ReadJson(path);
    REQUIRE(on_disk["displayName"] == "Hall");
    REQUIRE(on_disk["rotation"] == 90);
    REQUIRE(on_disk["manualPeers"][0]["ip"] == "10.0.0.2");
    REQUIRE(on_disk["addons"]["datetime"]["fontSize"] == 30);

    JsonConfigStore reopened(path);
    REQUIRE(reopened.Load());
    REQUIRE(reopened.Snapshot() == store.Snapshot());

    REQUIRE_THROWS_AS(store.Merge(nlohmann::json::array()), std::invalid_argument);
}

TEST_CASE("JsonConfigStore: failed write leaves memory unchanged", "[app][config]") {
    if (geteuid() == 0) {
        SKIP("root ignores directory permissions");
    }
    TempDir dir;
    const auto sub = dir / "ro";
    std::filesystem::create_directories(sub);
    JsonConfigStore store(sub / "config.json");
    REQUIRE(store.Load());

    chmod(sub.c_str(), 0500);
    REQUIRE_THROWS_AS(store.Merge({{"displayName", "Nope"}}), std::runtime_error);
    REQUIRE_THROWS_AS(store.SetAddonConfig("x", {{"a", 1}}), std::runtime_error);
    chmod(sub.c_str(), 0700);

    REQUIRE(store.Snapshot()["displayName"] != "Nope");
    REQUIRE(store.AddonConfig("x").is_null());
}
