// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>

using namespace torlink::app;
using torlink::util::atomic_write_file;

namespace {

std::filesystem::path WriteConfig(const std::filesystem::path& dir, const std::string& text) {
    auto path = dir / "torlink.json";
    REQUIRE(atomic_write_file(path, text));
    return path;
}

} // namespace

TEST_CASE("LoadConfigFile", "[app][config]") {
    auto test_dir = std::filesystem::temp_directory_path() / "torlink_config_test";
    std::filesystem::remove_all(test_dir);
    REQUIRE(torlink::util::ensure_directory(test_dir));

    AppConfig config;
    std::string error;

    SECTION("Defaults survive an empty object") {
        const auto datadir = config.datadir;
        REQUIRE(LoadConfigFile(WriteConfig(test_dir, "{}"), config, &error));
        REQUIRE(config.datadir == datadir);
        REQUIRE(config.listen);
        REQUIRE_FALSE(config.transport.websocket);
        REQUIRE(config.min_peers == 1);
        REQUIRE(config.connect_timeout == std::chrono::minutes(3));
        REQUIRE(config.tor.control_address == "127.0.0.1:9051");
        REQUIRE(config.peers_file.empty());
    }

    SECTION("All fields") {
        auto path = WriteConfig(test_dir, R"({
            "datadir": "/tmp/torlink-node",
            "tor": {"control": "127.0.0.1:9151", "socks": "127.0.0.1:9150",
                    "password": "secret", "cookie": "/run/tor/control.authcookie",
                    "command_timeout_secs": 10},
            "websocket": true,
            "listen": false,
            "onion_port": 4001,
            "peer_id": "QmSelf",
            "peers": "/etc/torlink/peers.json",
            "min_peers": 3,
            "connect_timeout_secs": 90,
            "provide": "topic",
            "loglevel": "debug",
            "debug": ["net", "tor"]
        })");
        REQUIRE(LoadConfigFile(path, config, &error));
        REQUIRE(config.datadir == "/tmp/torlink-node");
        REQUIRE(config.tor.control_address == "127.0.0.1:9151");
        REQUIRE(config.tor.socks_address == "127.0.0.1:9150");
        REQUIRE(config.tor.control_password == "secret");
        REQUIRE(config.tor.cookie_path == "/run/tor/control.authcookie");
        REQUIRE(config.tor.command_timeout == std::chrono::seconds(10));
        REQUIRE(config.transport.websocket);
        REQUIRE_FALSE(config.listen);
        REQUIRE(config.transport.listen.remote_port == 4001);
        REQUIRE(config.peer_id == "QmSelf");
        REQUIRE(config.peers_file == "/etc/torlink/peers.json");
        REQUIRE(config.min_peers == 3);
        REQUIRE(config.connect_timeout == std::chrono::seconds(90));
        REQUIRE(config.provide_key == "topic");
        REQUIRE(config.log_level == "debug");
        REQUIRE(config.debug_components == (std::vector<std::string>{"net", "tor"}));
    }

    SECTION("Null values are ignored") {
        REQUIRE(LoadConfigFile(WriteConfig(test_dir, R"({"peer_id": null, "min_peers": null})"),
                               config, &error));
        REQUIRE(config.peer_id.empty());
        REQUIRE(config.min_peers == 1);
    }

    SECTION("Type errors name the key") {
        REQUIRE_FALSE(LoadConfigFile(WriteConfig(test_dir, R"({"listen": "yes"})"), config, &error));
        REQUIRE(error.find("'listen'") != std::string::npos);
    }

    SECTION("Range checks") {
        REQUIRE_FALSE(LoadConfigFile(WriteConfig(test_dir, R"({"onion_port": 70000})"), config, &error));
        REQUIRE_FALSE(LoadConfigFile(WriteConfig(test_dir, R"({"min_peers": -1})"), config, &error));
        REQUIRE_FALSE(LoadConfigFile(WriteConfig(test_dir, R"({"connect_timeout_secs": 0})"), config, &error));
        REQUIRE_FALSE(LoadConfigFile(WriteConfig(test_dir, R"({"tor": {"command_timeout_secs": -5}})"),
                                     config, &error));
    }

    SECTION("Unreadable or malformed files") {
        REQUIRE_FALSE(LoadConfigFile(test_dir / "missing.json", config, &error));
        REQUIRE(error.find("cannot read") != std::string::npos);
        REQUIRE_FALSE(LoadConfigFile(WriteConfig(test_dir, "[1, 2]"), config, &error));
        REQUIRE(error.find("not a JSON object") != std::string::npos);
        REQUIRE_FALSE(LoadConfigFile(WriteConfig(test_dir, "{broken"), config, &error));
    }

    std::filesystem::remove_all(test_dir);
}
