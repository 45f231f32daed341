// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "dht/peer_info.hpp"
#include "util/files.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>

using namespace torlink::dht;
using json = nlohmann::json;

namespace {

const std::string V2_ID = "abcdefghijklmnop";
const std::string V3_ID = "pg6mmjiyjmcrsslvykfwnntlaru7p5svn6y2ymmju6nubxndf4pscryd";

PeerInfo MakeInfo(const std::string& id, const std::string& service, uint16_t port) {
    PeerInfo info;
    info.id = id;
    info.onion_service_id = service;
    info.onion_port = port;
    return info;
}

} // namespace

TEST_CASE("PeerInfo - JSON conversion", "[dht][peerinfo]") {
    auto info = MakeInfo("QmPeer", V2_ID, 4001);
    json j = PeerInfoToJson(info);
    REQUIRE(j["id"] == "QmPeer");
    REQUIRE(j["onion_service_id"] == V2_ID);
    REQUIRE(j["onion_port"] == 4001);

    PeerInfo parsed;
    REQUIRE(PeerInfoFromJson(j, parsed));
    REQUIRE(parsed == info);
    REQUIRE(parsed.ToString() == "QmPeer@" + V2_ID + ".onion:4001");
}

TEST_CASE("PeerInfo - JSON validation", "[dht][peerinfo]") {
    PeerInfo out = MakeInfo("QmUntouched", V2_ID, 1);
    std::string error;

    SECTION("Not an object") {
        REQUIRE_FALSE(PeerInfoFromJson(json::array(), out, &error));
        REQUIRE(error == "peer info is not an object");
    }

    SECTION("Missing field") {
        json j = {{"id", "QmPeer"}, {"onion_service_id", V2_ID}};
        REQUIRE_FALSE(PeerInfoFromJson(j, out, &error));
        REQUIRE(error == "peer info is missing fields");
    }

    SECTION("Wrong types") {
        json j = {{"id", "QmPeer"}, {"onion_service_id", V2_ID}, {"onion_port", "4001"}};
        REQUIRE_FALSE(PeerInfoFromJson(j, out, &error));
        j["onion_port"] = -1;
        REQUIRE_FALSE(PeerInfoFromJson(j, out, &error));
    }

    SECTION("Bad identity") {
        json j = {{"id", "QmPeer"}, {"onion_service_id", "short"}, {"onion_port", 4001}};
        REQUIRE_FALSE(PeerInfoFromJson(j, out, &error));
        j["onion_service_id"] = "ABCDEFGHIJKLMNOP";
        REQUIRE_FALSE(PeerInfoFromJson(j, out, &error));
    }

    SECTION("Bad port") {
        json j = {{"id", "QmPeer"}, {"onion_service_id", V3_ID}, {"onion_port", 0}};
        REQUIRE_FALSE(PeerInfoFromJson(j, out, &error));
        j["onion_port"] = 70000;
        REQUIRE_FALSE(PeerInfoFromJson(j, out, &error));
    }

    SECTION("Empty id") {
        json j = {{"id", ""}, {"onion_service_id", V2_ID}, {"onion_port", 1}};
        REQUIRE_FALSE(PeerInfoFromJson(j, out, &error));
        REQUIRE(error == "empty peer id");
    }

    // Output untouched on failure
    REQUIRE(out.id == "QmUntouched");
}

TEST_CASE("PeerInfo - files", "[dht][peerinfo]") {
    auto test_dir = std::filesystem::temp_directory_path() / "torlink_peerinfo_test";
    std::filesystem::remove_all(test_dir);
    REQUIRE(torlink::util::ensure_directory(test_dir));

    SECTION("Single record") {
        auto path = test_dir / "peerinfo.json";
        auto info = MakeInfo("QmSelf", V3_ID, 9000);
        REQUIRE(SavePeerInfo(path, info));
        auto loaded = LoadPeerInfo(path);
        REQUIRE(loaded.has_value());
        REQUIRE(*loaded == info);
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(LoadPeerInfo(test_dir / "absent.json").has_value());
        REQUIRE_FALSE(LoadPeerInfos(test_dir / "absent.json").has_value());
    }

    SECTION("Peer list") {
        auto path = test_dir / "peers.json";
        std::vector<PeerInfo> peers{MakeInfo("QmA", V2_ID, 1), MakeInfo("QmB", V3_ID, 2)};
        REQUIRE(SavePeerInfos(path, peers));
        auto loaded = LoadPeerInfos(path);
        REQUIRE(loaded.has_value());
        REQUIRE(*loaded == peers);
    }

    SECTION("Bare array with a malformed entry") {
        auto path = test_dir / "peers.json";
        json root = json::array();
        root.push_back(PeerInfoToJson(MakeInfo("QmA", V2_ID, 1)));
        root.push_back({{"id", "QmBroken"}});
        root.push_back(PeerInfoToJson(MakeInfo("QmC", V2_ID, 3)));
        REQUIRE(torlink::util::atomic_write_file(path, root.dump()));

        auto loaded = LoadPeerInfos(path);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->size() == 2);
        REQUIRE((*loaded)[0].id == "QmA");
        REQUIRE((*loaded)[1].id == "QmC");
    }

    SECTION("Wrong version or garbage") {
        auto path = test_dir / "peers.json";
        REQUIRE(torlink::util::atomic_write_file(path, "{\"version\": 2, \"peers\": []}"));
        REQUIRE_FALSE(LoadPeerInfos(path).has_value());
        REQUIRE(torlink::util::atomic_write_file(path, "not json"));
        REQUIRE_FALSE(LoadPeerInfos(path).has_value());
        REQUIRE_FALSE(LoadPeerInfo(path).has_value());
    }

    std::filesystem::remove_all(test_dir);
}
