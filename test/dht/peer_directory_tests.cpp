// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "dht/peer_directory.hpp"
#include <catch2/catch_test_macros.hpp>
#include <thread>

using namespace torlink::dht;
using torlink::transport::Multiaddr;

namespace {

Multiaddr Addr(const std::string& text) {
    auto addr = Multiaddr::parse(text);
    REQUIRE(addr.has_value());
    return *addr;
}

} // namespace

TEST_CASE("PeerDirectory - add and query", "[dht][peerstore]") {
    PeerDirectory directory;
    const auto a = Addr("/onion/abcdefghijklmnop:4001");
    const auto b = Addr("/onion/abcdefghijklmnop:4002/ws");

    REQUIRE(directory.size() == 0);
    REQUIRE_FALSE(directory.contains("QmA"));
    REQUIRE(directory.addrs("QmA").empty());

    REQUIRE(directory.add_addrs("QmA", {a}) == 1);
    REQUIRE(directory.contains("QmA"));

    SECTION("Duplicates are ignored and order is kept") {
        REQUIRE(directory.add_addrs("QmA", {b, a, b}) == 1);
        const std::vector<Multiaddr> expected{a, b};
        REQUIRE(directory.addrs("QmA") == expected);
    }

    SECTION("Peers are listed in sorted order") {
        directory.add_addrs("QmC", {b});
        directory.add_addrs("QmB", {a});
        const std::vector<std::string> expected{"QmA", "QmB", "QmC"};
        REQUIRE(directory.peers() == expected);
        REQUIRE(directory.size() == 3);
    }

    SECTION("Empty additions still register the peer") {
        REQUIRE(directory.add_addrs("QmEmpty", {}) == 0);
        REQUIRE(directory.contains("QmEmpty"));
        REQUIRE(directory.addrs("QmEmpty").empty());
    }
}

TEST_CASE("PeerDirectory - concurrent writers", "[dht][peerstore]") {
    PeerDirectory directory;
    const auto a = Addr("/onion/abcdefghijklmnop:4001");
    const auto b = Addr("/onion/abcdefghijklmnop:4002");

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            for (int j = 0; j < 100; ++j) {
                directory.add_addrs("QmShared", {(i + j) % 2 ? a : b});
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    REQUIRE(directory.addrs("QmShared").size() == 2);
}
