// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "dht/tor_dht.hpp"
#include "transport/onion_transport.hpp"
#include "transport/plaintext_upgrader.hpp"
#include "transport/infra/fake_overlay.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

using namespace torlink;
using namespace torlink::dht;
using namespace torlink::transport;
using namespace torlink::test;

namespace {

// Full node stack on a shared FakeNetwork
struct DhtNode {
    std::shared_ptr<FakeOverlay> overlay;
    HostPtr host;
    std::shared_ptr<LocalContentRouter> router;
    std::unique_ptr<TorDht> dht;

    DhtNode(const std::string& id, const std::shared_ptr<FakeNetwork>& network,
            TorDht::Options options = FastOptions())
        : overlay(std::make_shared<FakeOverlay>(network)) {
        auto transport =
            std::make_shared<OnionTransport>(overlay, std::make_shared<PlaintextUpgrader>(id));
        host = std::make_shared<Host>(id, transport);
        std::weak_ptr<Host> weak_host = host;
        router = std::make_shared<LocalContentRouter>([weak_host] {
            ProviderRecord record;
            if (auto h = weak_host.lock()) {
                record.id = h->id();
                record.addrs = h->listen_addresses();
            }
            return record;
        });
        dht = std::make_unique<TorDht>(host, router, AddressCodec(), options);
    }

    static TorDht::Options FastOptions() {
        TorDht::Options options;
        options.quorum.stagger = std::chrono::milliseconds(0);
        options.quorum.poll_interval = std::chrono::milliseconds(5);
        return options;
    }

    PeerInfo Listen() {
        TransportState state;
        REQUIRE(host->listen(AddressCodec::listen_marker(), state));
        REQUIRE(dht->apply_peer_info(state));
        REQUIRE(dht->peer_info().has_value());
        return *dht->peer_info();
    }
};

class StuckRouter : public ContentRouter {
public:
    bool provide(const util::Context&, const std::string&, TransportState& state) override {
        return state.Error(TransportError::ROUTING_FAILED, "router stuck");
    }
    bool find_providers(const util::Context&, const std::string&, size_t,
                        const ProviderVisitor&, TransportState& state) override {
        return state.Error(TransportError::ROUTING_FAILED, "router stuck");
    }
    bool close(TransportState& state) override {
        ++close_calls;
        return state.Error(TransportError::ROUTING_FAILED, "router stuck");
    }
    int close_calls = 0;
};

// Router that hands out fixed records
class FixedRouter : public ContentRouter {
public:
    explicit FixedRouter(std::vector<ProviderRecord> records) : records_(std::move(records)) {}
    bool provide(const util::Context&, const std::string&, TransportState&) override {
        return true;
    }
    bool find_providers(const util::Context&, const std::string&, size_t,
                        const ProviderVisitor& visitor, TransportState&) override {
        for (const auto& record : records_) {
            if (!visitor(record)) {
                break;
            }
        }
        return true;
    }
    bool close(TransportState&) override { return true; }

private:
    std::vector<ProviderRecord> records_;
};

Multiaddr Addr(const std::string& text) {
    auto addr = Multiaddr::parse(text);
    REQUIRE(addr.has_value());
    return *addr;
}

} // namespace

TEST_CASE("TorDht - constructor checks", "[dht][tordht]") {
    auto network = FakeNetwork::Create();
    DhtNode node("QmLocal", network);
    REQUIRE_THROWS_AS(TorDht(nullptr, node.router), std::invalid_argument);
    REQUIRE_THROWS_AS(TorDht(node.host, nullptr), std::invalid_argument);
}

TEST_CASE("TorDht - peer info from listen addresses", "[dht][tordht]") {
    auto network = FakeNetwork::Create();
    DhtNode node("QmLocal", network);
    TransportState state;

    SECTION("No listener leaves peer info empty") {
        REQUIRE(node.dht->apply_peer_info(state));
        REQUIRE_FALSE(node.dht->peer_info().has_value());
    }

    SECTION("One onion listener") {
        auto info = node.Listen();
        REQUIRE(info.id == "QmLocal");
        REQUIRE(info.onion_service_id == node.overlay->service()->service_id());
        REQUIRE(info.onion_port == 4001);
    }

    SECTION("Two onion listeners are ambiguous") {
        REQUIRE(node.host->listen(AddressCodec::listen_marker(), state));
        REQUIRE(node.host->listen(AddressCodec::listen_marker(), state));
        REQUIRE_FALSE(node.dht->apply_peer_info(state));
        REQUIRE(state.GetError() == TransportError::ADDRESS_FORMAT_INVALID);
        REQUIRE(state.GetReason() == "expected at most 1 listen onion address");
    }
}

TEST_CASE("TorDht - make_peer_info", "[dht][tordht]") {
    auto network = FakeNetwork::Create();
    DhtNode node("QmLocal", network);
    PeerInfo info;
    TransportState state;

    REQUIRE(node.dht->make_peer_info("QmRemote", Addr("/onion/abcdefghijklmnop:4001/ws"), info,
                                     state));
    REQUIRE(info.ToString() == "QmRemote@abcdefghijklmnop.onion:4001");

    REQUIRE_FALSE(node.dht->make_peer_info("QmRemote", Addr("/ip4/1.2.3.4/tcp/1"), info, state));
    REQUIRE(state.GetError() == TransportError::ADDRESS_FORMAT_INVALID);
}

TEST_CASE("TorDht - provide and find providers", "[dht][tordht]") {
    auto network = FakeNetwork::Create();
    DhtNode a("QmA", network);
    DhtNode b("QmB", network);
    DhtNode c("QmC", network);
    a.router->add_peer(b.router);
    a.router->add_peer(c.router);

    const auto b_info = b.Listen();
    const auto c_info = c.Listen();
    auto ctx = util::Context::WithTimeout(util::Context(), std::chrono::seconds(5));

    TransportState state;
    REQUIRE(b.dht->provide(ctx, "topic", state));
    REQUIRE(c.dht->provide(ctx, "topic", state));
    REQUIRE(c.dht->provide(ctx, "topic", state));
    REQUIRE(c.router->record_count("topic") == 1);

    SECTION("All providers") {
        std::vector<PeerInfo> found;
        REQUIRE(a.dht->find_providers(ctx, "topic", 0, found, state));
        const std::vector<PeerInfo> expected{b_info, c_info};
        REQUIRE(found == expected);
    }

    SECTION("Bounded lookup") {
        std::vector<PeerInfo> found;
        REQUIRE(a.dht->find_providers(ctx, "topic", 1, found, state));
        REQUIRE(found.size() == 1);
    }

    SECTION("Unknown key") {
        std::vector<PeerInfo> found;
        REQUIRE(a.dht->find_providers(ctx, "other", 0, found, state));
        REQUIRE(found.empty());
    }

    SECTION("Providers found can be connected") {
        std::vector<PeerInfo> found;
        REQUIRE(a.dht->find_providers(ctx, "topic", 0, found, state));
        auto result = a.dht->connect_peers(ctx, found, found.size(), state);
        REQUIRE(result.ok());
        REQUIRE(a.host->connection_count() == 2);
    }

    SECTION("Cancelled lookup") {
        auto cancelled = util::Context::WithCancel(util::Context());
        cancelled.Cancel();
        std::vector<PeerInfo> found;
        REQUIRE_FALSE(a.dht->find_providers(cancelled, "topic", 0, found, state));
        REQUIRE(state.GetError() == TransportError::CANCELLED);
    }
}

TEST_CASE("TorDht - providers with unusable addresses", "[dht][tordht]") {
    auto network = FakeNetwork::Create();
    auto transport = std::make_shared<OnionTransport>(std::make_shared<FakeOverlay>(network),
                                                      std::make_shared<ScriptedUpgrader>());
    auto host = std::make_shared<Host>("QmLocal", transport);
    TransportState state;
    std::vector<PeerInfo> found;

    SECTION("Non-onion first address") {
        TorDht dht(host, std::make_shared<FixedRouter>(std::vector<ProviderRecord>{
                             {"QmGood", {Addr("/onion/abcdefghijklmnop:1")}},
                             {"QmBad", {Addr("/ip4/1.2.3.4/tcp/1")}}}));
        REQUIRE_FALSE(dht.find_providers(util::Context(), "topic", 0, found, state));
        REQUIRE(state.GetError() == TransportError::ADDRESS_FORMAT_INVALID);
        REQUIRE(state.GetReason() == "failed parsing provider QmBad at /ip4/1.2.3.4/tcp/1");
    }

    SECTION("No addresses") {
        TorDht dht(host, std::make_shared<FixedRouter>(std::vector<ProviderRecord>{{"QmEmpty", {}}}));
        REQUIRE_FALSE(dht.find_providers(util::Context(), "topic", 0, found, state));
        REQUIRE(state.GetReason() == "failed parsing provider QmEmpty");
    }

    REQUIRE(found.empty());
}

TEST_CASE("TorDht - connect_peers end to end", "[dht][tordht]") {
    auto network = FakeNetwork::Create();
    DhtNode a("QmA", network);
    DhtNode b("QmB", network);
    DhtNode c("QmC", network);
    const auto b_info = b.Listen();
    const auto c_info = c.Listen();

    PeerInfo gone;
    gone.id = "QmGone";
    gone.onion_service_id = MakeServiceId(4000);
    gone.onion_port = 4001;

    auto ctx = util::Context::WithTimeout(util::Context(), std::chrono::seconds(5));
    TransportState state;

    SECTION("Quorum reached despite an unreachable peer") {
        auto result = a.dht->connect_peers(ctx, {b_info, gone, c_info}, 2, state);
        REQUIRE(result.ok());
        REQUIRE(result.succeeded == 2);
        REQUIRE(a.host->connection("QmB"));
        REQUIRE(a.host->connection("QmC"));
    }

    SECTION("Quorum unreachable") {
        auto result = a.dht->connect_peers(ctx, {b_info, gone, c_info}, 3, state);
        REQUIRE(result.outcome == QuorumOutcome::FAILED);
        REQUIRE(state.GetError() == TransportError::QUORUM_UNREACHABLE);
        REQUIRE(state.GetDebugMessage().find("peer QmGone") != std::string::npos);
    }

    SECTION("Identity mismatch counts as a failure") {
        PeerInfo impostor = b_info;
        impostor.id = "QmImpostor";
        auto result = a.dht->connect_peers(ctx, {impostor}, 1, state);
        REQUIRE(result.outcome == QuorumOutcome::FAILED);
        REQUIRE(result.failures[0].state.GetError() == TransportError::UPGRADE_FAILED);
    }
}

TEST_CASE("TorDht - connect_peer validation", "[dht][tordht]") {
    auto network = FakeNetwork::Create();
    DhtNode node("QmLocal", network);
    TransportState state;

    SECTION("Empty id") {
        PeerInfo peer;
        peer.onion_service_id = "abcdefghijklmnop";
        peer.onion_port = 1;
        REQUIRE_FALSE(node.dht->connect_peer(util::Context(), peer, state));
        REQUIRE(state.GetError() == TransportError::ADDRESS_FORMAT_INVALID);
    }

    SECTION("Invalid identity never reaches the peer store") {
        PeerInfo peer;
        peer.id = "QmRemote";
        peer.onion_service_id = "not-base32";
        peer.onion_port = 1;
        REQUIRE_FALSE(node.dht->connect_peer(util::Context(), peer, state));
        REQUIRE(state.GetError() == TransportError::ADDRESS_FORMAT_INVALID);
        REQUIRE_FALSE(node.host->peerstore().contains("QmRemote"));
    }

    REQUIRE(node.overlay->open_calls() == 0);
}

TEST_CASE("TorDht - websocket addresses", "[dht][tordht]") {
    auto network = FakeNetwork::Create();
    auto options = DhtNode::FastOptions();
    options.websocket = true;
    DhtNode node("QmLocal", network, options);

    PeerInfo peer;
    peer.id = "QmRemote";
    peer.onion_service_id = MakeServiceId(77);
    peer.onion_port = 4001;
    TransportState state;
    REQUIRE_FALSE(node.dht->connect_peer(util::Context(), peer, state));

    const auto addrs = node.host->peerstore().addrs("QmRemote");
    REQUIRE(addrs.size() == 1);
    REQUIRE(addrs[0].to_string() == "/onion3/" + MakeServiceId(77) + ":4001/ws");
}

TEST_CASE("TorDht - close", "[dht][tordht]") {
    auto network = FakeNetwork::Create();

    SECTION("Closes router and host once") {
        DhtNode node("QmLocal", network);
        node.Listen();
        TransportState state;
        REQUIRE(node.dht->close(state));
        REQUIRE(node.dht->close(state));
        REQUIRE(node.router->is_closed());
        REQUIRE(node.host->is_closed());
        REQUIRE(node.overlay->service()->is_closed());

        TransportState provide_state;
        REQUIRE_FALSE(node.dht->provide(util::Context(), "topic", provide_state));
        REQUIRE(provide_state.GetReason() == "dht closed");

        std::vector<PeerInfo> found;
        TransportState find_state;
        REQUIRE_FALSE(node.dht->find_providers(util::Context(), "topic", 0, found, find_state));
        REQUIRE(find_state.GetError() == TransportError::ROUTING_FAILED);

        TransportState connect_state;
        auto result = node.dht->connect_peers(util::Context(), {}, 0, connect_state);
        REQUIRE_FALSE(result.ok());
        REQUIRE(connect_state.GetError() == TransportError::DIAL_FAILED);
    }

    SECTION("Router error is reported when the host closes cleanly") {
        auto transport = std::make_shared<OnionTransport>(std::make_shared<FakeOverlay>(network),
                                                          std::make_shared<ScriptedUpgrader>());
        auto host = std::make_shared<Host>("QmLocal", transport);
        auto router = std::make_shared<StuckRouter>();
        TorDht dht(host, router);

        TransportState state;
        REQUIRE_FALSE(dht.close(state));
        REQUIRE(state.GetError() == TransportError::ROUTING_FAILED);
        REQUIRE(host->is_closed());
        REQUIRE(dht.close(state));
        REQUIRE(router->close_calls == 1);
    }

    SECTION("Host error wins when both fail") {
        auto overlay = std::make_shared<FakeOverlay>(network);
        overlay->service_close_error = make_error_code(overlay_errc::protocol_error);
        auto transport =
            std::make_shared<OnionTransport>(overlay, std::make_shared<ScriptedUpgrader>());
        auto host = std::make_shared<Host>("QmLocal", transport);
        TorDht dht(host, std::make_shared<StuckRouter>());

        TransportState listen_state;
        REQUIRE(host->listen(AddressCodec::listen_marker(), listen_state));

        TransportState state;
        REQUIRE_FALSE(dht.close(state));
        REQUIRE(state.GetError() == TransportError::LISTENER_CLOSED);
    }
}
