// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "transport/plaintext_upgrader.hpp"
#include "transport/infra/fake_overlay.hpp"
#include <catch2/catch_test_macros.hpp>
#include <future>
#include <stdexcept>

using namespace torlink;
using namespace torlink::transport;
using namespace torlink::test;

namespace {

MultiaddrConnectionPtr Wrap(RawConnectionPtr raw, Direction direction) {
    auto local = *Multiaddr::parse("/ip4/127.0.0.1/tcp/1");
    auto remote = *Multiaddr::parse("/ip4/127.0.0.1/tcp/2");
    return std::make_shared<MultiaddrConnection>(std::move(raw), local, remote, direction);
}

} // namespace

TEST_CASE("PlaintextUpgrader - rejects invalid local ids", "[transport][upgrader]") {
    REQUIRE_THROWS_AS(PlaintextUpgrader(""), std::invalid_argument);
    REQUIRE_THROWS_AS(PlaintextUpgrader(std::string(257, 'x')), std::invalid_argument);
    REQUIRE_NOTHROW(PlaintextUpgrader("QmLocal"));
}

TEST_CASE("PlaintextUpgrader - outbound and inbound agree", "[transport][upgrader]") {
    auto pipe = MakePipe();
    auto client = pipe.first;
    auto server = pipe.second;
    PlaintextUpgrader dialer("QmDialer");
    PlaintextUpgrader acceptor("QmAcceptor");
    auto ctx = util::Context::WithTimeout(util::Context(), std::chrono::seconds(5));

    auto inbound = std::async(std::launch::async, [&] {
        TransportState state;
        return acceptor.upgrade_inbound(ctx, Wrap(server, Direction::INBOUND), state);
    });

    TransportState state;
    auto outbound = dialer.upgrade_outbound(ctx, Wrap(client, Direction::OUTBOUND), "QmAcceptor",
                                            state);
    REQUIRE(outbound);
    REQUIRE(state.IsValid());
    REQUIRE(outbound->local_peer() == "QmDialer");
    REQUIRE(outbound->remote_peer() == "QmAcceptor");
    REQUIRE(outbound->direction() == Direction::OUTBOUND);

    auto accepted = inbound.get();
    REQUIRE(accepted);
    REQUIRE(accepted->remote_peer() == "QmDialer");
    REQUIRE(accepted->direction() == Direction::INBOUND);

    SECTION("Payload flows after the hello") {
        const uint8_t payload[] = {1, 2, 3};
        boost::system::error_code ec;
        outbound->write_all(ctx, payload, sizeof(payload), ec);
        REQUIRE_FALSE(ec);
        uint8_t got[3];
        size_t n = 0;
        while (n < sizeof(got) && !ec) {
            n += accepted->read_some(ctx, got + n, sizeof(got) - n, ec);
        }
        REQUIRE_FALSE(ec);
        REQUIRE(got[2] == 3);
    }

    SECTION("Close is idempotent and closes the stream") {
        outbound->close();
        outbound->close();
        REQUIRE(outbound->is_closed());
        REQUIRE_FALSE(client->is_open());
    }
}

TEST_CASE("PlaintextUpgrader - peer id mismatch", "[transport][upgrader]") {
    auto pipe = MakePipe();
    auto client = pipe.first;
    auto server = pipe.second;
    PlaintextUpgrader dialer("QmDialer");
    PlaintextUpgrader acceptor("QmSomeoneElse");
    auto ctx = util::Context::WithTimeout(util::Context(), std::chrono::seconds(5));

    auto inbound = std::async(std::launch::async, [&] {
        TransportState state;
        return acceptor.upgrade_inbound(ctx, Wrap(server, Direction::INBOUND), state);
    });

    TransportState state;
    auto outbound = dialer.upgrade_outbound(ctx, Wrap(client, Direction::OUTBOUND), "QmExpected",
                                            state);
    REQUIRE_FALSE(outbound);
    REQUIRE(state.GetError() == TransportError::UPGRADE_FAILED);
    REQUIRE(state.GetReason() == "peer id mismatch");
    inbound.get();
}

TEST_CASE("PlaintextUpgrader - malformed hello", "[transport][upgrader]") {
    auto [client, server] = MakePipe();
    PlaintextUpgrader acceptor("QmAcceptor");
    auto ctx = util::Context::WithTimeout(util::Context(), std::chrono::seconds(5));
    boost::system::error_code ec;
    TransportState state;

    SECTION("Unknown version") {
        const uint8_t hello[] = {0x02, 0x00, 0x01, 'x'};
        client->write_all(ctx, hello, sizeof(hello), ec);
        REQUIRE_FALSE(acceptor.upgrade_inbound(ctx, Wrap(server, Direction::INBOUND), state));
        REQUIRE(state.GetReason() == "unsupported hello version");
    }

    SECTION("Zero length id") {
        const uint8_t hello[] = {0x01, 0x00, 0x00};
        client->write_all(ctx, hello, sizeof(hello), ec);
        REQUIRE_FALSE(acceptor.upgrade_inbound(ctx, Wrap(server, Direction::INBOUND), state));
        REQUIRE(state.GetReason() == "invalid peer id length");
    }

    SECTION("Truncated id") {
        const uint8_t hello[] = {0x01, 0x00, 0x08, 'a', 'b'};
        client->write_all(ctx, hello, sizeof(hello), ec);
        client->close();
        REQUIRE_FALSE(acceptor.upgrade_inbound(ctx, Wrap(server, Direction::INBOUND), state));
    }

    SECTION("Silent peer times out") {
        auto short_ctx = util::Context::WithTimeout(ctx, std::chrono::milliseconds(30));
        REQUIRE_FALSE(
            acceptor.upgrade_inbound(short_ctx, Wrap(server, Direction::INBOUND), state));
        REQUIRE(state.GetReason() == "reading hello failed");
    }

    REQUIRE(state.GetError() == TransportError::UPGRADE_FAILED);
}
