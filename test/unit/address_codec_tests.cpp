// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "transport/address_codec.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace torlink::transport;

namespace {

const std::string V2_ID = "abcdefghijklmnop";
const std::string V3_ID = "pg6mmjiyjmcrsslvykfwnntlaru7p5svn6y2ymmju6nubxndf4pscryd";

Multiaddr Parse(const std::string& text) {
    auto addr = Multiaddr::parse(text);
    REQUIRE(addr.has_value());
    return *addr;
}

} // namespace

TEST_CASE("AddressCodec - display form round trip", "[transport][codec]") {
    AddressCodec codec;
    OnionEndpoint endpoint;
    bool framed = true;
    TransportState state;

    REQUIRE(codec.decode_host_port("abcdefghijklmnop.onion:4001", endpoint, framed, state));
    REQUIRE(endpoint.service_id == "abcdefghijklmnop");
    REQUIRE(endpoint.port == 4001);
    REQUIRE_FALSE(framed);
    REQUIRE(codec.encode(endpoint.service_id, endpoint.port) == "abcdefghijklmnop.onion:4001");
    REQUIRE(codec.encode(endpoint) == "abcdefghijklmnop.onion:4001");
}

TEST_CASE("AddressCodec - framed display form", "[transport][codec]") {
    AddressCodec codec;
    OnionEndpoint endpoint;
    bool framed = false;
    TransportState state;

    REQUIRE(codec.decode_host_port(V3_ID + ".onion:80/ws", endpoint, framed, state));
    REQUIRE(framed);
    REQUIRE(endpoint.service_id == V3_ID);
    REQUIRE(codec.encode_framed(V3_ID, 80) == V3_ID + ".onion:80/ws");
}

TEST_CASE("AddressCodec - display form failures", "[transport][codec]") {
    AddressCodec codec;
    OnionEndpoint endpoint;
    bool framed = false;

    for (const std::string& text : {std::string("abcdefghijklmnop.onion"),
                                    std::string("abcdefghijklmnop.onion:0"),
                                    std::string("abcdefghijklmnop.com:80"),
                                    std::string(".onion:80"),
                                    std::string("abcdefghijklmno.onion:80"),
                                    std::string("ABCDEFGHIJKLMNOP.onion:80")}) {
        TransportState state;
        INFO(text);
        REQUIRE_FALSE(codec.decode_host_port(text, endpoint, framed, state));
        REQUIRE(state.GetError() == TransportError::ADDRESS_FORMAT_INVALID);
    }
}

TEST_CASE("AddressCodec - decode multiaddr", "[transport][codec]") {
    AddressCodec codec;
    OnionEndpoint endpoint;
    TransportState state;

    SECTION("onion") {
        REQUIRE(codec.decode(Parse("/onion/" + V2_ID + ":4001"), endpoint, state));
        REQUIRE(endpoint == (OnionEndpoint{V2_ID, 4001}));
    }

    SECTION("onion3 with ws") {
        REQUIRE(codec.decode(Parse("/onion3/" + V3_ID + ":443/ws"), endpoint, state));
        REQUIRE(endpoint == (OnionEndpoint{V3_ID, 443}));
    }
}

TEST_CASE("AddressCodec - decode rejects other shapes", "[transport][codec]") {
    AddressCodec codec;
    OnionEndpoint endpoint;

    auto expect_invalid = [&](const Multiaddr& addr) {
        TransportState state;
        INFO(addr.to_string());
        REQUIRE_FALSE(codec.decode(addr, endpoint, state));
        REQUIRE(state.GetError() == TransportError::ADDRESS_FORMAT_INVALID);
        return state;
    };

    SECTION("Non-onion addresses") {
        expect_invalid(Parse("/ip4/127.0.0.1/tcp/4001"));
        expect_invalid(Multiaddr());
    }

    SECTION("Missing port") {
        expect_invalid(Multiaddr({{Protocol::ONION, V2_ID}}));
    }

    SECTION("Unvalidated component values are checked again") {
        expect_invalid(Multiaddr({{Protocol::ONION, "short:80"}}));
        expect_invalid(Multiaddr({{Protocol::ONION3, V2_ID + ":80"}}));
        expect_invalid(Multiaddr({{Protocol::ONION, V2_ID + ":99999"}}));
    }

    SECTION("Extra or conflicting segments") {
        expect_invalid(Parse("/onion/" + V2_ID + ":4001/p2p/QmPeer"));
        expect_invalid(Parse("/onion/" + V2_ID + ":4001/ws/ws"));
        expect_invalid(Parse("/onion/" + V2_ID + ":4001/onion3/" + V3_ID + ":80"));
        expect_invalid(Multiaddr({{Protocol::ONION, V2_ID + ":4001"}, {Protocol::WS, "x"}}));
    }

    SECTION("Listen marker, with or without value") {
        auto state = expect_invalid(AddressCodec::listen_marker());
        REQUIRE(state.GetReason() == "listen marker is not dialable");
        expect_invalid(Multiaddr({{Protocol::ONION_LISTEN, "x"}}));
    }
}

TEST_CASE("AddressCodec - to_multiaddr", "[transport][codec]") {
    AddressCodec codec;

    REQUIRE(codec.to_multiaddr(V2_ID, 4001, false).to_string() == "/onion/" + V2_ID + ":4001");
    REQUIRE(codec.to_multiaddr(V3_ID, 80, true).to_string() == "/onion3/" + V3_ID + ":80/ws");

    // Whatever to_multiaddr builds decodes back to the same endpoint
    OnionEndpoint endpoint;
    TransportState state;
    REQUIRE(codec.decode(codec.to_multiaddr(V3_ID, 80, true), endpoint, state));
    REQUIRE(endpoint == (OnionEndpoint{V3_ID, 80}));
}

TEST_CASE("AddressCodec - listen marker", "[transport][codec]") {
    AddressCodec codec;

    REQUIRE(codec.is_listen_marker(AddressCodec::listen_marker()));
    REQUIRE(codec.is_listen_marker(Parse("/onionListen")));
    REQUIRE_FALSE(codec.is_listen_marker(Multiaddr({{Protocol::ONION_LISTEN, "x"}})));
    REQUIRE_FALSE(codec.is_listen_marker(Parse("/onionListen/ws")));
    REQUIRE_FALSE(codec.is_listen_marker(Parse("/onion/" + V2_ID + ":4001")));
}

TEST_CASE("AddressCodec - custom suffix", "[transport][codec]") {
    AddressCodec codec("exit");
    REQUIRE(codec.suffix() == "exit");
    REQUIRE(codec.encode(V2_ID, 1) == V2_ID + ".exit:1");

    OnionEndpoint endpoint;
    bool framed = false;
    TransportState state;
    REQUIRE_FALSE(codec.decode_host_port(V2_ID + ".onion:1", endpoint, framed, state));
}
