// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "tor/socks5.hpp"
#include "transport/infra/fake_overlay.hpp"
#include <catch2/catch_test_macros.hpp>
#include <vector>

using namespace torlink;
using namespace torlink::tor;
using namespace torlink::test;
using transport::make_error_code;

namespace {

void Script(PipeConnection& server, const std::vector<uint8_t>& bytes) {
    boost::system::error_code ec;
    server.write_all(util::Context(), bytes.data(), bytes.size(), ec);
    REQUIRE_FALSE(ec);
}

std::vector<uint8_t> Received(PipeConnection& server) {
    std::vector<uint8_t> out(server.pending());
    boost::system::error_code ec;
    REQUIRE(transport::ReadExact(server, util::Context(), out.data(), out.size(), ec));
    return out;
}

const std::vector<uint8_t> METHOD_OK = {0x05, 0x00};

std::vector<uint8_t> ConnectReply(uint8_t code) {
    return {0x05, code, 0x00, 0x01, 0, 0, 0, 0, 0, 0};
}

} // namespace

TEST_CASE("Socks5Connect - success", "[tor][socks5]") {
    auto [client, server] = MakePipe();
    const std::string host = "abcdefghijklmnop.onion";

    SECTION("IPv4 bound address") {
        Script(*server, METHOD_OK);
        Script(*server, ConnectReply(0x00));
    }

    SECTION("Domain bound address") {
        Script(*server, METHOD_OK);
        Script(*server, {0x05, 0x00, 0x00, 0x03, 3, 'a', 'b', 'c', 0x1f, 0x90});
    }

    SECTION("IPv6 bound address") {
        Script(*server, METHOD_OK);
        std::vector<uint8_t> reply = {0x05, 0x00, 0x00, 0x04};
        reply.resize(4 + 16 + 2, 0);
        Script(*server, reply);
    }

    // Application bytes after the reply stay in the stream
    Script(*server, {'h', 'i'});

    boost::system::error_code ec;
    REQUIRE(Socks5Connect(*client, util::Context(), host, 4001, ec));
    REQUIRE_FALSE(ec);

    std::vector<uint8_t> expected = {0x05, 0x01, 0x00, 0x05, 0x01, 0x00, 0x03,
                                     static_cast<uint8_t>(host.size())};
    expected.insert(expected.end(), host.begin(), host.end());
    expected.push_back(4001 >> 8);
    expected.push_back(4001 & 0xff);
    REQUIRE(Received(*server) == expected);

    uint8_t rest[2];
    REQUIRE(transport::ReadExact(*client, util::Context(), rest, sizeof(rest), ec));
    REQUIRE(rest[0] == 'h');
    REQUIRE(rest[1] == 'i');
}

TEST_CASE("Socks5Connect - reply codes map to overlay errors", "[tor][socks5]") {
    struct Case {
        uint8_t reply;
        transport::overlay_errc expected;
    };
    const std::vector<Case> cases = {
        {0x01, transport::overlay_errc::protocol_error},
        {0x04, transport::overlay_errc::host_unreachable},
        {0x05, transport::overlay_errc::connection_refused},
        {0x06, transport::overlay_errc::timed_out},
        {0xF0, transport::overlay_errc::host_unreachable},
        {0xF2, transport::overlay_errc::host_unreachable},
        {0xF4, transport::overlay_errc::authentication_failed},
        {0xF7, transport::overlay_errc::timed_out},
    };

    for (const auto& c : cases) {
        auto [client, server] = MakePipe();
        Script(*server, METHOD_OK);
        Script(*server, ConnectReply(c.reply));

        boost::system::error_code ec;
        INFO(Socks5ReplyString(c.reply));
        REQUIRE_FALSE(Socks5Connect(*client, util::Context(), "abcdefghijklmnop.onion", 80, ec));
        REQUIRE(ec == make_error_code(c.expected));
    }
}

TEST_CASE("Socks5Connect - negotiation failures", "[tor][socks5]") {
    auto [client, server] = MakePipe();
    boost::system::error_code ec;

    SECTION("Method rejected") {
        Script(*server, {0x05, 0xFF});
        REQUIRE_FALSE(Socks5Connect(*client, util::Context(), "x.onion", 80, ec));
        REQUIRE(ec == make_error_code(transport::overlay_errc::authentication_failed));
    }

    SECTION("Wrong version") {
        Script(*server, {0x04, 0x00});
        REQUIRE_FALSE(Socks5Connect(*client, util::Context(), "x.onion", 80, ec));
        REQUIRE(ec == make_error_code(transport::overlay_errc::protocol_error));
    }

    SECTION("Unknown bound address type") {
        Script(*server, METHOD_OK);
        Script(*server, {0x05, 0x00, 0x00, 0x09});
        REQUIRE_FALSE(Socks5Connect(*client, util::Context(), "x.onion", 80, ec));
        REQUIRE(ec == make_error_code(transport::overlay_errc::protocol_error));
    }

    SECTION("Host name too long") {
        REQUIRE_FALSE(Socks5Connect(*client, util::Context(), std::string(256, 'a'), 80, ec));
        REQUIRE(ec == make_error_code(transport::overlay_errc::protocol_error));
        REQUIRE(server->pending() == 0);
    }

    SECTION("Proxy hangs up") {
        server->close();
        REQUIRE_FALSE(Socks5Connect(*client, util::Context(), "x.onion", 80, ec));
        REQUIRE(ec == make_error_code(transport::overlay_errc::session_closed));
    }

    SECTION("Deadline") {
        auto ctx = util::Context::WithTimeout(util::Context(), std::chrono::milliseconds(20));
        REQUIRE_FALSE(Socks5Connect(*client, ctx, "x.onion", 80, ec));
        REQUIRE(ec == make_error_code(transport::overlay_errc::timed_out));
    }
}

TEST_CASE("Socks5ReplyString", "[tor][socks5]") {
    REQUIRE(Socks5ReplyString(0x00) == "succeeded");
    REQUIRE(Socks5ReplyString(0xF6) == "onion service invalid address");
    REQUIRE(Socks5ReplyString(0x42) == "unknown reply 66");
}
