// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "tor/control_connection.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace torlink::tor;

TEST_CASE("SplitTorReplyLine", "[tor][control]") {
    auto [type, rest] = SplitTorReplyLine("AUTH METHODS=NULL");
    REQUIRE(type == "AUTH");
    REQUIRE(rest == "METHODS=NULL");

    auto only_type = SplitTorReplyLine("OK");
    REQUIRE(only_type.first == "OK");
    REQUIRE(only_type.second.empty());

    auto spaces = SplitTorReplyLine("VERSION Tor=\"0.4.8.9\" extra");
    REQUIRE(spaces.first == "VERSION");
    REQUIRE(spaces.second == "Tor=\"0.4.8.9\" extra");
}

TEST_CASE("ParseTorReplyMapping", "[tor][control]") {
    SECTION("Unquoted values") {
        auto m = ParseTorReplyMapping("METHODS=COOKIE,SAFECOOKIE,HASHEDPASSWORD");
        REQUIRE(m.size() == 1);
        REQUIRE(m["METHODS"] == "COOKIE,SAFECOOKIE,HASHEDPASSWORD");
    }

    SECTION("Quoted values") {
        auto m = ParseTorReplyMapping(
            "METHODS=COOKIE COOKIEFILE=\"/home/x/.tor/control_auth_cookie\"");
        REQUIRE(m.size() == 2);
        REQUIRE(m["COOKIEFILE"] == "/home/x/.tor/control_auth_cookie");
    }

    SECTION("Escapes are kept") {
        auto m = ParseTorReplyMapping("Tor=\"a\\\"b\"");
        REQUIRE(m["Tor"] == "a\\\"b");
    }

    SECTION("Values may contain '='") {
        auto m = ParseTorReplyMapping("ServiceID=abc PrivateKey=ED25519-V3:base64==");
        REQUIRE(m["ServiceID"] == "abc");
        REQUIRE(m["PrivateKey"] == "ED25519-V3:base64==");
    }

    SECTION("Syntax errors give an empty map") {
        REQUIRE(ParseTorReplyMapping("NOEQUALS").empty());
        REQUIRE(ParseTorReplyMapping("A=1 B").empty());
        REQUIRE(ParseTorReplyMapping("A=\"unterminated").empty());
    }

    SECTION("Empty input") {
        REQUIRE(ParseTorReplyMapping("").empty());
    }
}

TEST_CASE("QuoteTorString", "[tor][control]") {
    REQUIRE(QuoteTorString("secret") == "\"secret\"");
    REQUIRE(QuoteTorString("a\"b") == "\"a\\\"b\"");
    REQUIRE(QuoteTorString("c:\\tor") == "\"c:\\\\tor\"");
    REQUIRE(QuoteTorString("") == "\"\"");
}

TEST_CASE("ParseBootstrapProgress", "[tor][control]") {
    REQUIRE(ParseBootstrapProgress(
                "NOTICE BOOTSTRAP PROGRESS=100 TAG=done SUMMARY=\"Done\"") == 100);
    REQUIRE(ParseBootstrapProgress("NOTICE BOOTSTRAP PROGRESS=5 TAG=conn") == 5);
    REQUIRE_FALSE(ParseBootstrapProgress("NOTICE BOOTSTRAP TAG=starting").has_value());
    REQUIRE_FALSE(ParseBootstrapProgress("NOTICE BOOTSTRAP PROGRESS=abc").has_value());
    REQUIRE_FALSE(ParseBootstrapProgress("NOTICE BOOTSTRAP PROGRESS=101").has_value());
}
