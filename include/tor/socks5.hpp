// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/transport.hpp"
#include "util/context.hpp"
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <string>

namespace torlink {
namespace tor {

namespace socks5 {
constexpr uint8_t VERSION = 0x05;
constexpr uint8_t METHOD_NO_AUTH = 0x00;
constexpr uint8_t METHOD_NONE_ACCEPTABLE = 0xFF;
constexpr uint8_t CMD_CONNECT = 0x01;
constexpr uint8_t ATYP_IPV4 = 0x01;
constexpr uint8_t ATYP_DOMAINNAME = 0x03;
constexpr uint8_t ATYP_IPV6 = 0x04;
constexpr uint8_t REPLY_SUCCEEDED = 0x00;
} // namespace socks5

// Human readable SOCKS5 reply, including Tor's onion service extensions
// (0xF0-0xF7)
std::string Socks5ReplyString(uint8_t reply);

/**
 * Run a SOCKS5 CONNECT by domain name over an open stream (RFC 1928)
 *
 * Only the no-authentication method is offered; Tor does not need more on
 * its local SOCKS port. On return the stream carries the proxied connection.
 *
 * Errors map onto overlay_errc: connection_refused, host_unreachable,
 * timed_out (TTL / intro timeout), authentication_failed (method rejected),
 * protocol_error (anything malformed).
 */
bool Socks5Connect(transport::RawConnection &conn, const util::Context &ctx,
                   const std::string &host, uint16_t port,
                   boost::system::error_code &ec);

} // namespace tor
} // namespace torlink
