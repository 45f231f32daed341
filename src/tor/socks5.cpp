// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "tor/socks5.hpp"
#include "transport/overlay.hpp"
#include "util/logging.hpp"
#include <vector>

namespace torlink {
namespace tor {

using transport::make_error_code;
using transport::overlay_errc;

std::string Socks5ReplyString(uint8_t reply) {
  switch (reply) {
  case 0x00:
    return "succeeded";
  case 0x01:
    return "general failure";
  case 0x02:
    return "connection not allowed";
  case 0x03:
    return "network unreachable";
  case 0x04:
    return "host unreachable";
  case 0x05:
    return "connection refused";
  case 0x06:
    return "TTL expired";
  case 0x07:
    return "protocol error";
  case 0x08:
    return "address type not supported";
  case 0xF0:
    return "onion service descriptor can not be found";
  case 0xF1:
    return "onion service descriptor is invalid";
  case 0xF2:
    return "onion service introduction failed";
  case 0xF3:
    return "onion service rendezvous failed";
  case 0xF4:
    return "onion service missing client authorization";
  case 0xF5:
    return "onion service wrong client authorization";
  case 0xF6:
    return "onion service invalid address";
  case 0xF7:
    return "onion service introduction timed out";
  default:
    return "unknown reply " + std::to_string(reply);
  }
}

namespace {

overlay_errc ReplyToErrc(uint8_t reply) {
  switch (reply) {
  case 0x04:
  case 0xF0:
  case 0xF2:
  case 0xF3:
    return overlay_errc::host_unreachable;
  case 0x05:
    return overlay_errc::connection_refused;
  case 0x06:
  case 0xF7:
    return overlay_errc::timed_out;
  case 0xF4:
  case 0xF5:
    return overlay_errc::authentication_failed;
  default:
    return overlay_errc::protocol_error;
  }
}

} // namespace

bool Socks5Connect(transport::RawConnection &conn, const util::Context &ctx,
                   const std::string &host, uint16_t port,
                   boost::system::error_code &ec) {
  if (host.empty() || host.size() > 255) {
    ec = make_error_code(overlay_errc::protocol_error);
    return false;
  }

  // Method negotiation
  const uint8_t greeting[] = {socks5::VERSION, 0x01, socks5::METHOD_NO_AUTH};
  conn.write_all(ctx, greeting, sizeof(greeting), ec);
  if (ec) {
    return false;
  }
  uint8_t method[2];
  if (!transport::ReadExact(conn, ctx, method, sizeof(method), ec)) {
    return false;
  }
  if (method[0] != socks5::VERSION) {
    LOG_TOR_DEBUG("proxy answered with SOCKS version {}", method[0]);
    ec = make_error_code(overlay_errc::protocol_error);
    return false;
  }
  if (method[1] != socks5::METHOD_NO_AUTH) {
    LOG_TOR_DEBUG("proxy rejected no-auth method ({:#x})", method[1]);
    ec = make_error_code(overlay_errc::authentication_failed);
    return false;
  }

  // CONNECT request
  std::vector<uint8_t> request;
  request.reserve(7 + host.size());
  request.push_back(socks5::VERSION);
  request.push_back(socks5::CMD_CONNECT);
  request.push_back(0x00);
  request.push_back(socks5::ATYP_DOMAINNAME);
  request.push_back(static_cast<uint8_t>(host.size()));
  request.insert(request.end(), host.begin(), host.end());
  request.push_back(static_cast<uint8_t>(port >> 8));
  request.push_back(static_cast<uint8_t>(port & 0xff));
  conn.write_all(ctx, request.data(), request.size(), ec);
  if (ec) {
    return false;
  }

  uint8_t reply[4];
  if (!transport::ReadExact(conn, ctx, reply, sizeof(reply), ec)) {
    return false;
  }
  if (reply[0] != socks5::VERSION || reply[2] != 0x00) {
    ec = make_error_code(overlay_errc::protocol_error);
    return false;
  }
  if (reply[1] != socks5::REPLY_SUCCEEDED) {
    LOG_TOR_DEBUG("SOCKS5 connect to {}:{} failed: {}", host, port,
                  Socks5ReplyString(reply[1]));
    ec = make_error_code(ReplyToErrc(reply[1]));
    return false;
  }

  // Skip the bound address
  size_t skip = 0;
  switch (reply[3]) {
  case socks5::ATYP_IPV4:
    skip = 4;
    break;
  case socks5::ATYP_IPV6:
    skip = 16;
    break;
  case socks5::ATYP_DOMAINNAME: {
    uint8_t length = 0;
    if (!transport::ReadExact(conn, ctx, &length, 1, ec)) {
      return false;
    }
    skip = length;
    break;
  }
  default:
    ec = make_error_code(overlay_errc::protocol_error);
    return false;
  }
  std::vector<uint8_t> bound(skip + 2);
  if (!transport::ReadExact(conn, ctx, bound.data(), bound.size(), ec)) {
    return false;
  }
  ec.clear();
  return true;
}

} // namespace tor
} // namespace torlink
