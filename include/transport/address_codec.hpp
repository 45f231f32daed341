// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/multiaddr.hpp"
#include "transport/transport_state.hpp"
#include <cstdint>
#include <string>

namespace torlink {
namespace transport {

// Onion service identity plus virtual port
struct OnionEndpoint {
  std::string service_id;
  uint16_t port = 0;

  bool operator==(const OnionEndpoint &other) const {
    return service_id == other.service_id && port == other.port;
  }
  bool operator!=(const OnionEndpoint &other) const { return !(*this == other); }
};

/**
 * AddressCodec - translation between multiaddrs and onion endpoints
 *
 * Dialable address shape (nothing else is accepted):
 *
 *   /onion/<16 base32>:<port>[/ws]
 *   /onion3/<56 base32>:<port>[/ws]
 *
 * Display form handed to the overlay: "<service_id>.onion:<port>", with an
 * optional "/ws" suffix when websocket framing is in use.
 *
 * The codec is a plain value; each transport owns its own copy.
 */
class AddressCodec {
public:
  static constexpr const char *DEFAULT_SUFFIX = "onion";
  static constexpr const char *FRAMED_SUFFIX = "/ws";

  explicit AddressCodec(std::string suffix = DEFAULT_SUFFIX);

  /**
   * Extract the onion endpoint of a dialable multiaddr
   * Fails with ADDRESS_FORMAT_INVALID on any other shape.
   */
  bool decode(const Multiaddr &addr, OnionEndpoint &out,
              TransportState &state) const;

  /**
   * Parse the display form "<id>.onion:<port>[/ws]"
   * @param framed Set to true when the "/ws" suffix is present
   */
  bool decode_host_port(const std::string &text, OnionEndpoint &out,
                        bool &framed, TransportState &state) const;

  // "<service_id>.<suffix>:<port>"
  std::string encode(const std::string &service_id, uint16_t port) const;
  std::string encode(const OnionEndpoint &endpoint) const {
    return encode(endpoint.service_id, endpoint.port);
  }

  // encode() + "/ws"
  std::string encode_framed(const std::string &service_id,
                            uint16_t port) const;

  // /onion or /onion3 chosen from the identity length
  Multiaddr to_multiaddr(const std::string &service_id, uint16_t port,
                         bool framed) const;

  // True iff `addr` is exactly the value-less /onionListen marker
  bool is_listen_marker(const Multiaddr &addr) const;

  static Multiaddr listen_marker();

  const std::string &suffix() const { return suffix_; }

private:
  bool valid_service_id(const std::string &id) const;

  std::string suffix_;
};

} // namespace transport
} // namespace torlink
