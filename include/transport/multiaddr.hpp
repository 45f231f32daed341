// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

/*
 Multiaddr - protocol-tagged structured network address

 Text form is a sequence of "/<protocol>[/<value>]" segments, e.g.

   /ip4/127.0.0.1/tcp/9050
   /onion/abcdefghijklmnop:4001/ws
   /onion3/<56 base32 chars>:4001/p2p/QmPeer
   /onionListen

 Only the text form is supported. Protocol codes follow the multiaddr table
 so that protocol sets can be compared with other stacks; onionListen uses a
 private code.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace torlink {
namespace transport {

enum class Protocol : uint32_t {
  IP4 = 4,
  TCP = 6,
  IP6 = 41,
  DNS = 53,
  P2P = 421,
  ONION = 444,
  ONION3 = 445,
  WS = 477,
  ONION_LISTEN = 0x7F00, // private-use: listen-request marker
};

struct ProtocolInfo {
  Protocol code;
  std::string_view name;
  bool has_value;
};

// Lookup by text name ("ipfs" is accepted as an alias of "p2p")
const ProtocolInfo *FindProtocol(std::string_view name);
const ProtocolInfo *FindProtocol(Protocol code);
std::string ProtocolName(Protocol code);

// Onion identity lengths in base32 characters
constexpr size_t ONION_V2_ID_LENGTH = 16;
constexpr size_t ONION_V3_ID_LENGTH = 56;

struct Component {
  Protocol protocol;
  std::string value;

  bool operator==(const Component &other) const {
    return protocol == other.protocol && value == other.value;
  }
  bool operator!=(const Component &other) const { return !(*this == other); }
};

/**
 * Check a component value against its protocol's syntax
 *
 * Used by Multiaddr::parse(). Components built directly through the vector
 * constructor are NOT validated; consumers that need guarantees (the onion
 * address codec) validate again.
 */
bool ValidateComponentValue(Protocol protocol, const std::string &value,
                            std::string *error = nullptr);

class Multiaddr {
public:
  Multiaddr() = default;
  explicit Multiaddr(std::vector<Component> components)
      : components_(std::move(components)) {}

  /**
   * Parse multiaddr text
   * @param error Receives a human readable reason on failure (optional)
   * @return std::nullopt for unknown protocols, missing or invalid values
   */
  static std::optional<Multiaddr> parse(const std::string &text,
                                        std::string *error = nullptr);

  /**
   * Convert a numeric "ip:port" socket endpoint to /ip4|ip6/.../tcp/...
   *
   * Hostnames are rejected: only endpoints reported by sockets are expected.
   */
  static std::optional<Multiaddr> from_endpoint(const std::string &host_port);

  const std::vector<Component> &components() const { return components_; }
  bool empty() const { return components_.empty(); }
  size_t size() const { return components_.size(); }

  bool has_protocol(Protocol protocol) const;

  // Value of the first component with `protocol` (empty string for
  // value-less protocols), std::nullopt if absent
  std::optional<std::string> value_for_protocol(Protocol protocol) const;

  Multiaddr encapsulate(const Multiaddr &inner) const;

  // Strip the last occurrence of `protocol` and everything after it
  Multiaddr decapsulate(Protocol protocol) const;

  std::string to_string() const;

  bool operator==(const Multiaddr &other) const {
    return components_ == other.components_;
  }
  bool operator!=(const Multiaddr &other) const { return !(*this == other); }
  bool operator<(const Multiaddr &other) const {
    return to_string() < other.to_string();
  }

private:
  std::vector<Component> components_;
};

} // namespace transport
} // namespace torlink
