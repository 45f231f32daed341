// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "transport/multiaddr.hpp"
#include "util/string_parsing.hpp"
#include <array>
#include <boost/asio/ip/address.hpp>
#include <cctype>

namespace torlink {
namespace transport {

namespace {

constexpr std::array<ProtocolInfo, 9> kProtocols = {{
    {Protocol::IP4, "ip4", true},
    {Protocol::TCP, "tcp", true},
    {Protocol::IP6, "ip6", true},
    {Protocol::DNS, "dns", true},
    {Protocol::P2P, "p2p", true},
    {Protocol::ONION, "onion", true},
    {Protocol::ONION3, "onion3", true},
    {Protocol::WS, "ws", false},
    {Protocol::ONION_LISTEN, "onionListen", false},
}};

bool Fail(std::string *error, const std::string &message) {
  if (error) {
    *error = message;
  }
  return false;
}

bool ValidateOnion(const std::string &value, size_t id_length,
                   std::string *error) {
  const size_t colon = value.find(':');
  if (colon == std::string::npos) {
    return Fail(error, "onion address '" + value + "' is missing a port");
  }
  const std::string id = value.substr(0, colon);
  if (id.size() != id_length || !util::IsBase32Lower(id)) {
    return Fail(error, "invalid onion identity '" + id + "'");
  }
  if (!util::SafeParsePort(value.substr(colon + 1))) {
    return Fail(error, "invalid onion port in '" + value + "'");
  }
  return true;
}

} // namespace

const ProtocolInfo *FindProtocol(std::string_view name) {
  if (name == "ipfs") {
    name = "p2p";
  }
  for (const auto &info : kProtocols) {
    if (info.name == name) {
      return &info;
    }
  }
  return nullptr;
}

const ProtocolInfo *FindProtocol(Protocol code) {
  for (const auto &info : kProtocols) {
    if (info.code == code) {
      return &info;
    }
  }
  return nullptr;
}

std::string ProtocolName(Protocol code) {
  const auto *info = FindProtocol(code);
  return info ? std::string(info->name)
              : "unknown(" + std::to_string(static_cast<uint32_t>(code)) + ")";
}

bool ValidateComponentValue(Protocol protocol, const std::string &value,
                            std::string *error) {
  boost::system::error_code ec;
  switch (protocol) {
  case Protocol::IP4:
    boost::asio::ip::make_address_v4(value, ec);
    return ec ? Fail(error, "invalid ip4 address '" + value + "'") : true;
  case Protocol::IP6:
    boost::asio::ip::make_address_v6(value, ec);
    return ec ? Fail(error, "invalid ip6 address '" + value + "'") : true;
  case Protocol::TCP:
    // tcp/0 is legal (ephemeral bind), unlike onion ports
    if (value == "0" || util::SafeParsePort(value)) {
      return true;
    }
    return Fail(error, "invalid tcp port '" + value + "'");
  case Protocol::DNS:
    if (value.empty() || value.find('/') != std::string::npos) {
      return Fail(error, "invalid dns name '" + value + "'");
    }
    return true;
  case Protocol::P2P:
    if (value.empty()) {
      return Fail(error, "empty peer id");
    }
    for (unsigned char c : value) {
      if (!std::isalnum(c)) {
        return Fail(error, "invalid peer id '" + value + "'");
      }
    }
    return true;
  case Protocol::ONION:
    return ValidateOnion(value, ONION_V2_ID_LENGTH, error);
  case Protocol::ONION3:
    return ValidateOnion(value, ONION_V3_ID_LENGTH, error);
  case Protocol::WS:
  case Protocol::ONION_LISTEN:
    return value.empty() ? true
                         : Fail(error, ProtocolName(protocol) +
                                           " does not take a value");
  }
  return Fail(error, "unknown protocol");
}

std::optional<Multiaddr> Multiaddr::parse(const std::string &text,
                                          std::string *error) {
  if (text.empty() || text.front() != '/') {
    Fail(error, "multiaddr must begin with '/'");
    return std::nullopt;
  }

  auto parts = util::SplitString(text.substr(1), '/');
  // A single trailing slash is tolerated ("/ws/")
  if (parts.size() > 1 && parts.back().empty()) {
    parts.pop_back();
  }

  std::vector<Component> components;
  for (size_t i = 0; i < parts.size(); ++i) {
    const ProtocolInfo *info = FindProtocol(parts[i]);
    if (!info) {
      Fail(error, "unknown protocol '" + parts[i] + "'");
      return std::nullopt;
    }
    std::string value;
    if (info->has_value) {
      if (i + 1 >= parts.size() || parts[i + 1].empty()) {
        Fail(error, std::string(info->name) + " requires a value");
        return std::nullopt;
      }
      value = parts[++i];
    }
    if (!ValidateComponentValue(info->code, value, error)) {
      return std::nullopt;
    }
    if (info->code == Protocol::IP4 || info->code == Protocol::IP6) {
      value = boost::asio::ip::make_address(value).to_string();
    }
    components.push_back({info->code, std::move(value)});
  }
  return Multiaddr(std::move(components));
}

std::optional<Multiaddr> Multiaddr::from_endpoint(const std::string &host_port) {
  std::string host;
  uint16_t port = 0;
  if (!util::SplitHostPort(host_port, host, port)) {
    return std::nullopt;
  }
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(host, ec);
  if (ec) {
    return std::nullopt;
  }
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    ip = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped,
                                          ip.to_v6());
  }
  return Multiaddr({{ip.is_v4() ? Protocol::IP4 : Protocol::IP6, ip.to_string()},
                    {Protocol::TCP, std::to_string(port)}});
}

bool Multiaddr::has_protocol(Protocol protocol) const {
  return value_for_protocol(protocol).has_value();
}

std::optional<std::string>
Multiaddr::value_for_protocol(Protocol protocol) const {
  for (const auto &c : components_) {
    if (c.protocol == protocol) {
      return c.value;
    }
  }
  return std::nullopt;
}

Multiaddr Multiaddr::encapsulate(const Multiaddr &inner) const {
  std::vector<Component> out = components_;
  out.insert(out.end(), inner.components_.begin(), inner.components_.end());
  return Multiaddr(std::move(out));
}

Multiaddr Multiaddr::decapsulate(Protocol protocol) const {
  for (size_t i = components_.size(); i > 0; --i) {
    if (components_[i - 1].protocol == protocol) {
      return Multiaddr(std::vector<Component>(components_.begin(),
                                              components_.begin() + (i - 1)));
    }
  }
  return *this;
}

std::string Multiaddr::to_string() const {
  std::string out;
  for (const auto &c : components_) {
    out += "/" + ProtocolName(c.protocol);
    if (!c.value.empty()) {
      out += "/" + c.value;
    }
  }
  return out;
}

} // namespace transport
} // namespace torlink
