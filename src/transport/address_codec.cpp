// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "transport/address_codec.hpp"
#include "util/string_parsing.hpp"

namespace torlink {
namespace transport {

AddressCodec::AddressCodec(std::string suffix) : suffix_(std::move(suffix)) {}

bool AddressCodec::valid_service_id(const std::string &id) const {
  return (id.size() == ONION_V2_ID_LENGTH || id.size() == ONION_V3_ID_LENGTH) &&
         util::IsBase32Lower(id);
}

bool AddressCodec::decode(const Multiaddr &addr, OnionEndpoint &out,
                          TransportState &state) const {
  const auto &components = addr.components();
  if (components.empty()) {
    return state.Error(TransportError::ADDRESS_FORMAT_INVALID, "empty address");
  }

  const Component &head = components.front();
  if (head.protocol != Protocol::ONION && head.protocol != Protocol::ONION3) {
    if (addr.has_protocol(Protocol::ONION_LISTEN)) {
      return state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                         "listen marker is not dialable", addr.to_string());
    }
    return state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                       "not an onion address", addr.to_string());
  }

  std::string error;
  if (!ValidateComponentValue(head.protocol, head.value, &error)) {
    return state.Error(TransportError::ADDRESS_FORMAT_INVALID, error,
                       addr.to_string());
  }

  if (components.size() > 2 ||
      (components.size() == 2 &&
       (components[1].protocol != Protocol::WS || !components[1].value.empty()))) {
    return state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                       "unexpected segments after onion address",
                       addr.to_string());
  }

  const size_t colon = head.value.find(':');
  auto port = util::SafeParsePort(head.value.substr(colon + 1));
  out.service_id = head.value.substr(0, colon);
  out.port = *port;
  return true;
}

bool AddressCodec::decode_host_port(const std::string &text,
                                    OnionEndpoint &out, bool &framed,
                                    TransportState &state) const {
  std::string body = text;
  const std::string framed_suffix = FRAMED_SUFFIX;
  framed = false;
  if (body.size() > framed_suffix.size() &&
      body.compare(body.size() - framed_suffix.size(), framed_suffix.size(),
                   framed_suffix) == 0) {
    framed = true;
    body.resize(body.size() - framed_suffix.size());
  }

  std::string host;
  uint16_t port = 0;
  if (!util::SplitHostPort(body, host, port)) {
    return state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                       "expected <id>." + suffix_ + ":<port>", text);
  }

  const std::string dot_suffix = "." + suffix_;
  if (host.size() <= dot_suffix.size() ||
      host.compare(host.size() - dot_suffix.size(), dot_suffix.size(),
                   dot_suffix) != 0) {
    return state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                       "host is not a ." + suffix_ + " name", text);
  }

  std::string id = host.substr(0, host.size() - dot_suffix.size());
  if (!valid_service_id(id)) {
    return state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                       "invalid onion identity '" + id + "'", text);
  }
  out.service_id = std::move(id);
  out.port = port;
  return true;
}

std::string AddressCodec::encode(const std::string &service_id,
                                 uint16_t port) const {
  return service_id + "." + suffix_ + ":" + std::to_string(port);
}

std::string AddressCodec::encode_framed(const std::string &service_id,
                                        uint16_t port) const {
  return encode(service_id, port) + FRAMED_SUFFIX;
}

Multiaddr AddressCodec::to_multiaddr(const std::string &service_id,
                                     uint16_t port, bool framed) const {
  const Protocol proto = service_id.size() == ONION_V3_ID_LENGTH
                             ? Protocol::ONION3
                             : Protocol::ONION;
  std::vector<Component> components{
      {proto, service_id + ":" + std::to_string(port)}};
  if (framed) {
    components.push_back({Protocol::WS, ""});
  }
  return Multiaddr(std::move(components));
}

bool AddressCodec::is_listen_marker(const Multiaddr &addr) const {
  const auto &components = addr.components();
  return components.size() == 1 &&
         components[0].protocol == Protocol::ONION_LISTEN &&
         components[0].value.empty();
}

Multiaddr AddressCodec::listen_marker() {
  return Multiaddr({{Protocol::ONION_LISTEN, ""}});
}

} // namespace transport
} // namespace torlink
