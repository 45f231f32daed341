// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "dht/tor_dht.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace torlink {
namespace dht {

using transport::Multiaddr;
using transport::OnionEndpoint;
using transport::TransportError;
using transport::TransportState;

TorDht::TorDht(HostPtr host, ContentRouterPtr router,
               transport::AddressCodec codec)
    : TorDht(std::move(host), std::move(router), std::move(codec), Options{}) {}

TorDht::TorDht(HostPtr host, ContentRouterPtr router,
               transport::AddressCodec codec, Options options)
    : host_(std::move(host)), router_(std::move(router)),
      codec_(std::move(codec)), options_(options) {
  if (!host_ || !router_) {
    throw std::invalid_argument("TorDht requires a host and a content router");
  }
  quorum_ = std::make_unique<QuorumConnector>(
      [this](const util::Context &ctx, const PeerInfo &peer,
             TransportState &state) { return connect_peer(ctx, peer, state); },
      options_.quorum);
}

TorDht::~TorDht() {
  // Stragglers call back into host_; join them first
  quorum_.reset();
  TransportState state;
  if (!close(state)) {
    LOG_DHT_WARN("dht teardown: {}", state.ToString());
  }
}

bool TorDht::provide(const util::Context &ctx, const std::string &key,
                     TransportState &state) {
  if (closed_.load(std::memory_order_acquire)) {
    return state.Error(TransportError::ROUTING_FAILED, "dht closed");
  }
  return router_->provide(ctx, key, state);
}

bool TorDht::find_providers(const util::Context &ctx, const std::string &key,
                            size_t max_count, std::vector<PeerInfo> &out,
                            TransportState &state) {
  if (closed_.load(std::memory_order_acquire)) {
    return state.Error(TransportError::ROUTING_FAILED, "dht closed");
  }

  std::vector<PeerInfo> found;
  TransportState convert_state;
  const bool routed = router_->find_providers(
      ctx, key, max_count,
      [&](const ProviderRecord &record) {
        PeerInfo info;
        if (record.addrs.empty()) {
          convert_state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                              "failed parsing provider " + record.id,
                              "no addresses");
          return false;
        }
        if (!make_peer_info(record.id, record.addrs.front(), info,
                            convert_state)) {
          convert_state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                              "failed parsing provider " + record.id + " at " +
                                  record.addrs.front().to_string(),
                              convert_state.GetReason());
          return false;
        }
        found.push_back(std::move(info));
        return true;
      },
      state);

  if (convert_state.IsError()) {
    state = convert_state;
    return false;
  }
  if (!routed) {
    return false;
  }
  LOG_DHT_DEBUG("found {} providers", found.size());
  out = std::move(found);
  return true;
}

bool TorDht::connect_peer(const util::Context &ctx, const PeerInfo &peer,
                          TransportState &state) {
  if (peer.id.empty()) {
    return state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                       "peer id is empty", peer.ToString());
  }
  const Multiaddr addr = codec_.to_multiaddr(
      peer.onion_service_id, peer.onion_port, options_.websocket);

  // Reject identities the transport could never dial before touching the
  // directory
  OnionEndpoint endpoint;
  if (!codec_.decode(addr, endpoint, state)) {
    return false;
  }
  host_->peerstore().add_addrs(peer.id, {addr});

  if (!host_->connect(ctx, peer.id, state)) {
    LOG_DHT_DEBUG("failed connecting to peer {}: {}", peer.ToString(),
                  state.ToString());
    return false;
  }
  return true;
}

QuorumResult TorDht::connect_peers(const util::Context &ctx,
                                   const std::vector<PeerInfo> &peers,
                                   size_t min_required, TransportState &state) {
  if (closed_.load(std::memory_order_acquire)) {
    QuorumResult result;
    result.required = std::min(min_required, peers.size());
    state.Error(TransportError::DIAL_FAILED, "dht closed");
    return result;
  }
  LOG_DHT_INFO("connecting to at least {} of {} peers", min_required,
               peers.size());
  return quorum_->connect(ctx, peers, min_required, state);
}

bool TorDht::make_peer_info(const transport::PeerId &id, const Multiaddr &addr,
                            PeerInfo &out, TransportState &state) const {
  OnionEndpoint endpoint;
  if (!codec_.decode(addr, endpoint, state)) {
    return false;
  }
  out.id = id;
  out.onion_service_id = endpoint.service_id;
  out.onion_port = endpoint.port;
  return true;
}

bool TorDht::apply_peer_info(TransportState &state) {
  std::vector<Multiaddr> onion_addrs;
  for (const auto &addr : host_->listen_addresses()) {
    if (addr.has_protocol(transport::Protocol::ONION) ||
        addr.has_protocol(transport::Protocol::ONION3)) {
      onion_addrs.push_back(addr);
    }
  }

  if (onion_addrs.size() > 1) {
    std::string joined;
    for (const auto &addr : onion_addrs) {
      joined += (joined.empty() ? "" : ", ") + addr.to_string();
    }
    return state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                       "expected at most 1 listen onion address", joined);
  }

  std::lock_guard<std::mutex> lock(info_mutex_);
  if (onion_addrs.empty()) {
    peer_info_.reset();
    LOG_DHT_DEBUG("no onion listen address, not announcing peer info");
    return true;
  }

  PeerInfo info;
  if (!make_peer_info(host_->id(), onion_addrs.front(), info, state)) {
    return false;
  }
  LOG_DHT_INFO("local peer info {}", info.ToString());
  peer_info_ = std::move(info);
  return true;
}

std::optional<PeerInfo> TorDht::peer_info() const {
  std::lock_guard<std::mutex> lock(info_mutex_);
  return peer_info_;
}

bool TorDht::close(TransportState &state) {
  if (closed_.exchange(true)) {
    return true;
  }

  TransportState router_state;
  const bool router_ok = router_->close(router_state);
  if (!router_ok) {
    LOG_DHT_WARN("closing content router: {}", router_state.ToString());
  }

  TransportState host_state;
  const bool host_ok = host_->close(host_state);
  if (!host_ok) {
    state = host_state;
    return false;
  }
  if (!router_ok) {
    state = router_state;
    return false;
  }
  return true;
}

} // namespace dht
} // namespace torlink
