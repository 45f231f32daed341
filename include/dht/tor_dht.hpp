// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "dht/content_router.hpp"
#include "dht/host.hpp"
#include "dht/peer_info.hpp"
#include "dht/quorum_connector.hpp"
#include "transport/address_codec.hpp"
#include "util/context.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace torlink {
namespace dht {

/**
 * TorDht - content routing and peer connection over onion addresses
 *
 * Glues a ContentRouter to a Host whose transport dials onion services.
 * Peers are exchanged as PeerInfo (peer id + onion identity + port); the
 * codec turns them into dialable multiaddrs and back.
 */
class TorDht {
public:
  struct Options {
    // Dial peers through websocket framing ("/ws" suffix)
    bool websocket = false;
    QuorumConnector::Options quorum;
  };

  TorDht(HostPtr host, ContentRouterPtr router,
         transport::AddressCodec codec = transport::AddressCodec());
  TorDht(HostPtr host, ContentRouterPtr router, transport::AddressCodec codec,
         Options options);
  ~TorDht();

  TorDht(const TorDht &) = delete;
  TorDht &operator=(const TorDht &) = delete;

  bool provide(const util::Context &ctx, const std::string &key,
               transport::TransportState &state);

  // Up to `max_count` providers (0 = unbounded). A provider whose first
  // address is not an onion address fails the whole call.
  bool find_providers(const util::Context &ctx, const std::string &key,
                      size_t max_count, std::vector<PeerInfo> &out,
                      transport::TransportState &state);

  // Connect to at least `min_required` of `peers` (see QuorumConnector)
  QuorumResult connect_peers(const util::Context &ctx,
                             const std::vector<PeerInfo> &peers,
                             size_t min_required,
                             transport::TransportState &state);

  // One quorum attempt: register the peer's onion address, then dial it
  bool connect_peer(const util::Context &ctx, const PeerInfo &peer,
                    transport::TransportState &state);

  // Derive the local PeerInfo from the host's onion listen address. No
  // onion listener leaves peer_info() empty; more than one is an error.
  bool apply_peer_info(transport::TransportState &state);

  std::optional<PeerInfo> peer_info() const;

  bool make_peer_info(const transport::PeerId &id,
                      const transport::Multiaddr &addr, PeerInfo &out,
                      transport::TransportState &state) const;

  // Closes the router, then the host. When both fail the host error is
  // reported. Repeated calls return true.
  bool close(transport::TransportState &state);

  Host &host() { return *host_; }
  const transport::AddressCodec &codec() const { return codec_; }

private:
  HostPtr host_;
  ContentRouterPtr router_;
  transport::AddressCodec codec_;
  Options options_;
  std::unique_ptr<QuorumConnector> quorum_;

  mutable std::mutex info_mutex_;
  std::optional<PeerInfo> peer_info_;
  std::atomic<bool> closed_{false};
};

} // namespace dht
} // namespace torlink
