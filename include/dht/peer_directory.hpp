// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/multiaddr.hpp"
#include "transport/transport.hpp"
#include "util/threadsafe_containers.hpp"
#include <cstddef>
#include <vector>

namespace torlink {
namespace dht {

/**
 * PeerDirectory - known addresses per peer
 *
 * Append-only: addresses are never evicted, duplicates are ignored, and
 * insertion order is kept so the host dials the oldest address first.
 */
class PeerDirectory {
public:
  PeerDirectory() = default;

  PeerDirectory(const PeerDirectory &) = delete;
  PeerDirectory &operator=(const PeerDirectory &) = delete;

  // Returns how many of `addrs` were not yet known
  size_t add_addrs(const transport::PeerId &peer,
                   const std::vector<transport::Multiaddr> &addrs);

  std::vector<transport::Multiaddr> addrs(const transport::PeerId &peer) const;
  bool contains(const transport::PeerId &peer) const;
  std::vector<transport::PeerId> peers() const;
  size_t size() const { return entries_.Size(); }

private:
  util::ThreadSafeMap<transport::PeerId, std::vector<transport::Multiaddr>>
      entries_;
};

} // namespace dht
} // namespace torlink
