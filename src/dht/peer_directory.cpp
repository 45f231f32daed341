// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "dht/peer_directory.hpp"
#include <algorithm>

namespace torlink {
namespace dht {

size_t PeerDirectory::add_addrs(const transport::PeerId &peer,
                                const std::vector<transport::Multiaddr> &addrs) {
  return entries_.Upsert(peer, [&](std::vector<transport::Multiaddr> &known) {
    size_t added = 0;
    for (const auto &addr : addrs) {
      if (std::find(known.begin(), known.end(), addr) == known.end()) {
        known.push_back(addr);
        ++added;
      }
    }
    return added;
  });
}

std::vector<transport::Multiaddr>
PeerDirectory::addrs(const transport::PeerId &peer) const {
  std::vector<transport::Multiaddr> out;
  entries_.Read(peer,
                [&](const std::vector<transport::Multiaddr> &known) {
                  out = known;
                });
  return out;
}

bool PeerDirectory::contains(const transport::PeerId &peer) const {
  return entries_.Contains(peer);
}

std::vector<transport::PeerId> PeerDirectory::peers() const {
  auto ids = entries_.Keys();
  std::sort(ids.begin(), ids.end());
  return ids;
}

} // namespace dht
} // namespace torlink
