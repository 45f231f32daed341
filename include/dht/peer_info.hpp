// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/transport.hpp"
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace torlink {
namespace dht {

// Where a peer can be reached through the overlay
struct PeerInfo {
  transport::PeerId id;
  std::string onion_service_id;
  uint16_t onion_port = 0;

  // "<id>@<service_id>.onion:<port>"
  std::string ToString() const;

  bool operator==(const PeerInfo &other) const {
    return id == other.id && onion_service_id == other.onion_service_id &&
           onion_port == other.onion_port;
  }
  bool operator!=(const PeerInfo &other) const { return !(*this == other); }
};

/**
 * JSON form:
 *   {"id": "QmPeer", "onion_service_id": "<16|56 base32>", "onion_port": 4001}
 */
nlohmann::json PeerInfoToJson(const PeerInfo &info);

// Validates the identity alphabet/length and the port range
bool PeerInfoFromJson(const nlohmann::json &j, PeerInfo &out,
                      std::string *error = nullptr);

// Single PeerInfo file (the node's own <datadir>/peerinfo.json)
bool SavePeerInfo(const std::filesystem::path &path, const PeerInfo &info);
std::optional<PeerInfo> LoadPeerInfo(const std::filesystem::path &path);

/**
 * Peer list file
 *   {"version": 1, "peers": [ {...}, ... ]}
 *
 * A bare JSON array of PeerInfo objects is accepted on load. Malformed
 * entries are skipped with a warning; a malformed file yields nullopt.
 */
bool SavePeerInfos(const std::filesystem::path &path,
                   const std::vector<PeerInfo> &peers);
std::optional<std::vector<PeerInfo>>
LoadPeerInfos(const std::filesystem::path &path);

} // namespace dht
} // namespace torlink
