// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "dht/peer_info.hpp"
#include "transport/multiaddr.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

namespace torlink {
namespace dht {

using json = nlohmann::json;

namespace {

constexpr int PEERS_FILE_VERSION = 1;
constexpr size_t MAX_PEERS_FILE_SIZE = 4 * 1024 * 1024;

bool Fail(std::string *error, const std::string &message) {
  if (error) {
    *error = message;
  }
  return false;
}

std::optional<json> ParseFile(const std::filesystem::path &path) {
  auto contents = util::read_file_string(path, MAX_PEERS_FILE_SIZE);
  if (!contents) {
    LOG_DHT_DEBUG("cannot read {}", path.string());
    return std::nullopt;
  }
  json root = json::parse(*contents, nullptr, false);
  if (root.is_discarded()) {
    LOG_DHT_WARN("failed to parse {}", path.string());
    return std::nullopt;
  }
  return root;
}

} // namespace

std::string PeerInfo::ToString() const {
  return id + "@" + onion_service_id + ".onion:" + std::to_string(onion_port);
}

json PeerInfoToJson(const PeerInfo &info) {
  json j;
  j["id"] = info.id;
  j["onion_service_id"] = info.onion_service_id;
  j["onion_port"] = info.onion_port;
  return j;
}

bool PeerInfoFromJson(const json &j, PeerInfo &out, std::string *error) {
  if (!j.is_object()) {
    return Fail(error, "peer info is not an object");
  }
  if (!j.contains("id") || !j.contains("onion_service_id") ||
      !j.contains("onion_port")) {
    return Fail(error, "peer info is missing fields");
  }
  if (!j["id"].is_string() || !j["onion_service_id"].is_string() ||
      !j["onion_port"].is_number_unsigned()) {
    return Fail(error, "peer info has invalid field types");
  }

  PeerInfo info;
  info.id = j["id"].get<std::string>();
  info.onion_service_id = j["onion_service_id"].get<std::string>();
  const auto port = j["onion_port"].get<uint64_t>();

  if (info.id.empty()) {
    return Fail(error, "empty peer id");
  }
  const size_t len = info.onion_service_id.size();
  if ((len != transport::ONION_V2_ID_LENGTH &&
       len != transport::ONION_V3_ID_LENGTH) ||
      !util::IsBase32Lower(info.onion_service_id)) {
    return Fail(error, "invalid onion service id '" + info.onion_service_id + "'");
  }
  if (port == 0 || port > 65535) {
    return Fail(error, "invalid onion port " + std::to_string(port));
  }
  info.onion_port = static_cast<uint16_t>(port);
  out = std::move(info);
  return true;
}

bool SavePeerInfo(const std::filesystem::path &path, const PeerInfo &info) {
  if (!util::atomic_write_file(path, PeerInfoToJson(info).dump(2) + "\n")) {
    LOG_DHT_ERROR("failed to write peer info to {}", path.string());
    return false;
  }
  return true;
}

std::optional<PeerInfo> LoadPeerInfo(const std::filesystem::path &path) {
  auto root = ParseFile(path);
  if (!root) {
    return std::nullopt;
  }
  PeerInfo info;
  std::string error;
  if (!PeerInfoFromJson(*root, info, &error)) {
    LOG_DHT_WARN("invalid peer info in {}: {}", path.string(), error);
    return std::nullopt;
  }
  return info;
}

bool SavePeerInfos(const std::filesystem::path &path,
                   const std::vector<PeerInfo> &peers) {
  json root;
  root["version"] = PEERS_FILE_VERSION;
  json array = json::array();
  for (const auto &peer : peers) {
    array.push_back(PeerInfoToJson(peer));
  }
  root["peers"] = array;

  if (!util::atomic_write_file(path, root.dump(2) + "\n")) {
    LOG_DHT_ERROR("failed to save {} peers to {}", peers.size(), path.string());
    return false;
  }
  LOG_DHT_DEBUG("saved {} peers to {}", peers.size(), path.string());
  return true;
}

std::optional<std::vector<PeerInfo>>
LoadPeerInfos(const std::filesystem::path &path) {
  auto root = ParseFile(path);
  if (!root) {
    return std::nullopt;
  }

  const json *array = nullptr;
  if (root->is_array()) {
    array = &*root;
  } else if (root->is_object() && root->value("version", 0) == PEERS_FILE_VERSION &&
             root->contains("peers") && (*root)["peers"].is_array()) {
    array = &(*root)["peers"];
  } else {
    LOG_DHT_WARN("invalid peers file format/version in {}", path.string());
    return std::nullopt;
  }

  std::vector<PeerInfo> peers;
  for (const auto &entry : *array) {
    PeerInfo info;
    std::string error;
    if (!PeerInfoFromJson(entry, info, &error)) {
      LOG_DHT_WARN("skipping peer entry in {}: {}", path.string(), error);
      continue;
    }
    peers.push_back(std::move(info));
  }
  LOG_DHT_DEBUG("loaded {} peers from {}", peers.size(), path.string());
  return peers;
}

} // namespace dht
} // namespace torlink
