// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "dht/content_router.hpp"
#include "util/logging.hpp"
#include <set>
#include <stdexcept>

namespace torlink {
namespace dht {

using transport::TransportError;
using transport::TransportState;

LocalContentRouter::LocalContentRouter(SelfRecordFunction self)
    : self_(std::move(self)) {
  if (!self_) {
    throw std::invalid_argument("LocalContentRouter requires a self record");
  }
}

bool LocalContentRouter::provide(const util::Context &ctx,
                                 const std::string &key,
                                 TransportState &state) {
  if (ctx.Done()) {
    return state.Error(TransportError::CANCELLED, ctx.Error());
  }
  ProviderRecord record = self_();

  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return state.Error(TransportError::ROUTING_FAILED, "router closed");
  }
  auto &list = records_[key];
  for (auto &existing : list) {
    if (existing.id == record.id) {
      existing.addrs = std::move(record.addrs);
      return true;
    }
  }
  list.push_back(std::move(record));
  LOG_DHT_DEBUG("providing key of {} bytes ({} providers)", key.size(),
                list.size());
  return true;
}

std::vector<ProviderRecord>
LocalContentRouter::local_records(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(key);
  if (it == records_.end()) {
    return {};
  }
  return it->second;
}

bool LocalContentRouter::find_providers(const util::Context &ctx,
                                        const std::string &key,
                                        size_t max_count,
                                        const ProviderVisitor &visitor,
                                        TransportState &state) {
  std::vector<std::shared_ptr<LocalContentRouter>> linked;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return state.Error(TransportError::ROUTING_FAILED, "router closed");
    }
    for (const auto &weak : peers_) {
      if (auto peer = weak.lock()) {
        linked.push_back(std::move(peer));
      }
    }
  }

  std::vector<ProviderRecord> candidates = local_records(key);
  for (const auto &peer : linked) {
    if (peer->is_closed()) {
      continue;
    }
    auto remote = peer->local_records(key);
    candidates.insert(candidates.end(), remote.begin(), remote.end());
  }

  std::set<transport::PeerId> seen;
  size_t delivered = 0;
  for (const auto &record : candidates) {
    if (ctx.Done()) {
      return state.Error(TransportError::CANCELLED, ctx.Error());
    }
    if (max_count != 0 && delivered >= max_count) {
      break;
    }
    if (!seen.insert(record.id).second) {
      continue;
    }
    ++delivered;
    if (!visitor(record)) {
      break;
    }
  }
  return true;
}

bool LocalContentRouter::close(TransportState &) {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  peers_.clear();
  return true;
}

void LocalContentRouter::add_peer(std::shared_ptr<LocalContentRouter> peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_.push_back(peer);
}

size_t LocalContentRouter::record_count(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(key);
  return it == records_.end() ? 0 : it->second.size();
}

bool LocalContentRouter::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

} // namespace dht
} // namespace torlink
