// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/multiaddr.hpp"
#include "transport/transport.hpp"
#include "transport/transport_state.hpp"
#include "util/context.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace torlink {
namespace dht {

// A peer advertising a content key, with the addresses it published
struct ProviderRecord {
  transport::PeerId id;
  std::vector<transport::Multiaddr> addrs;
};

// Return false to stop the lookup early
using ProviderVisitor = std::function<bool(const ProviderRecord &)>;

/**
 * ContentRouter - provider record collaborator
 *
 * Keys are passed through as raw bytes. Failures set ROUTING_FAILED, or
 * CANCELLED when `ctx` expired before the operation finished.
 */
class ContentRouter {
public:
  virtual ~ContentRouter() = default;

  virtual bool provide(const util::Context &ctx, const std::string &key,
                       transport::TransportState &state) = 0;

  // Streams up to `max_count` records into `visitor` (0 = unbounded)
  virtual bool find_providers(const util::Context &ctx, const std::string &key,
                              size_t max_count, const ProviderVisitor &visitor,
                              transport::TransportState &state) = 0;

  // Idempotent
  virtual bool close(transport::TransportState &state) = 0;
};

using ContentRouterPtr = std::shared_ptr<ContentRouter>;

/**
 * LocalContentRouter - in-process provider table
 *
 * Records live in memory only. Routers can be linked with add_peer() so a
 * lookup also consults the peer's table, which is enough to run several
 * nodes in one process without a distributed routing layer.
 */
class LocalContentRouter : public ContentRouter {
public:
  // `self` supplies the record announced by provide()
  using SelfRecordFunction = std::function<ProviderRecord()>;

  explicit LocalContentRouter(SelfRecordFunction self);

  bool provide(const util::Context &ctx, const std::string &key,
               transport::TransportState &state) override;
  bool find_providers(const util::Context &ctx, const std::string &key,
                      size_t max_count, const ProviderVisitor &visitor,
                      transport::TransportState &state) override;
  bool close(transport::TransportState &state) override;

  void add_peer(std::shared_ptr<LocalContentRouter> peer);

  size_t record_count(const std::string &key) const;
  bool is_closed() const;

private:
  std::vector<ProviderRecord> local_records(const std::string &key) const;

  SelfRecordFunction self_;
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<ProviderRecord>> records_;
  std::vector<std::weak_ptr<LocalContentRouter>> peers_;
  bool closed_ = false;
};

} // namespace dht
} // namespace torlink
