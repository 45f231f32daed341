// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "transport/upgrader.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace torlink {
namespace transport {

UpgradedListener::UpgradedListener(NetListenerPtr inner, UpgraderPtr upgrader,
                                   std::chrono::milliseconds upgrade_timeout)
    : inner_(std::move(inner)), upgrader_(std::move(upgrader)),
      upgrade_timeout_(upgrade_timeout) {
  if (!inner_ || !upgrader_) {
    throw std::invalid_argument("UpgradedListener requires a listener and an upgrader");
  }
}

UpgradedListener::~UpgradedListener() {
  auto ec = close();
  if (ec) {
    LOG_NET_DEBUG("listener teardown in destructor: {}", ec.message());
  }
}

ConnectionPtr UpgradedListener::accept(TransportState &state) {
  for (;;) {
    TransportState accept_state;
    MultiaddrConnectionPtr raw = inner_->accept(accept_state);
    if (!raw) {
      if (accept_state.GetError() == TransportError::ADDRESS_FORMAT_INVALID &&
          !closed_.load(std::memory_order_acquire)) {
        LOG_NET_DEBUG("dropped inbound stream on {}: {}",
                      inner_->multiaddr().to_string(), accept_state.ToString());
        continue;
      }
      state = accept_state;
      return nullptr;
    }

    auto ctx = util::Context::WithTimeout(util::Context(), upgrade_timeout_);
    TransportState upgrade_state;
    ConnectionPtr conn = upgrader_->upgrade_inbound(ctx, raw, upgrade_state);
    if (!conn) {
      raw->close();
      LOG_NET_DEBUG("inbound upgrade from {} failed: {}",
                    raw->remote_multiaddr().to_string(),
                    upgrade_state.ToString());
      continue;
    }
    LOG_NET_DEBUG("accepted {} from peer {}", raw->remote_multiaddr().to_string(),
                  conn->remote_peer());
    return conn;
  }
}

boost::system::error_code UpgradedListener::close() {
  if (closed_.exchange(true)) {
    return {};
  }
  auto ec = inner_->close();
  if (ec) {
    LOG_NET_WARN("closing listener {}: {}", inner_->multiaddr().to_string(),
                 ec.message());
  }
  return ec;
}

} // namespace transport
} // namespace torlink
