// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/transport.hpp"
#include <atomic>
#include <chrono>

namespace torlink {
namespace transport {

/**
 * UpgradedListener - runs the upgrader over every accepted stream
 *
 * Streams that fail the inbound upgrade, or whose remote endpoint could not be
 * turned into a multiaddr, are closed and skipped; accept() only returns
 * nullptr once the underlying listener is closed.
 */
class UpgradedListener : public Listener {
public:
  static constexpr std::chrono::milliseconds DEFAULT_UPGRADE_TIMEOUT{
      std::chrono::seconds(45)};

  UpgradedListener(NetListenerPtr inner, UpgraderPtr upgrader,
                   std::chrono::milliseconds upgrade_timeout =
                       DEFAULT_UPGRADE_TIMEOUT);
  ~UpgradedListener() override;

  ConnectionPtr accept(TransportState &state) override;
  boost::system::error_code close() override;
  const Multiaddr &multiaddr() const override { return inner_->multiaddr(); }

  const NetListenerPtr &inner() const { return inner_; }

private:
  NetListenerPtr inner_;
  UpgraderPtr upgrader_;
  std::chrono::milliseconds upgrade_timeout_;
  std::atomic<bool> closed_{false};
};

} // namespace transport
} // namespace torlink
