// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/transport.hpp"
#include <atomic>
#include <cstdint>

namespace torlink {
namespace transport {

/**
 * PlaintextConnection - upgraded connection without encryption
 *
 * Tor already authenticates and encrypts the onion stream end to end; this
 * layer only binds peer ids to it.
 */
class PlaintextConnection : public Connection {
public:
  PlaintextConnection(MultiaddrConnectionPtr conn, PeerId local_peer,
                      PeerId remote_peer)
      : conn_(std::move(conn)), local_peer_(std::move(local_peer)),
        remote_peer_(std::move(remote_peer)) {}
  ~PlaintextConnection() override;

  const PeerId &local_peer() const override { return local_peer_; }
  const PeerId &remote_peer() const override { return remote_peer_; }
  const Multiaddr &local_multiaddr() const override {
    return conn_->local_multiaddr();
  }
  const Multiaddr &remote_multiaddr() const override {
    return conn_->remote_multiaddr();
  }
  Direction direction() const override { return conn_->direction(); }

  size_t read_some(const util::Context &ctx, uint8_t *data, size_t size,
                   boost::system::error_code &ec) override;
  size_t write_all(const util::Context &ctx, const uint8_t *data, size_t size,
                   boost::system::error_code &ec) override;

  void close() override;
  bool is_closed() const override {
    return closed_.load(std::memory_order_acquire);
  }

private:
  MultiaddrConnectionPtr conn_;
  PeerId local_peer_;
  PeerId remote_peer_;
  std::atomic<bool> closed_{false};
};

/**
 * PlaintextUpgrader - exchanges peer ids over a fresh stream
 *
 * Both sides send one hello frame and read the other's:
 *
 *   [version:1 = 0x01][length:2 big-endian][peer id bytes]
 *
 * Outbound upgrades fail if the remote id differs from the dialed peer.
 */
class PlaintextUpgrader : public Upgrader {
public:
  static constexpr uint8_t PROTOCOL_VERSION = 1;
  static constexpr size_t MAX_PEER_ID_LENGTH = 256;

  explicit PlaintextUpgrader(PeerId local_peer);

  ConnectionPtr upgrade_outbound(const util::Context &ctx,
                                 const MultiaddrConnectionPtr &conn,
                                 const PeerId &remote_peer,
                                 TransportState &state) override;
  ConnectionPtr upgrade_inbound(const util::Context &ctx,
                                const MultiaddrConnectionPtr &conn,
                                TransportState &state) override;

  const PeerId &local_peer() const { return local_peer_; }

private:
  bool exchange_hello(const util::Context &ctx, MultiaddrConnection &conn,
                      PeerId &remote, TransportState &state) const;

  PeerId local_peer_;
};

} // namespace transport
} // namespace torlink
