// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "dht/peer_directory.hpp"
#include "transport/transport.hpp"
#include "util/context.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace torlink {
namespace dht {

/**
 * Host - local peer identity plus its transport, listeners and connections
 *
 * Connections are tracked per remote peer; a live connection is reused by
 * connect(). Each listener gets an accept thread that registers inbound
 * connections and hands them to the inbound handler, if one is set.
 */
class Host {
public:
  using InboundHandler = std::function<void(const transport::ConnectionPtr &)>;

  Host(transport::PeerId local_id, transport::TransportPtr transport,
       std::shared_ptr<PeerDirectory> directory = nullptr);
  ~Host();

  Host(const Host &) = delete;
  Host &operator=(const Host &) = delete;

  const transport::PeerId &id() const { return local_id_; }
  PeerDirectory &peerstore() { return *directory_; }
  const transport::TransportPtr &transport() const { return transport_; }

  // Install before listen(); not synchronized with running accept threads
  void set_inbound_handler(InboundHandler handler);

  bool listen(const transport::Multiaddr &addr,
              transport::TransportState &state);

  // Addresses of the listeners, in the order they were opened
  std::vector<transport::Multiaddr> listen_addresses() const;

  // Reuses a live connection, else dials the directory's addresses in order
  // until one succeeds. The state of the last failed attempt is reported.
  bool connect(const util::Context &ctx, const transport::PeerId &peer,
               transport::TransportState &state);

  transport::ConnectionPtr connection(const transport::PeerId &peer) const;
  std::vector<transport::PeerId> connected_peers() const;
  size_t connection_count() const;

  // Closes listeners, joins accept threads, closes connections. A listener
  // teardown failure is reported (LISTENER_CLOSED) after everything else was
  // still closed. Repeated calls succeed without doing anything.
  bool close(transport::TransportState &state);
  bool is_closed() const { return closed_.load(std::memory_order_acquire); }

private:
  struct ListenerEntry {
    transport::ListenerPtr listener;
    std::thread accept_thread;
  };

  void accept_loop(transport::ListenerPtr listener);
  void register_connection(const transport::ConnectionPtr &conn);

  transport::PeerId local_id_;
  transport::TransportPtr transport_;
  std::shared_ptr<PeerDirectory> directory_;
  InboundHandler inbound_handler_;

  mutable std::mutex listeners_mutex_;
  std::vector<ListenerEntry> listeners_;

  util::ThreadSafeMap<transport::PeerId, transport::ConnectionPtr> connections_;
  std::atomic<bool> closed_{false};
};

using HostPtr = std::shared_ptr<Host>;

} // namespace dht
} // namespace torlink
