// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "dht/host.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace torlink {
namespace dht {

using transport::ConnectionPtr;
using transport::Multiaddr;
using transport::TransportError;
using transport::TransportState;

Host::Host(transport::PeerId local_id, transport::TransportPtr transport,
           std::shared_ptr<PeerDirectory> directory)
    : local_id_(std::move(local_id)), transport_(std::move(transport)),
      directory_(directory ? std::move(directory)
                           : std::make_shared<PeerDirectory>()) {
  if (local_id_.empty()) {
    throw std::invalid_argument("Host requires a local peer id");
  }
  if (!transport_) {
    throw std::invalid_argument("Host requires a transport");
  }
}

Host::~Host() {
  TransportState state;
  if (!close(state)) {
    LOG_DHT_WARN("host teardown: {}", state.ToString());
  }
}

void Host::set_inbound_handler(InboundHandler handler) {
  inbound_handler_ = std::move(handler);
}

bool Host::listen(const Multiaddr &addr, TransportState &state) {
  if (is_closed()) {
    return state.Error(TransportError::LISTENER_SETUP_FAILED, "host closed");
  }
  auto listener = transport_->listen(addr, state);
  if (!listener) {
    return false;
  }

  std::lock_guard<std::mutex> lock(listeners_mutex_);
  if (is_closed()) {
    auto ec = listener->close();
    if (ec) {
      LOG_DHT_WARN("closing listener opened during shutdown: {}", ec.message());
    }
    return state.Error(TransportError::LISTENER_SETUP_FAILED, "host closed");
  }
  LOG_DHT_INFO("listening on {}", listener->multiaddr().to_string());
  ListenerEntry entry;
  entry.listener = listener;
  entry.accept_thread = std::thread([this, listener] { accept_loop(listener); });
  listeners_.push_back(std::move(entry));
  return true;
}

std::vector<Multiaddr> Host::listen_addresses() const {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  std::vector<Multiaddr> out;
  out.reserve(listeners_.size());
  for (const auto &entry : listeners_) {
    out.push_back(entry.listener->multiaddr());
  }
  return out;
}

void Host::accept_loop(transport::ListenerPtr listener) {
  for (;;) {
    TransportState state;
    auto conn = listener->accept(state);
    if (!conn) {
      if (!is_closed()) {
        LOG_DHT_WARN("accept loop on {} ended: {}",
                     listener->multiaddr().to_string(), state.ToString());
      }
      return;
    }
    LOG_DHT_DEBUG("inbound connection from {} via {}", conn->remote_peer(),
                  conn->remote_multiaddr().to_string());
    register_connection(conn);
    if (inbound_handler_) {
      inbound_handler_(conn);
    }
  }
}

void Host::register_connection(const ConnectionPtr &conn) {
  // Drop connections that went away since the last registration
  const size_t pruned = connections_.EraseIf(
      [&](const transport::PeerId &id, const ConnectionPtr &existing) {
        return id != conn->remote_peer() && (!existing || existing->is_closed());
      });
  if (pruned > 0) {
    LOG_DHT_TRACE("pruned {} closed connections", pruned);
  }
  ConnectionPtr replaced;
  connections_.Upsert(conn->remote_peer(), [&](ConnectionPtr &slot) {
    if (slot && !slot->is_closed()) {
      replaced = slot;
    }
    slot = conn;
    return true;
  });
  // Newest connection wins; the older one is no longer reachable
  if (replaced && replaced != conn) {
    replaced->close();
  }
  if (is_closed()) {
    conn->close();
  }
}

bool Host::connect(const util::Context &ctx, const transport::PeerId &peer,
                   TransportState &state) {
  if (is_closed()) {
    return state.Error(TransportError::DIAL_FAILED, "host closed");
  }
  auto existing = connection(peer);
  if (existing && !existing->is_closed()) {
    return true;
  }

  const auto addrs = directory_->addrs(peer);
  if (addrs.empty()) {
    return state.Error(TransportError::DIAL_FAILED, "no addresses for peer",
                       peer);
  }

  state.Error(TransportError::DIAL_FAILED, "no dialable address for peer",
              peer);
  for (const auto &addr : addrs) {
    if (ctx.Done()) {
      return state.Error(TransportError::CANCELLED, ctx.Error(), peer);
    }
    if (!transport_->can_dial(addr)) {
      LOG_DHT_DEBUG("skipping {} for {}: transport cannot dial it",
                    addr.to_string(), peer);
      continue;
    }
    TransportState attempt;
    auto conn = transport_->dial(ctx, addr, peer, attempt);
    if (!conn) {
      LOG_DHT_DEBUG("dial {} at {} failed: {}", peer, addr.to_string(),
                    attempt.ToString());
      state = attempt;
      continue;
    }
    register_connection(conn);
    state.Reset();
    LOG_DHT_INFO("connected to {} at {}", peer, addr.to_string());
    return true;
  }
  return false;
}

ConnectionPtr Host::connection(const transport::PeerId &peer) const {
  auto conn = connections_.Get(peer);
  return conn ? *conn : nullptr;
}

std::vector<transport::PeerId> Host::connected_peers() const {
  std::vector<transport::PeerId> out;
  connections_.ForEach([&](const transport::PeerId &id,
                           const ConnectionPtr &conn) {
    if (conn && !conn->is_closed()) {
      out.push_back(id);
    }
  });
  return out;
}

size_t Host::connection_count() const { return connected_peers().size(); }

bool Host::close(TransportState &state) {
  if (closed_.exchange(true)) {
    return true;
  }

  std::vector<ListenerEntry> entries;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    entries.swap(listeners_);
  }

  boost::system::error_code first_error;
  std::string failed_addr;
  for (auto &entry : entries) {
    auto ec = entry.listener->close();
    if (ec && !first_error) {
      first_error = ec;
      failed_addr = entry.listener->multiaddr().to_string();
    }
  }
  for (auto &entry : entries) {
    if (entry.accept_thread.joinable()) {
      entry.accept_thread.join();
    }
  }

  for (auto &[id, conn] : connections_.TakeAll()) {
    if (conn) {
      conn->close();
    }
  }

  if (first_error) {
    return state.Error(TransportError::LISTENER_CLOSED,
                       "failed closing listener " + failed_addr,
                       first_error.message());
  }
  return true;
}

} // namespace dht
} // namespace torlink
