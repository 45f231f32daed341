// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/multiaddr.hpp"
#include "transport/transport_state.hpp"
#include "util/context.hpp"
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace torlink {
namespace transport {

// Abstract transport interfaces
//
// Layering, bottom to top:
// - RawConnection / RawListener: byte streams produced by the overlay
//   (SOCKS stream, hidden service accept, websocket framed stream)
// - MultiaddrConnection: raw stream tagged with local/remote multiaddrs
// - Connection: stream after the Upgrader negotiated peer identities
// - Transport / Listener: what the host dials and listens through
//
// Implementations:
// - OnionTransport / OnionListener: Tor overlay (transport/)
// - SocketConnection, TorOverlay, WebSocketFraming: real sockets (tor/)
// - FakeOverlay, PipeConnection: in-memory doubles (test/transport/infra)

using PeerId = std::string;

enum class Direction { INBOUND, OUTBOUND };

const char *DirectionAsString(Direction direction);

// RawConnection - blocking byte stream
//
// read_some() and write_all() block until data moved, the stream failed, or
// `ctx` expired (ec = overlay_errc::timed_out / cancelled). Calls from
// different threads are allowed as long as there is at most one reader and
// one writer at a time.
class RawConnection {
public:
  virtual ~RawConnection() = default;

  virtual size_t read_some(const util::Context &ctx, uint8_t *data,
                           size_t size, boost::system::error_code &ec) = 0;
  virtual size_t write_all(const util::Context &ctx, const uint8_t *data,
                           size_t size, boost::system::error_code &ec) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  // Numeric "ip:port", or empty if not known
  virtual std::string local_endpoint() const = 0;
  virtual std::string remote_endpoint() const = 0;
};

using RawConnectionPtr = std::shared_ptr<RawConnection>;

// Loop read_some() until `size` bytes arrived
bool ReadExact(RawConnection &conn, const util::Context &ctx, uint8_t *data,
               size_t size, boost::system::error_code &ec);

// RawListener - blocking accept source
class RawListener {
public:
  virtual ~RawListener() = default;

  // Blocks until a stream arrives; overlay_errc::listener_closed once closed
  virtual RawConnectionPtr accept(boost::system::error_code &ec) = 0;

  // Returns the teardown error, if any; repeated calls are no-ops
  virtual boost::system::error_code close() = 0;

  virtual std::string local_endpoint() const = 0;
};

using RawListenerPtr = std::shared_ptr<RawListener>;

// MultiaddrConnection - raw stream plus addressing metadata
class MultiaddrConnection {
public:
  MultiaddrConnection(RawConnectionPtr raw, Multiaddr local, Multiaddr remote,
                      Direction direction)
      : raw_(std::move(raw)), local_(std::move(local)),
        remote_(std::move(remote)), direction_(direction) {}

  RawConnection &raw() { return *raw_; }
  const RawConnectionPtr &raw_ptr() const { return raw_; }
  const Multiaddr &local_multiaddr() const { return local_; }
  const Multiaddr &remote_multiaddr() const { return remote_; }
  Direction direction() const { return direction_; }

  void close() { raw_->close(); }

private:
  RawConnectionPtr raw_;
  Multiaddr local_;
  Multiaddr remote_;
  Direction direction_;
};

using MultiaddrConnectionPtr = std::shared_ptr<MultiaddrConnection>;

// Connection - upgraded stream with authenticated peer identities
class Connection {
public:
  virtual ~Connection() = default;

  virtual const PeerId &local_peer() const = 0;
  virtual const PeerId &remote_peer() const = 0;
  virtual const Multiaddr &local_multiaddr() const = 0;
  virtual const Multiaddr &remote_multiaddr() const = 0;
  virtual Direction direction() const = 0;

  virtual size_t read_some(const util::Context &ctx, uint8_t *data,
                           size_t size, boost::system::error_code &ec) = 0;
  virtual size_t write_all(const util::Context &ctx, const uint8_t *data,
                           size_t size, boost::system::error_code &ec) = 0;

  virtual void close() = 0;
  virtual bool is_closed() const = 0;
};

using ConnectionPtr = std::shared_ptr<Connection>;

// NetListener - accept contract before upgrade
class NetListener {
public:
  virtual ~NetListener() = default;

  // nullptr + LISTENER_CLOSED once the source is gone; nullptr +
  // ADDRESS_FORMAT_INVALID for a single bad inbound stream (keep accepting)
  virtual MultiaddrConnectionPtr accept(TransportState &state) = 0;
  virtual boost::system::error_code close() = 0;
  virtual const Multiaddr &multiaddr() const = 0;
};

using NetListenerPtr = std::shared_ptr<NetListener>;

// Listener - accept contract handed to the host
class Listener {
public:
  virtual ~Listener() = default;

  // Blocks until an upgraded inbound connection is ready or the listener
  // closed (nullptr + LISTENER_CLOSED)
  virtual ConnectionPtr accept(TransportState &state) = 0;
  // Teardown error of the underlying registration, if any; idempotent
  virtual boost::system::error_code close() = 0;
  virtual const Multiaddr &multiaddr() const = 0;
};

using ListenerPtr = std::shared_ptr<Listener>;

// Upgrader - security/multiplexing negotiation collaborator
//
// On failure returns nullptr and fills `state`; the caller closes the raw
// connection.
class Upgrader {
public:
  virtual ~Upgrader() = default;

  virtual ConnectionPtr upgrade_outbound(const util::Context &ctx,
                                         const MultiaddrConnectionPtr &conn,
                                         const PeerId &remote_peer,
                                         TransportState &state) = 0;
  virtual ConnectionPtr upgrade_inbound(const util::Context &ctx,
                                        const MultiaddrConnectionPtr &conn,
                                        TransportState &state) = 0;
};

using UpgraderPtr = std::shared_ptr<Upgrader>;

// Transport - pluggable transport contract seen by the host
class Transport {
public:
  virtual ~Transport() = default;

  virtual ConnectionPtr dial(const util::Context &ctx, const Multiaddr &addr,
                             const PeerId &peer, TransportState &state) = 0;

  virtual ListenerPtr listen(const Multiaddr &addr, TransportState &state) = 0;

  // Side-effect free
  virtual bool can_dial(const Multiaddr &addr) const = 0;

  virtual std::vector<Protocol> protocols() const = 0;

  // True when dialed addresses are not routable outside this transport
  virtual bool proxy() const = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

} // namespace transport
} // namespace torlink
