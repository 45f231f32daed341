// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

/*
 Overlay collaborator interfaces

 The onion transport never talks to Tor directly. It consumes:

   OverlayClient   open a dialer session, publish a hidden service
   OverlayDialer   dial "<id>.onion:<port>" through the overlay
   HiddenService   registered service plus its raw accept source
   FramingProvider optional websocket layer over dialers and listeners

 tor/TorOverlay and tor/WebSocketFraming are the production implementations;
 tests substitute in-memory fakes.
*/

#include "transport/transport.hpp"
#include "util/context.hpp"
#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>

namespace torlink {
namespace transport {

// Failure codes of overlay and raw stream operations
enum class overlay_errc {
  success = 0,
  timed_out,
  cancelled,
  session_closed,
  connection_refused,
  host_unreachable,
  listener_closed,
  unsupported_stream,
  handshake_failed,
  protocol_error,
  authentication_failed,
  service_unavailable,
};

const boost::system::error_category &overlay_category();

boost::system::error_code make_error_code(overlay_errc e);

// timed_out for an expired deadline, cancelled otherwise (success if not done)
boost::system::error_code ContextError(const util::Context &ctx);

struct DialConfig {
  // Do not issue SETCONF DisableNetwork=0 / wait for bootstrap
  bool skip_enable_network = false;
  // SOCKS endpoint override ("host:port"); empty = ask tor
  std::string proxy_address;
};

struct ListenConfig {
  bool version3 = true;
  // Virtual port announced by the service; 0 = reuse the local port
  uint16_t remote_port = 0;
};

class OverlayDialer {
public:
  virtual ~OverlayDialer() = default;

  // Safe to call from many threads at once
  virtual RawConnectionPtr dial(const util::Context &ctx,
                                const std::string &host, uint16_t port,
                                boost::system::error_code &ec) = 0;
  virtual void close() = 0;
};

using OverlayDialerPtr = std::shared_ptr<OverlayDialer>;

class HiddenService : public RawListener {
public:
  // Onion identity without the ".onion" suffix
  virtual const std::string &service_id() const = 0;
  virtual uint16_t remote_port() const = 0;
};

using HiddenServicePtr = std::shared_ptr<HiddenService>;

class OverlayClient {
public:
  virtual ~OverlayClient() = default;

  virtual OverlayDialerPtr open_dialer(const util::Context &ctx,
                                       const DialConfig &config,
                                       boost::system::error_code &ec) = 0;

  virtual HiddenServicePtr publish(const util::Context &ctx,
                                   const ListenConfig &config,
                                   boost::system::error_code &ec) = 0;
};

using OverlayClientPtr = std::shared_ptr<OverlayClient>;

// Underlying dial primitive handed to a framed dialer
using NetDialFunction = std::function<RawConnectionPtr(
    const util::Context &, const std::string &, uint16_t,
    boost::system::error_code &)>;

class FramedDialer {
public:
  virtual ~FramedDialer() = default;

  // Dial host:port through the primitive, then run the client handshake
  virtual RawConnectionPtr dial(const util::Context &ctx,
                                const std::string &host, uint16_t port,
                                boost::system::error_code &ec) = 0;
};

class FramingProvider {
public:
  virtual ~FramingProvider() = default;

  virtual std::unique_ptr<FramedDialer>
  make_dialer(NetDialFunction net_dial,
              std::chrono::milliseconds handshake_timeout) = 0;

  // Framed accept loop layered over `source`; nullptr + ec on failure
  virtual RawListenerPtr start_listener(RawListenerPtr source,
                                        boost::system::error_code &ec) = 0;
};

using FramingProviderPtr = std::shared_ptr<FramingProvider>;

} // namespace transport
} // namespace torlink

namespace boost {
namespace system {
template <>
struct is_error_code_enum<torlink::transport::overlay_errc> : std::true_type {};
} // namespace system
} // namespace boost
