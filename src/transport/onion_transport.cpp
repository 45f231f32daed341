// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "transport/onion_transport.hpp"
#include "transport/onion_listener.hpp"
#include "transport/upgrader.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace torlink {
namespace transport {

OnionTransport::OnionTransport(OverlayClientPtr overlay, UpgraderPtr upgrader,
                               TransportConfig config, AddressCodec codec,
                               FramingProviderPtr framing)
    : overlay_(std::move(overlay)), upgrader_(std::move(upgrader)),
      config_(std::move(config)), codec_(std::move(codec)),
      framing_(std::move(framing)) {
  if (!overlay_) {
    throw std::invalid_argument("OnionTransport requires an overlay client");
  }
  if (!upgrader_) {
    throw std::invalid_argument("OnionTransport requires an upgrader");
  }
  if (config_.websocket && !framing_) {
    throw std::invalid_argument(
        "websocket mode requires a framing provider");
  }
}

OnionTransport::~OnionTransport() { close(); }

bool OnionTransport::ensure_session(const util::Context &ctx,
                                    TransportState &state) {
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (closed_) {
      return state.Error(TransportError::SESSION_INIT_FAILED,
                         "transport is closed");
    }
    if (session_) {
      return true;
    }
  }

  // One initializer at a time; the others wait here for its outcome.
  // session_mutex_ is not held while tor bootstraps so close() stays prompt.
  std::lock_guard<std::mutex> init_lock(init_mutex_);
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (closed_) {
      return state.Error(TransportError::SESSION_INIT_FAILED,
                         "transport is closed");
    }
    if (session_) {
      return true;
    }
  }

  boost::system::error_code ec;
  OverlayDialerPtr dialer = overlay_->open_dialer(ctx, config_.dial, ec);
  if (!dialer || ec) {
    LOG_NET_DEBUG("failed initializing dialers: {}",
                  ec ? ec.message() : "no dialer");
    return state.Error(TransportError::SESSION_INIT_FAILED,
                       "failed creating tor dialer",
                       ec ? ec.message() : std::string());
  }

  auto session = std::make_shared<DialSession>();
  session->dialer = dialer;
  if (config_.websocket) {
    // The framed dialer reuses the overlay dialer as its dial primitive
    NetDialFunction net_dial = [dialer](const util::Context &dial_ctx,
                                        const std::string &host, uint16_t port,
                                        boost::system::error_code &dial_ec) {
      return dialer->dial(dial_ctx, host, port, dial_ec);
    };
    session->framed =
        framing_->make_dialer(std::move(net_dial), config_.handshake_timeout);
    if (!session->framed) {
      dialer->close();
      return state.Error(TransportError::SESSION_INIT_FAILED,
                         "failed creating websocket dialer");
    }
  }

  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!closed_) {
      session_ = std::move(session);
      LOG_NET_DEBUG("dial session ready (websocket={})", config_.websocket);
      return true;
    }
  }
  // Closed while the overlay was bootstrapping
  dialer->close();
  return state.Error(TransportError::SESSION_INIT_FAILED,
                     "transport is closed");
}

bool OnionTransport::has_session() const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return session_ != nullptr;
}

std::shared_ptr<DialSession> OnionTransport::current_session() const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return session_;
}

void OnionTransport::close() {
  std::shared_ptr<DialSession> session;
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    session = std::move(session_);
  }
  if (session && session->dialer) {
    session->dialer->close();
  }
}

ConnectionPtr OnionTransport::dial(const util::Context &ctx,
                                   const Multiaddr &addr, const PeerId &peer,
                                   TransportState &state) {
  LOG_NET_DEBUG("for peer {}, dialing {}", peer, addr.to_string());

  OnionEndpoint endpoint;
  if (!codec_.decode(addr, endpoint, state)) {
    return nullptr;
  }
  if (!ensure_session(ctx, state)) {
    return nullptr;
  }
  auto session = current_session();
  if (!session) {
    state.Error(TransportError::SESSION_INIT_FAILED, "transport is closed");
    return nullptr;
  }

  const std::string host = endpoint.service_id + "." + codec_.suffix();
  boost::system::error_code ec;
  RawConnectionPtr raw;
  if (session->framed) {
    LOG_NET_TRACE("dialing ws://{}", codec_.encode(endpoint));
    raw = session->framed->dial(ctx, host, endpoint.port, ec);
  } else {
    raw = session->dialer->dial(ctx, host, endpoint.port, ec);
  }
  if (!raw || ec) {
    if (raw) {
      raw->close();
    }
    const std::string cause = ec ? ec.message() : std::string("no stream");
    LOG_NET_DEBUG("failed dialing {}: {}", codec_.encode(endpoint), cause);
    state.Error(TransportError::DIAL_FAILED, "failed dialing " +
                                                 codec_.encode(endpoint),
                cause);
    return nullptr;
  }

  auto local = Multiaddr::from_endpoint(raw->local_endpoint());
  auto conn = std::make_shared<MultiaddrConnection>(
      raw, local ? *local : Multiaddr(), addr, Direction::OUTBOUND);

  TransportState upgrade_state;
  ConnectionPtr upgraded =
      upgrader_->upgrade_outbound(ctx, conn, peer, upgrade_state);
  if (!upgraded) {
    conn->close();
    LOG_NET_DEBUG("failed upgrading connection to {}: {}", peer,
                  upgrade_state.ToString());
    state.Error(TransportError::UPGRADE_FAILED,
                "failed upgrading connection to " + peer,
                upgrade_state.IsError() ? upgrade_state.ToString()
                                        : std::string());
    return nullptr;
  }
  return upgraded;
}

ListenerPtr OnionTransport::listen(const Multiaddr &addr,
                                   TransportState &state) {
  LOG_NET_DEBUG("called listen for {}", addr.to_string());
  if (!codec_.is_listen_marker(addr)) {
    auto value = addr.value_for_protocol(Protocol::ONION_LISTEN);
    if (value && !value->empty()) {
      state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                  "must be '/onionListen', got '/onionListen/" + *value + "'");
    } else {
      state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                  "must be '/onionListen'", addr.to_string());
    }
    return nullptr;
  }

  auto ctx = util::Context::WithTimeout(util::Context(), config_.listen_timeout);
  boost::system::error_code ec;
  HiddenServicePtr service = overlay_->publish(ctx, config_.listen, ec);
  if (!service || ec) {
    const std::string cause = ec ? ec.message() : std::string("no service");
    LOG_NET_DEBUG("failed creating onion service: {}", cause);
    if (service) {
      auto teardown_ec = service->close();
      if (teardown_ec) {
        LOG_NET_WARN("removing partial hidden service: {}",
                     teardown_ec.message());
      }
    }
    state.Error(TransportError::SERVICE_REGISTRATION_FAILED,
                "failed creating onion service", cause);
    return nullptr;
  }
  LOG_NET_INFO("published hidden service {}", service->service_id());

  auto listener = OnionListener::create(
      std::move(service), codec_, config_.websocket ? framing_ : nullptr,
      state);
  if (!listener) {
    return nullptr;
  }
  return std::make_shared<UpgradedListener>(std::move(listener), upgrader_,
                                            config_.handshake_timeout);
}

bool OnionTransport::can_dial(const Multiaddr &addr) const {
  OnionEndpoint endpoint;
  TransportState state;
  return codec_.decode(addr, endpoint, state);
}

std::vector<Protocol> OnionTransport::protocols() const {
  return {Protocol::TCP, Protocol::ONION, Protocol::ONION3,
          Protocol::ONION_LISTEN};
}

} // namespace transport
} // namespace torlink
