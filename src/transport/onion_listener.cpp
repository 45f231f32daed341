// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "transport/onion_listener.hpp"
#include "util/logging.hpp"

namespace torlink {
namespace transport {

std::shared_ptr<OnionListener>
OnionListener::create(HiddenServicePtr service, const AddressCodec &codec,
                      const FramingProviderPtr &framing,
                      TransportState &state) {
  Multiaddr addr = codec.to_multiaddr(service->service_id(),
                                      service->remote_port(), framing != nullptr);

  RawListenerPtr active = service;
  if (framing) {
    boost::system::error_code ec;
    active = framing->start_listener(service, ec);
    if (!active || ec) {
      const std::string cause =
          ec ? ec.message() : std::string("framing provider returned no listener");
      // Roll back the registration so no unusable service stays published
      auto teardown_ec = service->close();
      if (teardown_ec) {
        LOG_NET_WARN("removing hidden service {} after failed setup: {}",
                     service->service_id(), teardown_ec.message());
      }
      state.Error(TransportError::LISTENER_SETUP_FAILED,
                  "failed creating websocket listener", cause);
      return nullptr;
    }
  }

  LOG_NET_INFO("listening on {}", addr.to_string());
  return std::shared_ptr<OnionListener>(
      new OnionListener(std::move(service), std::move(active), std::move(addr)));
}

OnionListener::OnionListener(HiddenServicePtr service, RawListenerPtr active,
                             Multiaddr multiaddr)
    : service_(std::move(service)), active_(std::move(active)),
      multiaddr_(std::move(multiaddr)) {}

OnionListener::~OnionListener() {
  auto ec = close();
  if (ec) {
    LOG_NET_DEBUG("hidden service teardown in destructor: {}", ec.message());
  }
}

MultiaddrConnectionPtr OnionListener::accept(TransportState &state) {
  boost::system::error_code ec;
  RawConnectionPtr raw = active_->accept(ec);
  if (!raw || ec) {
    state.Error(TransportError::LISTENER_CLOSED, "accept source closed",
                ec ? ec.message() : std::string());
    return nullptr;
  }

  const std::string endpoint = raw->remote_endpoint();
  auto remote = Multiaddr::from_endpoint(endpoint);
  if (!remote) {
    raw->close();
    state.Error(TransportError::ADDRESS_FORMAT_INVALID,
                "cannot convert remote endpoint", endpoint);
    return nullptr;
  }
  return std::make_shared<MultiaddrConnection>(std::move(raw), multiaddr_,
                                               std::move(*remote),
                                               Direction::INBOUND);
}

boost::system::error_code OnionListener::close() {
  if (closed_.exchange(true)) {
    return {};
  }
  if (active_ != service_) {
    auto ec = active_->close();
    if (ec) {
      LOG_NET_DEBUG("closing framed listener: {}", ec.message());
    }
  }
  LOG_NET_DEBUG("removing hidden service {}", service_->service_id());
  return service_->close();
}

} // namespace transport
} // namespace torlink
