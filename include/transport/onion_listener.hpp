// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/address_codec.hpp"
#include "transport/overlay.hpp"
#include "transport/transport.hpp"
#include <atomic>
#include <memory>

namespace torlink {
namespace transport {

/**
 * OnionListener - accept side of one published hidden service
 *
 * Owns the service registration. The active accept source is either the
 * service itself or a framed listener layered over it (websocket mode).
 * close() removes the service; it is safe to call more than once.
 */
class OnionListener : public NetListener {
public:
  /**
   * Build a listener over a freshly published service
   *
   * When `framing` is set a framed listener is started over the service. If
   * that fails the service is torn down (a teardown error is only logged)
   * and nullptr is returned with LISTENER_SETUP_FAILED.
   */
  static std::shared_ptr<OnionListener>
  create(HiddenServicePtr service, const AddressCodec &codec,
         const FramingProviderPtr &framing, TransportState &state);

  ~OnionListener() override;

  OnionListener(const OnionListener &) = delete;
  OnionListener &operator=(const OnionListener &) = delete;

  MultiaddrConnectionPtr accept(TransportState &state) override;
  boost::system::error_code close() override;
  const Multiaddr &multiaddr() const override { return multiaddr_; }

  const std::string &service_id() const { return service_->service_id(); }
  bool framed() const { return active_ != service_; }
  bool is_closed() const { return closed_.load(std::memory_order_acquire); }

private:
  OnionListener(HiddenServicePtr service, RawListenerPtr active,
                Multiaddr multiaddr);

  HiddenServicePtr service_;
  RawListenerPtr active_;
  Multiaddr multiaddr_;
  std::atomic<bool> closed_{false};
};

} // namespace transport
} // namespace torlink
