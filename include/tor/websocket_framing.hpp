// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/overlay.hpp"
#include <atomic>
#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace torlink {
namespace tor {

/**
 * WebSocketConnection - binary websocket messages as a byte stream
 *
 * Reads return message payload bytes as they arrive (message boundaries are
 * not preserved); each write_all() sends one binary message.
 */
class WebSocketConnection
    : public transport::RawConnection,
      public std::enable_shared_from_this<WebSocketConnection> {
public:
  using tcp = boost::asio::ip::tcp;
  using Stream = boost::beast::websocket::stream<tcp::socket>;

  // Client side: run the HTTP upgrade for ws://<host>:<port>/
  static std::shared_ptr<WebSocketConnection>
  Handshake(tcp::socket socket, const util::Context &ctx,
            const std::string &host, uint16_t port,
            boost::system::error_code &ec);

  // Server side: answer the upgrade request
  static std::shared_ptr<WebSocketConnection>
  Accept(tcp::socket socket, const util::Context &ctx,
         boost::system::error_code &ec);

  ~WebSocketConnection() override;

  size_t read_some(const util::Context &ctx, uint8_t *data, size_t size,
                   boost::system::error_code &ec) override;
  size_t write_all(const util::Context &ctx, const uint8_t *data, size_t size,
                   boost::system::error_code &ec) override;

  void close() override;
  bool is_open() const override { return open_.load(std::memory_order_acquire); }

  std::string local_endpoint() const override { return local_; }
  std::string remote_endpoint() const override { return remote_; }

private:
  explicit WebSocketConnection(tcp::socket socket);

  std::function<void()> make_cancel();

  Stream ws_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  std::atomic<bool> open_{false};
  std::string local_;
  std::string remote_;
};

/**
 * WebSocketFraming - FramingProvider built on Boost.Beast
 *
 * Works only over socket-backed overlay streams (tor::SocketConnection);
 * anything else fails with overlay_errc::unsupported_stream.
 */
class WebSocketFraming : public transport::FramingProvider {
public:
  // Bound on the server-side upgrade of each inbound stream
  explicit WebSocketFraming(std::chrono::milliseconds accept_timeout =
                                std::chrono::seconds(45))
      : accept_timeout_(accept_timeout) {}

  std::unique_ptr<transport::FramedDialer>
  make_dialer(transport::NetDialFunction net_dial,
              std::chrono::milliseconds handshake_timeout) override;

  transport::RawListenerPtr
  start_listener(transport::RawListenerPtr source,
                 boost::system::error_code &ec) override;

private:
  std::chrono::milliseconds accept_timeout_;
};

} // namespace tor
} // namespace torlink
