// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "tor/websocket_framing.hpp"
#include "tor/socket_connection.hpp"
#include "util/logging.hpp"

namespace torlink {
namespace tor {

namespace websocket = boost::beast::websocket;
using transport::make_error_code;
using transport::overlay_errc;

namespace {

std::string FormatEndpoint(const boost::asio::ip::tcp::endpoint &ep) {
  if (ep.address().is_v6()) {
    return "[" + ep.address().to_string() + "]:" + std::to_string(ep.port());
  }
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

// ============================================================================
// WebSocketConnection
// ============================================================================

WebSocketConnection::WebSocketConnection(tcp::socket socket)
    : ws_(std::move(socket)), strand_(ws_.get_executor()) {
  boost::system::error_code ec;
  auto local = boost::beast::get_lowest_layer(ws_).local_endpoint(ec);
  if (!ec) {
    local_ = FormatEndpoint(local);
  }
  auto remote = boost::beast::get_lowest_layer(ws_).remote_endpoint(ec);
  if (!ec) {
    remote_ = FormatEndpoint(remote);
  }
  ws_.binary(true);
}

WebSocketConnection::~WebSocketConnection() = default;

std::function<void()> WebSocketConnection::make_cancel() {
  auto self = shared_from_this();
  return [self]() {
    boost::asio::post(self->strand_, [self]() {
      boost::system::error_code ignored;
      boost::beast::get_lowest_layer(self->ws_).cancel(ignored);
    });
  };
}

std::shared_ptr<WebSocketConnection>
WebSocketConnection::Handshake(tcp::socket socket, const util::Context &ctx,
                               const std::string &host, uint16_t port,
                               boost::system::error_code &ec) {
  auto conn = std::shared_ptr<WebSocketConnection>(
      new WebSocketConnection(std::move(socket)));
  conn->ws_.set_option(
      websocket::stream_base::timeout::suggested(boost::beast::role_type::client));

  const std::string host_header = host + ":" + std::to_string(port);
  auto promise = std::make_shared<std::promise<IoResult>>();
  auto future = promise->get_future();
  boost::asio::post(conn->strand_, [conn, promise, host_header]() {
    conn->ws_.async_handshake(
        host_header, "/",
        boost::asio::bind_executor(
            conn->strand_, [promise](const boost::system::error_code &hs_ec) {
              promise->set_value({hs_ec, 0});
            }));
  });

  bool interrupted = false;
  IoResult result = AwaitIo(future, ctx, conn->make_cancel(), interrupted);
  ec = result.ec;
  if (interrupted && ec) {
    ec = transport::ContextError(ctx);
  }
  if (ec) {
    LOG_NET_DEBUG("websocket handshake with ws://{}/ failed: {}", host_header,
                  ec.message());
    boost::system::error_code ignored;
    boost::beast::get_lowest_layer(conn->ws_).close(ignored);
    return nullptr;
  }
  conn->open_ = true;
  return conn;
}

std::shared_ptr<WebSocketConnection>
WebSocketConnection::Accept(tcp::socket socket, const util::Context &ctx,
                            boost::system::error_code &ec) {
  auto conn = std::shared_ptr<WebSocketConnection>(
      new WebSocketConnection(std::move(socket)));
  conn->ws_.set_option(
      websocket::stream_base::timeout::suggested(boost::beast::role_type::server));

  auto promise = std::make_shared<std::promise<IoResult>>();
  auto future = promise->get_future();
  boost::asio::post(conn->strand_, [conn, promise]() {
    conn->ws_.async_accept(boost::asio::bind_executor(
        conn->strand_, [promise](const boost::system::error_code &accept_ec) {
          promise->set_value({accept_ec, 0});
        }));
  });

  bool interrupted = false;
  IoResult result = AwaitIo(future, ctx, conn->make_cancel(), interrupted);
  ec = result.ec;
  if (interrupted && ec) {
    ec = transport::ContextError(ctx);
  }
  if (ec) {
    boost::system::error_code ignored;
    boost::beast::get_lowest_layer(conn->ws_).close(ignored);
    return nullptr;
  }
  conn->open_ = true;
  return conn;
}

size_t WebSocketConnection::read_some(const util::Context &ctx, uint8_t *data,
                                      size_t size,
                                      boost::system::error_code &ec) {
  if (!is_open()) {
    ec = make_error_code(overlay_errc::session_closed);
    return 0;
  }
  auto self = shared_from_this();
  auto promise = std::make_shared<std::promise<IoResult>>();
  auto future = promise->get_future();
  boost::asio::post(strand_, [this, self, promise, data, size]() {
    ws_.async_read_some(
        boost::asio::buffer(data, size),
        boost::asio::bind_executor(
            strand_, [promise](const boost::system::error_code &read_ec,
                               size_t n) { promise->set_value({read_ec, n}); }));
  });

  bool interrupted = false;
  IoResult result = AwaitIo(future, ctx, make_cancel(), interrupted);
  ec = result.ec;
  if (interrupted && ec) {
    ec = transport::ContextError(ctx);
  }
  return result.bytes;
}

size_t WebSocketConnection::write_all(const util::Context &ctx,
                                      const uint8_t *data, size_t size,
                                      boost::system::error_code &ec) {
  if (!is_open()) {
    ec = make_error_code(overlay_errc::session_closed);
    return 0;
  }
  auto self = shared_from_this();
  auto promise = std::make_shared<std::promise<IoResult>>();
  auto future = promise->get_future();
  boost::asio::post(strand_, [this, self, promise, data, size]() {
    ws_.async_write(
        boost::asio::buffer(data, size),
        boost::asio::bind_executor(
            strand_, [promise](const boost::system::error_code &write_ec,
                               size_t n) { promise->set_value({write_ec, n}); }));
  });

  bool interrupted = false;
  IoResult result = AwaitIo(future, ctx, make_cancel(), interrupted);
  ec = result.ec;
  if (interrupted && ec) {
    ec = transport::ContextError(ctx);
  }
  return result.bytes;
}

void WebSocketConnection::close() {
  if (!open_.exchange(false)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    // Close frame first; the socket goes away when the handshake ends or the
    // stream's close timeout fires
    self->ws_.async_close(
        websocket::close_code::normal,
        boost::asio::bind_executor(
            self->strand_, [self](const boost::system::error_code &close_ec) {
              if (close_ec) {
                LOG_NET_TRACE("websocket close: {}", close_ec.message());
              }
              boost::system::error_code ignored;
              boost::beast::get_lowest_layer(self->ws_).close(ignored);
            }));
  });
}

// ============================================================================
// WebSocketFraming
// ============================================================================

namespace {

class WebSocketDialer : public transport::FramedDialer {
public:
  WebSocketDialer(transport::NetDialFunction net_dial,
                  std::chrono::milliseconds handshake_timeout)
      : net_dial_(std::move(net_dial)), handshake_timeout_(handshake_timeout) {}

  transport::RawConnectionPtr dial(const util::Context &ctx,
                                   const std::string &host, uint16_t port,
                                   boost::system::error_code &ec) override {
    auto raw = net_dial_(ctx, host, port, ec);
    if (!raw || ec) {
      if (raw) {
        raw->close();
      }
      if (!ec) {
        ec = make_error_code(overlay_errc::session_closed);
      }
      return nullptr;
    }
    auto socket_conn = std::dynamic_pointer_cast<SocketConnection>(raw);
    if (!socket_conn) {
      raw->close();
      ec = make_error_code(overlay_errc::unsupported_stream);
      return nullptr;
    }
    auto hs_ctx = util::Context::WithTimeout(ctx, handshake_timeout_);
    return WebSocketConnection::Handshake(socket_conn->release_socket(), hs_ctx,
                                          host, port, ec);
  }

private:
  transport::NetDialFunction net_dial_;
  std::chrono::milliseconds handshake_timeout_;
};

// Upgrades each stream of `source`; the source itself stays owned by the
// caller
class WebSocketListener : public transport::RawListener {
public:
  WebSocketListener(transport::RawListenerPtr source,
                    std::chrono::milliseconds accept_timeout)
      : source_(std::move(source)), accept_timeout_(accept_timeout) {}

  transport::RawConnectionPtr accept(boost::system::error_code &ec) override {
    while (!closed_.load(std::memory_order_acquire)) {
      auto raw = source_->accept(ec);
      if (!raw) {
        return nullptr;
      }
      auto socket_conn = std::dynamic_pointer_cast<SocketConnection>(raw);
      if (!socket_conn) {
        LOG_NET_DEBUG("dropping inbound stream: not socket backed");
        raw->close();
        continue;
      }
      const std::string remote = socket_conn->remote_endpoint();
      auto ctx = util::Context::WithTimeout(util::Context(), accept_timeout_);
      auto ws =
          WebSocketConnection::Accept(socket_conn->release_socket(), ctx, ec);
      if (!ws) {
        LOG_NET_DEBUG("websocket upgrade from {} failed: {}", remote,
                      ec.message());
        continue;
      }
      ec.clear();
      return ws;
    }
    ec = make_error_code(overlay_errc::listener_closed);
    return nullptr;
  }

  boost::system::error_code close() override {
    closed_.store(true, std::memory_order_release);
    return {};
  }

  std::string local_endpoint() const override {
    return source_->local_endpoint();
  }

private:
  transport::RawListenerPtr source_;
  std::chrono::milliseconds accept_timeout_;
  std::atomic<bool> closed_{false};
};

} // namespace

std::unique_ptr<transport::FramedDialer>
WebSocketFraming::make_dialer(transport::NetDialFunction net_dial,
                              std::chrono::milliseconds handshake_timeout) {
  return std::make_unique<WebSocketDialer>(std::move(net_dial),
                                           handshake_timeout);
}

transport::RawListenerPtr
WebSocketFraming::start_listener(transport::RawListenerPtr source,
                                 boost::system::error_code &ec) {
  if (!source) {
    ec = make_error_code(overlay_errc::listener_closed);
    return nullptr;
  }
  ec.clear();
  return std::make_shared<WebSocketListener>(std::move(source),
                                             accept_timeout_);
}

} // namespace tor
} // namespace torlink
