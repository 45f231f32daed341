// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "tor/socket_connection.hpp"
#include "transport/overlay.hpp"
#include "util/logging.hpp"

namespace torlink {
namespace tor {

using transport::make_error_code;
using transport::overlay_errc;

namespace {

// How often a blocked caller re-checks its context
constexpr std::chrono::milliseconds POLL_SLICE{50};

std::string FormatEndpoint(const boost::asio::ip::tcp::endpoint &ep) {
  if (ep.address().is_v6()) {
    return "[" + ep.address().to_string() + "]:" + std::to_string(ep.port());
  }
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

IoResult AwaitIo(std::future<IoResult> &future, const util::Context &ctx,
                 const std::function<void()> &cancel, bool &interrupted) {
  interrupted = false;
  try {
    while (future.wait_for(POLL_SLICE) != std::future_status::ready) {
      if (!interrupted && ctx.Done()) {
        interrupted = true;
        cancel();
      }
    }
    return future.get();
  } catch (const std::future_error &e) {
    LOG_TOR_TRACE("io handler dropped before completion: {}", e.what());
    return {make_error_code(overlay_errc::session_closed), 0};
  }
}

// ============================================================================
// SocketConnection
// ============================================================================

SocketConnection::SocketConnection(tcp::socket socket)
    : socket_(std::move(socket)), strand_(socket_.get_executor()) {}

SocketConnection::~SocketConnection() = default;

std::shared_ptr<SocketConnection>
SocketConnection::Connect(boost::asio::io_context &io_context,
                          const util::Context &ctx, const std::string &host,
                          uint16_t port, boost::system::error_code &ec) {
  auto conn = std::shared_ptr<SocketConnection>(
      new SocketConnection(tcp::socket(io_context)));
  auto resolver = std::make_shared<tcp::resolver>(io_context);
  auto cancelled = std::make_shared<bool>(false); // strand only
  auto promise = std::make_shared<std::promise<IoResult>>();
  auto future = promise->get_future();

  boost::asio::post(conn->strand_, [conn, resolver, cancelled, promise, host,
                                    port]() {
    resolver->async_resolve(
        host, std::to_string(port),
        boost::asio::bind_executor(
            conn->strand_,
            [conn, resolver, cancelled,
             promise](const boost::system::error_code &resolve_ec,
                      tcp::resolver::results_type results) {
              if (resolve_ec || *cancelled) {
                promise->set_value(
                    {resolve_ec ? resolve_ec
                                : boost::system::error_code(
                                      boost::asio::error::operation_aborted),
                     0});
                return;
              }
              boost::asio::async_connect(
                  conn->socket_, results,
                  boost::asio::bind_executor(
                      conn->strand_,
                      [promise](const boost::system::error_code &connect_ec,
                                const tcp::endpoint &) {
                        promise->set_value({connect_ec, 0});
                      }));
            }));
  });

  bool interrupted = false;
  IoResult result = AwaitIo(
      future, ctx,
      [conn, resolver, cancelled]() {
        boost::asio::post(conn->strand_, [conn, resolver, cancelled]() {
          *cancelled = true;
          resolver->cancel();
          boost::system::error_code ignored;
          conn->socket_.cancel(ignored);
        });
      },
      interrupted);

  ec = interrupted ? transport::ContextError(ctx) : result.ec;
  if (ec) {
    LOG_TOR_TRACE("connect to {}:{} failed: {}", host, port, ec.message());
    boost::system::error_code ignored;
    conn->socket_.close(ignored);
    return nullptr;
  }

  boost::system::error_code opt_ec;
  conn->socket_.set_option(tcp::no_delay(true), opt_ec);
  conn->capture_endpoints();
  conn->open_ = true;
  return conn;
}

std::shared_ptr<SocketConnection> SocketConnection::Adopt(tcp::socket socket) {
  auto conn =
      std::shared_ptr<SocketConnection>(new SocketConnection(std::move(socket)));
  conn->capture_endpoints();
  conn->open_ = true;
  return conn;
}

void SocketConnection::capture_endpoints() {
  boost::system::error_code ec;
  auto local = socket_.local_endpoint(ec);
  if (!ec) {
    local_ = FormatEndpoint(local);
  }
  auto remote = socket_.remote_endpoint(ec);
  if (!ec) {
    remote_ = FormatEndpoint(remote);
  }
}

std::function<void()> SocketConnection::make_cancel() {
  auto self = shared_from_this();
  return [self]() {
    boost::asio::post(self->strand_, [self]() {
      boost::system::error_code ignored;
      self->socket_.cancel(ignored);
    });
  };
}

size_t SocketConnection::read_some(const util::Context &ctx, uint8_t *data,
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
    socket_.async_read_some(
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

size_t SocketConnection::write_all(const util::Context &ctx,
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
    boost::asio::async_write(
        socket_, boost::asio::buffer(data, size),
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

void SocketConnection::close() {
  if (!open_.exchange(false)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    boost::system::error_code ignored;
    self->socket_.shutdown(tcp::socket::shutdown_both, ignored);
    self->socket_.close(ignored);
  });
}

SocketConnection::tcp::socket SocketConnection::release_socket() {
  open_ = false;
  return std::move(socket_);
}

// ============================================================================
// SocketAcceptor
// ============================================================================

SocketAcceptor::SocketAcceptor(boost::asio::io_context &io_context)
    : io_context_(io_context), acceptor_(io_context),
      strand_(acceptor_.get_executor()) {}

SocketAcceptor::~SocketAcceptor() = default;

std::shared_ptr<SocketAcceptor>
SocketAcceptor::Bind(boost::asio::io_context &io_context, uint16_t port,
                     boost::system::error_code &ec) {
  auto acceptor =
      std::shared_ptr<SocketAcceptor>(new SocketAcceptor(io_context));
  const tcp::endpoint endpoint(boost::asio::ip::address_v4::loopback(), port);

  acceptor->acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor->acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor->acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor->acceptor_.listen(boost::asio::socket_base::max_listen_connections,
                               ec);
  }
  if (ec) {
    LOG_TOR_WARN("failed to bind local acceptor on port {}: {}", port,
                 ec.message());
    boost::system::error_code ignored;
    acceptor->acceptor_.close(ignored);
    return nullptr;
  }
  acceptor->port_ = acceptor->acceptor_.local_endpoint(ec).port();
  return acceptor;
}

transport::RawConnectionPtr
SocketAcceptor::accept(boost::system::error_code &ec) {
  if (closed_.load(std::memory_order_acquire)) {
    ec = make_error_code(overlay_errc::listener_closed);
    return nullptr;
  }
  auto self = shared_from_this();
  auto peer = std::make_shared<tcp::socket>(io_context_);
  auto promise = std::make_shared<std::promise<IoResult>>();
  auto future = promise->get_future();
  boost::asio::post(strand_, [this, self, peer, promise]() {
    acceptor_.async_accept(
        *peer, boost::asio::bind_executor(
                   strand_, [promise](const boost::system::error_code &accept_ec) {
                     promise->set_value({accept_ec, 0});
                   }));
  });

  bool interrupted = false;
  IoResult result = AwaitIo(future, util::Context(), [] {}, interrupted);
  if (result.ec) {
    ec = closed_.load(std::memory_order_acquire)
             ? make_error_code(overlay_errc::listener_closed)
             : result.ec;
    return nullptr;
  }
  ec.clear();
  return SocketConnection::Adopt(std::move(*peer));
}

boost::system::error_code SocketAcceptor::close() {
  if (closed_.exchange(true)) {
    return {};
  }
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    boost::system::error_code ignored;
    self->acceptor_.cancel(ignored);
    self->acceptor_.close(ignored);
  });
  return {};
}

std::string SocketAcceptor::local_endpoint() const {
  return "127.0.0.1:" + std::to_string(port_);
}

} // namespace tor
} // namespace torlink
