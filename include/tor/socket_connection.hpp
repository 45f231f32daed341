// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/transport.hpp"
#include "util/context.hpp"
#include <atomic>
#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace torlink {
namespace tor {

// Outcome of one asio operation completed on the io thread
struct IoResult {
  boost::system::error_code ec;
  size_t bytes = 0;
};

/**
 * Block on an io-thread result while watching a context
 *
 * When `ctx` expires first, `cancel` is invoked (it must post a cancel of the
 * pending operation onto the owning strand) and the call keeps waiting for
 * the aborted handler, so buffers handed to the operation stay valid until
 * it is gone. `interrupted` reports whether the context fired.
 *
 * A handler destroyed without running (io_context torn down) yields
 * overlay_errc::session_closed.
 */
IoResult AwaitIo(std::future<IoResult> &future, const util::Context &ctx,
                 const std::function<void()> &cancel, bool &interrupted);

/**
 * SocketConnection - TCP socket as a blocking RawConnection
 *
 * All socket operations run on the io_context thread behind strand_; the
 * calling thread blocks on a future bounded by its context. Used for the
 * control port, SOCKS streams and hidden service inbound streams.
 */
class SocketConnection
    : public transport::RawConnection,
      public std::enable_shared_from_this<SocketConnection> {
public:
  using tcp = boost::asio::ip::tcp;

  /**
   * Resolve and connect
   * @return nullptr with `ec` set on failure or context expiry
   */
  static std::shared_ptr<SocketConnection>
  Connect(boost::asio::io_context &io_context, const util::Context &ctx,
          const std::string &host, uint16_t port,
          boost::system::error_code &ec);

  // Wrap an already connected socket (acceptor output)
  static std::shared_ptr<SocketConnection> Adopt(tcp::socket socket);

  ~SocketConnection() override;

  SocketConnection(const SocketConnection &) = delete;
  SocketConnection &operator=(const SocketConnection &) = delete;

  size_t read_some(const util::Context &ctx, uint8_t *data, size_t size,
                   boost::system::error_code &ec) override;
  size_t write_all(const util::Context &ctx, const uint8_t *data, size_t size,
                   boost::system::error_code &ec) override;

  void close() override;
  bool is_open() const override { return open_.load(std::memory_order_acquire); }

  std::string local_endpoint() const override { return local_; }
  std::string remote_endpoint() const override { return remote_; }

  /**
   * Hand the socket to another stream layer (websocket)
   *
   * Must not be called while a read or write is pending. The connection is
   * closed afterwards.
   */
  tcp::socket release_socket();

private:
  explicit SocketConnection(tcp::socket socket);

  void capture_endpoints();
  std::function<void()> make_cancel();

  tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  std::atomic<bool> open_{false};
  std::string local_;
  std::string remote_;
};

/**
 * SocketAcceptor - loopback TCP acceptor as a blocking RawListener
 *
 * Hidden services forward their virtual port to one of these.
 */
class SocketAcceptor : public transport::RawListener,
                       public std::enable_shared_from_this<SocketAcceptor> {
public:
  using tcp = boost::asio::ip::tcp;

  // Bind 127.0.0.1:<port> (0 = ephemeral); nullptr + ec on failure
  static std::shared_ptr<SocketAcceptor>
  Bind(boost::asio::io_context &io_context, uint16_t port,
       boost::system::error_code &ec);

  ~SocketAcceptor() override;

  transport::RawConnectionPtr accept(boost::system::error_code &ec) override;
  boost::system::error_code close() override;
  std::string local_endpoint() const override;

  uint16_t port() const { return port_; }

private:
  explicit SocketAcceptor(boost::asio::io_context &io_context);

  boost::asio::io_context &io_context_;
  tcp::acceptor acceptor_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  std::atomic<bool> closed_{false};
  uint16_t port_ = 0;
};

} // namespace tor
} // namespace torlink
