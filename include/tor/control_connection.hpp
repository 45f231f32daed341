// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/transport.hpp"
#include "util/context.hpp"
#include <boost/system/error_code.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace torlink {
namespace tor {

/**
 * Reply to one control port command
 *
 * `lines` holds the data part of every reply line (status code and separator
 * stripped). A "+" data block is folded into its line, joined with '\n'.
 */
struct TorControlReply {
  int code = 0;
  std::vector<std::string> lines;

  bool ok() const { return code == 250; }
  // Last line text, or empty (the final line carries the status message)
  std::string message() const { return lines.empty() ? "" : lines.back(); }
};

// Split "AUTH METHODS=NULL" into {"AUTH", "METHODS=NULL"}
std::pair<std::string, std::string> SplitTorReplyLine(const std::string &s);

/**
 * Parse 'METHODS=COOKIE,SAFECOOKIE COOKIEFILE=".../control_auth_cookie"'
 *
 * Quoted values keep escape sequences as-is. Returns an empty map on any
 * syntax error.
 */
std::map<std::string, std::string> ParseTorReplyMapping(const std::string &s);

// Quote a string for the control protocol ("a\"b" style)
std::string QuoteTorString(const std::string &s);

// PROGRESS=<n> from a status/bootstrap-phase value
std::optional<int> ParseBootstrapProgress(const std::string &phase);

/**
 * TorControlConnection - synchronous client for tor's control port
 *
 * One command runs at a time (mutex). Asynchronous event replies (6xx) that
 * arrive between commands are logged and skipped. The underlying stream is
 * any RawConnection so tests can script the daemon.
 */
class TorControlConnection {
public:
  static constexpr size_t MAX_LINE_LENGTH = 64 * 1024;

  explicit TorControlConnection(transport::RawConnectionPtr stream);
  ~TorControlConnection();

  TorControlConnection(const TorControlConnection &) = delete;
  TorControlConnection &operator=(const TorControlConnection &) = delete;

  // Send `command` and read its full reply; false on I/O or syntax errors
  bool command(const util::Context &ctx, const std::string &command,
               TorControlReply &reply, boost::system::error_code &ec);

  void close();
  bool is_open() const;

private:
  bool read_line(const util::Context &ctx, std::string &line,
                 boost::system::error_code &ec);
  bool read_reply(const util::Context &ctx, TorControlReply &reply,
                  boost::system::error_code &ec);

  std::mutex mutex_;
  transport::RawConnectionPtr stream_;
  std::string buffer_;
};

} // namespace tor
} // namespace torlink
