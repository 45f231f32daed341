// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "tor/control_connection.hpp"
#include "transport/overlay.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

namespace torlink {
namespace tor {

using transport::make_error_code;
using transport::overlay_errc;

std::pair<std::string, std::string> SplitTorReplyLine(const std::string &s) {
  size_t ptr = 0;
  std::string type;
  while (ptr < s.size() && s[ptr] != ' ') {
    type.push_back(s[ptr]);
    ++ptr;
  }
  if (ptr < s.size()) {
    ++ptr; // skip ' '
  }
  return {type, s.substr(ptr)};
}

std::map<std::string, std::string> ParseTorReplyMapping(const std::string &s) {
  std::map<std::string, std::string> mapping;
  size_t ptr = 0;
  while (ptr < s.size()) {
    std::string key, value;
    while (ptr < s.size() && s[ptr] != '=' && s[ptr] != ' ') {
      key.push_back(s[ptr]);
      ++ptr;
    }
    if (ptr == s.size() || s[ptr] != '=') {
      return {};
    }
    ++ptr; // skip '='
    if (ptr < s.size() && s[ptr] == '"') {
      ++ptr;
      bool escape_next = false;
      while (ptr < s.size() && (escape_next || s[ptr] != '"')) {
        escape_next = !escape_next && s[ptr] == '\\';
        value.push_back(s[ptr]);
        ++ptr;
      }
      if (ptr == s.size()) {
        return {}; // unterminated quote
      }
      ++ptr; // closing '"'
    } else {
      // Unquoted values may contain '=' but no spaces
      while (ptr < s.size() && s[ptr] != ' ') {
        value.push_back(s[ptr]);
        ++ptr;
      }
    }
    if (ptr < s.size() && s[ptr] == ' ') {
      ++ptr;
    }
    mapping[key] = value;
  }
  return mapping;
}

std::string QuoteTorString(const std::string &s) {
  std::string out = "\"";
  for (char c : s) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::optional<int> ParseBootstrapProgress(const std::string &phase) {
  for (const auto &token : util::SplitString(phase, ' ')) {
    if (token.rfind("PROGRESS=", 0) == 0) {
      return util::SafeParseInt(token.substr(9), 0, 100);
    }
  }
  return std::nullopt;
}

TorControlConnection::TorControlConnection(transport::RawConnectionPtr stream)
    : stream_(std::move(stream)) {}

TorControlConnection::~TorControlConnection() { close(); }

void TorControlConnection::close() {
  if (stream_) {
    stream_->close();
  }
}

bool TorControlConnection::is_open() const {
  return stream_ && stream_->is_open();
}

bool TorControlConnection::read_line(const util::Context &ctx,
                                     std::string &line,
                                     boost::system::error_code &ec) {
  for (;;) {
    const size_t eol = buffer_.find("\r\n");
    if (eol != std::string::npos) {
      line = buffer_.substr(0, eol);
      buffer_.erase(0, eol + 2);
      return true;
    }
    if (buffer_.size() > MAX_LINE_LENGTH) {
      ec = make_error_code(overlay_errc::protocol_error);
      return false;
    }
    uint8_t chunk[4096];
    const size_t n = stream_->read_some(ctx, chunk, sizeof(chunk), ec);
    if (ec) {
      return false;
    }
    if (n == 0) {
      ec = make_error_code(overlay_errc::session_closed);
      return false;
    }
    buffer_.append(reinterpret_cast<const char *>(chunk), n);
  }
}

bool TorControlConnection::read_reply(const util::Context &ctx,
                                      TorControlReply &reply,
                                      boost::system::error_code &ec) {
  reply = TorControlReply();
  std::string line;
  for (;;) {
    if (!read_line(ctx, line, ec)) {
      return false;
    }
    if (line.size() < 4) {
      LOG_TOR_WARN("malformed control reply line '{}'", line);
      ec = make_error_code(overlay_errc::protocol_error);
      return false;
    }
    auto code = util::SafeParseInt(line.substr(0, 3), 100, 699);
    if (!code) {
      LOG_TOR_WARN("malformed control reply code in '{}'", line);
      ec = make_error_code(overlay_errc::protocol_error);
      return false;
    }
    const char sep = line[3];
    std::string data = line.substr(4);

    if (sep == '+') {
      // Data block runs until a line holding a single "."
      std::string block_line;
      for (;;) {
        if (!read_line(ctx, block_line, ec)) {
          return false;
        }
        if (block_line == ".") {
          break;
        }
        if (!block_line.empty() && block_line[0] == '.') {
          block_line.erase(0, 1); // dot-stuffing
        }
        data += "\n" + block_line;
      }
    } else if (sep != '-' && sep != ' ') {
      ec = make_error_code(overlay_errc::protocol_error);
      return false;
    }

    if (*code >= 600) {
      // Asynchronous event; not part of the command reply
      LOG_TOR_TRACE("tor event: {}", data);
      continue;
    }

    reply.code = *code;
    reply.lines.push_back(std::move(data));
    if (sep == ' ') {
      return true;
    }
  }
}

bool TorControlConnection::command(const util::Context &ctx,
                                   const std::string &command,
                                   TorControlReply &reply,
                                   boost::system::error_code &ec) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!is_open()) {
    ec = make_error_code(overlay_errc::session_closed);
    return false;
  }
  // Never log credentials
  const bool secret = command.rfind("AUTHENTICATE", 0) == 0;
  LOG_TOR_TRACE("control> {}", secret ? "AUTHENTICATE ..." : command);

  const std::string wire = command + "\r\n";
  stream_->write_all(ctx, reinterpret_cast<const uint8_t *>(wire.data()),
                     wire.size(), ec);
  if (ec) {
    return false;
  }
  if (!read_reply(ctx, reply, ec)) {
    return false;
  }
  LOG_TOR_TRACE("control< {} {}", reply.code, reply.message());
  return true;
}

} // namespace tor
} // namespace torlink
