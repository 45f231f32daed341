// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "transport/transport.hpp"
#include "transport/overlay.hpp"

namespace torlink {
namespace transport {

const char *DirectionAsString(Direction direction) {
  return direction == Direction::INBOUND ? "inbound" : "outbound";
}

bool ReadExact(RawConnection &conn, const util::Context &ctx, uint8_t *data,
               size_t size, boost::system::error_code &ec) {
  size_t got = 0;
  while (got < size) {
    const size_t n = conn.read_some(ctx, data + got, size - got, ec);
    if (ec) {
      return false;
    }
    if (n == 0) {
      // Orderly shutdown mid-message
      ec = make_error_code(overlay_errc::session_closed);
      return false;
    }
    got += n;
  }
  return true;
}

} // namespace transport
} // namespace torlink
