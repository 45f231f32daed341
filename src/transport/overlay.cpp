// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "transport/overlay.hpp"

namespace torlink {
namespace transport {

namespace {

class OverlayCategory : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "overlay"; }

  std::string message(int ev) const override {
    switch (static_cast<overlay_errc>(ev)) {
    case overlay_errc::success:
      return "success";
    case overlay_errc::timed_out:
      return "operation timed out";
    case overlay_errc::cancelled:
      return "operation cancelled";
    case overlay_errc::session_closed:
      return "overlay session closed";
    case overlay_errc::connection_refused:
      return "connection refused";
    case overlay_errc::host_unreachable:
      return "host unreachable";
    case overlay_errc::listener_closed:
      return "listener closed";
    case overlay_errc::unsupported_stream:
      return "stream type not supported by this layer";
    case overlay_errc::handshake_failed:
      return "handshake failed";
    case overlay_errc::protocol_error:
      return "protocol error";
    case overlay_errc::authentication_failed:
      return "authentication failed";
    case overlay_errc::service_unavailable:
      return "overlay service unavailable";
    }
    return "unknown overlay error";
  }
};

} // namespace

const boost::system::error_category &overlay_category() {
  static const OverlayCategory category;
  return category;
}

boost::system::error_code make_error_code(overlay_errc e) {
  return {static_cast<int>(e), overlay_category()};
}

boost::system::error_code ContextError(const util::Context &ctx) {
  if (!ctx.Done()) {
    return {};
  }
  return ctx.Error() == util::Context::kDeadlineExceeded
             ? make_error_code(overlay_errc::timed_out)
             : make_error_code(overlay_errc::cancelled);
}

} // namespace transport
} // namespace torlink
