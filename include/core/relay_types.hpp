#pragma once

#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/websocket/error.hpp>
#include <cstddef>
#include <cstdint>

namespace proxy {

namespace net = boost::asio;
namespace beast = boost::beast;

enum class Direction : std::uint8_t {
  client_to_broker = 0, // WebSocket → TCP
  broker_to_client = 1, // TCP → WebSocket
};

// Terminal state of one relay loop.
// - clean: the source signalled end-of-stream (TCP FIN, WS close frame,
//   zero-length chunk)
// - disconnect: the peer went away (reset, broken pipe, ...); expected
// - cancelled: the coordinator interrupted the loop after its sibling finished
// - transport_error: anything else; reported but contained to the session
enum class RelayOutcome : std::uint8_t {
  clean = 0,
  disconnect = 1,
  cancelled = 2,
  transport_error = 3,
};

struct RelayResult {
  Direction direction = Direction::client_to_broker;
  RelayOutcome outcome = RelayOutcome::clean;
  beast::error_code ec;
  std::uint64_t bytes = 0;
  std::uint64_t chunks = 0;
  std::uint64_t flushes = 0;
};

inline const char *ToString(Direction d) {
  return d == Direction::client_to_broker ? "ws->tcp" : "tcp->ws";
}

inline const char *ToString(RelayOutcome o) {
  switch (o) {
  case RelayOutcome::clean:
    return "clean";
  case RelayOutcome::disconnect:
    return "disconnect";
  case RelayOutcome::cancelled:
    return "cancelled";
  case RelayOutcome::transport_error:
    return "transport_error";
  }
  return "unknown";
}

inline bool IsDisconnect(const beast::error_code &ec) {
  return ec == net::error::eof || ec == net::error::connection_reset ||
         ec == net::error::connection_aborted ||
         ec == net::error::broken_pipe || ec == net::error::not_connected ||
         ec == net::error::shut_down || ec == beast::error::timeout ||
         ec == beast::websocket::error::closed;
}

// Maps an I/O failure of a running loop onto its terminal outcome. The
// end-of-stream cases are recognised by the loops themselves before this is
// consulted.
inline RelayOutcome ClassifyError(const beast::error_code &ec) {
  if (ec == net::error::operation_aborted) {
    return RelayOutcome::cancelled;
  }
  if (IsDisconnect(ec)) {
    return RelayOutcome::disconnect;
  }
  return RelayOutcome::transport_error;
}

} // namespace proxy
