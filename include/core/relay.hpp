#pragma once

#include "core/flush_policy.hpp"
#include "core/metrics.hpp"
#include "core/relay_types.hpp"
#include "util/branch.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <vector>

// Relay loops
// Threading model:
// - Both loops of a session run as coroutines on the session strand; each loop
//   issues at most one read and one write at a time, so bytes within one
//   direction are written exactly in the order they were read
// - Loops never close or shut down a socket. Termination is reported through
//   RelayResult and the coordinator owns teardown
// - `stop` is set by the coordinator together with cancelling the sockets; it
//   is checked after every resumption so an operation that completed just
//   before the cancel cannot start another blocking one
// - Error handling is by error_code (yield[ec]); nothing is thrown out of a
//   loop for I/O failures
namespace proxy {

namespace websocket = beast::websocket;

namespace detail {

template <typename TcpSocket>
beast::error_code FlushPending(TcpSocket &broker, beast::flat_buffer &pending,
                               PendingCounter &counter, RelayResult &r,
                               ProxyMetrics &metrics,
                               net::yield_context yield) {
  beast::error_code ec;
  net::async_write(broker, pending.data(), yield[ec]);
  if (BRANCH_UNLIKELY(ec)) {
    return ec;
  }
  pending.consume(pending.size());
  counter.Reset();
  ++r.flushes;
  ProxyMetrics::Add(metrics.flushes_client_to_broker, 1);
  return ec;
}

} // namespace detail

// WebSocket → TCP. Each WebSocket message is one chunk; chunks are coalesced
// into `pending` according to the session's PendingCounter and written to the
// broker on flush. On a clean end of stream, or when only the client side went
// away, any remaining pending bytes get a final flush.
template <typename WsStream, typename TcpSocket>
RelayResult RelayClientToBroker(WsStream &ws, TcpSocket &broker,
                                beast::flat_buffer &frame,
                                beast::flat_buffer &pending,
                                PendingCounter &counter, ProxyMetrics &metrics,
                                const bool &stop, net::yield_context yield) {
  RelayResult r;
  r.direction = Direction::client_to_broker;
  beast::error_code ec;
  bool sink_failed = false;

  for (;;) {
    frame.clear();
    ws.async_read(frame, yield[ec]);
    if (ec) {
      if (ec == websocket::error::closed) {
        r.outcome = RelayOutcome::clean;
      } else {
        r.outcome = ClassifyError(ec);
        r.ec = ec;
      }
      break;
    }
    if (BRANCH_UNLIKELY(stop)) {
      r.outcome = RelayOutcome::cancelled;
      break;
    }
    const std::size_t n = frame.size();
    // An empty message is the client's end of stream, not a skipped chunk
    if (BRANCH_UNLIKELY(n == 0)) {
      r.outcome = RelayOutcome::clean;
      break;
    }
    net::buffer_copy(pending.prepare(n), frame.data());
    pending.commit(n);
    ++r.chunks;
    r.bytes += n;
    ProxyMetrics::Add(metrics.chunks_client_to_broker, 1);
    ProxyMetrics::Add(metrics.bytes_client_to_broker, n);

    if (counter.Record(n)) {
      ec = detail::FlushPending(broker, pending, counter, r, metrics, yield);
      if (ec) {
        r.outcome = ClassifyError(ec);
        r.ec = ec;
        sink_failed = true;
        break;
      }
      if (BRANCH_UNLIKELY(stop)) {
        r.outcome = RelayOutcome::cancelled;
        break;
      }
    }
  }

  if (!sink_failed && !stop && r.outcome != RelayOutcome::cancelled &&
      pending.size() > 0) {
    ec = detail::FlushPending(broker, pending, counter, r, metrics, yield);
    if (ec && r.outcome == RelayOutcome::clean) {
      r.outcome = ClassifyError(ec);
      r.ec = ec;
    }
  }
  return r;
}

// TCP → WebSocket. Every read is forwarded immediately as one binary message;
// the broker already batches its output.
template <typename TcpSocket, typename WsStream>
RelayResult RelayBrokerToClient(TcpSocket &broker, WsStream &ws,
                                std::vector<char> &buffer,
                                ProxyMetrics &metrics, const bool &stop,
                                net::yield_context yield) {
  RelayResult r;
  r.direction = Direction::broker_to_client;
  beast::error_code ec;

  for (;;) {
    const std::size_t n = broker.async_read_some(net::buffer(buffer), yield[ec]);
    if (ec) {
      if (ec == net::error::eof) {
        r.outcome = RelayOutcome::clean;
      } else {
        r.outcome = ClassifyError(ec);
        r.ec = ec;
      }
      break;
    }
    if (BRANCH_UNLIKELY(stop)) {
      r.outcome = RelayOutcome::cancelled;
      break;
    }
    if (BRANCH_UNLIKELY(n == 0)) {
      r.outcome = RelayOutcome::clean;
      break;
    }
    ++r.chunks;
    r.bytes += n;
    ProxyMetrics::Add(metrics.chunks_broker_to_client, 1);
    ProxyMetrics::Add(metrics.bytes_broker_to_client, n);

    ws.async_write(net::buffer(buffer.data(), n), yield[ec]);
    if (ec) {
      r.outcome = ClassifyError(ec);
      r.ec = ec;
      break;
    }
    ++r.flushes;
    if (BRANCH_UNLIKELY(stop)) {
      r.outcome = RelayOutcome::cancelled;
      break;
    }
  }
  return r;
}

} // namespace proxy
