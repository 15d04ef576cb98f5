#pragma once

#include "core/flush_policy.hpp"
#include "core/metrics.hpp"
#include "core/relay.hpp"
#include "core/relay_types.hpp"
#include "logging/log.hpp"
#include "logging/session_record.hpp"
#include "net/ws_ops.hpp"
#include "util/time.hpp"
#include <array>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace proxy {

using tcp = net::ip::tcp;
using Strand = net::strand<net::io_context::executor_type>;
using WsStream = websocket::stream<beast::tcp_stream>;

struct SessionConfig {
  std::string broker_host = "127.0.0.1";
  std::string broker_port = "1883";
  std::size_t read_buffer_size = 65536;
  FlushPolicy flush_policy{};
  wsops::WsTimeouts ws_timeouts{};
  std::string server_name = "mqtt-ws-proxy";
};

// ProxySession: one WebSocket client bridged to one broker TCP connection.
// Threading model:
// - The coordinator (Run) and both relay loops are coroutines on the same
//   strand, so session state needs no locking
// - Run returns only after both loops have stopped and the broker socket has
//   been closed; the caller then releases the WebSocket
// - Loops are raced: the first to finish stops the other by cancelling the
//   pending operations on both sockets
class ProxySession : public std::enable_shared_from_this<ProxySession> {
public:
  ProxySession(std::uint64_t id, Strand strand, beast::tcp_stream &&client,
               const SessionConfig &cfg, ProxyMetrics &metrics,
               logging::SessionRecordQueue *records)
      : id_(id), strand_(std::move(strand)), ws_(std::move(client)),
        broker_(strand_), signal_(strand_), cfg_(cfg), metrics_(metrics),
        records_(records), counter_(cfg.flush_policy),
        read_buf_(cfg.read_buffer_size) {
    signal_.expires_at(net::steady_timer::time_point::max());
  }

  ProxySession(const ProxySession &) = delete;
  ProxySession &operator=(const ProxySession &) = delete;

  // Must be called from a coroutine running on this session's strand.
  void Run(const wsops::UpgradeRequest &req, net::yield_context yield) {
    started_ = std::chrono::steady_clock::now();
    started_epoch_ms_ = timeutil::EpochMillisUtc();
    ProxyMetrics::Add(metrics_.sessions_started, 1);
    metrics_.sessions_active.fetch_add(1, std::memory_order_relaxed);

    wsops::ConfigureServerWebSocket(
        ws_, wsops::OffersSubprotocol(req, wsops::kMqttSubprotocol),
        cfg_.ws_timeouts, cfg_.server_name);

    // 1. Broker first: a client must never be accepted without a broker leg
    if (!ConnectBroker(yield)) {
      RejectClient(req, yield);
      Finish(true);
      return;
    }

    // 2. Upgrade
    if (auto st = wsops::AsyncWsAccept(ws_, req, yield); !st) {
      logging::Info(Tag(), "websocket handshake failed: ", st.error().message());
      CloseBroker();
      Finish(false);
      return;
    }
    logging::Debug(Tag(), "bridged to broker ", cfg_.broker_host, ":",
                   cfg_.broker_port);

    // 3. Both directions
    ProxyMetrics::Add(metrics_.relays_started, 1);
    StartLoop(Direction::client_to_broker);
    StartLoop(Direction::broker_to_client);

    // 4. First completed
    WaitUntil([this] { return finished_ >= 1; }, yield);

    // 5. Interrupt the other direction
    stop_ = true;
    CancelIo();
    WaitUntil([this] { return finished_ == 2; }, yield);

    // 6. Broker leg closed exactly once, after both loops are gone
    CloseBroker();
    Finish(false);
  }

  // Drops the client connection. Called by the acceptor once Run returned.
  void ReleaseClient() {
    beast::error_code ec;
    auto &sock = beast::get_lowest_layer(ws_).socket();
    sock.shutdown(tcp::socket::shutdown_both, ec);
    sock.close(ec);
  }

private:
  static std::size_t Index(Direction d) { return static_cast<std::size_t>(d); }

  std::string Tag() const { return "session " + std::to_string(id_); }

  bool ConnectBroker(net::yield_context yield) {
    tcp::resolver resolver(strand_);
    auto results = wsops::AsyncResolve(resolver, cfg_.broker_host,
                                       cfg_.broker_port, yield);
    if (!results) {
      logging::Warn(Tag(), "broker resolve failed: ", results.error().message());
      return false;
    }
    if (auto st = wsops::AsyncConnect(broker_, *results, yield); !st) {
      logging::Warn(Tag(), "broker connect failed: ", st.error().message());
      beast::error_code ignored;
      broker_.close(ignored);
      return false;
    }
    wsops::SetTcpNoDelay(broker_);
    return true;
  }

  // Broker unreachable: complete the upgrade only to deliver close 1011.
  void RejectClient(const wsops::UpgradeRequest &req,
                    net::yield_context yield) {
    ProxyMetrics::Add(metrics_.connect_failures, 1);
    if (auto st = wsops::AsyncWsAccept(ws_, req, yield); !st) {
      logging::Debug(Tag(), "handshake before reject failed: ",
                     st.error().message());
      return;
    }
    if (auto st = wsops::AsyncWsClose(
            ws_, websocket::close_code::internal_error, yield);
        !st) {
      logging::Debug(Tag(), "close after connect failure: ",
                     st.error().message());
    }
  }

  void StartLoop(Direction d) {
    auto self = shared_from_this();
    net::spawn(strand_, [self, d](net::yield_context yield) {
      RelayResult r;
      r.direction = d;
      try {
        if (d == Direction::client_to_broker) {
          r = RelayClientToBroker(self->ws_, self->broker_, self->frame_,
                                  self->pending_, self->counter_,
                                  self->metrics_, self->stop_, yield);
        } else {
          r = RelayBrokerToClient(self->broker_, self->ws_, self->read_buf_,
                                  self->metrics_, self->stop_, yield);
        }
      } catch (const std::exception &e) {
        logging::Error(self->Tag(), ToString(d), " relay aborted: ", e.what());
        r.outcome = RelayOutcome::transport_error;
      }
      self->OnLoopFinished(r);
    });
  }

  void OnLoopFinished(const RelayResult &r) {
    const std::size_t i = Index(r.direction);
    results_[i] = r;
    if (++finished_ == 1) {
      first_finished_ = r.direction;
    }
    if (r.outcome == RelayOutcome::transport_error) {
      ProxyMetrics::Add(metrics_.transport_errors, 1);
      logging::Warn(Tag(), ToString(r.direction),
                    " transport error: ", r.ec.message());
    } else {
      logging::Debug(Tag(), ToString(r.direction), " finished: ",
                     ToString(r.outcome),
                     r.ec ? " (" + r.ec.message() + ")" : std::string());
    }
    signal_.cancel();
  }

  // Suspends the coordinator until pred() holds. Loops wake it by cancelling
  // the never-expiring signal timer; everything runs on one strand, so no
  // wakeup can slip in between the check and the wait.
  template <typename Pred> void WaitUntil(Pred pred, net::yield_context yield) {
    while (!pred()) {
      beast::error_code ec;
      signal_.async_wait(yield[ec]);
    }
  }

  void CancelIo() {
    beast::error_code ec;
    broker_.cancel(ec);
    beast::get_lowest_layer(ws_).cancel();
  }

  void CloseBroker() {
    if (broker_closed_) {
      return;
    }
    broker_closed_ = true;
    beast::error_code ec;
    broker_.shutdown(tcp::socket::shutdown_send, ec);
    broker_.close(ec);
    ProxyMetrics::Add(metrics_.broker_closes, 1);
  }

  void Finish(bool connect_failed) {
    metrics_.sessions_active.fetch_sub(1, std::memory_order_relaxed);
    ProxyMetrics::Add(metrics_.sessions_finished, 1);
    const auto &up = results_[Index(Direction::client_to_broker)];
    const auto &down = results_[Index(Direction::broker_to_client)];
    const std::int64_t duration_ms = timeutil::MillisSince(started_);

    if (!connect_failed && up && down) {
      logging::Info(Tag(), "closed after ", duration_ms, " ms, first=",
                    ToString(*first_finished_), " ws->tcp ", up->bytes,
                    " B/", up->flushes, " flushes, tcp->ws ", down->bytes,
                    " B");
    }
    if (records_ == nullptr) {
      return;
    }
    logging::SessionRecord rec{};
    rec.session_id = id_;
    rec.started_epoch_ms = started_epoch_ms_;
    rec.duration_ms = duration_ms;
    rec.connect_failed = connect_failed;
    if (up) {
      rec.bytes_client_to_broker = up->bytes;
      rec.chunks_client_to_broker = up->chunks;
      rec.flushes_client_to_broker = up->flushes;
      rec.outcome_upstream = static_cast<std::uint8_t>(up->outcome);
    }
    if (down) {
      rec.bytes_broker_to_client = down->bytes;
      rec.chunks_broker_to_client = down->chunks;
      rec.outcome_downstream = static_cast<std::uint8_t>(down->outcome);
    }
    if (first_finished_) {
      rec.first_finished = static_cast<std::uint8_t>(*first_finished_);
    }
    if (!records_->push(rec)) {
      logging::Debug(Tag(), "session record queue full, record dropped");
    }
  }

  std::uint64_t id_;
  Strand strand_;
  WsStream ws_;
  tcp::socket broker_;
  net::steady_timer signal_;
  SessionConfig cfg_;
  ProxyMetrics &metrics_;
  logging::SessionRecordQueue *records_;

  // client→broker buffering
  PendingCounter counter_;
  beast::flat_buffer frame_;
  beast::flat_buffer pending_;
  // broker→client read buffer
  std::vector<char> read_buf_;

  std::array<std::optional<RelayResult>, 2> results_{};
  std::optional<Direction> first_finished_;
  int finished_ = 0;
  bool stop_ = false;
  bool broker_closed_ = false;
  std::chrono::steady_clock::time_point started_{};
  std::int64_t started_epoch_ms_ = 0;
};

} // namespace proxy
