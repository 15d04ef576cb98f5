#pragma once

#include "config/options.hpp"
#include "core/metrics.hpp"
#include "core/session.hpp"
#include "logging/log.hpp"
#include "logging/session_record.hpp"
#include "net/backoff.hpp"
#include "net/ws_ops.hpp"
#include <algorithm>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace proxy {

struct ServerConfig {
  std::string listen_host = "127.0.0.1";
  std::string listen_port = "8000";
  std::vector<std::string> ws_paths = {"/mqtt", "/mqtt_opt"};
  std::chrono::seconds handshake_timeout{30};
  SessionConfig session{};
};

inline ServerConfig MakeServerConfig(const ProxyOptions &opt) {
  ServerConfig cfg;
  cfg.listen_host = opt.listen_host;
  cfg.listen_port = opt.listen_port;
  cfg.ws_paths = opt.ws_paths;
  cfg.handshake_timeout = std::chrono::seconds(opt.handshake_timeout_s);
  cfg.session.broker_host = opt.broker_host;
  cfg.session.broker_port = opt.broker_port;
  cfg.session.read_buffer_size = opt.read_buffer_size;
  cfg.session.flush_policy = opt.flush_policy;
  cfg.session.ws_timeouts.handshake =
      std::chrono::seconds(opt.handshake_timeout_s);
  cfg.session.ws_timeouts.idle = std::chrono::seconds(opt.ws_idle_timeout_s);
  cfg.session.ws_timeouts.keepalive_pings = opt.ws_keepalive_pings;
  return cfg;
}

// ProxyServer: accepts WebSocket upgrades and runs one ProxySession per
// connection.
// Threading model:
// - The accept loop is a coroutine on its own strand
// - Every accepted connection gets a fresh strand; its upgrade handling, the
//   session coordinator and both relay loops all run there
// - Sessions share nothing but the configuration and ProxyMetrics; a failure
//   in one connection is logged and contained to that connection
class ProxyServer : public std::enable_shared_from_this<ProxyServer> {
public:
  ProxyServer(net::io_context &ioc, ServerConfig cfg, ProxyMetrics &metrics,
              logging::SessionRecordQueue *records = nullptr)
      : ioc_(ioc), strand_(net::make_strand(ioc)), acceptor_(strand_),
        cfg_(std::move(cfg)), metrics_(metrics), records_(records) {}

  ProxyServer(const ProxyServer &) = delete;
  ProxyServer &operator=(const ProxyServer &) = delete;

  // Opens, binds and listens. Call before Start(), outside the reactor.
  wsops::Status Listen() {
    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = wsops::Resolve(resolver, cfg_.listen_host, cfg_.listen_port);
    if (!results) {
      return std::unexpected(results.error());
    }
    const tcp::endpoint ep = results->begin()->endpoint();
    acceptor_.open(ep.protocol(), ec);
    if (ec) {
      return std::unexpected(ec);
    }
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
      return std::unexpected(ec);
    }
    acceptor_.bind(ep, ec);
    if (ec) {
      return std::unexpected(ec);
    }
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
      return std::unexpected(ec);
    }
    local_ = acceptor_.local_endpoint(ec);
    return wsops::MakeStatus(ec);
  }

  void Start() {
    auto self = shared_from_this();
    net::spawn(strand_,
               [self](net::yield_context yield) { self->AcceptLoop(yield); });
  }

  // Stops accepting; sessions already running are left to finish.
  void Stop() {
    auto self = shared_from_this();
    net::post(strand_, [self] {
      self->stopping_ = true;
      beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short LocalPort() const { return local_.port(); }

  bool IsServedPath(const std::string &target) const {
    const std::string path = target.substr(0, target.find('?'));
    return std::find(cfg_.ws_paths.begin(), cfg_.ws_paths.end(), path) !=
           cfg_.ws_paths.end();
  }

private:
  void AcceptLoop(net::yield_context yield) {
    retry::Backoff backoff;
    logging::Info("server", "listening on ", local_.address().to_string(), ":",
                  local_.port(), ", broker ", cfg_.session.broker_host, ":",
                  cfg_.session.broker_port);
    for (;;) {
      auto conn_strand = net::make_strand(ioc_);
      tcp::socket sock(conn_strand);
      beast::error_code ec;
      acceptor_.async_accept(sock, yield[ec]);
      if (stopping_ || !acceptor_.is_open() ||
          ec == net::error::operation_aborted) {
        break;
      }
      if (ec) {
        const std::size_t wait_ms = backoff.Next();
        logging::Warn("server", "accept failed: ", ec.message(),
                      ", retrying in ", wait_ms, " ms");
        retry::WaitAsync(strand_, yield, wait_ms);
        continue;
      }
      backoff.Reset();
      ProxyMetrics::Add(metrics_.connections_accepted, 1);
      const std::uint64_t id = ++next_id_;
      auto stream = std::make_shared<beast::tcp_stream>(std::move(sock));
      auto self = shared_from_this();
      net::spawn(conn_strand, [self, id, conn_strand,
                               stream](net::yield_context yield) {
        try {
          self->HandleConnection(id, conn_strand, *stream, yield);
        } catch (const std::exception &e) {
          logging::Error("server", "connection ", id, " failed: ", e.what());
        }
      });
    }
    logging::Info("server", "accept loop stopped");
  }

  void HandleConnection(std::uint64_t id, const Strand &strand,
                        beast::tcp_stream &stream, net::yield_context yield) {
    beast::flat_buffer buffer;
    wsops::UpgradeRequest req;
    if (auto st = wsops::AsyncReadUpgrade(stream, buffer, req,
                                          cfg_.handshake_timeout, yield);
        !st) {
      logging::Debug("server", "connection ", id,
                     " no request: ", st.error().message());
      CloseStream(stream);
      return;
    }

    const auto target_sv = req.target();
    const std::string target(target_sv.data(), target_sv.size());
    if (!websocket::is_upgrade(req) || !IsServedPath(target)) {
      ProxyMetrics::Add(metrics_.upgrades_rejected, 1);
      logging::Info("server", "connection ", id, " rejected: ",
                    websocket::is_upgrade(req) ? "unknown path "
                                               : "not an upgrade ",
                    target);
      if (auto st = wsops::AsyncRespondNotFound(
              stream, req, cfg_.session.server_name, yield);
          !st) {
        logging::Debug("server", "connection ", id,
                       " 404 not delivered: ", st.error().message());
      }
      CloseStream(stream);
      return;
    }

    auto session = std::make_shared<ProxySession>(
        id, strand, std::move(stream), cfg_.session, metrics_, records_);
    session->Run(req, yield);
    session->ReleaseClient();
  }

  static void CloseStream(beast::tcp_stream &stream) {
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream.close();
  }

  net::io_context &ioc_;
  Strand strand_;
  tcp::acceptor acceptor_;
  ServerConfig cfg_;
  ProxyMetrics &metrics_;
  logging::SessionRecordQueue *records_;
  tcp::endpoint local_;
  std::uint64_t next_id_ = 0;
  bool stopping_ = false;
};

} // namespace proxy
