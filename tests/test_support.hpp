#pragma once

#include "core/metrics.hpp"
#include "core/reactor.hpp"
#include "core/server.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace testutil {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;
using namespace std::chrono_literals;

// Polls pred every 5 ms until it holds or the timeout expires.
inline bool WaitFor(const std::function<bool()> &pred,
                    std::chrono::milliseconds timeout = 5000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

// Deterministic, position-dependent payload so reordering or loss is visible.
inline std::string Pattern(std::size_t n, std::size_t seed) {
  std::string s(n, '\0');
  for (std::size_t i = 0; i < n; ++i) {
    s[i] = static_cast<char>((i * 31 + seed * 7) & 0xff);
  }
  return s;
}

// Port on 127.0.0.1 with nothing listening.
inline unsigned short UnusedPort() {
  net::io_context ioc;
  tcp::acceptor acc(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  const unsigned short port = acc.local_endpoint().port();
  acc.close();
  return port;
}

// FakeBroker: plain TCP peer standing in for the MQTT broker. Runs its own
// io_context on one thread; every connection is a coroutine that records the
// bytes it receives (and echoes them back in echo mode). In silent mode
// connections are accepted but never read, so the proxy's writes back up.
class FakeBroker {
public:
  enum class Mode { record, echo, silent };

  explicit FakeBroker(Mode mode = Mode::record)
      : mode_(mode), work_(net::make_work_guard(ioc_)),
        acceptor_(ioc_,
                  tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    net::spawn(ioc_, [this](net::yield_context yield) { AcceptLoop(yield); });
    thread_ = std::thread([this] { ioc_.run(); });
  }

  ~FakeBroker() {
    RunOnBroker([this] {
      beast::error_code ec;
      acceptor_.close(ec);
      for (auto &c : conns_) {
        c->close(ec);
      }
    });
    work_.reset();
    ioc_.stop();
    thread_.join();
  }

  unsigned short Port() const { return port_; }

  std::string Received() const {
    std::lock_guard<std::mutex> lock(mu_);
    return received_;
  }
  std::size_t ReceivedSize() const {
    std::lock_guard<std::mutex> lock(mu_);
    return received_.size();
  }
  int Connections() const {
    std::lock_guard<std::mutex> lock(mu_);
    return connections_;
  }
  // Connections on which the proxy side closed (EOF or error on read).
  int PeerClosed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return peer_closed_;
  }

  // Writes to the most recent connection.
  void Send(const std::string &bytes) {
    RunOnBroker([this, bytes] {
      if (conns_.empty()) {
        return;
      }
      beast::error_code ec;
      net::write(*conns_.back(), net::buffer(bytes), ec);
    });
  }

  // Graceful close (FIN) of every live connection.
  void CloseAll() {
    RunOnBroker([this] {
      beast::error_code ec;
      for (auto &c : conns_) {
        c->shutdown(tcp::socket::shutdown_both, ec);
        c->close(ec);
      }
    });
  }

  // Abortive close (RST) of every live connection.
  void ResetAll() {
    RunOnBroker([this] {
      beast::error_code ec;
      for (auto &c : conns_) {
        c->set_option(net::socket_base::linger(true, 0), ec);
        c->close(ec);
      }
    });
  }

private:
  void RunOnBroker(std::function<void()> fn) {
    std::promise<void> done;
    auto fut = done.get_future();
    net::post(ioc_, [&] {
      fn();
      done.set_value();
    });
    fut.wait();
  }

  void AcceptLoop(net::yield_context yield) {
    for (;;) {
      auto sock = std::make_shared<tcp::socket>(ioc_);
      beast::error_code ec;
      acceptor_.async_accept(*sock, yield[ec]);
      if (ec) {
        return;
      }
      {
        std::lock_guard<std::mutex> lock(mu_);
        ++connections_;
      }
      conns_.push_back(sock);
      if (mode_ == Mode::silent) {
        continue;
      }
      net::spawn(ioc_, [this, sock](net::yield_context y) { Serve(sock, y); });
    }
  }

  void Serve(std::shared_ptr<tcp::socket> sock, net::yield_context yield) {
    std::vector<char> buf(65536);
    for (;;) {
      beast::error_code ec;
      const std::size_t n = sock->async_read_some(net::buffer(buf), yield[ec]);
      if (ec) {
        std::lock_guard<std::mutex> lock(mu_);
        ++peer_closed_;
        return;
      }
      {
        std::lock_guard<std::mutex> lock(mu_);
        received_.append(buf.data(), n);
      }
      if (mode_ == Mode::echo) {
        net::async_write(*sock, net::buffer(buf.data(), n), yield[ec]);
        if (ec) {
          std::lock_guard<std::mutex> lock(mu_);
          ++peer_closed_;
          return;
        }
      }
    }
  }

  Mode mode_;
  net::io_context ioc_;
  net::executor_work_guard<net::io_context::executor_type> work_;
  tcp::acceptor acceptor_;
  unsigned short port_ = 0;
  std::vector<std::shared_ptr<tcp::socket>> conns_; // broker thread only
  mutable std::mutex mu_;
  std::string received_;
  int connections_ = 0;
  int peer_closed_ = 0;
  std::thread thread_;
};

using WsClient = websocket::stream<tcp::socket>;

// Synchronous Beast client. The returned stream is connected and upgraded;
// `protocol` receives the negotiated Sec-WebSocket-Protocol.
inline std::unique_ptr<WsClient>
ConnectClient(net::io_context &ioc, unsigned short port,
              const std::string &path, std::string *protocol = nullptr,
              beast::error_code *error = nullptr) {
  auto ws = std::make_unique<WsClient>(ioc);
  ws->next_layer().connect(
      tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
  ws->set_option(
      websocket::stream_base::decorator([](websocket::request_type &req) {
        req.set(http::field::sec_websocket_protocol, "mqtt");
      }));
  websocket::response_type res;
  beast::error_code ec;
  ws->handshake(res, "127.0.0.1", path, ec);
  if (error != nullptr) {
    *error = ec;
  }
  if (ec) {
    return nullptr;
  }
  if (protocol != nullptr) {
    const auto v = res[http::field::sec_websocket_protocol];
    *protocol = std::string(v.data(), v.size());
  }
  ws->binary(true);
  return ws;
}

// Reads messages until `total` bytes arrived or the stream failed.
inline std::string ReadBytes(WsClient &ws, std::size_t total,
                             std::vector<std::size_t> *sizes = nullptr) {
  std::string out;
  while (out.size() < total) {
    beast::flat_buffer b;
    beast::error_code ec;
    ws.read(b, ec);
    if (ec) {
      break;
    }
    if (sizes != nullptr) {
      sizes->push_back(b.size());
    }
    out += beast::buffers_to_string(b.data());
  }
  return out;
}

// Blocks on a read that is expected to fail because the proxy tore the
// session down. Returns the error, or nullopt if nothing happened within
// `timeout` (the socket is then shut down to release the reader).
inline std::optional<beast::error_code>
ReadUntilClosed(WsClient &ws, std::chrono::milliseconds timeout = 5000ms) {
  auto fut = std::async(std::launch::async, [&ws] {
    for (;;) {
      beast::flat_buffer b;
      beast::error_code ec;
      ws.read(b, ec);
      if (ec) {
        return ec;
      }
    }
  });
  if (fut.wait_for(timeout) != std::future_status::ready) {
    beast::error_code ignored;
    ws.next_layer().shutdown(tcp::socket::shutdown_both, ignored);
    fut.wait();
    return std::nullopt;
  }
  return fut.get();
}

// Proxy server on an ephemeral loopback port, backed by its own reactor.
struct ProxyHarness {
  proxy::ProxyMetrics metrics;
  Reactor reactor;
  std::shared_ptr<proxy::ProxyServer> server;
  bool listening = false;

  explicit ProxyHarness(unsigned short broker_port,
                        proxy::ServerConfig cfg = {}) {
    cfg.listen_host = "127.0.0.1";
    cfg.listen_port = "0";
    cfg.session.broker_host = "127.0.0.1";
    cfg.session.broker_port = std::to_string(broker_port);
    server = std::make_shared<proxy::ProxyServer>(reactor.GetIoContext(),
                                                  std::move(cfg), metrics);
    listening = server->Listen().has_value();
    if (listening) {
      server->Start();
      reactor.Start(2);
    }
  }

  ~ProxyHarness() {
    server->Stop();
    reactor.Join();
  }

  unsigned short Port() const { return server->LocalPort(); }

  std::uint64_t Get(const std::atomic<std::uint64_t> &c) const {
    return proxy::ProxyMetrics::Get(c);
  }
};

} // namespace testutil
