#pragma once

#include <boost/algorithm/string/trim.hpp>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>

// namespace wsops: thin std::expected wrappers over the Asio/Beast calls the
// proxy makes: broker resolve/connect (async and sync) and the server side of
// the WebSocket upgrade.
namespace wsops {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

using Status = std::expected<void, beast::error_code>;
using UpgradeRequest = http::request<http::string_body>;

inline constexpr char kMqttSubprotocol[] = "mqtt";

inline Status MakeStatus(const beast::error_code &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

inline std::expected<tcp::resolver::results_type, beast::error_code>
AsyncResolve(tcp::resolver &resolver, const std::string &host,
             const std::string &port, net::yield_context yield) {
  beast::error_code ec;
  auto r = resolver.async_resolve(host, port, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  return r;
}

inline Status AsyncConnect(tcp::socket &sock,
                           const tcp::resolver::results_type &endpoints,
                           net::yield_context yield) {
  beast::error_code ec;
  net::async_connect(sock, endpoints, yield[ec]);
  return MakeStatus(ec);
}

// Sync variants, used by the startup broker check outside the reactor
inline std::expected<tcp::resolver::results_type, beast::error_code>
Resolve(tcp::resolver &resolver, const std::string &host,
        const std::string &port) {
  beast::error_code ec;
  auto r = resolver.resolve(host, port, ec);
  if (ec)
    return std::unexpected(ec);
  return r;
}

inline Status Connect(tcp::socket &sock,
                      const tcp::resolver::results_type &endpoints) {
  beast::error_code ec;
  net::connect(sock, endpoints, ec);
  return MakeStatus(ec);
}

// One-shot reachability check of the broker: resolve, connect, close.
inline Status CheckBroker(const std::string &host, const std::string &port) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  auto results = Resolve(resolver, host, port);
  if (!results) {
    return std::unexpected(results.error());
  }
  tcp::socket sock(ioc);
  auto st = Connect(sock, *results);
  beast::error_code ignored;
  sock.close(ignored);
  return st;
}

inline void SetTcpNoDelay(tcp::socket &sock) {
  beast::error_code ec;
  sock.set_option(net::ip::tcp::no_delay(true), ec);
  (void)ec;
}

// Reads the HTTP request that should carry the upgrade, bounded by `limit`.
inline Status AsyncReadUpgrade(beast::tcp_stream &stream,
                               beast::flat_buffer &buffer, UpgradeRequest &req,
                               std::chrono::seconds limit,
                               net::yield_context yield) {
  beast::error_code ec;
  stream.expires_after(limit);
  http::async_read(stream, buffer, req, yield[ec]);
  // the websocket stream takes over timeouts from here on
  stream.expires_never();
  return MakeStatus(ec);
}

// True if the comma-separated Sec-WebSocket-Protocol list names `proto`.
inline bool OffersSubprotocol(const UpgradeRequest &req,
                              std::string_view proto) {
  auto it = req.find(http::field::sec_websocket_protocol);
  if (it == req.end()) {
    return false;
  }
  const auto value = it->value();
  std::string list(value.data(), value.size());
  std::size_t start = 0;
  while (start <= list.size()) {
    std::size_t comma = list.find(',', start);
    if (comma == std::string::npos) {
      comma = list.size();
    }
    std::string token = list.substr(start, comma - start);
    boost::algorithm::trim(token);
    if (token == proto) {
      return true;
    }
    start = comma + 1;
  }
  return false;
}

struct WsTimeouts {
  std::chrono::seconds handshake{30};
  std::chrono::seconds idle{0}; // 0 = none
  bool keepalive_pings = false;
};

// Server-side stream setup: binary frames, no permessage-deflate, echo the
// mqtt subprotocol when the client offered it, transport timeouts.
template <typename WS>
inline void ConfigureServerWebSocket(WS &ws, bool echo_mqtt,
                                     const WsTimeouts &timeouts,
                                     const std::string &serverName) {
  websocket::permessage_deflate pmd;
  pmd.client_enable = false;
  pmd.server_enable = false;
  ws.set_option(pmd);

  websocket::stream_base::timeout to{};
  to.handshake_timeout = timeouts.handshake;
  to.idle_timeout = timeouts.idle.count() > 0
                        ? std::chrono::duration_cast<
                              websocket::stream_base::duration>(timeouts.idle)
                        : websocket::stream_base::none();
  to.keep_alive_pings = timeouts.keepalive_pings;
  ws.set_option(to);

  ws.set_option(websocket::stream_base::decorator(
      [echo_mqtt, serverName](websocket::response_type &res) {
        res.set(http::field::server, serverName);
        if (echo_mqtt) {
          res.set(http::field::sec_websocket_protocol, kMqttSubprotocol);
        }
      }));
  ws.binary(true);
}

template <typename WS>
inline Status AsyncWsAccept(WS &ws, const UpgradeRequest &req,
                            net::yield_context yield) {
  beast::error_code ec;
  ws.async_accept(req, yield[ec]);
  return MakeStatus(ec);
}

template <typename WS>
inline Status AsyncWsClose(WS &ws, websocket::close_code code,
                           net::yield_context yield) {
  beast::error_code ec;
  ws.async_close(code, yield[ec]);
  return MakeStatus(ec);
}

// Plain HTTP refusal for requests that are not an upgrade on a served path.
inline Status AsyncRespondNotFound(beast::tcp_stream &stream,
                                   const UpgradeRequest &req,
                                   const std::string &serverName,
                                   net::yield_context yield) {
  http::response<http::string_body> res{http::status::not_found,
                                        req.version()};
  res.set(http::field::server, serverName);
  res.set(http::field::content_type, "text/plain");
  res.keep_alive(false);
  res.body() = "not found\n";
  res.prepare_payload();
  beast::error_code ec;
  stream.expires_after(std::chrono::seconds(5));
  http::async_write(stream, res, yield[ec]);
  return MakeStatus(ec);
}

} // namespace wsops
