#pragma once

#include "core/flush_policy.hpp"
#include "logging/log.hpp"
#include "net/url.hpp"
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

struct ProxyOptions {
  std::string listen_host = "127.0.0.1";
  std::string listen_port = "8000";
  std::string broker_host = "127.0.0.1";
  std::string broker_port = "1883";
  // First entry is the primary path; the rest are aliases served identically.
  std::vector<std::string> ws_paths = {"/mqtt", "/mqtt_opt"};
  std::size_t read_buffer_size = 65536;
  proxy::FlushPolicy flush_policy{};
  int threads = 1;
  int handshake_timeout_s = 30;
  int ws_idle_timeout_s = 0; // 0 = never time out an idle WebSocket
  bool ws_keepalive_pings = false;
  logging::Level log_level = logging::Level::info;
  std::string session_log; // empty = no per-session records
  int stats_interval_s = 0;
  int seconds = 0; // 0 = run until SIGINT/SIGTERM
  bool check_broker = true;
  bool show_help = false;
};

inline const char *Usage() {
  return "usage: mqtt-ws-proxy [options]\n"
         "  -l, --listen HOST:PORT        WebSocket listen address "
         "(127.0.0.1:8000)\n"
         "  -b, --broker URL              broker, tcp://host[:port] "
         "(tcp://127.0.0.1:1883)\n"
         "      --broker-host HOST        broker host\n"
         "      --broker-port PORT        broker port\n"
         "  -p, --path PATH               WebSocket path, repeatable "
         "(/mqtt, /mqtt_opt)\n"
         "      --read-buffer BYTES       TCP read buffer (65536)\n"
         "      --small-chunk BYTES       flush immediately below this size "
         "(100)\n"
         "      --flush-threshold BYTES   coalesce up to this many bytes "
         "(131072)\n"
         "  -j, --threads N               reactor threads (1)\n"
         "      --handshake-timeout SEC   upgrade request/handshake limit (30)\n"
         "      --ws-idle-timeout SEC     close idle WebSockets, 0 = never (0)\n"
         "      --ws-keepalive-pings      send WebSocket pings when idle\n"
         "      --log-level LEVEL         debug|info|warn|error (info)\n"
         "      --session-log FILE        append one line per finished session\n"
         "      --stats-interval SEC      periodic throughput summary, 0 = off\n"
         "  -t, --seconds SEC             stop after SEC seconds, 0 = never\n"
         "      --no-broker-check         skip the startup broker check\n"
         "  -h, --help                    show this help\n";
}

namespace detail {

template <typename T>
std::expected<T, std::string> ParseNumber(std::string_view flag,
                                          std::string_view text, T min_value,
                                          T max_value) {
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::unexpected(std::string(flag) + ": not a number: '" +
                           std::string(text) + "'");
  }
  if (value < min_value || value > max_value) {
    return std::unexpected(std::string(flag) + ": out of range: " +
                           std::string(text));
  }
  return value;
}

inline bool TakesValue(std::string_view a) {
  static constexpr std::string_view kFlags[] = {
      "-l", "--listen", "-b", "--broker", "--broker-host", "--broker-port",
      "-p", "--path", "--read-buffer", "--small-chunk", "--flush-threshold",
      "-j", "--threads", "--handshake-timeout", "--ws-idle-timeout",
      "--log-level", "--session-log", "--stats-interval", "-t", "--seconds"};
  for (auto f : kFlags) {
    if (f == a) {
      return true;
    }
  }
  return false;
}

} // namespace detail

// Parses argv into ProxyOptions. Unknown flags, missing values and
// inconsistent settings are reported as an error string.
inline std::expected<ProxyOptions, std::string> ParseArgs(int argc,
                                                          char **argv) {
  ProxyOptions opt;
  bool paths_given = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto value = [&]() -> std::expected<std::string, std::string> {
      if (i + 1 >= argc) {
        return std::unexpected(a + ": missing value");
      }
      return std::string(argv[++i]);
    };

    if (a == "-h" || a == "--help") {
      opt.show_help = true;
      return opt;
    }
    if (a == "--ws-keepalive-pings") {
      opt.ws_keepalive_pings = true;
      continue;
    }
    if (a == "--no-broker-check") {
      opt.check_broker = false;
      continue;
    }

    if (!detail::TakesValue(a)) {
      return std::unexpected("unknown option: " + a);
    }
    auto v = value();
    if (!v) {
      return std::unexpected(v.error());
    }
    if (a == "-l" || a == "--listen") {
      auto ep = URL::ParseHostPort(*v, "8000");
      if (!ep) {
        return std::unexpected("--listen: expected HOST:PORT, got '" + *v +
                               "'");
      }
      opt.listen_host = ep->host;
      opt.listen_port = ep->port;
    } else if (a == "-b" || a == "--broker") {
      auto ep = URL::ParseBrokerUrl(*v);
      if (!ep) {
        return std::unexpected("--broker: expected tcp://HOST[:PORT], got '" +
                               *v + "'");
      }
      opt.broker_host = ep->host;
      opt.broker_port = ep->port;
    } else if (a == "--broker-host") {
      opt.broker_host = *v;
    } else if (a == "--broker-port") {
      auto n = detail::ParseNumber<int>(a, *v, 1, 65535);
      if (!n) {
        return std::unexpected(n.error());
      }
      opt.broker_port = *v;
    } else if (a == "-p" || a == "--path") {
      if (v->empty() || v->front() != '/') {
        return std::unexpected("--path: must start with '/': '" + *v + "'");
      }
      if (!paths_given) {
        opt.ws_paths.clear();
        paths_given = true;
      }
      opt.ws_paths.push_back(*v);
    } else if (a == "--read-buffer") {
      auto n = detail::ParseNumber<std::size_t>(a, *v, 512, 16u << 20);
      if (!n) {
        return std::unexpected(n.error());
      }
      opt.read_buffer_size = *n;
    } else if (a == "--small-chunk") {
      auto n = detail::ParseNumber<std::size_t>(a, *v, 0, 1u << 20);
      if (!n) {
        return std::unexpected(n.error());
      }
      opt.flush_policy.small_chunk_threshold = *n;
    } else if (a == "--flush-threshold") {
      auto n = detail::ParseNumber<std::size_t>(a, *v, 0, 64u << 20);
      if (!n) {
        return std::unexpected(n.error());
      }
      opt.flush_policy.flush_threshold = *n;
    } else if (a == "-j" || a == "--threads") {
      auto n = detail::ParseNumber<int>(a, *v, 1, 256);
      if (!n) {
        return std::unexpected(n.error());
      }
      opt.threads = *n;
    } else if (a == "--handshake-timeout") {
      auto n = detail::ParseNumber<int>(a, *v, 1, 3600);
      if (!n) {
        return std::unexpected(n.error());
      }
      opt.handshake_timeout_s = *n;
    } else if (a == "--ws-idle-timeout") {
      auto n = detail::ParseNumber<int>(a, *v, 0, 86400);
      if (!n) {
        return std::unexpected(n.error());
      }
      opt.ws_idle_timeout_s = *n;
    } else if (a == "--log-level") {
      auto level = logging::ParseLevel(*v);
      if (!level) {
        return std::unexpected("--log-level: unknown level '" + *v + "'");
      }
      opt.log_level = *level;
    } else if (a == "--session-log") {
      opt.session_log = *v;
    } else if (a == "--stats-interval") {
      auto n = detail::ParseNumber<int>(a, *v, 0, 86400);
      if (!n) {
        return std::unexpected(n.error());
      }
      opt.stats_interval_s = *n;
    } else if (a == "-t" || a == "--seconds") {
      auto n = detail::ParseNumber<int>(a, *v, 0, 1 << 30);
      if (!n) {
        return std::unexpected(n.error());
      }
      opt.seconds = *n;
    }
  }

  if (opt.ws_keepalive_pings && opt.ws_idle_timeout_s == 0) {
    return std::unexpected(
        "--ws-keepalive-pings requires a nonzero --ws-idle-timeout");
  }
  return opt;
}
