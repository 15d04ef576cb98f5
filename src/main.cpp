#include "config/options.hpp"
#include "core/metrics.hpp"
#include "core/reactor.hpp"
#include "core/server.hpp"
#include "logging/log.hpp"
#include "logging/logger.hpp"
#include "logging/session_record.hpp"
#include "net/ws_ops.hpp"
#include <atomic>
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

// Composition/threading overview:
// - Reactor: io_context on --threads workers; hosts the accept loop and every
//   session as coroutines
// - SessionLogger: dedicated jthread; drains finished-session records and
//   prints periodic stats
// - Main thread: waits for SIGINT/SIGTERM (or the --seconds deadline), then
//   stops accepting, stops the reactor and joins the logger
int main(int argc, char **argv) {
  auto parsed = ParseArgs(argc, argv);
  if (!parsed) {
    std::cerr << "mqtt-ws-proxy: " << parsed.error() << "\n" << Usage();
    return 1;
  }
  const ProxyOptions &opt = *parsed;
  if (opt.show_help) {
    std::cout << Usage();
    return 0;
  }
  logging::SetLevel(opt.log_level);

  if (opt.check_broker) {
    if (auto st = wsops::CheckBroker(opt.broker_host, opt.broker_port)) {
      logging::Info("main", "broker ", opt.broker_host, ":", opt.broker_port,
                    " is up");
    } else {
      logging::Warn("main", "broker ", opt.broker_host, ":", opt.broker_port,
                    " not reachable (", st.error().message(),
                    "); clients will be refused until it is");
    }
  }

  proxy::ProxyMetrics metrics;
  logging::SessionRecordQueue records;
  SessionLogger session_logger{records, metrics,
                               std::chrono::seconds(opt.stats_interval_s)};
  if (!opt.session_log.empty() && !session_logger.Open(opt.session_log)) {
    logging::Error("main", "cannot open session log ", opt.session_log);
    return 1;
  }

  Reactor reactor;
  auto server = std::make_shared<proxy::ProxyServer>(
      reactor.GetIoContext(), proxy::MakeServerConfig(opt), metrics, &records);
  if (auto st = server->Listen(); !st) {
    logging::Error("main", "cannot listen on ", opt.listen_host, ":",
                   opt.listen_port, ": ", st.error().message());
    return 1;
  }

  // Signals and the optional deadline both end up in shutdown() on a reactor
  // thread
  net::signal_set signals(reactor.GetIoContext(), SIGINT, SIGTERM);
  std::optional<net::steady_timer> deadline;
  std::promise<void> done;
  auto done_future = done.get_future();
  std::atomic<bool> shutting_down{false};
  auto shutdown = [&](const char *why) {
    if (shutting_down.exchange(true)) {
      return;
    }
    logging::Info("main", "shutting down (", why, ")");
    server->Stop();
    done.set_value();
  };
  signals.async_wait([&](const boost::system::error_code &ec, int signo) {
    if (!ec) {
      shutdown(signo == SIGINT ? "SIGINT" : "SIGTERM");
    }
  });
  if (opt.seconds > 0) {
    deadline.emplace(reactor.GetIoContext());
    deadline->expires_after(std::chrono::seconds(opt.seconds));
    deadline->async_wait([&](const boost::system::error_code &ec) {
      if (!ec) {
        shutdown("deadline");
      }
    });
  }

  session_logger.Start();
  server->Start();
  reactor.Start(opt.threads);

  done_future.wait();
  reactor.Join();
  session_logger.Join();
  const auto s = proxy::Snapshot(metrics);
  logging::Info("main", "served ", s.sessions_started, " sessions, ",
                s.connect_failures, " broker connect failures, ",
                s.upgrades_rejected, " rejected requests");
  return 0;
}
