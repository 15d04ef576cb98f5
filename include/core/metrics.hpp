#pragma once

#include <atomic>
#include <cstdint>

namespace proxy {

// ProxyMetrics: process-scoped counters shared by the acceptor and all
// sessions. Passed by reference; every field is updated with relaxed atomics
// from whichever reactor thread runs the session.
struct ProxyMetrics {
  std::atomic<std::uint64_t> connections_accepted{0};
  std::atomic<std::uint64_t> upgrades_rejected{0};
  std::atomic<std::uint64_t> sessions_started{0};
  std::atomic<std::int64_t> sessions_active{0};
  std::atomic<std::uint64_t> sessions_finished{0};
  std::atomic<std::uint64_t> connect_failures{0};
  std::atomic<std::uint64_t> relays_started{0};
  std::atomic<std::uint64_t> transport_errors{0};
  std::atomic<std::uint64_t> broker_closes{0};
  std::atomic<std::uint64_t> bytes_client_to_broker{0};
  std::atomic<std::uint64_t> bytes_broker_to_client{0};
  std::atomic<std::uint64_t> chunks_client_to_broker{0};
  std::atomic<std::uint64_t> chunks_broker_to_client{0};
  std::atomic<std::uint64_t> flushes_client_to_broker{0};

  static void Add(std::atomic<std::uint64_t> &c, std::uint64_t v) {
    c.fetch_add(v, std::memory_order_relaxed);
  }
  static std::uint64_t Get(const std::atomic<std::uint64_t> &c) {
    return c.load(std::memory_order_relaxed);
  }
};

// Plain copy of the counters for reporting.
struct MetricsSnapshot {
  std::uint64_t connections_accepted = 0;
  std::uint64_t upgrades_rejected = 0;
  std::uint64_t sessions_started = 0;
  std::int64_t sessions_active = 0;
  std::uint64_t sessions_finished = 0;
  std::uint64_t connect_failures = 0;
  std::uint64_t transport_errors = 0;
  std::uint64_t bytes_client_to_broker = 0;
  std::uint64_t bytes_broker_to_client = 0;
  std::uint64_t chunks_client_to_broker = 0;
  std::uint64_t chunks_broker_to_client = 0;
  std::uint64_t flushes_client_to_broker = 0;
};

inline MetricsSnapshot Snapshot(const ProxyMetrics &m) {
  MetricsSnapshot s;
  s.connections_accepted = ProxyMetrics::Get(m.connections_accepted);
  s.upgrades_rejected = ProxyMetrics::Get(m.upgrades_rejected);
  s.sessions_started = ProxyMetrics::Get(m.sessions_started);
  s.sessions_active = m.sessions_active.load(std::memory_order_relaxed);
  s.sessions_finished = ProxyMetrics::Get(m.sessions_finished);
  s.connect_failures = ProxyMetrics::Get(m.connect_failures);
  s.transport_errors = ProxyMetrics::Get(m.transport_errors);
  s.bytes_client_to_broker = ProxyMetrics::Get(m.bytes_client_to_broker);
  s.bytes_broker_to_client = ProxyMetrics::Get(m.bytes_broker_to_client);
  s.chunks_client_to_broker = ProxyMetrics::Get(m.chunks_client_to_broker);
  s.chunks_broker_to_client = ProxyMetrics::Get(m.chunks_broker_to_client);
  s.flushes_client_to_broker = ProxyMetrics::Get(m.flushes_client_to_broker);
  return s;
}

} // namespace proxy
