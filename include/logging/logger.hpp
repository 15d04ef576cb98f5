#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fcntl.h>
#include <string>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

#include "core/metrics.hpp"
#include "core/relay_types.hpp"
#include "io/file_writer.hpp"
#include "logging/log.hpp"
#include "logging/session_record.hpp"
#include "util/branch.hpp"

// LoggerBase
// Threading model:
// - Owns one background std::jthread worker (started via Start)
// - Derived class implements RunLoop() and controls draining strategy
// - Join() stops the worker and waits for clean shutdown
template <typename Derived> class LoggerBase {
public:
  LoggerBase() = default;
  ~LoggerBase() { Join(); }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ =
        std::jthread([this] { static_cast<Derived *>(this)->RunLoop(); });
  }

  void Join() {
    running_.store(false, std::memory_order_relaxed);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

protected:
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

// SessionLogger
// Threading model:
// - Single background thread drains the shared SessionRecordQueue (sessions on
//   any reactor thread are producers) and appends one line per record to the
//   session log with batched writev
// - Every stats interval it also logs a throughput summary computed from the
//   process-wide ProxyMetrics
// - On Join() the queue is drained completely before the thread exits
class SessionLogger : public LoggerBase<SessionLogger> {
public:
  SessionLogger(logging::SessionRecordQueue &queue,
                const proxy::ProxyMetrics &metrics,
                std::chrono::seconds stats_interval)
      : queue_(queue), metrics_(metrics), stats_interval_(stats_interval) {}

  ~SessionLogger() {
    Join();
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  // Opens (appending) the per-session log. Without a file, records are still
  // drained so producers never see a full queue.
  bool Open(const std::string &path) {
    fd_ = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    return fd_ != -1;
  }

  void RunLoop() {
    using clock = std::chrono::steady_clock;
    auto last_stats = clock::now();
    auto prev = proxy::Snapshot(metrics_);
    for (;;) {
      const bool running = this->running_.load(std::memory_order_relaxed);
      const std::size_t drained = Drain();
      if (stats_interval_.count() > 0 &&
          clock::now() - last_stats >= stats_interval_) {
        auto now = proxy::Snapshot(metrics_);
        ReportStats(prev, now, clock::now() - last_stats);
        prev = now;
        last_stats = clock::now();
      }
      if (BRANCH_UNLIKELY(!running)) {
        break;
      }
      if (BRANCH_LIKELY(drained == 0)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    }
    (void)Drain();
  }

  static int FormatRecord(const logging::SessionRecord &r, char *out,
                          std::size_t cap) {
    const auto first = static_cast<proxy::Direction>(r.first_finished);
    const auto up = static_cast<proxy::RelayOutcome>(r.outcome_upstream);
    const auto down = static_cast<proxy::RelayOutcome>(r.outcome_downstream);
    int n = std::snprintf(
        out, cap,
        "start_ms=%lld session=%llu duration_ms=%lld connect_failed=%d "
        "ws_tcp_bytes=%llu ws_tcp_chunks=%llu ws_tcp_flushes=%llu "
        "tcp_ws_bytes=%llu tcp_ws_chunks=%llu first=%s ws_tcp=%s tcp_ws=%s\n",
        static_cast<long long>(r.started_epoch_ms),
        static_cast<unsigned long long>(r.session_id),
        static_cast<long long>(r.duration_ms), r.connect_failed ? 1 : 0,
        static_cast<unsigned long long>(r.bytes_client_to_broker),
        static_cast<unsigned long long>(r.chunks_client_to_broker),
        static_cast<unsigned long long>(r.flushes_client_to_broker),
        static_cast<unsigned long long>(r.bytes_broker_to_client),
        static_cast<unsigned long long>(r.chunks_broker_to_client),
        r.connect_failed ? "-" : proxy::ToString(first),
        r.connect_failed ? "-" : proxy::ToString(up),
        r.connect_failed ? "-" : proxy::ToString(down));
    if (n < 0) {
      return 0;
    }
    return n < static_cast<int>(cap) ? n : static_cast<int>(cap) - 1;
  }

private:
  static constexpr int kBatch = 64;
  static constexpr std::size_t kLineCap = 320;

  std::size_t Drain() {
    struct iovec iov[kBatch];
    char lines[kBatch][kLineCap];
    int cnt = 0;
    std::size_t total = 0;
    logging::SessionRecord rec;
    while (queue_.pop(rec)) {
      ++total;
      if (fd_ == -1) {
        continue;
      }
      const int len = FormatRecord(rec, lines[cnt], kLineCap);
      iov[cnt] = {lines[cnt], static_cast<std::size_t>(len)};
      if (++cnt == kBatch) {
        Flush(iov, cnt);
        cnt = 0;
      }
    }
    if (cnt > 0) {
      Flush(iov, cnt);
    }
    return total;
  }

  void Flush(struct iovec *iov, int cnt) {
    if (!io::WritevAll(fd_, iov, cnt)) {
      logging::Error("session-log", "write failed, disabling session log");
      ::close(fd_);
      fd_ = -1;
    }
  }

  void ReportStats(const proxy::MetricsSnapshot &a,
                   const proxy::MetricsSnapshot &b,
                   std::chrono::steady_clock::duration elapsed) {
    const double secs =
        std::chrono::duration_cast<std::chrono::duration<double>>(elapsed)
            .count();
    if (secs <= 0.0) {
      return;
    }
    const double up_msgs =
        static_cast<double>(b.chunks_client_to_broker -
                            a.chunks_client_to_broker) /
        secs;
    const double down_msgs =
        static_cast<double>(b.chunks_broker_to_client -
                            a.chunks_broker_to_client) /
        secs;
    const double up_kib = static_cast<double>(b.bytes_client_to_broker -
                                              a.bytes_client_to_broker) /
                          1024.0 / secs;
    const double down_kib = static_cast<double>(b.bytes_broker_to_client -
                                                a.bytes_broker_to_client) /
                            1024.0 / secs;
    logging::Info("stats", "active=", b.sessions_active,
                  " finished=", b.sessions_finished,
                  " connect_failures=", b.connect_failures,
                  " transport_errors=", b.transport_errors,
                  " ws->tcp msg/s=", up_msgs, " KiB/s=", up_kib,
                  " flushes=", b.flushes_client_to_broker - a.flushes_client_to_broker,
                  " tcp->ws msg/s=", down_msgs, " KiB/s=", down_kib);
  }

  logging::SessionRecordQueue &queue_;
  const proxy::ProxyMetrics &metrics_;
  std::chrono::seconds stats_interval_;
  int fd_ = -1;
};
