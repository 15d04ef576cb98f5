#pragma once

#include <cstddef>

namespace proxy {

// FlushPolicy: batching rule for the client→broker direction.
// - Chunks smaller than small_chunk_threshold are flushed immediately: they
//   are acks/keepalives (PUBACK, PINGREQ, ...) where latency dominates
// - Larger chunks accumulate until the pending total exceeds flush_threshold
// The broker→client direction does not use this policy; every read is
// forwarded as its own WebSocket message.
struct FlushPolicy {
  std::size_t small_chunk_threshold = 100;
  std::size_t flush_threshold = 131072;

  // n: size of the chunk just read; pending: unflushed bytes before it
  bool ShouldFlush(std::size_t n, std::size_t pending) const {
    if (n < small_chunk_threshold) {
      return true;
    }
    return pending + n > flush_threshold;
  }
};

// PendingCounter: per-session accounting of unflushed client→broker bytes.
class PendingCounter {
public:
  explicit PendingCounter(FlushPolicy policy) : policy_(policy) {}

  // Adds a chunk and returns true when the accumulated bytes must be flushed.
  bool Record(std::size_t n) {
    const bool flush = policy_.ShouldFlush(n, pending_);
    pending_ += n;
    return flush;
  }

  void Reset() { pending_ = 0; }
  std::size_t Pending() const { return pending_; }

private:
  FlushPolicy policy_;
  std::size_t pending_ = 0;
};

} // namespace proxy
