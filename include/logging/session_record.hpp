#pragma once

#include <boost/lockfree/queue.hpp>
#include <cstddef>
#include <cstdint>

namespace logging {

// Summary of one finished session, produced on a reactor thread and written
// by the SessionLogger thread. Trivially copyable so it can travel through a
// fixed-capacity lock-free queue.
struct SessionRecord {
  std::uint64_t session_id;
  std::int64_t started_epoch_ms;
  std::int64_t duration_ms;
  std::uint64_t bytes_client_to_broker;
  std::uint64_t bytes_broker_to_client;
  std::uint64_t chunks_client_to_broker;
  std::uint64_t chunks_broker_to_client;
  std::uint64_t flushes_client_to_broker;
  std::uint8_t first_finished;   // proxy::Direction
  std::uint8_t outcome_upstream;   // proxy::RelayOutcome of ws->tcp
  std::uint8_t outcome_downstream; // proxy::RelayOutcome of tcp->ws
  bool connect_failed;
};

inline constexpr std::size_t kSessionRecordCapacity = 4096;

// Multi-producer (one per reactor thread), single consumer.
using SessionRecordQueue =
    boost::lockfree::queue<SessionRecord,
                           boost::lockfree::capacity<kSessionRecordCapacity>>;

} // namespace logging
