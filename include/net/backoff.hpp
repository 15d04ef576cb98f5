#pragma once

#include <algorithm>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <cstddef>

// namespace retry: exponential backoff for the accept loop. A failing
// accept (EMFILE, ENFILE, ENOBUFS) is retried after a growing pause instead of
// spinning on the error.
namespace retry {

namespace net = boost::asio;

struct Backoff {
  std::size_t initial_ms = 200;
  std::size_t current_ms = 200;
  std::size_t max_ms = 5000;

  void Reset() { current_ms = initial_ms; }
  std::size_t Next() {
    std::size_t v = current_ms;
    current_ms = std::min(max_ms, current_ms * 2);
    return v;
  }
};

template <typename Executor>
void WaitAsync(const Executor &ex, net::yield_context yield, std::size_t ms) {
  boost::system::error_code ec;
  net::steady_timer t(ex);
  t.expires_after(std::chrono::milliseconds(ms));
  t.async_wait(yield[ec]);
  (void)ec;
}

} // namespace retry
