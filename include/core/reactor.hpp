#pragma once

#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <optional>
#include <thread>
#include <vector>

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns a single io_context shared by the acceptor and all sessions
// - Runs io_context::run() on N std::jthread workers; sessions execute as
//   coroutines on per-session strands, so N > 1 spreads sessions across
//   threads without any session-internal locking
// - Join() stops the context and waits for the workers; pending handlers are
//   destroyed with the io_context
class Reactor {
public:
  Reactor() = default;
  Reactor(const Reactor &) = delete;
  Reactor &operator=(const Reactor &) = delete;

  net::io_context &GetIoContext() { return ioc_; }

  void Start(int numThreads = 1) {
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    threads_.reserve(static_cast<std::size_t>(numThreads));
    for (int i = 0; i < numThreads; ++i) {
      threads_.emplace_back([this] { ioc_.run(); });
    }
  }

  void Stop() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    ioc_.stop();
  }

  void Join() {
    Stop();
    for (auto &t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    threads_.clear();
  }

  ~Reactor() { Join(); }

private:
  net::io_context ioc_;
  std::vector<std::jthread> threads_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};
