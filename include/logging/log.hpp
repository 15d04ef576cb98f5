#pragma once

#include "io/file_writer.hpp"
#include "util/time.hpp"
#include <atomic>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unistd.h>

// namespace logging: line-oriented diagnostics for the proxy.
// Every record is formatted up front and emitted with a single write(2) on
// stderr, so lines from different reactor threads never interleave.
namespace logging {

enum class Level : int { debug = 0, info = 1, warn = 2, error = 3 };

inline std::atomic<int> g_min_level{static_cast<int>(Level::info)};

inline void SetLevel(Level level) {
  g_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

inline bool Enabled(Level level) {
  return static_cast<int>(level) >=
         g_min_level.load(std::memory_order_relaxed);
}

inline const char *LevelName(Level level) {
  switch (level) {
  case Level::debug:
    return "DEBUG";
  case Level::info:
    return "INFO ";
  case Level::warn:
    return "WARN ";
  case Level::error:
    return "ERROR";
  }
  return "?";
}

inline std::optional<Level> ParseLevel(std::string_view s) {
  if (s == "debug") {
    return Level::debug;
  }
  if (s == "info") {
    return Level::info;
  }
  if (s == "warn") {
    return Level::warn;
  }
  if (s == "error") {
    return Level::error;
  }
  return std::nullopt;
}

template <typename... Args>
void Log(Level level, std::string_view tag, const Args &...args) {
  if (!Enabled(level)) {
    return;
  }
  std::ostringstream oss;
  oss << timeutil::ClockTime() << ' ' << LevelName(level) << " [" << tag
      << "] ";
  (oss << ... << args);
  oss << '\n';
  const std::string line = oss.str();
  // stderr going away is not something we can report anywhere else
  (void)io::WriteAll(STDERR_FILENO, line.data(), line.size());
}

template <typename... Args>
void Debug(std::string_view tag, const Args &...args) {
  Log(Level::debug, tag, args...);
}
template <typename... Args>
void Info(std::string_view tag, const Args &...args) {
  Log(Level::info, tag, args...);
}
template <typename... Args>
void Warn(std::string_view tag, const Args &...args) {
  Log(Level::warn, tag, args...);
}
template <typename... Args>
void Error(std::string_view tag, const Args &...args) {
  Log(Level::error, tag, args...);
}

} // namespace logging
