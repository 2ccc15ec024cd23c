// Repository: KitchenSync
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission so concurrent tasks never interleave lines.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_UTIL_LOGGER_HPP_
#define KITCHENSYNC_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace kitchensync::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from concurrent tasks (broadcast loop, control listener,
// sync listener, heartbeat loop) never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when KITCHENSYNC_DEBUG env is set
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (hard faults)
//
// Test-only: SetErrorSink / SetWarnSink install a callback invoked for every
// Error() / Warn() line (in addition to stderr). Used by tests to assert that
// a swallowed failure was still reported.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Returns true when KITCHENSYNC_DEBUG is set (callers can skip formatting).
  static bool DebugEnabled();

  // Test-only: call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
};

}  // namespace kitchensync::util

#endif  // KITCHENSYNC_UTIL_LOGGER_HPP_
