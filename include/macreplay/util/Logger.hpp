// Repository: MacReplay-gateway
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by request, relay and refresh threads.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_UTIL_LOGGER_HPP_
#define MACREPLAY_UTIL_LOGGER_HPP_

#include <functional>
#include <fstream>
#include <mutex>
#include <string>

namespace macreplay::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from concurrent relays never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when MACREPLAY_DEBUG env is set
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (failures that cost a caller its stream or artifact)
//
// When a log file is set every level that is emitted is also appended there.
//
// Test-only: SetErrorSink / SetInfoSink install callbacks invoked for every
// Error() / Info() line. Used by tests to assert on logged context.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Appends all subsequent lines to `path`. Returns false if it cannot be opened.
  static bool SetLogFile(const std::string& path);

  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static void WriteFileLocked(const char* level, const std::string& line);

  static std::mutex mutex_;
  static std::ofstream file_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace macreplay::util

#endif  // MACREPLAY_UTIL_LOGGER_HPP_
