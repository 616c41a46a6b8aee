// Repository: MacReplay-gateway
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by request, relay and refresh threads.
// Copyright (c) 2025 MacReplay

#include "macreplay/util/Logger.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace macreplay::util {

std::mutex Logger::mutex_;
std::ofstream Logger::file_;
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::info_sink_;

namespace {

std::string Timestamp() {
  const std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

}  // namespace

bool Logger::SetLogFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
  }
  file_.open(path, std::ios::out | std::ios::app);
  return file_.is_open();
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::WriteFileLocked(const char* level, const std::string& line) {
  if (!file_.is_open()) return;
  file_ << Timestamp() << " [" << level << "] " << line << '\n';
  file_.flush();
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << "[INFO] " << line << '\n';
  std::cout.flush();
  WriteFileLocked("INFO", line);
}

void Logger::Debug(const std::string& line) {
  if (std::getenv("MACREPLAY_DEBUG") == nullptr) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << "[DEBUG] " << line << '\n';
  std::cout.flush();
  WriteFileLocked("DEBUG", line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[WARNING] " << line << '\n';
  std::cerr.flush();
  WriteFileLocked("WARNING", line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << "[ERROR] " << line << '\n';
  std::cerr.flush();
  WriteFileLocked("ERROR", line);
}

}  // namespace macreplay::util
