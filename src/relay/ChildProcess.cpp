// Repository: MacReplay-gateway
// Component: Child Process
// Purpose: Owns one external relay or probe process and its stdout pipe.
// Copyright (c) 2025 MacReplay

#include "macreplay/relay/ChildProcess.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "macreplay/util/Logger.hpp"

namespace macreplay::relay {

using macreplay::util::Logger;

namespace {
constexpr std::chrono::milliseconds kDefaultKillGrace(500);
}

ChildProcess::ChildProcess(pid_t pid, int stdout_fd) : pid_(pid), stdout_fd_(stdout_fd) {}

ChildProcess::~ChildProcess() {
  if (!exited_) {
    Kill();
  }
  CloseStdout();
}

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const std::vector<std::string>& argv,
                                                  bool capture_stdout) {
  if (argv.empty()) return nullptr;

  // argv is prepared before fork; the child only calls async-signal-safe functions.
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  int pipe_fds[2] = {-1, -1};
  if (capture_stdout && pipe2(pipe_fds, O_CLOEXEC) != 0) {
    Logger::Error(std::string("[ChildProcess] pipe failed: ") + std::strerror(errno));
    return nullptr;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    Logger::Error(std::string("[ChildProcess] fork failed: ") + std::strerror(errno));
    if (capture_stdout) {
      close(pipe_fds[0]);
      close(pipe_fds[1]);
    }
    return nullptr;
  }

  if (pid == 0) {
    const int null_fd = open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
      dup2(null_fd, STDIN_FILENO);
      dup2(null_fd, STDERR_FILENO);
      if (!capture_stdout) dup2(null_fd, STDOUT_FILENO);
    }
    if (capture_stdout) {
      dup2(pipe_fds[1], STDOUT_FILENO);
    }
    execvp(args[0], args.data());
    _exit(127);  // execvp only returns on error
  }

  if (capture_stdout) {
    close(pipe_fds[1]);
  }
  Logger::Debug("[ChildProcess] Spawned pid " + std::to_string(pid) + ": " + argv[0]);
  return std::unique_ptr<ChildProcess>(
      new ChildProcess(pid, capture_stdout ? pipe_fds[0] : -1));
}

ReadResult ChildProcess::Read(char* buffer, size_t capacity,
                              std::chrono::milliseconds timeout) {
  ReadResult result;
  if (stdout_fd_ < 0) {
    result.status = ReadStatus::kEndOfStream;
    return result;
  }

  pollfd pfd{};
  pfd.fd = stdout_fd_;
  pfd.events = POLLIN;
  const int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready == 0) {
    result.status = ReadStatus::kTimeout;
    return result;
  }
  if (ready < 0) {
    result.status = errno == EINTR ? ReadStatus::kTimeout : ReadStatus::kError;
    return result;
  }

  const ssize_t n = read(stdout_fd_, buffer, capacity);
  if (n > 0) {
    result.status = ReadStatus::kData;
    result.bytes = static_cast<size_t>(n);
  } else if (n == 0) {
    result.status = ReadStatus::kEndOfStream;
  } else {
    result.status = (errno == EINTR || errno == EAGAIN) ? ReadStatus::kTimeout
                                                        : ReadStatus::kError;
  }
  return result;
}

std::optional<int> ChildProcess::Reap(bool block) {
  if (exited_) return exit_status_;
  int status = 0;
  pid_t rc;
  do {
    rc = waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (rc < 0 && errno == EINTR);

  if (rc == 0) return std::nullopt;
  if (rc < 0) {
    // Already reaped elsewhere; treat as a failed exit.
    exited_ = true;
    exit_status_ = -1;
    return exit_status_;
  }
  exited_ = true;
  if (WIFEXITED(status)) {
    exit_status_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_status_ = -WTERMSIG(status);
  } else {
    exit_status_ = -1;
  }
  return exit_status_;
}

void ChildProcess::Kill(std::chrono::milliseconds grace) {
  if (exited_) return;
  if (Reap(false)) return;

  kill(pid_, SIGTERM);
  if (WaitFor(grace)) return;

  Logger::Warn("[ChildProcess] pid " + std::to_string(pid_) +
               " ignored SIGTERM, sending SIGKILL");
  kill(pid_, SIGKILL);
  Reap(true);
}

void ChildProcess::Kill() { Kill(kDefaultKillGrace); }

int ChildProcess::Wait() {
  auto status = Reap(true);
  return status.value_or(-1);
}

std::optional<int> ChildProcess::WaitFor(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto status = Reap(false);
    if (status) return status;
    if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void ChildProcess::CloseStdout() {
  if (stdout_fd_ >= 0) {
    close(stdout_fd_);
    stdout_fd_ = -1;
  }
}

}  // namespace macreplay::relay
