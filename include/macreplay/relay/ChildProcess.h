// Repository: MacReplay-gateway
// Component: Child Process
// Purpose: Owns one external relay or probe process and its stdout pipe.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_RELAY_CHILD_PROCESS_H_
#define MACREPLAY_RELAY_CHILD_PROCESS_H_

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace macreplay::relay {

enum class ReadStatus {
  kData,
  kEndOfStream,
  kTimeout,
  kError,
};

struct ReadResult {
  ReadStatus status = ReadStatus::kError;
  size_t bytes = 0;
};

// IRelayProcess is the output side of a running relay command.
class IRelayProcess {
 public:
  virtual ~IRelayProcess() = default;

  // Waits up to `timeout` for stdout data and reads at most `capacity` bytes.
  virtual ReadResult Read(char* buffer, size_t capacity, std::chrono::milliseconds timeout) = 0;

  // Stops the process; Wait() returns promptly afterwards.
  virtual void Kill() = 0;

  // Blocks until the process exits. Exit code, or -signal when it was killed.
  virtual int Wait() = 0;
};

// ChildProcess runs argv[0] (resolved through PATH) with stdin and stderr on
// /dev/null. With capture_stdout the child's stdout is readable through
// Read(); otherwise it goes to /dev/null as well. The destructor kills and
// reaps a child that is still running.
class ChildProcess final : public IRelayProcess {
 public:
  ~ChildProcess() override;

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  // Returns nullptr when the pipe or fork fails. A missing executable is
  // reported later as exit status 127.
  static std::unique_ptr<ChildProcess> Spawn(const std::vector<std::string>& argv,
                                             bool capture_stdout);

  pid_t pid() const { return pid_; }

  ReadResult Read(char* buffer, size_t capacity, std::chrono::milliseconds timeout) override;

  // SIGTERM, then SIGKILL if the child has not exited within `grace`.
  void Kill(std::chrono::milliseconds grace);
  void Kill() override;

  int Wait() override;

  // Like Wait() but gives up after `timeout`.
  std::optional<int> WaitFor(std::chrono::milliseconds timeout);

  bool exited() const { return exited_; }

 private:
  ChildProcess(pid_t pid, int stdout_fd);

  std::optional<int> Reap(bool block);
  void CloseStdout();

  pid_t pid_;
  int stdout_fd_;
  bool exited_ = false;
  int exit_status_ = 0;
};

}  // namespace macreplay::relay

#endif  // MACREPLAY_RELAY_CHILD_PROCESS_H_
