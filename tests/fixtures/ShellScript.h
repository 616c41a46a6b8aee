// Repository: MacReplay-gateway
// Component: Shell Script Fixture
// Purpose: Temporary /bin/sh executables standing in for ffmpeg and ffprobe.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_TESTS_FIXTURES_SHELL_SCRIPT_H_
#define MACREPLAY_TESTS_FIXTURES_SHELL_SCRIPT_H_

#include <signal.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace macreplay::tests::fixtures {

// TestDirectory is a mkdtemp directory removed with its contents on
// destruction.
class TestDirectory {
 public:
  TestDirectory() {
    char pattern[] = "/tmp/macreplay-test-XXXXXX";
    const char* created = mkdtemp(pattern);
    path_ = created ? created : "";
  }

  ~TestDirectory() {
    if (!path_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
  }

  TestDirectory(const TestDirectory&) = delete;
  TestDirectory& operator=(const TestDirectory&) = delete;

  const std::string& path() const { return path_; }
  std::string File(const std::string& name) const { return path_ + "/" + name; }

 private:
  std::string path_;
};

// Writes `body` as an executable /bin/sh script in `dir` and returns its path.
inline std::string WriteShellScript(const TestDirectory& dir, const std::string& name,
                                    const std::string& body) {
  const std::string path = dir.File(name);
  {
    std::ofstream out(path, std::ios::trunc);
    out << "#!/bin/sh\n" << body << "\n";
  }
  chmod(path.c_str(), 0755);
  return path;
}

// True while a process with `pid` exists (zombies included).
inline bool ProcessExists(pid_t pid) { return pid > 0 && ::kill(pid, 0) == 0; }

}  // namespace macreplay::tests::fixtures

#endif  // MACREPLAY_TESTS_FIXTURES_SHELL_SCRIPT_H_
