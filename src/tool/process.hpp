#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace codeloop {

struct ProcessOptions {
  // Executed directly via execvp; use {"/bin/sh", "-c", cmd} for shell text
  std::vector<std::string> argv;
  std::string stdin_data;
  std::filesystem::path workdir;
  std::chrono::milliseconds timeout{120000};
  bool merge_stderr = true;
  std::shared_ptr<std::atomic<bool>> abort_signal;
};

struct ProcessOutput {
  int exit_code = -1;
  std::string out;  // stdout, interleaved with stderr when merged
  std::string err;
  bool timed_out = false;
  bool cancelled = false;
  std::string error;  // spawn failure

  bool spawned() const {
    return error.empty();
  }
};

// Run a child in its own process group. On timeout or abort the whole group
// gets SIGTERM, then SIGKILL after a short grace period.
ProcessOutput run_process(const ProcessOptions &options);

}  // namespace codeloop
