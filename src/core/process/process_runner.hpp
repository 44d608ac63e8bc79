#pragma once

#include "core/cancellation.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace comfytest::core::process {

// One external command. `program` is looked up on PATH unless it contains a
// path separator. `env` entries are layered over the inherited environment
// for the child only; the engine's own environment is never modified.
struct ProcessSpec {
  std::string program;
  std::vector<std::string> args;
  std::filesystem::path cwd;
  std::map<std::string, std::string> env;
  // When set, combined stdout/stderr is appended to this file as well.
  std::filesystem::path log_path;
  // Zero means no deadline.
  std::chrono::milliseconds timeout{0};
  std::size_t max_capture_bytes = 1024U * 1024U;
};

enum class ProcessOutcome {
  kExited,
  kSignaled,
  kTimedOut,
  kCancelled,
};

const char* ToString(ProcessOutcome outcome);

// Exit code follows the shell convention: 124 for a deadline kill and
// 128+signal for signal termination.
struct ProcessResult {
  ProcessOutcome outcome = ProcessOutcome::kExited;
  int exit_code = -1;
  int pid = -1;
  std::string output;
  bool output_truncated = false;
  std::chrono::milliseconds elapsed{0};
};

// Runs `spec` to completion in its own process group.
//
// Contract:
// - On deadline expiry or cancellation the whole process group is killed and
//   reaped before returning; no child outlives this call.
// - Returns false only when the process could not be spawned.
bool RunProcess(const ProcessSpec& spec, const CancellationToken& cancel, ProcessResult& result,
                std::string& error);

// Long-lived child (the host application server) owned for a scope.
//
// Destruction terminates the process group: SIGTERM, a grace period, then
// SIGKILL, then waitpid. Output goes to `spec.log_path` (or is discarded).
class ScopedProcess {
public:
  ScopedProcess() = default;
  ~ScopedProcess();

  ScopedProcess(const ScopedProcess&) = delete;
  ScopedProcess& operator=(const ScopedProcess&) = delete;
  ScopedProcess(ScopedProcess&& other) noexcept;
  ScopedProcess& operator=(ScopedProcess&& other) noexcept;

  bool Start(const ProcessSpec& spec, std::string& error);

  // Non-blocking liveness probe; reaps the child if it already exited.
  bool IsRunning();
  int Pid() const {
    return pid_;
  }
  int ExitCode() const {
    return exit_code_;
  }

  void Terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(5000));

private:
  int pid_ = -1;
  int exit_code_ = -1;
};

} // namespace comfytest::core::process
