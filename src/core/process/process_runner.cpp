#include "core/process/process_runner.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <system_error>
#include <thread>

#if !defined(_WIN32)
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

namespace fs = std::filesystem;

namespace comfytest::core::process {

const char* ToString(ProcessOutcome outcome) {
  switch (outcome) {
  case ProcessOutcome::kExited:
    return "exited";
  case ProcessOutcome::kSignaled:
    return "signaled";
  case ProcessOutcome::kTimedOut:
    return "timed_out";
  case ProcessOutcome::kCancelled:
    return "cancelled";
  }
  return "exited";
}

#if !defined(_WIN32)

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
constexpr int kTimeoutExitCode = 124;

// Inherited environment with `overrides` layered on top, as KEY=VALUE lines.
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> entries;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string_view line(*entry);
    const std::size_t eq = line.find('=');
    const std::string key(line.substr(0, eq));
    if (overrides.find(key) != overrides.end()) {
      continue;
    }
    entries.emplace_back(line);
  }
  for (const auto& [key, value] : overrides) {
    entries.push_back(key + "=" + value);
  }
  return entries;
}

bool ResolveProgram(const ProcessSpec& spec, std::string& resolved, std::string& error) {
  if (spec.program.empty()) {
    error = "process program cannot be empty";
    return false;
  }
  if (spec.program.find('/') != std::string::npos) {
    resolved = spec.program;
    return true;
  }

  std::string path_value;
  const auto path_override = spec.env.find("PATH");
  if (path_override != spec.env.end()) {
    path_value = path_override->second;
  } else if (const char* inherited = std::getenv("PATH"); inherited != nullptr) {
    path_value = inherited;
  }

  std::size_t start = 0;
  while (start <= path_value.size()) {
    const std::size_t end = std::min(path_value.find(':', start), path_value.size());
    const std::string dir = path_value.substr(start, end - start);
    const fs::path candidate = fs::path(dir.empty() ? "." : dir) / spec.program;
    if (::access(candidate.c_str(), X_OK) == 0) {
      resolved = candidate.string();
      return true;
    }
    start = end + 1;
  }

  error = "executable not found on PATH: " + spec.program;
  return false;
}

std::vector<char*> ToCharPointers(std::vector<std::string>& items) {
  std::vector<char*> pointers;
  pointers.reserve(items.size() + 1U);
  for (auto& item : items) {
    pointers.push_back(item.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

// Runs in the forked child only: new session (own process group), output
// redirected to `output_fd`, stdin from /dev/null.
[[noreturn]] void ExecChild(const std::string& program, const fs::path& cwd, int output_fd,
                            char* const* argv, char* const* envp) {
  ::setsid();
  const int null_fd = ::open("/dev/null", O_RDONLY);
  if (null_fd >= 0) {
    ::dup2(null_fd, STDIN_FILENO);
    ::close(null_fd);
  }
  ::dup2(output_fd, STDOUT_FILENO);
  ::dup2(output_fd, STDERR_FILENO);
  ::close(output_fd);

  if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
    ::_exit(127);
  }
  ::execve(program.c_str(), argv, envp);
  ::_exit(127);
}

int DecodeWaitStatus(int status, ProcessOutcome& outcome) {
  if (WIFEXITED(status)) {
    outcome = ProcessOutcome::kExited;
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    outcome = ProcessOutcome::kSignaled;
    return 128 + WTERMSIG(status);
  }
  outcome = ProcessOutcome::kSignaled;
  return -1;
}

// Owns a descriptor opened close-on-exec, so children forked by other
// platform threads never inherit it.
class LogFd {
public:
  explicit LogFd(int fd) : fd_(fd) {}
  ~LogFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  LogFd(const LogFd&) = delete;
  LogFd& operator=(const LogFd&) = delete;

  int get() const {
    return fd_;
  }

private:
  int fd_ = -1;
};

int OpenLogAppend(const fs::path& path) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }
  return ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
}

bool OpenOutputPipe(int fds[2]) {
#if defined(__linux__)
  return ::pipe2(fds, O_CLOEXEC) == 0;
#else
  if (::pipe(fds) != 0) {
    return false;
  }
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
#endif
}

void AppendCapture(const ProcessSpec& spec, const char* data, std::size_t size,
                   ProcessResult& result, int log_fd) {
  if (log_fd >= 0) {
    std::size_t written = 0;
    while (written < size) {
      const ssize_t n = ::write(log_fd, data + written, size - written);
      if (n <= 0) {
        break;
      }
      written += static_cast<std::size_t>(n);
    }
  }
  const std::size_t room = result.output.size() < spec.max_capture_bytes
                               ? spec.max_capture_bytes - result.output.size()
                               : 0U;
  const std::size_t take = std::min(room, size);
  result.output.append(data, take);
  if (take < size) {
    result.output_truncated = true;
  }
}

void DrainPipe(int fd, const ProcessSpec& spec, ProcessResult& result, int log_fd) {
  char buffer[4096];
  while (true) {
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n <= 0) {
      return;
    }
    AppendCapture(spec, buffer, static_cast<std::size_t>(n), result, log_fd);
  }
}

} // namespace

bool RunProcess(const ProcessSpec& spec, const CancellationToken& cancel, ProcessResult& result,
                std::string& error) {
  result = ProcessResult{};

  std::string program;
  if (!ResolveProgram(spec, program, error)) {
    return false;
  }

  const LogFd log_file(spec.log_path.empty() ? -1 : OpenLogAppend(spec.log_path));
  if (!spec.log_path.empty() && log_file.get() < 0) {
    error = "failed to open process log '" + spec.log_path.string() + "'";
    return false;
  }

  std::vector<std::string> arg_storage;
  arg_storage.reserve(spec.args.size() + 1U);
  arg_storage.push_back(program);
  arg_storage.insert(arg_storage.end(), spec.args.begin(), spec.args.end());
  std::vector<std::string> env_storage = BuildEnvironment(spec.env);
  std::vector<char*> argv = ToCharPointers(arg_storage);
  std::vector<char*> envp = ToCharPointers(env_storage);

  int output_pipe[2];
  if (!OpenOutputPipe(output_pipe)) {
    error = "failed to create output pipe for '" + spec.program + "'";
    return false;
  }

  const auto started_at = std::chrono::steady_clock::now();
  const pid_t pid = ::fork();
  if (pid < 0) {
    ::close(output_pipe[0]);
    ::close(output_pipe[1]);
    error = "failed to fork process for '" + spec.program + "'";
    return false;
  }
  if (pid == 0) {
    ::close(output_pipe[0]);
    ExecChild(program, spec.cwd, output_pipe[1], argv.data(), envp.data());
  }

  ::close(output_pipe[1]);
  ::fcntl(output_pipe[0], F_SETFL, O_NONBLOCK);
  result.pid = static_cast<int>(pid);

  const bool has_deadline = spec.timeout.count() > 0;
  const auto deadline = started_at + spec.timeout;
  int status = 0;
  std::optional<ProcessOutcome> forced_outcome;
  while (true) {
    DrainPipe(output_pipe[0], spec, result, log_file.get());

    if (::waitpid(pid, &status, WNOHANG) == pid) {
      break;
    }

    if (cancel.IsCancelled()) {
      forced_outcome = ProcessOutcome::kCancelled;
    } else if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
      forced_outcome = ProcessOutcome::kTimedOut;
    }
    if (forced_outcome.has_value()) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }

  // Stragglers left in the group (daemonized helpers) go with the leader.
  ::kill(-pid, SIGKILL);
  DrainPipe(output_pipe[0], spec, result, log_file.get());
  ::close(output_pipe[0]);

  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started_at);
  if (forced_outcome.has_value()) {
    result.outcome = *forced_outcome;
    result.exit_code = *forced_outcome == ProcessOutcome::kTimedOut ? kTimeoutExitCode
                                                                    : 128 + SIGKILL;
  } else {
    result.exit_code = DecodeWaitStatus(status, result.outcome);
  }
  if (result.output_truncated) {
    result.output += "(truncated)";
  }
  return true;
}

ScopedProcess::~ScopedProcess() {
  Terminate();
}

ScopedProcess::ScopedProcess(ScopedProcess&& other) noexcept
    : pid_(other.pid_), exit_code_(other.exit_code_) {
  other.pid_ = -1;
}

ScopedProcess& ScopedProcess::operator=(ScopedProcess&& other) noexcept {
  if (this != &other) {
    Terminate();
    pid_ = other.pid_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
  }
  return *this;
}

bool ScopedProcess::Start(const ProcessSpec& spec, std::string& error) {
  if (pid_ > 0) {
    error = "process already started (pid " + std::to_string(pid_) + ")";
    return false;
  }

  std::string program;
  if (!ResolveProgram(spec, program, error)) {
    return false;
  }

  int output_fd = -1;
  if (spec.log_path.empty()) {
    output_fd = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
  } else {
    output_fd = OpenLogAppend(spec.log_path);
  }
  if (output_fd < 0) {
    error = "failed to open process log '" + spec.log_path.string() + "'";
    return false;
  }

  std::vector<std::string> arg_storage;
  arg_storage.reserve(spec.args.size() + 1U);
  arg_storage.push_back(program);
  arg_storage.insert(arg_storage.end(), spec.args.begin(), spec.args.end());
  std::vector<std::string> env_storage = BuildEnvironment(spec.env);
  std::vector<char*> argv = ToCharPointers(arg_storage);
  std::vector<char*> envp = ToCharPointers(env_storage);

  const pid_t pid = ::fork();
  if (pid < 0) {
    ::close(output_fd);
    error = "failed to fork process for '" + spec.program + "'";
    return false;
  }
  if (pid == 0) {
    ExecChild(program, spec.cwd, output_fd, argv.data(), envp.data());
  }

  ::close(output_fd);
  pid_ = static_cast<int>(pid);
  exit_code_ = -1;
  return true;
}

bool ScopedProcess::IsRunning() {
  if (pid_ <= 0) {
    return false;
  }
  int status = 0;
  const pid_t waited = ::waitpid(pid_, &status, WNOHANG);
  if (waited == 0) {
    return true;
  }
  if (waited == pid_) {
    ProcessOutcome outcome = ProcessOutcome::kExited;
    exit_code_ = DecodeWaitStatus(status, outcome);
  }
  ::kill(-pid_, SIGKILL);
  pid_ = -1;
  return false;
}

void ScopedProcess::Terminate(std::chrono::milliseconds grace) {
  if (pid_ <= 0) {
    return;
  }

  const pid_t pid = static_cast<pid_t>(pid_);
  pid_ = -1;
  int status = 0;
  if (::waitpid(pid, &status, WNOHANG) == pid) {
    ProcessOutcome outcome = ProcessOutcome::kExited;
    exit_code_ = DecodeWaitStatus(status, outcome);
    ::kill(-pid, SIGKILL);
    return;
  }

  ::kill(-pid, SIGTERM);
  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (::waitpid(pid, &status, WNOHANG) == pid) {
      ProcessOutcome outcome = ProcessOutcome::kExited;
      exit_code_ = DecodeWaitStatus(status, outcome);
      ::kill(-pid, SIGKILL);
      return;
    }
    std::this_thread::sleep_for(kPollInterval);
  }

  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
  ::waitpid(pid, &status, 0);
  ProcessOutcome outcome = ProcessOutcome::kExited;
  exit_code_ = DecodeWaitStatus(status, outcome);
}

#else

bool RunProcess(const ProcessSpec& spec, const CancellationToken&, ProcessResult& result,
                std::string& error) {
  result = ProcessResult{};
  error = "process spawning is not supported on this host: " + spec.program;
  return false;
}

ScopedProcess::~ScopedProcess() = default;

ScopedProcess::ScopedProcess(ScopedProcess&& other) noexcept
    : pid_(other.pid_), exit_code_(other.exit_code_) {
  other.pid_ = -1;
}

ScopedProcess& ScopedProcess::operator=(ScopedProcess&& other) noexcept {
  pid_ = other.pid_;
  exit_code_ = other.exit_code_;
  other.pid_ = -1;
  return *this;
}

bool ScopedProcess::Start(const ProcessSpec& spec, std::string& error) {
  error = "process spawning is not supported on this host: " + spec.program;
  return false;
}

bool ScopedProcess::IsRunning() {
  return false;
}

void ScopedProcess::Terminate(std::chrono::milliseconds) {}

#endif

} // namespace comfytest::core::process
