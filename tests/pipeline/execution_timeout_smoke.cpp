#include "pipeline/platform_matrix.hpp"

#include "../common/assertions.hpp"
#include "../common/extension_fixtures.hpp"
#include "../common/fake_collaborators.hpp"
#include "../common/temp_dir.hpp"

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include <signal.h>

namespace fs = std::filesystem;
using comfytest::config::Level;
using comfytest::report::LevelStatus;
using namespace comfytest::tests::common;

// An EXECUTION run that outlives `timeout = 5` fails with Timeout and its
// child process is gone by the time the run returns.
int main() {
  const fs::path root = CreateUniqueTempDir("comfytest-exec-timeout");
  const fs::path node_dir =
      CreateDemoExtension(root, DemoConfigToml("timeout = 5\nlevels = [\"execution\"]\n"));
  DemoInputs inputs;
  LoadDemoInputsOrFail(node_dir, inputs);

  FakeCollaborators fakes;
  fakes.execution.sleep_seconds = 60;

  std::ostringstream log_sink;
  comfytest::core::logging::Logger logger(comfytest::core::logging::LogLevel::kDebug, log_sink);
  comfytest::pipeline::PlatformMatrixRunner runner(inputs.config, inputs.project, inputs.catalog,
                                                   fakes.Set(), logger);

  comfytest::pipeline::MatrixOptions options;
  options.output_root = root / "results";
  options.workspace_root = root / "workspace";

  const auto started = std::chrono::steady_clock::now();
  comfytest::report::RunReport report;
  comfytest::core::errors::Failure failure;
  if (!runner.Run(options, comfytest::core::CancellationToken(), report, failure)) {
    Fail("matrix run failed: " + failure.message);
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;
  AssertTrue(elapsed < std::chrono::seconds(30), "the deadline must cut the run short");

  const comfytest::report::PlatformReport& linux_report = report.platforms.front();
  const auto& execution = linux_report.At(Level::kExecution);
  AssertTrue(execution.status == LevelStatus::kFailed, "execution must fail");
  AssertTrue(execution.failure.has_value() &&
                 execution.failure->kind == comfytest::core::errors::ErrorKind::kTimeout,
             "execution failure kind must be Timeout");
  AssertTrue(execution.workflows.size() == 1U &&
                 execution.workflows.front().failure_kind ==
                     comfytest::core::errors::ErrorKind::kTimeout,
             "the workflow run is recorded as timed out");
  AssertTrue(linux_report.At(Level::kValidation).skip_reason ==
                 comfytest::report::SkipReason::kNotRequested,
             "validation was not requested");
  AssertTrue(linux_report.At(Level::kRegistration).implicit, "registration is implicit");

  const int pid = fakes.execution.last_pid.load();
  AssertTrue(pid > 0, "the sleep child must have been spawned");
  errno = 0;
  if (::kill(pid, 0) == 0 || errno != ESRCH) {
    Fail("child process " + std::to_string(pid) + " survived the timeout");
  }
  AssertTrue(!report.Succeeded(), "a timed out level fails the run");

  RemovePathBestEffort(root);
  std::cout << "execution_timeout_smoke: ok\n";
  return 0;
}
