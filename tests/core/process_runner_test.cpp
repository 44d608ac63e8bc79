#include "core/process/process_runner.hpp"

#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using comfytest::core::CancellationToken;
using comfytest::core::process::ProcessOutcome;
using comfytest::core::process::ProcessResult;
using comfytest::core::process::ProcessSpec;

TEST_CASE("Output is captured and appended to the process log", "[process]") {
  const fs::path root = comfytest::tests::common::CreateUniqueTempDir("comfytest-process-log");
  ProcessSpec spec;
  spec.program = "sh";
  spec.args = {"-c", "echo out; echo err 1>&2; exit 3"};
  spec.log_path = root / "logs" / "step.log";

  ProcessResult result;
  std::string error;
  REQUIRE(comfytest::core::process::RunProcess(spec, CancellationToken(), result, error));
  CHECK(result.outcome == ProcessOutcome::kExited);
  CHECK(result.exit_code == 3);
  CHECK(result.output.find("out") != std::string::npos);
  CHECK(result.output.find("err") != std::string::npos);
  CHECK(comfytest::tests::common::ReadFileToString(spec.log_path) == result.output);
  comfytest::tests::common::RemovePathBestEffort(root);
}

#if defined(__linux__)
TEST_CASE("The process log descriptor is not inherited by the child", "[process]") {
  const fs::path root = comfytest::tests::common::CreateUniqueTempDir("comfytest-process-cloexec");
  ProcessSpec spec;
  spec.program = "ls";
  spec.args = {"-l", "/proc/self/fd/"};
  spec.log_path = root / "cloexec-check.log";

  ProcessResult result;
  std::string error;
  REQUIRE(comfytest::core::process::RunProcess(spec, CancellationToken(), result, error));
  REQUIRE(result.exit_code == 0);
  // stdout and stderr are the capture pipe; the log stays in the parent.
  CHECK(result.output.find("pipe:") != std::string::npos);
  CHECK(result.output.find("cloexec-check.log") == std::string::npos);
  comfytest::tests::common::RemovePathBestEffort(root);
}
#endif

TEST_CASE("A deadline kills the child and reports the timeout exit code", "[process]") {
  ProcessSpec spec;
  spec.program = "sleep";
  spec.args = {"30"};
  spec.timeout = std::chrono::milliseconds(200);

  ProcessResult result;
  std::string error;
  REQUIRE(comfytest::core::process::RunProcess(spec, CancellationToken(), result, error));
  CHECK(result.outcome == ProcessOutcome::kTimedOut);
  CHECK(result.exit_code == 124);
  CHECK(result.elapsed < std::chrono::seconds(10));
}

TEST_CASE("An unknown program is an error, not a result", "[process]") {
  ProcessSpec spec;
  spec.program = "comfytest-no-such-program";
  ProcessResult result;
  std::string error;
  CHECK_FALSE(comfytest::core::process::RunProcess(spec, CancellationToken(), result, error));
  CHECK(error == "executable not found on PATH: comfytest-no-such-program");
}
