#include "pipeline/platform_matrix.hpp"

#include "../common/assertions.hpp"
#include "../common/extension_fixtures.hpp"
#include "../common/fake_collaborators.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using comfytest::collaborators::ScreenshotStatus;
using comfytest::config::Level;
using comfytest::report::LevelStatus;
using comfytest::report::SkipReason;
using namespace comfytest::tests::common;

namespace {

comfytest::report::PlatformReport RunWithScreenshot(const fs::path& root, ScreenshotStatus status,
                                                    const std::string& message) {
  const fs::path node_dir = CreateDemoExtension(root, DemoConfigToml());
  DemoInputs inputs;
  LoadDemoInputsOrFail(node_dir, inputs);

  FakeCollaborators fakes;
  fakes.screenshot.status = status;
  fakes.screenshot.message = message;
  std::ostringstream log_sink;
  comfytest::core::logging::Logger logger(comfytest::core::logging::LogLevel::kDebug, log_sink);
  comfytest::pipeline::PlatformMatrixRunner runner(inputs.config, inputs.project, inputs.catalog,
                                                   fakes.Set(), logger);

  comfytest::pipeline::MatrixOptions options;
  options.output_root = root / "results";
  options.workspace_root = root / "workspace";

  comfytest::report::RunReport report;
  comfytest::core::errors::Failure failure;
  if (!runner.Run(options, comfytest::core::CancellationToken(), report, failure)) {
    Fail("matrix run failed: " + failure.message);
  }
  AssertTrue(fakes.counts.capture.load() == 1, "one capture for the one workflow");
  return report.platforms.front();
}

void ExpectPassWithWarning(const fs::path& root, ScreenshotStatus status,
                           const std::string& message) {
  const comfytest::report::PlatformReport linux_report = RunWithScreenshot(root, status, message);
  const auto& capture = linux_report.At(Level::kStaticCapture);
  AssertTrue(capture.status == LevelStatus::kPassed, "a capture warning does not fail the level");
  AssertTrue(capture.warnings.size() == 1U, "one warning per affected workflow");
  AssertContains(capture.warnings.front(), "basic.json: " + message);
  AssertTrue(capture.workflows.size() == 1U && capture.workflows.front().artifacts.empty(),
             "no screenshot artifact without a capture");
  AssertTrue(linux_report.At(Level::kExecution).status == LevelStatus::kPassed,
             "later levels still run");
  AssertTrue(linux_report.Succeeded(), "warnings keep the platform successful");
}

} // namespace

int main() {
  const fs::path root = CreateUniqueTempDir("comfytest-static-capture");

  {
    const comfytest::report::PlatformReport linux_report =
        RunWithScreenshot(root / "captured", ScreenshotStatus::kCaptured, "");
    const auto& capture = linux_report.At(Level::kStaticCapture);
    AssertTrue(capture.status == LevelStatus::kPassed, "a capture passes");
    AssertTrue(capture.warnings.empty(), "a capture carries no warning");
    AssertTrue(capture.workflows.size() == 1U &&
                   capture.workflows.front().artifacts ==
                       std::vector<std::string>{"screenshots/basic.png"},
               "the screenshot path is recorded relative to the platform directory");
    AssertTrue(fs::exists(root / "captured" / "results" / "linux" / "screenshots" / "basic.png"),
               "the screenshot file is written");
  }

  ExpectPassWithWarning(root / "warning", ScreenshotStatus::kWarning, "blank canvas");
  ExpectPassWithWarning(root / "unavailable", ScreenshotStatus::kUnavailable,
                        "no screenshot tool configured");

  {
    const comfytest::report::PlatformReport linux_report =
        RunWithScreenshot(root / "error", ScreenshotStatus::kError, "chromium crashed");
    const auto& capture = linux_report.At(Level::kStaticCapture);
    AssertTrue(capture.status == LevelStatus::kFailed, "a screenshot tool error fails the level");
    AssertTrue(capture.failure.has_value() &&
                   capture.failure->kind == comfytest::core::errors::ErrorKind::kExecution,
               "the failure kind is ExecutionError");
    AssertContains(capture.failure->message, "basic.json");
    AssertTrue(capture.workflows.size() == 1U &&
                   capture.workflows.front().message == "chromium crashed",
               "the tool message is kept on the workflow run");
    for (const Level level : {Level::kValidation, Level::kExecution}) {
      const auto& result = linux_report.At(level);
      if (result.status != LevelStatus::kSkipped || result.skip_reason != SkipReason::kBlocked) {
        Fail(std::string("expected blocked skip for ") + comfytest::config::ToDisplayName(level));
      }
    }
  }

  RemovePathBestEffort(root);
  std::cout << "static_capture_outcome_smoke: ok\n";
  return 0;
}
