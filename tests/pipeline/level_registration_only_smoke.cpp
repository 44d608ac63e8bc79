#include "pipeline/platform_matrix.hpp"

#include "../common/assertions.hpp"
#include "../common/extension_fixtures.hpp"
#include "../common/fake_collaborators.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using comfytest::config::Level;
using comfytest::report::LevelStatus;
using comfytest::report::SkipReason;
using namespace comfytest::tests::common;

int main() {
  const fs::path root = CreateUniqueTempDir("comfytest-level-registration");
  const fs::path node_dir = CreateDemoExtension(root, DemoConfigToml());
  DemoInputs inputs;
  LoadDemoInputsOrFail(node_dir, inputs);

  FakeCollaborators fakes;
  std::ostringstream log_sink;
  comfytest::core::logging::Logger logger(comfytest::core::logging::LogLevel::kDebug, log_sink);
  comfytest::pipeline::PlatformMatrixRunner runner(inputs.config, inputs.project, inputs.catalog,
                                                   fakes.Set(), logger);

  comfytest::pipeline::MatrixOptions options;
  options.through = Level::kRegistration;
  options.output_root = root / "results";
  options.workspace_root = root / "workspace";
  options.tool_version = "test";

  comfytest::report::RunReport report;
  comfytest::core::errors::Failure failure;
  if (!runner.Run(options, comfytest::core::CancellationToken(), report, failure)) {
    Fail("matrix run failed: " + failure.message);
  }

  AssertTrue(report.platforms.size() == 1U, "expected exactly the linux platform");
  const comfytest::report::PlatformReport& linux_report = report.platforms.front();
  AssertTrue(linux_report.finalized, "platform must be finalized");

  for (const Level level : {Level::kSyntax, Level::kInstall, Level::kRegistration}) {
    const auto& result = linux_report.At(level);
    if (result.status != LevelStatus::kPassed) {
      Fail(std::string("expected passed: ") + comfytest::config::ToDisplayName(level) +
           (result.failure.has_value() ? " (" + result.failure->message + ")" : ""));
    }
    AssertTrue(result.started_at.has_value() && result.finished_at.has_value(),
               "executed levels carry timestamps");
  }
  for (const Level level : {Level::kInstantiation, Level::kStaticCapture, Level::kValidation,
                            Level::kExecution}) {
    const auto& result = linux_report.At(level);
    AssertTrue(result.status == LevelStatus::kSkipped, "later levels must be skipped");
    AssertTrue(result.skip_reason == SkipReason::kNotRequested, "skip reason must be not_requested");
    AssertTrue(!result.started_at.has_value(), "not requested levels never start");
  }

  AssertTrue(fakes.counts.install.load() == 1 && fakes.counts.start.load() == 1,
             "install and server start run once");
  AssertTrue(fakes.counts.capture.load() == 0 && fakes.counts.execute.load() == 0,
             "nothing past registration may be invoked");
  AssertTrue(report.Succeeded(), "configuration skips do not fail the run");

  const std::string events = ReadFileToString(options.output_root / "linux" / "events.jsonl");
  AssertContains(events, "\"type\":\"run_started\"");
  AssertContains(events, "\"type\":\"run_finished\"");
  AssertContains(log_sink.str(), "platform=\"linux\"");

  RemovePathBestEffort(root);
  std::cout << "level_registration_only_smoke: ok\n";
  return 0;
}
