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
using comfytest::config::PlatformId;
using comfytest::report::LevelStatus;
using comfytest::report::SkipReason;
using namespace comfytest::tests::common;

// INSTALL fails on linux only: linux blocks every later level, macos runs to
// the end untouched.
int main() {
  const fs::path root = CreateUniqueTempDir("comfytest-blocked");
  const fs::path node_dir = CreateDemoExtension(
      root, DemoConfigToml("",
                           "linux = true\nmacos = true\nwindows = false\nwindows_portable = false\n"));
  DemoInputs inputs;
  LoadDemoInputsOrFail(node_dir, inputs);

  FakeCollaborators fakes;
  fakes.environment.fail = true;
  fakes.environment.fail_on = PlatformId::kLinux;

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
  AssertTrue(report.platforms.size() == 2U, "linux and macos are enabled");

  const comfytest::report::PlatformReport* linux_report = report.FindPlatform(PlatformId::kLinux);
  const comfytest::report::PlatformReport* macos_report = report.FindPlatform(PlatformId::kMacos);
  AssertTrue(linux_report != nullptr && macos_report != nullptr, "both platforms reported");

  AssertTrue(linux_report->At(Level::kSyntax).status == LevelStatus::kPassed,
             "syntax passes before install");
  const auto& install = linux_report->At(Level::kInstall);
  AssertTrue(install.status == LevelStatus::kFailed, "install must fail on linux");
  AssertTrue(install.failure.has_value() &&
                 install.failure->kind == comfytest::core::errors::ErrorKind::kEnvironment,
             "install failure is an EnvironmentError");
  for (const Level level : {Level::kRegistration, Level::kInstantiation, Level::kStaticCapture,
                            Level::kValidation, Level::kExecution}) {
    const auto& result = linux_report->At(level);
    if (result.status != LevelStatus::kSkipped || result.skip_reason != SkipReason::kBlocked) {
      Fail(std::string("expected blocked skip for ") + comfytest::config::ToDisplayName(level));
    }
  }

  for (const auto& result : macos_report->levels) {
    if (result.status != LevelStatus::kPassed) {
      Fail(std::string("macos level did not pass: ") +
           comfytest::config::ToDisplayName(result.level) +
           (result.failure.has_value() ? " (" + result.failure->message + ")" : ""));
    }
  }

  AssertTrue(fakes.counts.install.load() == 2, "both platforms install");
  AssertTrue(fakes.counts.start.load() == 1, "only macos reaches registration");
  AssertTrue(!linux_report->Succeeded() && macos_report->Succeeded(),
             "only the failing platform is unsuccessful");
  AssertTrue(!report.Succeeded(), "a blocked platform fails the run");

  RemovePathBestEffort(root);
  std::cout << "blocked_after_failure_smoke: ok\n";
  return 0;
}
