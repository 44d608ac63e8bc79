#include "artifacts/output_dir_utils.hpp"
#include "comfytest/cli/router.hpp"
#include "report/run_report.hpp"

#include "../common/assertions.hpp"
#include "../common/extension_fixtures.hpp"
#include "../common/fake_collaborators.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace comfytest::tests::common;

// Full seven-level run through the CLI entry point with fake collaborators:
// the run report, HTML index and status table all come out of one call.
int main() {
  const fs::path root = CreateUniqueTempDir("comfytest-execute-run");
  const fs::path node_dir = CreateDemoExtension(root, DemoConfigToml());

  FakeCollaborators fakes;
  comfytest::cli::RunOptions options;
  options.node_dir = node_dir;
  options.output_root = root / "results";
  options.workspace_root = root / "workspace";
  options.log_level = comfytest::core::logging::LogLevel::kWarn;

  std::ostringstream captured_out;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  const int exit_code =
      comfytest::cli::ExecuteRun(options, fakes.Set(), comfytest::core::CancellationToken());
  std::cout.rdbuf(original_out);

  if (exit_code != 0) {
    Fail("run should succeed with cooperative fakes, got exit " + std::to_string(exit_code) +
         "\n" + captured_out.str());
  }
  const std::string table = captured_out.str();
  AssertContains(table, "SYNTAX");
  AssertContains(table, "EXECUTION");
  AssertContains(table, "linux");
  AssertNotContains(table, "FAIL");

  const fs::path report_path = options.output_root / comfytest::artifacts::kRunReportFileName;
  const fs::path index_path = options.output_root / comfytest::artifacts::kIndexHtmlFileName;
  AssertTrue(fs::exists(report_path), "run_report.json must be written");
  AssertTrue(fs::exists(index_path), "index.html must be written");

  const std::string report_text = ReadFileToString(report_path);
  comfytest::report::RunReport parsed;
  std::string error;
  if (!comfytest::report::ParseRunReport(report_text, parsed, error)) {
    Fail("written report does not parse: " + error);
  }
  AssertTrue(parsed.Succeeded(), "parsed report must be successful");
  AssertTrue(parsed.platforms.size() == 1U, "one platform in the report");
  AssertTrue(parsed.project.cuda_packages.size() == 1U &&
                 parsed.project.cuda_packages.front() == "flash_attn",
             "cuda packages are reported in canonical form");
  AssertTrue(parsed.platforms.front().At(comfytest::config::Level::kExecution).status ==
                 comfytest::report::LevelStatus::kPassed,
             "execution passed");

  AssertContains(ReadFileToString(index_path), "demo-nodes");
  AssertTrue(fs::exists(options.output_root / "linux" / comfytest::artifacts::kEventsFileName),
             "per-platform events are written");
  AssertTrue(fakes.counts.execute.load() >= 1, "execution level ran workflows");
  AssertTrue(fakes.counts.capture.load() == 1, "one static capture per workflow");

  // `--node-dir demo_nodes/` must still install and register as demo_nodes.
  FakeCollaborators slash_fakes;
  comfytest::cli::RunOptions slash_options = options;
  slash_options.node_dir = fs::path(node_dir.string() + "/");
  slash_options.output_root = root / "results-slash";
  slash_options.workspace_root = root / "workspace-slash";
  std::ostringstream slash_out;
  original_out = std::cout.rdbuf(slash_out.rdbuf());
  const int slash_exit =
      comfytest::cli::ExecuteRun(slash_options, slash_fakes.Set(), comfytest::core::CancellationToken());
  std::cout.rdbuf(original_out);
  if (slash_exit != 0) {
    Fail("run with a trailing separator in --node-dir failed, exit " + std::to_string(slash_exit) +
         "\n" + slash_out.str());
  }
  comfytest::report::RunReport slash_report;
  if (!comfytest::report::ParseRunReport(
          ReadFileToString(slash_options.output_root / comfytest::artifacts::kRunReportFileName),
          slash_report, error)) {
    Fail("trailing separator report does not parse: " + error);
  }
  AssertTrue(slash_report.platforms.front().At(comfytest::config::Level::kRegistration).status ==
                 comfytest::report::LevelStatus::kPassed,
             "registration finds the demo_nodes classes");

  RemovePathBestEffort(root);
  std::cout << "execute_run_report_smoke: ok\n";
  return 0;
}
