#include "artifacts/html_report_writer.hpp"
#include "artifacts/report_writer.hpp"

#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

using comfytest::config::Level;
using comfytest::report::LevelStatus;

comfytest::report::RunReport BuildReport() {
  comfytest::report::RunReport report;
  report.tool_version = "0.1.0";
  report.project = {.name = "demo <nodes>",
                    .comfyui_version = "latest",
                    .python_version = "3.11",
                    .cuda_packages = {"flash_attn", "xformers"}};
  report.started_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'000));
  report.finished_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(61'000));

  comfytest::report::PlatformReport linux_report;
  linux_report.platform = comfytest::config::PlatformId::kLinux;
  linux_report.server_port = 8188;
  linux_report.finalized = true;
  for (auto& level : linux_report.levels) {
    level.status = LevelStatus::kPassed;
  }
  auto& execution = linux_report.At(Level::kExecution);
  execution.status = LevelStatus::kFailed;
  execution.failure = comfytest::core::errors::Failure{
      .kind = comfytest::core::errors::ErrorKind::kTimeout,
      .message = "1 of 1 workflow(s) failed",
      .details = {}};
  execution.workflows = {{.workflow = "basic.json",
                          .status = LevelStatus::kFailed,
                          .failure_kind = comfytest::core::errors::ErrorKind::kTimeout,
                          .message = "exceeded timeout of 5s",
                          .elapsed = std::chrono::milliseconds(5'004),
                          .artifacts = {"logs/basic.execution.log"}}};
  execution.diagnostics = {{.node_id = 4, .node_class = "DemoSaver", .field = "",
                            .message = "interrupted"}};

  comfytest::report::PlatformReport macos_report;
  macos_report.platform = comfytest::config::PlatformId::kMacos;
  macos_report.server_port = 8189;
  macos_report.finalized = true;
  for (auto& level : macos_report.levels) {
    level.status = LevelStatus::kSkipped;
    level.skip_reason = comfytest::report::SkipReason::kNotRequested;
  }
  macos_report.At(Level::kSyntax).status = LevelStatus::kPassed;
  macos_report.At(Level::kSyntax).skip_reason = comfytest::report::SkipReason::kNone;

  report.platforms = {linux_report, macos_report};
  return report;
}

} // namespace

int main() {
  using comfytest::tests::common::AssertContains;
  using comfytest::tests::common::AssertNotContains;
  using comfytest::tests::common::AssertTrue;
  using comfytest::tests::common::Fail;

  const fs::path out_dir = comfytest::tests::common::CreateUniqueTempDir("comfytest-report-writers");
  const fs::path results_dir = out_dir / "results";
  const comfytest::report::RunReport report = BuildReport();

  fs::path json_path;
  std::string error;
  if (!comfytest::artifacts::WriteRunReportJson(report, results_dir, json_path, error)) {
    Fail("WriteRunReportJson failed: " + error);
  }
  AssertTrue(json_path == results_dir / "run_report.json", "unexpected run_report.json path");
  const std::string json = comfytest::tests::common::ReadFileToString(json_path);
  AssertTrue(!json.empty() && json.back() == '\n', "run_report.json must end with a newline");
  AssertContains(json, "\"tool_version\":\"0.1.0\"");

  comfytest::report::RunReport loaded;
  if (!comfytest::artifacts::LoadRunReportJson(results_dir, loaded, error)) {
    Fail("LoadRunReportJson failed: " + error);
  }
  AssertTrue(loaded == report, "loaded report differs from the written one");
  AssertTrue(!loaded.Succeeded(), "report with a failed level must not succeed");

  // Rewriting replaces the previous report instead of appending.
  if (!comfytest::artifacts::WriteRunReportJson(report, results_dir, json_path, error)) {
    Fail("second WriteRunReportJson failed: " + error);
  }
  AssertTrue(comfytest::tests::common::ReadFileToString(json_path) == json,
             "rewritten run_report.json differs");

  fs::path html_path;
  if (!comfytest::artifacts::WriteReportIndexHtml(report, results_dir, html_path, error)) {
    Fail("WriteReportIndexHtml failed: " + error);
  }
  const std::string html = comfytest::tests::common::ReadFileToString(html_path);
  AssertContains(html, "<!doctype html>");
  AssertContains(html, "demo &lt;nodes&gt;");
  AssertNotContains(html, "demo <nodes>");
  AssertContains(html, "flash_attn, xformers");
  AssertContains(html, "<th>linux</th><th>macos</th>");
  AssertContains(html, "<td class=\"fail\">FAIL</td>");
  AssertContains(html, "not requested");
  AssertContains(html, "<code>Timeout</code> 1 of 1 workflow(s) failed");
  AssertContains(html, "exceeded timeout of 5s");
  AssertContains(html, "href=\"linux/logs/basic.execution.log\"");
  AssertContains(html, "href=\"linux/events.jsonl\"");
  AssertContains(html, "node 4 (DemoSaver): interrupted");
  AssertNotContains(html, "<script");

  fs::path missing_report_dir = out_dir / "empty";
  comfytest::report::RunReport unused;
  if (comfytest::artifacts::LoadRunReportJson(missing_report_dir, unused, error)) {
    Fail("LoadRunReportJson must fail without a report");
  }

  comfytest::tests::common::RemovePathBestEffort(out_dir);
  std::cout << "report_writers_smoke: ok\n";
  return 0;
}
