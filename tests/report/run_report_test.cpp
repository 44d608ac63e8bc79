#include "report/result_aggregator.hpp"
#include "report/run_report.hpp"
#include "report/status_table.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

namespace {

using comfytest::config::Level;
using comfytest::config::PlatformId;
using comfytest::config::RunnerClass;
using comfytest::core::errors::ErrorKind;
using comfytest::report::LevelResult;
using comfytest::report::LevelStatus;
using comfytest::report::SkipReason;

std::chrono::system_clock::time_point AtMs(std::int64_t ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

comfytest::report::RunReport SampleReport() {
  comfytest::report::RunReport report;
  report.tool_version = "0.1.0";
  report.project = {.name = "demo-nodes",
                    .comfyui_version = "v0.3.10",
                    .python_version = "3.12",
                    .cuda_packages = {"flash_attn"}};
  report.started_at = AtMs(1'700'000'000'000);
  report.finished_at = AtMs(1'700'000'090'250);

  comfytest::report::PlatformReport linux_report;
  linux_report.platform = PlatformId::kLinux;
  linux_report.server_port = 8188;
  linux_report.finalized = true;
  for (LevelResult& level : linux_report.levels) {
    level.status = LevelStatus::kPassed;
    level.started_at = AtMs(1'700'000'001'000);
    level.finished_at = AtMs(1'700'000'002'500);
  }
  linux_report.At(Level::kSyntax).implicit = true;

  LevelResult& validation = linux_report.At(Level::kValidation);
  validation.status = LevelStatus::kFailed;
  validation.failure = comfytest::core::errors::Failure{
      .kind = ErrorKind::kValidationSchema, .message = "1 of 1 workflow(s) failed validation",
      .details = "line one\nline \"two\""};
  comfytest::report::WorkflowValidation workflow;
  workflow.workflow = "basic.json";
  workflow.Result(comfytest::report::SubLevel::kSchema) = {
      .sub_level = comfytest::report::SubLevel::kSchema,
      .status = LevelStatus::kFailed,
      .failure_kind = ErrorKind::kValidationSchema,
      .note = "1 problem(s)",
      .diagnostics = {{.node_id = 3, .node_class = "KSampler", .field = "steps",
                       .message = "0 < minimum 1"}}};
  for (const auto sub_level : {comfytest::report::SubLevel::kGraph,
                               comfytest::report::SubLevel::kIntrospection}) {
    workflow.Result(sub_level).status = LevelStatus::kPassed;
  }
  workflow.Result(comfytest::report::SubLevel::kPartialExecution).status = LevelStatus::kSkipped;
  validation.validation = comfytest::report::ValidationReport{.workflows = {workflow},
                                                              .excluded = {"gpu_only.json"}};

  LevelResult& execution = linux_report.At(Level::kExecution);
  execution.status = LevelStatus::kSkipped;
  execution.skip_reason = SkipReason::kBlocked;
  execution.started_at.reset();
  execution.finished_at.reset();

  LevelResult& capture = linux_report.At(Level::kStaticCapture);
  capture.warnings = {"screenshot tool unavailable"};
  capture.workflows = {{.workflow = "basic.json",
                        .status = LevelStatus::kPassed,
                        .failure_kind = ErrorKind::kNone,
                        .message = "",
                        .elapsed = std::chrono::milliseconds(1234),
                        .artifacts = {"screenshots/basic.png"}}};
  capture.artifacts = {"screenshots/basic.png"};

  report.platforms.push_back(linux_report);
  return report;
}

} // namespace

TEST_CASE("Run report JSON is deterministic and round trips", "[report][json]") {
  const comfytest::report::RunReport report = SampleReport();
  const std::string json = comfytest::report::ToJson(report);
  CHECK(json == comfytest::report::ToJson(SampleReport()));
  CHECK(json.rfind(R"({"tool_version":"0.1.0","project":{"name":"demo-nodes")", 0) == 0U);
  CHECK(json.find(R"("started_at_utc":"2023-11-14T22:13:20.000Z")") != std::string::npos);
  CHECK(json.find(R"("succeeded":false)") != std::string::npos);

  comfytest::report::RunReport parsed;
  std::string error;
  REQUIRE(comfytest::report::ParseRunReport(json, parsed, error));
  CHECK(parsed == report);
  CHECK(comfytest::report::ToJson(parsed) == json);
}

TEST_CASE("Run report parsing names the offending path", "[report][json]") {
  comfytest::report::RunReport parsed;
  std::string error;
  std::string json = comfytest::report::ToJson(SampleReport());
  const std::string runner = R"("runner":"cpu")";
  json.replace(json.find(runner), runner.size(), R"("runner":"tpu")");
  CHECK_FALSE(comfytest::report::ParseRunReport(json, parsed, error));
  CHECK(error == "$.platforms[0].runner: expected cpu|gpu");
}

TEST_CASE("Configuration skips do not fail a platform, blocked skips do", "[report]") {
  comfytest::report::PlatformReport platform;
  for (LevelResult& level : platform.levels) {
    level.status = LevelStatus::kPassed;
  }
  platform.At(Level::kExecution).status = LevelStatus::kSkipped;
  platform.At(Level::kExecution).skip_reason = SkipReason::kNotRequested;
  platform.At(Level::kValidation).status = LevelStatus::kSkipped;
  platform.At(Level::kValidation).skip_reason = SkipReason::kSkipWorkflow;
  CHECK(platform.Succeeded());

  platform.At(Level::kExecution).skip_reason = SkipReason::kBlocked;
  CHECK_FALSE(platform.Succeeded());
}

TEST_CASE("Diagnostics format with node, class and field", "[report]") {
  CHECK(comfytest::report::FormatDiagnostic({.node_id = 7, .node_class = "KSampler",
                                             .field = "steps", .message = "bad"}) ==
        "node 7 (KSampler) steps: bad");
  CHECK(comfytest::report::FormatDiagnostic({.message = "plain"}) == "plain");
}

TEST_CASE("Aggregator enforces one terminal transition per level", "[report][aggregator]") {
  comfytest::report::ResultAggregator aggregator({.name = "demo"}, "0.1.0");
  std::string error;
  REQUIRE(aggregator.RegisterPlatform(PlatformId::kLinux, RunnerClass::kCpu, 8188, error));
  CHECK_FALSE(aggregator.RegisterPlatform(PlatformId::kLinux, RunnerClass::kCpu, 8189, error));

  REQUIRE(aggregator.BeginLevel(PlatformId::kLinux, Level::kSyntax, false, AtMs(1000), error));
  CHECK_FALSE(aggregator.BeginLevel(PlatformId::kLinux, Level::kSyntax, false, AtMs(1001), error));

  LevelResult running{.level = Level::kSyntax, .status = LevelStatus::kRunning};
  CHECK_FALSE(aggregator.RecordLevel(PlatformId::kLinux, running, error));
  CHECK(error.find("must be terminal") != std::string::npos);

  LevelResult passed{.level = Level::kSyntax, .status = LevelStatus::kPassed};
  REQUIRE(aggregator.RecordLevel(PlatformId::kLinux, passed, error));
  CHECK_FALSE(aggregator.RecordLevel(PlatformId::kLinux, passed, error));

  const comfytest::report::RunReport snapshot = aggregator.Snapshot();
  CHECK(snapshot.platforms.front().At(Level::kSyntax).started_at == AtMs(1000));
  CHECK_FALSE(aggregator.FinalizePlatform(PlatformId::kLinux, error));
  CHECK(error.find("INSTALL") != std::string::npos);
}

TEST_CASE("A finalized platform is frozen", "[report][aggregator]") {
  comfytest::report::ResultAggregator aggregator({.name = "demo"}, "0.1.0");
  std::string error;
  REQUIRE(aggregator.RegisterPlatform(PlatformId::kMacos, RunnerClass::kCpu, 8188, error));
  for (const Level level : comfytest::config::kAllLevels) {
    REQUIRE(aggregator.RecordLevel(
        PlatformId::kMacos,
        {.level = level, .status = LevelStatus::kSkipped, .skip_reason = SkipReason::kNotRequested},
        error));
  }
  const comfytest::report::RunReport before = aggregator.Snapshot();
  REQUIRE(aggregator.FinalizePlatform(PlatformId::kMacos, error));
  CHECK(aggregator.IsFinalized(PlatformId::kMacos));
  CHECK_FALSE(aggregator.BeginLevel(PlatformId::kMacos, Level::kSyntax, false, AtMs(1), error));
  CHECK(error.find("finalized") != std::string::npos);
  CHECK_FALSE(before.platforms.front().finalized);
}

TEST_CASE("Status table shows one row per level and the failures", "[report][table]") {
  const std::string table = comfytest::report::RenderStatusTable(SampleReport());
  CHECK(table.rfind("LEVEL", 0) == 0U);
  CHECK(table.find("VALIDATION      FAIL") != std::string::npos);
  CHECK(table.find("EXECUTION       SKIP") != std::string::npos);
  CHECK(table.find("linux VALIDATION: ValidationError.Schema") != std::string::npos);
  CHECK(table.find("basic.json [schema] ValidationError.Schema: 1 problem(s)") !=
        std::string::npos);
  CHECK(table.find("node 3 (KSampler) steps: 0 < minimum 1") != std::string::npos);
  CHECK(table.find("result: FAILED") != std::string::npos);
}
