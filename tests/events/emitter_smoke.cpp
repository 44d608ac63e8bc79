#include "events/emitter.hpp"

#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

using comfytest::tests::common::AssertContains;
using comfytest::tests::common::AssertNotContains;
using comfytest::tests::common::Fail;

std::vector<std::string> ReadNonEmptyLines(const fs::path& path) {
  std::istringstream input(comfytest::tests::common::ReadFileToString(path));
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

std::chrono::system_clock::time_point AtMs(long long ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

int main() {
  using comfytest::config::Level;
  using comfytest::config::PlatformId;
  using comfytest::events::Emitter;

  const fs::path out_dir = comfytest::tests::common::CreateUniqueTempDir("comfytest-emitter");
  const Emitter emitter(out_dir / "linux");
  std::string error;

  if (!emitter.EmitRunStarted({.ts = AtMs(1'000),
                               .platform = PlatformId::kLinux,
                               .runner = comfytest::config::RunnerClass::kCpu,
                               .project = "demo-nodes",
                               .comfyui_version = "latest",
                               .python_version = "3.11",
                               .server_port = 8188,
                               .levels = "syntax,install,registration"},
                              error)) {
    Fail("EmitRunStarted failed: " + error);
  }
  if (!emitter.EmitLevelStarted(
          {.ts = AtMs(1'100), .platform = PlatformId::kLinux, .level = Level::kSyntax,
           .implicit = true},
          error)) {
    Fail("EmitLevelStarted failed: " + error);
  }
  if (!emitter.EmitLevelFinished(
          {.ts = AtMs(1'200),
           .platform = PlatformId::kLinux,
           .level = Level::kSyntax,
           .status = comfytest::report::LevelStatus::kPassed,
           .elapsed = std::chrono::milliseconds(100)},
          error)) {
    Fail("EmitLevelFinished(passed) failed: " + error);
  }
  if (!emitter.EmitWorkflowFinished(
          {.ts = AtMs(1'300),
           .platform = PlatformId::kLinux,
           .level = Level::kExecution,
           .workflow = "basic.json",
           .status = comfytest::report::LevelStatus::kFailed,
           .failure_kind = comfytest::core::errors::ErrorKind::kTimeout,
           .elapsed = std::chrono::milliseconds(5'000)},
          error)) {
    Fail("EmitWorkflowFinished failed: " + error);
  }
  if (!emitter.EmitLevelFinished(
          {.ts = AtMs(1'400),
           .platform = PlatformId::kLinux,
           .level = Level::kValidation,
           .status = comfytest::report::LevelStatus::kSkipped,
           .skip_reason = comfytest::report::SkipReason::kBlocked},
          error)) {
    Fail("EmitLevelFinished(skipped) failed: " + error);
  }
  if (!emitter.EmitRunFinished(
          {.ts = AtMs(1'500), .platform = PlatformId::kLinux, .succeeded = false},
          error)) {
    Fail("EmitRunFinished failed: " + error);
  }

  const std::vector<std::string> lines = ReadNonEmptyLines(emitter.EventsPath());
  if (lines.size() != 6U) {
    Fail("expected exactly six event lines");
  }

  AssertContains(lines[0], "\"type\":\"run_started\"");
  AssertContains(lines[0], "\"project\":\"demo-nodes\"");
  AssertContains(lines[0], "\"server_port\":\"8188\"");
  AssertContains(lines[0], "\"levels\":\"syntax,install,registration\"");

  AssertContains(lines[1], "\"type\":\"level_started\"");
  AssertContains(lines[1], "\"implicit\":\"true\"");

  AssertContains(lines[2], "\"type\":\"level_finished\"");
  AssertContains(lines[2], "\"status\":\"passed\"");
  AssertContains(lines[2], "\"elapsed_ms\":\"100\"");
  AssertNotContains(lines[2], "skip_reason");
  AssertNotContains(lines[2], "failure_kind");

  AssertContains(lines[3], "\"type\":\"workflow_finished\"");
  AssertContains(lines[3], "\"workflow\":\"basic.json\"");
  AssertContains(lines[3], "\"failure_kind\":\"Timeout\"");

  AssertContains(lines[4], "\"skip_reason\":\"blocked by failed predecessor\"");
  AssertContains(lines[4], "\"level\":\"validation\"");

  AssertContains(lines[5], "\"type\":\"run_finished\"");
  AssertContains(lines[5], "\"succeeded\":\"false\"");
  AssertContains(lines[5], "\"cancelled\":\"false\"");

  // Workflows of one level finish concurrently; every append stays one line.
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&emitter, t] {
      std::string thread_error;
      for (int i = 0; i < 25; ++i) {
        if (!emitter.EmitWarning(PlatformId::kLinux,
                                 "warning " + std::to_string(t) + "-" + std::to_string(i),
                                 thread_error)) {
          Fail("EmitWarning failed: " + thread_error);
        }
      }
    });
  }
  for (std::thread& writer : writers) {
    writer.join();
  }
  const std::vector<std::string> all = ReadNonEmptyLines(emitter.EventsPath());
  if (all.size() != 106U) {
    Fail("expected 106 event lines after concurrent warnings");
  }
  for (std::size_t i = 6; i < all.size(); ++i) {
    AssertContains(all[i], "\"type\":\"warning\"");
    if (all[i].back() != '}') {
      Fail("interleaved event line: " + all[i]);
    }
  }

  comfytest::tests::common::RemovePathBestEffort(out_dir);
  std::cout << "emitter_smoke: ok\n";
  return 0;
}
