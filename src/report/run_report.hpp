#pragma once

#include "config/levels.hpp"
#include "config/run_config.hpp"
#include "core/errors/error_kind.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace comfytest::report {

enum class LevelStatus {
  kPending,
  kRunning,
  kPassed,
  kFailed,
  kSkipped,
};

const char* ToString(LevelStatus status);
bool ParseLevelStatus(std::string_view raw, LevelStatus& status);

constexpr bool IsTerminal(LevelStatus status) {
  return status == LevelStatus::kPassed || status == LevelStatus::kFailed ||
         status == LevelStatus::kSkipped;
}

// Why a level did not run. The first three come from configuration and do not
// affect the exit code; the last two do.
enum class SkipReason {
  kNone,
  kNotRequested,
  kSkipWorkflow,
  kNoWorkflows,
  kBlocked,
  kCancelled,
};

const char* ToString(SkipReason reason);
bool ParseSkipReason(std::string_view raw, SkipReason& reason);

constexpr bool IsConfigurationSkip(SkipReason reason) {
  return reason == SkipReason::kNotRequested || reason == SkipReason::kSkipWorkflow ||
         reason == SkipReason::kNoWorkflows;
}

// One collected problem. `node_id` and `field` are set when the problem is
// tied to a node instance or one of its inputs.
struct Diagnostic {
  std::optional<std::int64_t> node_id;
  std::string node_class;
  std::string field;
  std::string message;

  bool operator==(const Diagnostic& other) const = default;
};

// `node 7 (KSampler) steps: value 0 below minimum 1`
std::string FormatDiagnostic(const Diagnostic& diagnostic);

enum class SubLevel {
  kSchema = 0,
  kGraph = 1,
  kIntrospection = 2,
  kPartialExecution = 3,
};

inline constexpr std::size_t kSubLevelCount = 4;

inline constexpr std::array<SubLevel, kSubLevelCount> kAllSubLevels = {
    SubLevel::kSchema,
    SubLevel::kGraph,
    SubLevel::kIntrospection,
    SubLevel::kPartialExecution,
};

const char* ToString(SubLevel sub_level);
bool ParseSubLevel(std::string_view raw, SubLevel& sub_level);

// ValidationError.<SubLevel> kind reported when the sub-level fails.
core::errors::ErrorKind FailureKindFor(SubLevel sub_level);

struct SubLevelResult {
  SubLevel sub_level = SubLevel::kSchema;
  LevelStatus status = LevelStatus::kPending;
  // kNone unless failed. Partial execution may fail with kTimeout.
  core::errors::ErrorKind failure_kind = core::errors::ErrorKind::kNone;
  // Short human summary ("3 nodes executed", "no CUDA-independent nodes").
  std::string note;
  std::vector<Diagnostic> diagnostics;

  bool operator==(const SubLevelResult& other) const = default;
};

// Four sub-results for one workflow, always all present and in order.
struct WorkflowValidation {
  std::string workflow;
  std::array<SubLevelResult, kSubLevelCount> sub_levels{{
      {.sub_level = SubLevel::kSchema},
      {.sub_level = SubLevel::kGraph},
      {.sub_level = SubLevel::kIntrospection},
      {.sub_level = SubLevel::kPartialExecution},
  }};

  SubLevelResult& Result(SubLevel sub_level) {
    return sub_levels[static_cast<std::size_t>(sub_level)];
  }
  const SubLevelResult& Result(SubLevel sub_level) const {
    return sub_levels[static_cast<std::size_t>(sub_level)];
  }

  // Skipped sub-levels (empty partial-execution subgraph) do not fail.
  bool Passed() const;

  bool operator==(const WorkflowValidation& other) const = default;
};

struct ValidationReport {
  std::vector<WorkflowValidation> workflows;
  // In-scope workflows left out by the `surviving_only` policy.
  std::vector<std::string> excluded;

  bool Passed() const;

  bool operator==(const ValidationReport& other) const = default;
};

// Per-workflow record for STATIC_CAPTURE and EXECUTION.
struct WorkflowRun {
  std::string workflow;
  LevelStatus status = LevelStatus::kPending;
  core::errors::ErrorKind failure_kind = core::errors::ErrorKind::kNone;
  std::string message;
  std::chrono::milliseconds elapsed{0};
  // Paths relative to the platform results directory.
  std::vector<std::string> artifacts;

  bool operator==(const WorkflowRun& other) const = default;
};

struct LevelResult {
  config::Level level = config::Level::kSyntax;
  LevelStatus status = LevelStatus::kPending;
  // Pulled in only as a dependency of a requested level.
  bool implicit = false;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> finished_at;
  SkipReason skip_reason = SkipReason::kNone;
  std::optional<core::errors::Failure> failure;
  std::vector<Diagnostic> diagnostics;
  std::vector<std::string> warnings;
  std::vector<WorkflowRun> workflows;
  std::optional<ValidationReport> validation;
  std::vector<std::string> artifacts;

  bool operator==(const LevelResult& other) const = default;
};

struct PlatformReport {
  config::PlatformId platform = config::PlatformId::kLinux;
  config::RunnerClass runner = config::RunnerClass::kCpu;
  std::uint16_t server_port = 0;
  bool finalized = false;
  std::array<LevelResult, config::kLevelCount> levels{{
      {.level = config::Level::kSyntax},
      {.level = config::Level::kInstall},
      {.level = config::Level::kRegistration},
      {.level = config::Level::kInstantiation},
      {.level = config::Level::kStaticCapture},
      {.level = config::Level::kValidation},
      {.level = config::Level::kExecution},
  }};

  LevelResult& At(config::Level level) {
    return levels[config::ToIndex(level)];
  }
  const LevelResult& At(config::Level level) const {
    return levels[config::ToIndex(level)];
  }

  // Every level passed or was skipped by configuration.
  bool Succeeded() const;

  bool operator==(const PlatformReport& other) const = default;
};

struct ProjectSummary {
  std::string name;
  std::string comfyui_version;
  std::string python_version;
  std::vector<std::string> cuda_packages;

  bool operator==(const ProjectSummary& other) const = default;
};

// Root aggregate written to run_report.json and consumed by publishing.
struct RunReport {
  std::string tool_version;
  ProjectSummary project;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
  // Platform order (linux, macos, windows, windows_portable), enabled only.
  std::vector<PlatformReport> platforms;

  const PlatformReport* FindPlatform(config::PlatformId platform) const;

  bool Succeeded() const;

  bool operator==(const RunReport& other) const = default;
};

// JSON serializers with canonical key order. Identical reports always give
// identical bytes.
std::string ToJson(const Diagnostic& diagnostic);
std::string ToJson(const SubLevelResult& result);
std::string ToJson(const WorkflowValidation& validation);
std::string ToJson(const ValidationReport& report);
std::string ToJson(const WorkflowRun& run);
std::string ToJson(const LevelResult& result);
std::string ToJson(const PlatformReport& report);
std::string ToJson(const RunReport& report);

// Loads a report written by ToJson (used by `publish`).
bool ParseRunReport(std::string_view json_text, RunReport& report, std::string& error);

} // namespace comfytest::report
