#pragma once

#include "config/levels.hpp"
#include "config/run_config.hpp"
#include "report/run_report.hpp"
#include "workflow/discovery.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace comfytest::pipeline {

// Levels every platform pipeline runs, after dependency closure and
// `--level` truncation.
struct LevelSelection {
  std::vector<config::Level> levels;
  // Subset of `levels` pulled in only as dependencies.
  std::vector<config::Level> implicit;

  bool Runs(config::Level level) const {
    return config::Contains(levels, level);
  }
  bool IsImplicit(config::Level level) const {
    return config::Contains(implicit, level);
  }
};

// Closes the configured levels over their hard dependencies, then keeps the
// prefix through `through` when given.
LevelSelection SelectLevels(const config::RunConfig& config,
                            std::optional<config::Level> through);

// Enabled platforms in matrix order, or only `only`.
//
// Contract:
// - Zero enabled platforms is an error (the caller reports ConfigError).
// - `only` must name an enabled platform.
bool SelectPlatforms(const config::RunConfig& config, std::optional<config::PlatformId> only,
                     std::vector<config::PlatformId>& platforms, std::string& error);

// Workflows a level looks at on one platform. STATIC_CAPTURE renders every
// discovered workflow; VALIDATION and EXECUTION take the runner's share
// unless the platform sets `skip_workflow`.
std::vector<const workflow::WorkflowEntry*> WorkflowsForLevel(
    config::Level level, const workflow::WorkflowCatalog& catalog,
    const config::PlatformSettings& platform, config::RunnerClass runner);

// Why a level is skipped before it would start, or kNone when it runs.
// Shared by the dry-run plan and the live pipeline so both agree.
report::SkipReason ConfigurationSkip(config::Level level, const LevelSelection& selection,
                                     const workflow::WorkflowCatalog& catalog,
                                     const config::PlatformSettings& platform,
                                     config::RunnerClass runner);

struct PlatformPlan {
  config::PlatformId platform = config::PlatformId::kLinux;
  config::RunnerClass runner = config::RunnerClass::kCpu;
  std::uint16_t server_port = 0;
  std::array<report::SkipReason, config::kLevelCount> skips{};
  std::array<bool, config::kLevelCount> implicit{};
  std::size_t capture_workflows = 0;
  std::size_t validation_workflows = 0;
  std::size_t execution_workflows = 0;
};

// What `run --dry-run` prints. Building it performs no collaborator calls.
struct RunPlan {
  std::vector<PlatformPlan> platforms;
};

// Port of the i-th selected platform.
std::uint16_t PlatformPort(const config::RunConfig& config, std::size_t index);

RunPlan BuildRunPlan(const config::RunConfig& config, const workflow::WorkflowCatalog& catalog,
                     const LevelSelection& selection,
                     const std::vector<config::PlatformId>& platforms,
                     config::RunnerClass runner);

// Level x platform matrix: `run`, `run (implicit)`, or the skip reason.
std::string RenderPlanTable(const RunPlan& plan);

} // namespace comfytest::pipeline
