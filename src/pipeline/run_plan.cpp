#include "pipeline/run_plan.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace comfytest::pipeline {

namespace {

constexpr int kLevelColumnWidth = 16;

std::string PlanCell(const PlatformPlan& plan, config::Level level) {
  const std::size_t index = config::ToIndex(level);
  if (plan.skips[index] != report::SkipReason::kNone) {
    return report::ToString(plan.skips[index]);
  }
  return plan.implicit[index] ? "run (implicit)" : "run";
}

} // namespace

LevelSelection SelectLevels(const config::RunConfig& config,
                            std::optional<config::Level> through) {
  LevelSelection selection;
  std::vector<config::Level> implicit;
  selection.levels = config::CloseOverDependencies(config.levels, implicit);
  if (through.has_value()) {
    selection.levels = config::TruncateThrough(selection.levels, *through);
  }
  for (const config::Level level : implicit) {
    if (selection.Runs(level)) {
      selection.implicit.push_back(level);
    }
  }
  return selection;
}

bool SelectPlatforms(const config::RunConfig& config, std::optional<config::PlatformId> only,
                     std::vector<config::PlatformId>& platforms, std::string& error) {
  platforms = config::EnabledPlatforms(config);
  if (platforms.empty()) {
    error = "no platform is enabled (expected at least one of " +
            config::ExpectedPlatformList() + ")";
    return false;
  }
  if (only.has_value()) {
    if (std::find(platforms.begin(), platforms.end(), *only) == platforms.end()) {
      error = std::string("platform '") + config::ToString(*only) +
              "' is disabled in the configuration";
      return false;
    }
    platforms = {*only};
  }
  return true;
}

std::vector<const workflow::WorkflowEntry*> WorkflowsForLevel(
    config::Level level, const workflow::WorkflowCatalog& catalog,
    const config::PlatformSettings& platform, config::RunnerClass runner) {
  std::vector<const workflow::WorkflowEntry*> selected;
  if (level == config::Level::kStaticCapture) {
    for (const workflow::WorkflowEntry& entry : catalog.entries) {
      selected.push_back(&entry);
    }
    return selected;
  }
  if (level != config::Level::kValidation && level != config::Level::kExecution) {
    return selected;
  }
  if (platform.skip_workflow) {
    return selected;
  }
  return catalog.InScope(runner);
}

report::SkipReason ConfigurationSkip(config::Level level, const LevelSelection& selection,
                                     const workflow::WorkflowCatalog& catalog,
                                     const config::PlatformSettings& platform,
                                     config::RunnerClass runner) {
  if (!selection.Runs(level)) {
    return report::SkipReason::kNotRequested;
  }
  switch (level) {
  case config::Level::kValidation:
  case config::Level::kExecution:
    if (platform.skip_workflow) {
      return report::SkipReason::kSkipWorkflow;
    }
    [[fallthrough]];
  case config::Level::kStaticCapture:
    if (WorkflowsForLevel(level, catalog, platform, runner).empty()) {
      return report::SkipReason::kNoWorkflows;
    }
    break;
  default:
    break;
  }
  return report::SkipReason::kNone;
}

std::uint16_t PlatformPort(const config::RunConfig& config, std::size_t index) {
  return static_cast<std::uint16_t>(config.server_port + index);
}

RunPlan BuildRunPlan(const config::RunConfig& config, const workflow::WorkflowCatalog& catalog,
                     const LevelSelection& selection,
                     const std::vector<config::PlatformId>& platforms,
                     config::RunnerClass runner) {
  RunPlan plan;
  for (std::size_t i = 0; i < platforms.size(); ++i) {
    const config::PlatformSettings& settings = config.Platform(platforms[i]);
    PlatformPlan entry;
    entry.platform = platforms[i];
    entry.runner = runner;
    entry.server_port = PlatformPort(config, i);
    for (const config::Level level : config::kAllLevels) {
      entry.skips[config::ToIndex(level)] =
          ConfigurationSkip(level, selection, catalog, settings, runner);
      entry.implicit[config::ToIndex(level)] = selection.IsImplicit(level);
    }
    entry.capture_workflows =
        WorkflowsForLevel(config::Level::kStaticCapture, catalog, settings, runner).size();
    entry.validation_workflows =
        WorkflowsForLevel(config::Level::kValidation, catalog, settings, runner).size();
    entry.execution_workflows =
        WorkflowsForLevel(config::Level::kExecution, catalog, settings, runner).size();
    plan.platforms.push_back(entry);
  }
  return plan;
}

std::string RenderPlanTable(const RunPlan& plan) {
  std::vector<int> widths;
  for (const PlatformPlan& platform : plan.platforms) {
    std::size_t width = std::string(config::ToString(platform.platform)).size();
    for (const config::Level level : config::kAllLevels) {
      width = std::max(width, PlanCell(platform, level).size());
    }
    widths.push_back(static_cast<int>(width + 2U));
  }

  std::ostringstream out;
  out << std::left << std::setw(kLevelColumnWidth) << "LEVEL";
  for (std::size_t i = 0; i < plan.platforms.size(); ++i) {
    out << std::setw(widths[i]) << config::ToString(plan.platforms[i].platform);
  }
  out << "\n";
  for (const config::Level level : config::kAllLevels) {
    out << std::setw(kLevelColumnWidth) << config::ToDisplayName(level);
    for (std::size_t i = 0; i < plan.platforms.size(); ++i) {
      out << std::setw(widths[i]) << PlanCell(plan.platforms[i], level);
    }
    out << "\n";
  }

  out << "\n";
  for (const PlatformPlan& platform : plan.platforms) {
    out << config::ToString(platform.platform) << ": runner=" << config::ToString(platform.runner)
        << " port=" << platform.server_port << " workflows capture=" << platform.capture_workflows
        << " validation=" << platform.validation_workflows
        << " execution=" << platform.execution_workflows << "\n";
  }
  return out.str();
}

} // namespace comfytest::pipeline
