#pragma once

#include "collaborators/collaborators.hpp"
#include "config/project.hpp"
#include "config/run_config.hpp"
#include "core/cancellation.hpp"
#include "core/errors/error_kind.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/run_plan.hpp"
#include "report/run_report.hpp"
#include "workflow/discovery.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace comfytest::pipeline {

struct MatrixOptions {
  // `--platform`
  std::optional<config::PlatformId> only_platform;
  // `--level`
  std::optional<config::Level> through;
  config::RunnerClass runner = config::RunnerClass::kCpu;
  // `<root>/<platform>/` receives each platform's artifacts.
  std::filesystem::path output_root;
  // `<root>/<platform>/` is each platform's exclusive scratch space.
  std::filesystem::path workspace_root;
  std::string tool_version;
};

// Run-scoped environment layered over every collaborator process: the
// project's `env_vars` plus the CUDA wheel resolution hint.
std::map<std::string, std::string> BuildCollaboratorEnv(const config::Project& project);

// Fans the level pipeline out over the enabled platforms.
//
// Contract:
// - Every check that can fail the whole run (zero enabled platforms, a
//   disabled `--platform`) happens before any collaborator is touched and is
//   reported as ConfigError.
// - One thread per platform; platforms share only the read-only config,
//   project and workflow catalog. Each gets its own workspace, port, output
//   directory, environment map and logger scope.
// - Returns after every platform is finalized. A failing platform never
//   stops another one.
class PlatformMatrixRunner {
public:
  PlatformMatrixRunner(const config::RunConfig& config, const config::Project& project,
                       const workflow::WorkflowCatalog& catalog,
                       collaborators::CollaboratorSet collaborators,
                       core::logging::Logger logger);

  // Resolves platforms and levels without running anything (`--dry-run`).
  bool Plan(const MatrixOptions& options, RunPlan& plan, core::errors::Failure& failure) const;

  bool Run(const MatrixOptions& options, const core::CancellationToken& cancel,
           report::RunReport& report, core::errors::Failure& failure);

private:
  const config::RunConfig& config_;
  const config::Project& project_;
  const workflow::WorkflowCatalog& catalog_;
  collaborators::CollaboratorSet collaborators_;
  core::logging::Logger logger_;
};

} // namespace comfytest::pipeline
