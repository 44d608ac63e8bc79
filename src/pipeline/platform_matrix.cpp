#include "pipeline/platform_matrix.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "pipeline/level_pipeline.hpp"
#include "report/result_aggregator.hpp"

#include <chrono>
#include <memory>
#include <thread>
#include <utility>

namespace comfytest::pipeline {

namespace {

core::errors::Failure ConfigFailure(std::string message) {
  return core::errors::Failure{
      .kind = core::errors::ErrorKind::kConfig, .message = std::move(message), .details = {}};
}

report::ProjectSummary Summarize(const config::Project& project) {
  return report::ProjectSummary{.name = project.name,
                                .comfyui_version = project.comfyui_version,
                                .python_version = project.python_version,
                                .cuda_packages = project.cuda_packages};
}

} // namespace

std::map<std::string, std::string> BuildCollaboratorEnv(const config::Project& project) {
  std::map<std::string, std::string> env = project.env_vars;
  env[collaborators::kCudaVersionEnvName] = collaborators::kCudaVersionHint;
  return env;
}

PlatformMatrixRunner::PlatformMatrixRunner(const config::RunConfig& config,
                                           const config::Project& project,
                                           const workflow::WorkflowCatalog& catalog,
                                           collaborators::CollaboratorSet collaborators,
                                           core::logging::Logger logger)
    : config_(config),
      project_(project),
      catalog_(catalog),
      collaborators_(collaborators),
      logger_(std::move(logger)) {}

bool PlatformMatrixRunner::Plan(const MatrixOptions& options, RunPlan& plan,
                                core::errors::Failure& failure) const {
  std::vector<config::PlatformId> platforms;
  std::string error;
  if (!SelectPlatforms(config_, options.only_platform, platforms, error)) {
    failure = ConfigFailure(error);
    return false;
  }
  plan = BuildRunPlan(config_, catalog_, SelectLevels(config_, options.through), platforms,
                      options.runner);
  return true;
}

bool PlatformMatrixRunner::Run(const MatrixOptions& options, const core::CancellationToken& cancel,
                               report::RunReport& report, core::errors::Failure& failure) {
  std::vector<config::PlatformId> platforms;
  std::string error;
  if (!SelectPlatforms(config_, options.only_platform, platforms, error)) {
    failure = ConfigFailure(error);
    logger_.Error("run aborted before any platform started", {{"error", error}});
    return false;
  }
  const LevelSelection selection = SelectLevels(config_, options.through);

  report::ResultAggregator aggregator(Summarize(project_), options.tool_version);
  aggregator.MarkRunStarted(std::chrono::system_clock::now());
  for (std::size_t i = 0; i < platforms.size(); ++i) {
    if (!aggregator.RegisterPlatform(platforms[i], options.runner, PlatformPort(config_, i),
                                     error)) {
      failure = ConfigFailure(error);
      return false;
    }
  }

  std::vector<std::unique_ptr<LevelPipeline>> pipelines;
  for (std::size_t i = 0; i < platforms.size(); ++i) {
    const config::PlatformId platform = platforms[i];
    PipelineContext context;
    context.config = &config_;
    context.project = &project_;
    context.catalog = &catalog_;
    context.selection = selection;
    context.collaborators = collaborators_;
    context.run.platform = platform;
    context.run.runner = options.runner;
    context.run.project = &project_;
    context.run.workspace = options.workspace_root / config::ToString(platform);
    context.run.output_dir = artifacts::PlatformOutputDir(options.output_root, platform);
    context.run.env = BuildCollaboratorEnv(project_);
    context.run.server_port = PlatformPort(config_, i);
    context.run.portable_version = config_.Platform(platform).portable_version;
    context.run.logger = logger_.WithField("platform", config::ToString(platform));
    pipelines.push_back(std::make_unique<LevelPipeline>(std::move(context), aggregator));
  }

  logger_.Info("platform matrix started", {{"platforms", std::to_string(platforms.size())},
                                           {"runner", config::ToString(options.runner)}});

  std::vector<std::string> errors(pipelines.size());
  std::vector<std::thread> threads;
  threads.reserve(pipelines.size());
  for (std::size_t i = 0; i < pipelines.size(); ++i) {
    threads.emplace_back([&, i]() {
      std::string pipeline_error;
      if (!pipelines[i]->Run(cancel, pipeline_error)) {
        errors[i] = pipeline_error;
      }
    });
  }
  for (std::thread& thread : threads) {
    thread.join();
  }

  aggregator.MarkRunFinished(std::chrono::system_clock::now());
  report = aggregator.Snapshot();

  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (!errors[i].empty()) {
      failure = core::errors::Failure{.kind = core::errors::ErrorKind::kEnvironment,
                                      .message = std::string(config::ToString(platforms[i])) +
                                                 ": " + errors[i],
                                      .details = {}};
      return false;
    }
  }
  logger_.Info("platform matrix finished", {{"result", report.Succeeded() ? "passed" : "failed"}});
  return true;
}

} // namespace comfytest::pipeline
