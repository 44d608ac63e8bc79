#include "pipeline/level_pipeline.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/bounded_parallel.hpp"
#include "core/deadline_task.hpp"
#include "core/fs_utils.hpp"
#include "syntax/syntax_check.hpp"
#include "validation/validation_engine.hpp"
#include "workflow/prompt_builder.hpp"
#include "workflow/workflow.hpp"

#include <array>
#include <map>
#include <utility>

namespace comfytest::pipeline {

namespace {

using core::errors::ErrorKind;
using report::LevelResult;
using report::LevelStatus;

LevelResult Passed() {
  LevelResult result;
  result.status = LevelStatus::kPassed;
  return result;
}

LevelResult Failed(ErrorKind kind, std::string message, std::string details = {}) {
  LevelResult result;
  result.status = LevelStatus::kFailed;
  result.failure = core::errors::Failure{
      .kind = kind, .message = std::move(message), .details = std::move(details)};
  return result;
}

// Folds a collaborator step into the level result; a deadline overrides
// whatever the collaborator reported after it was cancelled.
LevelResult FromStep(const collaborators::StepOutcome& outcome, core::DeadlineOutcome deadline,
                     const std::string& step, std::chrono::seconds budget) {
  LevelResult result;
  if (deadline == core::DeadlineOutcome::kTimedOut) {
    result = Failed(ErrorKind::kTimeout,
                    step + " exceeded " + std::to_string(budget.count()) + "s");
  } else if (deadline == core::DeadlineOutcome::kCancelled) {
    result = Failed(ErrorKind::kCancelled, step + " cancelled");
  } else if (!outcome.ok) {
    result.status = LevelStatus::kFailed;
    result.failure = outcome.failure;
  } else {
    result.status = LevelStatus::kPassed;
  }
  result.warnings = outcome.warnings;
  result.artifacts = outcome.artifacts;
  return result;
}

std::string WorkflowStem(const workflow::WorkflowEntry& entry) {
  return core::SanitizeFileStem(entry.path.stem().string());
}

std::string JoinLevels(const std::vector<config::Level>& levels) {
  std::string joined;
  for (const config::Level level : levels) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += config::ToString(level);
  }
  return joined;
}

ErrorKind ExecutionFailureKind(collaborators::ExecutionStatus status) {
  switch (status) {
  case collaborators::ExecutionStatus::kTimedOut:
    return ErrorKind::kTimeout;
  case collaborators::ExecutionStatus::kCancelled:
    return ErrorKind::kCancelled;
  case collaborators::ExecutionStatus::kCompleted:
    return ErrorKind::kNone;
  case collaborators::ExecutionStatus::kFailed:
    break;
  }
  return ErrorKind::kExecution;
}

// Level verdict from per-workflow records: the first failed workflow in
// catalog order names the failure kind.
void SummarizeWorkflowRuns(LevelResult& result, const std::string& noun) {
  std::size_t failed = 0;
  const report::WorkflowRun* first = nullptr;
  for (const report::WorkflowRun& run : result.workflows) {
    if (run.status == LevelStatus::kFailed) {
      ++failed;
      if (first == nullptr) {
        first = &run;
      }
    }
  }
  if (first == nullptr) {
    result.status = LevelStatus::kPassed;
    return;
  }
  result.status = LevelStatus::kFailed;
  result.failure = core::errors::Failure{
      .kind = first->failure_kind,
      .message = std::to_string(failed) + " of " + std::to_string(result.workflows.size()) +
                 " workflow(s) failed " + noun + " (first: " + first->workflow + ")",
      .details = first->message};
}

} // namespace

LevelPipeline::LevelPipeline(PipelineContext context, report::ResultAggregator& aggregator)
    : context_(std::move(context)),
      aggregator_(aggregator),
      emitter_(context_.run.output_dir) {}

void LevelPipeline::RecordError(const std::string& message) {
  context_.run.logger.Error("failed to record pipeline progress", {{"error", message}});
  if (record_error_.empty()) {
    record_error_ = message;
  }
}

void LevelPipeline::LevelStarted(config::Level level, bool implicit,
                                 std::chrono::system_clock::time_point at) {
  context_.run.logger.Info("level started", {{"level", config::ToDisplayName(level)},
                                             {"implicit", implicit ? "true" : "false"}});
  std::string error;
  if (!aggregator_.BeginLevel(context_.run.platform, level, implicit, at, error)) {
    RecordError(error);
  }
  if (!emitter_.EmitLevelStarted(
          {.ts = at, .platform = context_.run.platform, .level = level, .implicit = implicit},
          error)) {
    RecordError(error);
  }
}

void LevelPipeline::LevelFinished(const LevelResult& result) {
  std::chrono::milliseconds elapsed{0};
  if (result.started_at.has_value() && result.finished_at.has_value()) {
    elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(*result.finished_at -
                                                                    *result.started_at);
  }
  const ErrorKind kind = result.failure.has_value() ? result.failure->kind : ErrorKind::kNone;
  const std::string message = result.failure.has_value() ? result.failure->message : "";

  if (result.status == LevelStatus::kFailed) {
    context_.run.logger.Error("level failed", {{"level", config::ToDisplayName(result.level)},
                                               {"kind", core::errors::ToString(kind)},
                                               {"error", message}});
  } else if (result.status == LevelStatus::kSkipped) {
    context_.run.logger.Info("level skipped",
                             {{"level", config::ToDisplayName(result.level)},
                              {"reason", report::ToString(result.skip_reason)}});
  } else {
    context_.run.logger.Info("level passed",
                             {{"level", config::ToDisplayName(result.level)},
                              {"elapsed_ms", std::to_string(elapsed.count())}});
  }
  for (const std::string& warning : result.warnings) {
    context_.run.logger.Warn("level warning",
                             {{"level", config::ToDisplayName(result.level)}, {"warning", warning}});
  }

  std::string error;
  if (!aggregator_.RecordLevel(context_.run.platform, result, error)) {
    RecordError(error);
  }
  if (!emitter_.EmitLevelFinished({.ts = result.finished_at.value_or(
                                       std::chrono::system_clock::now()),
                                   .platform = context_.run.platform,
                                   .level = result.level,
                                   .status = result.status,
                                   .skip_reason = result.skip_reason,
                                   .failure_kind = kind,
                                   .message = message,
                                   .diagnostics = result.diagnostics.size(),
                                   .elapsed = elapsed},
                                  error)) {
    RecordError(error);
  }
}

std::vector<const workflow::WorkflowEntry*> LevelPipeline::LevelWorkflows(
    config::Level level) const {
  return WorkflowsForLevel(level, *context_.catalog,
                           context_.config->Platform(context_.run.platform), context_.run.runner);
}

bool LevelPipeline::ExcludedByInstantiation(const workflow::Workflow& graph) const {
  if (context_.config->instantiation_failures !=
      config::InstantiationFailurePolicy::kSurvivingOnly) {
    return false;
  }
  for (const std::string& class_name : graph.ClassNames()) {
    if (failed_classes_.count(class_name) != 0U) {
      return true;
    }
  }
  return false;
}

std::vector<LevelDescriptor> LevelPipeline::BuildDescriptors() {
  using Runner = report::LevelResult (LevelPipeline::*)(const core::CancellationToken&);
  static constexpr std::array<Runner, config::kLevelCount> kRunners = {
      &LevelPipeline::RunSyntax,        &LevelPipeline::RunInstall,
      &LevelPipeline::RunRegistration,  &LevelPipeline::RunInstantiation,
      &LevelPipeline::RunStaticCapture, &LevelPipeline::RunValidation,
      &LevelPipeline::RunExecution,
  };

  const config::PlatformSettings& settings = context_.config->Platform(context_.run.platform);
  std::vector<LevelDescriptor> descriptors;
  for (const config::Level level : config::kAllLevels) {
    const Runner runner = kRunners[config::ToIndex(level)];
    descriptors.push_back(
        {.level = level,
         .implicit = context_.selection.IsImplicit(level),
         .configuration_skip = ConfigurationSkip(level, context_.selection, *context_.catalog,
                                                 settings, context_.run.runner),
         .run = [this, runner](const core::CancellationToken& cancel) {
           return (this->*runner)(cancel);
         }});
  }
  return descriptors;
}

bool LevelPipeline::Run(const core::CancellationToken& cancel, std::string& error) {
  const config::PlatformId platform = context_.run.platform;
  if (!artifacts::EnsureOutputDir(context_.run.output_dir, error)) {
    return false;
  }
  if (!emitter_.EmitRunStarted({.ts = std::chrono::system_clock::now(),
                                .platform = platform,
                                .runner = context_.run.runner,
                                .project = context_.project->name,
                                .comfyui_version = context_.project->comfyui_version,
                                .python_version = context_.project->python_version,
                                .server_port = context_.run.server_port,
                                .levels = JoinLevels(context_.selection.levels)},
                               error)) {
    return false;
  }
  context_.run.logger.Info("platform pipeline started",
                           {{"runner", config::ToString(context_.run.runner)},
                            {"workspace", context_.run.workspace.string()},
                            {"port", std::to_string(context_.run.server_port)}});

  const std::vector<LevelDescriptor> descriptors = BuildDescriptors();
  RunLevelGate(descriptors, cancel, *this);

  if (session_ != nullptr) {
    context_.run.logger.Debug("stopping host server");
    session_.reset();
  }

  std::string finalize_error;
  if (!aggregator_.FinalizePlatform(platform, finalize_error)) {
    RecordError(finalize_error);
  }

  const report::RunReport snapshot = aggregator_.Snapshot();
  const report::PlatformReport* entry = snapshot.FindPlatform(platform);
  const bool succeeded = entry != nullptr && entry->Succeeded();
  std::string emit_error;
  if (!emitter_.EmitRunFinished({.ts = std::chrono::system_clock::now(),
                                 .platform = platform,
                                 .succeeded = succeeded,
                                 .cancelled = cancel.IsCancelled()},
                                emit_error)) {
    RecordError(emit_error);
  }
  context_.run.logger.Info("platform pipeline finished",
                           {{"result", succeeded ? "passed" : "failed"}});

  if (!record_error_.empty()) {
    error = record_error_;
    return false;
  }
  return true;
}

LevelResult LevelPipeline::RunSyntax(const core::CancellationToken& /*cancel*/) {
  syntax::SyntaxReport syntax_report;
  std::string error;
  if (!syntax::RunSyntaxChecks(context_.project->node_dir, syntax_report, error)) {
    return Failed(ErrorKind::kSyntax, error);
  }
  context_.run.logger.Debug("syntax scan finished",
                            {{"files", std::to_string(syntax_report.files_scanned)}});
  LevelResult result = syntax_report.Passed() ? Passed() : LevelResult{};
  for (const std::string& line : syntax_report.diagnostics) {
    result.diagnostics.push_back({.message = line});
  }
  if (!syntax_report.Passed()) {
    result.status = LevelStatus::kFailed;
    result.failure = core::errors::Failure{
        .kind = ErrorKind::kSyntax,
        .message = std::to_string(syntax_report.diagnostics.size()) + " problem(s) in " +
                   std::to_string(syntax_report.files_scanned) + " source file(s)",
        .details = {}};
  }
  return result;
}

LevelResult LevelPipeline::RunInstall(const core::CancellationToken& cancel) {
  collaborators::EnvironmentCollaborator* environment = context_.collaborators.environment;
  if (environment == nullptr) {
    return Failed(ErrorKind::kEnvironment, "no environment collaborator configured");
  }
  collaborators::StepOutcome outcome;
  const core::DeadlineOutcome deadline = core::RunWithDeadline<collaborators::StepOutcome>(
      context_.config->timeout, cancel,
      [&](const core::CancellationToken& token) {
        return environment->Install(context_.run, token, installation_);
      },
      outcome);
  return FromStep(outcome, deadline, "install", context_.config->timeout);
}

LevelResult LevelPipeline::RunRegistration(const core::CancellationToken& cancel) {
  collaborators::ServerCollaborator* server = context_.collaborators.server;
  if (server == nullptr) {
    return Failed(ErrorKind::kRegistration, "no server collaborator configured");
  }
  collaborators::StepOutcome outcome;
  const core::DeadlineOutcome deadline = core::RunWithDeadline<collaborators::StepOutcome>(
      context_.config->timeout, cancel,
      [&](const core::CancellationToken& token) {
        return server->Start(context_.run, installation_, token, session_);
      },
      outcome);
  LevelResult result = FromStep(outcome, deadline, "server start", context_.config->timeout);
  if (result.status != LevelStatus::kPassed) {
    return result;
  }
  if (session_ == nullptr) {
    return Failed(ErrorKind::kRegistration, "server collaborator returned no session");
  }
  context_.run.logger.Info("host server ready", {{"url", session_->BaseUrl()}});

  const std::vector<std::string> import_errors = session_->ImportErrors();
  if (!import_errors.empty()) {
    result = Failed(ErrorKind::kRegistration,
                    std::to_string(import_errors.size()) + " custom node import failure(s)");
    for (const std::string& line : import_errors) {
      result.diagnostics.push_back({.message = line});
    }
    return result;
  }

  std::string error;
  if (!session_->QueryNodeDefinitions(cancel, definitions_, error)) {
    return Failed(ErrorKind::kRegistration, "node registry query failed: " + error);
  }

  std::string extension = installation_.custom_node_dir.filename().string();
  if (extension.empty()) {
    extension = context_.project->node_dir.filename().string();
  }
  extension_classes_ = workflow::ExtensionClassNames(definitions_, extension);
  if (extension_classes_.empty()) {
    return Failed(ErrorKind::kRegistration, "no node classes registered by '" + extension +
                                                "' (" + std::to_string(definitions_.size()) +
                                                " classes known to the server)");
  }

  std::map<std::string, collaborators::NodeInspection> inspections;
  if (!session_->InspectNodes(extension_classes_, cancel, inspections, error)) {
    return Failed(ErrorKind::kRegistration, "node introspection failed: " + error);
  }
  for (auto& [class_name, inspection] : inspections) {
    auto it = definitions_.find(class_name);
    if (it == definitions_.end()) {
      continue;
    }
    it->second.dependencies = std::move(inspection.dependencies);
    it->second.entry_point_resolved = inspection.entry_point_resolved;
    it->second.return_arity = inspection.return_arity;
  }

  cuda_ = cuda::ClassifyCudaNodes(context_.project->cuda_packages, definitions_);
  for (const auto& [class_name, packages] : cuda_.reasons) {
    std::string joined;
    for (const std::string& package : packages) {
      joined += (joined.empty() ? "" : ",") + package;
    }
    context_.run.logger.Info("node classified as CUDA-only",
                             {{"class", class_name}, {"packages", joined}});
  }
  context_.run.logger.Info("registration complete",
                           {{"extension_classes", std::to_string(extension_classes_.size())},
                            {"cuda_classes", std::to_string(cuda_.flagged.size())}});
  result.artifacts.push_back(artifacts::kServerLogFileName);
  return result;
}

LevelResult LevelPipeline::RunInstantiation(const core::CancellationToken& cancel) {
  if (session_ == nullptr) {
    return Failed(ErrorKind::kRegistration, "host server is not running");
  }
  std::map<std::string, collaborators::InstantiationResult> results;
  std::string error;
  if (!session_->InstantiateNodes(extension_classes_, cancel, results, error)) {
    if (cancel.IsCancelled()) {
      return Failed(ErrorKind::kCancelled, "instantiation cancelled");
    }
    return Failed(ErrorKind::kInstantiation, "instantiation helper failed: " + error);
  }

  LevelResult result = Passed();
  for (const std::string& class_name : extension_classes_) {
    const auto it = results.find(class_name);
    if (it != results.end() && it->second.ok) {
      continue;
    }
    failed_classes_.insert(class_name);
    result.diagnostics.push_back(
        {.node_class = class_name,
         .message = it == results.end() ? "no instantiation result reported"
                                        : "constructor failed: " + it->second.message});
  }

  if (!failed_classes_.empty() && failed_classes_.size() == extension_classes_.size()) {
    result.status = LevelStatus::kFailed;
    result.failure = core::errors::Failure{
        .kind = ErrorKind::kInstantiation,
        .message = "all " + std::to_string(extension_classes_.size()) +
                   " node classes failed to instantiate",
        .details = {}};
  } else if (!failed_classes_.empty()) {
    result.warnings.push_back(std::to_string(failed_classes_.size()) + " of " +
                              std::to_string(extension_classes_.size()) +
                              " node classes failed to instantiate");
  }
  return result;
}

LevelResult LevelPipeline::RunStaticCapture(const core::CancellationToken& cancel) {
  collaborators::ScreenshotCollaborator* screenshot = context_.collaborators.screenshot;
  if (session_ == nullptr) {
    return Failed(ErrorKind::kRegistration, "host server is not running");
  }
  const std::vector<const workflow::WorkflowEntry*> entries =
      LevelWorkflows(config::Level::kStaticCapture);

  LevelResult result;
  result.workflows.resize(entries.size());
  std::vector<std::string> warnings(entries.size());
  core::ForEachBounded(entries.size(), context_.config->workflow_concurrency, [&](std::size_t i) {
    const workflow::WorkflowEntry& entry = *entries[i];
    report::WorkflowRun& run = result.workflows[i];
    run.workflow = entry.file_name;
    const auto started = std::chrono::steady_clock::now();

    if (cancel.IsCancelled()) {
      run.status = LevelStatus::kFailed;
      run.failure_kind = ErrorKind::kCancelled;
      run.message = "cancelled";
    } else if (screenshot == nullptr) {
      run.status = LevelStatus::kPassed;
      warnings[i] = entry.file_name + ": no screenshot collaborator";
    } else {
      const std::string relative =
          std::string(artifacts::kScreenshotsDirName) + "/" + WorkflowStem(entry) + ".png";
      const collaborators::ScreenshotOutcome outcome = screenshot->Capture(
          context_.run, *session_, entry, context_.run.output_dir / relative, cancel);
      run.message = outcome.message;
      switch (outcome.status) {
      case collaborators::ScreenshotStatus::kCaptured:
        run.status = LevelStatus::kPassed;
        run.artifacts.push_back(outcome.artifact.empty() ? relative : outcome.artifact);
        break;
      case collaborators::ScreenshotStatus::kWarning:
      case collaborators::ScreenshotStatus::kUnavailable:
        run.status = LevelStatus::kPassed;
        warnings[i] = entry.file_name + ": " + outcome.message;
        break;
      case collaborators::ScreenshotStatus::kError:
        run.status = LevelStatus::kFailed;
        run.failure_kind = ErrorKind::kExecution;
        break;
      }
    }
    run.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    std::string error;
    if (!emitter_.EmitWorkflowFinished({.ts = std::chrono::system_clock::now(),
                                        .platform = context_.run.platform,
                                        .level = config::Level::kStaticCapture,
                                        .workflow = run.workflow,
                                        .status = run.status,
                                        .failure_kind = run.failure_kind,
                                        .elapsed = run.elapsed},
                                       error)) {
      context_.run.logger.Warn("failed to append workflow event", {{"error", error}});
    }
  });

  for (std::string& warning : warnings) {
    if (!warning.empty()) {
      result.warnings.push_back(std::move(warning));
    }
  }
  SummarizeWorkflowRuns(result, "static capture");
  return result;
}

collaborators::ExecutionOutcome LevelPipeline::ExecuteWithDeadline(
    const collaborators::ExecutionRequest& request, const core::CancellationToken& cancel) {
  collaborators::ExecutionCollaborator* execution = context_.collaborators.execution;
  collaborators::ExecutionOutcome outcome;
  const auto started = std::chrono::steady_clock::now();
  const core::DeadlineOutcome deadline =
      core::RunWithDeadline<collaborators::ExecutionOutcome>(
          request.timeout, cancel,
          [&](const core::CancellationToken& token) {
            return execution->Execute(context_.run, *session_, request, token);
          },
          outcome);
  if (deadline == core::DeadlineOutcome::kTimedOut) {
    outcome.status = collaborators::ExecutionStatus::kTimedOut;
    outcome.message = "exceeded timeout of " +
                      std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                                         request.timeout)
                                         .count()) +
                      "s";
  } else if (deadline == core::DeadlineOutcome::kCancelled) {
    outcome.status = collaborators::ExecutionStatus::kCancelled;
    outcome.message = "cancelled";
  }
  outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return outcome;
}

LevelResult LevelPipeline::RunValidation(const core::CancellationToken& cancel) {
  const std::vector<const workflow::WorkflowEntry*> entries =
      LevelWorkflows(config::Level::kValidation);

  // Load first so the instantiation policy can look at node classes.
  std::vector<workflow::Workflow> workflows(entries.size());
  std::vector<std::string> load_errors(entries.size());
  std::vector<bool> included(entries.size(), true);
  report::ValidationReport validation;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (!workflow::LoadWorkflowFile(entries[i]->path, workflows[i], load_errors[i])) {
      continue;
    }
    if (ExcludedByInstantiation(workflows[i])) {
      included[i] = false;
      validation.excluded.push_back(entries[i]->file_name);
    }
  }

  std::vector<report::WorkflowValidation> results(entries.size());
  core::ForEachBounded(entries.size(), context_.config->workflow_concurrency, [&](std::size_t i) {
    if (!included[i]) {
      return;
    }
    if (!load_errors[i].empty()) {
      report::WorkflowValidation& failed = results[i];
      failed.workflow = entries[i]->file_name;
      report::SubLevelResult& graph = failed.Result(report::SubLevel::kGraph);
      graph.status = LevelStatus::kFailed;
      graph.failure_kind = report::FailureKindFor(report::SubLevel::kGraph);
      graph.note = "workflow could not be loaded";
      graph.diagnostics.push_back(
          {.message = load_errors[i]});
      for (const report::SubLevel sub_level :
           {report::SubLevel::kSchema, report::SubLevel::kIntrospection,
            report::SubLevel::kPartialExecution}) {
        failed.Result(sub_level).status = LevelStatus::kSkipped;
        failed.Result(sub_level).note = "workflow could not be loaded";
      }
      return;
    }

    validation::SubgraphRunner runner;
    if (context_.collaborators.execution != nullptr && session_ != nullptr) {
      const std::string stem = WorkflowStem(*entries[i]);
      runner = [this, &cancel, stem](const std::string& workflow_name,
                                     const core::json::Value& prompt) {
        const collaborators::ExecutionRequest request{
            .workflow = workflow_name,
            .prompt = prompt,
            .log_path = context_.run.output_dir / artifacts::kLogsDirName /
                        (stem + ".partial.log"),
            .timeout = context_.config->partial_timeout};
        return ExecuteWithDeadline(request, cancel);
      };
    }
    results[i] = validation::ValidateWorkflow(workflows[i], definitions_, cuda_.flagged, runner);
  });

  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (included[i]) {
      validation.workflows.push_back(std::move(results[i]));
    }
  }

  LevelResult result;
  std::size_t failed = 0;
  const report::SubLevelResult* first = nullptr;
  std::string first_workflow;
  for (const report::WorkflowValidation& workflow_result : validation.workflows) {
    if (workflow_result.Passed()) {
      continue;
    }
    ++failed;
    for (const report::SubLevelResult& sub : workflow_result.sub_levels) {
      if (first == nullptr && sub.status == LevelStatus::kFailed) {
        first = &sub;
        first_workflow = workflow_result.workflow;
      }
    }
  }
  if (!validation.excluded.empty()) {
    result.warnings.push_back(std::to_string(validation.excluded.size()) +
                              " workflow(s) excluded: they use classes that failed to "
                              "instantiate");
  }

  if (failed == 0U) {
    result.status = LevelStatus::kPassed;
  } else {
    result.status = LevelStatus::kFailed;
    result.failure = core::errors::Failure{
        .kind = first != nullptr ? first->failure_kind : ErrorKind::kValidationGraph,
        .message = std::to_string(failed) + " of " + std::to_string(validation.workflows.size()) +
                   " workflow(s) failed validation (first: " + first_workflow + " " +
                   (first != nullptr ? report::ToString(first->sub_level) : "") + ")",
        .details = {}};
  }
  result.validation = std::move(validation);
  return result;
}

LevelResult LevelPipeline::RunExecution(const core::CancellationToken& cancel) {
  if (context_.collaborators.execution == nullptr) {
    return Failed(ErrorKind::kExecution, "no execution collaborator configured");
  }
  if (session_ == nullptr) {
    return Failed(ErrorKind::kRegistration, "host server is not running");
  }
  std::vector<const workflow::WorkflowEntry*> entries;
  std::vector<std::string> excluded;
  for (const workflow::WorkflowEntry* entry : LevelWorkflows(config::Level::kExecution)) {
    workflow::Workflow graph;
    std::string load_error;
    // Unloadable files stay in scope and fail below with their load error.
    if (workflow::LoadWorkflowFile(entry->path, graph, load_error) &&
        ExcludedByInstantiation(graph)) {
      excluded.push_back(entry->file_name);
      continue;
    }
    entries.push_back(entry);
  }

  LevelResult result;
  for (const std::string& name : excluded) {
    result.warnings.push_back(name + ": not executed, uses classes that failed to instantiate");
  }
  result.workflows.resize(entries.size());
  core::ForEachBounded(entries.size(), context_.config->workflow_concurrency, [&](std::size_t i) {
    const workflow::WorkflowEntry& entry = *entries[i];
    report::WorkflowRun& run = result.workflows[i];
    run.workflow = entry.file_name;

    workflow::Workflow graph;
    core::json::Value prompt;
    std::string error;
    if (!workflow::LoadWorkflowFile(entry.path, graph, error) ||
        !workflow::BuildPrompt(graph, definitions_, nullptr, prompt, error)) {
      run.status = LevelStatus::kFailed;
      run.failure_kind = ErrorKind::kExecution;
      run.message = error;
    } else {
      const std::string log_relative =
          std::string(artifacts::kLogsDirName) + "/" + WorkflowStem(entry) + ".log";
      const collaborators::ExecutionRequest request{
          .workflow = entry.file_name,
          .prompt = std::move(prompt),
          .log_path = context_.run.output_dir / log_relative,
          .timeout = context_.config->timeout};
      const collaborators::ExecutionOutcome outcome = ExecuteWithDeadline(request, cancel);
      run.elapsed = outcome.elapsed;
      run.failure_kind = ExecutionFailureKind(outcome.status);
      run.status = run.failure_kind == ErrorKind::kNone ? LevelStatus::kPassed
                                                        : LevelStatus::kFailed;
      run.message = outcome.message;
      run.artifacts.push_back(log_relative);
      run.artifacts.insert(run.artifacts.end(), outcome.outputs.begin(), outcome.outputs.end());
    }

    context_.run.logger.Info("workflow finished",
                             {{"workflow", run.workflow},
                              {"status", report::ToString(run.status)},
                              {"elapsed", core::FormatElapsedClock(run.elapsed)}});
    if (!emitter_.EmitWorkflowFinished({.ts = std::chrono::system_clock::now(),
                                        .platform = context_.run.platform,
                                        .level = config::Level::kExecution,
                                        .workflow = run.workflow,
                                        .status = run.status,
                                        .failure_kind = run.failure_kind,
                                        .elapsed = run.elapsed},
                                       error)) {
      context_.run.logger.Warn("failed to append workflow event", {{"error", error}});
    }
  });

  SummarizeWorkflowRuns(result, "execution");
  return result;
}

} // namespace comfytest::pipeline
