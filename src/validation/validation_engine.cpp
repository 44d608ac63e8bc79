#include "validation/validation_engine.hpp"

#include "validation/graph_check.hpp"
#include "validation/introspection_check.hpp"
#include "validation/schema_check.hpp"
#include "workflow/prompt_builder.hpp"

namespace comfytest::validation {

namespace {

using core::errors::ErrorKind;
using report::LevelStatus;
using report::SubLevel;

void FinishCheck(report::SubLevelResult& result, std::vector<report::Diagnostic> diagnostics) {
  result.diagnostics = std::move(diagnostics);
  if (result.diagnostics.empty()) {
    result.status = LevelStatus::kPassed;
    result.failure_kind = ErrorKind::kNone;
    return;
  }
  result.status = LevelStatus::kFailed;
  result.failure_kind = report::FailureKindFor(result.sub_level);
  result.note = std::to_string(result.diagnostics.size()) + " problem(s)";
}

void Skip(report::SubLevelResult& result, std::string note) {
  result.status = LevelStatus::kSkipped;
  result.failure_kind = ErrorKind::kNone;
  result.note = std::move(note);
}

} // namespace

void ApplyPartialOutcome(const PartialPlan& plan, const collaborators::ExecutionOutcome& outcome,
                         report::SubLevelResult& result) {
  result.diagnostics = outcome.diagnostics;
  switch (outcome.status) {
  case collaborators::ExecutionStatus::kCompleted:
    result.status = LevelStatus::kPassed;
    result.failure_kind = ErrorKind::kNone;
    result.note = std::to_string(plan.nodes.size()) + " node(s) executed, " +
                  std::to_string(plan.cuda_excluded.size()) + " CUDA node(s) excluded";
    return;
  case collaborators::ExecutionStatus::kTimedOut:
    result.status = LevelStatus::kFailed;
    result.failure_kind = ErrorKind::kTimeout;
    break;
  case collaborators::ExecutionStatus::kCancelled:
    result.status = LevelStatus::kFailed;
    result.failure_kind = ErrorKind::kCancelled;
    break;
  case collaborators::ExecutionStatus::kFailed:
    result.status = LevelStatus::kFailed;
    result.failure_kind = ErrorKind::kValidationPartialExecution;
    break;
  }
  result.note = outcome.message.empty() ? collaborators::ToString(outcome.status) : outcome.message;
}

report::WorkflowValidation ValidateWorkflow(const workflow::Workflow& workflow,
                                            const workflow::NodeDefinitionSet& definitions,
                                            const cuda::CudaFlagSet& cuda_flags,
                                            const SubgraphRunner& runner) {
  report::WorkflowValidation validation;
  validation.workflow = workflow.name;

  FinishCheck(validation.Result(SubLevel::kSchema), CheckSchema(workflow, definitions));
  FinishCheck(validation.Result(SubLevel::kGraph), CheckGraph(workflow, definitions));
  FinishCheck(validation.Result(SubLevel::kIntrospection),
              CheckIntrospection(workflow, definitions));

  report::SubLevelResult& partial = validation.Result(SubLevel::kPartialExecution);
  const PartialPlan plan = PlanPartialExecution(workflow, definitions, cuda_flags);
  if (plan.nodes.empty()) {
    Skip(partial, "no CUDA-independent nodes to execute");
    return validation;
  }
  if (!plan.has_output) {
    Skip(partial, "CUDA-independent subgraph has no output node");
    return validation;
  }
  if (!runner) {
    Skip(partial, "no execution collaborator");
    return validation;
  }

  core::json::Value prompt;
  std::string build_error;
  if (!workflow::BuildPrompt(workflow, definitions, &plan.nodes, prompt, build_error)) {
    partial.status = LevelStatus::kFailed;
    partial.failure_kind = ErrorKind::kValidationPartialExecution;
    partial.note = build_error;
    return validation;
  }
  ApplyPartialOutcome(plan, runner(workflow.name, prompt), partial);
  return validation;
}

} // namespace comfytest::validation
