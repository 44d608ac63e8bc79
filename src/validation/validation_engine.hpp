#pragma once

#include "collaborators/collaborators.hpp"
#include "cuda/classifier.hpp"
#include "report/run_report.hpp"
#include "validation/partial_execution.hpp"
#include "workflow/node_definition.hpp"
#include "workflow/workflow.hpp"

#include <functional>
#include <string>

namespace comfytest::validation {

// Executes one `/prompt` graph under the partial-execution deadline. The
// pipeline binds it to the execution collaborator; tests bind a fake.
using SubgraphRunner = std::function<collaborators::ExecutionOutcome(
    const std::string& workflow_name, const core::json::Value& prompt)>;

// Maps one partial run onto the partial-execution sub-result.
void ApplyPartialOutcome(const PartialPlan& plan, const collaborators::ExecutionOutcome& outcome,
                         report::SubLevelResult& result);

// Runs the four sub-levels on one workflow.
//
// Contract:
// - All four sub-results are always filled, in order, whatever the earlier
//   ones report.
// - Partial execution is `skipped` (never `failed`) when the
//   CUDA-independent subgraph is empty or has no output node, and when no
//   runner is supplied.
report::WorkflowValidation ValidateWorkflow(const workflow::Workflow& workflow,
                                            const workflow::NodeDefinitionSet& definitions,
                                            const cuda::CudaFlagSet& cuda_flags,
                                            const SubgraphRunner& runner);

} // namespace comfytest::validation
