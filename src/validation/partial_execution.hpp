#pragma once

#include "cuda/classifier.hpp"
#include "workflow/node_definition.hpp"
#include "workflow/workflow.hpp"

#include <cstdint>
#include <set>

namespace comfytest::validation {

// The CUDA-independent part of a workflow that can run on its own.
struct PartialPlan {
  // Nodes to execute.
  std::set<std::int64_t> nodes;
  // Nodes whose class is in the CUDA flag set.
  std::set<std::int64_t> cuda_excluded;
  // Nodes dropped because a required input could only come from an excluded
  // node (directly or transitively), or because their class is unknown.
  std::set<std::int64_t> unsatisfied;
  // Whether any of `nodes` is an output node (the host only executes graphs
  // that end in one).
  bool has_output = false;
};

// Starts from every active node whose class is known and not CUDA-flagged,
// then repeatedly drops nodes with a required input that cannot be satisfied
// without the dropped nodes, until nothing changes. A required widget input
// fed by a dropped node falls back to its saved value or default.
PartialPlan PlanPartialExecution(const workflow::Workflow& workflow,
                                 const workflow::NodeDefinitionSet& definitions,
                                 const cuda::CudaFlagSet& cuda_flags);

} // namespace comfytest::validation
