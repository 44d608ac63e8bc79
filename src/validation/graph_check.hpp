#pragma once

#include "report/run_report.hpp"
#include "workflow/node_definition.hpp"
#include "workflow/workflow.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace comfytest::validation {

// `*` on either side matches anything; the target may list several accepted
// types separated by commas (`STRING,FILE_3D_GLB`).
bool TypesCompatible(std::string_view output_type, std::string_view input_type);

// Node ids that lie on a dependency cycle among `workflow`'s nodes, sorted.
std::vector<std::int64_t> FindCycleNodes(const workflow::Workflow& workflow);

// Graph sub-level.
//
// Reports, each as its own diagnostic:
// - entries the loader could not read;
// - nodes whose class has no registered definition;
// - links whose source or target node does not exist;
// - output slots beyond the source definition's outputs, input slots beyond
//   the target node's inputs, and incompatible slot types;
// - inputs pointing at links that do not exist;
// - required inputs of active nodes with neither a link nor a value;
// - dependency cycles.
std::vector<report::Diagnostic> CheckGraph(const workflow::Workflow& workflow,
                                           const workflow::NodeDefinitionSet& definitions);

} // namespace comfytest::validation
