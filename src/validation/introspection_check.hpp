#pragma once

#include "report/run_report.hpp"
#include "workflow/node_definition.hpp"
#include "workflow/workflow.hpp"

#include <vector>

namespace comfytest::validation {

// Well-formedness of one definition, independent of any workflow: shape
// problems found while parsing `/object_info`, an unresolvable entry point,
// and a return arity that disagrees with the declared outputs.
std::vector<std::string> CheckDefinition(const workflow::NodeDefinition& definition);

// Introspection sub-level: CheckDefinition for every class the workflow
// uses, reported once per class against the first node using it.
std::vector<report::Diagnostic> CheckIntrospection(const workflow::Workflow& workflow,
                                                   const workflow::NodeDefinitionSet& definitions);

} // namespace comfytest::validation
