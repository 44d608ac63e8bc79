#include "validation/introspection_check.hpp"

#include <set>

namespace comfytest::validation {

std::vector<std::string> CheckDefinition(const workflow::NodeDefinition& definition) {
  std::vector<std::string> problems = definition.shape_issues;
  if (!definition.entry_point.empty() && definition.entry_point_resolved.has_value() &&
      !definition.entry_point_resolved.value()) {
    problems.push_back("FUNCTION '" + definition.entry_point + "' is not defined on the class");
  }
  if (definition.return_arity.has_value() &&
      static_cast<std::size_t>(*definition.return_arity) != definition.outputs.size()) {
    problems.push_back("FUNCTION '" + definition.entry_point + "' returns " +
                       std::to_string(*definition.return_arity) + " value(s) but RETURN_TYPES has " +
                       std::to_string(definition.outputs.size()));
  }
  return problems;
}

std::vector<report::Diagnostic> CheckIntrospection(const workflow::Workflow& workflow,
                                                   const workflow::NodeDefinitionSet& definitions) {
  std::vector<report::Diagnostic> diagnostics;
  std::set<std::string> seen;
  for (const workflow::WorkflowNode& node : workflow.nodes) {
    if (workflow::IsFrontendOnlyClass(node.class_name) || !seen.insert(node.class_name).second) {
      continue;
    }
    const auto found = definitions.find(node.class_name);
    if (found == definitions.end()) {
      continue;
    }
    for (std::string& problem : CheckDefinition(found->second)) {
      diagnostics.push_back(
          {.node_id = node.id, .node_class = node.class_name, .message = std::move(problem)});
    }
  }
  return diagnostics;
}

} // namespace comfytest::validation
