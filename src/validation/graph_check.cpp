#include "validation/graph_check.hpp"

#include "workflow/widget_values.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <sstream>
#include <string>

namespace comfytest::validation {

namespace {

std::string_view Trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

void CheckLink(const workflow::Workflow& workflow, const workflow::NodeDefinitionSet& definitions,
               const workflow::WorkflowLink& link, std::vector<report::Diagnostic>& diagnostics) {
  const std::string prefix = "link " + std::to_string(link.id) + ": ";
  const workflow::WorkflowNode* source = workflow.FindNode(link.from_node);
  if (source == nullptr) {
    diagnostics.push_back({.node_id = link.from_node,
                           .message = prefix + "source node " + std::to_string(link.from_node) +
                                      " does not exist"});
    return;
  }
  const workflow::WorkflowNode* target = workflow.FindNode(link.to_node);
  if (target == nullptr) {
    diagnostics.push_back({.node_id = link.to_node,
                           .message = prefix + "target node " + std::to_string(link.to_node) +
                                      " does not exist"});
    return;
  }

  if (link.to_slot < 0 || static_cast<std::size_t>(link.to_slot) >= target->inputs.size()) {
    diagnostics.push_back({.node_id = target->id,
                           .node_class = target->class_name,
                           .message = prefix + "input slot " + std::to_string(link.to_slot) +
                                      " does not exist on " + target->class_name});
    return;
  }

  // Reroutes and primitives adapt to whatever they are connected to.
  if (workflow::IsFrontendOnlyClass(source->class_name) ||
      workflow::IsFrontendOnlyClass(target->class_name)) {
    return;
  }
  const auto source_definition = definitions.find(source->class_name);
  if (source_definition == definitions.end() ||
      definitions.find(target->class_name) == definitions.end()) {
    return;
  }

  const std::vector<std::string>& outputs = source_definition->second.outputs;
  if (link.from_slot < 0 || static_cast<std::size_t>(link.from_slot) >= outputs.size()) {
    diagnostics.push_back({.node_id = source->id,
                           .node_class = source->class_name,
                           .message = prefix + "output slot " + std::to_string(link.from_slot) +
                                      " does not exist on " + source->class_name});
    return;
  }

  const std::string& output_type = outputs[static_cast<std::size_t>(link.from_slot)];
  const workflow::InputSlot& input = target->inputs[static_cast<std::size_t>(link.to_slot)];
  if (!TypesCompatible(output_type, input.type)) {
    diagnostics.push_back({.node_id = target->id,
                           .node_class = target->class_name,
                           .field = input.name,
                           .message = prefix + "type mismatch: " + source->class_name +
                                      " outputs " + output_type + ", but " + target->class_name +
                                      " expects " + input.type});
  }
}

void CheckRequiredInputs(const workflow::Workflow& workflow, const workflow::WorkflowNode& node,
                         const workflow::NodeDefinition& definition,
                         std::vector<report::Diagnostic>& diagnostics) {
  const std::vector<workflow::WidgetBinding> bindings =
      workflow::BindWidgetValues(node, definition);
  for (const workflow::InputSpec& spec : definition.inputs) {
    if (!spec.required) {
      continue;
    }
    const workflow::InputSlot* slot = node.FindInputSlot(spec.name);
    if (slot != nullptr && slot->link.has_value()) {
      const workflow::LinkSource source = workflow::ResolveLinkSource(workflow, *slot->link);
      if (source.kind != workflow::LinkSource::Kind::kMissing) {
        continue;
      }
    }
    if (spec.IsWidget()) {
      const bool has_value =
          std::any_of(bindings.begin(), bindings.end(), [&spec](const workflow::WidgetBinding& b) {
            return b.spec == &spec && b.value.has_value();
          });
      if (has_value || spec.has_default) {
        continue;
      }
      diagnostics.push_back({.node_id = node.id,
                             .node_class = node.class_name,
                             .field = spec.name,
                             .message = "required input has no value"});
      continue;
    }
    diagnostics.push_back({.node_id = node.id,
                           .node_class = node.class_name,
                           .field = spec.name,
                           .message = "required input '" + spec.name + "' (" + spec.type_name +
                                      ") is not connected"});
  }
}

} // namespace

bool TypesCompatible(std::string_view output_type, std::string_view input_type) {
  if (output_type == "*" || input_type == "*" || output_type.empty() || input_type.empty()) {
    return true;
  }
  while (true) {
    const std::size_t comma = input_type.find(',');
    if (Trim(input_type.substr(0, comma)) == output_type) {
      return true;
    }
    if (comma == std::string_view::npos) {
      return false;
    }
    input_type.remove_prefix(comma + 1U);
  }
}

std::vector<std::int64_t> FindCycleNodes(const workflow::Workflow& workflow) {
  std::map<std::int64_t, std::set<std::int64_t>> successors;
  std::map<std::int64_t, std::set<std::int64_t>> predecessors;
  for (const workflow::WorkflowNode& node : workflow.nodes) {
    successors[node.id];
    predecessors[node.id];
  }
  for (const workflow::WorkflowLink& link : workflow.links) {
    if (successors.count(link.from_node) == 0U || successors.count(link.to_node) == 0U) {
      continue;
    }
    successors[link.from_node].insert(link.to_node);
    predecessors[link.to_node].insert(link.from_node);
  }

  // Peel sources (Kahn), then sinks; whatever survives both passes sits on
  // or between cycles.
  auto peel = [](std::map<std::int64_t, std::set<std::int64_t>>& incoming,
                 std::map<std::int64_t, std::set<std::int64_t>>& outgoing) {
    std::deque<std::int64_t> ready;
    for (const auto& [id, edges] : incoming) {
      if (edges.empty()) {
        ready.push_back(id);
      }
    }
    while (!ready.empty()) {
      const std::int64_t id = ready.front();
      ready.pop_front();
      for (const std::int64_t next : outgoing[id]) {
        auto& next_incoming = incoming[next];
        next_incoming.erase(id);
        if (next_incoming.empty()) {
          ready.push_back(next);
        }
      }
      for (const std::int64_t prev : incoming[id]) {
        outgoing[prev].erase(id);
      }
      incoming.erase(id);
      outgoing.erase(id);
    }
  };
  peel(predecessors, successors);
  peel(successors, predecessors);

  std::vector<std::int64_t> remaining;
  for (const auto& entry : successors) {
    remaining.push_back(entry.first);
  }
  return remaining;
}

std::vector<report::Diagnostic> CheckGraph(const workflow::Workflow& workflow,
                                           const workflow::NodeDefinitionSet& definitions) {
  std::vector<report::Diagnostic> diagnostics;
  for (const std::string& issue : workflow.load_issues) {
    diagnostics.push_back({.message = issue});
  }

  for (const workflow::WorkflowNode& node : workflow.nodes) {
    if (workflow::IsFrontendOnlyClass(node.class_name) ||
        definitions.find(node.class_name) != definitions.end()) {
      continue;
    }
    diagnostics.push_back({.node_id = node.id,
                           .node_class = node.class_name,
                           .message = "unknown class '" + node.class_name +
                                      "' (not registered by the server)"});
  }

  for (const workflow::WorkflowLink& link : workflow.links) {
    CheckLink(workflow, definitions, link, diagnostics);
  }

  for (const workflow::WorkflowNode& node : workflow.nodes) {
    for (const workflow::InputSlot& slot : node.inputs) {
      if (slot.link.has_value() && workflow.FindLink(*slot.link) == nullptr) {
        diagnostics.push_back({.node_id = node.id,
                               .node_class = node.class_name,
                               .field = slot.name,
                               .message = "input references missing link " +
                                          std::to_string(*slot.link)});
      }
    }
    if (!node.IsActive() || workflow::IsFrontendOnlyClass(node.class_name)) {
      continue;
    }
    const auto found = definitions.find(node.class_name);
    if (found != definitions.end()) {
      CheckRequiredInputs(workflow, node, found->second, diagnostics);
    }
  }

  const std::vector<std::int64_t> cycle = FindCycleNodes(workflow);
  if (!cycle.empty()) {
    std::ostringstream ids;
    for (std::size_t i = 0; i < cycle.size(); ++i) {
      ids << (i > 0U ? ", " : "") << cycle[i];
    }
    diagnostics.push_back({.node_id = cycle.front(),
                           .message = "dependency cycle through nodes " + ids.str()});
  }
  return diagnostics;
}

} // namespace comfytest::validation
