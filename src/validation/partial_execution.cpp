#include "validation/partial_execution.hpp"

#include "workflow/widget_values.hpp"

#include <algorithm>

namespace comfytest::validation {

namespace {

bool InputSatisfied(const workflow::Workflow& workflow, const workflow::WorkflowNode& node,
                    const workflow::InputSpec& spec,
                    const std::vector<workflow::WidgetBinding>& bindings,
                    const std::set<std::int64_t>& kept) {
  const workflow::InputSlot* slot = node.FindInputSlot(spec.name);
  if (slot != nullptr && slot->link.has_value()) {
    const workflow::LinkSource source = workflow::ResolveLinkSource(workflow, *slot->link);
    if (source.kind == workflow::LinkSource::Kind::kNode && kept.count(source.node_id) != 0U) {
      return true;
    }
  }
  if (!spec.IsWidget()) {
    return false;
  }
  if (spec.has_default) {
    return true;
  }
  return std::any_of(bindings.begin(), bindings.end(), [&spec](const workflow::WidgetBinding& b) {
    return b.spec == &spec && b.value.has_value();
  });
}

} // namespace

PartialPlan PlanPartialExecution(const workflow::Workflow& workflow,
                                 const workflow::NodeDefinitionSet& definitions,
                                 const cuda::CudaFlagSet& cuda_flags) {
  PartialPlan plan;
  for (const workflow::WorkflowNode& node : workflow.nodes) {
    if (!node.IsActive() || workflow::IsFrontendOnlyClass(node.class_name)) {
      continue;
    }
    if (cuda_flags.count(node.class_name) != 0U) {
      plan.cuda_excluded.insert(node.id);
    } else if (definitions.find(node.class_name) == definitions.end()) {
      plan.unsatisfied.insert(node.id);
    } else {
      plan.nodes.insert(node.id);
    }
  }

  bool changed = true;
  while (changed) {
    changed = false;
    for (const workflow::WorkflowNode& node : workflow.nodes) {
      if (plan.nodes.count(node.id) == 0U) {
        continue;
      }
      const workflow::NodeDefinition& definition = definitions.at(node.class_name);
      const std::vector<workflow::WidgetBinding> bindings =
          workflow::BindWidgetValues(node, definition);
      const bool runnable = std::all_of(
          definition.inputs.begin(), definition.inputs.end(),
          [&](const workflow::InputSpec& spec) {
            return !spec.required || InputSatisfied(workflow, node, spec, bindings, plan.nodes);
          });
      if (!runnable) {
        plan.nodes.erase(node.id);
        plan.unsatisfied.insert(node.id);
        changed = true;
      }
    }
  }

  for (const std::int64_t id : plan.nodes) {
    const workflow::WorkflowNode* node = workflow.FindNode(id);
    if (node != nullptr && definitions.at(node->class_name).is_output_node) {
      plan.has_output = true;
      break;
    }
  }
  return plan;
}

} // namespace comfytest::validation
