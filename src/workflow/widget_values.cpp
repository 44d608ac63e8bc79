#include "workflow/widget_values.hpp"

namespace comfytest::workflow {

std::vector<WidgetBinding> BindWidgetValues(const WorkflowNode& node,
                                            const NodeDefinition& definition) {
  std::vector<WidgetBinding> bindings;
  std::size_t cursor = 0;
  for (const InputSpec& spec : definition.inputs) {
    if (!spec.IsWidget()) {
      continue;
    }

    WidgetBinding binding{.spec = &spec, .value = std::nullopt};
    if (node.named_widget_values.has_value()) {
      if (const core::json::Value* value = node.named_widget_values->Find(spec.name);
          value != nullptr) {
        binding.value = *value;
      }
    } else if (cursor < node.widget_values.size()) {
      binding.value = node.widget_values[cursor++];
      if (spec.control_after_generate && cursor < node.widget_values.size() &&
          node.widget_values[cursor].IsString()) {
        ++cursor;
      }
    }
    bindings.push_back(std::move(binding));
  }
  return bindings;
}

} // namespace comfytest::workflow
