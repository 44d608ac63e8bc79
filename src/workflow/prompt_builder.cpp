#include "workflow/prompt_builder.hpp"

#include "workflow/widget_values.hpp"

#include <optional>

namespace comfytest::workflow {

namespace {

using JsonValue = core::json::Value;

JsonValue MakeLinkReference(const LinkSource& source) {
  JsonValue reference = JsonValue::MakeArray();
  reference.array_value.push_back(JsonValue::MakeString(std::to_string(source.node_id)));
  reference.array_value.push_back(JsonValue::MakeNumber(static_cast<double>(source.slot)));
  return reference;
}

} // namespace

bool BuildPrompt(const Workflow& workflow, const NodeDefinitionSet& definitions,
                 const std::set<std::int64_t>* subset, JsonValue& prompt, std::string& error) {
  std::set<std::int64_t> emitted;
  for (const WorkflowNode& node : workflow.nodes) {
    if (!node.IsActive() || IsFrontendOnlyClass(node.class_name)) {
      continue;
    }
    if (subset != nullptr && subset->count(node.id) == 0U) {
      continue;
    }
    if (definitions.find(node.class_name) == definitions.end()) {
      error = "node " + std::to_string(node.id) + " uses unknown class '" + node.class_name + "'";
      return false;
    }
    emitted.insert(node.id);
  }

  prompt = JsonValue::MakeObject();
  for (const WorkflowNode& node : workflow.nodes) {
    if (emitted.count(node.id) == 0U) {
      continue;
    }
    const NodeDefinition& definition = definitions.at(node.class_name);

    std::vector<WidgetBinding> bindings = BindWidgetValues(node, definition);
    auto take_widget_value = [&bindings](const InputSpec& spec) -> std::optional<JsonValue> {
      for (WidgetBinding& binding : bindings) {
        if (binding.spec == &spec) {
          return std::move(binding.value);
        }
      }
      return std::nullopt;
    };

    JsonValue inputs = JsonValue::MakeObject();
    for (const InputSpec& spec : definition.inputs) {
      std::optional<JsonValue> widget_value;
      if (spec.IsWidget()) {
        widget_value = take_widget_value(spec);
      }

      const InputSlot* slot = node.FindInputSlot(spec.name);
      if (slot != nullptr && slot->link.has_value()) {
        const LinkSource source = ResolveLinkSource(workflow, *slot->link);
        if (source.kind == LinkSource::Kind::kNode && emitted.count(source.node_id) != 0U) {
          inputs.object_value.emplace_back(spec.name, MakeLinkReference(source));
          continue;
        }
      }
      if (widget_value.has_value()) {
        inputs.object_value.emplace_back(spec.name, std::move(*widget_value));
      }
    }

    JsonValue entry = JsonValue::MakeObject();
    entry.object_value.emplace_back("class_type", JsonValue::MakeString(node.class_name));
    entry.object_value.emplace_back("inputs", std::move(inputs));
    prompt.object_value.emplace_back(std::to_string(node.id), std::move(entry));
  }
  return true;
}

} // namespace comfytest::workflow
