#include "validation/schema_check.hpp"

#include "core/json_utils.hpp"
#include "workflow/widget_values.hpp"

#include <algorithm>

namespace comfytest::validation {

namespace {

using JsonValue = core::json::Value;

const char* JsonTypeName(const JsonValue& value) {
  switch (value.type) {
  case JsonValue::Type::kObject:
    return "object";
  case JsonValue::Type::kArray:
    return "list";
  case JsonValue::Type::kString:
    return "string";
  case JsonValue::Type::kNumber:
    return value.IsInteger() ? "int" : "float";
  case JsonValue::Type::kBool:
    return "bool";
  case JsonValue::Type::kNull:
    return "null";
  }
  return "null";
}

bool SameScalar(const JsonValue& lhs, const JsonValue& rhs) {
  if (lhs.type != rhs.type) {
    return false;
  }
  switch (lhs.type) {
  case JsonValue::Type::kString:
    return lhs.string_value == rhs.string_value;
  case JsonValue::Type::kNumber:
    return lhs.number_value == rhs.number_value;
  case JsonValue::Type::kBool:
    return lhs.bool_value == rhs.bool_value;
  case JsonValue::Type::kNull:
    return true;
  default:
    return core::SerializeJson(lhs) == core::SerializeJson(rhs);
  }
}

std::optional<std::string> CheckRange(const workflow::InputSpec& spec, double number) {
  if (spec.min.has_value() && number < *spec.min) {
    return core::FormatJsonNumber(number) + " < minimum " + core::FormatJsonNumber(*spec.min);
  }
  if (spec.max.has_value() && number > *spec.max) {
    return core::FormatJsonNumber(number) + " > maximum " + core::FormatJsonNumber(*spec.max);
  }
  return std::nullopt;
}

std::string DescribeAllowed(const std::vector<JsonValue>& values) {
  constexpr std::size_t kMaxListed = 8;
  std::string text = "[";
  for (std::size_t i = 0; i < values.size() && i < kMaxListed; ++i) {
    if (i > 0U) {
      text += ", ";
    }
    text += core::SerializeJson(values[i]);
  }
  if (values.size() > kMaxListed) {
    text += ", ... " + std::to_string(values.size() - kMaxListed) + " more";
  }
  return text + "]";
}

} // namespace

std::optional<std::string> CheckWidgetValue(const workflow::InputSpec& spec,
                                            const JsonValue& value) {
  switch (spec.kind) {
  case workflow::InputKind::kEnum: {
    if (spec.upload || spec.enum_values.empty()) {
      return std::nullopt;
    }
    const bool allowed =
        std::any_of(spec.enum_values.begin(), spec.enum_values.end(),
                    [&value](const JsonValue& option) { return SameScalar(option, value); });
    if (!allowed) {
      return core::SerializeJson(value) + " not in allowed values " +
             DescribeAllowed(spec.enum_values);
    }
    return std::nullopt;
  }
  case workflow::InputKind::kInt:
  case workflow::InputKind::kFloat:
    if (!value.IsNumber()) {
      return std::string("expected ") + (spec.kind == workflow::InputKind::kInt ? "INT" : "FLOAT") +
             ", got " + JsonTypeName(value);
    }
    return CheckRange(spec, value.number_value);
  case workflow::InputKind::kString:
    if (!value.IsString()) {
      return std::string("expected STRING, got ") + JsonTypeName(value);
    }
    return std::nullopt;
  case workflow::InputKind::kBoolean:
    if (!value.IsBool()) {
      return std::string("expected BOOLEAN, got ") + JsonTypeName(value);
    }
    return std::nullopt;
  case workflow::InputKind::kConnection:
    return std::nullopt;
  }
  return std::nullopt;
}

std::vector<report::Diagnostic> CheckSchema(const workflow::Workflow& workflow,
                                            const workflow::NodeDefinitionSet& definitions) {
  std::vector<report::Diagnostic> diagnostics;
  for (const workflow::WorkflowNode& node : workflow.nodes) {
    if (workflow::IsFrontendOnlyClass(node.class_name)) {
      continue;
    }
    const auto found = definitions.find(node.class_name);
    if (found == definitions.end()) {
      continue;
    }

    for (const workflow::WidgetBinding& binding :
         workflow::BindWidgetValues(node, found->second)) {
      if (!binding.value.has_value()) {
        continue;
      }
      const workflow::InputSlot* slot = node.FindInputSlot(binding.spec->name);
      if (slot != nullptr && slot->link.has_value()) {
        continue;
      }
      if (auto problem = CheckWidgetValue(*binding.spec, *binding.value); problem.has_value()) {
        diagnostics.push_back({.node_id = node.id,
                               .node_class = node.class_name,
                               .field = binding.spec->name,
                               .message = std::move(*problem)});
      }
    }
  }
  return diagnostics;
}

} // namespace comfytest::validation
