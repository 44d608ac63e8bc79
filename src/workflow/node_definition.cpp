#include "workflow/node_definition.hpp"

#include <algorithm>
#include <cctype>

namespace comfytest::workflow {

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
    return "number";
  case JsonValue::Type::kBool:
    return "bool";
  case JsonValue::Type::kNull:
    return "null";
  }
  return "null";
}

bool IsTruthy(const JsonValue* value) {
  if (value == nullptr) {
    return false;
  }
  if (value->IsBool()) {
    return value->bool_value;
  }
  if (value->IsNumber()) {
    return value->number_value != 0.0;
  }
  if (value->IsString()) {
    return !value->string_value.empty();
  }
  return !value->IsNull();
}

std::optional<InputKind> WidgetKindFor(std::string_view type_name) {
  if (type_name == "INT") {
    return InputKind::kInt;
  }
  if (type_name == "FLOAT") {
    return InputKind::kFloat;
  }
  if (type_name == "STRING") {
    return InputKind::kString;
  }
  if (type_name == "BOOLEAN") {
    return InputKind::kBoolean;
  }
  return std::nullopt;
}

void ParseInputSection(const JsonValue& section, bool required, const std::string& section_name,
                       NodeDefinition& definition) {
  for (const auto& [input_name, declaration] : section.object_value) {
    const std::string label = "input '" + input_name + "'";
    if (!declaration.IsArray() || declaration.array_value.empty()) {
      definition.shape_issues.push_back(label + " in '" + section_name +
                                        "' must be declared as [type, options?], got " +
                                        JsonTypeName(declaration));
      continue;
    }

    InputSpec spec;
    spec.name = input_name;
    spec.required = required;

    const JsonValue& type_value = declaration.array_value.front();
    const JsonValue* options =
        declaration.array_value.size() > 1U && declaration.array_value[1].IsObject()
            ? &declaration.array_value[1]
            : nullptr;
    auto option = [options](std::string_view key) -> const JsonValue* {
      return options != nullptr ? options->Find(key) : nullptr;
    };

    if (type_value.IsArray()) {
      spec.kind = InputKind::kEnum;
      spec.type_name = "COMBO";
      spec.enum_values = type_value.array_value;
    } else if (type_value.IsString()) {
      spec.type_name = type_value.string_value;
      if (spec.type_name == "COMBO") {
        // Newer declaration style: ["COMBO", {"options": [...]}].
        spec.kind = InputKind::kEnum;
        if (const JsonValue* values = option("options"); values != nullptr && values->IsArray()) {
          spec.enum_values = values->array_value;
        }
      } else if (const auto widget_kind = WidgetKindFor(spec.type_name);
                 widget_kind.has_value() && !IsTruthy(option("forceInput"))) {
        spec.kind = *widget_kind;
      } else {
        spec.kind = InputKind::kConnection;
      }
    } else {
      definition.shape_issues.push_back(label + " has a type of kind " +
                                        std::string(JsonTypeName(type_value)) +
                                        " (expected a type name or a list of choices)");
      continue;
    }

    if (const JsonValue* min = option("min"); min != nullptr && min->IsNumber()) {
      spec.min = min->number_value;
    }
    if (const JsonValue* max = option("max"); max != nullptr && max->IsNumber()) {
      spec.max = max->number_value;
    }
    spec.has_default = option("default") != nullptr;
    spec.upload = IsTruthy(option("image_upload")) || IsTruthy(option("file_upload"));
    spec.control_after_generate =
        spec.kind == InputKind::kInt &&
        (IsTruthy(option("control_after_generate")) || input_name == "seed" ||
         input_name == "noise_seed");

    definition.inputs.push_back(std::move(spec));
  }
}

void ParseInputs(const JsonValue& entry, NodeDefinition& definition) {
  const JsonValue* input = entry.Find("input");
  if (input == nullptr) {
    return;
  }
  if (!input->IsObject()) {
    definition.shape_issues.push_back("INPUT_TYPES returned invalid type: " +
                                      std::string(JsonTypeName(*input)));
    return;
  }

  for (const std::string_view section_name : {"required", "optional"}) {
    const JsonValue* section = input->Find(section_name);
    if (section == nullptr || section->IsNull()) {
      continue;
    }
    if (!section->IsObject()) {
      definition.shape_issues.push_back("INPUT_TYPES '" + std::string(section_name) +
                                        "' is not a dict");
      continue;
    }
    ParseInputSection(*section, section_name == "required", std::string(section_name),
                      definition);
  }
}

void ParseOutputs(const JsonValue& entry, NodeDefinition& definition) {
  if (const JsonValue* output = entry.Find("output"); output != nullptr) {
    if (!output->IsArray()) {
      definition.shape_issues.push_back("RETURN_TYPES is not a list: " +
                                        std::string(JsonTypeName(*output)));
    } else {
      for (const JsonValue& item : output->array_value) {
        // A list here is a combo output.
        definition.outputs.push_back(item.IsString() ? item.string_value : "COMBO");
      }
    }
  }

  if (const JsonValue* names = entry.Find("output_name"); names != nullptr) {
    if (!names->IsArray()) {
      definition.shape_issues.push_back("RETURN_NAMES is not a list: " +
                                        std::string(JsonTypeName(*names)));
    } else {
      for (const JsonValue& item : names->array_value) {
        definition.output_names.push_back(item.IsString() ? item.string_value : "");
      }
    }
  }

  if (!definition.output_names.empty() &&
      definition.outputs.size() != definition.output_names.size()) {
    definition.shape_issues.push_back(
        "RETURN_TYPES (" + std::to_string(definition.outputs.size()) +
        ") doesn't match RETURN_NAMES (" + std::to_string(definition.output_names.size()) + ")");
  }
}

std::string FoldModuleName(std::string_view raw) {
  std::string folded;
  folded.reserve(raw.size());
  for (const char c : raw) {
    folded.push_back(c == '-' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return folded;
}

} // namespace

const char* ToString(InputKind kind) {
  switch (kind) {
  case InputKind::kInt:
    return "INT";
  case InputKind::kFloat:
    return "FLOAT";
  case InputKind::kString:
    return "STRING";
  case InputKind::kBoolean:
    return "BOOLEAN";
  case InputKind::kEnum:
    return "COMBO";
  case InputKind::kConnection:
    return "connection";
  }
  return "connection";
}

const InputSpec* NodeDefinition::FindInput(std::string_view input_name) const {
  for (const InputSpec& spec : inputs) {
    if (spec.name == input_name) {
      return &spec;
    }
  }
  return nullptr;
}

NodeDefinition ParseNodeDefinition(const std::string& class_name, const JsonValue& entry) {
  NodeDefinition definition;
  definition.class_name = class_name;
  if (!entry.IsObject()) {
    definition.shape_issues.push_back("declaration is a " + std::string(JsonTypeName(entry)) +
                                      ", expected an object");
    return definition;
  }

  if (const JsonValue* display = entry.Find("display_name"); display != nullptr && display->IsString()) {
    definition.display_name = display->string_value;
  }
  if (const JsonValue* category = entry.Find("category"); category != nullptr && category->IsString()) {
    definition.category = category->string_value;
  }
  if (const JsonValue* module = entry.Find("python_module"); module != nullptr && module->IsString()) {
    definition.python_module = module->string_value;
  }
  definition.is_output_node = IsTruthy(entry.Find("output_node"));

  ParseInputs(entry, definition);
  ParseOutputs(entry, definition);

  const JsonValue* function = entry.Find("function");
  if (function == nullptr) {
    function = entry.Find("name");
  }
  if (function != nullptr && function->IsString() && !function->string_value.empty()) {
    definition.entry_point = function->string_value;
  } else {
    definition.shape_issues.push_back("Node has no FUNCTION defined");
  }

  return definition;
}

bool ParseObjectInfo(const JsonValue& root, NodeDefinitionSet& definitions, std::string& error) {
  if (!root.IsObject()) {
    error = "object_info response must be a JSON object keyed by node class";
    return false;
  }
  definitions.clear();
  for (const auto& [class_name, entry] : root.object_value) {
    definitions[class_name] = ParseNodeDefinition(class_name, entry);
  }
  return true;
}

bool ParseObjectInfoText(std::string_view json_text, NodeDefinitionSet& definitions,
                         std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "invalid object_info JSON: " + error;
    return false;
  }
  return ParseObjectInfo(root, definitions, error);
}

std::vector<std::string> ExtensionClassNames(const NodeDefinitionSet& definitions,
                                             std::string_view extension_name) {
  const std::string package = "custom_nodes." + FoldModuleName(extension_name);
  std::vector<std::string> names;
  for (const auto& [class_name, definition] : definitions) {
    const std::string module = FoldModuleName(definition.python_module);
    if (module == package || module.rfind(package + ".", 0) == 0) {
      names.push_back(class_name);
    }
  }
  return names;
}

} // namespace comfytest::workflow
