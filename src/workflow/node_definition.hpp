#pragma once

#include "core/json_dom.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace comfytest::workflow {

// How an input is fed: a widget value stored in the workflow, or a link.
enum class InputKind {
  kInt,
  kFloat,
  kString,
  kBoolean,
  kEnum,
  kConnection,
};

const char* ToString(InputKind kind);

struct InputSpec {
  std::string name;
  bool required = true;
  InputKind kind = InputKind::kConnection;
  // Declared type; "COMBO" for enums.
  std::string type_name;
  std::vector<core::json::Value> enum_values;
  std::optional<double> min;
  std::optional<double> max;
  bool has_default = false;
  // image_upload / file_upload enums list server-side files; values are not
  // checked for membership.
  bool upload = false;
  // Seed-style INT widgets get an extra frontend-only widget value
  // ("randomize", "fixed", ...) right after them.
  bool control_after_generate = false;

  bool IsWidget() const {
    return kind != InputKind::kConnection;
  }
};

// Metadata for one node class as reported by the host application. Data
// only: the engine inspects declared schema and never dispatches on it.
struct NodeDefinition {
  std::string class_name;
  std::string display_name;
  std::string category;
  std::string python_module;
  bool is_output_node = false;

  // Required inputs first, then optional ones, each in declaration order.
  std::vector<InputSpec> inputs;
  std::vector<std::string> outputs;
  std::vector<std::string> output_names;
  // Python method name (`FUNCTION`), reported as `function` or `name`.
  std::string entry_point;

  // Well-formedness problems found while reading the host's declaration.
  // Never fatal while parsing; reported by the introspection check.
  std::vector<std::string> shape_issues;

  // Filled from the registration helper when it could inspect the class.
  std::vector<std::string> dependencies;
  std::optional<bool> entry_point_resolved;
  std::optional<int> return_arity;

  const InputSpec* FindInput(std::string_view input_name) const;
};

using NodeDefinitionSet = std::map<std::string, NodeDefinition>;

// Reads one `/object_info` entry. Always produces a definition; structural
// problems land in `shape_issues`.
NodeDefinition ParseNodeDefinition(const std::string& class_name, const core::json::Value& entry);

// Reads a whole `/object_info` response. Fails only when the root is not an
// object of class name -> entry.
bool ParseObjectInfo(const core::json::Value& root, NodeDefinitionSet& definitions,
                     std::string& error);
bool ParseObjectInfoText(std::string_view json_text, NodeDefinitionSet& definitions,
                         std::string& error);

// Classes registered by the extension (`python_module` names it as a custom
// node package).
std::vector<std::string> ExtensionClassNames(const NodeDefinitionSet& definitions,
                                             std::string_view extension_name);

} // namespace comfytest::workflow
