#pragma once

#include "core/json_dom.hpp"
#include "workflow/node_definition.hpp"
#include "workflow/workflow.hpp"

#include <optional>
#include <vector>

namespace comfytest::workflow {

struct WidgetBinding {
  const InputSpec* spec = nullptr;
  // Unset when the saved node has fewer values than widgets (host defaults
  // apply).
  std::optional<core::json::Value> value;
};

// Pairs each widget input of `definition`, in declaration order, with the
// value saved on `node`. The frontend-only companion value that follows a
// seed widget ("randomize", "fixed", ...) is skipped.
std::vector<WidgetBinding> BindWidgetValues(const WorkflowNode& node,
                                            const NodeDefinition& definition);

} // namespace comfytest::workflow
