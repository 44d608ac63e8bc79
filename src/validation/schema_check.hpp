#pragma once

#include "report/run_report.hpp"
#include "workflow/node_definition.hpp"
#include "workflow/workflow.hpp"

#include <optional>
#include <string>
#include <vector>

namespace comfytest::validation {

// Checks one widget value against its input declaration. Returns the
// problem text, or nullopt when the value is acceptable.
std::optional<std::string> CheckWidgetValue(const workflow::InputSpec& spec,
                                            const core::json::Value& value);

// Schema sub-level: every saved widget value of every node with a known
// definition is checked for type, enum membership and numeric range.
// Unknown classes are left to the graph check. Widgets whose input slot is
// linked are not checked; the linked value wins at execution time.
std::vector<report::Diagnostic> CheckSchema(const workflow::Workflow& workflow,
                                            const workflow::NodeDefinitionSet& definitions);

} // namespace comfytest::validation
