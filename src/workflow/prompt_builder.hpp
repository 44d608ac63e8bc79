#pragma once

#include "core/json_dom.hpp"
#include "workflow/node_definition.hpp"
#include "workflow/workflow.hpp"

#include <cstdint>
#include <set>
#include <string>

namespace comfytest::workflow {

// Converts a frontend graph into the host's `/prompt` format:
// `{"<id>": {"class_type": ..., "inputs": {name: value | ["<src id>", slot]}}}`.
//
// Contract:
// - Only active nodes are emitted; when `subset` is given, only its members.
// - Links are followed through reroutes; a link from a primitive node takes
//   the target's own widget value; links from nodes outside the emitted set
//   are dropped (the input falls back to its widget value, if any).
// - Fails when an emitted node has no definition.
bool BuildPrompt(const Workflow& workflow, const NodeDefinitionSet& definitions,
                 const std::set<std::int64_t>* subset, core::json::Value& prompt,
                 std::string& error);

} // namespace comfytest::workflow
