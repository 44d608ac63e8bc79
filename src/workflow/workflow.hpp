#pragma once

#include "core/json_dom.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace comfytest::workflow {

// litegraph node modes.
inline constexpr int kModeAlways = 0;
inline constexpr int kModeNever = 2;
inline constexpr int kModeBypass = 4;

struct InputSlot {
  std::string name;
  std::string type;
  std::optional<std::int64_t> link;
  // Set when the slot is a widget converted to an input.
  bool widget = false;
};

struct OutputSlot {
  std::string name;
  std::string type;
};

struct WorkflowNode {
  std::int64_t id = 0;
  std::string class_name;
  int mode = kModeAlways;
  // Positional widget values. Some extensions save them as an object keyed
  // by input name instead; that form lands in `named_widget_values`.
  std::vector<core::json::Value> widget_values;
  std::optional<core::json::Value> named_widget_values;
  std::vector<InputSlot> inputs;
  std::vector<OutputSlot> outputs;

  bool IsActive() const {
    return mode != kModeNever && mode != kModeBypass;
  }

  const InputSlot* FindInputSlot(std::string_view slot_name) const {
    for (const InputSlot& slot : inputs) {
      if (slot.name == slot_name) {
        return &slot;
      }
    }
    return nullptr;
  }
};

struct WorkflowLink {
  std::int64_t id = 0;
  std::int64_t from_node = 0;
  std::int64_t from_slot = 0;
  std::int64_t to_node = 0;
  std::int64_t to_slot = 0;
  std::string type = "*";
};

// A saved frontend graph (`workflows/<name>.json`).
struct Workflow {
  std::string name;
  std::filesystem::path path;
  std::vector<WorkflowNode> nodes;
  std::vector<WorkflowLink> links;
  // Entries that could not be read (malformed nodes or links); reported by
  // the graph check instead of failing the load.
  std::vector<std::string> load_issues;

  const WorkflowNode* FindNode(std::int64_t id) const;
  const WorkflowLink* FindLink(std::int64_t id) const;
  // Class names of every node that needs a host definition.
  std::set<std::string> ClassNames() const;
};

// Where a link's value comes from once reroutes are followed.
struct LinkSource {
  enum class Kind {
    kNode,
    // A PrimitiveNode: the value is stored as the target's widget value.
    kPrimitive,
    // Dangling link, missing node, or a reroute chain that ends nowhere.
    kMissing,
  };
  Kind kind = Kind::kMissing;
  std::int64_t node_id = 0;
  std::int64_t slot = 0;
};

LinkSource ResolveLinkSource(const Workflow& workflow, std::int64_t link_id);

// Frontend-only helpers that never reach the host (notes, reroutes,
// primitive value sources).
bool IsFrontendOnlyClass(std::string_view class_name);

bool ParseWorkflowText(std::string_view json_text, std::string name, Workflow& workflow,
                       std::string& error);
bool LoadWorkflowFile(const std::filesystem::path& path, Workflow& workflow, std::string& error);

} // namespace comfytest::workflow
