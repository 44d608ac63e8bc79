#include "workflow/workflow.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <array>

namespace fs = std::filesystem;

namespace comfytest::workflow {

namespace {

using JsonValue = core::json::Value;

bool TryGetInteger(const JsonValue* value, std::int64_t& out) {
  if (value == nullptr || !value->IsInteger()) {
    return false;
  }
  out = static_cast<std::int64_t>(value->number_value);
  return true;
}

// Slot and link types are usually strings; anything else ("*" as a list,
// numeric ids from old saves) is treated as the wildcard.
std::string ReadType(const JsonValue* value) {
  if (value != nullptr && value->IsString() && !value->string_value.empty()) {
    return value->string_value;
  }
  return "*";
}

void ParseSlots(const JsonValue& node_value, WorkflowNode& node, std::vector<std::string>& issues) {
  if (const JsonValue* inputs = node_value.Find("inputs"); inputs != nullptr && inputs->IsArray()) {
    for (const JsonValue& item : inputs->array_value) {
      InputSlot slot;
      if (const JsonValue* name = item.Find("name"); name != nullptr && name->IsString()) {
        slot.name = name->string_value;
      }
      slot.type = ReadType(item.Find("type"));
      std::int64_t link = 0;
      if (TryGetInteger(item.Find("link"), link)) {
        slot.link = link;
      }
      slot.widget = item.Find("widget") != nullptr;
      node.inputs.push_back(std::move(slot));
    }
  }

  if (const JsonValue* outputs = node_value.Find("outputs"); outputs != nullptr) {
    if (!outputs->IsArray()) {
      issues.push_back("node " + std::to_string(node.id) + ": 'outputs' is not a list");
      return;
    }
    for (const JsonValue& item : outputs->array_value) {
      OutputSlot slot;
      if (const JsonValue* name = item.Find("name"); name != nullptr && name->IsString()) {
        slot.name = name->string_value;
      }
      slot.type = ReadType(item.Find("type"));
      node.outputs.push_back(std::move(slot));
    }
  }
}

bool ParseNode(const JsonValue& node_value, std::size_t index, WorkflowNode& node,
               std::vector<std::string>& issues) {
  const std::string label = "nodes[" + std::to_string(index) + "]";
  if (!node_value.IsObject()) {
    issues.push_back(label + ": node entry is not an object");
    return false;
  }
  if (!TryGetInteger(node_value.Find("id"), node.id)) {
    issues.push_back(label + ": missing integer 'id'");
    return false;
  }
  const JsonValue* type = node_value.Find("type");
  if (type == nullptr || !type->IsString() || type->string_value.empty()) {
    issues.push_back("node " + std::to_string(node.id) + ": missing node class 'type'");
    return false;
  }
  node.class_name = type->string_value;

  std::int64_t mode = kModeAlways;
  if (TryGetInteger(node_value.Find("mode"), mode)) {
    node.mode = static_cast<int>(mode);
  }

  if (const JsonValue* widgets = node_value.Find("widgets_values"); widgets != nullptr) {
    if (widgets->IsArray()) {
      node.widget_values = widgets->array_value;
    } else if (widgets->IsObject()) {
      node.named_widget_values = *widgets;
    }
  }

  ParseSlots(node_value, node, issues);
  return true;
}

// Links are saved either as [id, from, from_slot, to, to_slot, type] arrays
// or as objects with origin_/target_ keys.
bool ParseLink(const JsonValue& link_value, std::size_t index, WorkflowLink& link,
               std::vector<std::string>& issues) {
  const std::string label = "links[" + std::to_string(index) + "]";
  if (link_value.IsArray()) {
    const auto& items = link_value.array_value;
    if (items.size() < 5U || !TryGetInteger(&items[0], link.id) ||
        !TryGetInteger(&items[1], link.from_node) || !TryGetInteger(&items[2], link.from_slot) ||
        !TryGetInteger(&items[3], link.to_node) || !TryGetInteger(&items[4], link.to_slot)) {
      issues.push_back(label + ": malformed link (expected [id, from, from_slot, to, to_slot, type])");
      return false;
    }
    link.type = ReadType(items.size() > 5U ? &items[5] : nullptr);
    return true;
  }
  if (link_value.IsObject()) {
    if (!TryGetInteger(link_value.Find("id"), link.id) ||
        !TryGetInteger(link_value.Find("origin_id"), link.from_node) ||
        !TryGetInteger(link_value.Find("origin_slot"), link.from_slot) ||
        !TryGetInteger(link_value.Find("target_id"), link.to_node) ||
        !TryGetInteger(link_value.Find("target_slot"), link.to_slot)) {
      issues.push_back(label + ": malformed link object");
      return false;
    }
    link.type = ReadType(link_value.Find("type"));
    return true;
  }
  issues.push_back(label + ": link entry is neither a list nor an object");
  return false;
}

} // namespace

const WorkflowNode* Workflow::FindNode(std::int64_t id) const {
  const auto it = std::find_if(nodes.begin(), nodes.end(),
                               [id](const WorkflowNode& node) { return node.id == id; });
  return it == nodes.end() ? nullptr : &*it;
}

const WorkflowLink* Workflow::FindLink(std::int64_t id) const {
  const auto it = std::find_if(links.begin(), links.end(),
                               [id](const WorkflowLink& link) { return link.id == id; });
  return it == links.end() ? nullptr : &*it;
}

std::set<std::string> Workflow::ClassNames() const {
  std::set<std::string> names;
  for (const WorkflowNode& node : nodes) {
    if (!IsFrontendOnlyClass(node.class_name)) {
      names.insert(node.class_name);
    }
  }
  return names;
}

LinkSource ResolveLinkSource(const Workflow& workflow, std::int64_t link_id) {
  constexpr int kMaxRerouteHops = 64;
  for (int hop = 0; hop < kMaxRerouteHops; ++hop) {
    const WorkflowLink* link = workflow.FindLink(link_id);
    if (link == nullptr) {
      return {};
    }
    const WorkflowNode* source = workflow.FindNode(link->from_node);
    if (source == nullptr) {
      return {};
    }
    if (source->class_name == "PrimitiveNode") {
      return {.kind = LinkSource::Kind::kPrimitive, .node_id = source->id, .slot = 0};
    }
    if (source->class_name != "Reroute") {
      return {.kind = LinkSource::Kind::kNode, .node_id = source->id, .slot = link->from_slot};
    }
    if (source->inputs.empty() || !source->inputs.front().link.has_value()) {
      return {};
    }
    link_id = *source->inputs.front().link;
  }
  return {};
}

bool IsFrontendOnlyClass(std::string_view class_name) {
  static constexpr std::array<std::string_view, 4> kFrontendOnly = {"Note", "MarkdownNote",
                                                                    "Reroute", "PrimitiveNode"};
  return std::find(kFrontendOnly.begin(), kFrontendOnly.end(), class_name) != kFrontendOnly.end();
}

bool ParseWorkflowText(std::string_view json_text, std::string name, Workflow& workflow,
                       std::string& error) {
  workflow = Workflow{};
  workflow.name = std::move(name);

  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "workflow '" + workflow.name + "' is not valid JSON: " + error;
    return false;
  }
  if (!root.IsObject()) {
    error = "workflow '" + workflow.name + "' must be a JSON object";
    return false;
  }
  const JsonValue* nodes = root.Find("nodes");
  if (nodes == nullptr || !nodes->IsArray()) {
    error = "workflow '" + workflow.name +
            "' has no 'nodes' list (only frontend-saved workflows are supported)";
    return false;
  }

  for (std::size_t i = 0; i < nodes->array_value.size(); ++i) {
    WorkflowNode node;
    if (ParseNode(nodes->array_value[i], i, node, workflow.load_issues)) {
      workflow.nodes.push_back(std::move(node));
    }
  }

  if (const JsonValue* links = root.Find("links"); links != nullptr) {
    if (!links->IsArray()) {
      workflow.load_issues.push_back("'links' is not a list");
    } else {
      for (std::size_t i = 0; i < links->array_value.size(); ++i) {
        WorkflowLink link;
        if (ParseLink(links->array_value[i], i, link, workflow.load_issues)) {
          workflow.links.push_back(std::move(link));
        }
      }
    }
  }
  return true;
}

bool LoadWorkflowFile(const fs::path& path, Workflow& workflow, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParseWorkflowText(text, path.filename().string(), workflow, error)) {
    return false;
  }
  workflow.path = path;
  return true;
}

} // namespace comfytest::workflow
