#ifndef COMFYTEST_TESTS_COMMON_EXTENSION_FIXTURES_HPP_
#define COMFYTEST_TESTS_COMMON_EXTENSION_FIXTURES_HPP_

#include "assertions.hpp"

#include "config/project.hpp"
#include "config/run_config.hpp"
#include "core/fs_utils.hpp"
#include "workflow/discovery.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace comfytest::tests::common {

inline constexpr const char* kDemoExtensionName = "demo_nodes";

// `/object_info` for the demo extension plus one core class:
//   DemoLoader (STRING path -> IMAGE), DemoFlash (IMAGE -> IMAGE),
//   DemoSaver (IMAGE, output node), SaveImage (core, output node).
inline std::string DemoObjectInfoJson() {
  return R"({
  "DemoLoader": {
    "input": {"required": {"path": ["STRING", {"default": ""}]}},
    "output": ["IMAGE"],
    "output_name": ["image"],
    "name": "DemoLoader",
    "display_name": "Demo Loader",
    "category": "demo",
    "python_module": "custom_nodes.demo_nodes",
    "output_node": false
  },
  "DemoFlash": {
    "input": {"required": {"images": ["IMAGE"], "strength": ["FLOAT", {"default": 1.0, "min": 0.0, "max": 2.0}]}},
    "output": ["IMAGE"],
    "output_name": ["image"],
    "name": "DemoFlash",
    "category": "demo",
    "python_module": "custom_nodes.demo_nodes",
    "output_node": false
  },
  "DemoSaver": {
    "input": {"required": {"images": ["IMAGE"], "prefix": ["STRING", {"default": "demo"}]}},
    "output": [],
    "output_name": [],
    "name": "DemoSaver",
    "category": "demo",
    "python_module": "custom_nodes.demo_nodes",
    "output_node": true
  },
  "SaveImage": {
    "input": {"required": {"images": ["IMAGE"], "filename_prefix": ["STRING", {"default": "ComfyUI"}]}},
    "output": [],
    "output_name": [],
    "name": "SaveImage",
    "category": "image",
    "python_module": "nodes",
    "output_node": true
  }
})";
}

// Loader -> Saver, no GPU-only node.
inline std::string DemoBasicWorkflowJson() {
  return R"({
  "nodes": [
    {"id": 1, "type": "DemoLoader", "mode": 0, "inputs": [],
     "outputs": [{"name": "image", "type": "IMAGE", "links": [1]}],
     "widgets_values": ["input.png"]},
    {"id": 2, "type": "DemoSaver", "mode": 0,
     "inputs": [{"name": "images", "type": "IMAGE", "link": 1}],
     "outputs": [], "widgets_values": ["demo"]}
  ],
  "links": [[1, 1, 0, 2, 0, "IMAGE"]]
})";
}

// Loader -> Flash -> Saver, plus Loader -> SaveImage.
inline std::string DemoFlashWorkflowJson() {
  return R"({
  "nodes": [
    {"id": 1, "type": "DemoLoader", "mode": 0, "inputs": [],
     "outputs": [{"name": "image", "type": "IMAGE", "links": [1, 4]}],
     "widgets_values": ["input.png"]},
    {"id": 2, "type": "DemoFlash", "mode": 0,
     "inputs": [{"name": "images", "type": "IMAGE", "link": 1}],
     "outputs": [{"name": "image", "type": "IMAGE", "links": [2]}],
     "widgets_values": [1.0]},
    {"id": 3, "type": "DemoSaver", "mode": 0,
     "inputs": [{"name": "images", "type": "IMAGE", "link": 2}],
     "outputs": [], "widgets_values": ["flash"]},
    {"id": 4, "type": "SaveImage", "mode": 0,
     "inputs": [{"name": "images", "type": "IMAGE", "link": 4}],
     "outputs": [], "widgets_values": ["plain"]}
  ],
  "links": [[1, 1, 0, 2, 0, "IMAGE"], [2, 2, 0, 3, 0, "IMAGE"], [4, 1, 0, 4, 0, "IMAGE"]]
})";
}

// Minimal comfy-test.toml: linux only, pinned python. `extra` is TOML placed
// ahead of the `[platforms]` table, so it may hold top-level keys followed by
// tables of its own.
inline std::string DemoConfigToml(std::string_view extra = "",
                                  std::string_view platforms =
                                      "linux = true\nmacos = false\nwindows = false\nwindows_portable = false\n") {
  std::string toml = "name = \"demo-nodes\"\npython_version = \"3.12\"\n";
  if (!extra.empty()) {
    toml += extra;
    if (toml.back() != '\n') {
      toml += '\n';
    }
  }
  toml += "\n[platforms]\n";
  toml += platforms;
  return toml;
}

inline void WriteFileOrFail(const std::filesystem::path& path, std::string_view text) {
  std::string error;
  if (!core::WriteTextFileAtomic(path, text, error)) {
    Fail("failed to write fixture file: " + error);
  }
}

// `<root>/demo_nodes/` with a manifest, Python sources, `comfy-test.toml`,
// a comfy-env.toml declaring flash-attn, and `workflows/basic.json`.
inline std::filesystem::path CreateDemoExtension(const std::filesystem::path& root,
                                                 std::string_view config_toml) {
  const std::filesystem::path node_dir = root / kDemoExtensionName;
  WriteFileOrFail(node_dir / "pyproject.toml", "[project]\nname = \"demo-nodes\"\n");
  WriteFileOrFail(node_dir / "__init__.py",
                  "from .nodes import NODE_CLASS_MAPPINGS\n__all__ = [\"NODE_CLASS_MAPPINGS\"]\n");
  WriteFileOrFail(node_dir / "nodes.py", "class DemoLoader:\n    FUNCTION = \"load\"\n");
  WriteFileOrFail(node_dir / "comfy-env.toml", "[cuda]\npackages = [\"flash-attn\"]\n");
  WriteFileOrFail(node_dir / "comfy-test.toml", config_toml);
  WriteFileOrFail(node_dir / "workflows" / "basic.json", DemoBasicWorkflowJson());
  return node_dir;
}

struct DemoInputs {
  config::RunConfig config;
  config::Project project;
  workflow::WorkflowCatalog catalog;
};

// Loads what `comfy-test run` would load, failing the test on any issue.
inline void LoadDemoInputsOrFail(const std::filesystem::path& node_dir, DemoInputs& inputs) {
  config::ConfigReport report;
  std::string error;
  if (!config::LoadRunConfigFile(node_dir / "comfy-test.toml", {}, inputs.config, report, error)) {
    Fail("config load failed: " + error);
  }
  if (!report.valid) {
    Fail("fixture config invalid: " + report.issues.front().path + ": " +
         report.issues.front().message);
  }
  if (!config::LoadProject(node_dir, inputs.config, inputs.project, report, error) ||
      !workflow::DiscoverWorkflows(node_dir, inputs.config, inputs.catalog, report, error)) {
    Fail("project load failed: " + error);
  }
  if (!report.valid) {
    Fail("fixture project invalid: " + report.issues.front().path + ": " +
         report.issues.front().message);
  }
}

} // namespace comfytest::tests::common

#endif // COMFYTEST_TESTS_COMMON_EXTENSION_FIXTURES_HPP_
