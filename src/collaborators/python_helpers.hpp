#pragma once

#include "core/json_dom.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace comfytest::collaborators {

// Helper sources written next to each platform's workspace and run with the
// isolated interpreter. Each prints exactly one JSON object as its last line.
inline constexpr const char* kSiteCustomizeFileName = "sitecustomize.py";
inline constexpr const char* kInspectScriptFileName = "inspect_nodes.py";
inline constexpr const char* kInstantiateScriptFileName = "instantiate_nodes.py";

// Comma-separated module names replaced by empty stand-ins at interpreter
// start, so extensions importing GPU-only packages still load on CPU hosts.
inline constexpr const char* kMockPackagesEnvName = "COMFY_TEST_MOCK_PACKAGES";

// Writes the helper scripts into `dir` (created if missing).
bool WriteHelperScripts(const std::filesystem::path& dir, std::string& error);

// Parses the last line of `output` that starts with '{'.
bool ParseHelperOutput(std::string_view output, core::json::Value& root, std::string& error);

} // namespace comfytest::collaborators
