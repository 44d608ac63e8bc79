#include "config/run_config.hpp"

#include "config/toml_document.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <random>
#include <set>

namespace fs = std::filesystem;

namespace comfytest::config {

namespace {

using JsonValue = core::json::Value;

constexpr std::array<std::string_view, 14> kTopLevelKeys = {
    "name",      "comfyui_version", "python_version", "levels",           "timeout",
    "platforms", "linux",           "macos",          "windows",          "windows_portable",
    "workflows", "server",          "screenshot",     "policies",
};

void AddIssue(ConfigReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool IsKnownTopLevelKey(std::string_view key) {
  return std::find(kTopLevelKeys.begin(), kTopLevelKeys.end(), key) != kTopLevelKeys.end();
}

bool TryGetPositiveInteger(const JsonValue& value, std::uint64_t max, std::uint64_t& out) {
  if (!value.IsInteger() || value.number_value <= 0.0) {
    return false;
  }
  if (value.number_value > static_cast<double>(max)) {
    return false;
  }
  out = static_cast<std::uint64_t>(value.number_value);
  return true;
}

void ReadString(const JsonValue& root, std::string_view key, std::string path,
                std::string& out, ConfigReport& report) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr) {
    return;
  }
  if (!field->IsString()) {
    AddIssue(report, std::move(path), "must be a string");
    return;
  }
  if (field->string_value.empty()) {
    AddIssue(report, std::move(path), "must not be empty");
    return;
  }
  out = field->string_value;
}

void ReadBool(const JsonValue& root, std::string_view key, const std::string& path, bool& out,
              ConfigReport& report) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr) {
    return;
  }
  if (!field->IsBool()) {
    AddIssue(report, path, "must be a boolean");
    return;
  }
  out = field->bool_value;
}

void ReadSeconds(const JsonValue& root, std::string_view key, const std::string& path,
                 std::chrono::seconds& out, ConfigReport& report) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr) {
    return;
  }
  std::uint64_t seconds = 0;
  if (!TryGetPositiveInteger(*field, 7U * 24U * 3600U, seconds)) {
    AddIssue(report, path, "must be a positive integer number of seconds (at most one week)");
    return;
  }
  out = std::chrono::seconds(static_cast<std::int64_t>(seconds));
}

void ReadPythonVersion(const JsonValue& root, RunConfig& config, ConfigReport& report) {
  const JsonValue* field = root.Find("python_version");
  if (field == nullptr) {
    return;
  }
  if (!field->IsString()) {
    AddIssue(report, "python_version", "must be a string");
    return;
  }
  const auto allowed = std::find(kAllowedPythonVersions.begin(), kAllowedPythonVersions.end(),
                                 field->string_value);
  if (allowed == kAllowedPythonVersions.end()) {
    AddIssue(report, "python_version", "must be one of: 3.10, 3.11, 3.12, 3.13");
    return;
  }
  config.python_version = field->string_value;
  config.python_version_defaulted = false;
}

void ReadLevels(const JsonValue& root, RunConfig& config, ConfigReport& report) {
  const JsonValue* field = root.Find("levels");
  if (field == nullptr) {
    return;
  }
  if (field->IsString()) {
    if (field->string_value != "all") {
      AddIssue(report, "levels", "must be \"all\" or a list of level names");
    }
    return;
  }
  if (!field->IsArray()) {
    AddIssue(report, "levels", "must be \"all\" or a list of level names");
    return;
  }
  if (field->array_value.empty()) {
    AddIssue(report, "levels", "must name at least one level");
    return;
  }

  std::array<bool, kLevelCount> selected{};
  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& item = field->array_value[i];
    const std::string path = "levels[" + std::to_string(i) + "]";
    Level level = Level::kSyntax;
    if (!item.IsString() || !ParseLevel(item.string_value, level)) {
      AddIssue(report, path, "must be one of: " + ExpectedLevelList());
      continue;
    }
    if (selected[ToIndex(level)]) {
      AddIssue(report, path, "duplicate level '" + item.string_value + "'");
      continue;
    }
    selected[ToIndex(level)] = true;
  }

  config.levels.clear();
  for (const Level level : kAllLevels) {
    if (selected[ToIndex(level)]) {
      config.levels.push_back(level);
    }
  }
}

void ReadPlatformToggles(const JsonValue& root, RunConfig& config, ConfigReport& report) {
  const JsonValue* platforms = root.Find("platforms");
  if (platforms == nullptr) {
    return;
  }
  if (!platforms->IsObject()) {
    AddIssue(report, "platforms", "must be a table of platform name = boolean");
    return;
  }
  for (const auto& [key, value] : platforms->object_value) {
    PlatformId id = PlatformId::kLinux;
    if (!ParsePlatformId(key, id)) {
      AddIssue(report, "platforms." + key, "unknown platform (expected " +
                                               ExpectedPlatformList() + ")");
      continue;
    }
    if (!value.IsBool()) {
      AddIssue(report, "platforms." + key, "must be a boolean");
      continue;
    }
    config.Platform(id).enabled = value.bool_value;
  }
}

// Per-platform sections override the `platforms` toggle table.
void ReadPlatformSection(const JsonValue& root, PlatformId id, RunConfig& config,
                         ConfigReport& report) {
  const std::string key = ToString(id);
  const JsonValue* section = root.Find(key);
  if (section == nullptr) {
    return;
  }
  if (!section->IsObject()) {
    AddIssue(report, key, "must be a table");
    return;
  }

  PlatformSettings& settings = config.Platform(id);
  for (const auto& member : section->object_value) {
    const std::string& field_key = member.first;
    const std::string path = key + "." + field_key;
    if (field_key == "enabled") {
      ReadBool(*section, "enabled", path, settings.enabled, report);
    } else if (field_key == "skip_workflow") {
      ReadBool(*section, "skip_workflow", path, settings.skip_workflow, report);
    } else if (field_key == "comfyui_portable_version" && id == PlatformId::kWindowsPortable) {
      ReadString(*section, "comfyui_portable_version", path, settings.portable_version, report);
    } else {
      AddIssue(report, path, "unknown key");
    }
  }
}

bool IsPlainJsonFileName(std::string_view name) {
  if (name.size() <= 5U || name.substr(name.size() - 5U) != ".json") {
    return false;
  }
  return name.find('/') == std::string_view::npos && name.find('\\') == std::string_view::npos &&
         name != ".." && name != ".";
}

void ReadWorkflowSelection(const JsonValue& workflows, std::string_view key,
                           WorkflowSelection& selection, ConfigReport& report) {
  const JsonValue* field = workflows.Find(key);
  if (field == nullptr) {
    return;
  }
  const std::string path = "workflows." + std::string(key);
  if (field->IsString()) {
    if (field->string_value != "all") {
      AddIssue(report, path, "must be \"all\" or a list of workflow file names");
      return;
    }
    selection = WorkflowSelection{.all = true, .files = {}};
    return;
  }
  if (!field->IsArray()) {
    AddIssue(report, path, "must be \"all\" or a list of workflow file names");
    return;
  }

  selection = WorkflowSelection{};
  std::set<std::string> seen;
  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& item = field->array_value[i];
    const std::string item_path = path + "[" + std::to_string(i) + "]";
    if (!item.IsString() || !IsPlainJsonFileName(item.string_value)) {
      AddIssue(report, item_path, "must be a .json file name inside workflows/");
      continue;
    }
    if (!seen.insert(item.string_value).second) {
      AddIssue(report, item_path, "duplicate workflow '" + item.string_value + "'");
      continue;
    }
    selection.files.push_back(item.string_value);
  }
}

void ReadWorkflows(const JsonValue& root, RunConfig& config, ConfigReport& report) {
  const JsonValue* workflows = root.Find("workflows");
  if (workflows == nullptr) {
    return;
  }
  if (!workflows->IsObject()) {
    AddIssue(report, "workflows", "must be a table");
    return;
  }

  for (const auto& member : workflows->object_value) {
    const std::string& key = member.first;
    if (key != "cpu" && key != "gpu" && key != "concurrency" && key != "partial_timeout") {
      AddIssue(report, "workflows." + key, "unknown key");
    }
  }

  ReadWorkflowSelection(*workflows, "cpu", config.cpu_workflows, report);
  ReadWorkflowSelection(*workflows, "gpu", config.gpu_workflows, report);
  ReadSeconds(*workflows, "partial_timeout", "workflows.partial_timeout", config.partial_timeout,
              report);

  if (const JsonValue* concurrency = workflows->Find("concurrency"); concurrency != nullptr) {
    std::uint64_t parsed = 0;
    if (!TryGetPositiveInteger(*concurrency, 64U, parsed)) {
      AddIssue(report, "workflows.concurrency", "must be an integer between 1 and 64");
    } else {
      config.workflow_concurrency = static_cast<std::size_t>(parsed);
    }
  }
}

void ReadServer(const JsonValue& root, RunConfig& config, ConfigReport& report) {
  const JsonValue* server = root.Find("server");
  if (server == nullptr) {
    return;
  }
  if (!server->IsObject()) {
    AddIssue(report, "server", "must be a table");
    return;
  }
  const JsonValue* port = server->Find("port");
  if (port == nullptr) {
    return;
  }
  // Each platform takes port + index, so leave room for all of them.
  std::uint64_t parsed = 0;
  const std::uint64_t max_port = std::numeric_limits<std::uint16_t>::max() - kPlatformCount + 1U;
  if (!TryGetPositiveInteger(*port, max_port, parsed) || parsed < 1024U) {
    AddIssue(report, "server.port",
             "must be an integer between 1024 and " + std::to_string(max_port));
    return;
  }
  config.server_port = static_cast<std::uint16_t>(parsed);
}

void ReadScreenshot(const JsonValue& root, RunConfig& config, ConfigReport& report) {
  const JsonValue* screenshot = root.Find("screenshot");
  if (screenshot == nullptr) {
    return;
  }
  if (!screenshot->IsObject()) {
    AddIssue(report, "screenshot", "must be a table");
    return;
  }
  const JsonValue* command = screenshot->Find("command");
  if (command == nullptr) {
    return;
  }
  if (!command->IsArray() || command->array_value.empty()) {
    AddIssue(report, "screenshot.command", "must be a non-empty list of argv strings");
    return;
  }
  std::vector<std::string> argv;
  for (std::size_t i = 0; i < command->array_value.size(); ++i) {
    const JsonValue& item = command->array_value[i];
    if (!item.IsString()) {
      AddIssue(report, "screenshot.command[" + std::to_string(i) + "]", "must be a string");
      return;
    }
    argv.push_back(item.string_value);
  }
  config.screenshot_command = std::move(argv);
}

void ReadPolicies(const JsonValue& root, RunConfig& config, ConfigReport& report) {
  const JsonValue* policies = root.Find("policies");
  if (policies == nullptr) {
    return;
  }
  if (!policies->IsObject()) {
    AddIssue(report, "policies", "must be a table");
    return;
  }

  if (const JsonValue* dual = policies->Find("dual_assignment"); dual != nullptr) {
    const std::string value = dual->IsString() ? dual->string_value : "";
    if (value == "gpu") {
      config.dual_assignment = DualAssignmentPolicy::kGpu;
    } else if (value == "cpu") {
      config.dual_assignment = DualAssignmentPolicy::kCpu;
    } else if (value == "both") {
      config.dual_assignment = DualAssignmentPolicy::kBoth;
    } else {
      AddIssue(report, "policies.dual_assignment", "must be one of: gpu, cpu, both");
    }
  }

  if (const JsonValue* failures = policies->Find("instantiation_failures"); failures != nullptr) {
    const std::string value = failures->IsString() ? failures->string_value : "";
    if (value == "validate_all") {
      config.instantiation_failures = InstantiationFailurePolicy::kValidateAll;
    } else if (value == "surviving_only") {
      config.instantiation_failures = InstantiationFailurePolicy::kSurvivingOnly;
    } else {
      AddIssue(report, "policies.instantiation_failures",
               "must be one of: validate_all, surviving_only");
    }
  }
}

} // namespace

const char* ToString(PlatformId platform) {
  switch (platform) {
  case PlatformId::kLinux:
    return "linux";
  case PlatformId::kMacos:
    return "macos";
  case PlatformId::kWindows:
    return "windows";
  case PlatformId::kWindowsPortable:
    return "windows_portable";
  }
  return "linux";
}

bool ParsePlatformId(std::string_view raw, PlatformId& platform) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return c == '-' ? '_' : static_cast<char>(std::tolower(c));
  });
  for (const PlatformId candidate : kAllPlatforms) {
    if (normalized == ToString(candidate)) {
      platform = candidate;
      return true;
    }
  }
  return false;
}

std::string ExpectedPlatformList() {
  return "linux|macos|windows|windows_portable";
}

const char* ToString(RunnerClass runner) {
  return runner == RunnerClass::kGpu ? "gpu" : "cpu";
}

const char* ToString(DualAssignmentPolicy policy) {
  switch (policy) {
  case DualAssignmentPolicy::kGpu:
    return "gpu";
  case DualAssignmentPolicy::kCpu:
    return "cpu";
  case DualAssignmentPolicy::kBoth:
    return "both";
  }
  return "gpu";
}

const char* ToString(InstantiationFailurePolicy policy) {
  return policy == InstantiationFailurePolicy::kSurvivingOnly ? "surviving_only"
                                                                : "validate_all";
}

std::string ChoosePythonVersion(std::uint32_t seed) {
  std::mt19937 engine(seed);
  std::uniform_int_distribution<std::size_t> pick(0, kAllowedPythonVersions.size() - 1U);
  return std::string(kAllowedPythonVersions[pick(engine)]);
}

bool ParseRunConfigText(std::string_view toml_text, const ParseOptions& options,
                        RunConfig& config, ConfigReport& report, std::string& error) {
  error.clear();
  report = ConfigReport{};
  config = RunConfig{};

  JsonValue root;
  std::string parse_error;
  if (!ParseTomlDocument(toml_text, kConfigFileName, root, parse_error)) {
    AddIssue(report, "$", "invalid TOML: " + parse_error);
    return true;
  }

  for (const auto& member : root.object_value) {
    if (!IsKnownTopLevelKey(member.first)) {
      AddIssue(report, member.first, "unknown key");
    }
  }

  ReadString(root, "name", "name", config.name, report);
  ReadString(root, "comfyui_version", "comfyui_version", config.comfyui_version, report);
  ReadPythonVersion(root, config, report);
  ReadLevels(root, config, report);
  ReadSeconds(root, "timeout", "timeout", config.timeout, report);
  ReadPlatformToggles(root, config, report);
  for (const PlatformId id : kAllPlatforms) {
    ReadPlatformSection(root, id, config, report);
  }
  ReadWorkflows(root, config, report);
  ReadServer(root, config, report);
  ReadScreenshot(root, config, report);
  ReadPolicies(root, config, report);

  if (config.python_version.empty()) {
    const std::uint32_t seed =
        options.python_seed.has_value() ? *options.python_seed : std::random_device{}();
    config.python_version = ChoosePythonVersion(seed);
    config.python_version_defaulted = true;
  }

  report.valid = report.issues.empty();
  return true;
}

bool LoadRunConfigFile(const fs::path& path, const ParseOptions& options, RunConfig& config,
                       ConfigReport& report, std::string& error) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "config file not found: " + path.string() + " (run 'comfy-test init' to create one)";
    return false;
  }

  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  return ParseRunConfigText(text, options, config, report, error);
}

fs::path ResolveConfigPath(const fs::path& node_dir, const fs::path& explicit_path) {
  if (!explicit_path.empty()) {
    return explicit_path;
  }
  return node_dir / std::string(kConfigFileName);
}

std::vector<PlatformId> EnabledPlatforms(const RunConfig& config) {
  std::vector<PlatformId> enabled;
  for (const PlatformSettings& settings : config.platforms) {
    if (settings.enabled) {
      enabled.push_back(settings.id);
    }
  }
  return enabled;
}

} // namespace comfytest::config
