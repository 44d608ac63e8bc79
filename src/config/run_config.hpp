#pragma once

#include "config/levels.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace comfytest::config {

inline constexpr std::string_view kConfigFileName = "comfy-test.toml";

enum class PlatformId {
  kLinux = 0,
  kMacos = 1,
  kWindows = 2,
  kWindowsPortable = 3,
};

inline constexpr std::size_t kPlatformCount = 4;

inline constexpr std::array<PlatformId, kPlatformCount> kAllPlatforms = {
    PlatformId::kLinux,
    PlatformId::kMacos,
    PlatformId::kWindows,
    PlatformId::kWindowsPortable,
};

const char* ToString(PlatformId platform);
bool ParsePlatformId(std::string_view raw, PlatformId& platform);
std::string ExpectedPlatformList();

enum class RunnerClass {
  kCpu,
  kGpu,
};

const char* ToString(RunnerClass runner);

// Where a workflow listed under both `workflows.cpu` and `workflows.gpu` runs.
enum class DualAssignmentPolicy {
  kGpu,
  kCpu,
  kBoth,
};

// Whether VALIDATION looks at every workflow after partial INSTANTIATION
// failure, or only at workflows whose node classes all instantiated.
enum class InstantiationFailurePolicy {
  kValidateAll,
  kSurvivingOnly,
};

const char* ToString(DualAssignmentPolicy policy);
const char* ToString(InstantiationFailurePolicy policy);

struct PlatformSettings {
  PlatformId id = PlatformId::kLinux;
  bool enabled = true;
  bool skip_workflow = false;
  // windows_portable only.
  std::string portable_version = "latest";
};

// "all" or an explicit list of file names under `workflows/`.
struct WorkflowSelection {
  bool all = false;
  std::vector<std::string> files;

  bool operator==(const WorkflowSelection& other) const = default;
};

struct RunConfig {
  std::string name;
  std::string comfyui_version = "latest";
  std::string python_version;
  bool python_version_defaulted = false;

  // Requested levels in pipeline order (before dependency closure).
  std::vector<Level> levels{kAllLevels.begin(), kAllLevels.end()};

  std::chrono::seconds timeout{3600};
  std::chrono::seconds partial_timeout{120};

  std::array<PlatformSettings, kPlatformCount> platforms{{
      {.id = PlatformId::kLinux},
      {.id = PlatformId::kMacos},
      {.id = PlatformId::kWindows},
      {.id = PlatformId::kWindowsPortable},
  }};

  WorkflowSelection cpu_workflows{.all = true, .files = {}};
  WorkflowSelection gpu_workflows;
  std::size_t workflow_concurrency = 1;

  std::uint16_t server_port = 8188;

  // argv template with {url} {workflow} {output} placeholders; empty means
  // no screenshot tool is configured.
  std::vector<std::string> screenshot_command;

  DualAssignmentPolicy dual_assignment = DualAssignmentPolicy::kGpu;
  InstantiationFailurePolicy instantiation_failures = InstantiationFailurePolicy::kValidateAll;

  const PlatformSettings& Platform(PlatformId id) const {
    return platforms[static_cast<std::size_t>(id)];
  }
  PlatformSettings& Platform(PlatformId id) {
    return platforms[static_cast<std::size_t>(id)];
  }
};

struct ConfigIssue {
  std::string path;
  std::string message;
};

struct ConfigReport {
  bool valid = false;
  std::vector<ConfigIssue> issues;
};

inline constexpr std::array<std::string_view, 4> kAllowedPythonVersions = {"3.10", "3.11", "3.12",
                                                                           "3.13"};

// Picks the default interpreter version from `kAllowedPythonVersions`.
std::string ChoosePythonVersion(std::uint32_t seed);

struct ParseOptions {
  // Seed for the default python version; random when unset.
  std::optional<std::uint32_t> python_seed;
};

// Parses and strictly validates comfy-test.toml text.
//
// Contract:
// - Returns true when validation completed (even if the config is invalid).
// - `report.issues` carries one entry per problem, keyed by dotted path; a
//   parse failure is reported under path `$`.
// - `config` is only meaningful when `report.valid` is true.
bool ParseRunConfigText(std::string_view toml_text, const ParseOptions& options,
                        RunConfig& config, ConfigReport& report, std::string& error);

// Loads a config file. Returns false if the file cannot be read.
bool LoadRunConfigFile(const std::filesystem::path& path, const ParseOptions& options,
                       RunConfig& config, ConfigReport& report, std::string& error);

// `--config` if given, else `<node_dir>/comfy-test.toml`.
std::filesystem::path ResolveConfigPath(const std::filesystem::path& node_dir,
                                        const std::filesystem::path& explicit_path);

std::vector<PlatformId> EnabledPlatforms(const RunConfig& config);

} // namespace comfytest::config
