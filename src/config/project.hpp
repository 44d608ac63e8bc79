#pragma once

#include "config/run_config.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace comfytest::config {

inline constexpr std::string_view kComfyEnvFileName = "comfy-env.toml";

// The extension under test. Loaded once before any platform starts and
// shared read-only by every platform pipeline.
struct Project {
  std::string name;
  std::filesystem::path node_dir;
  std::string comfyui_version;
  std::string python_version;
  // Canonical names (see CanonicalPackageName), sorted and unique.
  std::vector<std::string> cuda_packages;
  // comfy-env.toml files the package list was read from, relative to node_dir.
  std::vector<std::string> cuda_package_sources;
  // `env_vars` of the root comfy-env.toml, passed to collaborators only.
  std::map<std::string, std::string> env_vars;
};

// Absolute form of a user-supplied extension directory with no trailing
// separator, so `filename()` is the extension's folder name.
std::filesystem::path NormalizeNodeDir(const std::filesystem::path& node_dir);

// Python distribution name normalization: lowercase, with '-' and '.'
// folded to '_' (`Flash-Attn` and `flash_attn` name the same package).
std::string CanonicalPackageName(std::string_view raw);

// Directories never searched for sources or comfy-env files: VCS metadata,
// caches, virtual environments, vendored site-packages and hidden folders.
bool IsIgnoredDirectoryName(std::string_view name);

// Collects `[cuda] packages` from every comfy-env.toml below `node_dir`.
// Malformed files are reported as issues under their relative path.
bool CollectCudaPackages(const std::filesystem::path& node_dir, Project& project,
                         ConfigReport& report, std::string& error);

// Builds the Project from the extension directory and validated config.
// Without an explicit `name`, pyproject.toml's `[project] name` is used, then
// the directory name.
//
// Contract:
// - Returns false only for I/O failures (missing node directory included).
// - Configuration problems are appended to `report` and clear `report.valid`.
bool LoadProject(const std::filesystem::path& node_dir, const RunConfig& config, Project& project,
                 ConfigReport& report, std::string& error);

} // namespace comfytest::config
