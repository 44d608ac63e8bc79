#include "config/project.hpp"

#include "config/toml_document.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace comfytest::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ConfigReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
  report.valid = false;
}

std::string RelativeLabel(const fs::path& path, const fs::path& base) {
  std::error_code ec;
  const fs::path relative = fs::relative(path, base, ec);
  if (ec || relative.empty()) {
    return path.generic_string();
  }
  return relative.generic_string();
}

void ReadComfyEnvFile(const fs::path& file, const fs::path& node_dir, bool is_root,
                      std::set<std::string>& packages, Project& project, ConfigReport& report) {
  const std::string label = RelativeLabel(file, node_dir);

  std::string text;
  std::string io_error;
  if (!core::ReadTextFile(file, text, io_error)) {
    AddIssue(report, label, io_error);
    return;
  }

  JsonValue root;
  std::string parse_error;
  if (!ParseTomlDocument(text, label, root, parse_error)) {
    AddIssue(report, label, "invalid TOML: " + parse_error);
    return;
  }

  if (const JsonValue* cuda = root.Find("cuda"); cuda != nullptr) {
    const JsonValue* list = cuda->Find("packages");
    if (!cuda->IsObject() || (list != nullptr && !list->IsArray())) {
      AddIssue(report, label + ": cuda.packages", "must be an array of package names");
    } else if (list != nullptr) {
      bool contributed = false;
      for (std::size_t i = 0; i < list->array_value.size(); ++i) {
        const JsonValue& item = list->array_value[i];
        if (!item.IsString() || item.string_value.empty()) {
          AddIssue(report, label + ": cuda.packages[" + std::to_string(i) + "]",
                   "must be a non-empty string");
          continue;
        }
        packages.insert(CanonicalPackageName(item.string_value));
        contributed = true;
      }
      if (contributed) {
        project.cuda_package_sources.push_back(label);
      }
    }
  }

  if (!is_root) {
    return;
  }
  if (const JsonValue* env_vars = root.Find("env_vars"); env_vars != nullptr) {
    if (!env_vars->IsObject()) {
      AddIssue(report, label + ": env_vars", "must be a table of string values");
      return;
    }
    for (const auto& [key, value] : env_vars->object_value) {
      if (!value.IsString()) {
        AddIssue(report, label + ": env_vars." + key, "must be a string");
        continue;
      }
      project.env_vars[key] = value.string_value;
    }
  }
}

// `[project] name` from pyproject.toml when it declares one.
std::string ReadPyprojectName(const fs::path& node_dir) {
  const fs::path pyproject = node_dir / "pyproject.toml";
  std::error_code ec;
  if (!fs::is_regular_file(pyproject, ec) || ec) {
    return {};
  }
  std::string text;
  std::string io_error;
  if (!core::ReadTextFile(pyproject, text, io_error)) {
    return {};
  }
  JsonValue root;
  std::string parse_error;
  if (!ParseTomlDocument(text, "pyproject.toml", root, parse_error)) {
    return {};
  }
  const JsonValue* section = root.Find("project");
  const JsonValue* name = section != nullptr ? section->Find("name") : nullptr;
  if (name == nullptr || !name->IsString()) {
    return {};
  }
  return name->string_value;
}

std::string DetectProjectName(const fs::path& node_dir) {
  if (std::string declared = ReadPyprojectName(node_dir); !declared.empty()) {
    return declared;
  }
  return NormalizeNodeDir(node_dir).filename().string();
}

} // namespace

fs::path NormalizeNodeDir(const fs::path& node_dir) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(node_dir, ec);
  if (ec) {
    resolved = node_dir.lexically_normal();
  }
  // "ext/" keeps an empty final component through lexical normalization.
  if (resolved.filename().empty() && resolved.has_parent_path()) {
    resolved = resolved.parent_path();
  }
  return resolved;
}

std::string CanonicalPackageName(std::string_view raw) {
  std::string canonical;
  canonical.reserve(raw.size());
  for (const char c : raw) {
    if (c == '-' || c == '.') {
      canonical.push_back('_');
    } else {
      canonical.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return canonical;
}

bool IsIgnoredDirectoryName(std::string_view name) {
  static constexpr std::array<std::string_view, 6> kIgnored = {
      "__pycache__", "venv", "node_modules", "site-packages", "lib", "Lib",
  };
  if (name.empty()) {
    return false;
  }
  if (name.front() == '.') {
    return true;
  }
  if (name.rfind("_env_", 0) == 0) {
    return true;
  }
  return std::find(kIgnored.begin(), kIgnored.end(), name) != kIgnored.end();
}

bool CollectCudaPackages(const fs::path& node_dir, Project& project, ConfigReport& report,
                         std::string& error) {
  std::error_code ec;
  if (!fs::is_directory(node_dir, ec) || ec) {
    error = "node directory not found: " + node_dir.string();
    return false;
  }

  std::vector<fs::path> files;
  fs::recursive_directory_iterator it(node_dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    error = "failed to scan node directory '" + node_dir.string() + "': " + ec.message();
    return false;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      error = "failed to scan node directory '" + node_dir.string() + "': " + ec.message();
      return false;
    }
    std::error_code entry_ec;
    if (it->is_directory(entry_ec) && IsIgnoredDirectoryName(it->path().filename().string())) {
      it.disable_recursion_pending();
      continue;
    }
    if (it->path().filename() == kComfyEnvFileName && it->is_regular_file(entry_ec)) {
      files.push_back(it->path());
    }
  }
  // Directory iteration order is filesystem dependent.
  std::sort(files.begin(), files.end());

  std::set<std::string> packages;
  for (const fs::path& file : files) {
    std::error_code same_ec;
    const bool is_root = file.parent_path() == node_dir ||
                         fs::equivalent(file.parent_path(), node_dir, same_ec);
    ReadComfyEnvFile(file, node_dir, is_root, packages, project, report);
  }
  project.cuda_packages.assign(packages.begin(), packages.end());
  return true;
}

bool LoadProject(const fs::path& node_dir, const RunConfig& config, Project& project,
                 ConfigReport& report, std::string& error) {
  project = Project{};
  project.node_dir = NormalizeNodeDir(node_dir);
  project.name = config.name.empty() ? DetectProjectName(project.node_dir) : config.name;
  project.comfyui_version = config.comfyui_version;
  project.python_version = config.python_version;

  if (!CollectCudaPackages(project.node_dir, project, report, error)) {
    return false;
  }
  if (project.name.empty()) {
    AddIssue(report, "name", "could not be detected from the node directory; set it explicitly");
  }
  return true;
}

} // namespace comfytest::config
