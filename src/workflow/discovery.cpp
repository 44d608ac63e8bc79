#include "workflow/discovery.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace comfytest::workflow {

namespace {

void AddIssue(config::ConfigReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
  report.valid = false;
}

// Marks the entries named by `selection`; unknown names become issues.
void ApplySelection(const config::WorkflowSelection& selection, const char* key,
                    std::vector<WorkflowEntry>& entries, std::vector<bool>& marks,
                    config::ConfigReport& report) {
  marks.assign(entries.size(), selection.all);
  if (selection.all) {
    return;
  }
  for (std::size_t i = 0; i < selection.files.size(); ++i) {
    const std::string& wanted = selection.files[i];
    const auto it = std::find_if(entries.begin(), entries.end(), [&](const WorkflowEntry& entry) {
      return entry.file_name == wanted;
    });
    if (it == entries.end()) {
      AddIssue(report, std::string("workflows.") + key + "[" + std::to_string(i) + "]",
               "workflow file not found: " + std::string(kWorkflowDirName) + "/" + wanted);
      continue;
    }
    marks[static_cast<std::size_t>(it - entries.begin())] = true;
  }
}

} // namespace

std::vector<const WorkflowEntry*> WorkflowCatalog::InScope(config::RunnerClass runner) const {
  std::vector<const WorkflowEntry*> scoped;
  for (const WorkflowEntry& entry : entries) {
    if (entry.AssignedTo(runner)) {
      scoped.push_back(&entry);
    }
  }
  return scoped;
}

bool DiscoverWorkflows(const fs::path& node_dir, const config::RunConfig& config,
                       WorkflowCatalog& catalog, config::ConfigReport& report,
                       std::string& error) {
  catalog = WorkflowCatalog{};
  const fs::path dir = node_dir / kWorkflowDirName;

  std::error_code ec;
  if (fs::is_directory(dir, ec)) {
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
      std::error_code entry_ec;
      if (!it->is_regular_file(entry_ec) || it->path().extension() != ".json") {
        continue;
      }
      catalog.entries.push_back(
          {.file_name = it->path().filename().string(), .path = it->path()});
    }
    if (ec) {
      error = "failed to list workflows in '" + dir.string() + "': " + ec.message();
      return false;
    }
  }
  std::sort(catalog.entries.begin(), catalog.entries.end(),
            [](const WorkflowEntry& a, const WorkflowEntry& b) { return a.file_name < b.file_name; });

  std::vector<bool> cpu_marks;
  std::vector<bool> gpu_marks;
  ApplySelection(config.cpu_workflows, "cpu", catalog.entries, cpu_marks, report);
  ApplySelection(config.gpu_workflows, "gpu", catalog.entries, gpu_marks, report);

  for (std::size_t i = 0; i < catalog.entries.size(); ++i) {
    WorkflowEntry& entry = catalog.entries[i];
    entry.cpu = cpu_marks[i];
    entry.gpu = gpu_marks[i];
    if (entry.cpu && entry.gpu) {
      switch (config.dual_assignment) {
      case config::DualAssignmentPolicy::kGpu:
        entry.cpu = false;
        break;
      case config::DualAssignmentPolicy::kCpu:
        entry.gpu = false;
        break;
      case config::DualAssignmentPolicy::kBoth:
        break;
      }
    }
  }
  return true;
}

} // namespace comfytest::workflow
