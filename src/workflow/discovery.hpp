#pragma once

#include "config/run_config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace comfytest::workflow {

inline constexpr const char* kWorkflowDirName = "workflows";

// One candidate file under `<node_dir>/workflows/` and the runner classes it
// is assigned to after the dual-assignment policy is applied.
struct WorkflowEntry {
  std::string file_name;
  std::filesystem::path path;
  bool cpu = false;
  bool gpu = false;

  bool AssignedTo(config::RunnerClass runner) const {
    return runner == config::RunnerClass::kGpu ? gpu : cpu;
  }
};

// The declared workflow list, shared read-only by every platform pipeline.
struct WorkflowCatalog {
  // Every discovered file, sorted by name.
  std::vector<WorkflowEntry> entries;

  std::vector<const WorkflowEntry*> InScope(config::RunnerClass runner) const;
};

// Lists `*.json` under `<node_dir>/workflows/` and resolves the cpu/gpu sets.
//
// Contract:
// - A listed file name that is not on disk is a configuration issue
//   (`workflows.cpu[1]: ...`), never a run failure.
// - A missing workflows directory is fine when neither set names a file.
// - Returns false only for I/O failures.
bool DiscoverWorkflows(const std::filesystem::path& node_dir, const config::RunConfig& config,
                       WorkflowCatalog& catalog, config::ConfigReport& report,
                       std::string& error);

} // namespace comfytest::workflow
