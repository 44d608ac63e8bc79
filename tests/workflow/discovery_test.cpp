#include "workflow/discovery.hpp"

#include "common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {

using comfytest::config::ConfigReport;
using comfytest::config::DualAssignmentPolicy;
using comfytest::config::RunConfig;
using comfytest::config::RunnerClass;
using comfytest::config::WorkflowSelection;
using comfytest::workflow::WorkflowCatalog;
using comfytest::workflow::WorkflowEntry;

void WriteFile(const fs::path& path, const std::string& text) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << text;
}

const WorkflowEntry& EntryNamed(const WorkflowCatalog& catalog, const std::string& name) {
  for (const WorkflowEntry& entry : catalog.entries) {
    if (entry.file_name == name) {
      return entry;
    }
  }
  FAIL("no catalog entry for " << name);
  return catalog.entries.front();
}

// cpu = ["shared.json", "cpu_only.json"], gpu = ["shared.json"].
RunConfig DualListedConfig(DualAssignmentPolicy policy) {
  RunConfig config;
  config.cpu_workflows = WorkflowSelection{.all = false, .files = {"shared.json", "cpu_only.json"}};
  config.gpu_workflows = WorkflowSelection{.all = false, .files = {"shared.json"}};
  config.dual_assignment = policy;
  return config;
}

} // namespace

TEST_CASE("Listed workflow missing from disk is a configuration issue", "[workflow]") {
  const fs::path root = comfytest::tests::common::CreateUniqueTempDir("comfytest-discover-missing");
  WriteFile(root / "workflows" / "present.json", "{}");
  WriteFile(root / "workflows" / "notes.txt", "not a workflow");

  RunConfig config;
  config.cpu_workflows = WorkflowSelection{.all = false, .files = {"present.json", "gone.json"}};
  WorkflowCatalog catalog;
  ConfigReport report;
  std::string error;
  REQUIRE(comfytest::workflow::DiscoverWorkflows(root, config, catalog, report, error));
  CHECK(error.empty());
  CHECK_FALSE(report.valid);
  REQUIRE(report.issues.size() == 1U);
  CHECK(report.issues[0].path == "workflows.cpu[1]");
  CHECK(report.issues[0].message == "workflow file not found: workflows/gone.json");
  REQUIRE(catalog.entries.size() == 1U);
  CHECK(catalog.entries[0].cpu);
  comfytest::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("Missing workflows directory is fine when nothing is listed", "[workflow]") {
  const fs::path root = comfytest::tests::common::CreateUniqueTempDir("comfytest-discover-empty");
  WorkflowCatalog catalog;
  ConfigReport report;
  std::string error;
  REQUIRE(comfytest::workflow::DiscoverWorkflows(root, RunConfig{}, catalog, report, error));
  CHECK(report.valid);
  CHECK(catalog.entries.empty());
  comfytest::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("Dual-listed workflow follows the dual assignment policy", "[workflow]") {
  const fs::path root = comfytest::tests::common::CreateUniqueTempDir("comfytest-discover-dual");
  WriteFile(root / "workflows" / "shared.json", "{}");
  WriteFile(root / "workflows" / "cpu_only.json", "{}");
  WriteFile(root / "workflows" / "unlisted.json", "{}");

  struct Expectation {
    DualAssignmentPolicy policy;
    bool cpu;
    bool gpu;
  };
  const Expectation expectations[] = {
      {DualAssignmentPolicy::kGpu, false, true},
      {DualAssignmentPolicy::kCpu, true, false},
      {DualAssignmentPolicy::kBoth, true, true},
  };
  for (const Expectation& expected : expectations) {
    CAPTURE(comfytest::config::ToString(expected.policy));
    WorkflowCatalog catalog;
    ConfigReport report;
    std::string error;
    REQUIRE(comfytest::workflow::DiscoverWorkflows(root, DualListedConfig(expected.policy),
                                                   catalog, report, error));
    REQUIRE(report.valid);
    REQUIRE(catalog.entries.size() == 3U);

    const WorkflowEntry& shared = EntryNamed(catalog, "shared.json");
    CHECK(shared.cpu == expected.cpu);
    CHECK(shared.gpu == expected.gpu);

    const WorkflowEntry& cpu_only = EntryNamed(catalog, "cpu_only.json");
    CHECK(cpu_only.cpu);
    CHECK_FALSE(cpu_only.gpu);

    const WorkflowEntry& unlisted = EntryNamed(catalog, "unlisted.json");
    CHECK_FALSE(unlisted.cpu);
    CHECK_FALSE(unlisted.gpu);

    CHECK(catalog.InScope(RunnerClass::kGpu).size() == (expected.gpu ? 1U : 0U));
    CHECK(catalog.InScope(RunnerClass::kCpu).size() == (expected.cpu ? 2U : 1U));
  }
  comfytest::tests::common::RemovePathBestEffort(root);
}
