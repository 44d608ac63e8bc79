#include "pipeline/run_plan.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <vector>

namespace {

using comfytest::config::Level;
using comfytest::config::PlatformId;
using comfytest::config::RunnerClass;
using comfytest::report::SkipReason;

comfytest::workflow::WorkflowCatalog Catalog() {
  comfytest::workflow::WorkflowCatalog catalog;
  catalog.entries.push_back({.file_name = "basic.json", .path = "basic.json", .cpu = true});
  catalog.entries.push_back({.file_name = "flash.json", .path = "flash.json", .gpu = true});
  return catalog;
}

} // namespace

TEST_CASE("Level selection closes over dependencies before truncating", "[pipeline][plan]") {
  comfytest::config::RunConfig config;
  config.levels = {Level::kValidation};

  const auto selection = comfytest::pipeline::SelectLevels(config, std::nullopt);
  CHECK(selection.levels ==
        std::vector<Level>{Level::kSyntax, Level::kInstall, Level::kRegistration,
                           Level::kValidation});
  CHECK(selection.IsImplicit(Level::kInstall));
  CHECK_FALSE(selection.IsImplicit(Level::kValidation));

  const auto truncated = comfytest::pipeline::SelectLevels(config, Level::kInstall);
  CHECK(truncated.levels == std::vector<Level>{Level::kSyntax, Level::kInstall});
  CHECK(truncated.implicit == std::vector<Level>{Level::kSyntax, Level::kInstall});
}

TEST_CASE("Platform selection keeps matrix order and validates --platform", "[pipeline][plan]") {
  comfytest::config::RunConfig config;
  config.Platform(PlatformId::kWindows).enabled = false;

  std::vector<PlatformId> platforms;
  std::string error;
  REQUIRE(comfytest::pipeline::SelectPlatforms(config, std::nullopt, platforms, error));
  CHECK(platforms ==
        std::vector<PlatformId>{PlatformId::kLinux, PlatformId::kMacos, PlatformId::kWindowsPortable});

  REQUIRE(comfytest::pipeline::SelectPlatforms(config, PlatformId::kMacos, platforms, error));
  CHECK(platforms == std::vector<PlatformId>{PlatformId::kMacos});

  CHECK_FALSE(comfytest::pipeline::SelectPlatforms(config, PlatformId::kWindows, platforms, error));
  CHECK(error == "platform 'windows' is disabled in the configuration");

  for (auto& platform : config.platforms) {
    platform.enabled = false;
  }
  CHECK_FALSE(comfytest::pipeline::SelectPlatforms(config, std::nullopt, platforms, error));
  CHECK(error.rfind("no platform is enabled", 0) == 0U);
}

TEST_CASE("Workflow-driven levels skip by configuration", "[pipeline][plan]") {
  comfytest::config::RunConfig config;
  const auto selection = comfytest::pipeline::SelectLevels(config, std::nullopt);
  const auto catalog = Catalog();
  comfytest::config::PlatformSettings settings;

  CHECK(comfytest::pipeline::ConfigurationSkip(Level::kExecution, selection, catalog, settings,
                                               RunnerClass::kCpu) == SkipReason::kNone);
  CHECK(comfytest::pipeline::WorkflowsForLevel(Level::kStaticCapture, catalog, settings,
                                               RunnerClass::kCpu)
            .size() == 2U);
  CHECK(comfytest::pipeline::WorkflowsForLevel(Level::kValidation, catalog, settings,
                                               RunnerClass::kGpu)
            .front()
            ->file_name == "flash.json");

  settings.skip_workflow = true;
  CHECK(comfytest::pipeline::ConfigurationSkip(Level::kValidation, selection, catalog, settings,
                                               RunnerClass::kCpu) == SkipReason::kSkipWorkflow);
  // STATIC_CAPTURE ignores skip_workflow.
  CHECK(comfytest::pipeline::ConfigurationSkip(Level::kStaticCapture, selection, catalog, settings,
                                               RunnerClass::kCpu) == SkipReason::kNone);

  const comfytest::workflow::WorkflowCatalog empty;
  settings.skip_workflow = false;
  CHECK(comfytest::pipeline::ConfigurationSkip(Level::kExecution, selection, empty, settings,
                                               RunnerClass::kCpu) == SkipReason::kNoWorkflows);

  const auto install_only = comfytest::pipeline::SelectLevels(config, Level::kInstall);
  CHECK(comfytest::pipeline::ConfigurationSkip(Level::kExecution, install_only, catalog, settings,
                                               RunnerClass::kCpu) == SkipReason::kNotRequested);
}

TEST_CASE("Dry-run plan lists every level for every platform", "[pipeline][plan]") {
  comfytest::config::RunConfig config;
  config.levels = {Level::kRegistration};
  config.Platform(PlatformId::kWindows).enabled = false;
  config.Platform(PlatformId::kWindowsPortable).enabled = false;

  const auto plan = comfytest::pipeline::BuildRunPlan(
      config, Catalog(), comfytest::pipeline::SelectLevels(config, std::nullopt),
      {PlatformId::kLinux, PlatformId::kMacos}, RunnerClass::kCpu);
  REQUIRE(plan.platforms.size() == 2U);
  CHECK(plan.platforms[0].server_port == 8188);
  CHECK(plan.platforms[1].server_port == 8189);
  CHECK(plan.platforms[0].capture_workflows == 2U);
  CHECK(plan.platforms[0].execution_workflows == 1U);

  const std::string table = comfytest::pipeline::RenderPlanTable(plan);
  CHECK(table.rfind("LEVEL", 0) == 0U);
  CHECK(table.find("SYNTAX          run (implicit)") != std::string::npos);
  CHECK(table.find("REGISTRATION    run ") != std::string::npos);
  CHECK(table.find("EXECUTION       not requested") != std::string::npos);
  CHECK(table.find("macos: runner=cpu port=8189") != std::string::npos);
}
