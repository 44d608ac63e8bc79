#include "config/project.hpp"

#include "common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using comfytest::config::ConfigReport;
using comfytest::config::Project;
using comfytest::config::RunConfig;

void WriteFile(const fs::path& path, const std::string& text) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << text;
}

} // namespace

TEST_CASE("comfy-env.toml cuda packages land canonicalized in the project", "[config]") {
  const fs::path root = comfytest::tests::common::CreateUniqueTempDir("comfytest-env-flash");
  const fs::path node_dir = root / "flash_nodes";
  WriteFile(node_dir / "comfy-env.toml", "[cuda]\npackages = [\"flash-attn\"]\n");

  Project project;
  ConfigReport report;
  std::string error;
  REQUIRE(comfytest::config::LoadProject(node_dir, RunConfig{}, project, report, error));
  REQUIRE(report.valid);
  CHECK(project.cuda_packages == std::vector<std::string>{"flash_attn"});
  CHECK(project.cuda_package_sources == std::vector<std::string>{"comfy-env.toml"});
  comfytest::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("Nested comfy-env files merge, env_vars only from the root", "[config]") {
  const fs::path root = comfytest::tests::common::CreateUniqueTempDir("comfytest-env-nested");
  const fs::path node_dir = root / "nested_nodes";
  WriteFile(node_dir / "comfy-env.toml",
            "[cuda]\npackages = [\"Flash-Attn\"]\n\n[env_vars]\nHF_HUB_OFFLINE = \"1\"\n");
  WriteFile(node_dir / "sub" / "comfy-env.toml",
            "[cuda]\npackages = [\"sageattention\", \"flash_attn\"]\n\n[env_vars]\nIGNORED = \"x\"\n");
  // Virtual environments are never searched.
  WriteFile(node_dir / ".venv" / "comfy-env.toml", "[cuda]\npackages = [\"xformers\"]\n");

  Project project;
  ConfigReport report;
  std::string error;
  REQUIRE(comfytest::config::LoadProject(node_dir, RunConfig{}, project, report, error));
  REQUIRE(report.valid);
  CHECK(project.cuda_packages == std::vector<std::string>{"flash_attn", "sageattention"});
  CHECK(project.env_vars.size() == 1U);
  CHECK(project.env_vars.at("HF_HUB_OFFLINE") == "1");
  comfytest::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("Malformed comfy-env.toml is reported under its relative path", "[config]") {
  const fs::path root = comfytest::tests::common::CreateUniqueTempDir("comfytest-env-bad");
  const fs::path node_dir = root / "bad_nodes";
  WriteFile(node_dir / "comfy-env.toml", "[cuda\npackages = 3\n");
  WriteFile(node_dir / "inner" / "comfy-env.toml", "[cuda]\npackages = [\"\"]\n");

  Project project;
  ConfigReport report;
  std::string error;
  REQUIRE(comfytest::config::LoadProject(node_dir, RunConfig{}, project, report, error));
  CHECK_FALSE(report.valid);
  REQUIRE(report.issues.size() == 2U);
  CHECK(report.issues[0].path == "comfy-env.toml");
  CHECK(report.issues[0].message.rfind("invalid TOML: ", 0) == 0);
  CHECK(report.issues[1].path == "inner/comfy-env.toml: cuda.packages[0]");
  comfytest::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("Project name comes from pyproject.toml, then the folder name", "[config]") {
  const fs::path root = comfytest::tests::common::CreateUniqueTempDir("comfytest-env-name");
  const fs::path declared = root / "folder_name";
  WriteFile(declared / "pyproject.toml", "[project]\nname = \"comfyui-declared\"\nversion = \"1.0\"\n");
  const fs::path bare = root / "bare_nodes";
  fs::create_directories(bare);

  Project project;
  ConfigReport report;
  std::string error;
  REQUIRE(comfytest::config::LoadProject(declared, RunConfig{}, project, report, error));
  CHECK(project.name == "comfyui-declared");

  REQUIRE(comfytest::config::LoadProject(bare, RunConfig{}, project, report, error));
  CHECK(project.name == "bare_nodes");

  RunConfig named;
  named.name = "explicit";
  REQUIRE(comfytest::config::LoadProject(declared, named, project, report, error));
  CHECK(project.name == "explicit");
  comfytest::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("A trailing separator does not change the extension folder name", "[config]") {
  const fs::path root = comfytest::tests::common::CreateUniqueTempDir("comfytest-env-slash");
  const fs::path node_dir = root / "slash_nodes";
  fs::create_directories(node_dir);

  const fs::path normalized =
      comfytest::config::NormalizeNodeDir(fs::path(node_dir.string() + "/"));
  CHECK(normalized.filename() == "slash_nodes");
  CHECK(normalized.is_absolute());

  Project project;
  ConfigReport report;
  std::string error;
  REQUIRE(comfytest::config::LoadProject(fs::path(node_dir.string() + "/"), RunConfig{}, project,
                                         report, error));
  CHECK(project.node_dir.filename() == "slash_nodes");
  CHECK(project.name == "slash_nodes");
  comfytest::tests::common::RemovePathBestEffort(root);
}
