#include "comfytest/cli/router.hpp"

#include "artifacts/html_report_writer.hpp"
#include "artifacts/report_writer.hpp"
#include "collaborators/command_screenshot.hpp"
#include "collaborators/git_publisher.hpp"
#include "collaborators/http_execution.hpp"
#include "collaborators/local_environment.hpp"
#include "collaborators/local_server.hpp"
#include "config/project.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "pipeline/platform_matrix.hpp"
#include "pipeline/run_plan.hpp"
#include "report/status_table.hpp"
#include "workflow/discovery.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace comfytest::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);

constexpr const char* kConfigFileName = "comfy-test.toml";
constexpr const char* kCiWorkflowPath = ".github/workflows/comfy-test.yml";
constexpr const char* kGpuEnvName = "COMFY_TEST_GPU";

constexpr std::string_view kConfigTemplate = R"(name = "my-custom-nodes"
comfyui_version = "latest"
python_version = "3.12"
levels = "all"
timeout = 3600

[platforms]
linux = true
macos = false
windows = false
windows_portable = false

[workflows]
cpu = "all"
gpu = []
concurrency = 1
partial_timeout = 120

[server]
port = 8188

[policies]
dual_assignment = "gpu"
instantiation_failures = "validate_all"
)";

constexpr std::string_view kCiWorkflowTemplate = R"(name: comfy-test

on:
  push:
    branches: [main]
  pull_request:
  workflow_dispatch:

jobs:
  test:
    strategy:
      fail-fast: false
      matrix:
        include:
          - os: ubuntu-latest
            platform: linux
    runs-on: ${{ matrix.os }}
    steps:
      - uses: actions/checkout@v4
      - uses: astral-sh/setup-uv@v5
      - name: Run comfy-test
        run: comfy-test run --platform ${{ matrix.platform }} --out comfy-test-results
      - uses: actions/upload-artifact@v4
        if: always()
        with:
          name: comfy-test-results-${{ matrix.platform }}
          path: comfy-test-results
)";

// Set by the SIGINT/SIGTERM handler; points at the root token of a `run`.
std::atomic<bool>* g_cancel_flag = nullptr;

extern "C" void HandleInterrupt(int /*signum*/) {
  if (g_cancel_flag != nullptr) {
    g_cancel_flag->store(true);
  }
}

// Installs the interrupt handler for one scope and restores the defaults.
class ScopedInterruptHandler {
public:
  explicit ScopedInterruptHandler(const core::CancellationToken& token) {
    g_cancel_flag = token.Flag();
    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);
  }
  ~ScopedInterruptHandler() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_cancel_flag = nullptr;
  }

  ScopedInterruptHandler(const ScopedInterruptHandler&) = delete;
  ScopedInterruptHandler& operator=(const ScopedInterruptHandler&) = delete;
};

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  comfy-test init [--force] [--node-dir <dir>]\n"
      << "  comfy-test run [--platform <" << config::ExpectedPlatformList() << ">] "
      << "[--level <level>] [--dry-run] [--config <path>] [--node-dir <dir>] [--out <dir>] "
         "[--workspace <dir>] [--gpu] [--log-level <debug|info|warn|error>]\n"
      << "  comfy-test validate [--config <path>] [--node-dir <dir>]\n"
      << "  comfy-test publish <results-dir> --repo <owner/repo> [--branch <name>]\n"
      << "  comfy-test version\n"
      << "\n"
      << "levels: " << config::ExpectedLevelList() << "\n";
}

void PrintConfigIssues(const fs::path& config_path, const config::ConfigReport& report) {
  std::cerr << "invalid configuration: " << config_path.string() << '\n';
  for (const config::ConfigIssue& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = std::string(args[i]) + " requires a value";
    return false;
  }
  value = args[++i];
  return true;
}

fs::path ResolveNodeDir(const fs::path& node_dir) {
  if (!node_dir.empty()) {
    return config::NormalizeNodeDir(node_dir);
  }
  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  return ec ? fs::path(".") : cwd;
}

bool GpuRequestedByEnvironment() {
  const char* value = std::getenv(kGpuEnvName);
  return value != nullptr && std::string_view(value) == "1";
}

bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--dry-run") {
      options.dry_run = true;
      continue;
    }
    if (token == "--gpu") {
      options.runner = config::RunnerClass::kGpu;
      continue;
    }
    if (token == "--platform") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      config::PlatformId platform = config::PlatformId::kLinux;
      if (!config::ParsePlatformId(value, platform)) {
        error = "invalid --platform '" + std::string(value) + "' (expected one of " +
                config::ExpectedPlatformList() + ")";
        return false;
      }
      options.only_platform = platform;
      continue;
    }
    if (token == "--level") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      config::Level level = config::Level::kSyntax;
      if (!config::ParseLevel(value, level)) {
        error = "invalid --level '" + std::string(value) + "' (expected one of " +
                config::ExpectedLevelList() + ")";
        return false;
      }
      options.through = level;
      continue;
    }
    if (token == "--config" || token == "--node-dir" || token == "--out" ||
        token == "--workspace") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = std::string(token) + " requires a non-empty value";
        return false;
      }
      if (token == "--config") {
        options.config_path = fs::path(std::string(value));
      } else if (token == "--node-dir") {
        options.node_dir = fs::path(std::string(value));
      } else if (token == "--out") {
        options.output_root = fs::path(std::string(value));
      } else {
        options.workspace_root = fs::path(std::string(value));
      }
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }
    error = "unknown run argument: " + std::string(token);
    return false;
  }
  if (GpuRequestedByEnvironment()) {
    options.runner = config::RunnerClass::kGpu;
  }
  return true;
}

// Loads config, project and workflows. Returns an exit code on failure.
std::optional<int> LoadInputs(const fs::path& node_dir, const fs::path& explicit_config,
                              const core::logging::Logger& logger, config::RunConfig& config,
                              config::Project& project, workflow::WorkflowCatalog& catalog) {
  const fs::path config_path = config::ResolveConfigPath(node_dir, explicit_config);
  config::ConfigReport report;
  std::string error;
  if (!config::LoadRunConfigFile(config_path, {}, config, report, error)) {
    logger.Error("configuration could not be read",
                 {{"config", config_path.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (!report.valid) {
    PrintConfigIssues(config_path, report);
    return kExitConfigInvalid;
  }
  if (config.python_version_defaulted) {
    logger.Info("python_version not set, picked a default",
                {{"python_version", config.python_version}});
  }

  if (!config::LoadProject(node_dir, config, project, report, error) ||
      !workflow::DiscoverWorkflows(node_dir, config, catalog, report, error)) {
    logger.Error("extension directory could not be loaded",
                 {{"node_dir", node_dir.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (!report.valid) {
    PrintConfigIssues(config_path, report);
    return kExitConfigInvalid;
  }
  return std::nullopt;
}

int CommandInit(const std::vector<std::string_view>& args) {
  bool force = false;
  fs::path node_dir;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view value;
    if (args[i] == "--force" || args[i] == "-f") {
      force = true;
    } else if (args[i] == "--node-dir") {
      if (!TakeValue(args, i, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      node_dir = fs::path(std::string(value));
    } else {
      std::cerr << "error: unknown init argument: " << args[i] << '\n';
      return kExitUsage;
    }
  }

  node_dir = ResolveNodeDir(node_dir);
  const fs::path config_path = node_dir / kConfigFileName;
  const fs::path ci_path = node_dir / kCiWorkflowPath;
  std::error_code ec;
  if (!force) {
    for (const fs::path& path : {config_path, ci_path}) {
      if (fs::exists(path, ec)) {
        std::cerr << "error: " << path.string() << " already exists (use --force to overwrite)\n";
        return kExitFailure;
      }
    }
  }

  if (!core::WriteTextFileAtomic(config_path, kConfigTemplate, error) ||
      !core::WriteTextFileAtomic(ci_path, kCiWorkflowTemplate, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::cout << "created: " << config_path.string() << '\n';
  std::cout << "created: " << ci_path.string() << '\n';
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  fs::path node_dir;
  fs::path explicit_config;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view value;
    if (args[i] != "--config" && args[i] != "--node-dir") {
      std::cerr << "error: unknown validate argument: " << args[i] << '\n';
      return kExitUsage;
    }
    if (!TakeValue(args, i, value, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
    (args[i - 1] == "--config" ? explicit_config : node_dir) = fs::path(std::string(value));
  }

  node_dir = ResolveNodeDir(node_dir);
  core::logging::Logger logger(core::logging::LogLevel::kWarn);
  config::RunConfig config;
  config::Project project;
  workflow::WorkflowCatalog catalog;
  if (const std::optional<int> exit_code =
          LoadInputs(node_dir, explicit_config, logger, config, project, catalog)) {
    return *exit_code;
  }

  std::cout << "valid: " << config::ResolveConfigPath(node_dir, explicit_config).string() << '\n';
  std::cout << "platforms:";
  for (const config::PlatformId platform : config::EnabledPlatforms(config)) {
    std::cout << ' ' << config::ToString(platform);
  }
  std::cout << "\nworkflows: " << catalog.entries.size()
            << "\ncuda packages: " << project.cuda_packages.size() << '\n';
  return kExitSuccess;
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  collaborators::LocalEnvironment environment;
  collaborators::LocalServer server;
  collaborators::HttpExecution execution;
  // The screenshot template comes from the config, which ExecuteRun loads;
  // an empty template reports screenshots as unavailable.
  std::unique_ptr<collaborators::CommandScreenshot> screenshot;
  if (!options.dry_run) {
    config::RunConfig config;
    config::ConfigReport report;
    const fs::path config_path =
        config::ResolveConfigPath(ResolveNodeDir(options.node_dir), options.config_path);
    if (config::LoadRunConfigFile(config_path, {}, config, report, error) && report.valid) {
      screenshot = std::make_unique<collaborators::CommandScreenshot>(config.screenshot_command);
    }
  }

  const collaborators::CollaboratorSet set{.environment = &environment,
                                           .server = &server,
                                           .screenshot = screenshot.get(),
                                           .execution = &execution};
  const core::CancellationToken cancel;
  const ScopedInterruptHandler interrupt_handler(cancel);
  return ExecuteRun(options, set, cancel);
}

int CommandPublish(const std::vector<std::string_view>& args) {
  collaborators::PublishRequest request;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view value;
    if (args[i] == "--repo" || args[i] == "--branch") {
      if (!TakeValue(args, i, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      (args[i - 1] == "--repo" ? request.repo : request.branch) = std::string(value);
    } else if (request.results_dir.empty() && !args[i].empty() && args[i].front() != '-') {
      request.results_dir = fs::path(std::string(args[i]));
    } else {
      std::cerr << "error: unknown publish argument: " << args[i] << '\n';
      return kExitUsage;
    }
  }
  if (request.results_dir.empty() || request.repo.empty()) {
    std::cerr << "error: publish requires <results-dir> and --repo <owner/repo>\n";
    return kExitUsage;
  }

  core::logging::Logger logger;
  report::RunReport run_report;
  if (!artifacts::LoadRunReportJson(request.results_dir, run_report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  fs::path index_path;
  if (!artifacts::WriteReportIndexHtml(run_report, request.results_dir, index_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  logger.Info("report index rendered", {{"path", index_path.string()}});

  collaborators::GitPublisher publisher;
  const core::CancellationToken cancel;
  const ScopedInterruptHandler interrupt_handler(cancel);
  if (!publisher.Publish(request, cancel, logger, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::cout << "published: " << request.repo << " (" << request.branch << ")\n";
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "comfy-test " << kToolVersion << '\n';
  return kExitSuccess;
}

} // namespace

int ExecuteRun(const RunOptions& options, const collaborators::CollaboratorSet& collaborators,
               const core::CancellationToken& cancel) {
  core::logging::Logger logger(options.log_level);
  const fs::path node_dir = ResolveNodeDir(options.node_dir);
  logger.Info("run requested", {{"node_dir", node_dir.string()},
                                {"output_root", options.output_root.string()},
                                {"runner", config::ToString(options.runner)},
                                {"dry_run", options.dry_run ? "true" : "false"}});

  config::RunConfig config;
  config::Project project;
  workflow::WorkflowCatalog catalog;
  if (const std::optional<int> exit_code =
          LoadInputs(node_dir, options.config_path, logger, config, project, catalog)) {
    return *exit_code;
  }

  pipeline::MatrixOptions matrix_options;
  matrix_options.only_platform = options.only_platform;
  matrix_options.through = options.through;
  matrix_options.runner = options.runner;
  matrix_options.output_root = options.output_root;
  matrix_options.workspace_root = options.workspace_root.empty()
                                      ? fs::temp_directory_path() / "comfy-test"
                                      : options.workspace_root;
  matrix_options.tool_version = kToolVersion;

  pipeline::PlatformMatrixRunner runner(config, project, catalog, collaborators, logger);
  core::errors::Failure failure;

  if (options.dry_run) {
    pipeline::RunPlan plan;
    if (!runner.Plan(matrix_options, plan, failure)) {
      std::cerr << "error: " << failure.message << '\n';
      return kExitConfigInvalid;
    }
    std::cout << pipeline::RenderPlanTable(plan);
    return kExitSuccess;
  }

  report::RunReport run_report;
  const bool completed = runner.Run(matrix_options, cancel, run_report, failure);
  if (!completed && failure.kind == core::errors::ErrorKind::kConfig) {
    logger.Error("run rejected", {{"error", failure.message}});
    std::cerr << "error: " << failure.message << '\n';
    return kExitConfigInvalid;
  }

  std::string error;
  fs::path report_path;
  if (!artifacts::WriteRunReportJson(run_report, options.output_root, report_path, error)) {
    logger.Error("failed to write run report", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  fs::path index_path;
  if (!artifacts::WriteReportIndexHtml(run_report, options.output_root, index_path, error)) {
    logger.Warn("failed to write report index", {{"error", error}});
  }
  logger.Info("run report written", {{"path", report_path.string()}});

  std::cout << report::RenderStatusTable(run_report);
  if (!completed) {
    std::cerr << "error: " << failure.message << '\n';
    return kExitFailure;
  }
  if (cancel.IsCancelled()) {
    std::cerr << "run cancelled\n";
  }
  return run_report.Succeeded() ? kExitSuccess : kExitFailure;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "init") {
    return CommandInit(args);
  }
  if (command == "run") {
    return CommandRun(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "publish") {
    return CommandPublish(args);
  }
  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace comfytest::cli
