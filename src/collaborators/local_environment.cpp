#include "collaborators/local_environment.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"
#include "core/process/process_runner.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace comfytest::collaborators {

namespace {

using core::errors::ErrorKind;

constexpr std::size_t kOutputTailBytes = 4096;

std::string OutputTail(const std::string& output) {
  if (output.size() <= kOutputTailBytes) {
    return output;
  }
  return output.substr(output.size() - kOutputTailBytes);
}

// Runs one install command; a non-empty result is the failure to report.
std::optional<StepOutcome> RunStep(const RunContext& context, const core::CancellationToken& cancel,
                                   const std::string& label, std::string program,
                                   std::vector<std::string> args, const fs::path& cwd,
                                   std::map<std::string, std::string> extra_env = {}) {
  core::process::ProcessSpec spec;
  spec.program = std::move(program);
  spec.args = std::move(args);
  spec.cwd = cwd;
  spec.env = context.env;
  for (auto& [key, value] : extra_env) {
    spec.env[key] = std::move(value);
  }
  spec.log_path = context.output_dir / artifacts::kInstallLogFileName;

  context.logger.Info("install step", {{"step", label}});
  core::process::ProcessResult result;
  std::string error;
  if (!core::process::RunProcess(spec, cancel, result, error)) {
    return StepOutcome::Fail(ErrorKind::kEnvironment, label + ": " + error);
  }
  switch (result.outcome) {
  case core::process::ProcessOutcome::kCancelled:
    return StepOutcome::Fail(ErrorKind::kCancelled, label + " cancelled");
  case core::process::ProcessOutcome::kTimedOut:
    return StepOutcome::Fail(ErrorKind::kTimeout, label + " timed out");
  case core::process::ProcessOutcome::kSignaled:
  case core::process::ProcessOutcome::kExited:
    break;
  }
  if (result.exit_code != 0) {
    return StepOutcome::Fail(ErrorKind::kEnvironment,
                             label + " failed (exit " + std::to_string(result.exit_code) + ")",
                             OutputTail(result.output));
  }
  return std::nullopt;
}

std::vector<std::string> PipInstallArgs(const RunContext& context, const fs::path& python) {
  std::vector<std::string> args = {"pip", "install", "--python", python.string()};
  if (context.runner == config::RunnerClass::kGpu) {
    args.insert(args.end(), {"--index-url", kPytorchCudaIndex, "--extra-index-url", kPypiIndex});
  }
  return args;
}

} // namespace

LocalEnvironment::LocalEnvironment(std::string repository) : repository_(std::move(repository)) {}

bool CopyExtensionTree(const fs::path& source, const fs::path& target, std::string& error) {
  std::error_code ec;
  fs::create_directories(target, ec);
  if (ec) {
    error = "failed to create '" + target.string() + "': " + ec.message();
    return false;
  }
  for (fs::directory_iterator it(source, ec), end; !ec && it != end; it.increment(ec)) {
    const fs::path& entry = it->path();
    const std::string name = entry.filename().string();
    if (it->is_directory(ec)) {
      if (config::IsIgnoredDirectoryName(name)) {
        continue;
      }
      if (!CopyExtensionTree(entry, target / name, error)) {
        return false;
      }
      continue;
    }
    fs::copy_file(entry, target / name, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      error = "failed to copy '" + entry.string() + "': " + ec.message();
      return false;
    }
  }
  if (ec) {
    error = "failed to list '" + source.string() + "': " + ec.message();
    return false;
  }
  return true;
}

StepOutcome LocalEnvironment::Install(const RunContext& context,
                                      const core::CancellationToken& cancel,
                                      Installation& installation) {
  if (context.project == nullptr) {
    return StepOutcome::Fail(ErrorKind::kEnvironment, "no project in run context");
  }
  const config::Project& project = *context.project;
  std::string error;
  if (!core::EnsureDirectory(context.workspace, error) ||
      !artifacts::EnsureOutputDir(context.output_dir, error)) {
    return StepOutcome::Fail(ErrorKind::kEnvironment, error);
  }

  installation.comfyui_dir = context.workspace / "ComfyUI";
  const fs::path venv_dir = context.workspace / ".venv";
  installation.python = venv_dir / "bin" / "python";
  installation.custom_node_dir =
      installation.comfyui_dir / "custom_nodes" / project.node_dir.filename();

  std::error_code ec;
  fs::remove_all(installation.comfyui_dir, ec);

  std::vector<std::string> clone_args = {"clone", "--depth", "1"};
  if (project.comfyui_version != "latest") {
    clone_args.insert(clone_args.end(), {"--branch", project.comfyui_version});
  }
  clone_args.insert(clone_args.end(), {repository_, installation.comfyui_dir.string()});
  if (auto failure = RunStep(context, cancel, "clone ComfyUI " + project.comfyui_version, "git",
                             clone_args, context.workspace)) {
    return *failure;
  }

  if (auto failure = RunStep(context, cancel, "create venv (python " + project.python_version + ")",
                             "uv",
                             {"venv", venv_dir.string(), "--python", project.python_version},
                             context.workspace)) {
    return *failure;
  }

  const fs::path host_requirements = installation.comfyui_dir / "requirements.txt";
  if (fs::is_regular_file(host_requirements, ec)) {
    std::vector<std::string> args = PipInstallArgs(context, installation.python);
    args.insert(args.end(), {"-r", host_requirements.string()});
    if (auto failure = RunStep(context, cancel, "install ComfyUI requirements", "uv", args,
                               context.workspace)) {
      return *failure;
    }
  }

  if (!CopyExtensionTree(project.node_dir, installation.custom_node_dir, error)) {
    return StepOutcome::Fail(ErrorKind::kEnvironment, "stage extension: " + error);
  }

  const fs::path node_requirements = installation.custom_node_dir / "requirements.txt";
  if (fs::is_regular_file(node_requirements, ec)) {
    std::vector<std::string> args = PipInstallArgs(context, installation.python);
    args.insert(args.end(), {"-r", node_requirements.string()});
    if (auto failure = RunStep(context, cancel, "install extension requirements", "uv", args,
                               installation.custom_node_dir)) {
      return *failure;
    }
  }

  const fs::path install_script = installation.custom_node_dir / "install.py";
  if (fs::is_regular_file(install_script, ec)) {
    if (auto failure = RunStep(
            context, cancel, "run install.py", installation.python.string(),
            {install_script.string()}, installation.custom_node_dir,
            {{"COMFY_ENV_CACHE_DIR", (context.workspace / ".comfy-env").string()}})) {
      return *failure;
    }
  }

  StepOutcome outcome;
  outcome.artifacts.push_back(artifacts::kInstallLogFileName);
  return outcome;
}

} // namespace comfytest::collaborators
