#include "collaborators/local_server.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "collaborators/python_helpers.hpp"
#include "core/fs_utils.hpp"

#include <cstdlib>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace comfytest::collaborators {

namespace {

using core::errors::ErrorKind;

std::map<std::string, std::string> ServerEnvironment(const RunContext& context,
                                                     const fs::path& helper_dir) {
  std::map<std::string, std::string> env = context.env;
  std::string python_path = helper_dir.string();
  if (const char* inherited = std::getenv("PYTHONPATH"); inherited != nullptr && *inherited != 0) {
    python_path += ":" + std::string(inherited);
  }
  env["PYTHONPATH"] = python_path;
  if (context.runner == config::RunnerClass::kCpu) {
    env["CUDA_VISIBLE_DEVICES"] = "";
    if (context.project != nullptr && !context.project->cuda_packages.empty()) {
      std::string joined;
      for (const std::string& package : context.project->cuda_packages) {
        joined += (joined.empty() ? "" : ",") + package;
      }
      env[kMockPackagesEnvName] = joined;
    }
  }
  return env;
}

} // namespace

std::vector<std::string> ScanImportErrors(std::string_view server_log) {
  std::vector<std::string> errors;
  std::size_t start = 0;
  while (start < server_log.size()) {
    std::size_t end = server_log.find('\n', start);
    if (end == std::string_view::npos) {
      end = server_log.size();
    }
    std::string_view line = server_log.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    const bool cannot_import = line.find("Cannot import") != std::string_view::npos &&
                               line.find("module for custom nodes") != std::string_view::npos;
    if (cannot_import || line.find("IMPORT FAILED") != std::string_view::npos) {
      errors.emplace_back(line);
    }
    start = end + 1;
  }
  return errors;
}

LocalServerSession::LocalServerSession(core::process::ScopedProcess process, std::string base_url,
                                       const RunContext& context, Installation installation,
                                       fs::path helper_dir, LocalServerOptions options)
    : process_(std::move(process)),
      http_(std::move(base_url)),
      env_(ServerEnvironment(context, helper_dir)),
      logger_(context.logger),
      server_log_(context.output_dir / artifacts::kServerLogFileName),
      installation_(std::move(installation)),
      helper_dir_(std::move(helper_dir)),
      options_(options) {}

LocalServerSession::~LocalServerSession() {
  process_.Terminate();
  logger_.Debug("host server stopped", {{"url", http_.BaseUrl()}});
}

std::string LocalServerSession::BaseUrl() const {
  return http_.BaseUrl();
}

bool LocalServerSession::QueryNodeDefinitions(const core::CancellationToken& cancel,
                                              workflow::NodeDefinitionSet& definitions,
                                              std::string& error) {
  HttpResponse response;
  if (!http_.Get("/object_info", cancel, response, error)) {
    return false;
  }
  if (response.status != 200) {
    error = "/object_info returned HTTP " + std::to_string(response.status);
    return false;
  }
  return workflow::ParseObjectInfoText(response.body, definitions, error);
}

std::vector<std::string> LocalServerSession::ImportErrors() {
  std::string text;
  std::string error;
  if (!core::ReadTextFile(server_log_, text, error)) {
    logger_.Warn("server log unavailable for import scan", {{"error", error}});
    return {};
  }
  return ScanImportErrors(text);
}

bool LocalServerSession::RunHelper(const char* script_name,
                                   const std::vector<std::string>& class_names,
                                   const core::CancellationToken& cancel,
                                   core::json::Value& root, std::string& error) {
  core::process::ProcessSpec spec;
  spec.program = installation_.python.string();
  spec.args = {(helper_dir_ / script_name).string(), installation_.comfyui_dir.string(),
               installation_.custom_node_dir.parent_path().string(),
               installation_.custom_node_dir.filename().string()};
  spec.args.insert(spec.args.end(), class_names.begin(), class_names.end());
  spec.cwd = installation_.comfyui_dir;
  spec.env = env_;
  spec.timeout = options_.helper_timeout;
  spec.log_path = server_log_.parent_path() / artifacts::kLogsDirName / "helpers.log";

  core::process::ProcessResult result;
  if (!core::process::RunProcess(spec, cancel, result, error)) {
    return false;
  }
  if (result.outcome == core::process::ProcessOutcome::kTimedOut ||
      result.outcome == core::process::ProcessOutcome::kCancelled) {
    error = std::string(script_name) + " " + core::process::ToString(result.outcome);
    return false;
  }
  if (!ParseHelperOutput(result.output, root, error)) {
    error = std::string(script_name) + " (exit " + std::to_string(result.exit_code) + "): " + error;
    return false;
  }
  return true;
}

bool LocalServerSession::InspectNodes(const std::vector<std::string>& class_names,
                                      const core::CancellationToken& cancel,
                                      std::map<std::string, NodeInspection>& inspections,
                                      std::string& error) {
  core::json::Value root;
  if (!RunHelper(kInspectScriptFileName, class_names, cancel, root, error)) {
    return false;
  }
  if (const core::json::Value* failure = root.Find("error");
      failure != nullptr && failure->IsString()) {
    error = failure->string_value;
    return false;
  }
  const core::json::Value* classes = root.Find("classes");
  if (classes == nullptr || !classes->IsObject()) {
    error = "inspection result has no 'classes' object";
    return false;
  }
  for (const auto& [class_name, entry] : classes->object_value) {
    NodeInspection inspection;
    if (const core::json::Value* deps = entry.Find("dependencies");
        deps != nullptr && deps->IsArray()) {
      for (const core::json::Value& dep : deps->array_value) {
        if (dep.IsString()) {
          inspection.dependencies.push_back(dep.string_value);
        }
      }
    }
    if (const core::json::Value* resolved = entry.Find("entry_point_resolved");
        resolved != nullptr && resolved->IsBool()) {
      inspection.entry_point_resolved = resolved->bool_value;
    }
    if (const core::json::Value* arity = entry.Find("return_arity");
        arity != nullptr && arity->IsInteger()) {
      inspection.return_arity = static_cast<int>(arity->number_value);
    }
    inspections[class_name] = std::move(inspection);
  }
  return true;
}

bool LocalServerSession::InstantiateNodes(const std::vector<std::string>& class_names,
                                          const core::CancellationToken& cancel,
                                          std::map<std::string, InstantiationResult>& results,
                                          std::string& error) {
  core::json::Value root;
  if (!RunHelper(kInstantiateScriptFileName, class_names, cancel, root, error)) {
    return false;
  }
  // The package itself failed to import: every class fails the same way.
  if (const core::json::Value* failure = root.Find("error");
      failure != nullptr && failure->IsString()) {
    const core::json::Value* traceback = root.Find("traceback");
    for (const std::string& class_name : class_names) {
      results[class_name] = {.ok = false,
                             .message = failure->string_value,
                             .details = traceback != nullptr && traceback->IsString()
                                            ? traceback->string_value
                                            : std::string()};
    }
    return true;
  }
  const core::json::Value* classes = root.Find("classes");
  if (classes == nullptr || !classes->IsObject()) {
    error = "instantiation result has no 'classes' object";
    return false;
  }
  for (const auto& [class_name, entry] : classes->object_value) {
    InstantiationResult result;
    const core::json::Value* ok = entry.Find("ok");
    result.ok = ok != nullptr && ok->IsBool() && ok->bool_value;
    if (const core::json::Value* message = entry.Find("error");
        message != nullptr && message->IsString()) {
      result.message = message->string_value;
    }
    if (const core::json::Value* traceback = entry.Find("traceback");
        traceback != nullptr && traceback->IsString()) {
      result.details = traceback->string_value;
    }
    results[class_name] = std::move(result);
  }
  return true;
}

LocalServer::LocalServer(LocalServerOptions options) : options_(options) {}

StepOutcome LocalServer::Start(const RunContext& context, const Installation& installation,
                               const core::CancellationToken& cancel,
                               std::unique_ptr<ServerSession>& session) {
  const fs::path helper_dir = context.workspace / "comfy-test-helpers";
  std::string error;
  if (!WriteHelperScripts(helper_dir, error)) {
    return StepOutcome::Fail(ErrorKind::kRegistration, "write helper scripts: " + error);
  }

  const std::string port = std::to_string(context.server_port);
  core::process::ProcessSpec spec;
  spec.program = installation.python.string();
  spec.args = {(installation.comfyui_dir / "main.py").string(), "--listen", "127.0.0.1",
               "--port", port};
  if (context.runner == config::RunnerClass::kCpu) {
    spec.args.push_back("--cpu");
  }
  spec.cwd = installation.comfyui_dir;
  spec.env = ServerEnvironment(context, helper_dir);
  spec.log_path = context.output_dir / artifacts::kServerLogFileName;

  core::process::ScopedProcess process;
  if (!process.Start(spec, error)) {
    return StepOutcome::Fail(ErrorKind::kRegistration, "server start: " + error);
  }
  context.logger.Info("host server spawned",
                      {{"pid", std::to_string(process.Pid())}, {"port", port}});

  const HttpClient probe("http://127.0.0.1:" + port, std::chrono::seconds(5));
  const auto deadline = std::chrono::steady_clock::now() + options_.ready_timeout;
  while (true) {
    if (cancel.IsCancelled()) {
      return StepOutcome::Fail(ErrorKind::kCancelled, "server start cancelled");
    }
    if (!process.IsRunning()) {
      return StepOutcome::Fail(ErrorKind::kRegistration,
                               "server exited during startup (exit " +
                                   std::to_string(process.ExitCode()) + ")",
                               "see " + spec.log_path.string());
    }
    HttpResponse response;
    std::string probe_error;
    if (probe.Get("/system_stats", cancel, response, probe_error) && response.status == 200) {
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return StepOutcome::Fail(
          ErrorKind::kTimeout,
          "server not ready after " +
              std::to_string(
                  std::chrono::duration_cast<std::chrono::seconds>(options_.ready_timeout)
                      .count()) +
              "s",
          probe_error);
    }
    std::this_thread::sleep_for(options_.poll_interval);
  }

  session = std::make_unique<LocalServerSession>(std::move(process), probe.BaseUrl(), context,
                                                 installation, helper_dir, options_);
  StepOutcome outcome;
  outcome.artifacts.push_back(artifacts::kServerLogFileName);
  return outcome;
}

} // namespace comfytest::collaborators
