#pragma once

#include "config/project.hpp"
#include "config/run_config.hpp"
#include "core/cancellation.hpp"
#include "core/errors/error_kind.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "report/run_report.hpp"
#include "workflow/discovery.hpp"
#include "workflow/node_definition.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace comfytest::collaborators {

// Name and value of the CUDA wheel resolution hint placed in every
// collaborator environment.
inline constexpr const char* kCudaVersionEnvName = "COMFY_ENV_CUDA_VERSION";
inline constexpr const char* kCudaVersionHint = "12.8";

// Run-scoped context handed to every collaborator call of one platform
// pipeline. Nothing here is process-global: two platforms never share a
// workspace, a port or an environment map.
struct RunContext {
  config::PlatformId platform = config::PlatformId::kLinux;
  config::RunnerClass runner = config::RunnerClass::kCpu;
  const config::Project* project = nullptr;
  // Exclusive scratch directory (host checkout, virtual environment).
  std::filesystem::path workspace;
  // `<results>/<platform>`: logs, screenshots, events.
  std::filesystem::path output_dir;
  // Layered over the inherited environment of every spawned process.
  std::map<std::string, std::string> env;
  std::uint16_t server_port = 0;
  // windows_portable only.
  std::string portable_version;
  core::logging::Logger logger;
};

// Uniform result of a collaborator step. `failure.kind` is set when !ok.
struct StepOutcome {
  bool ok = true;
  core::errors::Failure failure;
  std::vector<std::string> warnings;
  // Paths relative to RunContext::output_dir.
  std::vector<std::string> artifacts;

  static StepOutcome Fail(core::errors::ErrorKind kind, std::string message,
                          std::string details = {}) {
    StepOutcome outcome;
    outcome.ok = false;
    outcome.failure = {.kind = kind, .message = std::move(message), .details = std::move(details)};
    return outcome;
  }
};

// Where INSTALL put the host application and its isolated interpreter.
struct Installation {
  std::filesystem::path comfyui_dir;
  std::filesystem::path python;
  std::filesystem::path custom_node_dir;
};

// Environment collaborator: host checkout, isolated runtime, extension and
// dependency installation.
class EnvironmentCollaborator {
public:
  virtual ~EnvironmentCollaborator() = default;

  virtual StepOutcome Install(const RunContext& context, const core::CancellationToken& cancel,
                              Installation& installation) = 0;
};

// What the registration helper learned about one node class by importing it.
struct NodeInspection {
  std::vector<std::string> dependencies;
  std::optional<bool> entry_point_resolved;
  std::optional<int> return_arity;
};

struct InstantiationResult {
  bool ok = false;
  std::string message;
  std::string details;
};

// A running host application server owned by one platform pipeline.
// Destroying the session stops the server and reclaims its process.
class ServerSession {
public:
  virtual ~ServerSession() = default;

  virtual std::string BaseUrl() const = 0;

  // `/object_info`, parsed.
  virtual bool QueryNodeDefinitions(const core::CancellationToken& cancel,
                                    workflow::NodeDefinitionSet& definitions,
                                    std::string& error) = 0;

  // Custom-node import failures reported by the server during startup.
  virtual std::vector<std::string> ImportErrors() = 0;

  // Dependency closure, entry point resolution and return arity per class.
  virtual bool InspectNodes(const std::vector<std::string>& class_names,
                            const core::CancellationToken& cancel,
                            std::map<std::string, NodeInspection>& inspections,
                            std::string& error) = 0;

  // Constructs each class once in isolation. Per-class failures land in
  // `results`; false means the helper itself could not run.
  virtual bool InstantiateNodes(const std::vector<std::string>& class_names,
                                const core::CancellationToken& cancel,
                                std::map<std::string, InstantiationResult>& results,
                                std::string& error) = 0;
};

class ServerCollaborator {
public:
  virtual ~ServerCollaborator() = default;

  virtual StepOutcome Start(const RunContext& context, const Installation& installation,
                            const core::CancellationToken& cancel,
                            std::unique_ptr<ServerSession>& session) = 0;
};

enum class ScreenshotStatus {
  kCaptured,
  // Tool ran but the capture is unusable; reported as a level warning.
  kWarning,
  // No screenshot tool configured or installed; reported as a warning.
  kUnavailable,
  // The tool itself failed to run; fails STATIC_CAPTURE.
  kError,
};

struct ScreenshotOutcome {
  ScreenshotStatus status = ScreenshotStatus::kCaptured;
  std::string message;
  // Relative to RunContext::output_dir.
  std::string artifact;
};

// Renders a workflow in the frontend without executing it.
class ScreenshotCollaborator {
public:
  virtual ~ScreenshotCollaborator() = default;

  virtual ScreenshotOutcome Capture(const RunContext& context, const ServerSession& session,
                                    const workflow::WorkflowEntry& workflow,
                                    const std::filesystem::path& output_path,
                                    const core::CancellationToken& cancel) = 0;
};

enum class ExecutionStatus {
  kCompleted,
  kFailed,
  kTimedOut,
  kCancelled,
};

inline const char* ToString(ExecutionStatus status) {
  switch (status) {
  case ExecutionStatus::kCompleted:
    return "completed";
  case ExecutionStatus::kFailed:
    return "failed";
  case ExecutionStatus::kTimedOut:
    return "timed_out";
  case ExecutionStatus::kCancelled:
    return "cancelled";
  }
  return "failed";
}

struct ExecutionRequest {
  std::string workflow;
  // Host `/prompt` graph.
  core::json::Value prompt;
  std::filesystem::path log_path;
  // Zero means no deadline. The pipeline enforces it as well.
  std::chrono::milliseconds timeout{0};
};

struct ExecutionOutcome {
  ExecutionStatus status = ExecutionStatus::kCompleted;
  std::string message;
  std::string details;
  // Node-level errors reported by the host.
  std::vector<report::Diagnostic> diagnostics;
  // Files the graph produced, relative to RunContext::output_dir.
  std::vector<std::string> outputs;
  std::chrono::milliseconds elapsed{0};
};

// Runs a prompt end to end on a running server.
//
// Contract:
// - Must return promptly once `cancel` is cancelled, after releasing every
//   process or connection it acquired.
class ExecutionCollaborator {
public:
  virtual ~ExecutionCollaborator() = default;

  virtual ExecutionOutcome Execute(const RunContext& context, ServerSession& session,
                                   const ExecutionRequest& request,
                                   const core::CancellationToken& cancel) = 0;
};

struct PublishRequest {
  std::filesystem::path results_dir;
  // `owner/repo`
  std::string repo;
  std::string branch = "gh-pages";
};

class Publisher {
public:
  virtual ~Publisher() = default;

  virtual bool Publish(const PublishRequest& request, const core::CancellationToken& cancel,
                       const core::logging::Logger& logger, std::string& error) = 0;
};

// Non-owning bundle handed to the platform matrix; the caller keeps the
// collaborators alive for the whole run. Implementations must tolerate calls
// from several platform threads at once.
struct CollaboratorSet {
  EnvironmentCollaborator* environment = nullptr;
  ServerCollaborator* server = nullptr;
  ScreenshotCollaborator* screenshot = nullptr;
  ExecutionCollaborator* execution = nullptr;
};

} // namespace comfytest::collaborators
