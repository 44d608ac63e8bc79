#ifndef COMFYTEST_TESTS_COMMON_FAKE_COLLABORATORS_HPP_
#define COMFYTEST_TESTS_COMMON_FAKE_COLLABORATORS_HPP_

#include "extension_fixtures.hpp"

#include "collaborators/collaborators.hpp"
#include "core/process/process_runner.hpp"
#include "workflow/node_definition.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace comfytest::tests::common {

// Calls observed across every platform thread.
struct FakeCallCounts {
  std::atomic<int> install{0};
  std::atomic<int> start{0};
  std::atomic<int> capture{0};
  std::atomic<int> execute{0};

  int Total() const {
    return install.load() + start.load() + capture.load() + execute.load();
  }
};

// Pretends to install; fails with `failure` on `fail_on` (every platform
// when unset and `fail` is true).
class FakeEnvironment final : public collaborators::EnvironmentCollaborator {
public:
  explicit FakeEnvironment(FakeCallCounts& counts) : counts_(counts) {}

  collaborators::StepOutcome Install(const collaborators::RunContext& context,
                                     const core::CancellationToken& /*cancel*/,
                                     collaborators::Installation& installation) override {
    ++counts_.install;
    installation.comfyui_dir = context.workspace / "ComfyUI";
    installation.python = context.workspace / ".venv" / "bin" / "python";
    // Same layout as LocalEnvironment: the extension folder keeps its name.
    installation.custom_node_dir =
        installation.comfyui_dir / "custom_nodes" /
        (context.project != nullptr ? context.project->node_dir.filename()
                                    : std::filesystem::path(kDemoExtensionName));
    const bool failing = fail && (!fail_on.has_value() || *fail_on == context.platform);
    if (failing) {
      return collaborators::StepOutcome::Fail(core::errors::ErrorKind::kEnvironment,
                                              "pip install failed", "No matching distribution");
    }
    return {};
  }

  bool fail = false;
  std::optional<config::PlatformId> fail_on;

private:
  FakeCallCounts& counts_;
};

class FakeSession final : public collaborators::ServerSession {
public:
  FakeSession(std::string object_info, std::map<std::string, collaborators::NodeInspection> inspections,
              std::set<std::string> failing_classes, std::vector<std::string> import_errors)
      : object_info_(std::move(object_info)),
        inspections_(std::move(inspections)),
        failing_classes_(std::move(failing_classes)),
        import_errors_(std::move(import_errors)) {}

  std::string BaseUrl() const override {
    return "http://127.0.0.1:0";
  }

  bool QueryNodeDefinitions(const core::CancellationToken& /*cancel*/,
                            workflow::NodeDefinitionSet& definitions,
                            std::string& error) override {
    return workflow::ParseObjectInfoText(object_info_, definitions, error);
  }

  std::vector<std::string> ImportErrors() override {
    return import_errors_;
  }

  bool InspectNodes(const std::vector<std::string>& class_names,
                    const core::CancellationToken& /*cancel*/,
                    std::map<std::string, collaborators::NodeInspection>& inspections,
                    std::string& /*error*/) override {
    for (const std::string& class_name : class_names) {
      const auto found = inspections_.find(class_name);
      if (found != inspections_.end()) {
        inspections[class_name] = found->second;
      }
    }
    return true;
  }

  bool InstantiateNodes(const std::vector<std::string>& class_names,
                        const core::CancellationToken& /*cancel*/,
                        std::map<std::string, collaborators::InstantiationResult>& results,
                        std::string& /*error*/) override {
    for (const std::string& class_name : class_names) {
      if (failing_classes_.count(class_name) != 0U) {
        results[class_name] = {.ok = false, .message = "RuntimeError: no CUDA device", .details = {}};
      } else {
        results[class_name] = {.ok = true, .message = {}, .details = {}};
      }
    }
    return true;
  }

private:
  std::string object_info_;
  std::map<std::string, collaborators::NodeInspection> inspections_;
  std::set<std::string> failing_classes_;
  std::vector<std::string> import_errors_;
};

// Serves the demo `/object_info`; DemoFlash depends on flash-attn.
class FakeServer final : public collaborators::ServerCollaborator {
public:
  explicit FakeServer(FakeCallCounts& counts) : counts_(counts) {
    inspections["DemoLoader"] = {.dependencies = {"numpy", "pillow"},
                                 .entry_point_resolved = true,
                                 .return_arity = 1};
    inspections["DemoFlash"] = {.dependencies = {"torch", "Flash-Attn"},
                                .entry_point_resolved = true,
                                .return_arity = 1};
    inspections["DemoSaver"] = {.dependencies = {"pillow"},
                                .entry_point_resolved = true,
                                .return_arity = 0};
  }

  collaborators::StepOutcome Start(const collaborators::RunContext& /*context*/,
                                   const collaborators::Installation& /*installation*/,
                                   const core::CancellationToken& /*cancel*/,
                                   std::unique_ptr<collaborators::ServerSession>& session) override {
    ++counts_.start;
    session = std::make_unique<FakeSession>(object_info, inspections, failing_classes,
                                            import_errors);
    return {};
  }

  std::string object_info = DemoObjectInfoJson();
  std::map<std::string, collaborators::NodeInspection> inspections;
  std::set<std::string> failing_classes;
  std::vector<std::string> import_errors;

private:
  FakeCallCounts& counts_;
};

// Reports `status` for every workflow; only a capture writes the PNG.
class FakeScreenshot final : public collaborators::ScreenshotCollaborator {
public:
  explicit FakeScreenshot(FakeCallCounts& counts) : counts_(counts) {}

  collaborators::ScreenshotOutcome Capture(const collaborators::RunContext& /*context*/,
                                           const collaborators::ServerSession& /*session*/,
                                           const workflow::WorkflowEntry& /*workflow*/,
                                           const std::filesystem::path& output_path,
                                           const core::CancellationToken& /*cancel*/) override {
    ++counts_.capture;
    if (status == collaborators::ScreenshotStatus::kCaptured) {
      WriteFileOrFail(output_path, "png");
    }
    return {.status = status, .message = message, .artifact = {}};
  }

  collaborators::ScreenshotStatus status = collaborators::ScreenshotStatus::kCaptured;
  std::string message;

private:
  FakeCallCounts& counts_;
};

// Completes every prompt, or (with `sleep_seconds`) runs a real `sleep`
// child under the call's cancellation token and records its pid.
class FakeExecution final : public collaborators::ExecutionCollaborator {
public:
  explicit FakeExecution(FakeCallCounts& counts) : counts_(counts) {}

  collaborators::ExecutionOutcome Execute(const collaborators::RunContext& /*context*/,
                                          collaborators::ServerSession& /*session*/,
                                          const collaborators::ExecutionRequest& request,
                                          const core::CancellationToken& cancel) override {
    ++counts_.execute;
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      prompts_.push_back(request.prompt);
    }
    collaborators::ExecutionOutcome outcome;
    if (sleep_seconds == 0) {
      outcome.status = collaborators::ExecutionStatus::kCompleted;
      return outcome;
    }

    core::process::ProcessSpec spec;
    spec.program = "sleep";
    spec.args = {std::to_string(sleep_seconds)};
    spec.log_path = request.log_path;
    core::process::ProcessResult result;
    std::string error;
    if (!core::process::RunProcess(spec, cancel, result, error)) {
      outcome.status = collaborators::ExecutionStatus::kFailed;
      outcome.message = error;
      return outcome;
    }
    last_pid.store(result.pid);
    outcome.status = result.outcome == core::process::ProcessOutcome::kExited && result.exit_code == 0
                         ? collaborators::ExecutionStatus::kCompleted
                         : collaborators::ExecutionStatus::kCancelled;
    return outcome;
  }

  std::vector<core::json::Value> Prompts() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return prompts_;
  }

  int sleep_seconds = 0;
  std::atomic<int> last_pid{-1};

private:
  FakeCallCounts& counts_;
  mutable std::mutex mutex_;
  std::vector<core::json::Value> prompts_;
};

// Owns one of each fake and exposes them as a CollaboratorSet.
struct FakeCollaborators {
  FakeCallCounts counts;
  FakeEnvironment environment{counts};
  FakeServer server{counts};
  FakeScreenshot screenshot{counts};
  FakeExecution execution{counts};

  collaborators::CollaboratorSet Set() {
    return {.environment = &environment,
            .server = &server,
            .screenshot = &screenshot,
            .execution = &execution};
  }
};

} // namespace comfytest::tests::common

#endif // COMFYTEST_TESTS_COMMON_FAKE_COLLABORATORS_HPP_
