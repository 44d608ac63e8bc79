#include "events/emitter.hpp"

#include "events/jsonl_writer.hpp"

#include <utility>

namespace comfytest::events {

Emitter::Emitter(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) const {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);
  const std::lock_guard<std::mutex> lock(mutex_);
  return AppendEventJsonl(event, output_dir_, events_path_, error);
}

bool Emitter::EmitRunStarted(const RunStartedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kRunStarted, event.ts,
                 {
                     {"platform", config::ToString(event.platform)},
                     {"runner", config::ToString(event.runner)},
                     {"project", event.project},
                     {"comfyui_version", event.comfyui_version},
                     {"python_version", event.python_version},
                     {"server_port", std::to_string(event.server_port)},
                     {"levels", event.levels},
                 },
                 error);
}

bool Emitter::EmitLevelStarted(const LevelStartedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kLevelStarted, event.ts,
                 {
                     {"platform", config::ToString(event.platform)},
                     {"level", config::ToString(event.level)},
                     {"implicit", event.implicit ? "true" : "false"},
                 },
                 error);
}

bool Emitter::EmitLevelFinished(const LevelFinishedEvent& event, std::string& error) const {
  std::map<std::string, std::string> payload = {
      {"platform", config::ToString(event.platform)},
      {"level", config::ToString(event.level)},
      {"status", report::ToString(event.status)},
      {"diagnostics", std::to_string(event.diagnostics)},
      {"elapsed_ms", std::to_string(event.elapsed.count())},
  };
  if (event.skip_reason != report::SkipReason::kNone) {
    payload["skip_reason"] = report::ToString(event.skip_reason);
  }
  if (event.failure_kind != core::errors::ErrorKind::kNone) {
    payload["failure_kind"] = core::errors::ToString(event.failure_kind);
  }
  if (!event.message.empty()) {
    payload["message"] = event.message;
  }
  return EmitRaw(EventType::kLevelFinished, event.ts, std::move(payload), error);
}

bool Emitter::EmitWorkflowFinished(const WorkflowFinishedEvent& event, std::string& error) const {
  std::map<std::string, std::string> payload = {
      {"platform", config::ToString(event.platform)},
      {"level", config::ToString(event.level)},
      {"workflow", event.workflow},
      {"status", report::ToString(event.status)},
      {"elapsed_ms", std::to_string(event.elapsed.count())},
  };
  if (event.failure_kind != core::errors::ErrorKind::kNone) {
    payload["failure_kind"] = core::errors::ToString(event.failure_kind);
  }
  return EmitRaw(EventType::kWorkflowFinished, event.ts, std::move(payload), error);
}

bool Emitter::EmitRunFinished(const RunFinishedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kRunFinished, event.ts,
                 {
                     {"platform", config::ToString(event.platform)},
                     {"succeeded", event.succeeded ? "true" : "false"},
                     {"cancelled", event.cancelled ? "true" : "false"},
                 },
                 error);
}

bool Emitter::EmitWarning(config::PlatformId platform, std::string message,
                          std::string& error) const {
  return EmitRaw(EventType::kWarning, std::chrono::system_clock::now(),
                 {
                     {"platform", config::ToString(platform)},
                     {"message", std::move(message)},
                 },
                 error);
}

bool Emitter::EmitError(config::PlatformId platform, std::string message,
                        std::string& error) const {
  return EmitRaw(EventType::kError, std::chrono::system_clock::now(),
                 {
                     {"platform", config::ToString(platform)},
                     {"message", std::move(message)},
                 },
                 error);
}

} // namespace comfytest::events
