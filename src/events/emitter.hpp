#pragma once

#include "config/levels.hpp"
#include "config/run_config.hpp"
#include "core/errors/error_kind.hpp"
#include "events/event_model.hpp"
#include "report/run_report.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace comfytest::events {

// Thin event facade used by the level pipeline to keep payload contracts
// consistent while still writing the same JSONL event format.
//
// One emitter per platform; workflows of one level may finish concurrently,
// so appends are serialized.
class Emitter {
public:
  struct RunStartedEvent {
    std::chrono::system_clock::time_point ts{};
    config::PlatformId platform = config::PlatformId::kLinux;
    config::RunnerClass runner = config::RunnerClass::kCpu;
    std::string project;
    std::string comfyui_version;
    std::string python_version;
    std::uint16_t server_port = 0;
    // `syntax,install,registration`
    std::string levels;
  };

  struct LevelStartedEvent {
    std::chrono::system_clock::time_point ts{};
    config::PlatformId platform = config::PlatformId::kLinux;
    config::Level level = config::Level::kSyntax;
    bool implicit = false;
  };

  struct LevelFinishedEvent {
    std::chrono::system_clock::time_point ts{};
    config::PlatformId platform = config::PlatformId::kLinux;
    config::Level level = config::Level::kSyntax;
    report::LevelStatus status = report::LevelStatus::kPassed;
    report::SkipReason skip_reason = report::SkipReason::kNone;
    core::errors::ErrorKind failure_kind = core::errors::ErrorKind::kNone;
    std::string message;
    std::size_t diagnostics = 0;
    std::chrono::milliseconds elapsed{0};
  };

  struct WorkflowFinishedEvent {
    std::chrono::system_clock::time_point ts{};
    config::PlatformId platform = config::PlatformId::kLinux;
    config::Level level = config::Level::kExecution;
    std::string workflow;
    report::LevelStatus status = report::LevelStatus::kPassed;
    core::errors::ErrorKind failure_kind = core::errors::ErrorKind::kNone;
    std::chrono::milliseconds elapsed{0};
  };

  struct RunFinishedEvent {
    std::chrono::system_clock::time_point ts{};
    config::PlatformId platform = config::PlatformId::kLinux;
    bool succeeded = false;
    bool cancelled = false;
  };

  explicit Emitter(std::filesystem::path output_dir);

  Emitter(const Emitter&) = delete;
  Emitter& operator=(const Emitter&) = delete;

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error) const;

  bool EmitRunStarted(const RunStartedEvent& event, std::string& error) const;
  bool EmitLevelStarted(const LevelStartedEvent& event, std::string& error) const;
  bool EmitLevelFinished(const LevelFinishedEvent& event, std::string& error) const;
  bool EmitWorkflowFinished(const WorkflowFinishedEvent& event, std::string& error) const;
  bool EmitRunFinished(const RunFinishedEvent& event, std::string& error) const;
  bool EmitWarning(config::PlatformId platform, std::string message, std::string& error) const;
  bool EmitError(config::PlatformId platform, std::string message, std::string& error) const;

  const std::filesystem::path& EventsPath() const {
    return events_path_;
  }

private:
  std::filesystem::path output_dir_;
  mutable std::filesystem::path events_path_;
  mutable std::mutex mutex_;
};

} // namespace comfytest::events
