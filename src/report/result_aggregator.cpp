#include "report/result_aggregator.hpp"

#include <utility>

namespace comfytest::report {

ResultAggregator::ResultAggregator(ProjectSummary project, std::string tool_version) {
  report_.project = std::move(project);
  report_.tool_version = std::move(tool_version);
}

void ResultAggregator::MarkRunStarted(std::chrono::system_clock::time_point at) {
  const std::lock_guard<std::mutex> lock(mutex_);
  report_.started_at = at;
}

void ResultAggregator::MarkRunFinished(std::chrono::system_clock::time_point at) {
  const std::lock_guard<std::mutex> lock(mutex_);
  report_.finished_at = at;
}

PlatformReport* ResultAggregator::FindLocked(config::PlatformId platform, std::string& error) {
  for (PlatformReport& entry : report_.platforms) {
    if (entry.platform == platform) {
      if (entry.finalized) {
        error = std::string("platform '") + config::ToString(platform) +
                "' is finalized and cannot be modified";
        return nullptr;
      }
      return &entry;
    }
  }
  error = std::string("platform '") + config::ToString(platform) + "' is not registered";
  return nullptr;
}

bool ResultAggregator::RegisterPlatform(config::PlatformId platform, config::RunnerClass runner,
                                        std::uint16_t server_port, std::string& error) {
  const std::lock_guard<std::mutex> lock(mutex_);
  for (const PlatformReport& entry : report_.platforms) {
    if (entry.platform == platform) {
      error = std::string("platform '") + config::ToString(platform) + "' already registered";
      return false;
    }
  }
  PlatformReport entry;
  entry.platform = platform;
  entry.runner = runner;
  entry.server_port = server_port;
  report_.platforms.push_back(std::move(entry));
  return true;
}

bool ResultAggregator::BeginLevel(config::PlatformId platform, config::Level level, bool implicit,
                                  std::chrono::system_clock::time_point at, std::string& error) {
  const std::lock_guard<std::mutex> lock(mutex_);
  PlatformReport* entry = FindLocked(platform, error);
  if (entry == nullptr) {
    return false;
  }
  LevelResult& result = entry->At(level);
  if (result.status != LevelStatus::kPending) {
    error = std::string("level ") + config::ToDisplayName(level) + " on " +
            config::ToString(platform) + " already " + ToString(result.status);
    return false;
  }
  result.status = LevelStatus::kRunning;
  result.implicit = implicit;
  result.started_at = at;
  return true;
}

bool ResultAggregator::RecordLevel(config::PlatformId platform, LevelResult result,
                                   std::string& error) {
  const std::lock_guard<std::mutex> lock(mutex_);
  PlatformReport* entry = FindLocked(platform, error);
  if (entry == nullptr) {
    return false;
  }
  if (!IsTerminal(result.status)) {
    error = std::string("level ") + config::ToDisplayName(result.level) +
            " result must be terminal, got " + ToString(result.status);
    return false;
  }
  LevelResult& slot = entry->At(result.level);
  if (IsTerminal(slot.status)) {
    error = std::string("level ") + config::ToDisplayName(result.level) + " on " +
            config::ToString(platform) + " already " + ToString(slot.status);
    return false;
  }
  if (slot.status == LevelStatus::kRunning) {
    if (!result.started_at.has_value()) {
      result.started_at = slot.started_at;
    }
    result.implicit = result.implicit || slot.implicit;
  }
  slot = std::move(result);
  return true;
}

bool ResultAggregator::FinalizePlatform(config::PlatformId platform, std::string& error) {
  const std::lock_guard<std::mutex> lock(mutex_);
  PlatformReport* entry = FindLocked(platform, error);
  if (entry == nullptr) {
    return false;
  }
  for (const LevelResult& result : entry->levels) {
    if (!IsTerminal(result.status)) {
      error = std::string("cannot finalize ") + config::ToString(platform) + ": level " +
              config::ToDisplayName(result.level) + " is " + ToString(result.status);
      return false;
    }
  }
  entry->finalized = true;
  return true;
}

bool ResultAggregator::IsFinalized(config::PlatformId platform) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  const PlatformReport* entry = report_.FindPlatform(platform);
  return entry != nullptr && entry->finalized;
}

RunReport ResultAggregator::Snapshot() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return report_;
}

} // namespace comfytest::report
