#pragma once

#include "report/run_report.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace comfytest::report {

// Owns the RunReport while platform pipelines push results into it.
//
// Contract:
// - Thread safe; every platform thread pushes through the same instance.
// - A level moves pending -> running -> terminal exactly once.
// - Once FinalizePlatform succeeds, that platform's sub-tree is frozen and
//   further pushes for it are rejected.
// - Snapshot() returns an independent copy; later pushes never alter it.
class ResultAggregator {
public:
  ResultAggregator(ProjectSummary project, std::string tool_version);

  void MarkRunStarted(std::chrono::system_clock::time_point at);
  void MarkRunFinished(std::chrono::system_clock::time_point at);

  // Platforms are kept in registration order; callers register them in
  // matrix order before any pipeline starts.
  bool RegisterPlatform(config::PlatformId platform, config::RunnerClass runner,
                        std::uint16_t server_port, std::string& error);

  bool BeginLevel(config::PlatformId platform, config::Level level, bool implicit,
                  std::chrono::system_clock::time_point at, std::string& error);

  // Stores a terminal result. The level must be pending (a skip) or running.
  bool RecordLevel(config::PlatformId platform, LevelResult result, std::string& error);

  // Requires every level of the platform to be terminal.
  bool FinalizePlatform(config::PlatformId platform, std::string& error);

  bool IsFinalized(config::PlatformId platform) const;

  RunReport Snapshot() const;

private:
  PlatformReport* FindLocked(config::PlatformId platform, std::string& error);

  mutable std::mutex mutex_;
  RunReport report_;
};

} // namespace comfytest::report
