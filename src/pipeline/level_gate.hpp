#pragma once

#include "config/levels.hpp"
#include "core/cancellation.hpp"
#include "report/run_report.hpp"

#include <array>
#include <chrono>
#include <functional>
#include <vector>

namespace comfytest::pipeline {

// One entry of the ordered level list a platform pipeline walks.
struct LevelDescriptor {
  config::Level level = config::Level::kSyntax;
  bool implicit = false;
  // Decided before the level would start; kNone means the level runs.
  report::SkipReason configuration_skip = report::SkipReason::kNone;
  // Returns a terminal result. A non-terminal status is treated as failed.
  std::function<report::LevelResult(const core::CancellationToken&)> run;
};

// Receives every transition in order. Called on the pipeline thread.
class LevelObserver {
public:
  virtual ~LevelObserver() = default;

  virtual void LevelStarted(config::Level level, bool implicit,
                            std::chrono::system_clock::time_point at) = 0;
  virtual void LevelFinished(const report::LevelResult& result) = 0;
};

// Runs the descriptors in order: run, observe the terminal status, gate the
// next one.
//
// Contract:
// - Levels never overlap; each reaches a terminal status before the next
//   starts, and every descriptor yields exactly one terminal result.
// - After a failure every later level is skipped as blocked (or cancelled
//   when `cancel` fired), whatever its configuration.
// - Configuration skips do not block later levels.
std::vector<report::LevelResult> RunLevelGate(const std::vector<LevelDescriptor>& descriptors,
                                              const core::CancellationToken& cancel,
                                              LevelObserver& observer);

} // namespace comfytest::pipeline
