#include "pipeline/level_gate.hpp"

#include <string>
#include <utility>

namespace comfytest::pipeline {

namespace {

report::LevelResult Skipped(const LevelDescriptor& descriptor, report::SkipReason reason) {
  report::LevelResult result;
  result.level = descriptor.level;
  result.implicit = descriptor.implicit;
  result.status = report::LevelStatus::kSkipped;
  result.skip_reason = reason;
  return result;
}

} // namespace

std::vector<report::LevelResult> RunLevelGate(const std::vector<LevelDescriptor>& descriptors,
                                              const core::CancellationToken& cancel,
                                              LevelObserver& observer) {
  std::vector<report::LevelResult> results;
  results.reserve(descriptors.size());
  bool blocked = false;

  for (const LevelDescriptor& descriptor : descriptors) {
    report::LevelResult result;
    if (blocked) {
      result = Skipped(descriptor, cancel.IsCancelled() ? report::SkipReason::kCancelled
                                                        : report::SkipReason::kBlocked);
    } else if (descriptor.configuration_skip != report::SkipReason::kNone) {
      result = Skipped(descriptor, descriptor.configuration_skip);
    } else if (cancel.IsCancelled()) {
      result = Skipped(descriptor, report::SkipReason::kCancelled);
      blocked = true;
    } else {
      const auto started_at = std::chrono::system_clock::now();
      observer.LevelStarted(descriptor.level, descriptor.implicit, started_at);
      result = descriptor.run(cancel);
      result.level = descriptor.level;
      result.implicit = descriptor.implicit;
      result.started_at = started_at;
      result.finished_at = std::chrono::system_clock::now();
      if (!report::IsTerminal(result.status)) {
        result.status = report::LevelStatus::kFailed;
      }
      if (result.status == report::LevelStatus::kFailed) {
        if (!result.failure.has_value()) {
          result.failure = core::errors::Failure{
              .kind = cancel.IsCancelled() ? core::errors::ErrorKind::kCancelled
                                           : core::errors::ErrorKind::kExecution,
              .message = std::string(config::ToDisplayName(descriptor.level)) +
                         " did not report a result",
              .details = {}};
        }
        blocked = true;
      }
    }
    observer.LevelFinished(result);
    results.push_back(std::move(result));
  }
  return results;
}

} // namespace comfytest::pipeline
