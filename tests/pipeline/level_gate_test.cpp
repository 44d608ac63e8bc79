#include "pipeline/level_gate.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <vector>

namespace {

using comfytest::config::Level;
using comfytest::report::LevelResult;
using comfytest::report::LevelStatus;
using comfytest::report::SkipReason;

class RecordingObserver final : public comfytest::pipeline::LevelObserver {
public:
  void LevelStarted(Level level, bool /*implicit*/,
                    std::chrono::system_clock::time_point /*at*/) override {
    started.push_back(level);
  }
  void LevelFinished(const LevelResult& result) override {
    finished.push_back(result.level);
  }

  std::vector<Level> started;
  std::vector<Level> finished;
};

comfytest::pipeline::LevelDescriptor Passing(Level level, int& runs) {
  return {.level = level, .run = [&runs](const comfytest::core::CancellationToken&) {
            ++runs;
            LevelResult result;
            result.status = LevelStatus::kPassed;
            return result;
          }};
}

} // namespace

TEST_CASE("A failed level blocks every later level", "[pipeline][gate]") {
  int runs = 0;
  std::vector<comfytest::pipeline::LevelDescriptor> descriptors = {
      Passing(Level::kSyntax, runs),
      {.level = Level::kInstall,
       .run =
           [](const comfytest::core::CancellationToken&) {
             LevelResult result;
             result.status = LevelStatus::kFailed;
             result.failure = comfytest::core::errors::Failure{
                 .kind = comfytest::core::errors::ErrorKind::kEnvironment,
                 .message = "uv not found",
                 .details = {}};
             return result;
           }},
      Passing(Level::kRegistration, runs),
      {.level = Level::kExecution, .configuration_skip = SkipReason::kNotRequested},
  };

  RecordingObserver observer;
  const auto results =
      comfytest::pipeline::RunLevelGate(descriptors, comfytest::core::CancellationToken(), observer);
  REQUIRE(results.size() == 4U);
  CHECK(runs == 1);
  CHECK(results[0].status == LevelStatus::kPassed);
  CHECK(results[0].started_at.has_value());
  CHECK(results[1].status == LevelStatus::kFailed);
  CHECK(results[2].status == LevelStatus::kSkipped);
  CHECK(results[2].skip_reason == SkipReason::kBlocked);
  // Blocked wins over a configuration skip.
  CHECK(results[3].skip_reason == SkipReason::kBlocked);
  CHECK(observer.started == std::vector<Level>{Level::kSyntax, Level::kInstall});
  CHECK(observer.finished.size() == 4U);
}

TEST_CASE("Configuration skips do not block later levels", "[pipeline][gate]") {
  int runs = 0;
  std::vector<comfytest::pipeline::LevelDescriptor> descriptors = {
      Passing(Level::kSyntax, runs),
      {.level = Level::kInstall, .implicit = true, .configuration_skip = SkipReason::kNotRequested},
      Passing(Level::kRegistration, runs),
  };
  RecordingObserver observer;
  const auto results =
      comfytest::pipeline::RunLevelGate(descriptors, comfytest::core::CancellationToken(), observer);
  CHECK(runs == 2);
  CHECK(results[1].status == LevelStatus::kSkipped);
  CHECK(results[1].implicit);
  CHECK(results[2].status == LevelStatus::kPassed);
}

TEST_CASE("A level that reports no terminal status counts as failed", "[pipeline][gate]") {
  int runs = 0;
  std::vector<comfytest::pipeline::LevelDescriptor> descriptors = {
      {.level = Level::kSyntax,
       .run = [](const comfytest::core::CancellationToken&) { return LevelResult{}; }},
      Passing(Level::kInstall, runs),
  };
  RecordingObserver observer;
  const auto results =
      comfytest::pipeline::RunLevelGate(descriptors, comfytest::core::CancellationToken(), observer);
  CHECK(results[0].status == LevelStatus::kFailed);
  REQUIRE(results[0].failure.has_value());
  CHECK(results[0].failure->message == "SYNTAX did not report a result");
  CHECK(results[1].skip_reason == SkipReason::kBlocked);
  CHECK(runs == 0);
}

TEST_CASE("Cancellation skips the remaining levels as cancelled", "[pipeline][gate]") {
  comfytest::core::CancellationToken cancel;
  int runs = 0;
  std::vector<comfytest::pipeline::LevelDescriptor> descriptors = {
      {.level = Level::kSyntax,
       .run =
           [&cancel](const comfytest::core::CancellationToken&) {
             cancel.Cancel();
             LevelResult result;
             result.status = LevelStatus::kPassed;
             return result;
           }},
      Passing(Level::kInstall, runs),
      Passing(Level::kRegistration, runs),
  };
  RecordingObserver observer;
  const auto results = comfytest::pipeline::RunLevelGate(descriptors, cancel, observer);
  CHECK(runs == 0);
  CHECK(results[0].status == LevelStatus::kPassed);
  CHECK(results[1].skip_reason == SkipReason::kCancelled);
  CHECK(results[2].skip_reason == SkipReason::kCancelled);
  CHECK_FALSE(comfytest::report::IsConfigurationSkip(results[1].skip_reason));
}
