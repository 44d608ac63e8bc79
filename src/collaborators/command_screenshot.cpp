#include "collaborators/command_screenshot.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"
#include "core/process/process_runner.hpp"

#include <system_error>
#include <utility>

namespace comfytest::collaborators {

namespace {

void ReplaceAll(std::string& text, std::string_view token, const std::string& value) {
  std::size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos) {
    text.replace(pos, token.size(), value);
    pos += value.size();
  }
}

} // namespace

std::vector<std::string> ExpandScreenshotCommand(const std::vector<std::string>& argv_template,
                                                 const std::string& url,
                                                 const std::string& workflow_path,
                                                 const std::string& output_path) {
  std::vector<std::string> argv;
  argv.reserve(argv_template.size());
  for (std::string arg : argv_template) {
    ReplaceAll(arg, "{url}", url);
    ReplaceAll(arg, "{workflow}", workflow_path);
    ReplaceAll(arg, "{output}", output_path);
    argv.push_back(std::move(arg));
  }
  return argv;
}

CommandScreenshot::CommandScreenshot(std::vector<std::string> argv_template,
                                     std::chrono::milliseconds timeout)
    : argv_template_(std::move(argv_template)), timeout_(timeout) {}

ScreenshotOutcome CommandScreenshot::Capture(const RunContext& context,
                                             const ServerSession& session,
                                             const workflow::WorkflowEntry& workflow,
                                             const std::filesystem::path& output_path,
                                             const core::CancellationToken& cancel) {
  if (argv_template_.empty()) {
    return {.status = ScreenshotStatus::kUnavailable, .message = "no screenshot command configured"};
  }

  std::string error;
  if (!core::EnsureParentDirectory(output_path, error)) {
    return {.status = ScreenshotStatus::kError, .message = error};
  }

  std::vector<std::string> argv = ExpandScreenshotCommand(
      argv_template_, session.BaseUrl(), workflow.path.string(), output_path.string());
  core::process::ProcessSpec spec;
  spec.program = argv.front();
  spec.args.assign(argv.begin() + 1, argv.end());
  spec.env = context.env;
  spec.timeout = timeout_;
  spec.log_path = context.output_dir / artifacts::kLogsDirName /
                  (core::SanitizeFileStem(workflow.path.stem().string()) + ".screenshot.log");

  core::process::ProcessResult result;
  if (!core::process::RunProcess(spec, cancel, result, error)) {
    return {.status = ScreenshotStatus::kUnavailable, .message = error};
  }
  switch (result.outcome) {
  case core::process::ProcessOutcome::kTimedOut:
    return {.status = ScreenshotStatus::kWarning, .message = "screenshot command timed out"};
  case core::process::ProcessOutcome::kCancelled:
    return {.status = ScreenshotStatus::kError, .message = "cancelled"};
  case core::process::ProcessOutcome::kSignaled:
  case core::process::ProcessOutcome::kExited:
    break;
  }
  if (result.exit_code != 0) {
    return {.status = ScreenshotStatus::kError,
            .message = spec.program + " exited with code " + std::to_string(result.exit_code)};
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(output_path, ec)) {
    return {.status = ScreenshotStatus::kWarning,
            .message = "screenshot command wrote no image to " + output_path.string()};
  }
  return {.status = ScreenshotStatus::kCaptured};
}

} // namespace comfytest::collaborators
