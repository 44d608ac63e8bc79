#pragma once

#include "collaborators/collaborators.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace comfytest::collaborators {

// Expands `{url}`, `{workflow}` and `{output}` in every argv element.
std::vector<std::string> ExpandScreenshotCommand(const std::vector<std::string>& argv_template,
                                                 const std::string& url,
                                                 const std::string& workflow_path,
                                                 const std::string& output_path);

// Screenshot collaborator backed by an external browser automation command
// (`screenshot.command` in the configuration).
//
// Outcome mapping:
// - empty template or tool not on PATH -> kUnavailable
// - tool exits nonzero -> kError
// - tool timed out, or exited 0 without writing the output -> kWarning
class CommandScreenshot final : public ScreenshotCollaborator {
public:
  explicit CommandScreenshot(std::vector<std::string> argv_template,
                             std::chrono::milliseconds timeout = std::chrono::seconds(120));

  ScreenshotOutcome Capture(const RunContext& context, const ServerSession& session,
                            const workflow::WorkflowEntry& workflow,
                            const std::filesystem::path& output_path,
                            const core::CancellationToken& cancel) override;

private:
  std::vector<std::string> argv_template_;
  std::chrono::milliseconds timeout_;
};

} // namespace comfytest::collaborators
