#pragma once

#include "collaborators/collaborators.hpp"
#include "core/json_dom.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace comfytest::collaborators {

struct HttpExecutionOptions {
  std::chrono::milliseconds poll_interval = std::chrono::seconds(1);
  // Produced images are downloaded into `<output_dir>/outputs/<workflow>/`.
  bool download_outputs = true;
};

// `node_errors` of a rejected `/prompt` submission, one diagnostic per error.
std::vector<report::Diagnostic> ParseNodeErrors(const core::json::Value& node_errors);

// Diagnostics for the `execution_error` messages of a `/history/<id>` entry.
std::vector<report::Diagnostic> ParseExecutionErrors(const core::json::Value& status);

// Executes prompts on a running host server over its REST API:
// POST /prompt, poll GET /history/<id>, POST /interrupt on timeout or cancel.
class HttpExecution final : public ExecutionCollaborator {
public:
  explicit HttpExecution(HttpExecutionOptions options = {});

  ExecutionOutcome Execute(const RunContext& context, ServerSession& session,
                           const ExecutionRequest& request,
                           const core::CancellationToken& cancel) override;

private:
  HttpExecutionOptions options_;
};

} // namespace comfytest::collaborators
