#pragma once

#include "collaborators/collaborators.hpp"

#include <chrono>
#include <string>

namespace comfytest::collaborators {

// Remote for `repo`: an `owner/repo` slug becomes a GitHub HTTPS URL (with
// `token` embedded when non-empty); anything that already looks like a URL or
// a path is used as is.
std::string ResolvePublishRemote(const std::string& repo, const std::string& token);

// Publishes a results directory by committing it as the whole content of
// `branch` and force-pushing it to the remote.
//
// Contract:
// - Every git call runs under `cancel` with `timeout`; no git process
//   outlives Publish.
// - The access token (GITHUB_TOKEN) never appears in logs or errors.
class GitPublisher final : public Publisher {
public:
  explicit GitPublisher(std::chrono::milliseconds timeout = std::chrono::seconds(300));

  bool Publish(const PublishRequest& request, const core::CancellationToken& cancel,
               const core::logging::Logger& logger, std::string& error) override;

private:
  std::chrono::milliseconds timeout_;
};

} // namespace comfytest::collaborators
