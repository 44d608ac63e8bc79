#include "collaborators/git_publisher.hpp"

#include "core/process/process_runner.hpp"

#include <cstdlib>
#include <system_error>
#include <vector>

namespace comfytest::collaborators {

namespace {

bool LooksLikeRemote(const std::string& repo) {
  return repo.find("://") != std::string::npos || repo.rfind("git@", 0) == 0 ||
         repo.rfind("/", 0) == 0 || repo.rfind(".", 0) == 0;
}

std::string Redact(std::string text, const std::string& token) {
  if (token.empty()) {
    return text;
  }
  std::size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos) {
    text.replace(pos, token.size(), "***");
    pos += 3;
  }
  return text;
}

} // namespace

std::string ResolvePublishRemote(const std::string& repo, const std::string& token) {
  if (LooksLikeRemote(repo)) {
    return repo;
  }
  if (token.empty()) {
    return "https://github.com/" + repo + ".git";
  }
  return "https://x-access-token:" + token + "@github.com/" + repo + ".git";
}

GitPublisher::GitPublisher(std::chrono::milliseconds timeout) : timeout_(timeout) {}

bool GitPublisher::Publish(const PublishRequest& request, const core::CancellationToken& cancel,
                           const core::logging::Logger& logger, std::string& error) {
  if (request.repo.empty()) {
    error = "publish requires a repository (--repo owner/repo)";
    return false;
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(request.results_dir, ec)) {
    error = "results directory not found: " + request.results_dir.string();
    return false;
  }

  const char* token_env = std::getenv("GITHUB_TOKEN");
  const std::string token = token_env != nullptr ? token_env : "";
  const std::string remote = ResolvePublishRemote(request.repo, token);
  const std::string dir = request.results_dir.string();

  const std::vector<std::vector<std::string>> steps = {
      {"init", "--quiet"},
      {"checkout", "--quiet", "-B", request.branch},
      {"add", "--all"},
      {"-c", "user.name=comfy-test", "-c", "user.email=comfy-test@users.noreply.github.com",
       "commit", "--quiet", "--allow-empty", "-m", "Publish comfy-test results"},
      {"push", "--force", remote, "HEAD:refs/heads/" + request.branch},
  };

  for (const std::vector<std::string>& step : steps) {
    core::process::ProcessSpec spec;
    spec.program = "git";
    spec.args = {"-C", dir};
    spec.args.insert(spec.args.end(), step.begin(), step.end());
    spec.timeout = timeout_;
    spec.env["GIT_TERMINAL_PROMPT"] = "0";

    const std::string display = Redact("git " + step.front(), token);
    logger.Info("publish step", {{"cmd", display}, {"dir", dir}});

    core::process::ProcessResult result;
    if (!core::process::RunProcess(spec, cancel, result, error)) {
      return false;
    }
    if (result.outcome == core::process::ProcessOutcome::kCancelled) {
      error = display + " cancelled";
      return false;
    }
    if (result.outcome == core::process::ProcessOutcome::kTimedOut) {
      error = display + " timed out";
      return false;
    }
    if (result.exit_code != 0) {
      error = display + " failed (exit " + std::to_string(result.exit_code) +
              "): " + Redact(result.output, token);
      return false;
    }
  }

  logger.Info("results published",
              {{"repo", Redact(request.repo, token)}, {"branch", request.branch}});
  return true;
}

} // namespace comfytest::collaborators
