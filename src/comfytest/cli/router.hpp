#pragma once

#include "collaborators/collaborators.hpp"
#include "config/levels.hpp"
#include "config/run_config.hpp"
#include "core/cancellation.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>

namespace comfytest::cli {

inline constexpr const char* kToolVersion = "0.1.0";

// Options of `comfy-test run`, shared with in-process callers.
struct RunOptions {
  // Extension directory; the current directory when empty.
  std::filesystem::path node_dir;
  // `--config`; `<node_dir>/comfy-test.toml` when empty.
  std::filesystem::path config_path;
  std::filesystem::path output_root = "comfy-test-results";
  // Per-platform scratch directories; the system temp directory when empty.
  std::filesystem::path workspace_root;
  std::optional<config::PlatformId> only_platform;
  std::optional<config::Level> through;
  config::RunnerClass runner = config::RunnerClass::kCpu;
  bool dry_run = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Loads configuration, runs (or plans) the platform matrix with the given
// collaborators, writes `run_report.json` and `index.html` under
// `output_root`, and prints the status table.
//
// Returns the process exit code: 0 when every executed level passed, 10 for
// configuration errors, 1 otherwise.
int ExecuteRun(const RunOptions& options, const collaborators::CollaboratorSet& collaborators,
               const core::CancellationToken& cancel);

// Routes `comfy-test` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => level failures (or a failed command after valid invocation)
//   2  => usage error (unknown command / invalid args)
//   10 => configuration invalid
int Dispatch(int argc, char** argv);

} // namespace comfytest::cli
