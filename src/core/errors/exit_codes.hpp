#pragma once

namespace comfytest::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 one or more levels failed, were blocked, or were cancelled
// - 2 usage/argument failure
//
// Configuration failures get their own value so CI can tell a broken
// comfy-test.toml apart from a broken extension.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace comfytest::core::errors
