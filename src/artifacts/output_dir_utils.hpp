#ifndef COMFYTEST_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
#define COMFYTEST_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_

#include "config/run_config.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace comfytest::artifacts {

inline constexpr const char* kRunReportFileName = "run_report.json";
inline constexpr const char* kIndexHtmlFileName = "index.html";
inline constexpr const char* kEventsFileName = "events.jsonl";
inline constexpr const char* kInstallLogFileName = "install.log";
inline constexpr const char* kServerLogFileName = "server.log";
inline constexpr const char* kLogsDirName = "logs";
inline constexpr const char* kScreenshotsDirName = "screenshots";

// Centralized output-dir creation guard used by artifact writers.
// Shared error text keeps CLI and tests consistent across artifact types.
inline bool EnsureOutputDir(const std::filesystem::path& output_dir, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// `<results>/<platform>/`: everything one platform pipeline writes.
inline std::filesystem::path PlatformOutputDir(const std::filesystem::path& results_root,
                                               config::PlatformId platform) {
  return results_root / config::ToString(platform);
}

} // namespace comfytest::artifacts

#endif // COMFYTEST_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
