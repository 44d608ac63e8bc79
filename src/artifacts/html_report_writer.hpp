#pragma once

#include "report/run_report.hpp"

#include <filesystem>
#include <string>

namespace comfytest::artifacts {

// Writes the static HTML summary (`index.html`) that `publish` pushes.
//
// Contract:
// - creates `output_dir` when missing.
// - writes `<output_dir>/index.html`.
// - includes the level x platform matrix, every failure with its
//   diagnostics, and links to per-platform artifacts (relative paths).
// - returns false and sets `error` on failure.
bool WriteReportIndexHtml(const report::RunReport& run_report,
                          const std::filesystem::path& output_dir,
                          std::filesystem::path& written_path, std::string& error);

} // namespace comfytest::artifacts
