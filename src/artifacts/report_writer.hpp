#pragma once

#include "report/run_report.hpp"

#include <filesystem>
#include <string>

namespace comfytest::artifacts {

// Emits the canonical `run_report.json` artifact for a run.
//
// Contract:
// - Creates `output_dir` if needed.
// - Writes UTF-8 JSON to `<output_dir>/run_report.json`, replacing any
//   previous report atomically.
// - Returns true on success and populates `written_path`.
// - Returns false on failure and populates `error`.
bool WriteRunReportJson(const report::RunReport& run_report,
                        const std::filesystem::path& output_dir,
                        std::filesystem::path& written_path, std::string& error);

// Reads `<results_dir>/run_report.json` back.
bool LoadRunReportJson(const std::filesystem::path& results_dir, report::RunReport& run_report,
                       std::string& error);

} // namespace comfytest::artifacts
