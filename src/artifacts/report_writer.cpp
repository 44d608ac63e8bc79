#include "artifacts/report_writer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"

namespace fs = std::filesystem;

namespace comfytest::artifacts {

bool WriteRunReportJson(const report::RunReport& run_report, const fs::path& output_dir,
                        fs::path& written_path, std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }

  written_path = output_dir / kRunReportFileName;
  // Append a newline to keep files shell-friendly (`cat`, `tail`, diffs).
  return core::WriteTextFileAtomic(written_path, report::ToJson(run_report) + "\n", error);
}

bool LoadRunReportJson(const fs::path& results_dir, report::RunReport& run_report,
                       std::string& error) {
  const fs::path path = results_dir / kRunReportFileName;
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  std::string parse_error;
  if (!report::ParseRunReport(text, run_report, parse_error)) {
    error = "invalid " + path.string() + ": " + parse_error;
    return false;
  }
  return true;
}

} // namespace comfytest::artifacts
