#include "report/status_table.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace comfytest::report {

namespace {

constexpr std::size_t kLevelColumnWidth = 16;

void AppendFailureLines(std::ostringstream& out, const PlatformReport& platform,
                        const LevelResult& result, std::size_t max_diagnostics) {
  out << "  " << config::ToString(platform.platform) << " " << config::ToDisplayName(result.level)
      << ": ";
  if (result.failure.has_value()) {
    out << core::errors::ToString(result.failure->kind) << ": " << result.failure->message;
  } else {
    out << "failed";
  }
  out << "\n";

  std::vector<std::string> lines;
  for (const Diagnostic& diagnostic : result.diagnostics) {
    lines.push_back(FormatDiagnostic(diagnostic));
  }
  if (result.validation.has_value()) {
    for (const WorkflowValidation& workflow : result.validation->workflows) {
      for (const SubLevelResult& sub : workflow.sub_levels) {
        if (sub.status != LevelStatus::kFailed) {
          continue;
        }
        lines.push_back(workflow.workflow + " [" + ToString(sub.sub_level) + "] " +
                        core::errors::ToString(sub.failure_kind) +
                        (sub.note.empty() ? "" : ": " + sub.note));
        for (const Diagnostic& diagnostic : sub.diagnostics) {
          lines.push_back("  " + FormatDiagnostic(diagnostic));
        }
      }
    }
  }
  for (const WorkflowRun& run : result.workflows) {
    if (run.status == LevelStatus::kFailed) {
      lines.push_back(run.workflow + ": " + core::errors::ToString(run.failure_kind) +
                      (run.message.empty() ? "" : ": " + run.message));
    }
  }

  const std::size_t shown = std::min(lines.size(), max_diagnostics);
  for (std::size_t i = 0; i < shown; ++i) {
    out << "    - " << lines[i] << "\n";
  }
  if (lines.size() > shown) {
    out << "    ... " << (lines.size() - shown) << " more\n";
  }
}

} // namespace

const char* StatusCell(const LevelResult& result) {
  switch (result.status) {
  case LevelStatus::kPassed:
    return "PASS";
  case LevelStatus::kFailed:
    return "FAIL";
  case LevelStatus::kSkipped:
    return result.skip_reason == SkipReason::kNotRequested ? "--" : "SKIP";
  case LevelStatus::kPending:
  case LevelStatus::kRunning:
    return "--";
  }
  return "--";
}

std::string RenderStatusTable(const RunReport& report, std::size_t max_diagnostics) {
  std::vector<std::size_t> widths;
  for (const PlatformReport& platform : report.platforms) {
    widths.push_back(std::max<std::size_t>(std::string(config::ToString(platform.platform)).size(),
                                           4U) +
                     2U);
  }

  std::ostringstream out;
  out << std::left << std::setw(static_cast<int>(kLevelColumnWidth)) << "LEVEL";
  for (std::size_t i = 0; i < report.platforms.size(); ++i) {
    out << std::setw(static_cast<int>(widths[i])) << config::ToString(report.platforms[i].platform);
  }
  out << "\n";

  for (const config::Level level : config::kAllLevels) {
    out << std::setw(static_cast<int>(kLevelColumnWidth)) << config::ToDisplayName(level);
    for (std::size_t i = 0; i < report.platforms.size(); ++i) {
      out << std::setw(static_cast<int>(widths[i])) << StatusCell(report.platforms[i].At(level));
    }
    out << "\n";
  }

  bool any_failure = false;
  for (const PlatformReport& platform : report.platforms) {
    for (const LevelResult& result : platform.levels) {
      if (result.status != LevelStatus::kFailed) {
        continue;
      }
      if (!any_failure) {
        out << "\nfailures:\n";
        any_failure = true;
      }
      AppendFailureLines(out, platform, result, max_diagnostics);
    }
  }

  out << "\nresult: " << (report.Succeeded() ? "PASSED" : "FAILED") << "\n";
  return out.str();
}

} // namespace comfytest::report
