#include "artifacts/html_report_writer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/time_utils.hpp"
#include "report/status_table.hpp"

#include <fstream>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace comfytest::artifacts {

namespace {

std::string EscapeHtml(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '&':
      out << "&amp;";
      break;
    case '<':
      out << "&lt;";
      break;
    case '>':
      out << "&gt;";
      break;
    case '"':
      out << "&quot;";
      break;
    case '\'':
      out << "&#39;";
      break;
    default:
      out << ch;
      break;
    }
  }
  return out.str();
}

std::string StatusCssClass(const report::LevelResult& result) {
  switch (result.status) {
  case report::LevelStatus::kPassed:
    return "pass";
  case report::LevelStatus::kFailed:
    return "fail";
  default:
    return "skip";
  }
}

std::string StatusCssClass(const bool passed) {
  return passed ? "pass" : "fail";
}

std::string StatusLabel(const bool passed) {
  return passed ? "PASS" : "FAIL";
}

void WriteLevelDetails(std::ofstream& out_file, const report::LevelResult& result,
                       const std::string& platform_dir) {
  if (result.failure.has_value()) {
    out_file << "      <p><code>" << EscapeHtml(core::errors::ToString(result.failure->kind))
             << "</code> " << EscapeHtml(result.failure->message) << "</p>\n";
    if (!result.failure->details.empty()) {
      out_file << "      <pre>" << EscapeHtml(result.failure->details) << "</pre>\n";
    }
  }
  if (!result.diagnostics.empty()) {
    out_file << "      <ul>\n";
    for (const auto& diagnostic : result.diagnostics) {
      out_file << "        <li>" << EscapeHtml(report::FormatDiagnostic(diagnostic)) << "</li>\n";
    }
    out_file << "      </ul>\n";
  }
  for (const auto& warning : result.warnings) {
    out_file << "      <p class=\"meta\">warning: " << EscapeHtml(warning) << "</p>\n";
  }
  if (!result.workflows.empty()) {
    out_file << "      <table aria-label=\"workflows\">\n"
             << "        <thead><tr><th>Workflow</th><th>Status</th><th>Elapsed (ms)</th>"
                "<th>Artifacts</th></tr></thead>\n"
             << "        <tbody>\n";
    for (const auto& run : result.workflows) {
      out_file << "          <tr><td>" << EscapeHtml(run.workflow) << "</td><td>"
               << EscapeHtml(report::ToString(run.status));
      if (!run.message.empty()) {
        out_file << ": " << EscapeHtml(run.message);
      }
      out_file << "</td><td class=\"numeric\">" << run.elapsed.count() << "</td><td>";
      for (const auto& artifact : run.artifacts) {
        out_file << "<a href=\"" << EscapeHtml(platform_dir + "/" + artifact) << "\">"
                 << EscapeHtml(artifact) << "</a> ";
      }
      out_file << "</td></tr>\n";
    }
    out_file << "        </tbody>\n"
             << "      </table>\n";
  }
  if (result.validation.has_value()) {
    out_file << "      <table aria-label=\"validation\">\n"
             << "        <thead><tr><th>Workflow</th><th>schema</th><th>graph</th>"
                "<th>introspection</th><th>partial_execution</th></tr></thead>\n"
             << "        <tbody>\n";
    for (const auto& workflow : result.validation->workflows) {
      out_file << "          <tr><td>" << EscapeHtml(workflow.workflow) << "</td>";
      for (const auto& sub : workflow.sub_levels) {
        out_file << "<td>" << EscapeHtml(report::ToString(sub.status));
        for (const auto& diagnostic : sub.diagnostics) {
          out_file << "<br /><small>" << EscapeHtml(report::FormatDiagnostic(diagnostic))
                   << "</small>";
        }
        out_file << "</td>";
      }
      out_file << "</tr>\n";
    }
    out_file << "        </tbody>\n"
             << "      </table>\n";
  }
}

} // namespace

bool WriteReportIndexHtml(const report::RunReport& run_report, const fs::path& output_dir,
                          fs::path& written_path, std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }

  written_path = output_dir / kIndexHtmlFileName;
  std::ofstream out_file(written_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open output file '" + written_path.string() + "' for writing";
    return false;
  }

  const bool passed = run_report.Succeeded();

  out_file << "<!doctype html>\n"
           << "<html lang=\"en\">\n"
           << "<head>\n"
           << "  <meta charset=\"utf-8\" />\n"
           << "  <meta name=\"viewport\" content=\"width=device-width, initial-scale=1\" />\n"
           << "  <title>" << EscapeHtml(run_report.project.name) << " - comfy-test</title>\n"
           << "  <style>\n"
           << "    :root { color-scheme: light; }\n"
           << "    body { font-family: \"Segoe UI\", \"Helvetica Neue\", Arial, sans-serif; "
              "margin: 24px; color: "
              "#1f2933; }\n"
           << "    h1, h2 { margin-bottom: 8px; }\n"
           << "    .meta { color: #52606d; margin-top: 0; }\n"
           << "    .status { display: inline-block; padding: 4px 10px; border-radius: 12px; "
              "font-weight: 700; }\n"
           << "    .pass { background: #e8f5e9; color: #1b5e20; }\n"
           << "    .fail { background: #ffebee; color: #b71c1c; }\n"
           << "    .skip { background: #f5f7fa; color: #52606d; }\n"
           << "    table { border-collapse: collapse; width: 100%; margin: 12px 0 20px 0; }\n"
           << "    th, td { border: 1px solid #d9e2ec; padding: 8px; text-align: left; }\n"
           << "    th { background: #f5f7fa; }\n"
           << "    td.numeric { text-align: right; font-variant-numeric: tabular-nums; }\n"
           << "    code { background: #f0f4f8; padding: 2px 4px; border-radius: 4px; }\n"
           << "    pre { background: #f0f4f8; padding: 8px; overflow-x: auto; }\n"
           << "  </style>\n"
           << "</head>\n"
           << "<body>\n"
           << "  <h1>" << EscapeHtml(run_report.project.name) << "</h1>\n"
           << "  <p class=\"meta\">Static report generated by comfy-test "
           << EscapeHtml(run_report.tool_version) << " (no JavaScript required).</p>\n"
           << "  <p><span class=\"status " << StatusCssClass(passed) << "\">"
           << StatusLabel(passed) << "</span></p>\n"
           << "\n"
           << "  <h2>Run</h2>\n"
           << "  <table aria-label=\"run identity\">\n"
           << "    <thead><tr><th>Field</th><th>Value</th></tr></thead>\n"
           << "    <tbody>\n"
           << "      <tr><td>comfyui_version</td><td><code>"
           << EscapeHtml(run_report.project.comfyui_version) << "</code></td></tr>\n"
           << "      <tr><td>python_version</td><td><code>"
           << EscapeHtml(run_report.project.python_version) << "</code></td></tr>\n"
           << "      <tr><td>cuda_packages</td><td><code>";
  for (std::size_t i = 0; i < run_report.project.cuda_packages.size(); ++i) {
    out_file << (i > 0U ? ", " : "") << EscapeHtml(run_report.project.cuda_packages[i]);
  }
  out_file << "</code></td></tr>\n"
           << "      <tr><td>started_at_utc</td><td><code>"
           << EscapeHtml(core::FormatUtcTimestamp(run_report.started_at)) << "</code></td></tr>\n"
           << "      <tr><td>finished_at_utc</td><td><code>"
           << EscapeHtml(core::FormatUtcTimestamp(run_report.finished_at))
           << "</code></td></tr>\n"
           << "    </tbody>\n"
           << "  </table>\n"
           << "\n"
           << "  <h2>Levels</h2>\n"
           << "  <table aria-label=\"level matrix\">\n"
           << "    <thead><tr><th>Level</th>";
  for (const auto& platform : run_report.platforms) {
    out_file << "<th>" << EscapeHtml(config::ToString(platform.platform)) << "</th>";
  }
  out_file << "</tr></thead>\n"
           << "    <tbody>\n";
  for (const config::Level level : config::kAllLevels) {
    out_file << "      <tr><td>" << config::ToDisplayName(level) << "</td>";
    for (const auto& platform : run_report.platforms) {
      const report::LevelResult& result = platform.At(level);
      out_file << "<td class=\"" << StatusCssClass(result) << "\">"
               << report::StatusCell(result);
      if (result.status == report::LevelStatus::kSkipped) {
        out_file << " <small>" << EscapeHtml(report::ToString(result.skip_reason)) << "</small>";
      }
      out_file << "</td>";
    }
    out_file << "</tr>\n";
  }
  out_file << "    </tbody>\n"
           << "  </table>\n";

  for (const auto& platform : run_report.platforms) {
    const std::string platform_name = config::ToString(platform.platform);
    out_file << "\n"
             << "  <h2>" << EscapeHtml(platform_name) << " <small>("
             << config::ToString(platform.runner) << ")</small></h2>\n"
             << "  <p class=\"meta\"><a href=\"" << EscapeHtml(platform_name) << "/"
             << kEventsFileName << "\">events</a> &middot; <a href=\""
             << EscapeHtml(platform_name) << "/" << kServerLogFileName
             << "\">server log</a></p>\n";
    for (const auto& result : platform.levels) {
      if (result.status != report::LevelStatus::kPassed &&
          result.status != report::LevelStatus::kFailed) {
        continue;
      }
      out_file << "    <h3><span class=\"status " << StatusCssClass(result) << "\">"
               << report::StatusCell(result) << "</span> " << config::ToDisplayName(result.level)
               << "</h3>\n";
      WriteLevelDetails(out_file, result, platform_name);
    }
  }

  out_file << "</body>\n"
           << "</html>\n";

  if (!out_file) {
    error = "failed while writing output file '" + written_path.string() + "'";
    return false;
  }

  return true;
}

} // namespace comfytest::artifacts
