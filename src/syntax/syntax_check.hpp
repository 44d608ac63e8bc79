#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace comfytest::syntax {

// Outcome of the SYNTAX level: manifest presence plus a Windows code page
// scan of every Python source in the extension.
struct SyntaxReport {
  bool has_pyproject = false;
  bool has_requirements = false;
  std::size_t files_scanned = 0;
  // `file:line:col U+XXXX ...` entries, or manifest problems.
  std::vector<std::string> diagnostics;

  bool Passed() const {
    return (has_pyproject || has_requirements) && diagnostics.empty();
  }
};

// True for code points Windows-1252 can represent.
bool IsCp1252Encodable(std::uint32_t code_point);

// Decodes `text` as UTF-8 and appends a diagnostic for each code point that
// cp1252 cannot encode. Invalid UTF-8 stops the scan with one diagnostic.
// Lines and columns are 1-based; columns count code points.
void ScanSourceText(std::string_view text, const std::string& file_label,
                    std::vector<std::string>& diagnostics);

// Contract:
// - Returns false only for I/O failures (unreadable node directory).
// - Source directories such as .git, __pycache__, virtual environments,
//   site-packages and `_env_*` are skipped.
bool RunSyntaxChecks(const std::filesystem::path& node_dir, SyntaxReport& report,
                     std::string& error);

} // namespace comfytest::syntax
