#include "syntax/syntax_check.hpp"

#include "config/project.hpp"
#include "core/fs_utils.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <system_error>

namespace fs = std::filesystem;

namespace comfytest::syntax {

namespace {

// Code points in the 0x80-0x9F byte range of cp1252 (five bytes there are
// undefined).
constexpr std::array<std::uint32_t, 27> kCp1252HighBlock = {
    0x20AC, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021, 0x02C6, 0x2030,
    0x0160, 0x2039, 0x0152, 0x017D, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022,
    0x2013, 0x2014, 0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x017E, 0x0178,
};

constexpr std::size_t kMaxDiagnosticsPerFile = 50;

std::string FormatCodePoint(std::uint32_t code_point) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "U+%04X", static_cast<unsigned>(code_point));
  return buffer;
}

// Decodes one UTF-8 sequence at `pos`. Returns the byte length, or 0 when
// the bytes are not well-formed UTF-8 (overlongs and surrogates included).
std::size_t DecodeUtf8(std::string_view text, std::size_t pos, std::uint32_t& code_point) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 0;
  std::uint32_t min_value = 0;
  if (lead < 0x80U) {
    code_point = lead;
    return 1;
  }
  if ((lead & 0xE0U) == 0xC0U) {
    length = 2;
    code_point = lead & 0x1FU;
    min_value = 0x80U;
  } else if ((lead & 0xF0U) == 0xE0U) {
    length = 3;
    code_point = lead & 0x0FU;
    min_value = 0x800U;
  } else if ((lead & 0xF8U) == 0xF0U) {
    length = 4;
    code_point = lead & 0x07U;
    min_value = 0x10000U;
  } else {
    return 0;
  }
  if (pos + length > text.size()) {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto next = static_cast<unsigned char>(text[pos + i]);
    if ((next & 0xC0U) != 0x80U) {
      return 0;
    }
    code_point = (code_point << 6U) | (next & 0x3FU);
  }
  if (code_point < min_value || code_point > 0x10FFFFU ||
      (code_point >= 0xD800U && code_point <= 0xDFFFU)) {
    return 0;
  }
  return length;
}

bool HasIgnoredComponent(const fs::path& relative) {
  for (const fs::path& part : relative.parent_path()) {
    if (config::IsIgnoredDirectoryName(part.string())) {
      return true;
    }
  }
  return false;
}

} // namespace

bool IsCp1252Encodable(std::uint32_t code_point) {
  if (code_point <= 0x7FU || (code_point >= 0xA0U && code_point <= 0xFFU)) {
    return true;
  }
  return std::find(kCp1252HighBlock.begin(), kCp1252HighBlock.end(), code_point) !=
         kCp1252HighBlock.end();
}

void ScanSourceText(std::string_view text, const std::string& file_label,
                    std::vector<std::string>& diagnostics) {
  std::size_t line = 1;
  std::size_t column = 0;
  std::size_t reported = 0;
  std::size_t suppressed = 0;

  std::size_t pos = 0;
  // A UTF-8 BOM is legal and encodes nothing visible.
  if (text.substr(0, 3) == "\xEF\xBB\xBF") {
    pos = 3;
  }
  while (pos < text.size()) {
    std::uint32_t code_point = 0;
    const std::size_t length = DecodeUtf8(text, pos, code_point);
    if (length == 0U) {
      diagnostics.push_back(file_label + ":" + std::to_string(line) + ":" +
                            std::to_string(column + 1U) + " invalid UTF-8 byte sequence at offset " +
                            std::to_string(pos));
      return;
    }
    pos += length;

    if (code_point == '\n') {
      ++line;
      column = 0;
      continue;
    }
    ++column;
    if (IsCp1252Encodable(code_point)) {
      continue;
    }
    if (reported < kMaxDiagnosticsPerFile) {
      diagnostics.push_back(file_label + ":" + std::to_string(line) + ":" + std::to_string(column) +
                            " " + FormatCodePoint(code_point) + " not encodable in cp1252");
      ++reported;
    } else {
      ++suppressed;
    }
  }
  if (suppressed > 0U) {
    diagnostics.push_back(file_label + ": " + std::to_string(suppressed) +
                          " more characters not encodable in cp1252");
  }
}

bool RunSyntaxChecks(const fs::path& node_dir, SyntaxReport& report, std::string& error) {
  report = SyntaxReport{};

  std::error_code ec;
  if (!fs::is_directory(node_dir, ec) || ec) {
    error = "node directory not found: " + node_dir.string();
    return false;
  }

  report.has_pyproject = fs::is_regular_file(node_dir / "pyproject.toml", ec);
  report.has_requirements = fs::is_regular_file(node_dir / "requirements.txt", ec);
  if (!report.has_pyproject && !report.has_requirements) {
    report.diagnostics.push_back(
        "no dependency file found: expected pyproject.toml or requirements.txt in the node "
        "directory");
  }

  std::vector<fs::path> sources;
  fs::recursive_directory_iterator it(node_dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    error = "failed to scan node directory '" + node_dir.string() + "': " + ec.message();
    return false;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      error = "failed to scan node directory '" + node_dir.string() + "': " + ec.message();
      return false;
    }
    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      if (config::IsIgnoredDirectoryName(it->path().filename().string())) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (it->path().extension() == ".py" && it->is_regular_file(entry_ec)) {
      sources.push_back(it->path());
    }
  }
  std::sort(sources.begin(), sources.end());

  for (const fs::path& source : sources) {
    const fs::path relative = fs::relative(source, node_dir, ec);
    if (!ec && HasIgnoredComponent(relative)) {
      continue;
    }
    std::string text;
    std::string read_error;
    if (!core::ReadTextFile(source, text, read_error)) {
      report.diagnostics.push_back(read_error);
      continue;
    }
    ++report.files_scanned;
    ScanSourceText(text, ec ? source.generic_string() : relative.generic_string(),
                   report.diagnostics);
  }
  return true;
}

} // namespace comfytest::syntax
