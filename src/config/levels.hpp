#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace comfytest::config {

// The seven test levels in execution order. Numeric values are the index
// into per-platform level tables.
enum class Level {
  kSyntax = 0,
  kInstall = 1,
  kRegistration = 2,
  kInstantiation = 3,
  kStaticCapture = 4,
  kValidation = 5,
  kExecution = 6,
};

inline constexpr std::size_t kLevelCount = 7;

inline constexpr std::array<Level, kLevelCount> kAllLevels = {
    Level::kSyntax,        Level::kInstall,    Level::kRegistration, Level::kInstantiation,
    Level::kStaticCapture, Level::kValidation, Level::kExecution,
};

constexpr std::size_t ToIndex(Level level) {
  return static_cast<std::size_t>(level);
}

// Lowercase config/CLI name (`static_capture`).
const char* ToString(Level level);
// Uppercase display name (`STATIC_CAPTURE`).
const char* ToDisplayName(Level level);
bool ParseLevel(std::string_view raw, Level& level);
std::string ExpectedLevelList();

// Levels whose results a level consumes: INSTALL needs SYNTAX, REGISTRATION
// needs INSTALL, everything after REGISTRATION needs the node definitions.
std::vector<Level> HardDependencies(Level level);

// Adds every hard dependency of `requested` and returns the union in pipeline
// order. Levels added this way are reported through `implicit`.
std::vector<Level> CloseOverDependencies(const std::vector<Level>& requested,
                                         std::vector<Level>& implicit);

// `--level X`: keeps only the levels at or before X.
std::vector<Level> TruncateThrough(const std::vector<Level>& levels, Level last);

bool Contains(const std::vector<Level>& levels, Level level);

} // namespace comfytest::config
