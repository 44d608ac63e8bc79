#include "config/levels.hpp"

#include <algorithm>
#include <cctype>

namespace comfytest::config {

const char* ToString(Level level) {
  switch (level) {
  case Level::kSyntax:
    return "syntax";
  case Level::kInstall:
    return "install";
  case Level::kRegistration:
    return "registration";
  case Level::kInstantiation:
    return "instantiation";
  case Level::kStaticCapture:
    return "static_capture";
  case Level::kValidation:
    return "validation";
  case Level::kExecution:
    return "execution";
  }
  return "syntax";
}

const char* ToDisplayName(Level level) {
  switch (level) {
  case Level::kSyntax:
    return "SYNTAX";
  case Level::kInstall:
    return "INSTALL";
  case Level::kRegistration:
    return "REGISTRATION";
  case Level::kInstantiation:
    return "INSTANTIATION";
  case Level::kStaticCapture:
    return "STATIC_CAPTURE";
  case Level::kValidation:
    return "VALIDATION";
  case Level::kExecution:
    return "EXECUTION";
  }
  return "SYNTAX";
}

bool ParseLevel(std::string_view raw, Level& level) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return c == '-' ? '_' : static_cast<char>(std::tolower(c));
  });
  for (const Level candidate : kAllLevels) {
    if (normalized == ToString(candidate)) {
      level = candidate;
      return true;
    }
  }
  return false;
}

std::string ExpectedLevelList() {
  std::string out;
  for (const Level level : kAllLevels) {
    if (!out.empty()) {
      out += '|';
    }
    out += ToString(level);
  }
  return out;
}

std::vector<Level> HardDependencies(Level level) {
  switch (level) {
  case Level::kSyntax:
    return {};
  case Level::kInstall:
    return {Level::kSyntax};
  case Level::kRegistration:
    return {Level::kInstall};
  case Level::kInstantiation:
  case Level::kStaticCapture:
  case Level::kValidation:
  case Level::kExecution:
    return {Level::kRegistration};
  }
  return {};
}

std::vector<Level> CloseOverDependencies(const std::vector<Level>& requested,
                                         std::vector<Level>& implicit) {
  std::array<bool, kLevelCount> selected{};
  for (const Level level : requested) {
    selected[ToIndex(level)] = true;
  }

  // Dependencies always point to earlier levels, so one backwards sweep
  // reaches the fixpoint.
  std::array<bool, kLevelCount> added{};
  for (std::size_t i = kLevelCount; i-- > 0;) {
    if (!selected[i]) {
      continue;
    }
    for (const Level dependency : HardDependencies(kAllLevels[i])) {
      if (!selected[ToIndex(dependency)]) {
        selected[ToIndex(dependency)] = true;
        added[ToIndex(dependency)] = true;
      }
    }
  }

  std::vector<Level> closed;
  implicit.clear();
  for (const Level level : kAllLevels) {
    if (selected[ToIndex(level)]) {
      closed.push_back(level);
    }
    if (added[ToIndex(level)]) {
      implicit.push_back(level);
    }
  }
  return closed;
}

std::vector<Level> TruncateThrough(const std::vector<Level>& levels, Level last) {
  std::vector<Level> truncated;
  for (const Level level : levels) {
    if (ToIndex(level) <= ToIndex(last)) {
      truncated.push_back(level);
    }
  }
  return truncated;
}

bool Contains(const std::vector<Level>& levels, Level level) {
  return std::find(levels.begin(), levels.end(), level) != levels.end();
}

} // namespace comfytest::config
