#ifndef COMFYTEST_CORE_TIME_UTILS_HPP_
#define COMFYTEST_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace comfytest::core {

// Canonical UTC timestamp formatter used by the run report, events and logs.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Inverse of FormatUtcTimestamp for `YYYY-MM-DDTHH:MM:SS.mmmZ`. Used when a
// published report is loaded back from run_report.json.
inline bool ParseUtcTimestamp(std::string_view text, std::chrono::system_clock::time_point& out) {
  std::tm utc_time{};
  std::istringstream in{std::string(text)};
  in >> std::get_time(&utc_time, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return false;
  }

  int millis = 0;
  if (in.peek() == '.') {
    in.get();
    in >> millis;
    if (in.fail() || millis < 0 || millis > 999) {
      return false;
    }
  }

#if defined(_WIN32)
  const std::time_t epoch_seconds = _mkgmtime(&utc_time);
#else
  const std::time_t epoch_seconds = timegm(&utc_time);
#endif
  if (epoch_seconds == static_cast<std::time_t>(-1)) {
    return false;
  }

  out = std::chrono::system_clock::from_time_t(epoch_seconds) + std::chrono::milliseconds(millis);
  return true;
}

// `[mm:ss]` elapsed prefix used in the human-readable progress output.
inline std::string FormatElapsedClock(std::chrono::steady_clock::duration elapsed) {
  const auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
  std::ostringstream out;
  out << '[' << std::setw(2) << std::setfill('0') << (total_seconds / 60) << ':' << std::setw(2)
      << std::setfill('0') << (total_seconds % 60) << ']';
  return out.str();
}

} // namespace comfytest::core

#endif // COMFYTEST_CORE_TIME_UTILS_HPP_
