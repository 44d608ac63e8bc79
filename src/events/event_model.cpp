#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace comfytest::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kRunStarted:
    return "run_started";
  case EventType::kLevelStarted:
    return "level_started";
  case EventType::kLevelFinished:
    return "level_finished";
  case EventType::kWorkflowFinished:
    return "workflow_finished";
  case EventType::kRunFinished:
    return "run_finished";
  case EventType::kInfo:
    return "info";
  case EventType::kWarning:
    return "warning";
  case EventType::kError:
    return "error";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  // `payload` is a std::map, so key iteration order is stable. This keeps
  // line-by-line diffs and snapshot tests deterministic.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << "\"" << core::EscapeJson(key) << "\":\"" << core::EscapeJson(value) << "\"";
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace comfytest::events
