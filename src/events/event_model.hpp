#pragma once

#include <chrono>
#include <map>
#include <string>

namespace comfytest::events {

// Timeline event categories written to each platform's events.jsonl. Names
// are stable; the published report links to these files.
enum class EventType {
  kRunStarted,
  kLevelStarted,
  kLevelFinished,
  kWorkflowFinished,
  kRunFinished,
  kInfo,
  kWarning,
  kError,
};

// Canonical timeline event contract.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: lightweight string key/value attributes for context.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kInfo;
  std::map<std::string, std::string> payload;
};

// JSON serializers used by JSONL writers and tests.
std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace comfytest::events
