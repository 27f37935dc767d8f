#pragma once

#include <chrono>
#include <map>
#include <string>

namespace resilab::events {

// Run timeline categories. Downstream tooling keys off the serialized names,
// so keep them stable.
enum class EventType {
  kRunStarted,
  kWindowStarted,
  kWindowPhase,
  kOutageStarted,
  kMeasurementStarted,
  kMeasurementCompleted,
  kWindowLogged,
  kRunCompleted,
  kInfo,
  kWarning,
  kError,
};

// Canonical timeline event.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: string key/value attributes for context.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kInfo;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace resilab::events
