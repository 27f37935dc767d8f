#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace resilab::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kRunStarted:
    return "run_started";
  case EventType::kWindowStarted:
    return "WINDOW_STARTED";
  case EventType::kWindowPhase:
    return "WINDOW_PHASE";
  case EventType::kOutageStarted:
    return "OUTAGE_STARTED";
  case EventType::kMeasurementStarted:
    return "MEASUREMENT_STARTED";
  case EventType::kMeasurementCompleted:
    return "MEASUREMENT_COMPLETED";
  case EventType::kWindowLogged:
    return "WINDOW_LOGGED";
  case EventType::kRunCompleted:
    return "run_completed";
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

  // std::map keeps key order stable across runs.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << core::QuoteJson(key) << ':' << core::QuoteJson(value);
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace resilab::events
