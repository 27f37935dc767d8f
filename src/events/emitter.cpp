#include "events/emitter.hpp"

#include "core/json_utils.hpp"

#include <utility>

namespace resilab::events {

Emitter::Emitter(std::filesystem::path output_dir)
    : writer_(std::move(output_dir) / kEventsFileName) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);
  std::lock_guard<std::mutex> lock(mu_);
  return writer_.Append(event, error);
}

bool Emitter::EmitRunStarted(const RunStartedEvent& event, std::string& error) {
  return EmitRaw(EventType::kRunStarted, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"command", event.command},
                     {"p_fail", core::FormatJsonNumber(event.p_fail)},
                     {"windows", std::to_string(event.windows)},
                     {"mode_label", event.mode_label},
                 },
                 error);
}

bool Emitter::EmitWindowPhase(const WindowPhaseEvent& event, std::string& error) {
  const EventType type =
      event.phase == "idle" ? EventType::kWindowStarted
                            : (event.phase == "logged" ? EventType::kWindowLogged
                                                       : EventType::kWindowPhase);
  return EmitRaw(type, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"window_id", std::to_string(event.window_id)},
                     {"phase", event.phase},
                 },
                 error);
}

bool Emitter::EmitOutageStarted(const OutageStartedEvent& event, std::string& error) {
  return EmitRaw(EventType::kOutageStarted, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"window_id", std::to_string(event.window_id)},
                     {"eligible", std::to_string(event.eligible)},
                     {"killed", std::to_string(event.killed)},
                     {"anomalies", std::to_string(event.anomalies)},
                 },
                 error);
}

bool Emitter::EmitMeasurement(const MeasurementEvent& event, std::string& error) {
  std::map<std::string, std::string> payload = {
      {"run_id", event.run_id},
      {"window_id", std::to_string(event.window_id)},
  };
  if (event.completed) {
    payload["probes"] = std::to_string(event.probes);
    payload["succeeded"] = std::to_string(event.succeeded);
  }
  return EmitRaw(event.completed ? EventType::kMeasurementCompleted
                                 : EventType::kMeasurementStarted,
                 event.ts, std::move(payload), error);
}

bool Emitter::EmitRunCompleted(const RunCompletedEvent& event, std::string& error) {
  return EmitRaw(EventType::kRunCompleted, event.ts,
                 {
                     {"run_id", event.run_id},
                     {"windows_completed", std::to_string(event.windows_completed)},
                     {"interrupted", event.interrupted ? "true" : "false"},
                 },
                 error);
}

} // namespace resilab::events
