#pragma once

#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace resilab::events {

// Typed facade over the run timeline. Chaos and measurement threads emit
// concurrently, so appends are serialized.
class Emitter {
public:
  struct RunStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string run_id;
    std::string command;
    double p_fail = 0.0;
    int windows = 0;
    std::string mode_label;
  };

  struct WindowPhaseEvent {
    std::chrono::system_clock::time_point ts{};
    std::string run_id;
    int window_id = 0;
    std::string phase;
  };

  struct OutageStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string run_id;
    int window_id = 0;
    std::size_t eligible = 0;
    std::size_t killed = 0;
    std::size_t anomalies = 0;
  };

  struct MeasurementEvent {
    std::chrono::system_clock::time_point ts{};
    std::string run_id;
    int window_id = 0;
    bool completed = false;
    std::size_t probes = 0;
    std::size_t succeeded = 0;
  };

  struct RunCompletedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string run_id;
    int windows_completed = 0;
    bool interrupted = false;
  };

  explicit Emitter(std::filesystem::path output_dir);

  Emitter(const Emitter&) = delete;
  Emitter& operator=(const Emitter&) = delete;

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error);

  bool EmitRunStarted(const RunStartedEvent& event, std::string& error);
  bool EmitWindowPhase(const WindowPhaseEvent& event, std::string& error);
  bool EmitOutageStarted(const OutageStartedEvent& event, std::string& error);
  bool EmitMeasurement(const MeasurementEvent& event, std::string& error);
  bool EmitRunCompleted(const RunCompletedEvent& event, std::string& error);

  const std::filesystem::path& events_path() const {
    return writer_.path();
  }

private:
  EventLogWriter writer_;
  std::mutex mu_;
};

} // namespace resilab::events
