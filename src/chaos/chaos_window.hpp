#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace resilab::chaos {

enum class WindowPhase {
  kIdle,
  kSampling,
  kStopping,
  kCooling,
  kRestoring,
  kLogged,
};

const char* ToString(WindowPhase phase);

// A victim that did not reach exited/dead after the stop command.
struct StopAnomaly {
  std::string container;
  std::string observed_state;
};

// A platform command that failed for one container.
struct ContainerFailure {
  std::string container;
  std::string operation;
  std::string error;
};

// One chaos window as appended to `window_log.jsonl`.
struct ChaosWindow {
  int window_id = 0;
  double p_fail = 0.0;
  std::size_t eligible = 0;
  std::vector<std::string> containers;
  // Sorted normalized service names of the victims. Containers whose label
  // lookup failed are omitted.
  std::vector<std::string> services;
  double window_s = 0.0;
  std::vector<StopAnomaly> anomalies;
  std::vector<ContainerFailure> stop_failures;
  std::vector<ContainerFailure> restore_failures;
  std::string started_utc;
  std::string finished_utc;
  bool interrupted = false;
  std::vector<WindowPhase> phases;

  std::size_t Killed() const {
    return containers.size();
  }
  bool HasAnomalies() const {
    return !anomalies.empty();
  }
};

std::string ToJson(const ChaosWindow& window);

// Parses one window-log line. Unknown fields are ignored.
bool ParseChaosWindow(const std::string& line, ChaosWindow& window, std::string& error);

} // namespace resilab::chaos
