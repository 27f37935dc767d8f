#pragma once

#include "core/logging/logger.hpp"
#include "live/live_window.hpp"
#include "live/probe_client.hpp"
#include "model/target_spec.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace resilab::live {

struct CollectorConfig {
  std::string base_url;
  // Wait after the outage starts so load balancers and health checks notice
  // the stopped containers before counting.
  std::chrono::milliseconds reveal{std::chrono::seconds(15)};
  std::chrono::milliseconds measure{std::chrono::seconds(30)};
  std::size_t concurrency = 4;
  std::chrono::milliseconds probe_timeout{std::chrono::seconds(5)};
  // Stops after this many workflow runs in total; 0 means time-bounded only.
  std::size_t max_probes = 0;
  // Readiness gate before the first window. A zero timeout skips it.
  std::chrono::milliseconds ready_timeout{0};
  std::chrono::milliseconds ready_interval{std::chrono::seconds(1)};
  // Consecutive all-green rounds required; later rounds double as warm-up
  // traffic.
  std::size_t ready_rounds = 1;
  const std::atomic<bool>* cancel = nullptr;
};

enum class ReadinessStatus {
  kReady,
  kTimedOut,
  kInterrupted,
};

const char* ToString(ReadinessStatus status);

// `reveal + measure` must fit inside the outage window.
bool ValidateCollectorTiming(std::chrono::milliseconds reveal, std::chrono::milliseconds measure,
                             std::chrono::milliseconds window, std::string& error);

struct WorkflowOutcome {
  bool success = false;
  bool transport_error = false;
  bool server_error = false;
};

class LiveCollector {
public:
  // Only targets with probe steps are measured.
  LiveCollector(IProbeClient& client, const std::vector<model::TargetSpec>& targets,
                CollectorConfig config, core::logging::Logger& logger);

  // Sleeps the reveal delay, then probes round-robin until the measurement
  // window closes. Returns false when no endpoint declares a probe.
  bool Collect(int window_id, double p_fail, const std::string& mode_label, LiveWindow& window,
               std::string& error);

  // Runs every probed workflow once per round until `ready_rounds` rounds in
  // a row succeed for all endpoints, or `ready_timeout` elapses. `error`
  // names the last failing endpoint on timeout.
  ReadinessStatus WaitUntilReady(std::string& error);

  // Runs one endpoint workflow; stops at the first failing step.
  WorkflowOutcome RunWorkflow(const model::TargetSpec& target);

  std::size_t probed_endpoints() const {
    return targets_.size();
  }

private:
  IProbeClient& client_;
  std::vector<model::TargetSpec> targets_;
  CollectorConfig config_;
  core::logging::Logger& logger_;
};

} // namespace resilab::live
