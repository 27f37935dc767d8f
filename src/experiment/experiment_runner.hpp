#pragma once

#include "chaos/chaos_executor.hpp"
#include "chaos/chaos_window.hpp"
#include "core/logging/logger.hpp"
#include "fleet/fleet_inspector.hpp"
#include "fleet/platform.hpp"
#include "live/live_collector.hpp"
#include "live/live_window.hpp"
#include "live/probe_client.hpp"
#include "model/target_spec.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace resilab::experiment {

struct ExperimentConfig {
  // `chaos.p_fail`, `chaos.window` and `chaos.cancel` drive the whole run.
  chaos::ChaosConfig chaos;
  live::CollectorConfig collector;
  fleet::FleetInspectorOptions inspector;
  int windows = 1;
  std::string mode_label = "any";
  std::filesystem::path output_dir = "out";
  // Recorded in the RUN_STARTED event.
  std::string command = "experiment";
};

struct ExperimentResult {
  std::string run_id;
  std::vector<chaos::ChaosWindow> chaos_windows;
  std::vector<live::LiveWindow> live_windows;
  std::vector<std::filesystem::path> live_window_paths;
  std::filesystem::path window_log_path;
  std::filesystem::path events_path;
  bool interrupted = false;
};

// Checks the run-level preconditions: at least one window, p within [0, 1], and
// reveal + measurement fitting inside the outage window.
bool ValidateExperimentConfig(const ExperimentConfig& config, std::string& error);

// Runs chaos windows back to back. Inside each window the chaos executor runs
// on its own thread; the live measurement starts once the victims are down
// and always finishes before the executor restores them.
//
// Artifacts under `config.output_dir`:
// - `window_log.jsonl` (one record per window)
// - `live_p<p>_w<id>.json` (anomaly flag and kill count copied from the
//   matching chaos window)
// - `events.jsonl`
class ExperimentRunner {
public:
  ExperimentRunner(fleet::IContainerPlatform& platform, live::IProbeClient& probe_client,
                   std::vector<model::TargetSpec> targets, ExperimentConfig config,
                   core::logging::Logger& logger);

  // Returns false on configuration errors or when an artifact could not be
  // written. An operator interrupt stops after the current window and is
  // reported through `result.interrupted`.
  bool Run(ExperimentResult& result, std::string& error);

private:
  fleet::IContainerPlatform& platform_;
  live::IProbeClient& probe_client_;
  std::vector<model::TargetSpec> targets_;
  ExperimentConfig config_;
  core::logging::Logger& logger_;
};

struct ChaosValidationThresholds {
  std::size_t min_kills = 1;
  double max_live_rate = 0.99;
};

struct ChaosValidationOutcome {
  bool passed = false;
  std::size_t killed = 0;
  std::size_t probes = 0;
  std::size_t succeeded = 0;
  double live_rate = 0.0;
  std::vector<std::string> failures;
};

// Confirms a single validation window actually bit: enough containers were
// killed and the overall live success rate dropped to `max_live_rate` or
// below. A window without probes fails the live check.
ChaosValidationOutcome EvaluateChaosValidation(const chaos::ChaosWindow& chaos_window,
                                               const live::LiveWindow& live_window,
                                               const ChaosValidationThresholds& thresholds);

// Writes `validation_summary.json` into `output_dir`.
bool WriteChaosValidationSummary(const ChaosValidationOutcome& outcome,
                                 const ChaosValidationThresholds& thresholds, double p_fail,
                                 const std::filesystem::path& output_dir,
                                 std::filesystem::path& written_path, std::string& error);

} // namespace resilab::experiment
