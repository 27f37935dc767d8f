#include "experiment/experiment_runner.hpp"

#include "artifacts/live_window_store.hpp"
#include "artifacts/output_dir_utils.hpp"
#include "chaos/window_log.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/parallel.hpp"
#include "core/time_utils.hpp"
#include "events/emitter.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <limits>
#include <sstream>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace resilab::experiment {

namespace {

std::chrono::system_clock::time_point Now() {
  return std::chrono::system_clock::now();
}

bool CancelRequested(const std::atomic<bool>* cancel) {
  return cancel != nullptr && cancel->load();
}

} // namespace

bool ValidateExperimentConfig(const ExperimentConfig& config, std::string& error) {
  if (config.windows < 1) {
    error = "windows must be at least 1";
    return false;
  }
  if (!std::isfinite(config.chaos.p_fail) || config.chaos.p_fail < 0.0 ||
      config.chaos.p_fail > 1.0) {
    error = "p_fail must be within [0, 1]";
    return false;
  }
  if (config.collector.base_url.empty()) {
    error = "base URL cannot be empty";
    return false;
  }
  if (config.collector.concurrency == 0U) {
    error = "probe concurrency must be at least 1";
    return false;
  }
  return live::ValidateCollectorTiming(config.collector.reveal, config.collector.measure,
                                       config.chaos.window, error);
}

ExperimentRunner::ExperimentRunner(fleet::IContainerPlatform& platform,
                                   live::IProbeClient& probe_client,
                                   std::vector<model::TargetSpec> targets,
                                   ExperimentConfig config, core::logging::Logger& logger)
    : platform_(platform), probe_client_(probe_client), targets_(std::move(targets)),
      config_(std::move(config)), logger_(logger) {
  if (config_.collector.cancel == nullptr) {
    config_.collector.cancel = config_.chaos.cancel;
  }
}

bool ExperimentRunner::Run(ExperimentResult& result, std::string& error) {
  result = ExperimentResult{};
  if (!ValidateExperimentConfig(config_, error)) {
    return false;
  }
  if (!artifacts::EnsureOutputDir(config_.output_dir, error)) {
    return false;
  }

  live::LiveCollector collector(probe_client_, targets_, config_.collector, logger_);
  if (collector.probed_endpoints() == 0U) {
    error = "no endpoint in the target set declares a probe";
    return false;
  }

  result.run_id = core::MakeRunId(Now());
  logger_.SetRunId(result.run_id);

  fleet::FleetInspector inspector(platform_, config_.inspector, logger_);
  chaos::WindowLogWriter window_log(config_.output_dir / artifacts::kWindowLogFileName);
  chaos::ChaosExecutor executor(platform_, inspector, window_log, logger_, config_.chaos);
  events::Emitter emitter(config_.output_dir);
  result.window_log_path = window_log.path();
  result.events_path = emitter.events_path();

  if (!emitter.EmitRunStarted({Now(), result.run_id, config_.command, config_.chaos.p_fail,
                               config_.windows, config_.mode_label},
                              error)) {
    error = "failed to append run start event: " + error;
    return false;
  }
  logger_.Info("experiment started",
               {{"p_fail", core::FormatJsonNumber(config_.chaos.p_fail)},
                {"windows", std::to_string(config_.windows)},
                {"endpoints", std::to_string(collector.probed_endpoints())},
                {"output_dir", config_.output_dir.string()}});

  // Timeline appends from the chaos thread are best effort; a lost event must
  // not abort a window that already stopped containers.
  auto emit_or_log = [this](bool ok, const std::string& emit_error) {
    if (!ok) {
      logger_.Warn("failed to append timeline event", {{"error", emit_error}});
    }
  };

  // Never start chaos against a cold or unreachable system.
  std::string ready_error;
  const live::ReadinessStatus readiness = collector.WaitUntilReady(ready_error);
  if (readiness == live::ReadinessStatus::kTimedOut) {
    error = "readiness wait failed: " + ready_error;
    return false;
  }
  if (readiness == live::ReadinessStatus::kInterrupted) {
    result.interrupted = true;
  }

  for (int window_id = 1; window_id <= config_.windows && !result.interrupted; ++window_id) {
    if (CancelRequested(config_.chaos.cancel)) {
      result.interrupted = true;
      break;
    }
    core::logging::ScopedContext window_scope(logger_, "window", std::to_string(window_id));

    chaos::ChaosWindow chaos_window;
    live::LiveWindow live_window;
    std::promise<void> outage_promise;
    std::future<void> outage_future = outage_promise.get_future();
    std::atomic<bool> outage_reached{false};
    bool chaos_ok = false;
    std::string chaos_error;

    chaos::WindowHooks hooks;
    hooks.on_phase = [&](const chaos::ChaosWindow& window, chaos::WindowPhase phase) {
      std::string emit_error;
      const bool ok = emitter.EmitWindowPhase(
          {Now(), result.run_id, window.window_id, chaos::ToString(phase)}, emit_error);
      emit_or_log(ok, emit_error);
    };
    hooks.on_outage = [&](const chaos::ChaosWindow& window) {
      std::string emit_error;
      const bool ok = emitter.EmitOutageStarted({Now(), result.run_id, window.window_id,
                                                 window.eligible, window.Killed(),
                                                 window.anomalies.size()},
                                                emit_error);
      emit_or_log(ok, emit_error);
      outage_reached.store(true);
      outage_promise.set_value();
    };

    std::thread chaos_thread([&]() {
      chaos_ok = executor.RunWindow(window_id, hooks, chaos_window, chaos_error);
      if (!outage_reached.load()) {
        outage_promise.set_value();
      }
    });
    // The executor restores its victims before the thread ends; never let an
    // unwinding stack skip that.
    core::ThreadJoiner chaos_joiner(chaos_thread);

    outage_future.wait();
    bool collected = false;
    std::string collect_error;
    if (outage_reached.load()) {
      std::string emit_error;
      emit_or_log(emitter.EmitMeasurement({Now(), result.run_id, window_id, false, 0, 0},
                                          emit_error),
                  emit_error);
      collected = collector.Collect(window_id, config_.chaos.p_fail, config_.mode_label,
                                    live_window, collect_error);
    }
    chaos_thread.join();

    result.chaos_windows.push_back(chaos_window);
    if (!chaos_ok) {
      error = "window " + std::to_string(window_id) + ": " + chaos_error;
      return false;
    }
    if (!collected) {
      error = "window " + std::to_string(window_id) + ": live measurement failed" +
              (collect_error.empty() ? std::string() : ": " + collect_error);
      return false;
    }

    live_window.anomalous = chaos_window.HasAnomalies();
    live_window.killed = chaos_window.Killed();
    fs::path live_path;
    if (!artifacts::WriteLiveWindow(live_window, config_.output_dir, live_path, error)) {
      error = "failed to write live window: " + error;
      return false;
    }
    std::string emit_error;
    emit_or_log(emitter.EmitMeasurement({Now(), result.run_id, window_id, true,
                                         live_window.TotalAttempted(),
                                         live_window.TotalSucceeded()},
                                        emit_error),
                emit_error);

    logger_.Info("window measured",
                 {{"killed", std::to_string(live_window.killed)},
                  {"anomalous", live_window.anomalous ? "true" : "false"},
                  {"probes", std::to_string(live_window.TotalAttempted())},
                  {"succeeded", std::to_string(live_window.TotalSucceeded())},
                  {"live_window", live_path.string()}});
    result.live_windows.push_back(std::move(live_window));
    result.live_window_paths.push_back(live_path);

    if (chaos_window.interrupted) {
      result.interrupted = true;
      break;
    }
  }

  if (!emitter.EmitRunCompleted({Now(), result.run_id,
                                 static_cast<int>(result.live_windows.size()),
                                 result.interrupted},
                                error)) {
    error = "failed to append run completion event: " + error;
    return false;
  }
  if (result.interrupted) {
    logger_.Warn("experiment interrupted",
                 {{"windows_completed", std::to_string(result.live_windows.size())}});
  } else {
    logger_.Info("experiment completed",
                 {{"windows_completed", std::to_string(result.live_windows.size())}});
  }
  return true;
}

ChaosValidationOutcome EvaluateChaosValidation(const chaos::ChaosWindow& chaos_window,
                                               const live::LiveWindow& live_window,
                                               const ChaosValidationThresholds& thresholds) {
  ChaosValidationOutcome outcome;
  outcome.killed = chaos_window.Killed();
  outcome.probes = live_window.TotalAttempted();
  outcome.succeeded = live_window.TotalSucceeded();
  outcome.live_rate = outcome.probes == 0U
                          ? std::numeric_limits<double>::quiet_NaN()
                          : static_cast<double>(outcome.succeeded) /
                                static_cast<double>(outcome.probes);

  if (outcome.killed < thresholds.min_kills) {
    outcome.failures.push_back("expected at least " + std::to_string(thresholds.min_kills) +
                               " kills, got " + std::to_string(outcome.killed));
  }
  if (outcome.probes == 0U) {
    outcome.failures.push_back("no probes completed during the outage");
  } else if (outcome.live_rate > thresholds.max_live_rate) {
    outcome.failures.push_back("live success rate " +
                               core::FormatFixedDouble(outcome.live_rate, 4) +
                               " exceeds threshold " +
                               core::FormatFixedDouble(thresholds.max_live_rate, 4));
  }
  outcome.passed = outcome.failures.empty();
  return outcome;
}

bool WriteChaosValidationSummary(const ChaosValidationOutcome& outcome,
                                 const ChaosValidationThresholds& thresholds, double p_fail,
                                 const fs::path& output_dir, fs::path& written_path,
                                 std::string& error) {
  if (!artifacts::EnsureOutputDir(output_dir, error)) {
    return false;
  }

  std::ostringstream out;
  out << "{\n"
      << "  \"p_fail\": " << core::FormatJsonNumber(p_fail) << ",\n"
      << "  \"killed\": " << outcome.killed << ",\n"
      << "  \"min_kills\": " << thresholds.min_kills << ",\n"
      << "  \"probes\": " << outcome.probes << ",\n"
      << "  \"succeeded\": " << outcome.succeeded << ",\n"
      << "  \"R_live\": " << core::FormatJsonNumber(outcome.live_rate) << ",\n"
      << "  \"max_live\": " << core::FormatJsonNumber(thresholds.max_live_rate) << ",\n"
      << "  \"passed\": " << (outcome.passed ? "true" : "false") << ",\n"
      << "  \"failures\": " << core::FormatJsonStringArray(outcome.failures) << "\n"
      << "}\n";

  written_path = output_dir / "validation_summary.json";
  return core::WriteTextFileAtomic(written_path, out.str(), error);
}

} // namespace resilab::experiment
