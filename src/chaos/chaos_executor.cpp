#include "chaos/chaos_executor.hpp"

#include "chaos/kill_sampler.hpp"
#include "chaos/outage_guard.hpp"
#include "core/interrupt.hpp"
#include "core/parallel.hpp"
#include "core/time_utils.hpp"
#include "fleet/service_name.hpp"

#include <mutex>
#include <set>
#include <utility>

namespace resilab::chaos {

namespace {

std::string NowUtc() {
  return core::FormatUtcTimestamp(std::chrono::system_clock::now());
}

// Appends the window record exactly once. Declared before the outage guard in
// `RunWindow`, so on any early exit the guard restores victims first and the
// record written here already carries the restore outcome.
class WindowFinalizer {
public:
  WindowFinalizer(ChaosWindow& window, WindowLogWriter& log, core::logging::Logger& logger)
      : window_(window), log_(log), logger_(logger) {}

  ~WindowFinalizer() {
    if (committed_) {
      return;
    }
    std::string error;
    if (!Commit(error)) {
      logger_.Error("failed to append window record",
                    {{"window_id", std::to_string(window_.window_id)}, {"error", error}});
    }
  }

  WindowFinalizer(const WindowFinalizer&) = delete;
  WindowFinalizer& operator=(const WindowFinalizer&) = delete;

  bool Commit(std::string& error) {
    committed_ = true;
    window_.finished_utc = NowUtc();
    window_.phases.push_back(WindowPhase::kLogged);
    return log_.Append(window_, error);
  }

private:
  ChaosWindow& window_;
  WindowLogWriter& log_;
  core::logging::Logger& logger_;
  bool committed_ = false;
};

} // namespace

ChaosExecutor::ChaosExecutor(fleet::IContainerPlatform& platform,
                             fleet::FleetInspector& inspector, WindowLogWriter& log,
                             core::logging::Logger& logger, ChaosConfig config)
    : platform_(platform), inspector_(inspector), log_(log), logger_(logger),
      config_(config), rng_(MakeUnseededGenerator()) {}

void ChaosExecutor::EnterPhase(ChaosWindow& window, WindowPhase phase, const WindowHooks& hooks) {
  window.phases.push_back(phase);
  logger_.Debug("window phase", {{"window_id", std::to_string(window.window_id)},
                                 {"phase", ToString(phase)}});
  if (hooks.on_phase) {
    hooks.on_phase(window, phase);
  }
}

void ChaosExecutor::StopVictims(const std::vector<std::string>& victims, ChaosWindow& window) {
  std::mutex record_mu;

  core::ParallelForEach(victims.size(), config_.fan_out, [&](std::size_t i) {
    const std::string& container = victims[i];
    std::string error;
    if (!platform_.SetRestartPolicy(container, fleet::RestartPolicy::kNo, error)) {
      logger_.Warn("failed to disable auto-restart",
                   {{"container", container}, {"error", error}});
      std::lock_guard<std::mutex> lock(record_mu);
      window.stop_failures.push_back({container, "update", error});
    }
    if (!platform_.Stop(container, config_.stop_grace, error)) {
      logger_.Warn("stop command failed", {{"container", container}, {"error", error}});
      std::lock_guard<std::mutex> lock(record_mu);
      window.stop_failures.push_back({container, "stop", error});
    }
  });

  core::ParallelForEach(victims.size(), config_.fan_out, [&](std::size_t i) {
    const std::string& container = victims[i];
    fleet::ObservedState observed;
    std::string error;
    if (!platform_.InspectState(container, observed, error)) {
      logger_.Warn("victim inspect failed", {{"container", container}, {"error", error}});
      std::lock_guard<std::mutex> lock(record_mu);
      window.stop_failures.push_back({container, "inspect", error});
      return;
    }
    if (!fleet::IsTerminalStopped(observed.state)) {
      logger_.Warn("stop anomaly", {{"container", container}, {"state", observed.raw}});
      std::lock_guard<std::mutex> lock(record_mu);
      window.anomalies.push_back({container, observed.raw});
    }
  });
}

void ChaosExecutor::ResolveServices(const std::vector<std::string>& victims,
                                    ChaosWindow& window) {
  std::set<std::string> services;
  for (const auto& container : victims) {
    std::string label;
    std::string error;
    if (!platform_.ServiceLabel(container, label, error)) {
      logger_.Warn("service label lookup failed; omitted from window services",
                   {{"container", container}, {"error", error}});
      continue;
    }
    const std::string service = fleet::NormalizeServiceName(label);
    if (!service.empty()) {
      services.insert(service);
    }
  }
  window.services.assign(services.begin(), services.end());
}

bool ChaosExecutor::RunWindow(int window_id, const WindowHooks& hooks, ChaosWindow& window,
                              std::string& error) {
  window = ChaosWindow{};
  window.window_id = window_id;
  window.p_fail = config_.p_fail;
  window.window_s = static_cast<double>(config_.window.count()) / 1000.0;
  window.started_utc = NowUtc();

  WindowFinalizer finalizer(window, log_, logger_);
  EnterPhase(window, WindowPhase::kIdle, hooks);

  fleet::FleetSnapshot snapshot;
  std::string inspect_error;
  if (inspector_.Inspect(snapshot, inspect_error)) {
    inspector_.EnsureEligibleRunning(snapshot);
  } else {
    logger_.Error("fleet inspection failed; window runs with no eligible containers",
                  {{"window_id", std::to_string(window_id)}, {"error", inspect_error}});
  }

  EnterPhase(window, WindowPhase::kSampling, hooks);
  const std::vector<std::string> eligible = snapshot.EligibleNames();
  window.eligible = eligible.size();
  std::vector<std::string> victims;
  for (const std::size_t index : DrawKillSet(eligible.size(), config_.p_fail, rng_)) {
    victims.push_back(eligible[index]);
  }
  window.containers = victims;

  OutageGuard guard(platform_, logger_, config_.fan_out, window.restore_failures);
  guard.Arm(victims);

  EnterPhase(window, WindowPhase::kStopping, hooks);
  StopVictims(victims, window);
  ResolveServices(victims, window);

  logger_.Info("chaos window outage started",
               {{"window_id", std::to_string(window_id)},
                {"eligible", std::to_string(window.eligible)},
                {"killed", std::to_string(window.Killed())},
                {"anomalies", std::to_string(window.anomalies.size())}});
  if (hooks.on_outage) {
    hooks.on_outage(window);
  }

  EnterPhase(window, WindowPhase::kCooling, hooks);
  if (!core::SleepFor(config_.window, config_.cancel)) {
    window.interrupted = true;
    logger_.Warn("window cooling interrupted; restoring early",
                 {{"window_id", std::to_string(window_id)}});
  }

  EnterPhase(window, WindowPhase::kRestoring, hooks);
  guard.Restore();

  if (!finalizer.Commit(error)) {
    error = "failed to append window record: " + error;
    return false;
  }
  if (hooks.on_phase) {
    hooks.on_phase(window, WindowPhase::kLogged);
  }
  logger_.Info("chaos window logged", {{"window_id", std::to_string(window_id)},
                                       {"killed", std::to_string(window.Killed())},
                                       {"restore_failures",
                                        std::to_string(window.restore_failures.size())}});
  return true;
}

} // namespace resilab::chaos
