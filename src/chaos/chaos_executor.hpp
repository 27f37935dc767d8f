#pragma once

#include "chaos/chaos_window.hpp"
#include "chaos/window_log.hpp"
#include "core/logging/logger.hpp"
#include "fleet/fleet_inspector.hpp"
#include "fleet/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <random>
#include <string>

namespace resilab::chaos {

struct ChaosConfig {
  double p_fail = 0.0;
  std::chrono::milliseconds window{std::chrono::seconds(60)};
  std::chrono::seconds stop_grace{1};
  std::size_t fan_out = 4;
  // Shortens the cooling wait when set. Restoration and logging still run.
  const std::atomic<bool>* cancel = nullptr;
};

// Optional callbacks into the window state machine.
struct WindowHooks {
  // Fires after every phase transition.
  std::function<void(const ChaosWindow&, WindowPhase)> on_phase;
  // Fires once the victims are down, right before cooling starts.
  std::function<void(const ChaosWindow&)> on_outage;
};

// Runs chaos windows against one fleet:
//
//   Idle -> Sampling -> Stopping -> Cooling -> Restoring -> Logged
//
// Windows are strictly sequential; per-container commands fan out to at most
// `ChaosConfig::fan_out` workers.
class ChaosExecutor {
public:
  ChaosExecutor(fleet::IContainerPlatform& platform, fleet::FleetInspector& inspector,
                WindowLogWriter& log, core::logging::Logger& logger, ChaosConfig config);

  // Executes one window and appends its record to the window log.
  //
  // Returns false only when the record could not be appended. Platform
  // failures for individual containers are recorded on `window` instead.
  bool RunWindow(int window_id, const WindowHooks& hooks, ChaosWindow& window,
                 std::string& error);

  const ChaosConfig& config() const {
    return config_;
  }

private:
  void EnterPhase(ChaosWindow& window, WindowPhase phase, const WindowHooks& hooks);
  void StopVictims(const std::vector<std::string>& victims, ChaosWindow& window);
  void ResolveServices(const std::vector<std::string>& victims, ChaosWindow& window);

  fleet::IContainerPlatform& platform_;
  fleet::FleetInspector& inspector_;
  WindowLogWriter& log_;
  core::logging::Logger& logger_;
  ChaosConfig config_;
  std::mt19937_64 rng_;
};

} // namespace resilab::chaos
