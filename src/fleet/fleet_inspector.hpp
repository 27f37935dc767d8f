#pragma once

#include "core/logging/logger.hpp"
#include "fleet/eligibility.hpp"
#include "fleet/platform.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace resilab::fleet {

// One observation of the fleet partitioned by the eligibility policy.
struct FleetSnapshot {
  std::vector<ContainerInfo> eligible;
  std::vector<ContainerInfo> excluded;
  EligibilityPolicy policy;

  std::vector<std::string> EligibleNames() const;
  std::vector<std::string> ObservedServices() const;
};

struct FleetInspectorOptions {
  std::vector<std::string> disallowlist;
  std::vector<std::string> entrypoints = DefaultEntrypoints();
  std::size_t fan_out = 4;
};

class FleetInspector {
public:
  FleetInspector(IContainerPlatform& platform, FleetInspectorOptions options,
                 core::logging::Logger& logger);

  // Lists every container of the project, including stopped ones.
  bool Inspect(FleetSnapshot& snapshot, std::string& error);

  // Starts eligible containers that are not running. A container that cannot
  // be started, or does not report `running` afterwards, is dropped from
  // `snapshot.eligible` for this window with a warning.
  void EnsureEligibleRunning(FleetSnapshot& snapshot);

private:
  IContainerPlatform& platform_;
  FleetInspectorOptions options_;
  core::logging::Logger& logger_;
};

// Counts running containers per normalized service. Feeds `replicas.json`.
std::map<std::string, int> CountRunningReplicas(const std::vector<ContainerInfo>& containers);

} // namespace resilab::fleet
