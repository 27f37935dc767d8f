#include "fleet/fleet_inspector.hpp"

#include "core/parallel.hpp"

#include <set>
#include <utility>

namespace resilab::fleet {

std::vector<std::string> FleetSnapshot::EligibleNames() const {
  std::vector<std::string> names;
  names.reserve(eligible.size());
  for (const auto& container : eligible) {
    names.push_back(container.name);
  }
  return names;
}

std::vector<std::string> FleetSnapshot::ObservedServices() const {
  std::set<std::string> services;
  for (const auto& container : eligible) {
    services.insert(container.service);
  }
  for (const auto& container : excluded) {
    services.insert(container.service);
  }
  return {services.begin(), services.end()};
}

FleetInspector::FleetInspector(IContainerPlatform& platform, FleetInspectorOptions options,
                               core::logging::Logger& logger)
    : platform_(platform), options_(std::move(options)), logger_(logger) {}

bool FleetInspector::Inspect(FleetSnapshot& snapshot, std::string& error) {
  snapshot = FleetSnapshot{};

  std::vector<ContainerInfo> containers;
  if (!platform_.ListContainers(containers, error)) {
    error = "failed to list containers: " + error;
    return false;
  }

  std::set<std::string> observed;
  for (const auto& container : containers) {
    observed.insert(container.service);
  }

  std::string fallback_reason;
  snapshot.policy = BuildEligibilityPolicy(options_.disallowlist, options_.entrypoints,
                                           {observed.begin(), observed.end()}, fallback_reason);
  if (!fallback_reason.empty()) {
    logger_.Warn("eligibility fallback", {{"reason", fallback_reason}});
  }

  for (auto& container : containers) {
    if (snapshot.policy.IsEligible(container.service)) {
      snapshot.eligible.push_back(std::move(container));
    } else {
      snapshot.excluded.push_back(std::move(container));
    }
  }

  logger_.Debug("fleet inspected",
                {{"eligible", std::to_string(snapshot.eligible.size())},
                 {"excluded", std::to_string(snapshot.excluded.size())},
                 {"exclusion_source", ToString(snapshot.policy.source)}});
  return true;
}

void FleetInspector::EnsureEligibleRunning(FleetSnapshot& snapshot) {
  std::vector<char> keep(snapshot.eligible.size(), 1);

  core::ParallelForEach(snapshot.eligible.size(), options_.fan_out, [&](std::size_t i) {
    ContainerInfo& container = snapshot.eligible[i];
    if (container.state == ContainerState::kRunning) {
      return;
    }

    std::string error;
    if (!platform_.Start(container.name, error)) {
      logger_.Warn("eligible container failed to start; dropped from window",
                   {{"container", container.name}, {"error", error}});
      keep[i] = 0;
      return;
    }

    ObservedState observed;
    if (!platform_.InspectState(container.name, observed, error)) {
      logger_.Warn("eligible container state unknown after start; dropped from window",
                   {{"container", container.name}, {"error", error}});
      keep[i] = 0;
      return;
    }
    if (observed.state != ContainerState::kRunning) {
      logger_.Warn("eligible container not running after start; dropped from window",
                   {{"container", container.name}, {"state", observed.raw}});
      keep[i] = 0;
      return;
    }
    container.state = ContainerState::kRunning;
    container.raw_state = observed.raw;
  });

  std::vector<ContainerInfo> running;
  running.reserve(snapshot.eligible.size());
  for (std::size_t i = 0; i < snapshot.eligible.size(); ++i) {
    if (keep[i] != 0) {
      running.push_back(std::move(snapshot.eligible[i]));
    }
  }
  snapshot.eligible = std::move(running);
}

std::map<std::string, int> CountRunningReplicas(const std::vector<ContainerInfo>& containers) {
  std::map<std::string, int> replicas;
  for (const auto& container : containers) {
    if (container.state == ContainerState::kRunning && !container.service.empty()) {
      ++replicas[container.service];
    }
  }
  return replicas;
}

} // namespace resilab::fleet
