#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace resilab::fleet {

enum class ContainerState {
  kRunning,
  kExited,
  kDead,
  kUnknown,
};

const char* ToString(ContainerState state);

// Maps a platform status word (`running`, `exited`, `dead`, `created`, ...)
// onto the lifecycle states the chaos engine reasons about.
ContainerState ParseContainerState(std::string_view raw);

// A stopped victim has reached a terminal state only in {exited, dead}.
bool IsTerminalStopped(ContainerState state);

// One observed container instance. `service` is the normalized form of
// `service_label`.
struct ContainerInfo {
  std::string name;
  std::string service_label;
  std::string service;
  ContainerState state = ContainerState::kUnknown;
  std::string raw_state;
};

struct ObservedState {
  ContainerState state = ContainerState::kUnknown;
  std::string raw;
};

enum class RestartPolicy {
  kNo,
  kUnlessStopped,
};

const char* ToString(RestartPolicy policy);

// Container platform contract consumed by the fleet inspector and the chaos
// executor. The platform owns every container; resilab only observes, stops
// and restarts what already exists.
//
// Every per-container call may fail independently and reports through
// `error`. Implementations must tolerate concurrent calls for different
// containers (stop/start fan-out).
class IContainerPlatform {
public:
  virtual ~IContainerPlatform() = default;

  // Lists all containers of the managed project, running or not.
  virtual bool ListContainers(std::vector<ContainerInfo>& containers, std::string& error) = 0;

  virtual bool InspectState(const std::string& container, ObservedState& state,
                            std::string& error) = 0;

  // Resolves the logical service label of one container.
  virtual bool ServiceLabel(const std::string& container, std::string& label,
                            std::string& error) = 0;

  virtual bool Stop(const std::string& container, std::chrono::seconds grace,
                    std::string& error) = 0;

  virtual bool Start(const std::string& container, std::string& error) = 0;

  virtual bool SetRestartPolicy(const std::string& container, RestartPolicy policy,
                                std::string& error) = 0;
};

} // namespace resilab::fleet
