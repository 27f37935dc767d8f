#include "fleet/platform.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace resilab::fleet {

const char* ToString(ContainerState state) {
  switch (state) {
  case ContainerState::kRunning:
    return "running";
  case ContainerState::kExited:
    return "exited";
  case ContainerState::kDead:
    return "dead";
  case ContainerState::kUnknown:
    return "unknown";
  }
  return "unknown";
}

ContainerState ParseContainerState(std::string_view raw) {
  std::string lowered(raw);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  // `docker ps` status text reads "Up 3 minutes" / "Exited (0) ..."; `.State`
  // gives the bare word. Accept both.
  if (lowered == "running" || lowered.rfind("up ", 0) == 0) {
    return ContainerState::kRunning;
  }
  if (lowered == "exited" || lowered.rfind("exited", 0) == 0) {
    return ContainerState::kExited;
  }
  if (lowered == "dead") {
    return ContainerState::kDead;
  }
  return ContainerState::kUnknown;
}

bool IsTerminalStopped(ContainerState state) {
  return state == ContainerState::kExited || state == ContainerState::kDead;
}

const char* ToString(RestartPolicy policy) {
  switch (policy) {
  case RestartPolicy::kNo:
    return "no";
  case RestartPolicy::kUnlessStopped:
    return "unless-stopped";
  }
  return "no";
}

} // namespace resilab::fleet
