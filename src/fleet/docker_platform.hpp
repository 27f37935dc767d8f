#pragma once

#include "fleet/platform.hpp"

#include <string>

namespace resilab::fleet {

struct DockerPlatformOptions {
  std::string docker_binary = "docker";
  // Compose project whose containers form the fleet. Empty lists every
  // container that carries a compose service label.
  std::string compose_project;
};

// `IContainerPlatform` backed by the docker CLI. Every call shells out once;
// the adapter holds no mutable state, so concurrent calls are safe.
class DockerCliPlatform final : public IContainerPlatform {
public:
  explicit DockerCliPlatform(DockerPlatformOptions options);

  bool ListContainers(std::vector<ContainerInfo>& containers, std::string& error) override;
  bool InspectState(const std::string& container, ObservedState& state,
                    std::string& error) override;
  bool ServiceLabel(const std::string& container, std::string& label,
                    std::string& error) override;
  bool Stop(const std::string& container, std::chrono::seconds grace,
            std::string& error) override;
  bool Start(const std::string& container, std::string& error) override;
  bool SetRestartPolicy(const std::string& container, RestartPolicy policy,
                        std::string& error) override;

private:
  bool RunDocker(const std::string& arguments, std::string& output, std::string& error) const;

  DockerPlatformOptions options_;
};

} // namespace resilab::fleet
