#include "fleet/docker_platform.hpp"

#include "core/process.hpp"
#include "fleet/service_name.hpp"

#include <sstream>
#include <utility>

namespace resilab::fleet {

namespace {

constexpr const char* kComposeServiceLabel = "com.docker.compose.service";
constexpr const char* kComposeProjectLabel = "com.docker.compose.project";

std::string TrimTrailingNewlines(std::string value) {
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
    value.pop_back();
  }
  return value;
}

std::vector<std::string> SplitTabs(const std::string& line) {
  std::vector<std::string> columns;
  std::string current;
  for (const char c : line) {
    if (c == '\t') {
      columns.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  columns.push_back(current);
  return columns;
}

} // namespace

DockerCliPlatform::DockerCliPlatform(DockerPlatformOptions options)
    : options_(std::move(options)) {}

bool DockerCliPlatform::RunDocker(const std::string& arguments, std::string& output,
                                  std::string& error) const {
  core::CommandResult result;
  const std::string command = core::ShellQuote(options_.docker_binary) + " " + arguments;
  if (!core::RunShellCommand(command, result, error)) {
    return false;
  }
  output = TrimTrailingNewlines(result.output);
  if (result.exit_code != 0) {
    error = "docker exited with code " + std::to_string(result.exit_code) + ": " + output;
    return false;
  }
  return true;
}

bool DockerCliPlatform::ListContainers(std::vector<ContainerInfo>& containers,
                                       std::string& error) {
  containers.clear();

  std::string arguments = "ps -a";
  if (!options_.compose_project.empty()) {
    arguments += " --filter " +
                 core::ShellQuote(std::string("label=") + kComposeProjectLabel + "=" +
                                  options_.compose_project);
  }
  arguments += " --format " +
               core::ShellQuote(std::string("{{.Names}}\t{{.Label \"") + kComposeServiceLabel +
                                "\"}}\t{{.State}}");

  std::string output;
  if (!RunDocker(arguments, output, error)) {
    return false;
  }

  std::istringstream lines(output);
  std::string line;
  while (std::getline(lines, line)) {
    line = TrimTrailingNewlines(line);
    if (line.empty()) {
      continue;
    }
    const std::vector<std::string> columns = SplitTabs(line);
    if (columns.size() < 3U || columns[0].empty() || columns[1].empty()) {
      // Containers without a compose service label are not part of the fleet.
      continue;
    }
    ContainerInfo info;
    info.name = columns[0];
    info.service_label = columns[1];
    info.service = NormalizeServiceName(columns[1]);
    info.raw_state = columns[2];
    info.state = ParseContainerState(columns[2]);
    containers.push_back(std::move(info));
  }
  return true;
}

bool DockerCliPlatform::InspectState(const std::string& container, ObservedState& state,
                                     std::string& error) {
  std::string output;
  if (!RunDocker("inspect -f " + core::ShellQuote("{{.State.Status}}") + " " +
                     core::ShellQuote(container),
                 output, error)) {
    return false;
  }
  state.raw = output;
  state.state = ParseContainerState(output);
  return true;
}

bool DockerCliPlatform::ServiceLabel(const std::string& container, std::string& label,
                                     std::string& error) {
  std::string output;
  if (!RunDocker("inspect -f " +
                     core::ShellQuote(std::string("{{ index .Config.Labels \"") +
                                      kComposeServiceLabel + "\" }}") +
                     " " + core::ShellQuote(container),
                 output, error)) {
    return false;
  }
  if (output.empty() || output == "<no value>") {
    error = "container '" + container + "' has no compose service label";
    return false;
  }
  label = output;
  return true;
}

bool DockerCliPlatform::Stop(const std::string& container, std::chrono::seconds grace,
                             std::string& error) {
  std::string output;
  return RunDocker("stop --time " + std::to_string(grace.count()) + " " +
                       core::ShellQuote(container),
                   output, error);
}

bool DockerCliPlatform::Start(const std::string& container, std::string& error) {
  std::string output;
  return RunDocker("start " + core::ShellQuote(container), output, error);
}

bool DockerCliPlatform::SetRestartPolicy(const std::string& container, RestartPolicy policy,
                                         std::string& error) {
  std::string output;
  return RunDocker(std::string("update --restart=") + ToString(policy) + " " +
                       core::ShellQuote(container),
                   output, error);
}

} // namespace resilab::fleet
