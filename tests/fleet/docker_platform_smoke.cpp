#include "core/process.hpp"
#include "fleet/docker_platform.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using resilab::tests::common::AssertContains;
using resilab::tests::common::AssertTrue;
using resilab::tests::common::Fail;

namespace fs = std::filesystem;

namespace {

// Stand-in docker binary: answers `ps` and `inspect` from fixed text and
// fails every command aimed at a container named `ghost`.
fs::path WriteFakeDocker(const fs::path& dir) {
  const fs::path script = dir / "docker";
  const fs::path calls = dir / "calls.log";
  resilab::tests::common::WriteFileOrFail(
      script,
      "#!/bin/sh\n"
      "echo \"$*\" >> " + resilab::core::ShellQuote(calls.string()) + "\n"
      "for last; do :; done\n"
      "if [ \"$last\" = ghost ]; then echo 'Error: No such container: ghost'; exit 1; fi\n"
      "case \"$1\" in\n"
      "  ps) printf 'demo-cart-1\\tcartservice\\trunning\\n"
      "demo-redis-1\\tredis\\texited\\nloose-container\\t\\trunning\\n' ;;\n"
      "  inspect)\n"
      "    case \"$3\" in\n"
      "      *State*) echo dead ;;\n"
      "      *) if [ \"$last\" = demo-orphan-1 ]; then echo '<no value>'; "
      "else echo checkoutservice; fi ;;\n"
      "    esac ;;\n"
      "  *) echo \"$last\" ;;\n"
      "esac\n");
  fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);
  return script;
}

} // namespace

int main() {
  AssertTrue(resilab::core::ShellQuote("it's") == "'it'\\''s'", "single quotes are escaped");
  AssertTrue(resilab::core::JoinCommand({"a", "'b c'"}) == "a 'b c'", "tokens joined by spaces");

  resilab::core::CommandResult shell_result;
  std::string error;
  if (!resilab::core::RunShellCommand("echo out; exit 3", shell_result, error)) {
    Fail("shell command should launch: " + error);
  }
  AssertTrue(shell_result.exit_code == 3, "exit status should be decoded");
  AssertContains(shell_result.output, "out");

  resilab::tests::common::ScopedTempDir temp("resilab-docker-platform-smoke");
  const fs::path docker = WriteFakeDocker(temp.path());
  resilab::fleet::DockerCliPlatform platform({docker.string(), "demo"});

  std::vector<resilab::fleet::ContainerInfo> containers;
  if (!platform.ListContainers(containers, error)) {
    Fail("ListContainers failed: " + error);
  }
  AssertTrue(containers.size() == 2U, "containers without a service label are skipped");
  AssertTrue(containers[0].name == "demo-cart-1" && containers[0].service == "cart",
             "service label should be normalized");
  AssertTrue(containers[0].state == resilab::fleet::ContainerState::kRunning, "running state");
  AssertTrue(containers[1].state == resilab::fleet::ContainerState::kExited, "exited state");

  resilab::fleet::ObservedState state;
  if (!platform.InspectState("demo-cart-1", state, error)) {
    Fail("InspectState failed: " + error);
  }
  AssertTrue(state.state == resilab::fleet::ContainerState::kDead && state.raw == "dead",
             "inspect status should parse");

  std::string label;
  if (!platform.ServiceLabel("demo-checkout-1", label, error)) {
    Fail("ServiceLabel failed: " + error);
  }
  AssertTrue(label == "checkoutservice", "raw service label expected");
  AssertTrue(!platform.ServiceLabel("demo-orphan-1", label, error),
             "missing label should fail");
  AssertContains(error, "no compose service label");

  if (!platform.Stop("demo-cart-1", std::chrono::seconds(2), error) ||
      !platform.SetRestartPolicy("demo-cart-1", resilab::fleet::RestartPolicy::kNo, error) ||
      !platform.Start("demo-cart-1", error)) {
    Fail("lifecycle commands should succeed: " + error);
  }
  AssertTrue(!platform.Stop("ghost", std::chrono::seconds(1), error), "docker failure surfaces");
  AssertContains(error, "docker exited with code 1");
  AssertContains(error, "No such container");

  const std::string calls = resilab::tests::common::ReadFileToString(temp.path() / "calls.log");
  AssertContains(calls, "label=com.docker.compose.project=demo");
  AssertContains(calls, "stop --time 2 demo-cart-1");
  AssertContains(calls, "update --restart=no demo-cart-1");
  AssertContains(calls, "start demo-cart-1");

  std::cout << "docker_platform_smoke: ok\n";
  return 0;
}
