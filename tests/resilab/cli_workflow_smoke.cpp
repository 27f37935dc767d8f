#include "artifacts/live_window_store.hpp"
#include "live/live_window.hpp"

#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

using resilab::tests::common::AssertContains;
using resilab::tests::common::AssertTrue;
using resilab::tests::common::DispatchArgs;
using resilab::tests::common::DispatchCaptured;
using resilab::tests::common::Fail;
using resilab::tests::common::ReadFileToString;
using resilab::tests::common::WriteFileOrFail;

namespace fs = std::filesystem;

namespace {

constexpr const char* kGraphJson = R"({
  "services": ["cart", "checkout", "frontend", "redis"],
  "edges": [[0, 3], [1, 0], [2, 1]],
  "async_edges": [],
  "entrypoints": [2],
  "source": "file"
})";

constexpr const char* kTargetsJson = R"({
  "GET /api/cart": {"entry": "frontend", "all_of": ["cart"], "probe": {"path": "/api/cart"}},
  "POST /api/checkout": {
    "entry": "frontend",
    "all_of": ["checkout", "cart"],
    "probe": {"steps": [{"path": "/api/checkout", "method": "POST"}]}
  }
})";

void WriteLiveWindowOrFail(const fs::path& dir, int window_id, std::size_t cart_ok,
                           std::size_t checkout_ok) {
  resilab::live::LiveWindow window;
  window.window_id = window_id;
  window.p_fail = 0.3;
  window.endpoints["GET /api/cart"] = resilab::live::EndpointCounts{20, cart_ok, 20 - cart_ok, 0};
  window.endpoints["POST /api/checkout"] =
      resilab::live::EndpointCounts{20, checkout_ok, 0, 20 - checkout_ok};
  fs::path written;
  std::string error;
  if (!resilab::artifacts::WriteLiveWindow(window, dir, written, error)) {
    Fail("failed to seed live window: " + error);
  }
}

} // namespace

int main() {
  resilab::tests::common::ScopedTempDir temp("resilab-cli-workflow-smoke");
  const fs::path graph_path = temp.path() / "graph.json";
  const fs::path targets_path = temp.path() / "targets.json";
  const fs::path bad_targets_path = temp.path() / "bad_targets.json";
  const fs::path artifact_dir = temp.path() / "artifacts";
  WriteFileOrFail(graph_path, kGraphJson);
  WriteFileOrFail(targets_path, kTargetsJson);
  WriteFileOrFail(bad_targets_path,
                  R"({"GET /": {"k_of_n": {"k": 3, "items": ["cart", "checkout"]}}})");

  AssertTrue(DispatchArgs({"resilab"}) == 2, "missing subcommand is a usage error");
  AssertTrue(DispatchArgs({"resilab", "frobnicate"}) == 2, "unknown subcommand is a usage error");
  const auto version = DispatchCaptured({"resilab", "version"});
  AssertTrue(version.exit_code == 0, "version should succeed");
  AssertContains(version.out, "resilab ");
  const auto extra = DispatchCaptured({"resilab", "version", "extra"});
  AssertTrue(extra.exit_code == 2, "version takes no arguments");
  AssertContains(extra.err, "does not accept arguments");

  AssertTrue(DispatchArgs({"resilab", "validate-targets", targets_path.string()}) == 0,
             "valid targets should pass");
  AssertTrue(DispatchArgs({"resilab", "validate-targets", bad_targets_path.string()}) == 10,
             "k above the item count is a config error");
  AssertTrue(DispatchArgs({"resilab", "validate-targets"}) == 2,
             "validate-targets needs a path");

  // Model side: aggregate estimate plus one estimate per endpoint and mode.
  for (const std::string mode : {"blocking", "non_blocking"}) {
    const fs::path out = temp.path() / ("model_" + mode + ".json");
    const int exit_code = DispatchArgs(
        {"resilab", "simulate", "--graph", graph_path.string(), "--p", "0.3", "--mode", mode,
         "--out", out.string(), "--targets", targets_path.string(), "--samples", "400",
         "--threads", "2", "--estimates-dir", artifact_dir.string(), "--log-level", "warn"});
    AssertTrue(exit_code == 0, "simulate should succeed");
    const std::string estimate = ReadFileToString(out);
    AssertContains(estimate, "\"scope\": \"aggregate\"");
    AssertContains(estimate, "\"mode\": \"" + mode + "\"");
    AssertContains(estimate, "\"population\": 3");
  }
  AssertTrue(fs::exists(artifact_dir / "model_blocking_p0.3_GET_api_cart.json"),
             "per-endpoint estimate file expected");
  AssertTrue(fs::exists(artifact_dir / "model_non_blocking_p0.3_POST_api_checkout.json"),
             "per-endpoint estimate file expected");

  // A declared entry joins the entrypoints, so it leaves the kill population
  // instead of failing preparation.
  const fs::path checkout_entry_path = temp.path() / "checkout_entry.json";
  WriteFileOrFail(checkout_entry_path,
                  R"({"cart via checkout": {"entry": "checkout", "all_of": ["cart"]}})");
  const fs::path checkout_entry_out = temp.path() / "model_checkout_entry.json";
  AssertTrue(DispatchArgs({"resilab", "simulate", "--graph", graph_path.string(), "--p", "0.3",
                           "--mode", "blocking", "--out", checkout_entry_out.string(),
                           "--targets", checkout_entry_path.string(), "--samples", "200",
                           "--log-level", "warn"}) == 0,
             "simulate protects declared entries");
  AssertContains(ReadFileToString(checkout_entry_out), "\"population\": 2");

  AssertTrue(DispatchArgs({"resilab", "simulate", "--graph", graph_path.string(), "--p", "0.3",
                           "--mode", "eventual", "--out",
                           (temp.path() / "x.json").string()}) == 2,
             "unknown mode is a usage error");
  AssertTrue(DispatchArgs({"resilab", "simulate", "--graph", graph_path.string(), "--p", "1.5",
                           "--mode", "blocking", "--out",
                           (temp.path() / "x.json").string()}) == 2,
             "p outside [0, 1] is a usage error");
  AssertTrue(DispatchArgs({"resilab", "simulate", "--graph",
                           (temp.path() / "missing.json").string(), "--p", "0.3", "--mode",
                           "blocking", "--out", (temp.path() / "x.json").string()}) == 10,
             "unreadable graph is a config error");
  AssertTrue(DispatchArgs({"resilab", "simulate", "--graph", graph_path.string(), "--p", "0.3",
                           "--mode", "blocking", "--out", (temp.path() / "x.json").string(),
                           "--targets", bad_targets_path.string()}) == 10,
             "invalid targets are a config error");

  // Live side: three windows, the last one dropped by the p filter.
  WriteLiveWindowOrFail(artifact_dir, 1, 15, 12);
  WriteLiveWindowOrFail(artifact_dir, 2, 14, 10);
  WriteLiveWindowOrFail(artifact_dir, 3, 17, 13);

  AssertTrue(DispatchArgs({"resilab", "compare", "--p", "0.3", "--dir", artifact_dir.string(),
                           "--bootstrap", "200", "--log-level", "warn"}) == 0,
             "compare should succeed");
  const std::string comparison = ReadFileToString(artifact_dir / "comparison_p0.3.json");
  AssertContains(comparison, "\"live_windows\": 3");
  AssertContains(comparison, "\"endpoint\": \"GET /api/cart\"");
  AssertContains(comparison, "\"endpoint\": \"POST /api/checkout\"");
  AssertContains(comparison, "\"blocking\": {\"windows\": 3");
  AssertContains(ReadFileToString(artifact_dir / "comparison_p0.3.md"), "| GET /api/cart |");
  AssertContains(ReadFileToString(artifact_dir / "comparison_p0.3.csv"),
                 "p_fail,endpoint,variant,mode");

  AssertTrue(DispatchArgs({"resilab", "compare", "--p", "0.5", "--dir",
                           artifact_dir.string()}) == 1,
             "no live windows at the requested p is a failure");
  AssertTrue(DispatchArgs({"resilab", "compare", "--dir", artifact_dir.string()}) == 2,
             "compare requires --p");

  std::cout << "cli_workflow_smoke: ok\n";
  return 0;
}
