#include "experiment/experiment_runner.hpp"

#include "chaos/window_log.hpp"

#include "../common/assertions.hpp"
#include "../common/fakes.hpp"
#include "../common/temp_dir.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using resilab::tests::common::AssertContains;
using resilab::tests::common::AssertTrue;
using resilab::tests::common::Fail;

namespace fs = std::filesystem;

namespace {

std::vector<resilab::model::TargetSpec> CartTargets() {
  resilab::model::TargetSpec cart;
  cart.endpoint = "GET /api/cart";
  cart.entry = "frontend";
  cart.rule = resilab::model::AllOf{{"cart"}};
  resilab::model::ProbeStep step;
  step.path = "/api/cart";
  cart.probe.push_back(step);
  return {cart};
}

resilab::experiment::ExperimentConfig ShortConfig(const fs::path& output_dir) {
  resilab::experiment::ExperimentConfig config;
  config.chaos.p_fail = 1.0;
  config.chaos.window = std::chrono::milliseconds(80);
  config.collector.base_url = "http://demo.local";
  config.collector.reveal = std::chrono::milliseconds(5);
  config.collector.measure = std::chrono::milliseconds(30);
  config.collector.concurrency = 2;
  config.windows = 2;
  config.mode_label = "blocking";
  config.output_dir = output_dir;
  return config;
}

} // namespace

int main() {
  resilab::tests::common::ScopedTempDir temp("resilab-experiment-runner-smoke");

  resilab::tests::common::FakePlatform platform;
  platform.Add("demo-frontend-1", "frontend");
  platform.Add("demo-cart-1", "cart");
  platform.Add("demo-checkout-1", "checkout");
  platform.Add("demo-email-1", "email");
  platform.MarkIgnoresStop("demo-email-1");

  // The cart endpoint answers only while a cart container is running.
  resilab::tests::common::FakeProbeClient client(
      [&platform](const resilab::live::ProbeRequest& request) {
        resilab::live::ProbeResponse response;
        response.latency_ms = 1.0;
        if (request.url == "http://demo.local/api/cart" && platform.ServiceDown("cart")) {
          response.status = 502;
        } else {
          response.status = 200;
        }
        return response;
      });

  std::ostringstream log_stream;
  resilab::core::logging::Logger logger(resilab::core::logging::LogLevel::kInfo, log_stream);

  const fs::path out_dir = temp.path() / "run";
  resilab::experiment::ExperimentRunner runner(platform, client, CartTargets(),
                                               ShortConfig(out_dir), logger);
  resilab::experiment::ExperimentResult result;
  std::string error;
  if (!runner.Run(result, error)) {
    Fail("experiment run failed: " + error);
  }

  AssertTrue(!result.interrupted, "run should not be interrupted");
  AssertTrue(result.run_id.rfind("run-", 0) == 0, "run id should carry the run- prefix");
  AssertTrue(result.chaos_windows.size() == 2U, "two chaos windows expected");
  AssertTrue(result.live_windows.size() == 2U, "two live windows expected");
  AssertTrue(result.live_window_paths.size() == 2U, "two live window files expected");

  for (std::size_t i = 0; i < result.live_windows.size(); ++i) {
    const auto& chaos_window = result.chaos_windows[i];
    const auto& live_window = result.live_windows[i];
    AssertTrue(chaos_window.Killed() == 3U, "cart, checkout and email are victims at p=1");
    AssertTrue(live_window.killed == chaos_window.Killed(), "kill count copied to live window");
    AssertTrue(live_window.anomalous, "email ignoring stop marks the window anomalous");
    AssertTrue(live_window.mode_label == "blocking", "mode label carried into live window");
    AssertTrue(live_window.TotalAttempted() > 0U, "probes should run during the outage");
    AssertTrue(live_window.TotalSucceeded() == 0U, "cart is down for the whole measurement");
    AssertTrue(fs::exists(result.live_window_paths[i]), "live window file should exist");
  }
  AssertTrue(result.live_window_paths[0].filename() == "live_p1_w1.json",
             "live window file naming");
  AssertTrue(result.live_window_paths[1].filename() == "live_p1_w2.json",
             "live window file naming");

  AssertTrue(platform.IsRunning("demo-cart-1"), "victims are restored after the run");
  AssertTrue(platform.IsRunning("demo-checkout-1"), "victims are restored after the run");
  AssertTrue(platform.IsRunning("demo-frontend-1"), "entrypoints are never stopped");

  const auto log_lines = resilab::tests::common::ReadNonEmptyLines(result.window_log_path);
  AssertTrue(log_lines.size() == 2U, "one window log record per window");
  std::vector<resilab::chaos::ChaosWindow> logged;
  std::size_t skipped = 0;
  if (!resilab::chaos::ReadWindowLog(result.window_log_path, logged, skipped, error)) {
    Fail("window log should read back: " + error);
  }
  AssertTrue(logged.size() == 2U && skipped == 0U, "window log records should parse");

  const std::string events = resilab::tests::common::ReadFileToString(result.events_path);
  AssertContains(events, "\"type\":\"run_started\"");
  AssertContains(events, "\"mode_label\":\"blocking\"");
  AssertContains(events, "\"type\":\"WINDOW_STARTED\"");
  AssertContains(events, "\"type\":\"OUTAGE_STARTED\"");
  AssertContains(events, "\"type\":\"MEASUREMENT_STARTED\"");
  AssertContains(events, "\"type\":\"MEASUREMENT_COMPLETED\"");
  AssertContains(events, "\"type\":\"WINDOW_LOGGED\"");
  AssertContains(events, "\"windows_completed\":\"2\"");
  AssertContains(log_stream.str(), "experiment completed");

  // The validation gate passes: kills happened and the live rate collapsed.
  const auto outcome = resilab::experiment::EvaluateChaosValidation(
      result.chaos_windows[0], result.live_windows[0],
      resilab::experiment::ChaosValidationThresholds{});
  AssertTrue(outcome.passed, "validation should pass when the outage bites");
  AssertTrue(outcome.live_rate == 0.0, "live rate should be zero");

  fs::path summary_path;
  if (!resilab::experiment::WriteChaosValidationSummary(
          outcome, resilab::experiment::ChaosValidationThresholds{}, 1.0, out_dir, summary_path,
          error)) {
    Fail("validation summary write failed: " + error);
  }
  const std::string summary = resilab::tests::common::ReadFileToString(summary_path);
  AssertContains(summary, "\"passed\": true");
  AssertContains(summary, "\"killed\": 3");

  // A window where nothing died fails the gate on both checks.
  resilab::chaos::ChaosWindow quiet_chaos;
  resilab::live::LiveWindow quiet_live;
  quiet_live.endpoints["GET /api/cart"] = resilab::live::EndpointCounts{10, 10, 0, 0};
  const auto quiet = resilab::experiment::EvaluateChaosValidation(
      quiet_chaos, quiet_live, resilab::experiment::ChaosValidationThresholds{});
  AssertTrue(!quiet.passed, "no kills and full success must fail validation");
  AssertTrue(quiet.failures.size() == 2U, "both the kill and live-rate checks fail");

  // Configuration errors are caught before any container is touched.
  {
    const std::size_t stops_before = platform.stop_calls();
    auto config = ShortConfig(temp.path() / "bad-timing");
    config.collector.measure = std::chrono::milliseconds(200);
    resilab::experiment::ExperimentRunner bad(platform, client, CartTargets(), config, logger);
    AssertTrue(!bad.Run(result, error), "reveal + measure beyond the window must fail");
    AssertContains(error, "must fit inside the chaos window");
    AssertTrue(platform.stop_calls() == stops_before, "no stop issued on config error");
  }
  {
    auto targets = CartTargets();
    targets[0].probe.clear();
    resilab::experiment::ExperimentRunner bad(platform, client, targets,
                                              ShortConfig(temp.path() / "no-probes"), logger);
    AssertTrue(!bad.Run(result, error), "targets without probes must fail");
    AssertContains(error, "declares a probe");
  }

  // Cold start: the frontend answers 503 a few times before it comes up. Chaos
  // must wait until two consecutive rounds succeed.
  {
    std::atomic<int> cold_answers{3};
    std::atomic<std::size_t> calls_before_chaos{0};
    const std::size_t stops_before = platform.stop_calls();
    resilab::tests::common::FakeProbeClient warming(
        [&](const resilab::live::ProbeRequest&) {
          if (platform.stop_calls() == stops_before) {
            ++calls_before_chaos;
          }
          resilab::live::ProbeResponse response;
          response.latency_ms = 1.0;
          response.status = cold_answers.fetch_sub(1) > 0 ? 503 : 200;
          return response;
        });
    auto config = ShortConfig(temp.path() / "cold-start");
    config.windows = 1;
    config.collector.ready_timeout = std::chrono::seconds(5);
    config.collector.ready_interval = std::chrono::milliseconds(2);
    config.collector.ready_rounds = 2;
    std::ostringstream cold_log;
    resilab::core::logging::Logger cold_logger(resilab::core::logging::LogLevel::kInfo, cold_log);
    resilab::experiment::ExperimentRunner cold(platform, warming, CartTargets(), config,
                                               cold_logger);
    resilab::experiment::ExperimentResult cold_result;
    if (!cold.Run(cold_result, error)) {
      Fail("cold-start run failed: " + error);
    }
    AssertTrue(cold_result.live_windows.size() == 1U, "window runs once endpoints are ready");
    AssertTrue(calls_before_chaos.load() >= 5U,
               "three failing rounds plus two green rounds precede the first stop");
    AssertContains(cold_log.str(), "endpoints ready");
  }

  // A system that never comes up fails the run before any container is stopped.
  {
    resilab::tests::common::FakeProbeClient down([](const resilab::live::ProbeRequest&) {
      resilab::live::ProbeResponse response;
      response.status = 503;
      return response;
    });
    const std::size_t stops_before = platform.stop_calls();
    auto config = ShortConfig(temp.path() / "never-ready");
    config.collector.ready_timeout = std::chrono::milliseconds(40);
    config.collector.ready_interval = std::chrono::milliseconds(5);
    resilab::experiment::ExperimentRunner never(platform, down, CartTargets(), config, logger);
    AssertTrue(!never.Run(result, error), "unready endpoints must fail the run");
    AssertContains(error, "readiness wait failed");
    AssertContains(error, "GET /api/cart (server error)");
    AssertTrue(platform.stop_calls() == stops_before, "no stop issued before readiness");
  }

  // An interrupt during the wait ends the run without a single window.
  {
    std::atomic<bool> cancel{true};
    resilab::tests::common::FakeProbeClient down([](const resilab::live::ProbeRequest&) {
      resilab::live::ProbeResponse response;
      response.transport_error = true;
      return response;
    });
    auto config = ShortConfig(temp.path() / "interrupted-wait");
    config.chaos.cancel = &cancel;
    config.collector.ready_timeout = std::chrono::seconds(30);
    resilab::experiment::ExperimentRunner stopped(platform, down, CartTargets(), config, logger);
    resilab::experiment::ExperimentResult stopped_result;
    if (!stopped.Run(stopped_result, error)) {
      Fail("interrupted readiness wait should still finish the run: " + error);
    }
    AssertTrue(stopped_result.interrupted, "run reports the interrupt");
    AssertTrue(stopped_result.chaos_windows.empty(), "no window starts after an interrupt");
  }

  std::cout << "experiment_runner_smoke: ok\n";
  return 0;
}
