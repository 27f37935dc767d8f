#include "chaos/chaos_window.hpp"
#include "chaos/window_log.hpp"
#include "core/fs_utils.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

resilab::chaos::ChaosWindow MakeWindow(int window_id) {
  resilab::chaos::ChaosWindow window;
  window.window_id = window_id;
  window.p_fail = 0.3;
  window.eligible = 10;
  window.containers = {"demo-cart-1", "demo-checkout-1", "demo-email-1"};
  window.services = {"cart", "checkout", "email"};
  window.window_s = 60.0;
  window.anomalies = {{"demo-email-1", "running"}};
  window.restore_failures = {{"demo-cart-1", "start", "no such container"}};
  window.started_utc = "2026-10-18T10:00:00.000Z";
  window.finished_utc = "2026-10-18T10:01:00.000Z";
  window.phases = {resilab::chaos::WindowPhase::kIdle, resilab::chaos::WindowPhase::kSampling};
  return window;
}

} // namespace

TEST_CASE("Chaos window serializes kill set and anomalies", "[chaos][window]") {
  const std::string json = resilab::chaos::ToJson(MakeWindow(4));
  REQUIRE(json.find(R"("window_id":4)") != std::string::npos);
  REQUIRE(json.find(R"("killed":3)") != std::string::npos);
  REQUIRE(json.find(R"("services":["cart","checkout","email"])") != std::string::npos);
  REQUIRE(json.find(R"("anomalies":[{"container":"demo-email-1","state":"running"}])") !=
          std::string::npos);
  REQUIRE(json.find(R"("phases":["idle","sampling"])") != std::string::npos);
  REQUIRE(json.find(R"("interrupted":false)") != std::string::npos);
}

TEST_CASE("Chaos window records parse back", "[chaos][window]") {
  resilab::chaos::ChaosWindow parsed;
  std::string error;
  REQUIRE(resilab::chaos::ParseChaosWindow(resilab::chaos::ToJson(MakeWindow(2)), parsed, error));
  REQUIRE(parsed.window_id == 2);
  REQUIRE(parsed.p_fail == 0.3);
  REQUIRE(parsed.eligible == 10U);
  REQUIRE(parsed.Killed() == 3U);
  REQUIRE(parsed.HasAnomalies());
  REQUIRE(parsed.anomalies.front().observed_state == "running");
  REQUIRE(parsed.restore_failures.size() == 1U);
  REQUIRE(parsed.restore_failures.front().operation == "start");
}

TEST_CASE("Chaos window parsing rejects records without identity", "[chaos][window]") {
  resilab::chaos::ChaosWindow parsed;
  std::string error;
  REQUIRE_FALSE(resilab::chaos::ParseChaosWindow(R"({"p_fail":0.1})", parsed, error));
  REQUIRE(error.find("window_id") != std::string::npos);
  REQUIRE_FALSE(resilab::chaos::ParseChaosWindow(R"({"window_id":1})", parsed, error));
  REQUIRE_FALSE(resilab::chaos::ParseChaosWindow("[1,2]", parsed, error));
  REQUIRE(resilab::chaos::ParseChaosWindow(R"({"window_id":1,"p_fail":0.5,"extra":{}})", parsed,
                                           error));
}

TEST_CASE("Window log reader skips malformed lines", "[chaos][window_log]") {
  resilab::tests::common::ScopedTempDir temp("resilab-window-log");
  const auto log_path = temp.path() / "window_log.jsonl";

  resilab::chaos::WindowLogWriter writer(log_path);
  std::string error;
  REQUIRE(writer.Append(MakeWindow(0), error));
  REQUIRE(resilab::core::AppendLine(log_path, "{not json", error));
  REQUIRE(resilab::core::AppendLine(log_path, "", error));
  REQUIRE(writer.Append(MakeWindow(1), error));

  std::vector<resilab::chaos::ChaosWindow> windows;
  std::size_t skipped = 0;
  REQUIRE(resilab::chaos::ReadWindowLog(log_path, windows, skipped, error));
  REQUIRE(windows.size() == 2U);
  REQUIRE(skipped == 1U);
  REQUIRE(windows[0].window_id == 0);
  REQUIRE(windows[1].window_id == 1);
}

TEST_CASE("Window log reader reports a missing file", "[chaos][window_log]") {
  std::vector<resilab::chaos::ChaosWindow> windows;
  std::size_t skipped = 0;
  std::string error;
  REQUIRE_FALSE(resilab::chaos::ReadWindowLog("/nonexistent/window_log.jsonl", windows, skipped,
                                              error));
  REQUIRE_FALSE(error.empty());
}
