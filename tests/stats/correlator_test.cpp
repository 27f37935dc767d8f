#include "stats/correlator.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <random>
#include <string>
#include <vector>

using Catch::Approx;
using resilab::model::EstimateScope;
using resilab::model::ModelEstimate;
using resilab::model::SemanticsMode;
using resilab::stats::ComparisonResult;
using resilab::stats::Variant;

namespace {

ModelEstimate EndpointEstimate(const std::string& endpoint, SemanticsMode mode, double p_fail,
                               double success_rate) {
  ModelEstimate estimate;
  estimate.scope = EstimateScope::kEndpoint;
  estimate.endpoint = endpoint;
  estimate.mode = mode;
  estimate.p_fail = p_fail;
  estimate.success_rate = success_rate;
  estimate.samples = 1000;
  return estimate;
}

resilab::live::LiveWindow Window(int window_id, double p_fail, const std::string& endpoint,
                                 std::size_t attempted, std::size_t succeeded) {
  resilab::live::LiveWindow window;
  window.window_id = window_id;
  window.p_fail = p_fail;
  window.endpoints[endpoint].attempted = attempted;
  window.endpoints[endpoint].succeeded = succeeded;
  return window;
}

const ComparisonResult& Find(const std::vector<ComparisonResult>& results,
                             const std::string& endpoint, Variant variant) {
  for (const auto& result : results) {
    if (result.endpoint == endpoint && result.variant == variant) {
      return result;
    }
  }
  FAIL("missing result for " << endpoint << "/" << resilab::stats::ToString(variant));
  return results.front();
}

resilab::stats::CorrelatorOptions FastOptions() {
  resilab::stats::CorrelatorOptions options;
  options.bootstrap.resamples = 200;
  return options;
}

} // namespace

TEST_CASE("Mode labels select the windows of each mode", "[stats][correlator]") {
  REQUIRE(resilab::live::ModeLabelMatches("any", "blocking"));
  REQUIRE(resilab::live::ModeLabelMatches("", "non_blocking"));
  REQUIRE(resilab::live::ModeLabelMatches("blocking", "blocking"));
  REQUIRE_FALSE(resilab::live::ModeLabelMatches("blocking", "non_blocking"));
}

TEST_CASE("Per-endpoint comparison pairs both modes by window", "[stats][correlator]") {
  std::vector<resilab::live::LiveWindow> windows = {
      Window(0, 0.3, "GET /", 10, 9),
      Window(1, 0.3, "GET /", 10, 7),
      Window(2, 0.5, "GET /", 10, 0),
  };
  windows[1].anomalous = true;
  const std::vector<ModelEstimate> estimates = {
      EndpointEstimate("GET /", SemanticsMode::kBlocking, 0.3, 0.8),
      EndpointEstimate("GET /", SemanticsMode::kNonBlocking, 0.3, 0.9),
      EndpointEstimate("GET /", SemanticsMode::kBlocking, 0.5, 0.1),
  };

  std::mt19937_64 rng(5U);
  const auto results = resilab::stats::Correlate(windows, estimates, 0.3, FastOptions(), rng);
  REQUIRE(results.size() == 4U);

  const auto& all = Find(results, "GET /", Variant::kAll);
  REQUIRE(all.window_ids == std::vector<int>{0, 1});
  REQUIRE(all.modes.size() == 2U);
  REQUIRE(all.modes[0].mode == SemanticsMode::kBlocking);
  REQUIRE(all.modes[0].windows == 2U);
  REQUIRE(all.modes[0].model_value == Approx(0.8));
  REQUIRE(all.modes[0].mean_live_rate == Approx(0.8));
  REQUIRE(all.modes[0].mean_bias == Approx(0.0).margin(1e-12));
  REQUIRE(all.modes[0].mean_abs_bias == Approx(0.1));
  REQUIRE(all.modes[1].mean_bias == Approx(0.1));
  REQUIRE(all.modes[1].mean_abs_bias == Approx(0.1));
  REQUIRE(all.modes[0].bias_ci.valid);

  REQUIRE(all.has_paired);
  REQUIRE(all.paired.pairs == 2U);
  REQUIRE(all.paired.mean_delta_abs_bias == Approx(0.0).margin(1e-12));
  REQUIRE(all.paired.share_delta_positive == Approx(0.5));
  REQUIRE(all.paired.cliffs_delta.valid);

  const auto& clean = Find(results, "GET /", Variant::kClean);
  REQUIRE(clean.window_ids == std::vector<int>{0});
  REQUIRE(clean.modes[0].mean_bias == Approx(-0.1));
}

TEST_CASE("Mix weights windows and endpoints by probe count", "[stats][correlator]") {
  resilab::live::LiveWindow first = Window(0, 0.2, "a", 10, 10);
  first.endpoints["b"].attempted = 30;
  first.endpoints["b"].succeeded = 15;
  resilab::live::LiveWindow second = Window(1, 0.2, "a", 10, 5);
  second.endpoints["b"].attempted = 0;

  const std::vector<ModelEstimate> estimates = {
      EndpointEstimate("a", SemanticsMode::kBlocking, 0.2, 1.0),
      EndpointEstimate("b", SemanticsMode::kBlocking, 0.2, 0.5),
  };

  std::mt19937_64 rng(6U);
  const auto results =
      resilab::stats::Correlate({first, second}, estimates, 0.2, FastOptions(), rng);

  const auto& mix = Find(results, resilab::stats::kMixEndpoint, Variant::kAll);
  REQUIRE(mix.modes.size() == 1U);
  REQUIRE_FALSE(mix.has_paired);
  // Window 0: 40 probes, bias 0. Window 1: 10 probes, bias 0.5.
  REQUIRE(mix.modes[0].mean_live_rate == Approx(0.6));
  REQUIRE(mix.modes[0].mean_bias == Approx(0.1));
  REQUIRE(mix.modes[0].model_value == Approx(0.7));
}

TEST_CASE("Windows labelled for one mode are compared only in that mode",
          "[stats][correlator]") {
  resilab::live::LiveWindow window = Window(0, 0.3, "GET /", 4, 4);
  window.mode_label = "non_blocking";
  const std::vector<ModelEstimate> estimates = {
      EndpointEstimate("GET /", SemanticsMode::kBlocking, 0.3, 0.5),
      EndpointEstimate("GET /", SemanticsMode::kNonBlocking, 0.3, 0.75),
  };

  std::mt19937_64 rng(7U);
  const auto results = resilab::stats::Correlate({window}, estimates, 0.3, FastOptions(), rng);
  const auto& all = Find(results, "GET /", Variant::kAll);
  REQUIRE(all.modes.size() == 1U);
  REQUIRE(all.modes[0].mode == SemanticsMode::kNonBlocking);
  REQUIRE(all.modes[0].mean_bias == Approx(-0.25));
  REQUIRE_FALSE(all.has_paired);
}

TEST_CASE("Aggregate estimates and unmeasured endpoints are left out", "[stats][correlator]") {
  ModelEstimate aggregate;
  aggregate.scope = EstimateScope::kAggregate;
  aggregate.p_fail = 0.3;
  aggregate.success_rate = 0.5;

  const std::vector<ModelEstimate> estimates = {
      aggregate,
      EndpointEstimate("model-only", SemanticsMode::kBlocking, 0.3, 0.5),
  };
  std::mt19937_64 rng(8U);
  const auto results = resilab::stats::Correlate({Window(0, 0.3, "GET /", 5, 5)}, estimates, 0.3,
                                                 FastOptions(), rng);
  REQUIRE(results.empty());
}

TEST_CASE("Anomaly flags come from the matching chaos window", "[stats][correlator]") {
  std::vector<resilab::live::LiveWindow> windows = {Window(0, 0.3, "a", 1, 1),
                                                   Window(1, 0.3, "a", 1, 1)};
  resilab::chaos::ChaosWindow clean_window;
  clean_window.window_id = 0;
  clean_window.p_fail = 0.3;
  clean_window.containers = {"c1", "c2"};
  resilab::chaos::ChaosWindow noisy_window = clean_window;
  noisy_window.window_id = 1;
  noisy_window.anomalies = {{"c1", "running"}};
  resilab::chaos::ChaosWindow other_p = noisy_window;
  other_p.window_id = 0;
  other_p.p_fail = 0.5;

  resilab::stats::ApplyAnomalyFlags(windows, {clean_window, noisy_window, other_p});
  REQUIRE_FALSE(windows[0].anomalous);
  REQUIRE(windows[0].killed == 2U);
  REQUIRE(windows[1].anomalous);
}

TEST_CASE("Paired mix covers only endpoints estimated in both modes", "[stats][correlator]") {
  // "a" has both estimates; "b" only a blocking one and a very different
  // live rate, which would skew the blocking side of the pair if mixed in.
  resilab::live::LiveWindow first = Window(0, 0.3, "a", 10, 8);
  first.endpoints["b"].attempted = 90;
  first.endpoints["b"].succeeded = 0;
  resilab::live::LiveWindow second = Window(1, 0.3, "a", 10, 6);
  second.endpoints["b"].attempted = 90;
  second.endpoints["b"].succeeded = 0;

  const std::vector<ModelEstimate> estimates = {
      EndpointEstimate("a", SemanticsMode::kBlocking, 0.3, 0.7),
      EndpointEstimate("a", SemanticsMode::kNonBlocking, 0.3, 0.9),
      EndpointEstimate("b", SemanticsMode::kBlocking, 0.3, 1.0),
  };

  std::mt19937_64 rng(9U);
  const auto results =
      resilab::stats::Correlate({first, second}, estimates, 0.3, FastOptions(), rng);

  const auto& mix = Find(results, resilab::stats::kMixEndpoint, Variant::kAll);
  REQUIRE(mix.mix_endpoints == std::vector<std::string>{"a"});
  REQUIRE(mix.modes.size() == 2U);
  REQUIRE(mix.modes[0].mode == SemanticsMode::kBlocking);
  REQUIRE(mix.modes[0].mean_live_rate == Approx(0.7));
  REQUIRE(mix.modes[0].model_value == Approx(0.7));
  REQUIRE(mix.modes[1].mean_live_rate == Approx(0.7));
  REQUIRE(mix.modes[1].model_value == Approx(0.9));
  REQUIRE(mix.has_paired);
  REQUIRE(mix.paired.pairs == 2U);

  // The single-mode endpoint still gets its own comparison.
  const auto& only_blocking = Find(results, "b", Variant::kAll);
  REQUIRE(only_blocking.modes.size() == 1U);
  REQUIRE(only_blocking.mix_endpoints.empty());
}

TEST_CASE("Single-mode mix keeps every estimated endpoint", "[stats][correlator]") {
  resilab::live::LiveWindow window = Window(0, 0.2, "a", 10, 10);
  window.endpoints["b"].attempted = 10;
  window.endpoints["b"].succeeded = 5;
  const std::vector<ModelEstimate> estimates = {
      EndpointEstimate("a", SemanticsMode::kBlocking, 0.2, 1.0),
      EndpointEstimate("b", SemanticsMode::kBlocking, 0.2, 0.5),
  };
  std::mt19937_64 rng(10U);
  const auto results = resilab::stats::Correlate({window}, estimates, 0.2, FastOptions(), rng);
  const auto& mix = Find(results, resilab::stats::kMixEndpoint, Variant::kAll);
  REQUIRE(mix.mix_endpoints == std::vector<std::string>{"a", "b"});
}
