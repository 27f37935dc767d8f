#include "stats/correlator.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <set>

namespace resilab::stats {

namespace {

constexpr std::array<model::SemanticsMode, 2> kModes = {
    model::SemanticsMode::kBlocking,
    model::SemanticsMode::kNonBlocking,
};

struct WindowSample {
  int window_id = 0;
  double live = 0.0;
  double model = 0.0;
  double weight = 1.0;

  double Bias() const {
    return model - live;
  }
};

bool SameP(double a, double b, double tolerance) {
  return std::fabs(a - b) <= tolerance;
}

// Per-endpoint model values for one mode at the requested p.
std::map<std::string, double> EndpointModels(const std::vector<model::ModelEstimate>& estimates,
                                             model::SemanticsMode mode, double p_fail,
                                             double tolerance) {
  std::map<std::string, double> values;
  for (const auto& estimate : estimates) {
    if (estimate.scope == model::EstimateScope::kEndpoint && estimate.mode == mode &&
        SameP(estimate.p_fail, p_fail, tolerance)) {
      values[estimate.endpoint] = estimate.success_rate;
    }
  }
  return values;
}

std::vector<const live::LiveWindow*> SelectWindows(const std::vector<live::LiveWindow>& windows,
                                                   model::SemanticsMode mode, Variant variant,
                                                   double p_fail, double tolerance) {
  std::vector<const live::LiveWindow*> selected;
  for (const auto& window : windows) {
    if (!SameP(window.p_fail, p_fail, tolerance) ||
        !live::ModeLabelMatches(window.mode_label, model::ToString(mode))) {
      continue;
    }
    if (variant == Variant::kClean && window.anomalous) {
      continue;
    }
    selected.push_back(&window);
  }
  std::sort(selected.begin(), selected.end(),
            [](const live::LiveWindow* a, const live::LiveWindow* b) {
              return a->window_id < b->window_id;
            });
  return selected;
}

std::vector<WindowSample> EndpointSamples(const std::vector<const live::LiveWindow*>& windows,
                                          const std::string& endpoint, double model_value) {
  std::vector<WindowSample> samples;
  for (const auto* window : windows) {
    const auto it = window->endpoints.find(endpoint);
    if (it == window->endpoints.end() || it->second.attempted == 0U) {
      continue;
    }
    const double live = static_cast<double>(it->second.succeeded) /
                        static_cast<double>(it->second.attempted);
    samples.push_back({window->window_id, live, model_value, 1.0});
  }
  return samples;
}

std::vector<WindowSample> MixSamples(const std::vector<const live::LiveWindow*>& windows,
                                     const std::map<std::string, double>& models) {
  std::vector<WindowSample> samples;
  for (const auto* window : windows) {
    double probes = 0.0;
    double ok = 0.0;
    double weighted_model = 0.0;
    for (const auto& [endpoint, counts] : window->endpoints) {
      const auto model_it = models.find(endpoint);
      if (model_it == models.end() || counts.attempted == 0U) {
        continue;
      }
      const auto attempted = static_cast<double>(counts.attempted);
      probes += attempted;
      ok += static_cast<double>(counts.succeeded);
      weighted_model += attempted * model_it->second;
    }
    if (probes > 0.0) {
      samples.push_back({window->window_id, ok / probes, weighted_model / probes, probes});
    }
  }
  return samples;
}

ModeComparison Summarize(model::SemanticsMode mode, const std::vector<WindowSample>& samples,
                         const CorrelatorOptions& options, std::mt19937_64& rng) {
  std::vector<double> live;
  std::vector<double> model_values;
  std::vector<double> bias;
  std::vector<double> abs_bias;
  std::vector<double> weights;
  for (const auto& sample : samples) {
    live.push_back(sample.live);
    model_values.push_back(sample.model);
    bias.push_back(sample.Bias());
    abs_bias.push_back(std::fabs(sample.Bias()));
    weights.push_back(sample.weight);
  }

  ModeComparison comparison;
  comparison.mode = mode;
  comparison.windows = samples.size();
  comparison.model_value = WeightedMean(model_values, weights);
  comparison.mean_live_rate = WeightedMean(live, weights);
  comparison.mean_bias = WeightedMean(bias, weights);
  comparison.mean_abs_bias = WeightedMean(abs_bias, weights);
  comparison.bias_ci = BootstrapMeanCI(bias, weights, options.bootstrap, rng);
  return comparison;
}

PairedComparison Pair(const std::vector<WindowSample>& blocking,
                      const std::vector<WindowSample>& non_blocking,
                      const CorrelatorOptions& options, std::mt19937_64& rng) {
  std::map<int, const WindowSample*> by_window;
  for (const auto& sample : non_blocking) {
    by_window[sample.window_id] = &sample;
  }

  std::vector<double> abs_blocking;
  std::vector<double> abs_non_blocking;
  std::vector<double> deltas;
  std::vector<double> weights;
  for (const auto& sample : blocking) {
    const auto it = by_window.find(sample.window_id);
    if (it == by_window.end()) {
      continue;
    }
    abs_blocking.push_back(std::fabs(sample.Bias()));
    abs_non_blocking.push_back(std::fabs(it->second->Bias()));
    deltas.push_back(abs_blocking.back() - abs_non_blocking.back());
    weights.push_back(sample.weight);
  }

  PairedComparison paired;
  paired.pairs = deltas.size();
  if (deltas.empty()) {
    return paired;
  }
  paired.mean_delta_abs_bias = WeightedMean(deltas, weights);
  paired.share_delta_positive =
      static_cast<double>(std::count_if(deltas.begin(), deltas.end(),
                                        [](double d) { return d > 0.0; })) /
      static_cast<double>(deltas.size());
  paired.delta_ci = BootstrapMeanCI(deltas, weights, options.bootstrap, rng);
  paired.wilcoxon = WilcoxonSignedRank(abs_blocking, abs_non_blocking);
  paired.cliffs_delta = CliffsDelta(abs_blocking, abs_non_blocking);
  return paired;
}

// Builds one result from per-mode samples; false when no mode has data.
bool BuildResult(const std::string& endpoint, double p_fail, Variant variant,
                 const std::map<model::SemanticsMode, std::vector<WindowSample>>& per_mode,
                 const CorrelatorOptions& options, std::mt19937_64& rng,
                 ComparisonResult& result) {
  result = ComparisonResult{};
  result.endpoint = endpoint;
  result.p_fail = p_fail;
  result.variant = variant;

  std::set<int> window_ids;
  for (const auto mode : kModes) {
    const auto it = per_mode.find(mode);
    if (it == per_mode.end() || it->second.empty()) {
      continue;
    }
    result.modes.push_back(Summarize(mode, it->second, options, rng));
    for (const auto& sample : it->second) {
      window_ids.insert(sample.window_id);
    }
  }
  if (result.modes.empty()) {
    return false;
  }
  result.window_ids.assign(window_ids.begin(), window_ids.end());

  const auto blocking = per_mode.find(model::SemanticsMode::kBlocking);
  const auto non_blocking = per_mode.find(model::SemanticsMode::kNonBlocking);
  if (blocking != per_mode.end() && non_blocking != per_mode.end()) {
    result.paired = Pair(blocking->second, non_blocking->second, options, rng);
    result.has_paired = result.paired.pairs > 0U;
  }
  return true;
}

} // namespace

const char* ToString(Variant variant) {
  switch (variant) {
  case Variant::kAll:
    return "all";
  case Variant::kClean:
    return "clean";
  }
  return "all";
}

void ApplyAnomalyFlags(std::vector<live::LiveWindow>& live_windows,
                       const std::vector<chaos::ChaosWindow>& chaos_windows,
                       double p_tolerance) {
  for (auto& live_window : live_windows) {
    for (const auto& chaos_window : chaos_windows) {
      if (chaos_window.window_id != live_window.window_id ||
          !SameP(chaos_window.p_fail, live_window.p_fail, p_tolerance)) {
        continue;
      }
      live_window.anomalous = live_window.anomalous || chaos_window.HasAnomalies();
      live_window.killed = chaos_window.Killed();
    }
  }
}

std::vector<ComparisonResult> Correlate(const std::vector<live::LiveWindow>& live_windows,
                                        const std::vector<model::ModelEstimate>& estimates,
                                        double p_fail, const CorrelatorOptions& options,
                                        std::mt19937_64& rng) {
  std::map<model::SemanticsMode, std::map<std::string, double>> models;
  std::set<std::string> endpoints;
  for (const auto mode : kModes) {
    models[mode] = EndpointModels(estimates, mode, p_fail, options.p_tolerance);
    for (const auto& [endpoint, value] : models[mode]) {
      (void)value;
      endpoints.insert(endpoint);
    }
  }

  // When both modes have estimates the mix covers only endpoints estimated in
  // both, so the paired blocking vs non-blocking test compares like with like.
  std::map<model::SemanticsMode, std::map<std::string, double>> mix_models = models;
  const auto& blocking = models[model::SemanticsMode::kBlocking];
  const auto& non_blocking = models[model::SemanticsMode::kNonBlocking];
  if (!blocking.empty() && !non_blocking.empty()) {
    for (auto& [mode, per_endpoint] : mix_models) {
      (void)mode;
      for (auto it = per_endpoint.begin(); it != per_endpoint.end();) {
        if (blocking.count(it->first) == 0U || non_blocking.count(it->first) == 0U) {
          it = per_endpoint.erase(it);
        } else {
          ++it;
        }
      }
    }
  }
  std::set<std::string> covered;
  for (const auto& [mode, per_endpoint] : mix_models) {
    (void)mode;
    for (const auto& [endpoint, value] : per_endpoint) {
      (void)value;
      covered.insert(endpoint);
    }
  }
  const std::vector<std::string> mix_endpoints(covered.begin(), covered.end());

  std::vector<ComparisonResult> results;
  for (const auto variant : {Variant::kAll, Variant::kClean}) {
    std::map<model::SemanticsMode, std::vector<const live::LiveWindow*>> windows;
    for (const auto mode : kModes) {
      windows[mode] = SelectWindows(live_windows, mode, variant, p_fail, options.p_tolerance);
    }

    for (const auto& endpoint : endpoints) {
      std::map<model::SemanticsMode, std::vector<WindowSample>> per_mode;
      for (const auto mode : kModes) {
        const auto model_it = models[mode].find(endpoint);
        if (model_it != models[mode].end()) {
          per_mode[mode] = EndpointSamples(windows[mode], endpoint, model_it->second);
        }
      }
      ComparisonResult result;
      if (BuildResult(endpoint, p_fail, variant, per_mode, options, rng, result)) {
        results.push_back(std::move(result));
      }
    }

    std::map<model::SemanticsMode, std::vector<WindowSample>> mix;
    for (const auto mode : kModes) {
      if (!mix_models[mode].empty()) {
        mix[mode] = MixSamples(windows[mode], mix_models[mode]);
      }
    }
    ComparisonResult result;
    if (BuildResult(kMixEndpoint, p_fail, variant, mix, options, rng, result)) {
      result.mix_endpoints = mix_endpoints;
      results.push_back(std::move(result));
    }
  }
  return results;
}

} // namespace resilab::stats
