#pragma once

#include "chaos/chaos_window.hpp"
#include "live/live_window.hpp"
#include "model/reliability_estimator.hpp"
#include "stats/statistics.hpp"

#include <cstddef>
#include <random>
#include <string>
#include <vector>

namespace resilab::stats {

enum class Variant {
  kAll,
  kClean,
};

const char* ToString(Variant variant);

inline constexpr const char* kMixEndpoint = "mix";

// Model vs live for one semantics mode.
struct ModeComparison {
  model::SemanticsMode mode = model::SemanticsMode::kBlocking;
  double model_value = 0.0;
  double mean_live_rate = 0.0;
  // model - live, averaged over windows (probe-weighted for the mix).
  double mean_bias = 0.0;
  double mean_abs_bias = 0.0;
  ConfidenceInterval bias_ci;
  std::size_t windows = 0;
};

// Blocking vs non-blocking on per-window absolute bias, paired by window id.
struct PairedComparison {
  std::size_t pairs = 0;
  // mean(|bias_blocking| - |bias_non_blocking|).
  double mean_delta_abs_bias = 0.0;
  double share_delta_positive = 0.0;
  ConfidenceInterval delta_ci;
  WilcoxonResult wilcoxon;
  EffectSize cliffs_delta;
};

struct ComparisonResult {
  // Endpoint label, or `kMixEndpoint`.
  std::string endpoint;
  double p_fail = 0.0;
  Variant variant = Variant::kAll;
  std::vector<ModeComparison> modes;
  bool has_paired = false;
  PairedComparison paired;
  std::vector<int> window_ids;
  // Mix only: endpoints whose probes enter the mix. With estimates in both
  // modes this is the set estimated in both.
  std::vector<std::string> mix_endpoints;
};

struct CorrelatorOptions {
  BootstrapOptions bootstrap;
  double p_tolerance = 1e-9;
};

// Marks each live window whose chaos window (same window id and p) recorded
// stop anomalies, and copies its kill count.
void ApplyAnomalyFlags(std::vector<live::LiveWindow>& live_windows,
                       const std::vector<chaos::ChaosWindow>& chaos_windows,
                       double p_tolerance = 1e-9);

// Joins live windows with model estimates at `p_fail`:
// - one result per (endpoint, variant) with a matching per-endpoint estimate
//   and at least one live window that probed it
// - one `mix` result per variant from probe-weighted per-window bias, over
//   the endpoints estimated in every mode that has estimates
// - `clean` drops anomalous windows
// Combinations with nothing to compare are omitted.
std::vector<ComparisonResult> Correlate(const std::vector<live::LiveWindow>& live_windows,
                                        const std::vector<model::ModelEstimate>& estimates,
                                        double p_fail, const CorrelatorOptions& options,
                                        std::mt19937_64& rng);

} // namespace resilab::stats
