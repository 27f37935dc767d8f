#pragma once

#include <cstddef>
#include <random>
#include <vector>

namespace resilab::stats {

double Mean(const std::vector<double>& values);

// Weighted arithmetic mean; 0 when the weights sum to zero.
double WeightedMean(const std::vector<double>& values, const std::vector<double>& weights);

// Sample standard deviation (n - 1 denominator); 0 for fewer than 2 values.
double SampleStdDev(const std::vector<double>& values);

struct ConfidenceInterval {
  double lower = 0.0;
  double upper = 0.0;
  bool valid = false;
};

struct BootstrapOptions {
  std::size_t resamples = 10000;
  double alpha = 0.05;
};

// Percentile bootstrap CI of the weighted mean. Each resample draws
// `values.size()` indices with replacement; pass equal weights for the plain
// mean. Percentile positions: lower = floor(alpha/2 * B), upper =
// min(B - 1, floor((1 - alpha/2) * B)).
ConfidenceInterval BootstrapMeanCI(const std::vector<double>& values,
                                   const std::vector<double>& weights,
                                   const BootstrapOptions& options, std::mt19937_64& rng);

ConfidenceInterval BootstrapMeanCI(const std::vector<double>& values,
                                   const BootstrapOptions& options, std::mt19937_64& rng);

struct WilcoxonResult {
  // min(W+, W-).
  double statistic = 0.0;
  double z = 0.0;
  double p_value = 1.0;
  std::size_t nonzero_pairs = 0;
  bool valid = false;
};

// Paired Wilcoxon signed-rank test of `x` against `y` (equal lengths).
// Zero differences are dropped, ties get average ranks, the variance carries
// the tie correction and the two-sided p-value uses the normal
// approximation. Invalid when no non-zero difference remains.
WilcoxonResult WilcoxonSignedRank(const std::vector<double>& x, const std::vector<double>& y);

struct EffectSize {
  double value = 0.0;
  bool valid = false;
};

// Cliff's delta: P(x > y) - P(x < y) over all cross pairs.
EffectSize CliffsDelta(const std::vector<double>& x, const std::vector<double>& y);

} // namespace resilab::stats
