#include "stats/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace resilab::stats {

double Mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double WeightedMean(const std::vector<double>& values, const std::vector<double>& weights) {
  double weighted_sum = 0.0;
  double weight_total = 0.0;
  const std::size_t n = std::min(values.size(), weights.size());
  for (std::size_t i = 0; i < n; ++i) {
    weighted_sum += values[i] * weights[i];
    weight_total += weights[i];
  }
  return weight_total > 0.0 ? weighted_sum / weight_total : 0.0;
}

double SampleStdDev(const std::vector<double>& values) {
  if (values.size() < 2U) {
    return 0.0;
  }
  const double mean = Mean(values);
  double squared = 0.0;
  for (const double value : values) {
    squared += (value - mean) * (value - mean);
  }
  return std::sqrt(squared / static_cast<double>(values.size() - 1U));
}

ConfidenceInterval BootstrapMeanCI(const std::vector<double>& values,
                                   const std::vector<double>& weights,
                                   const BootstrapOptions& options, std::mt19937_64& rng) {
  ConfidenceInterval interval;
  if (values.empty() || weights.size() != values.size() || options.resamples == 0U) {
    return interval;
  }

  const std::size_t n = values.size();
  std::uniform_int_distribution<std::size_t> pick(0U, n - 1U);
  std::vector<double> means;
  means.reserve(options.resamples);
  for (std::size_t b = 0; b < options.resamples; ++b) {
    double weighted_sum = 0.0;
    double weight_total = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      const std::size_t index = pick(rng);
      weighted_sum += values[index] * weights[index];
      weight_total += weights[index];
    }
    // A resample made only of zero-weight windows carries no information.
    if (weight_total > 0.0) {
      means.push_back(weighted_sum / weight_total);
    }
  }
  if (means.empty()) {
    return interval;
  }
  std::sort(means.begin(), means.end());

  const std::size_t count = means.size();
  const auto lower_index =
      static_cast<std::size_t>((options.alpha / 2.0) * static_cast<double>(count));
  const auto upper_index =
      std::min(count - 1U, static_cast<std::size_t>((1.0 - options.alpha / 2.0) *
                                                    static_cast<double>(count)));
  interval.lower = means[std::min(lower_index, count - 1U)];
  interval.upper = means[upper_index];
  interval.valid = true;
  return interval;
}

ConfidenceInterval BootstrapMeanCI(const std::vector<double>& values,
                                   const BootstrapOptions& options, std::mt19937_64& rng) {
  return BootstrapMeanCI(values, std::vector<double>(values.size(), 1.0), options, rng);
}

WilcoxonResult WilcoxonSignedRank(const std::vector<double>& x, const std::vector<double>& y) {
  WilcoxonResult result;
  std::vector<double> diffs;
  const std::size_t pairs = std::min(x.size(), y.size());
  for (std::size_t i = 0; i < pairs; ++i) {
    const double diff = x[i] - y[i];
    if (diff != 0.0) {
      diffs.push_back(diff);
    }
  }
  const std::size_t n = diffs.size();
  result.nonzero_pairs = n;
  if (n == 0U) {
    return result;
  }

  std::vector<std::pair<double, std::size_t>> by_magnitude;
  by_magnitude.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    by_magnitude.emplace_back(std::fabs(diffs[i]), i);
  }
  std::sort(by_magnitude.begin(), by_magnitude.end());

  std::vector<double> ranks(n, 0.0);
  double tie_term = 0.0;
  for (std::size_t i = 0; i < n;) {
    std::size_t j = i;
    while (j < n && by_magnitude[j].first == by_magnitude[i].first) {
      ++j;
    }
    const double rank = static_cast<double>(i + 1U + j) / 2.0;
    for (std::size_t k = i; k < j; ++k) {
      ranks[by_magnitude[k].second] = rank;
    }
    const auto tie = static_cast<double>(j - i);
    if (j - i > 1U) {
      tie_term += tie * (tie * tie - 1.0);
    }
    i = j;
  }

  double w_pos = 0.0;
  double w_neg = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    if (diffs[i] > 0.0) {
      w_pos += ranks[i];
    } else {
      w_neg += ranks[i];
    }
  }

  const auto nd = static_cast<double>(n);
  const double mean = nd * (nd + 1.0) / 4.0;
  const double variance = nd * (nd + 1.0) * (2.0 * nd + 1.0) / 24.0 - tie_term / 48.0;
  result.statistic = std::min(w_pos, w_neg);
  if (!(variance > 0.0)) {
    return result;
  }
  result.z = (result.statistic - mean) / std::sqrt(variance);
  result.p_value = std::erfc(std::fabs(result.z) / std::sqrt(2.0));
  result.valid = true;
  return result;
}

EffectSize CliffsDelta(const std::vector<double>& x, const std::vector<double>& y) {
  EffectSize effect;
  if (x.empty() || y.empty()) {
    return effect;
  }
  long long dominance = 0;
  for (const double a : x) {
    for (const double b : y) {
      if (a > b) {
        ++dominance;
      } else if (a < b) {
        --dominance;
      }
    }
  }
  effect.value = static_cast<double>(dominance) /
                 (static_cast<double>(x.size()) * static_cast<double>(y.size()));
  effect.valid = true;
  return effect;
}

} // namespace resilab::stats
