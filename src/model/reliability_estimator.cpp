#include "model/reliability_estimator.hpp"

#include "chaos/kill_sampler.hpp"
#include "core/parallel.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace resilab::model {

namespace {

constexpr std::size_t kNotInGraph = std::numeric_limits<std::size_t>::max();
constexpr int kUniformTarget = -1;
constexpr int kAggregateTarget = -2;
constexpr const char* kDefaultEntry = "frontend";

} // namespace

const char* ToString(SemanticsMode mode) {
  switch (mode) {
  case SemanticsMode::kBlocking:
    return "blocking";
  case SemanticsMode::kNonBlocking:
    return "non_blocking";
  }
  return "blocking";
}

bool ParseSemanticsMode(const std::string& raw, SemanticsMode& mode) {
  if (raw == "blocking" || raw == "all-block") {
    mode = SemanticsMode::kBlocking;
    return true;
  }
  if (raw == "non_blocking" || raw == "non-blocking" || raw == "async") {
    mode = SemanticsMode::kNonBlocking;
    return true;
  }
  return false;
}

const char* ToString(EstimateScope scope) {
  switch (scope) {
  case EstimateScope::kEndpoint:
    return "endpoint";
  case EstimateScope::kAllEndpoints:
    return "all_endpoints";
  case EstimateScope::kAggregate:
    return "aggregate";
  }
  return "aggregate";
}

bool ReliabilityEstimator::Prepare(const graph::DependencyGraph& graph,
                                   const ReplicaMap& replicas,
                                   const fleet::EligibilityPolicy& policy,
                                   const std::vector<TargetSpec>& targets, std::string& error) {
  *this = ReliabilityEstimator{};
  if (!graph::ValidateDependencyGraph(graph, error)) {
    return false;
  }
  services_ = graph.services;
  const std::size_t n = services_.size();

  adjacency_all_.assign(n, {});
  adjacency_sync_.assign(n, {});
  for (const auto& edge : graph.edges) {
    adjacency_all_[edge.first].push_back(edge.second);
    if (!graph.IsAsync(edge)) {
      adjacency_sync_[edge.first].push_back(edge.second);
    }
  }

  std::size_t default_entry = kNotInGraph;
  if (!graph.entrypoints.empty()) {
    default_entry = graph.entrypoints.front();
  } else {
    std::size_t index = 0;
    if (graph.FindService(kDefaultEntry, index)) {
      default_entry = index;
    }
  }

  for (const auto& target : targets) {
    PreparedTarget prepared;
    prepared.endpoint = target.endpoint;
    prepared.exclude_async = target.exclude_async;
    prepared.required = RequiredCount(target.rule);

    if (!target.entry.empty()) {
      if (!graph.FindService(target.entry, prepared.entry)) {
        error = "endpoint '" + target.endpoint + "': entry service '" + target.entry +
                "' is not in the dependency graph";
        return false;
      }
    } else if (default_entry != kNotInGraph) {
      prepared.entry = default_entry;
    } else {
      error = "endpoint '" + target.endpoint +
              "': no entry declared and the graph has no entrypoint";
      return false;
    }
    if (policy.IsEligible(services_[prepared.entry])) {
      error = "endpoint '" + target.endpoint + "': entry service '" + services_[prepared.entry] +
              "' is chaos-eligible; list it as an entrypoint so it is never killed";
      return false;
    }

    for (const auto& item : RuleItems(target.rule)) {
      std::size_t index = 0;
      if (!graph.FindService(item, index)) {
        error = "endpoint '" + target.endpoint + "': service '" + item +
                "' is not in the dependency graph";
        return false;
      }
      prepared.items.push_back(index);
    }
    targets_.push_back(std::move(prepared));
    endpoint_labels_.push_back(target.endpoint);
  }

  if (!graph.entrypoints.empty()) {
    aggregate_entries_ = graph.entrypoints;
  } else if (default_entry != kNotInGraph) {
    aggregate_entries_.push_back(default_entry);
  }

  // Population: every replica of every policy-eligible service, whether or
  // not it appears in the graph. This is the chaos executor's population; the
  // target set never changes it.
  std::set<std::string> candidates(services_.begin(), services_.end());
  for (const auto& [service, count] : replicas.counts) {
    (void)count;
    candidates.insert(service);
  }
  replicas_in_population_.assign(n, 0);
  for (const auto& service : candidates) {
    if (!policy.IsEligible(service)) {
      continue;
    }
    std::size_t index = kNotInGraph;
    if (!graph.FindService(service, index)) {
      index = kNotInGraph;
    }
    const int count = replicas.ReplicasOf(service);
    for (int r = 0; r < count; ++r) {
      population_.push_back(index);
    }
    if (index != kNotInGraph) {
      replicas_in_population_[index] = count;
    }
  }

  std::vector<char> all_alive(n, 1);
  std::vector<char> reached;
  std::vector<std::size_t> queue;
  for (auto& target : targets_) {
    Reach(target.entry, all_alive, SemanticsMode::kNonBlocking, reached, queue);
    target.sync_reachable = reached;
  }

  prepared_ = true;
  return true;
}

const std::vector<std::vector<std::size_t>>&
ReliabilityEstimator::Adjacency(SemanticsMode mode) const {
  return mode == SemanticsMode::kBlocking ? adjacency_all_ : adjacency_sync_;
}

void ReliabilityEstimator::Reach(std::size_t entry, const std::vector<char>& alive,
                                 SemanticsMode mode, std::vector<char>& reached,
                                 std::vector<std::size_t>& queue) const {
  reached.assign(services_.size(), 0);
  queue.clear();
  if (alive[entry] == 0) {
    return;
  }
  const auto& adjacency = Adjacency(mode);
  reached[entry] = 1;
  queue.push_back(entry);
  for (std::size_t head = 0; head < queue.size(); ++head) {
    for (const std::size_t next : adjacency[queue[head]]) {
      if (reached[next] == 0 && alive[next] != 0) {
        reached[next] = 1;
        queue.push_back(next);
      }
    }
  }
}

bool ReliabilityEstimator::TargetSucceeds(const PreparedTarget& target,
                                          const std::vector<char>& alive, SemanticsMode mode,
                                          std::vector<char>& reached,
                                          std::vector<std::size_t>& queue) const {
  Reach(target.entry, alive, mode, reached, queue);
  const bool skip_async_only = mode == SemanticsMode::kNonBlocking && target.exclude_async;
  std::size_t satisfied = 0;
  for (const std::size_t item : target.items) {
    if (reached[item] != 0 || (skip_async_only && target.sync_reachable[item] == 0)) {
      ++satisfied;
    }
  }
  return satisfied >= target.required;
}

bool ReliabilityEstimator::AggregateSucceeds(const std::vector<char>& alive, SemanticsMode mode,
                                             std::vector<char>& reached,
                                             std::vector<std::size_t>& queue) const {
  const auto& adjacency = Adjacency(mode);
  for (const std::size_t entry : aggregate_entries_) {
    Reach(entry, alive, mode, reached, queue);
    for (const std::size_t node : queue) {
      if (adjacency[node].empty()) {
        return true;
      }
    }
  }
  return false;
}

std::size_t ReliabilityEstimator::RunTrials(const EstimatorConfig& config, int target_index,
                                            std::size_t count, std::mt19937_64& rng) const {
  const std::size_t n = services_.size();
  const std::size_t kills = chaos::ComputeKillCount(population_.size(), config.p_fail);

  std::vector<std::size_t> scratch;
  std::vector<int> killed(n, 0);
  std::vector<char> alive(n, 1);
  std::vector<char> reached;
  std::vector<std::size_t> queue;
  std::uniform_int_distribution<std::size_t> pick_target(
      0U, targets_.empty() ? 0U : targets_.size() - 1U);

  std::size_t successes = 0;
  for (std::size_t trial = 0; trial < count; ++trial) {
    chaos::DrawKillIndices(population_.size(), kills, rng, scratch);
    std::fill(killed.begin(), killed.end(), 0);
    for (std::size_t i = 0; i < kills; ++i) {
      const std::size_t service = population_[scratch[i]];
      if (service != kNotInGraph) {
        ++killed[service];
      }
    }
    for (std::size_t s = 0; s < n; ++s) {
      alive[s] = (replicas_in_population_[s] == 0 || killed[s] < replicas_in_population_[s]) ? 1
                                                                                              : 0;
    }

    bool success = false;
    if (target_index == kAggregateTarget) {
      success = AggregateSucceeds(alive, config.mode, reached, queue);
    } else {
      const std::size_t chosen = target_index == kUniformTarget
                                     ? pick_target(rng)
                                     : static_cast<std::size_t>(target_index);
      success = TargetSucceeds(targets_[chosen], alive, config.mode, reached, queue);
    }
    if (success) {
      ++successes;
    }
  }
  return successes;
}

bool ReliabilityEstimator::Estimate(const EstimatorConfig& config, const std::string& endpoint,
                                    ModelEstimate& estimate, std::string& error) const {
  if (!prepared_) {
    error = "estimator is not prepared";
    return false;
  }
  if (config.samples == 0U) {
    error = "sample count must be positive";
    return false;
  }
  if (!(config.p_fail >= 0.0 && config.p_fail <= 1.0)) {
    error = "failure fraction must be within [0, 1]";
    return false;
  }

  estimate = ModelEstimate{};
  int target_index = kAggregateTarget;
  estimate.scope = EstimateScope::kAggregate;
  if (!endpoint.empty()) {
    const auto it = std::find(endpoint_labels_.begin(), endpoint_labels_.end(), endpoint);
    if (it == endpoint_labels_.end()) {
      error = "endpoint '" + endpoint + "' is not declared in the targets";
      return false;
    }
    target_index = static_cast<int>(it - endpoint_labels_.begin());
    estimate.scope = EstimateScope::kEndpoint;
    estimate.endpoint = endpoint;
  } else if (!targets_.empty()) {
    target_index = kUniformTarget;
    estimate.scope = EstimateScope::kAllEndpoints;
  } else if (aggregate_entries_.empty()) {
    error = "no targets declared and the graph has no entrypoint for the aggregate criterion";
    return false;
  }

  const std::size_t workers =
      std::max<std::size_t>(1U, std::min(config.threads, config.samples));
  std::vector<std::size_t> worker_successes(workers, 0);
  core::ParallelForEach(workers, workers, [&](std::size_t w) {
    const std::size_t begin = config.samples * w / workers;
    const std::size_t end = config.samples * (w + 1U) / workers;
    std::mt19937_64 rng = chaos::MakeUnseededGenerator();
    worker_successes[w] = RunTrials(config, target_index, end - begin, rng);
  });

  std::size_t successes = 0;
  for (const std::size_t count : worker_successes) {
    successes += count;
  }

  const double rate = static_cast<double>(successes) / static_cast<double>(config.samples);
  estimate.mode = config.mode;
  estimate.p_fail = config.p_fail;
  estimate.samples = config.samples;
  estimate.successes = successes;
  estimate.success_rate = rate;
  estimate.std_dev = std::sqrt(rate * (1.0 - rate));
  estimate.std_error = estimate.std_dev / std::sqrt(static_cast<double>(config.samples));
  estimate.population = population_.size();
  estimate.kills_per_trial = chaos::ComputeKillCount(population_.size(), config.p_fail);
  return true;
}

bool ReliabilityEstimator::EvaluateWithDownServices(const std::set<std::string>& down_services,
                                                    SemanticsMode mode,
                                                    const std::string& endpoint, bool& success,
                                                    std::string& error) const {
  if (!prepared_) {
    error = "estimator is not prepared";
    return false;
  }
  std::vector<char> alive(services_.size(), 1);
  for (const auto& service : down_services) {
    const auto it = std::lower_bound(services_.begin(), services_.end(), service);
    if (it == services_.end() || *it != service) {
      error = "service '" + service + "' is not in the dependency graph";
      return false;
    }
    alive[static_cast<std::size_t>(it - services_.begin())] = 0;
  }

  std::vector<char> reached;
  std::vector<std::size_t> queue;
  if (endpoint.empty()) {
    success = AggregateSucceeds(alive, mode, reached, queue);
    return true;
  }
  const auto it = std::find(endpoint_labels_.begin(), endpoint_labels_.end(), endpoint);
  if (it == endpoint_labels_.end()) {
    error = "endpoint '" + endpoint + "' is not declared in the targets";
    return false;
  }
  success = TargetSucceeds(targets_[static_cast<std::size_t>(it - endpoint_labels_.begin())],
                           alive, mode, reached, queue);
  return true;
}

} // namespace resilab::model
