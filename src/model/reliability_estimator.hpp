#pragma once

#include "fleet/eligibility.hpp"
#include "graph/dependency_graph.hpp"
#include "model/replica_map.hpp"
#include "model/target_spec.hpp"

#include <cstddef>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace resilab::model {

// How async edges behave while their consumer is down.
// - blocking: every edge is a hard dependency.
// - non_blocking: async edges never propagate failure.
enum class SemanticsMode {
  kBlocking,
  kNonBlocking,
};

const char* ToString(SemanticsMode mode);

// Accepts `blocking`/`non_blocking` plus the legacy `all-block`/`async`.
bool ParseSemanticsMode(const std::string& raw, SemanticsMode& mode);

enum class EstimateScope {
  kEndpoint,
  kAllEndpoints,
  kAggregate,
};

const char* ToString(EstimateScope scope);

struct EstimatorConfig {
  double p_fail = 0.0;
  SemanticsMode mode = SemanticsMode::kBlocking;
  std::size_t samples = 20000;
  std::size_t threads = 4;
};

struct ModelEstimate {
  EstimateScope scope = EstimateScope::kAggregate;
  // Endpoint label for kEndpoint, empty otherwise.
  std::string endpoint;
  SemanticsMode mode = SemanticsMode::kBlocking;
  double p_fail = 0.0;
  double success_rate = 0.0;
  double std_dev = 0.0;
  double std_error = 0.0;
  std::size_t samples = 0;
  std::size_t successes = 0;
  std::size_t population = 0;
  std::size_t kills_per_trial = 0;
};

// Monte Carlo estimate of end-to-end success under the chaos kill law.
//
// `Prepare` resolves every target against the graph once; trials then run on
// plain index vectors. Instances are immutable after `Prepare`, so `Estimate`
// may be called from several threads.
class ReliabilityEstimator {
public:
  ReliabilityEstimator() = default;

  // Fails when a target names an item or entry that is not a graph service,
  // when no entry can be resolved, or when the resolved entry is one the
  // policy would let chaos kill. The error names the endpoint.
  //
  // The kill population comes from `policy` alone, the same set the chaos
  // executor samples from.
  bool Prepare(const graph::DependencyGraph& graph, const ReplicaMap& replicas,
               const fleet::EligibilityPolicy& policy, const std::vector<TargetSpec>& targets,
               std::string& error);

  // `endpoint` empty: uniform over declared targets, or the aggregate
  // criterion when none are declared.
  bool Estimate(const EstimatorConfig& config, const std::string& endpoint,
                ModelEstimate& estimate, std::string& error) const;

  // Evaluates one fixed outage, given as down service names.
  bool EvaluateWithDownServices(const std::set<std::string>& down_services, SemanticsMode mode,
                                const std::string& endpoint, bool& success,
                                std::string& error) const;

  std::size_t population_size() const {
    return population_.size();
  }
  const std::vector<std::string>& endpoints() const {
    return endpoint_labels_;
  }

private:
  struct PreparedTarget {
    std::string endpoint;
    std::size_t entry = 0;
    std::vector<std::size_t> items;
    std::size_t required = 1;
    bool exclude_async = false;
    // Items reachable from the entry over sync edges with nothing down.
    std::vector<char> sync_reachable;
  };

  const std::vector<std::vector<std::size_t>>& Adjacency(SemanticsMode mode) const;
  void Reach(std::size_t entry, const std::vector<char>& alive, SemanticsMode mode,
             std::vector<char>& reached, std::vector<std::size_t>& queue) const;
  bool TargetSucceeds(const PreparedTarget& target, const std::vector<char>& alive,
                      SemanticsMode mode, std::vector<char>& reached,
                      std::vector<std::size_t>& queue) const;
  bool AggregateSucceeds(const std::vector<char>& alive, SemanticsMode mode,
                         std::vector<char>& reached, std::vector<std::size_t>& queue) const;
  std::size_t RunTrials(const EstimatorConfig& config, int target_index, std::size_t count,
                        std::mt19937_64& rng) const;

  std::vector<std::string> services_;
  std::vector<std::vector<std::size_t>> adjacency_all_;
  std::vector<std::vector<std::size_t>> adjacency_sync_;
  // Graph service index per population slot; npos for replicas of services
  // that are not graph nodes.
  std::vector<std::size_t> population_;
  std::vector<int> replicas_in_population_;
  std::vector<std::size_t> aggregate_entries_;
  std::vector<PreparedTarget> targets_;
  std::vector<std::string> endpoint_labels_;
  bool prepared_ = false;
};

} // namespace resilab::model
