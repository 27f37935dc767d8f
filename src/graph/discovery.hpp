#pragma once

#include "core/logging/logger.hpp"
#include "graph/dependency_graph.hpp"
#include "graph/relation.hpp"
#include "graph/trace_source.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace resilab::graph {

struct DiscoveryOptions {
  std::chrono::minutes lookback{30};
  // Trace rounds over the configured lookback before widening.
  int attempts = 3;
  std::chrono::milliseconds retry_interval{std::chrono::seconds(5)};
  // Disables the dependency-summary fallback.
  bool strict = false;
  // Used when the backend lists no services.
  std::vector<std::string> fallback_services = DefaultDemoServices();
  const std::atomic<bool>* cancel = nullptr;

  static std::vector<std::string> DefaultDemoServices();
};

struct DiscoveryResult {
  RelationSet relations;
  GraphSource source = GraphSource::kTraces;
  bool widened = false;
};

// Collects relations, trace-derived first:
//
// 1. `attempts` rounds over `lookback`
// 2. one round over a widened lookback of at least 60 minutes
// 3. unless strict, the dependency summary, as a logged mode transition
//
// Returns false when nothing was discovered (or, in strict mode, when traces
// yielded nothing); callers map that to the discovery-failed exit code.
bool DiscoverRelations(ITraceSource& source, const DiscoveryOptions& options,
                       core::logging::Logger& logger, DiscoveryResult& result,
                       std::string& error);

} // namespace resilab::graph
