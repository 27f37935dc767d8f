#pragma once

#include "graph/relation.hpp"

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace resilab::graph {

enum class GraphSource {
  kTraces,
  kDependencySummary,
  kFile,
};

const char* ToString(GraphSource source);
bool ParseGraphSource(const std::string& raw, GraphSource& source);

using EdgeIndex = std::pair<std::size_t, std::size_t>;

// Directed service dependency graph shared by both semantics modes.
//
// Contract:
// - `services` sorted and unique
// - `edges` sorted, unique, no self edges, indices into `services`
// - `async_edges` is a subset of `edges`
// - `entrypoints` index into `services`
struct DependencyGraph {
  std::vector<std::string> services;
  std::vector<EdgeIndex> edges;
  std::vector<EdgeIndex> async_edges;
  std::vector<std::size_t> entrypoints;
  GraphSource source = GraphSource::kFile;

  bool FindService(const std::string& name, std::size_t& index) const;
  bool IsAsync(const EdgeIndex& edge) const;
};

struct GraphBuildOptions {
  std::vector<std::string> entrypoints;
  // Services dropped outright, together with every relation touching them.
  std::set<std::string> skip = DefaultSkippedServices();
  // Broker services collapsed into async edges.
  std::set<std::string> brokers = DefaultBrokers();
  GraphSource source = GraphSource::kTraces;

  static std::set<std::string> DefaultSkippedServices();
  static std::set<std::string> DefaultBrokers();
};

// Converts relations into a graph:
// - names normalized, self edges and skipped services dropped
// - `A -> broker -> B` (through broker chains too) becomes async `A -> B`
// - an edge is async only if it was never also observed as a sync call
// - nodes are the endpoints of the surviving edges; unknown entrypoints are
//   ignored
//
// Fails when no edge survives.
bool BuildDependencyGraph(const RelationSet& relations, const GraphBuildOptions& options,
                          DependencyGraph& graph, std::string& error);

// Structural checks applied to every graph read from disk.
bool ValidateDependencyGraph(const DependencyGraph& graph, std::string& error);

std::string ToJson(const DependencyGraph& graph);
bool ParseDependencyGraph(const std::string& text, DependencyGraph& graph, std::string& error);

bool WriteDependencyGraph(const std::filesystem::path& path, const DependencyGraph& graph,
                          std::string& error);
bool LoadDependencyGraph(const std::filesystem::path& path, DependencyGraph& graph,
                         std::string& error);

} // namespace resilab::graph
