#include "graph/dependency_graph.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "fleet/service_name.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <map>
#include <sstream>

namespace resilab::graph {

namespace json = core::json;

namespace {

bool IsBroker(const std::string& name, const std::set<std::string>& brokers) {
  for (const auto& broker : brokers) {
    if (name == broker || name.rfind(broker + "-", 0) == 0) {
      return true;
    }
  }
  return false;
}

std::string EdgesToJson(const std::vector<EdgeIndex>& edges) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < edges.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << '[' << edges[i].first << ',' << edges[i].second << ']';
  }
  out << ']';
  return out.str();
}

bool ReadIndex(const json::Value& value, std::size_t& index) {
  std::int64_t raw = 0;
  if (!json::TryGetInteger(value, raw) || raw < 0) {
    return false;
  }
  index = static_cast<std::size_t>(raw);
  return true;
}

bool ReadEdges(const json::Value& root, std::string_view key, bool required,
               std::vector<EdgeIndex>& edges, std::string& error) {
  edges.clear();
  const json::Value* field = json::GetField(root, key);
  if (field == nullptr && !required) {
    return true;
  }
  if (!json::IsArray(field)) {
    error = "graph field '" + std::string(key) + "' must be an array";
    return false;
  }
  for (const auto& item : field->array_value) {
    EdgeIndex edge;
    if (item.type != json::Value::Type::kArray || item.array_value.size() != 2U ||
        !ReadIndex(item.array_value[0], edge.first) ||
        !ReadIndex(item.array_value[1], edge.second)) {
      error = "graph field '" + std::string(key) + "' must contain [from, to] index pairs";
      return false;
    }
    edges.push_back(edge);
  }
  return true;
}

} // namespace

const char* ToString(GraphSource source) {
  switch (source) {
  case GraphSource::kTraces:
    return "traces";
  case GraphSource::kDependencySummary:
    return "dependency_summary";
  case GraphSource::kFile:
    return "file";
  }
  return "file";
}

bool ParseGraphSource(const std::string& raw, GraphSource& source) {
  if (raw == "traces") {
    source = GraphSource::kTraces;
    return true;
  }
  if (raw == "dependency_summary") {
    source = GraphSource::kDependencySummary;
    return true;
  }
  if (raw == "file") {
    source = GraphSource::kFile;
    return true;
  }
  return false;
}

bool DependencyGraph::FindService(const std::string& name, std::size_t& index) const {
  const auto it = std::lower_bound(services.begin(), services.end(), name);
  if (it == services.end() || *it != name) {
    return false;
  }
  index = static_cast<std::size_t>(it - services.begin());
  return true;
}

bool DependencyGraph::IsAsync(const EdgeIndex& edge) const {
  return std::binary_search(async_edges.begin(), async_edges.end(), edge);
}

std::set<std::string> GraphBuildOptions::DefaultSkippedServices() {
  return {"frontend-proxy", "jaeger",     "grafana",      "otel-collector",
          "zipkin",         "prometheus", "loadgenerator"};
}

std::set<std::string> GraphBuildOptions::DefaultBrokers() {
  return {"kafka", "rabbitmq", "nats", "redpanda", "activemq"};
}

bool BuildDependencyGraph(const RelationSet& relations, const GraphBuildOptions& options,
                          DependencyGraph& graph, std::string& error) {
  graph = DependencyGraph{};
  graph.source = options.source;

  std::set<std::string> brokers;
  for (const auto& broker : options.brokers) {
    brokers.insert(fleet::NormalizeServiceName(broker));
  }
  for (const auto& system : relations.messaging_systems) {
    brokers.insert(fleet::NormalizeServiceName(system));
  }

  using NamedEdge = std::pair<std::string, std::string>;
  std::set<NamedEdge> sync_seen;
  std::set<NamedEdge> async_seen;
  // Edges that touch a broker on either side, resolved below.
  std::map<std::string, std::set<std::string>> broker_out;
  std::map<std::string, std::set<std::string>> producers_into;

  for (const auto& [key, count] : relations.calls) {
    (void)count;
    const std::string caller = fleet::NormalizeServiceName(key.caller);
    const std::string callee = fleet::NormalizeServiceName(key.callee);
    if (caller.empty() || callee.empty() || caller == callee ||
        options.skip.count(caller) != 0U || options.skip.count(callee) != 0U) {
      continue;
    }
    const bool caller_broker = IsBroker(caller, brokers);
    const bool callee_broker = IsBroker(callee, brokers);
    if (caller_broker) {
      broker_out[caller].insert(callee);
    }
    if (callee_broker && !caller_broker) {
      producers_into[callee].insert(caller);
    }
    if (caller_broker || callee_broker) {
      continue;
    }
    if (key.transport == Transport::kAsync) {
      async_seen.insert({caller, callee});
    } else {
      sync_seen.insert({caller, callee});
    }
  }

  // Walk broker chains: every producer feeding a broker reaches every
  // non-broker consumer downstream of it.
  for (const auto& [broker, producers] : producers_into) {
    std::set<std::string> visited{broker};
    std::deque<std::string> frontier{broker};
    std::set<std::string> consumers;
    while (!frontier.empty()) {
      const std::string current = frontier.front();
      frontier.pop_front();
      const auto out_it = broker_out.find(current);
      if (out_it == broker_out.end()) {
        continue;
      }
      for (const auto& next : out_it->second) {
        if (IsBroker(next, brokers)) {
          if (visited.insert(next).second) {
            frontier.push_back(next);
          }
        } else {
          consumers.insert(next);
        }
      }
    }
    for (const auto& producer : producers) {
      for (const auto& consumer : consumers) {
        if (producer != consumer) {
          async_seen.insert({producer, consumer});
        }
      }
    }
  }

  std::set<NamedEdge> all_edges = sync_seen;
  all_edges.insert(async_seen.begin(), async_seen.end());
  if (all_edges.empty()) {
    error = "no service dependencies remain after filtering";
    return false;
  }

  std::set<std::string> nodes;
  for (const auto& [caller, callee] : all_edges) {
    nodes.insert(caller);
    nodes.insert(callee);
  }
  graph.services.assign(nodes.begin(), nodes.end());

  for (const auto& named : all_edges) {
    EdgeIndex edge;
    graph.FindService(named.first, edge.first);
    graph.FindService(named.second, edge.second);
    graph.edges.push_back(edge);
    if (async_seen.count(named) != 0U && sync_seen.count(named) == 0U) {
      graph.async_edges.push_back(edge);
    }
  }
  std::sort(graph.edges.begin(), graph.edges.end());
  std::sort(graph.async_edges.begin(), graph.async_edges.end());

  std::set<std::size_t> entry_indices;
  for (const auto& entry : options.entrypoints) {
    std::size_t index = 0;
    if (graph.FindService(fleet::NormalizeServiceName(entry), index)) {
      entry_indices.insert(index);
    }
  }
  graph.entrypoints.assign(entry_indices.begin(), entry_indices.end());
  return true;
}

bool ValidateDependencyGraph(const DependencyGraph& graph, std::string& error) {
  for (std::size_t i = 1; i < graph.services.size(); ++i) {
    if (!(graph.services[i - 1U] < graph.services[i])) {
      error = "graph services must be sorted and unique (at '" + graph.services[i] + "')";
      return false;
    }
  }
  const std::size_t n = graph.services.size();
  for (const auto& edge : graph.edges) {
    if (edge.first >= n || edge.second >= n) {
      error = "graph edge [" + std::to_string(edge.first) + "," + std::to_string(edge.second) +
              "] references an unknown service index";
      return false;
    }
  }
  for (const auto& edge : graph.async_edges) {
    if (!std::binary_search(graph.edges.begin(), graph.edges.end(), edge)) {
      error = "async edge [" + std::to_string(edge.first) + "," + std::to_string(edge.second) +
              "] is not part of the edge set";
      return false;
    }
  }
  for (const auto entry : graph.entrypoints) {
    if (entry >= n) {
      error = "graph entrypoint index " + std::to_string(entry) + " is out of range";
      return false;
    }
  }
  return true;
}

std::string ToJson(const DependencyGraph& graph) {
  std::ostringstream out;
  out << "{\n  \"services\": " << core::FormatJsonStringArray(graph.services)
      << ",\n  \"edges\": " << EdgesToJson(graph.edges)
      << ",\n  \"async_edges\": " << EdgesToJson(graph.async_edges) << ",\n  \"entrypoints\": [";
  for (std::size_t i = 0; i < graph.entrypoints.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << graph.entrypoints[i];
  }
  out << "],\n  \"source\": " << core::QuoteJson(ToString(graph.source)) << "\n}\n";
  return out.str();
}

bool ParseDependencyGraph(const std::string& text, DependencyGraph& graph, std::string& error) {
  json::Value root;
  if (!json::Parse(text, root, error)) {
    error = "invalid graph JSON: " + error;
    return false;
  }
  if (root.type != json::Value::Type::kObject) {
    error = "graph document must be a JSON object";
    return false;
  }

  graph = DependencyGraph{};
  const json::Value* services = json::GetField(root, "services");
  if (!json::IsArray(services)) {
    error = "graph field 'services' must be an array";
    return false;
  }
  for (const auto& item : services->array_value) {
    if (item.type != json::Value::Type::kString) {
      error = "graph field 'services' must contain strings";
      return false;
    }
    graph.services.push_back(item.string_value);
  }

  if (!ReadEdges(root, "edges", true, graph.edges, error) ||
      !ReadEdges(root, "async_edges", false, graph.async_edges, error)) {
    return false;
  }
  std::sort(graph.edges.begin(), graph.edges.end());
  graph.edges.erase(std::unique(graph.edges.begin(), graph.edges.end()), graph.edges.end());
  std::sort(graph.async_edges.begin(), graph.async_edges.end());
  graph.async_edges.erase(std::unique(graph.async_edges.begin(), graph.async_edges.end()),
                          graph.async_edges.end());

  const json::Value* entrypoints = json::GetField(root, "entrypoints");
  if (json::IsArray(entrypoints)) {
    for (const auto& item : entrypoints->array_value) {
      std::size_t index = 0;
      if (!ReadIndex(item, index)) {
        error = "graph field 'entrypoints' must contain service indices";
        return false;
      }
      graph.entrypoints.push_back(index);
    }
  }

  graph.source = GraphSource::kFile;
  const std::string source = json::GetStringAny(root, {"source"});
  if (!source.empty() && !ParseGraphSource(source, graph.source)) {
    error = "graph field 'source' has unknown value '" + source + "'";
    return false;
  }

  return ValidateDependencyGraph(graph, error);
}

bool WriteDependencyGraph(const std::filesystem::path& path, const DependencyGraph& graph,
                          std::string& error) {
  return core::WriteTextFileAtomic(path, ToJson(graph), error);
}

bool LoadDependencyGraph(const std::filesystem::path& path, DependencyGraph& graph,
                         std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParseDependencyGraph(text, graph, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

} // namespace resilab::graph
