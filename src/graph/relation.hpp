#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <tuple>

namespace resilab::graph {

enum class Transport {
  kSync,
  kAsync,
};

inline const char* ToString(Transport transport) {
  return transport == Transport::kAsync ? "async" : "sync";
}

struct RelationKey {
  std::string caller;
  std::string callee;
  Transport transport = Transport::kSync;

  bool operator<(const RelationKey& other) const {
    return std::tie(caller, callee, transport) <
           std::tie(other.caller, other.callee, other.transport);
  }
};

// Caller/callee observations with call counts, as raw service names. Names
// are normalized later by the graph builder.
struct RelationSet {
  std::map<RelationKey, std::int64_t> calls;
  // Values of `messaging.system` span tags (e.g. `kafka`). The builder
  // treats these names as brokers.
  std::set<std::string> messaging_systems;

  void Add(const std::string& caller, const std::string& callee, Transport transport,
           std::int64_t count = 1) {
    calls[RelationKey{caller, callee, transport}] += count;
  }

  bool empty() const {
    return calls.empty();
  }

  void Merge(const RelationSet& other) {
    for (const auto& [key, count] : other.calls) {
      calls[key] += count;
    }
    messaging_systems.insert(other.messaging_systems.begin(), other.messaging_systems.end());
  }
};

} // namespace resilab::graph
