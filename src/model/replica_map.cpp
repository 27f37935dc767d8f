#include "model/replica_map.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "fleet/service_name.hpp"

#include <cstdint>
#include <limits>
#include <sstream>

namespace resilab::model {

int ReplicaMap::ReplicasOf(const std::string& service) const {
  const auto it = counts.find(service);
  return it == counts.end() ? 1 : it->second;
}

bool ParseReplicaMap(const std::string& text, ReplicaMap& replicas, std::string& error) {
  core::json::Value root;
  if (!core::json::Parse(text, root, error)) {
    error = "invalid replicas JSON: " + error;
    return false;
  }
  if (root.type != core::json::Value::Type::kObject) {
    error = "replicas document must be an object of service -> count";
    return false;
  }

  replicas = ReplicaMap{};
  for (const auto& [service, value] : root.object_value) {
    std::int64_t count = 0;
    if (!core::json::TryGetInteger(value, count) || count < 1 ||
        count > std::numeric_limits<int>::max()) {
      error = "replica count for '" + service + "' must be an integer >= 1";
      return false;
    }
    const std::string normalized = fleet::NormalizeServiceName(service);
    if (normalized.empty()) {
      error = "replica map contains an empty service name";
      return false;
    }
    replicas.counts[normalized] += static_cast<int>(count);
  }
  return true;
}

bool LoadReplicaMap(const std::filesystem::path& path, ReplicaMap& replicas, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParseReplicaMap(text, replicas, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

std::string ToJson(const ReplicaMap& replicas) {
  std::ostringstream out;
  out << '{';
  bool first = true;
  for (const auto& [service, count] : replicas.counts) {
    out << (first ? "\n  " : ",\n  ") << core::QuoteJson(service) << ": " << count;
    first = false;
  }
  out << (first ? "}\n" : "\n}\n");
  return out.str();
}

bool WriteReplicaMap(const std::filesystem::path& path, const ReplicaMap& replicas,
                     std::string& error) {
  return core::WriteTextFileAtomic(path, ToJson(replicas), error);
}

} // namespace resilab::model
