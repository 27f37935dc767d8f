#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace resilab::model {

// Service -> replica count. Services not listed have exactly one replica.
struct ReplicaMap {
  std::map<std::string, int> counts;

  int ReplicasOf(const std::string& service) const;
};

// Parses `{"service": n, ...}` with every n >= 1. Keys are normalized.
bool ParseReplicaMap(const std::string& text, ReplicaMap& replicas, std::string& error);
bool LoadReplicaMap(const std::filesystem::path& path, ReplicaMap& replicas, std::string& error);

std::string ToJson(const ReplicaMap& replicas);
bool WriteReplicaMap(const std::filesystem::path& path, const ReplicaMap& replicas,
                     std::string& error);

} // namespace resilab::model
