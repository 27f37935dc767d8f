#include "fleet/service_name.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace resilab::fleet {

namespace {

constexpr std::array<std::string_view, 3> kStrippedSuffixes = {
    "-service",
    "service",
    "-svc",
};

constexpr std::array<std::string_view, 11> kInfrastructureNames = {
    "frontend-proxy", "jaeger",     "grafana", "otel-collector", "loadgenerator", "load-generator",
    "prometheus",     "kafka",      "zipkin",  "opensearch",     "flagd",
};

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.substr(value.size() - suffix.size()) == suffix;
}

} // namespace

const char* ToString(ServiceCategory category) {
  switch (category) {
  case ServiceCategory::kEntrypoint:
    return "entrypoint";
  case ServiceCategory::kInfrastructure:
    return "infrastructure";
  case ServiceCategory::kApplication:
    return "application";
  }
  return "application";
}

std::string NormalizeServiceName(std::string_view raw) {
  std::size_t begin = 0;
  while (begin < raw.size() && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }
  std::size_t end = raw.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
    --end;
  }

  std::string normalized(raw.substr(begin, end - begin));
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    if (c == '_') {
      return '-';
    }
    return static_cast<char>(std::tolower(c));
  });

  for (const auto suffix : kStrippedSuffixes) {
    if (normalized.size() > suffix.size() && EndsWith(normalized, suffix)) {
      normalized.resize(normalized.size() - suffix.size());
      break;
    }
  }
  while (!normalized.empty() && normalized.back() == '-') {
    normalized.pop_back();
  }
  return normalized;
}

bool MatchesInfrastructurePattern(std::string_view normalized_service) {
  return std::any_of(kInfrastructureNames.begin(), kInfrastructureNames.end(),
                     [normalized_service](std::string_view name) {
                       return EndsWith(normalized_service, name);
                     });
}

std::vector<std::string> DefaultEntrypoints() {
  return {"frontend", "frontend-proxy"};
}

} // namespace resilab::fleet
