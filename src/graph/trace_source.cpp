#include "graph/trace_source.hpp"

#include "core/json_dom.hpp"
#include "core/process.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <set>
#include <sstream>
#include <utility>

namespace resilab::graph {

namespace {

std::int64_t NowEpochMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

std::vector<std::string> SplitBaseList(const std::string& raw) {
  std::vector<std::string> bases;
  std::stringstream input(raw);
  std::string item;
  while (std::getline(input, item, ',')) {
    std::size_t begin = 0;
    while (begin < item.size() && std::isspace(static_cast<unsigned char>(item[begin])) != 0) {
      ++begin;
    }
    std::size_t end = item.size();
    while (end > begin && (std::isspace(static_cast<unsigned char>(item[end - 1])) != 0 ||
                           item[end - 1] == '/')) {
      --end;
    }
    if (end > begin) {
      bases.push_back(item.substr(begin, end - begin));
    }
  }
  return bases;
}

std::string PercentEncode(const std::string& raw) {
  std::ostringstream out;
  for (const char c : raw) {
    const auto byte = static_cast<unsigned char>(c);
    if (std::isalnum(byte) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
      out << c;
    } else {
      out << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
          << static_cast<int>(byte) << std::nouppercase << std::dec;
    }
  }
  return out.str();
}

JaegerHttpSource::JaegerHttpSource(JaegerSourceOptions options) : options_(std::move(options)) {}

bool JaegerHttpSource::GetFromAnyBase(const std::string& path_and_query, std::string& body,
                                      std::string& error) {
  if (options_.bases.empty()) {
    error = "no Jaeger base URL configured";
    return false;
  }

  std::string last_error;
  for (const auto& base : options_.bases) {
    const std::string url = base + path_and_query;
    const std::string command = core::JoinCommand({
        "curl",
        "-sS",
        "-f",
        "--max-time",
        std::to_string(options_.timeout_s),
        "-H",
        core::ShellQuote("Accept: application/json"),
        core::ShellQuote(url),
    });
    core::CommandResult result;
    std::string run_error;
    if (!core::RunShellCommand(command, result, run_error)) {
      last_error = run_error;
      continue;
    }
    if (result.exit_code != 0) {
      last_error = url + ": curl exited with code " + std::to_string(result.exit_code);
      continue;
    }
    // Proxies answer unknown paths with HTML; only accept JSON.
    core::json::Value probe;
    std::string parse_error;
    if (!core::json::Parse(result.output, probe, parse_error)) {
      last_error = url + ": response is not JSON";
      continue;
    }
    body = std::move(result.output);
    return true;
  }
  error = last_error;
  return false;
}

bool JaegerHttpSource::ListServices(std::vector<std::string>& services, std::string& error) {
  services.clear();
  std::string body;
  if (!GetFromAnyBase("/services", body, error)) {
    return false;
  }
  core::json::Value root;
  if (!core::json::Parse(body, root, error)) {
    return false;
  }
  const core::json::Value* list = &root;
  if (root.type == core::json::Value::Type::kObject) {
    list = core::json::GetField(root, "data");
  }
  if (!core::json::IsArray(list)) {
    return true;
  }
  std::set<std::string> unique;
  for (const auto& item : list->array_value) {
    if (item.type == core::json::Value::Type::kString && !item.string_value.empty()) {
      unique.insert(item.string_value);
    }
  }
  services.assign(unique.begin(), unique.end());
  return true;
}

bool JaegerHttpSource::FetchTraces(const std::string& service, std::chrono::minutes lookback,
                                   std::string& body, std::string& error) {
  const long long minutes = std::max<long long>(1, lookback.count());
  return GetFromAnyBase("/traces?service=" + PercentEncode(service) +
                            "&lookback=" + std::to_string(minutes) + "m&end=" +
                            std::to_string(NowEpochMillis()) +
                            "&limit=" + std::to_string(options_.trace_limit),
                        body, error);
}

bool JaegerHttpSource::FetchDependencySummary(std::chrono::minutes lookback, std::string& body,
                                              std::string& error) {
  const long long lookback_ms = std::max<long long>(1, lookback.count()) * 60LL * 1000LL;
  return GetFromAnyBase("/dependencies?endTs=" + std::to_string(NowEpochMillis()) +
                            "&lookback=" + std::to_string(lookback_ms),
                        body, error);
}

} // namespace resilab::graph
