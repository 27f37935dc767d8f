#include "live/live_window.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <cstdint>
#include <sstream>

namespace resilab::live {

namespace json = core::json;

namespace {

bool ReadCount(const json::Value& object, std::string_view key, std::size_t& out,
               std::string& error) {
  const json::Value* field = json::GetField(object, key);
  std::int64_t value = 0;
  if (field == nullptr || !json::TryGetInteger(*field, value) || value < 0) {
    error = "field '" + std::string(key) + "' must be a non-negative integer";
    return false;
  }
  out = static_cast<std::size_t>(value);
  return true;
}

} // namespace

std::size_t LiveWindow::TotalAttempted() const {
  std::size_t total = 0;
  for (const auto& [endpoint, counts] : endpoints) {
    (void)endpoint;
    total += counts.attempted;
  }
  return total;
}

std::size_t LiveWindow::TotalSucceeded() const {
  std::size_t total = 0;
  for (const auto& [endpoint, counts] : endpoints) {
    (void)endpoint;
    total += counts.succeeded;
  }
  return total;
}

bool ModeLabelMatches(const std::string& mode_label, const std::string& mode) {
  return mode_label.empty() || mode_label == "any" || mode_label == mode;
}

bool ValidateLiveWindow(const LiveWindow& window, std::string& error) {
  for (const auto& [endpoint, counts] : window.endpoints) {
    if (counts.succeeded > counts.attempted) {
      error = "endpoint '" + endpoint + "': succeeded exceeds attempted";
      return false;
    }
    if (counts.succeeded + counts.transport_errors + counts.server_errors > counts.attempted) {
      error = "endpoint '" + endpoint + "': outcome counts exceed attempted";
      return false;
    }
  }
  return true;
}

std::string ToJson(const LiveWindow& window) {
  std::ostringstream out;
  out << "{\n  \"window_id\": " << window.window_id
      << ",\n  \"p_fail\": " << core::FormatJsonNumber(window.p_fail)
      << ",\n  \"mode_label\": " << core::QuoteJson(window.mode_label)
      << ",\n  \"anomalous\": " << (window.anomalous ? "true" : "false")
      << ",\n  \"killed\": " << window.killed
      << ",\n  \"started_utc\": " << core::QuoteJson(window.started_utc)
      << ",\n  \"finished_utc\": " << core::QuoteJson(window.finished_utc)
      << ",\n  \"reveal_s\": " << core::FormatJsonNumber(window.reveal_s)
      << ",\n  \"measure_s\": " << core::FormatJsonNumber(window.measure_s)
      << ",\n  \"probe_total\": " << window.TotalAttempted()
      << ",\n  \"probe_ok\": " << window.TotalSucceeded() << ",\n  \"endpoints\": {";
  bool first = true;
  for (const auto& [endpoint, counts] : window.endpoints) {
    out << (first ? "\n    " : ",\n    ") << core::QuoteJson(endpoint)
        << ": {\"attempted\": " << counts.attempted << ", \"succeeded\": " << counts.succeeded
        << ", \"transport_errors\": " << counts.transport_errors
        << ", \"server_errors\": " << counts.server_errors << '}';
    first = false;
  }
  out << (first ? "}\n}\n" : "\n  }\n}\n");
  return out.str();
}

bool ParseLiveWindow(const std::string& text, LiveWindow& window, std::string& error) {
  json::Value root;
  if (!json::Parse(text, root, error)) {
    error = "invalid live window JSON: " + error;
    return false;
  }
  if (root.type != json::Value::Type::kObject) {
    error = "live window must be a JSON object";
    return false;
  }

  window = LiveWindow{};
  const json::Value* window_id = json::GetField(root, "window_id");
  std::int64_t id = 0;
  if (window_id == nullptr || !json::TryGetInteger(*window_id, id)) {
    error = "live window is missing integer 'window_id'";
    return false;
  }
  window.window_id = static_cast<int>(id);

  const json::Value* p_fail = json::GetField(root, "p_fail");
  if (!json::IsNumber(p_fail)) {
    error = "live window is missing numeric 'p_fail'";
    return false;
  }
  window.p_fail = p_fail->number_value;

  const std::string mode_label = json::GetStringAny(root, {"mode_label", "mode"});
  window.mode_label = mode_label.empty() ? "any" : mode_label;
  const json::Value* anomalous = json::GetField(root, "anomalous");
  window.anomalous = json::IsBool(anomalous) && anomalous->bool_value;
  const json::Value* killed = json::GetField(root, "killed");
  std::int64_t killed_count = 0;
  if (killed != nullptr && json::TryGetInteger(*killed, killed_count) && killed_count >= 0) {
    window.killed = static_cast<std::size_t>(killed_count);
  }
  window.started_utc = json::GetStringAny(root, {"started_utc"});
  window.finished_utc = json::GetStringAny(root, {"finished_utc"});
  const json::Value* reveal_s = json::GetField(root, "reveal_s");
  window.reveal_s = json::IsNumber(reveal_s) ? reveal_s->number_value : 0.0;
  const json::Value* measure_s = json::GetField(root, "measure_s");
  window.measure_s = json::IsNumber(measure_s) ? measure_s->number_value : 0.0;

  const json::Value* endpoints = json::GetField(root, "endpoints");
  if (!json::IsObject(endpoints)) {
    error = "live window is missing object 'endpoints'";
    return false;
  }
  for (const auto& [endpoint, value] : endpoints->object_value) {
    if (value.type != json::Value::Type::kObject) {
      error = "endpoint '" + endpoint + "' counts must be an object";
      return false;
    }
    EndpointCounts counts;
    if (!ReadCount(value, "attempted", counts.attempted, error) ||
        !ReadCount(value, "succeeded", counts.succeeded, error)) {
      error = "endpoint '" + endpoint + "': " + error;
      return false;
    }
    std::string ignored;
    (void)ReadCount(value, "transport_errors", counts.transport_errors, ignored);
    (void)ReadCount(value, "server_errors", counts.server_errors, ignored);
    window.endpoints[endpoint] = counts;
  }
  return ValidateLiveWindow(window, error);
}

} // namespace resilab::live
