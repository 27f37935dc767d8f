#include "chaos/chaos_window.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <cstdint>
#include <sstream>

namespace resilab::chaos {

namespace {

std::string FailuresToJson(const std::vector<ContainerFailure>& failures) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < failures.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << "{\"container\":" << core::QuoteJson(failures[i].container)
        << ",\"operation\":" << core::QuoteJson(failures[i].operation)
        << ",\"error\":" << core::QuoteJson(failures[i].error) << '}';
  }
  out << ']';
  return out.str();
}

bool ReadStringArray(const core::json::Value& root, std::string_view key,
                     std::vector<std::string>& values, std::string& error) {
  values.clear();
  const core::json::Value* field = core::json::GetField(root, key);
  if (field == nullptr) {
    return true;
  }
  if (!core::json::IsArray(field)) {
    error = "field '" + std::string(key) + "' must be an array";
    return false;
  }
  for (const auto& item : field->array_value) {
    if (item.type != core::json::Value::Type::kString) {
      error = "field '" + std::string(key) + "' must contain strings";
      return false;
    }
    values.push_back(item.string_value);
  }
  return true;
}

void ReadFailures(const core::json::Value& root, std::string_view key,
                  std::vector<ContainerFailure>& failures) {
  failures.clear();
  const core::json::Value* field = core::json::GetField(root, key);
  if (!core::json::IsArray(field)) {
    return;
  }
  for (const auto& item : field->array_value) {
    ContainerFailure failure;
    failure.container = core::json::GetStringAny(item, {"container"});
    failure.operation = core::json::GetStringAny(item, {"operation"});
    failure.error = core::json::GetStringAny(item, {"error"});
    failures.push_back(std::move(failure));
  }
}

} // namespace

const char* ToString(WindowPhase phase) {
  switch (phase) {
  case WindowPhase::kIdle:
    return "idle";
  case WindowPhase::kSampling:
    return "sampling";
  case WindowPhase::kStopping:
    return "stopping";
  case WindowPhase::kCooling:
    return "cooling";
  case WindowPhase::kRestoring:
    return "restoring";
  case WindowPhase::kLogged:
    return "logged";
  }
  return "idle";
}

std::string ToJson(const ChaosWindow& window) {
  std::ostringstream out;
  out << "{\"window_id\":" << window.window_id
      << ",\"p_fail\":" << core::FormatJsonNumber(window.p_fail)
      << ",\"eligible\":" << window.eligible
      << ",\"killed\":" << window.Killed()
      << ",\"containers\":" << core::FormatJsonStringArray(window.containers)
      << ",\"services\":" << core::FormatJsonStringArray(window.services)
      << ",\"window_s\":" << core::FormatJsonNumber(window.window_s) << ",\"anomalies\":[";
  for (std::size_t i = 0; i < window.anomalies.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << "{\"container\":" << core::QuoteJson(window.anomalies[i].container)
        << ",\"state\":" << core::QuoteJson(window.anomalies[i].observed_state) << '}';
  }
  out << "],\"stop_failures\":" << FailuresToJson(window.stop_failures)
      << ",\"restore_failures\":" << FailuresToJson(window.restore_failures)
      << ",\"started_utc\":" << core::QuoteJson(window.started_utc)
      << ",\"finished_utc\":" << core::QuoteJson(window.finished_utc)
      << ",\"interrupted\":" << (window.interrupted ? "true" : "false") << ",\"phases\":[";
  for (std::size_t i = 0; i < window.phases.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << core::QuoteJson(ToString(window.phases[i]));
  }
  out << "]}";
  return out.str();
}

bool ParseChaosWindow(const std::string& line, ChaosWindow& window, std::string& error) {
  core::json::Value root;
  if (!core::json::Parse(line, root, error)) {
    return false;
  }
  if (root.type != core::json::Value::Type::kObject) {
    error = "window record must be a JSON object";
    return false;
  }

  window = ChaosWindow{};
  const core::json::Value* window_id = core::json::GetField(root, "window_id");
  std::int64_t id = 0;
  if (window_id == nullptr || !core::json::TryGetInteger(*window_id, id)) {
    error = "window record is missing integer 'window_id'";
    return false;
  }
  window.window_id = static_cast<int>(id);

  const core::json::Value* p_fail = core::json::GetField(root, "p_fail");
  if (!core::json::IsNumber(p_fail)) {
    error = "window record is missing numeric 'p_fail'";
    return false;
  }
  window.p_fail = p_fail->number_value;

  std::int64_t eligible = 0;
  const core::json::Value* eligible_field = core::json::GetField(root, "eligible");
  if (eligible_field != nullptr && core::json::TryGetInteger(*eligible_field, eligible) &&
      eligible >= 0) {
    window.eligible = static_cast<std::size_t>(eligible);
  }
  const core::json::Value* window_s = core::json::GetField(root, "window_s");
  if (core::json::IsNumber(window_s)) {
    window.window_s = window_s->number_value;
  }

  if (!ReadStringArray(root, "containers", window.containers, error) ||
      !ReadStringArray(root, "services", window.services, error)) {
    return false;
  }

  const core::json::Value* anomalies = core::json::GetField(root, "anomalies");
  if (core::json::IsArray(anomalies)) {
    for (const auto& item : anomalies->array_value) {
      window.anomalies.push_back({core::json::GetStringAny(item, {"container"}),
                                  core::json::GetStringAny(item, {"state"})});
    }
  }
  ReadFailures(root, "stop_failures", window.stop_failures);
  ReadFailures(root, "restore_failures", window.restore_failures);

  window.started_utc = core::json::GetStringAny(root, {"started_utc"});
  window.finished_utc = core::json::GetStringAny(root, {"finished_utc"});
  const core::json::Value* interrupted = core::json::GetField(root, "interrupted");
  window.interrupted = core::json::IsBool(interrupted) && interrupted->bool_value;
  return true;
}

} // namespace resilab::chaos
