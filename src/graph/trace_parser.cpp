#include "graph/trace_parser.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace resilab::graph {

namespace json = core::json;

namespace {

struct SpanView {
  std::string span_id;
  std::string service;
  std::string kind;
  std::string messaging_system;
  std::string parent_span_id;
  bool follows_from = false;
  double start_time = 0.0;
};

std::string TagValue(const json::Value& span, std::string_view wanted_key) {
  const json::Value* tags = json::GetField(span, "tags");
  if (!json::IsArray(tags)) {
    return "";
  }
  for (const auto& tag : tags->array_value) {
    if (json::GetStringAny(tag, {"key"}) != wanted_key) {
      continue;
    }
    const json::Value* value = json::GetField(tag, "value");
    if (json::IsString(value)) {
      return value->string_value;
    }
  }
  return "";
}

double StartTime(const json::Value& span) {
  for (const auto key : {"startTime", "startTimeMillis", "startTimeUnixNano"}) {
    const json::Value* field = json::GetField(span, key);
    if (json::IsNumber(field)) {
      return field->number_value;
    }
  }
  return 0.0;
}

SpanView ReadSpan(const json::Value& span, const json::Value* processes) {
  SpanView view;
  view.span_id = json::GetStringAny(span, {"spanID", "spanId"});
  const std::string process_id = json::GetStringAny(span, {"processID", "processId"});
  if (processes != nullptr && !process_id.empty()) {
    const json::Value* process = json::GetField(*processes, process_id);
    if (json::IsObject(process)) {
      view.service = json::GetStringAny(*process, {"serviceName"});
    }
  }
  view.kind = TagValue(span, "span.kind");
  view.messaging_system = TagValue(span, "messaging.system");
  view.start_time = StartTime(span);

  const json::Value* references = json::GetField(span, "references");
  if (json::IsArray(references)) {
    for (const auto& reference : references->array_value) {
      const std::string ref_type = json::GetStringAny(reference, {"refType"});
      if (ref_type != "CHILD_OF" && ref_type != "FOLLOWS_FROM") {
        continue;
      }
      const std::string parent = json::GetStringAny(reference, {"spanID", "spanId"});
      if (!parent.empty()) {
        view.parent_span_id = parent;
        view.follows_from = ref_type == "FOLLOWS_FROM";
        break;
      }
    }
  }
  if (view.parent_span_id.empty()) {
    view.parent_span_id = json::GetStringAny(span, {"parentSpanID", "parentSpanId"});
  }
  return view;
}

bool IsAsyncLink(const SpanView& parent, const SpanView& child) {
  if (child.kind == "consumer" && parent.kind == "producer") {
    return true;
  }
  return child.follows_from &&
         (!child.messaging_system.empty() || !parent.messaging_system.empty());
}

void ParseTrace(const json::Value& trace, RelationSet& relations) {
  const json::Value* spans = json::GetField(trace, "spans");
  if (!json::IsArray(spans)) {
    return;
  }
  const json::Value* processes = json::GetField(trace, "processes");

  std::vector<SpanView> views;
  std::map<std::string, std::size_t> by_id;
  for (const auto& span : spans->array_value) {
    SpanView view = ReadSpan(span, json::IsObject(processes) ? processes : nullptr);
    if (!view.messaging_system.empty()) {
      relations.messaging_systems.insert(view.messaging_system);
    }
    if (view.span_id.empty() || view.service.empty()) {
      continue;
    }
    by_id[view.span_id] = views.size();
    views.push_back(std::move(view));
  }

  std::size_t linked = 0;
  for (const auto& child : views) {
    if (child.parent_span_id.empty()) {
      continue;
    }
    const auto parent_it = by_id.find(child.parent_span_id);
    if (parent_it == by_id.end()) {
      continue;
    }
    const SpanView& parent = views[parent_it->second];
    if (parent.service == child.service) {
      continue;
    }
    relations.Add(parent.service, child.service,
                  IsAsyncLink(parent, child) ? Transport::kAsync : Transport::kSync);
    ++linked;
  }
  if (linked > 0U || views.empty()) {
    return;
  }

  // No usable parent links: fall back to the order in which services appear.
  std::vector<std::pair<double, std::string>> sequence;
  sequence.reserve(views.size());
  for (const auto& view : views) {
    sequence.emplace_back(view.start_time, view.service);
  }
  std::stable_sort(sequence.begin(), sequence.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });
  std::vector<std::string> ordered;
  for (const auto& entry : sequence) {
    if (ordered.empty() || ordered.back() != entry.second) {
      ordered.push_back(entry.second);
    }
  }
  for (std::size_t i = 0; i + 1U < ordered.size(); ++i) {
    relations.Add(ordered[i], ordered[i + 1U], Transport::kSync);
  }
}

const json::Value* DataArray(const json::Value& root) {
  if (root.type == json::Value::Type::kArray) {
    return &root;
  }
  const json::Value* data = json::GetField(root, "data");
  return json::IsArray(data) ? data : nullptr;
}

} // namespace

bool ParseJaegerTraces(const json::Value& root, RelationSet& relations, std::string& error) {
  const json::Value* traces = DataArray(root);
  if (traces == nullptr) {
    error = "trace export must be a list or an object with a 'data' array";
    return false;
  }
  for (const auto& trace : traces->array_value) {
    if (trace.type == json::Value::Type::kObject) {
      ParseTrace(trace, relations);
    }
  }
  return true;
}

bool ParseJaegerTraceText(std::string_view text, RelationSet& relations, std::string& error) {
  json::Value root;
  if (!json::Parse(text, root, error)) {
    error = "invalid trace JSON: " + error;
    return false;
  }
  return ParseJaegerTraces(root, relations, error);
}

bool ParseDependencySummary(const json::Value& root, RelationSet& relations,
                            std::string& error) {
  const json::Value* rows = DataArray(root);
  if (rows == nullptr) {
    error = "dependency summary must be a list or an object with a 'data' array";
    return false;
  }
  for (const auto& row : rows->array_value) {
    if (row.type != json::Value::Type::kObject) {
      continue;
    }
    const std::string parent = json::GetStringAny(row, {"parent", "caller", "p"});
    const std::string child = json::GetStringAny(row, {"child", "callee", "c"});
    if (parent.empty() || child.empty() || parent == child) {
      continue;
    }
    std::int64_t count = 0;
    for (const auto key : {"callCount", "calls", "count"}) {
      const json::Value* field = json::GetField(row, key);
      if (field != nullptr && json::TryGetInteger(*field, count)) {
        break;
      }
    }
    relations.Add(parent, child, Transport::kSync, std::max<std::int64_t>(count, 1));
  }
  return true;
}

bool ParseDependencySummaryText(std::string_view text, RelationSet& relations,
                                std::string& error) {
  json::Value root;
  if (!json::Parse(text, root, error)) {
    error = "invalid dependency summary JSON: " + error;
    return false;
  }
  return ParseDependencySummary(root, relations, error);
}

} // namespace resilab::graph
