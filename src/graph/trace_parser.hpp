#pragma once

#include "core/json_dom.hpp"
#include "graph/relation.hpp"

#include <string>
#include <string_view>

namespace resilab::graph {

// Extracts service relations from a Jaeger trace export
// (`{"data":[{"spans":[...],"processes":{...}}]}`).
//
// - parent comes from a CHILD_OF/FOLLOWS_FROM reference, else `parentSpanID`
// - a relation is async for consumer-under-producer spans, or for a
//   FOLLOWS_FROM reference where either span carries `messaging.system`
// - a trace with no cross-service parent links contributes its time-ordered
//   service transitions instead (as sync relations)
bool ParseJaegerTraces(const core::json::Value& root, RelationSet& relations, std::string& error);
bool ParseJaegerTraceText(std::string_view text, RelationSet& relations, std::string& error);

// Parses a dependency summary, either a bare list or `{"data":[...]}` of
// `{parent|caller|p, child|callee|c, callCount|calls|count}`. All sync.
bool ParseDependencySummary(const core::json::Value& root, RelationSet& relations,
                            std::string& error);
bool ParseDependencySummaryText(std::string_view text, RelationSet& relations,
                                std::string& error);

} // namespace resilab::graph
