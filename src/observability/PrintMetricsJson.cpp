/***
 * Name: pybox::metrics::PrintMetricsJson
 * Purpose: Print metrics in JSON for consumption by tools.
 * Inputs:
 *   - reg: metrics registry snapshot
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Simple JSON writer; prints arrays of objects and a counter map.
 */
#include "observability/Metrics.h"

#include <cstddef>
#include <ostream>

#include "observability/JsonWriter.h"

namespace pybox::metrics {

auto Metrics::PrintMetricsJson(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "{";
  // durations
  out << "\n  \"durations_ns\": [";
  for (std::size_t i = 0; i < reg.durations_ns.size(); ++i) {
    const auto& item = reg.durations_ns[i];
    out << (i != 0U ? ",\n    {" : "\n    {")
        << R"("phase": ")" << PhaseName(item.first) << R"(", "ns": )" << item.second << "}";
  }
  out << "\n  ],";
  // counters
  out << "\n  \"counters\": {";
  for (std::size_t i = 0; i < reg.counters.size(); ++i) {
    out << (i != 0U ? ", " : " ") << "\"" << json::Escape(reg.counters[i].first) << "\": " << reg.counters[i].second;
  }
  out << " },";
  // AST
  out << "\n  \"ast\": { \"nodes\": " << reg.ast_geom.nodes
      << ", \"max_depth\": " << reg.ast_geom.maxDepth << " }\n}";
}

}  // namespace pybox::metrics
