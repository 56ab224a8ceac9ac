/***
 * Name: pybox::metrics::PrintMetrics
 * Purpose: Pretty-print collected metrics (durations, counters, AST geometry).
 * Inputs:
 *   - reg: metrics registry snapshot
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Formats timings in milliseconds and lists counters.
 */
#include "observability/Metrics.h"

#include <iomanip>
#include <ios>
#include <ostream>

namespace pybox::metrics {

auto Metrics::PrintMetrics(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "== Metrics ==\n";
  for (const auto& entry : reg.durations_ns) {
    const auto phase = entry.first;
    const auto nanoseconds = entry.second;
    const double milliseconds = static_cast<double>(nanoseconds) / 1'000'000.0;
    out << "  " << PhaseName(phase) << ": " << std::fixed << std::setprecision(3) << milliseconds << " ms\n";
  }
  out << "  AST: nodes=" << reg.ast_geom.nodes << ", max_depth=" << reg.ast_geom.maxDepth << "\n";
  out << "  Counters (" << reg.counters.size() << "):\n";
  for (const auto& [name, value] : reg.counters) {
    out << "    " << name << ": " << value << "\n";
  }
}

}  // namespace pybox::metrics
