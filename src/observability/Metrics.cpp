/***
 * Name: pybox::metrics::Metrics (registry)
 * Purpose: Define the static registry and its guarded recording operations.
 * Inputs: N/A
 * Outputs: Singleton-style storage for metrics across stages.
 * Theory of Operation: Every accessor takes the registry mutex; recorders
 *   return early while the registry is disabled.
 */
#include "observability/Metrics.h"

namespace pybox {
namespace metrics {

std::mutex Metrics::mutex_{};
Metrics::Registry Metrics::reg_{};

void Metrics::Enable(bool on) {
  std::lock_guard<std::mutex> lock(mutex_);
  reg_.enabled = on;
}

bool Metrics::Enabled() {
  std::lock_guard<std::mutex> lock(mutex_);
  return reg_.enabled;
}

Metrics::Registry Metrics::GetRegistry() {
  std::lock_guard<std::mutex> lock(mutex_);
  return reg_;
}

void Metrics::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool enabled = reg_.enabled;
  reg_ = Registry{};
  reg_.enabled = enabled;
}

void Metrics::RecordDuration(Phase phase, std::uint64_t ns) noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reg_.enabled) return;
  try {
    reg_.durations_ns.emplace_back(phase, ns);
  } catch (const std::bad_alloc&) {
    // Timings are best effort; a failed append drops this sample only.
  }
}

void Metrics::Increment(const std::string& counter, std::uint64_t delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reg_.enabled) return;
  for (auto& [name, value] : reg_.counters) {
    if (name == counter) {
      value += delta;
      return;
    }
  }
  reg_.counters.emplace_back(counter, delta);
}

void Metrics::SetASTGeometry(const ast::GeometrySummary& g) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (reg_.enabled) reg_.ast_geom = g;
}

const char* Metrics::PhaseName(Phase phase) {
  switch (phase) {
    case Phase::ReadFile: return "ReadFile";
    case Phase::Lex: return "Lex";
    case Phase::Parse: return "Parse";
    case Phase::Validate: return "Validate";
    case Phase::Execute: return "Execute";
  }
  return "Unknown";
}

}  // namespace metrics
}  // namespace pybox
