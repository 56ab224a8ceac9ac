/***
 * Name: pybox::metrics::Metrics
 * Purpose: Static metrics registry shared by the CLI, validator and sandbox.
 * Inputs: Phase identifiers, named counters, AST geometry
 * Outputs: A static registry the application prints as text or JSON.
 * Theory of Operation: All users share one Registry and its enabled flag;
 *   recording is a no-op while disabled. Phases may repeat (one Execute per
 *   run) and are reported in recording order. A mutex guards the registry
 *   because sandboxes may run on several threads.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "ast/GeometrySummary.h"

namespace pybox {

namespace metrics {

class Metrics {
 public:
  enum class Phase { ReadFile, Lex, Parse, Validate, Execute };

  // Counter names recorded by pybox itself.
  static constexpr const char* kValidations = "validations";
  static constexpr const char* kViolations = "violations";
  static constexpr const char* kExecutions = "executions";
  static constexpr const char* kTimeouts = "timeouts";
  static constexpr const char* kRuntimeFailures = "runtime_failures";
  static constexpr const char* kApiCalls = "api_calls";

  struct Registry {
    bool enabled{false};
    std::vector<std::pair<Phase, std::uint64_t>> durations_ns;
    std::vector<std::pair<std::string, std::uint64_t>> counters;
    ast::GeometrySummary ast_geom{};
  };

  class ScopedTimer {
   public:
    explicit ScopedTimer(Phase phase)
        : phase_(phase), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer() noexcept {
      auto end = std::chrono::steady_clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
      RecordDuration(phase_, static_cast<std::uint64_t>(ns));
    }
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

   private:
    Phase phase_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
  };

  static void Enable(bool on);
  static bool Enabled();
  // Snapshot of the registry.
  static Registry GetRegistry();
  static void Reset();
  static void RecordDuration(Phase phase, std::uint64_t ns) noexcept;
  static void Increment(const std::string& counter, std::uint64_t delta = 1);
  static void SetASTGeometry(const ast::GeometrySummary& g);

  static const char* PhaseName(Phase phase);
  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 protected:
  Metrics() = default;

 private:
  static std::mutex mutex_;
  static Registry reg_;
};

}  // namespace metrics
}  // namespace pybox
