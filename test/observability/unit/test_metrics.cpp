/***
 * Name: test_metrics
 * Purpose: Counter accumulation, enable gating and both metrics renderings.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "observability/Metrics.h"

using namespace pybox::metrics;

namespace {

struct MetricsScope {
  MetricsScope() {
    Metrics::Enable(true);
    Metrics::Reset();
  }
  ~MetricsScope() {
    Metrics::Reset();
    Metrics::Enable(false);
  }
};

} // namespace

TEST(Metrics, CountersAccumulateInFirstUseOrder) {
  MetricsScope scope;
  Metrics::Increment(Metrics::kValidations);
  Metrics::Increment(Metrics::kApiCalls, 3);
  Metrics::Increment(Metrics::kValidations);
  const auto reg = Metrics::GetRegistry();
  ASSERT_EQ(reg.counters.size(), 2u);
  EXPECT_EQ(reg.counters[0].first, "validations");
  EXPECT_EQ(reg.counters[0].second, 2u);
  EXPECT_EQ(reg.counters[1].first, "api_calls");
  EXPECT_EQ(reg.counters[1].second, 3u);
}

TEST(Metrics, DisabledRegistryRecordsNothing) {
  MetricsScope scope;
  Metrics::Enable(false);
  Metrics::Increment(Metrics::kExecutions);
  Metrics::RecordDuration(Metrics::Phase::Execute, 10);
  const auto reg = Metrics::GetRegistry();
  EXPECT_TRUE(reg.counters.empty());
  EXPECT_TRUE(reg.durations_ns.empty());
  std::ostringstream out;
  Metrics::PrintMetrics(reg, out);
  EXPECT_TRUE(out.str().empty());
}

TEST(Metrics, ResetKeepsEnabledFlag) {
  MetricsScope scope;
  Metrics::Increment(Metrics::kTimeouts);
  Metrics::Reset();
  EXPECT_TRUE(Metrics::Enabled());
  EXPECT_TRUE(Metrics::GetRegistry().counters.empty());
}

TEST(Metrics, ScopedTimerRecordsPhase) {
  MetricsScope scope;
  { Metrics::ScopedTimer timer(Metrics::Phase::Validate); }
  const auto reg = Metrics::GetRegistry();
  ASSERT_EQ(reg.durations_ns.size(), 1u);
  EXPECT_EQ(reg.durations_ns[0].first, Metrics::Phase::Validate);
}

TEST(Metrics, TextSummary) {
  MetricsScope scope;
  Metrics::RecordDuration(Metrics::Phase::Parse, 2'500'000);
  Metrics::Increment(Metrics::kViolations, 2);
  Metrics::SetASTGeometry(pybox::ast::GeometrySummary{4, 3});
  std::ostringstream out;
  Metrics::PrintMetrics(Metrics::GetRegistry(), out);
  EXPECT_EQ(out.str(),
            "== Metrics ==\n"
            "  Parse: 2.500 ms\n"
            "  AST: nodes=4, max_depth=3\n"
            "  Counters (1):\n"
            "    violations: 2\n");
}

TEST(Metrics, JsonSummary) {
  MetricsScope scope;
  Metrics::RecordDuration(Metrics::Phase::Execute, 42);
  Metrics::Increment(Metrics::kRuntimeFailures);
  std::ostringstream out;
  Metrics::PrintMetricsJson(Metrics::GetRegistry(), out);
  const std::string js = out.str();
  EXPECT_NE(js.find(R"({"phase": "Execute", "ns": 42})"), std::string::npos);
  EXPECT_NE(js.find(R"("counters": { "runtime_failures": 1 })"), std::string::npos);
  EXPECT_NE(js.find(R"("ast": { "nodes": 0, "max_depth": 0 })"), std::string::npos);
}
