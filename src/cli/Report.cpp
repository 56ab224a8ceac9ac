/***
 * Name: pybox::cli report printers
 * Purpose: Render validation and execution results as text or JSON.
 */
#include "cli/App.h"

#include <iomanip>
#include <ostream>
#include <string>

#include "observability/Metrics.h"

namespace pybox::cli {

namespace {

const char* pyBool(bool b) { return b ? "True" : "False"; }

} // namespace

void PrintValidation(const sema::ValidationResult& result, bool json, std::ostream& out) {
  if (json) {
    out << sandbox::describe(result).toJson() << '\n';
    return;
  }
  out << "valid: " << pyBool(result.valid) << '\n';
  if (result.entryNameFound) {
    out << "entry: " << *result.entryNameFound << " (signature " << (result.signatureOk ? "ok" : "not ok") << ")\n";
  }
  for (const auto& e : result.errors) { out << "error: " << e << '\n'; }
  for (const auto& w : result.warnings) { out << "warning: " << w << '\n'; }
  if (!result.actionsReferenced.empty()) {
    out << "actions:";
    for (const auto& a : result.actionsReferenced) { out << ' ' << a; }
    out << '\n';
  }
}

void PrintExecution(const sandbox::ExecutionResult& result, bool json, std::ostream& out) {
  if (json) {
    out << result.describe().toJson() << '\n';
    return;
  }
  out << "success: " << pyBool(result.success) << '\n';
  if (!result.success) { out << "failure: " << sandbox::to_string(result.failure) << '\n'; }
  if (result.error) { out << "error: " << *result.error << '\n'; }
  out << "elapsed: " << std::fixed << std::setprecision(3) << result.elapsed.count() << "s\n";
  out.unsetf(std::ios::floatfield);
  if (result.actionsTaken != 0 || result.turnsElapsed != 0) {
    out << "actions_taken: " << result.actionsTaken << "\nturns_elapsed: " << result.turnsElapsed << '\n';
  }
  if (!result.capturedOutput.empty()) {
    out << "stdout:\n" << result.capturedOutput;
    if (result.capturedOutput.back() != '\n') { out << '\n'; }
  }
  for (const auto& call : result.apiCalls) {
    out << "call: " << call.method << "(" << call.formattedArgs << ")";
    if (!call.success) { out << " failed" << (call.error ? ": " + *call.error : std::string()); }
    out << '\n';
  }
  for (const auto& m : result.gameMessages) { out << "message: " << m << '\n'; }
  if (result.exploration) {
    out << "autoexplore: " << result.exploration->stopReason << " after " << result.exploration->stepsTaken
        << " step(s)";
    if (!result.exploration->message.empty()) { out << " - " << result.exploration->message; }
    out << '\n';
  }
  if (const auto* value = result.payload.find("return_value")) { out << "return_value: " << value->toText() << '\n'; }
  if (const auto* value = result.payload.find("stopped_reason")) { out << "stopped_reason: " << value->asString() << '\n'; }
  if (const auto* value = result.payload.find("data")) { out << "data: " << value->toText() << '\n'; }
  if (const auto* value = result.payload.find("result")) { out << "result: " << value->toText() << '\n'; }
}

void ReportMetricsIfRequested(const Options& opts, std::ostream& out) {
  if (!opts.metrics && !opts.metricsJson) { return; }
  const auto registry = metrics::Metrics::GetRegistry();
  if (opts.metricsJson) {
    metrics::Metrics::PrintMetricsJson(registry, out);
  } else {
    metrics::Metrics::PrintMetrics(registry, out);
  }
}

} // namespace pybox::cli
