/***
 * Name: pybox::cli::Run
 * Purpose: Validate or execute one fragment file and report the outcome.
 */
#include "cli/App.h"

#include <ostream>
#include <string>

#include "observability/Log.h"
#include "observability/Metrics.h"
#include "sandbox/DryRunHandle.h"
#include "sandbox/Sandbox.h"

namespace pybox::cli {

int Run(const Options& opts, std::ostream& out) {
  log::Log::Enable(opts.verbose);
  metrics::Metrics::Enable(opts.metrics || opts.metricsJson);

  const std::string& path = opts.inputs.front();
  std::string source;
  {
    metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::ReadFile);
    source = ReadSource(path);
  }
  WriteStageLogs(opts, path, source);

  const sandbox::Sandbox sandbox(ResolveSandboxConfig(opts));
  int status = 0;
  if (opts.validateOnly) {
    const sema::ValidationResult result = sandbox.validate(source, opts.mode, opts.entry);
    PrintValidation(result, opts.json, out);
    status = result.valid ? 0 : 1;
  } else {
    sandbox::CodeSubmission submission;
    submission.source = source;
    submission.mode = opts.mode;
    submission.entryName = opts.entry;
    submission.parameters = opts.params;
    sandbox::DryRunHandle handle;
    const sandbox::ExecutionResult result = sandbox.execute(submission, handle);
    log::Log::Info("dry run finished at turn " + std::to_string(handle.turn()) + " after " +
                   std::to_string(handle.invocations()) + " handle call(s)");
    PrintExecution(result, opts.json, out);
    status = result.success ? 0 : 1;
  }
  ReportMetricsIfRequested(opts, out);
  return status;
}

} // namespace pybox::cli
