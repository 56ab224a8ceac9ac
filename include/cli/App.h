/***
 * Name: pybox::cli (app)
 * Purpose: The pieces of one pybox invocation after argument parsing.
 * Inputs: Parsed Options, the environment (PYBOX_TIMEOUT)
 * Outputs: Reports on the given streams, per-stage log files, exit status
 * Theory of Operation:
 *   Main parses arguments and calls Run inside the error boundary: any
 *   PyboxException or std::exception becomes "pybox: <message>" on the error
 *   stream and exit status 2. Run reads the file, writes the optional stage
 *   logs, then validates or executes it against a DryRunHandle. Exit status
 *   is 0 when the fragment validated (and ran) successfully, 1 otherwise.
 */
#pragma once

#include <iosfwd>
#include <string>

#include "cli/Options.h"
#include "sandbox/ExecutionResult.h"
#include "sandbox/SandboxConfig.h"
#include "sema/Validator.h"

namespace pybox::cli {

inline constexpr const char* kTimeoutEnv = "PYBOX_TIMEOUT";

int Main(int argc, char** argv, std::ostream& out, std::ostream& err);

int Run(const Options& opts, std::ostream& out);

// Whole file as text; throws exceptions::FileReadError.
std::string ReadSource(const std::string& path);

// Timeout from --timeout, else PYBOX_TIMEOUT, else the default; throws exceptions::ConfigError.
sandbox::SandboxConfig ResolveSandboxConfig(const Options& opts);

// Token and AST dumps under opts.logPath, when requested.
void WriteStageLogs(const Options& opts, const std::string& path, const std::string& source);

void PrintValidation(const sema::ValidationResult& result, bool json, std::ostream& out);
void PrintExecution(const sandbox::ExecutionResult& result, bool json, std::ostream& out);
void ReportMetricsIfRequested(const Options& opts, std::ostream& out);

} // namespace pybox::cli
