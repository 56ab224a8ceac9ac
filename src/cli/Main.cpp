#include "cli/App.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"

#include <exception>
#include <ostream>

#include "pybox/exceptions/pybox_exception.h"

namespace pybox::cli {
/***
 * Name: pybox::cli::Main
 * Purpose: CLI entry point for pybox.
 * Inputs:
 *   - argv, output and error streams
 * Outputs:
 *   - Exit status: 0 success, 1 fragment rejected or failed, 2 usage or host error
 * Theory of Operation:
 *   Parse args then invoke Run inside the error boundary.
 */
int Main(const int argc, char** argv, std::ostream& out, std::ostream& err) {
  try {
    Options opts;
    if (!ParseArgs(argc, argv, opts)) {
      err << "pybox: argument parse error\n";
      err << Usage();
      return 2;
    }
    if (opts.showHelp) {
      out << Usage();
      return 0;
    }
    if (opts.inputs.size() != 1) {
      err << "pybox: error: exactly one input file is required\n";
      return 2;
    }
    return Run(opts, out);
  } catch (const exceptions::PyboxException& ex) {
    err << "pybox: " << ex.what() << '\n';
    return 2;
  } catch (const std::exception& ex) {
    err << "pybox: internal error: " << ex.what() << '\n';
    return 2;
  }
}
} // namespace pybox::cli
