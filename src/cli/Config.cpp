/***
 * Name: pybox::cli::ReadSource / ResolveSandboxConfig
 * Purpose: Load the fragment file and settle the sandbox configuration.
 */
#include "cli/App.h"
#include "cli/ParseArgsInternals.h"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "pybox/exceptions/file_read_error.h"

namespace pybox::cli {

std::string ReadSource(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { throw exceptions::FileReadError("cannot open '" + path + "'"); }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) { throw exceptions::FileReadError("cannot read '" + path + "'"); }
  return buffer.str();
}

sandbox::SandboxConfig ResolveSandboxConfig(const Options& opts) {
  sandbox::SandboxConfig config;
  if (opts.timeoutSeconds) {
    config.timeout = std::chrono::duration<double>(*opts.timeoutSeconds);
  } else if (const char* env = std::getenv(kTimeoutEnv); env != nullptr && *env != '\0') {
    config.timeout = std::chrono::duration<double>(detail::parseTimeoutValue(env, kTimeoutEnv));
  }
  config.randomSeed = opts.seed;
  return config;
}

} // namespace pybox::cli
