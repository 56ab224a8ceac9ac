/***
 * Name: pybox::sandbox::SandboxConfig (impl)
 */
#include "sandbox/SandboxConfig.h"

#include <sstream>

#include "pybox/exceptions/config_error.h"

namespace pybox::sandbox {

void SandboxConfig::check() const {
  if (!(timeout.count() > 0.0)) {
    throw exceptions::ConfigError("timeout must be a positive number of seconds, got " + formatSeconds(timeout));
  }
  if (maxCallDepth <= 0) { throw exceptions::ConfigError("maximum call depth must be positive"); }
  if (maxSequenceLength == 0) { throw exceptions::ConfigError("maximum sequence length must be positive"); }
}

std::string formatSeconds(std::chrono::duration<double> seconds) {
  std::ostringstream oss;
  oss << seconds.count();
  return oss.str();
}

} // namespace pybox::sandbox
