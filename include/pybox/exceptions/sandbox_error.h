/***
 * Name: pybox::exceptions::SandboxError
 * Purpose: Exception for failures of the sandbox machinery itself (timer, handler installation).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyboxException; never raised by fragment code.
 */
#pragma once

#include <string>
#include <utility>

#include "pybox/exceptions/pybox_exception.h"

namespace pybox {
namespace exceptions {

class SandboxError : public PyboxException {
 public:
  explicit SandboxError(std::string msg) noexcept : PyboxException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pybox
