/***
 * Name: pybox::exceptions::TimeoutFailure
 * Purpose: Raised inside the interpreter when the execution deadline passes.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Not derived from the script exception type, so
 *   fragment-level try/except can never intercept it.
 */
#pragma once

#include <string>
#include <utility>

#include "pybox/exceptions/pybox_exception.h"

namespace pybox {
namespace exceptions {

class TimeoutFailure : public PyboxException {
 public:
  explicit TimeoutFailure(std::string msg) noexcept : PyboxException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pybox
