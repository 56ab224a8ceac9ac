/***
 * Name: pybox::rt::ScriptError
 * Purpose: C++ carrier for an exception raised by (or inside) fragment code.
 * Inputs: Script exception instance
 * Outputs: what() text of the form "<ExceptionType>: <message>"
 * Theory of Operation:
 *   Raised by the interpreter and by native helpers; `try/except` in the
 *   fragment catches it by matching the carried instance's type. Anything
 *   that is not a ScriptError (a timeout, say) passes through script handlers.
 */
#pragma once

#include <memory>
#include <string>

#include "pybox/exceptions/pybox_exception.h"
#include "runtime/TypeObject.h"

namespace pybox::rt {

class ScriptError : public exceptions::PyboxException {
 public:
  explicit ScriptError(std::shared_ptr<ExceptionObj> exc);

  const std::shared_ptr<ExceptionObj>& exception() const noexcept { return exc_; }
  const std::string& typeName() const noexcept { return exc_->type->name; }
  // Message without the type prefix.
  std::string detail() const;

 private:
  std::shared_ptr<ExceptionObj> exc_;
};

// Build an instance of `type` carrying a single message argument.
std::shared_ptr<ExceptionObj> newException(const TypePtr& type, const std::string& message);

[[noreturn]] void raise(const TypePtr& type, const std::string& message);

// str() of an exception instance: empty, the lone argument, or the argument tuple.
std::string exceptionMessage(const ExceptionObj& exc);

} // namespace pybox::rt
