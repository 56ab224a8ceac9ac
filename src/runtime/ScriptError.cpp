/***
 * Name: pybox::rt::ScriptError (implementation)
 */
#include "runtime/ScriptError.h"

#include <utility>

#include "runtime/Heap.h"
#include "runtime/Ops.h"

namespace pybox::rt {

namespace {
std::string formatWhat(const ExceptionObj& exc) { return exc.type->name + ": " + exceptionMessage(exc); }
} // namespace

ScriptError::ScriptError(std::shared_ptr<ExceptionObj> exc)
    : PyboxException(formatWhat(*exc)), exc_(std::move(exc)) {}

std::string ScriptError::detail() const { return exceptionMessage(*exc_); }

std::shared_ptr<ExceptionObj> newException(const TypePtr& type, const std::string& message) {
  ValueList args;
  args.push_back(newStr(message));
  return make<ExceptionObj>(type, std::move(args));
}

void raise(const TypePtr& type, const std::string& message) { throw ScriptError(newException(type, message)); }

std::string exceptionMessage(const ExceptionObj& exc) {
  if (exc.args.empty()) { return {}; }
  if (exc.args.size() == 1) {
    if (exc.type->isSubtypeOf(builtinTypes().keyError.get())) { return repr(exc.args[0]); }
    return str(exc.args[0]);
  }
  return repr(Value(make<TupleObj>(exc.args)));
}

} // namespace pybox::rt
