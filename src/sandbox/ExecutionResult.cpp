/***
 * Name: pybox::sandbox::ExecutionResult (impl)
 */
#include "sandbox/ExecutionResult.h"

#include <utility>

namespace pybox::sandbox {

namespace {

PayloadValue textList(const std::vector<std::string>& items) {
  PayloadValue::List list;
  list.reserve(items.size());
  for (const auto& item : items) { list.emplace_back(item); }
  return list;
}

const char* errorKindName(sema::ValidationErrorKind kind) {
  switch (kind) {
    case sema::ValidationErrorKind::None: return "none";
    case sema::ValidationErrorKind::Syntax: return "syntax";
    case sema::ValidationErrorKind::Security: return "security";
    case sema::ValidationErrorKind::MissingEntryPoint: return "missing_entry_point";
  }
  return "none";
}

} // namespace

const char* to_string(FailureKind kind) {
  switch (kind) {
    case FailureKind::None: return "none";
    case FailureKind::Validation: return "validation";
    case FailureKind::Timeout: return "timeout";
    case FailureKind::Runtime: return "runtime";
    case FailureKind::MissingEntryPoint: return "missing_entry_point";
    case FailureKind::Internal: return "internal";
  }
  return "internal";
}

PayloadValue describe(const sema::ValidationResult& validation) {
  PayloadValue::Map map;
  map.emplace_back("valid", validation.valid);
  map.emplace_back("errors", textList(validation.errors));
  map.emplace_back("warnings", textList(validation.warnings));
  map.emplace_back("entry_name_found",
                   validation.entryNameFound ? PayloadValue(*validation.entryNameFound) : PayloadValue());
  map.emplace_back("signature_ok", validation.signatureOk);
  map.emplace_back("error_kind", errorKindName(validation.errorKind));
  if (validation.violation) {
    PayloadValue::Map violation;
    violation.emplace_back("category", exceptions::to_string(validation.violation->category));
    violation.emplace_back("detail", validation.violation->detail);
    violation.emplace_back("line", validation.violation->line);
    map.emplace_back("violation", std::move(violation));
  }
  if (!validation.actionsReferenced.empty()) {
    map.emplace_back("actions_referenced", textList(validation.actionsReferenced));
  }
  return map;
}

PayloadValue describe(const APICallRecord& call) {
  PayloadValue::Map map;
  map.emplace_back("method", call.method);
  map.emplace_back("args", call.formattedArgs);
  map.emplace_back("success", call.success);
  if (call.error) { map.emplace_back("error", *call.error); }
  return map;
}

PayloadValue describe(const ExplorationOutcome& outcome) {
  PayloadValue::Map map;
  map.emplace_back("stop_reason", outcome.stopReason);
  map.emplace_back("steps_taken", outcome.stepsTaken);
  map.emplace_back("message", outcome.message);
  return map;
}

PayloadValue ExecutionResult::describe() const {
  PayloadValue::Map map;
  map.emplace_back("success", success);
  map.emplace_back("failure", to_string(failure));
  map.emplace_back("error", error ? PayloadValue(*error) : PayloadValue());
  map.emplace_back("elapsed", elapsed.count());
  map.emplace_back("actions_taken", actionsTaken);
  map.emplace_back("turns_elapsed", turnsElapsed);
  map.emplace_back("stdout", capturedOutput);
  map.emplace_back("result", payload);
  map.emplace_back("validation", sandbox::describe(validation));
  return map;
}

} // namespace pybox::sandbox
