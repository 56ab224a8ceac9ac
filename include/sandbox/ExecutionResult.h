/***
 * Name: pybox::sandbox::ExecutionResult
 * Purpose: Everything one execution produced, owned by the caller.
 * Inputs: Filled in by Sandbox::execute
 * Outputs:
 *   - Structured fields for programmatic use
 *   - describe(): the same data as a payload map, ready for JSON or text output
 * Theory of Operation:
 *   A failed result still carries whatever was captured before the failure:
 *   console output, call records and game messages. Timeouts give no rollback
 *   guarantee; actions recorded here may already have happened.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/CapabilityProxy.h"
#include "sandbox/Payload.h"
#include "sema/Validator.h"

namespace pybox::sandbox {

enum class FailureKind { None, Validation, Timeout, Runtime, MissingEntryPoint, Internal };

const char* to_string(FailureKind kind);

struct ExecutionResult {
  bool success{false};
  FailureKind failure{FailureKind::None};
  PayloadValue payload{PayloadValue::Map{}};
  std::optional<std::string> error;
  std::string capturedOutput;
  std::chrono::duration<double> elapsed{0.0};
  long long actionsTaken{0};
  long long turnsElapsed{0};
  std::vector<APICallRecord> apiCalls;
  std::vector<std::string> gameMessages;
  std::optional<ExplorationOutcome> exploration;
  sema::ValidationResult validation;

  PayloadValue describe() const;
};

PayloadValue describe(const sema::ValidationResult& validation);
PayloadValue describe(const APICallRecord& call);
PayloadValue describe(const ExplorationOutcome& outcome);

} // namespace pybox::sandbox
