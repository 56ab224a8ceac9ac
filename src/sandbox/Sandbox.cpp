/***
 * Name: pybox::sandbox::Sandbox (impl)
 * Purpose: Validation gate, entry-point adapter, timeout guards and result capture.
 */
#include "sandbox/Sandbox.h"

#include <chrono>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

#include "observability/Log.h"
#include "observability/Metrics.h"
#include "pybox/exceptions/missing_entry_point.h"
#include "pybox/exceptions/pybox_exception.h"
#include "pybox/exceptions/sandbox_error.h"
#include "pybox/exceptions/timeout_failure.h"
#include "runtime/Heap.h"
#include "runtime/Interpreter.h"
#include "runtime/ScriptError.h"
#include "sandbox/CapabilityProxy.h"
#include "sandbox/DomainTypes.h"
#include "sandbox/ImportNeutralizer.h"
#include "sandbox/MessageFilter.h"
#include "sandbox/NamespaceBuilder.h"
#include "sandbox/TimeoutGovernor.h"

namespace pybox::sandbox {

using Clock = std::chrono::steady_clock;
using metrics::Metrics;

namespace {

std::string joinErrors(const std::vector<std::string>& errors) {
  std::string out;
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (i > 0) { out += "; "; }
    out += errors[i];
  }
  return out;
}

std::chrono::microseconds toMicros(std::chrono::duration<double> d) {
  return std::chrono::duration_cast<std::chrono::microseconds>(d);
}

// Calls the fragment's entry point and drives the returned coroutine to completion.
rt::Value runFragment(rt::Interpreter& interp, const ast::Module& program, const CodeSubmission& submission,
                      const sema::ValidationResult& validation, const rt::Value& proxy) {
  interp.execModule(program);

  rt::CallArgs args;
  args.positional.push_back(proxy);
  if (submission.mode == sema::FragmentMode::AdHoc) {
    const rt::Value* wrapper = interp.lookupGlobal(kAdHocEntry);
    if (wrapper == nullptr) { throw exceptions::SandboxError("ad-hoc wrapper was not defined"); }
    return interp.await(interp.call(*wrapper, std::move(args)));
  }

  const std::string name = validation.entryNameFound.value_or(submission.entryName);
  const rt::Value* entry = interp.lookupGlobal(name);
  if (entry == nullptr) { throw exceptions::MissingEntryPoint("Function '" + name + "' not found after execution"); }
  for (const auto& [key, value] : submission.parameters) { args.keywords.emplace_back(key, fromPayload(value)); }
  return interp.await(interp.call(*entry, std::move(args)));
}

// Named-mode payload: a SkillResult is flattened, anything else lands under `result`.
void storeNamedReturn(const rt::Value& returned, ExecutionResult& result) {
  PayloadValue& payload = result.payload;
  const auto* skill = returned.as<SkillResultObj>();
  if (skill == nullptr) {
    payload.set("result", toPayload(returned));
    return;
  }
  const PayloadValue data = toPayload(skill->data());
  if (data.isMap()) {
    for (const auto& [key, value] : data.asMap()) { payload.set(key, value); }
  }
  payload.set("stopped_reason", skill->stoppedReason());
  payload.set("success", skill->success());
  payload.set("data", data);
  payload.set("actions_taken", skill->actionsTaken());
  payload.set("turns_elapsed", skill->turnsElapsed());
  result.actionsTaken = skill->actionsTaken();
  result.turnsElapsed = skill->turnsElapsed();
}

// Side effects captured whether or not the run succeeded.
void storeSideEffects(ExecutionResult& result) {
  PayloadValue& payload = result.payload;
  if (!result.capturedOutput.empty()) { payload.set("stdout", result.capturedOutput); }
  if (!result.gameMessages.empty()) {
    PayloadValue::List messages(result.gameMessages.begin(), result.gameMessages.end());
    payload.set("game_messages", std::move(messages));
  }
  if (!result.apiCalls.empty()) {
    PayloadValue::List calls;
    for (const auto& call : result.apiCalls) { calls.push_back(describe(call)); }
    payload.set("api_calls", std::move(calls));
  }
  if (result.exploration) { payload.set("autoexplore_result", describe(*result.exploration)); }
}

void fail(ExecutionResult& result, FailureKind kind, std::string error) {
  result.success = false;
  result.failure = kind;
  result.error = std::move(error);
}

} // namespace

std::unique_ptr<ast::Module> wrapAdHoc(std::unique_ptr<ast::Module> module) {
  auto wrapper = std::make_unique<ast::FunctionDef>(kAdHocEntry);
  wrapper->isAsync = true;
  ast::Param handle;
  handle.name = kHandleName;
  wrapper->params.push_back(std::move(handle));
  wrapper->body = std::move(module->body);
  wrapper->line = 1;
  wrapper->file = module->file;
  if (wrapper->body.empty()) { wrapper->body.push_back(std::make_unique<ast::PassStmt>()); }

  auto wrapped = std::make_unique<ast::Module>();
  wrapped->file = module->file;
  wrapped->body.push_back(std::move(wrapper));
  return wrapped;
}

Sandbox::Sandbox(SandboxConfig config) : config_(std::move(config)) { config_.check(); }

sema::ValidationResult Sandbox::validate(const std::string& source, sema::FragmentMode mode,
                                         const std::string& entryName) const {
  Metrics::ScopedTimer timer(Metrics::Phase::Validate);
  sema::ValidationResult result = sema::Validator::validate(source, mode, entryName);
  Metrics::Increment(Metrics::kValidations);
  if (result.violation) { Metrics::Increment(Metrics::kViolations); }
  return result;
}

ExecutionResult Sandbox::execute(const CodeSubmission& submission, CapabilityHandle& handle) const {
  ExecutionResult result;
  const auto started = Clock::now();
  const auto finish = [&]() -> ExecutionResult {
    result.elapsed = Clock::now() - started;
    return std::move(result);
  };

  std::unique_ptr<ast::Module> module;
  {
    Metrics::ScopedTimer timer(Metrics::Phase::Validate);
    result.validation = sema::Validator::validate(submission.source, submission.mode, submission.entryName, module);
  }
  Metrics::Increment(Metrics::kValidations);
  if (!result.validation.valid) {
    if (result.validation.violation) { Metrics::Increment(Metrics::kViolations); }
    fail(result, FailureKind::Validation, "Validation failed: " + joinErrors(result.validation.errors));
    log::Log::Warning(*result.error);
    return finish();
  }

  const std::size_t neutralized = neutralizeImports(*module);
  if (neutralized > 0) {
    log::Log::Debug("neutralized " + std::to_string(neutralized) + " import statement(s)");
  }
  std::unique_ptr<ast::Module> program =
      submission.mode == sema::FragmentMode::AdHoc ? wrapAdHoc(std::move(module)) : std::move(module);

  const std::chrono::duration<double> timeout = submission.timeout.value_or(config_.timeout);
  if (!(timeout.count() > 0.0)) {
    fail(result, FailureKind::Internal, "timeout must be a positive number of seconds, got " + formatSeconds(timeout));
    return finish();
  }
  const std::size_t messagesBefore = handle.messageCount();
  Metrics::Increment(Metrics::kExecutions);

  rt::Interpreter interp(rt::InterpreterLimits{config_.maxCallDepth, config_.maxSequenceLength});
  const Deadline deadline(toMicros(timeout));
  auto proxy = rt::make<CapabilityProxy>(handle, &deadline);
  const rt::Value proxyValue(proxy);

  try {
    buildNamespace(interp, proxyValue, config_);
    Metrics::ScopedTimer timer(Metrics::Phase::Execute);
    std::optional<rt::Value> returned;
    {
      AlarmGuard alarm(toMicros(timeout));
      interp.setInterruptFlag(AlarmGuard::flag());
      returned = runFragment(interp, *program, submission, result.validation, proxyValue);
    }
    interp.setInterruptFlag(nullptr);

    result.success = true;
    if (submission.mode == sema::FragmentMode::Named) {
      storeNamedReturn(*returned, result);
    } else if (!returned->isNone()) {
      result.payload.set("return_value", toPayload(*returned));
    }
  } catch (const exceptions::TimeoutFailure& e) {
    Metrics::Increment(Metrics::kTimeouts);
    log::Log::Warning(std::string("timeout: ") + e.what());
    fail(result, FailureKind::Timeout,
         "Code execution timed out after " + formatSeconds(timeout) + " seconds (possible infinite loop)");
  } catch (const exceptions::MissingEntryPoint& e) {
    fail(result, FailureKind::MissingEntryPoint, e.what());
    log::Log::Error(*result.error);
  } catch (const rt::ScriptError& e) {
    Metrics::Increment(Metrics::kRuntimeFailures);
    fail(result, FailureKind::Runtime, e.what());
    log::Log::Error("fragment raised " + *result.error);
  } catch (const exceptions::PyboxException& e) {
    fail(result, FailureKind::Internal, e.what());
    log::Log::Error(*result.error);
  } catch (const std::exception& e) {
    fail(result, FailureKind::Internal, e.what());
    log::Log::Error(*result.error);
  }
  interp.setInterruptFlag(nullptr);

  result.capturedOutput = interp.console();
  result.apiCalls = proxy->calls();
  result.exploration = proxy->exploration();
  result.gameMessages = filterMessages(handle.messagesSince(messagesBefore), handle.currentMessage());
  storeSideEffects(result);
  return finish();
}

} // namespace pybox::sandbox
