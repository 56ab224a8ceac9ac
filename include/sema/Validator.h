/***
 * Name: pybox::sema::Validator
 * Purpose: Decide whether a fragment may run, without ever executing it.
 * Inputs:
 *   - source text, fragment mode, expected entry name (named mode)
 * Outputs:
 *   - ValidationResult
 * Theory of Operation:
 *   Three stages, each of which can end validation: syntax (parse), security
 *   (SecurityScan, first violation aborts) and, in named mode only, the
 *   signature scan. The stage functions are public so callers can run a
 *   single stage; they throw ParseError / SecurityViolation or return data.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ast/Nodes.h"
#include "pybox/exceptions/security_violation.h"
#include "sema/FragmentMode.h"
#include "sema/SignatureScan.h"

namespace pybox::sema {

enum class ValidationErrorKind { None, Syntax, Security, MissingEntryPoint };

struct ViolationInfo {
  exceptions::ViolationCategory category{exceptions::ViolationCategory::Import};
  std::string detail;
  int line{0};
};

struct ValidationResult {
  bool valid{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  std::optional<std::string> entryNameFound;
  bool signatureOk{false};
  ValidationErrorKind errorKind{ValidationErrorKind::None};
  std::optional<ViolationInfo> violation;
  int syntaxLine{0};
  int syntaxColumn{0};
  std::vector<std::string> actionsReferenced;
};

// Parse the fragment; throws exceptions::ParseError.
std::unique_ptr<ast::Module> validateSyntax(const std::string& source, const std::string& name = "<fragment>");

// Security walk; throws exceptions::SecurityViolation, returns warnings.
std::vector<std::string> validateSecurity(const ast::Module& mod);

EntryPointMatch validateSignature(const ast::Module& mod, const std::string& entryName);

class Validator {
 public:
  static constexpr const char* kSignatureHint =
      "Skill must define an async function with signature: "
      "async def skill_name(nh, **params) -> SkillResult";

  static ValidationResult validate(const std::string& source, FragmentMode mode,
                                   const std::string& entryName = "");

  // Same as validate, also handing back the parsed module when it parsed.
  static ValidationResult validate(const std::string& source, FragmentMode mode,
                                   const std::string& entryName, std::unique_ptr<ast::Module>& parsed);
};

} // namespace pybox::sema
