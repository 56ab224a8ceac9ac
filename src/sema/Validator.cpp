/***
 * Name: pybox::sema::Validator (impl)
 * Purpose: Run syntax, security and signature stages and fill ValidationResult.
 */
#include "sema/Validator.h"

#include <string>
#include <utility>

#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pybox/exceptions/parse_error.h"
#include "sema/SecurityScan.h"

namespace pybox::sema {

std::unique_ptr<ast::Module> validateSyntax(const std::string& source, const std::string& name) {
  lex::Lexer lexer;
  lexer.pushString(source, name);
  parse::Parser parser(lexer);
  return parser.parseModule();
}

std::vector<std::string> validateSecurity(const ast::Module& mod) {
  SecurityScan scan;
  scan.run(mod);
  return scan.warnings();
}

EntryPointMatch validateSignature(const ast::Module& mod, const std::string& entryName) {
  return findEntryPoint(mod, entryName);
}

ValidationResult Validator::validate(const std::string& source, FragmentMode mode, const std::string& entryName) {
  std::unique_ptr<ast::Module> parsed;
  return validate(source, mode, entryName, parsed);
}

ValidationResult Validator::validate(const std::string& source, FragmentMode mode, const std::string& entryName,
                                     std::unique_ptr<ast::Module>& parsed) {
  ValidationResult result;
  try {
    parsed = validateSyntax(source);
  } catch (const exceptions::ParseError& e) {
    result.valid = false;
    result.errorKind = ValidationErrorKind::Syntax;
    result.syntaxLine = e.line();
    result.syntaxColumn = e.col();
    result.errors.push_back("Syntax error at line " + std::to_string(e.line()) + ", column " +
                            std::to_string(e.col()) + ": " + e.what());
    return result;
  }

  SecurityScan scan;
  try {
    scan.run(*parsed);
  } catch (const exceptions::SecurityViolation& v) {
    result.valid = false;
    result.errorKind = ValidationErrorKind::Security;
    result.warnings = scan.warnings();
    result.violation = ViolationInfo{v.category(), v.detail(), v.line()};
    result.errors.push_back("Security violation: " + v.detail());
    return result;
  }
  result.warnings = scan.warnings();
  result.actionsReferenced = scan.actionsReferenced();

  if (mode == FragmentMode::AdHoc) return result;

  const EntryPointMatch match = validateSignature(*parsed, entryName);
  if (!match.ok) {
    result.valid = false;
    result.errorKind = ValidationErrorKind::MissingEntryPoint;
    result.errors.emplace_back(kSignatureHint);
    return result;
  }
  result.entryNameFound = match.name;
  result.signatureOk = true;
  return result;
}

} // namespace pybox::sema
