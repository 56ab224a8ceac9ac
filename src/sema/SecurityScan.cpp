/***
 * Name: pybox::sema::SecurityScan (impl)
 * Purpose: Import, call, attribute and subscript checks.
 */
#include "sema/SecurityScan.h"

#include <algorithm>
#include <string>

#include "pybox/exceptions/security_violation.h"
#include "sandbox/ActionCatalog.h"
#include "sema/SecurityPolicy.h"

namespace pybox::sema {

using exceptions::SecurityViolation;
using exceptions::ViolationCategory;

namespace {

std::string lineSuffix(int line) { return " (line " + std::to_string(line) + ")"; }

} // namespace

void SecurityScan::checkModule(const std::string& shown, const std::string& module, int line) {
  switch (classifyImport(module)) {
    case ImportVerdict::Allowed:
      return;
    case ImportVerdict::Forbidden:
      throw SecurityViolation(ViolationCategory::Import,
                              "Forbidden import: '" + shown + "'" + lineSuffix(line), line);
    case ImportVerdict::Unknown:
      warnings_.push_back("Unknown import: '" + shown + "' may not be available" + lineSuffix(line));
      return;
  }
}

void SecurityScan::visit(const ast::Import& n) {
  for (const auto& alias : n.names) {
    checkModule(alias.name, alias.name, n.line);
  }
}

void SecurityScan::visit(const ast::ImportFrom& n) {
  if (n.module.empty()) return;
  checkModule("from " + n.module, n.module, n.line);
}

void SecurityScan::visit(const ast::Call& n) {
  if (n.callee->kind == ast::NodeKind::Name) {
    const auto& id = static_cast<const ast::Name&>(*n.callee).id;
    if (isForbiddenCall(id)) {
      throw SecurityViolation(ViolationCategory::Call,
                              "Forbidden function call: '" + id + "()'" + lineSuffix(n.line), n.line);
    }
  } else if (n.callee->kind == ast::NodeKind::Attribute) {
    const auto& attr = static_cast<const ast::Attribute&>(*n.callee).attr;
    if (isForbiddenMethod(attr)) {
      throw SecurityViolation(ViolationCategory::Call,
                              "Forbidden method call: '." + attr + "()'" + lineSuffix(n.line), n.line);
    }
    if (sandbox::isActionMethod(attr) && std::find(actions_.begin(), actions_.end(), attr) == actions_.end()) {
      actions_.push_back(attr);
    }
  }
  ast::TreeWalker::visit(n);
}

void SecurityScan::visit(const ast::Attribute& n) {
  if (isForbiddenAttribute(n.attr)) {
    throw SecurityViolation(ViolationCategory::Attribute,
                            "Forbidden attribute access: '." + n.attr + "'" + lineSuffix(n.line), n.line);
  }
  ast::TreeWalker::visit(n);
}

void SecurityScan::visit(const ast::Subscript& n) {
  if (n.slice && n.slice->kind == ast::NodeKind::StringLiteral) {
    const auto& key = static_cast<const ast::StringLiteral&>(*n.slice).value;
    if (isForbiddenAttribute(key)) {
      throw SecurityViolation(ViolationCategory::Subscript,
                              "Forbidden subscript access: '['" + key + "']'" + lineSuffix(n.line), n.line);
    }
  }
  ast::TreeWalker::visit(n);
}

} // namespace pybox::sema
