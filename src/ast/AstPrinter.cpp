/***
 * Name: pybox::ast::AstPrinter
 * Purpose: Indented AST dump used by --log-ast and parser tests.
 */
#include "ast/AstPrinter.h"

#include <sstream>
#include <string>

#include "ast/Nodes.h"

namespace pybox::ast {

namespace {
const char* unarySymbol(const UnaryOperator op) {
  switch (op) {
    case UnaryOperator::Neg: return "-";
    case UnaryOperator::Pos: return "+";
    case UnaryOperator::Invert: return "~";
    case UnaryOperator::Not: return "not";
  }
  return "?";
}
} // namespace

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::string AstPrinter::describe(const Node& node) {
  std::ostringstream oss;
  oss << to_string(node.kind);
  switch (node.kind) {
    case NodeKind::FunctionDef: {
      const auto& fn = static_cast<const FunctionDef&>(node);
      oss << " name=" << fn.name << " params=" << fn.params.size();
      if (fn.isAsync) { oss << " async"; }
      break;
    }
    case NodeKind::ClassDef: oss << " name=" << static_cast<const ClassDef&>(node).name; break;
    case NodeKind::Name: oss << " id=" << static_cast<const Name&>(node).id; break;
    case NodeKind::Attribute: oss << " attr=" << static_cast<const Attribute&>(node).attr; break;
    case NodeKind::IntLiteral: oss << " value=" << static_cast<const IntLiteral&>(node).value; break;
    case NodeKind::FloatLiteral: oss << " value=" << static_cast<const FloatLiteral&>(node).value; break;
    case NodeKind::StringLiteral: oss << " value=\"" << static_cast<const StringLiteral&>(node).value << "\""; break;
    case NodeKind::BoolLiteral: oss << " value=" << (static_cast<const BoolLiteral&>(node).value ? "True" : "False"); break;
    case NodeKind::BinaryExpr: oss << " op=" << to_symbol(static_cast<const Binary&>(node).op); break;
    case NodeKind::UnaryExpr: oss << " op=" << unarySymbol(static_cast<const Unary&>(node).op); break;
    case NodeKind::AugAssignStmt: oss << " op=" << to_symbol(static_cast<const AugAssignStmt&>(node).op) << "="; break;
    case NodeKind::Compare: {
      const auto& cmp = static_cast<const Compare&>(node);
      oss << " ops=";
      for (std::size_t i = 0; i < cmp.ops.size(); ++i) { oss << (i ? "," : "") << to_symbol(cmp.ops[i]); }
      break;
    }
    case NodeKind::ForStmt: if (static_cast<const ForStmt&>(node).isAsync) { oss << " async"; } break;
    case NodeKind::ExceptHandler: {
      const auto& h = static_cast<const ExceptHandler&>(node);
      if (!h.name.empty()) { oss << " as=" << h.name; }
      break;
    }
    case NodeKind::Import: {
      for (const auto& a : static_cast<const Import&>(node).names) { oss << " " << a.name; }
      break;
    }
    case NodeKind::ImportFrom: {
      const auto& imp = static_cast<const ImportFrom&>(node);
      oss << " module=" << std::string(static_cast<std::size_t>(imp.level), '.') << imp.module;
      break;
    }
    default: break;
  }
  if (node.line > 0) { oss << " @" << node.line << ":" << node.col; }
  return oss.str();
}

void AstPrinter::walk(const Node* node) {
  if (node == nullptr) { return; }
  out_ << std::string(static_cast<std::size_t>(depth_) * 2, ' ') << describe(*node) << '\n';
  ++depth_;
  TreeWalker::walk(node);
  --depth_;
}

std::string dump(const Node& root) {
  std::ostringstream oss;
  AstPrinter printer(oss);
  printer.print(root);
  return oss.str();
}

} // namespace pybox::ast
