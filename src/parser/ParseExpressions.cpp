/***
 * Name: pybox::parse::Parser (expressions)
 * Purpose: Expression grammar from lambda down to atoms, plus target checks.
 * Theory of Operation:
 *   One method per precedence level. Binary levels loop left-associatively;
 *   power and unary recurse right. Every recursive entry takes a DepthGuard.
 */
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "parser/Parser.h"
#include "pybox/exceptions/parse_error.h"

namespace pybox::parse {

using TK = lex::TokenKind;
using BO = ast::BinaryOperator;

namespace {

template <typename T>
std::unique_ptr<T> at(std::unique_ptr<T> node, const ast::Node& where) {
  node->line = where.line;
  node->col = where.col;
  node->file = where.file;
  return node;
}

} // namespace

bool Parser::startsExpression(TK kind) {
  switch (kind) {
    case TK::Ident: case TK::Int: case TK::Float: case TK::Imag:
    case TK::String: case TK::Bytes: case TK::NoneLit: case TK::BoolLit:
    case TK::Ellipsis: case TK::LParen: case TK::LBracket: case TK::LBrace:
    case TK::Minus: case TK::Plus: case TK::Tilde: case TK::Not:
    case TK::Lambda: case TK::Await: case TK::Star:
      return true;
    default:
      return false;
  }
}

bool Parser::atAsyncFor() const {
  return peek().kind == TK::For || (peek().kind == TK::Async && peekNext().kind == TK::For);
}

std::unique_ptr<ast::Expr> Parser::parseTestList(bool allowStar) {
  const lex::Token startTok = peek();
  auto first = allowStar ? parseStarOrTest(false) : parseExpr();
  if (peek().kind != TK::Comma) return first;
  auto tuple = stamp(std::make_unique<ast::TupleLiteral>(), startTok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpression(peek().kind)) break;
    tuple->elements.push_back(allowStar ? parseStarOrTest(false) : parseExpr());
  }
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseStarOrTest(bool allowNamed) {
  if (peek().kind == TK::Star) {
    const lex::Token tok = get();
    DepthGuard guard(*this);
    return stamp(std::make_unique<ast::Starred>(parseBitwiseOr()), tok);
  }
  return allowNamed ? parseNamedExprTest() : parseExpr();
}

std::unique_ptr<ast::Expr> Parser::parseNamedExprTest() {
  if (peek().kind == TK::Ident && peekNext().kind == TK::ColonEqual) {
    const lex::Token nameTok = get();
    (void)get();
    auto node = stamp(std::make_unique<ast::NamedExpr>(), nameTok);
    auto target = stamp(std::make_unique<ast::Name>(nameTok.text), nameTok);
    target->ctx = ast::ExprContext::Store;
    node->target = std::move(target);
    node->value = parseExpr();
    return node;
  }
  return parseExpr();
}

std::unique_ptr<ast::Expr> Parser::parseExpr() {
  DepthGuard guard(*this);
  if (peek().kind == TK::Lambda) return parseLambda();
  auto body = parseLogicalOr();
  if (peek().kind != TK::If) return body;
  const lex::Token ifTok = get();
  auto node = stamp(std::make_unique<ast::IfExpr>(), ifTok);
  node->line = body->line;
  node->col = body->col;
  node->body = std::move(body);
  node->test = parseLogicalOr();
  (void)expect(TK::Else, "'else' after conditional expression");
  node->orelse = parseExpr();
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseLambda() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::LambdaExpr>(), tok);
  parseParamList(node->params, TK::Colon, false);
  (void)expect(TK::Colon, "':'");
  node->body = parseExpr();
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalOr() {
  auto lhs = parseLogicalAnd();
  ChainGuard chain(*this);
  while (peek().kind == TK::Or) {
    chain.extend();
    const lex::Token tok = get();
    auto rhs = parseLogicalAnd();
    lhs = stamp(std::make_unique<ast::Binary>(BO::Or, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalAnd() {
  auto lhs = parseLogicalNot();
  ChainGuard chain(*this);
  while (peek().kind == TK::And) {
    chain.extend();
    const lex::Token tok = get();
    auto rhs = parseLogicalNot();
    lhs = stamp(std::make_unique<ast::Binary>(BO::And, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalNot() {
  if (peek().kind == TK::Not) {
    const lex::Token tok = get();
    DepthGuard guard(*this);
    return stamp(std::make_unique<ast::Unary>(ast::UnaryOperator::Not, parseLogicalNot()), tok);
  }
  return parseComparison();
}

std::unique_ptr<ast::Expr> Parser::parseComparison() {
  auto left = parseBitwiseOr();
  std::unique_ptr<ast::Compare> cmp;
  ChainGuard chain(*this);
  for (;;) {
    BO op{};
    switch (peek().kind) {
      case TK::EqEq: op = BO::Eq; break;
      case TK::NotEq: op = BO::Ne; break;
      case TK::Lt: op = BO::Lt; break;
      case TK::Le: op = BO::Le; break;
      case TK::Gt: op = BO::Gt; break;
      case TK::Ge: op = BO::Ge; break;
      case TK::In: op = BO::In; break;
      case TK::Is: op = BO::Is; break;
      case TK::Not:
        if (peekNext().kind == TK::In) { op = BO::NotIn; break; }
        [[fallthrough]];
      default:
        if (cmp) return cmp;
        return left;
    }
    chain.extend();
    (void)get();
    if (op == BO::NotIn) (void)get();
    if (op == BO::Is && match(TK::Not)) op = BO::IsNot;
    if (!cmp) {
      cmp = at(std::make_unique<ast::Compare>(), *left);
      cmp->left = std::move(left);
    }
    cmp->ops.push_back(op);
    cmp->comparators.push_back(parseBitwiseOr());
  }
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseOr() {
  auto lhs = parseBitwiseXor();
  ChainGuard chain(*this);
  while (peek().kind == TK::Pipe) {
    chain.extend();
    const lex::Token tok = get();
    auto rhs = parseBitwiseXor();
    lhs = stamp(std::make_unique<ast::Binary>(BO::BitOr, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseXor() {
  auto lhs = parseBitwiseAnd();
  ChainGuard chain(*this);
  while (peek().kind == TK::Caret) {
    chain.extend();
    const lex::Token tok = get();
    auto rhs = parseBitwiseAnd();
    lhs = stamp(std::make_unique<ast::Binary>(BO::BitXor, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseAnd() {
  auto lhs = parseShift();
  ChainGuard chain(*this);
  while (peek().kind == TK::Amp) {
    chain.extend();
    const lex::Token tok = get();
    auto rhs = parseShift();
    lhs = stamp(std::make_unique<ast::Binary>(BO::BitAnd, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseShift() {
  auto lhs = parseAdditive();
  ChainGuard chain(*this);
  while (peek().kind == TK::LShift || peek().kind == TK::RShift) {
    chain.extend();
    const lex::Token tok = get();
    const BO op = tok.kind == TK::LShift ? BO::LShift : BO::RShift;
    auto rhs = parseAdditive();
    lhs = stamp(std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseAdditive() {
  auto lhs = parseMultiplicative();
  ChainGuard chain(*this);
  while (peek().kind == TK::Plus || peek().kind == TK::Minus) {
    chain.extend();
    const lex::Token tok = get();
    const BO op = tok.kind == TK::Plus ? BO::Add : BO::Sub;
    auto rhs = parseMultiplicative();
    lhs = stamp(std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseMultiplicative() {
  auto lhs = parseUnary();
  ChainGuard chain(*this);
  for (;;) {
    BO op{};
    switch (peek().kind) {
      case TK::Star: op = BO::Mul; break;
      case TK::Slash: op = BO::Div; break;
      case TK::SlashSlash: op = BO::FloorDiv; break;
      case TK::Percent: op = BO::Mod; break;
      case TK::At: op = BO::MatMul; break;
      default: return lhs;
    }
    chain.extend();
    const lex::Token tok = get();
    auto rhs = parseUnary();
    lhs = stamp(std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs)), tok);
  }
}

std::unique_ptr<ast::Expr> Parser::parseUnary() {
  ast::UnaryOperator op{};
  switch (peek().kind) {
    case TK::Minus: op = ast::UnaryOperator::Neg; break;
    case TK::Plus: op = ast::UnaryOperator::Pos; break;
    case TK::Tilde: op = ast::UnaryOperator::Invert; break;
    default: return parsePower();
  }
  const lex::Token tok = get();
  DepthGuard guard(*this);
  return stamp(std::make_unique<ast::Unary>(op, parseUnary()), tok);
}

std::unique_ptr<ast::Expr> Parser::parsePower() {
  std::unique_ptr<ast::Expr> base;
  if (peek().kind == TK::Await) {
    const lex::Token tok = get();
    DepthGuard guard(*this);
    auto aw = stamp(std::make_unique<ast::AwaitExpr>(), tok);
    aw->value = parsePostfix(parseAtom());
    base = std::move(aw);
  } else {
    base = parsePostfix(parseAtom());
  }
  if (peek().kind == TK::StarStar) {
    const lex::Token tok = get();
    DepthGuard guard(*this);
    auto rhs = parseUnary();
    return stamp(std::make_unique<ast::Binary>(BO::Pow, std::move(base), std::move(rhs)), tok);
  }
  return base;
}

std::unique_ptr<ast::Expr> Parser::parsePostfix(std::unique_ptr<ast::Expr> base) {
  ChainGuard chain(*this);
  for (;;) {
    if (peek().kind == TK::LParen) {
      (void)get();
      chain.extend();
      DepthGuard guard(*this);
      const ast::Node& where = *base;
      auto call = at(std::make_unique<ast::Call>(nullptr), where);
      call->callee = std::move(base);
      parseCallArgs(*call);
      base = std::move(call);
    } else if (peek().kind == TK::LBracket) {
      (void)get();
      chain.extend();
      DepthGuard guard(*this);
      auto slice = parseSubscriptList();
      (void)expect(TK::RBracket, "']'");
      const ast::Node& where = *base;
      auto sub = at(std::make_unique<ast::Subscript>(nullptr, std::move(slice)), where);
      sub->value = std::move(base);
      base = std::move(sub);
    } else if (peek().kind == TK::Dot) {
      (void)get();
      chain.extend();
      const lex::Token nameTok = expect(TK::Ident, "attribute name");
      const ast::Node& where = *base;
      auto attr = at(std::make_unique<ast::Attribute>(nullptr, nameTok.text), where);
      attr->value = std::move(base);
      base = std::move(attr);
    } else {
      return base;
    }
  }
}

void Parser::parseCallArgs(ast::Call& call) {
  bool sawKeyword = false;
  bool sawKwUnpack = false;
  std::set<std::string> keywordNames;
  while (peek().kind != TK::RParen) {
    const lex::Token tok = peek();
    if (match(TK::StarStar)) {
      call.keywords.push_back(ast::KeywordArg{"", parseExpr()});
      sawKwUnpack = true;
    } else if (match(TK::Star)) {
      if (sawKwUnpack) fail(tok, "iterable argument unpacking follows keyword argument unpacking");
      call.args.push_back(stamp(std::make_unique<ast::Starred>(parseExpr()), tok));
    } else if (tok.kind == TK::Ident && peekNext().kind == TK::Equal) {
      (void)get();
      (void)get();
      if (!keywordNames.insert(tok.text).second) {
        fail(tok, "keyword argument repeated: " + tok.text);
      }
      call.keywords.push_back(ast::KeywordArg{tok.text, parseExpr()});
      sawKeyword = true;
    } else {
      if (sawKwUnpack) fail(tok, "positional argument follows keyword argument unpacking");
      if (sawKeyword) fail(tok, "positional argument follows keyword argument");
      auto arg = parseNamedExprTest();
      if (atAsyncFor()) {
        auto gen = at(std::make_unique<ast::GeneratorExpr>(), *arg);
        gen->elt = std::move(arg);
        gen->fors = parseComprehensionFors();
        if (!call.args.empty() || !call.keywords.empty() || peek().kind != TK::RParen) {
          fail(tok, "Generator expression must be parenthesized");
        }
        call.args.push_back(std::move(gen));
        break;
      }
      call.args.push_back(std::move(arg));
    }
    if (!match(TK::Comma)) break;
  }
  (void)expect(TK::RParen, "')'");
}

std::unique_ptr<ast::Expr> Parser::parseSubscriptList() {
  const lex::Token startTok = peek();
  auto first = parseSubscriptItem();
  if (peek().kind != TK::Comma) return first;
  auto tuple = stamp(std::make_unique<ast::TupleLiteral>(), startTok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) break;
    tuple->elements.push_back(parseSubscriptItem());
  }
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseSubscriptItem() {
  const lex::Token tok = peek();
  std::unique_ptr<ast::Expr> lower;
  if (tok.kind != TK::Colon) {
    lower = parseStarOrTest(true);
    if (peek().kind != TK::Colon) return lower;
  }
  auto slice = stamp(std::make_unique<ast::Slice>(), tok);
  slice->lower = std::move(lower);
  (void)get(); // ':'
  auto ends = [this]() {
    const auto k = peek().kind;
    return k == TK::Colon || k == TK::RBracket || k == TK::Comma;
  };
  if (!ends()) slice->upper = parseExpr();
  if (match(TK::Colon)) {
    if (!ends()) slice->step = parseExpr();
  }
  return slice;
}

std::vector<ast::ComprehensionFor> Parser::parseComprehensionFors() {
  std::vector<ast::ComprehensionFor> fors;
  while (atAsyncFor()) {
    ast::ComprehensionFor cf;
    cf.isAsync = match(TK::Async);
    (void)expect(TK::For, "'for'");
    cf.target = parseTargetList();
    (void)expect(TK::In, "'in'");
    cf.iter = parseLogicalOr();
    while (match(TK::If)) {
      cf.ifs.push_back(parseLogicalOr());
    }
    fors.push_back(std::move(cf));
  }
  return fors;
}

std::unique_ptr<ast::Expr> Parser::parseTargetList() {
  const lex::Token startTok = peek();
  auto parseOne = [this]() -> std::unique_ptr<ast::Expr> {
    if (peek().kind == TK::Star) {
      const lex::Token tok = get();
      return stamp(std::make_unique<ast::Starred>(parseBitwiseOr()), tok);
    }
    return parseBitwiseOr();
  };
  auto first = parseOne();
  if (peek().kind == TK::Comma) {
    auto tuple = stamp(std::make_unique<ast::TupleLiteral>(), startTok);
    tuple->elements.push_back(std::move(first));
    while (match(TK::Comma)) {
      if (peek().kind == TK::In || peek().kind == TK::Equal || !startsExpression(peek().kind)) break;
      tuple->elements.push_back(parseOne());
    }
    first = std::move(tuple);
  }
  setTargetContext(first.get(), ast::ExprContext::Store);
  return first;
}

std::unique_ptr<ast::Expr> Parser::parseYieldExpr() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::YieldExpr>(), tok);
  if (match(TK::From)) {
    node->isFrom = true;
    node->value = parseExpr();
  } else if (startsExpression(peek().kind)) {
    node->value = parseTestList(true);
  }
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseAtom() {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Ident:
      (void)get();
      return stamp(std::make_unique<ast::Name>(tok.text), tok);
    case TK::Int:
    case TK::Float:
    case TK::Imag:
      (void)get();
      return parseNumber(tok);
    case TK::String:
    case TK::Bytes:
      return parseStrings();
    case TK::NoneLit:
      (void)get();
      return stamp(std::make_unique<ast::NoneLiteral>(), tok);
    case TK::BoolLit:
      (void)get();
      return stamp(std::make_unique<ast::BoolLiteral>(tok.text == "True"), tok);
    case TK::Ellipsis:
      (void)get();
      return stamp(std::make_unique<ast::EllipsisLiteral>(), tok);
    case TK::LParen: {
      (void)get();
      DepthGuard guard(*this);
      return parseParenthesized(tok);
    }
    case TK::LBracket: {
      (void)get();
      DepthGuard guard(*this);
      return parseListDisplay(tok);
    }
    case TK::LBrace: {
      (void)get();
      DepthGuard guard(*this);
      return parseDictOrSetDisplay(tok);
    }
    default:
      failHere("invalid syntax");
  }
}

std::unique_ptr<ast::Expr> Parser::parseParenthesized(const lex::Token& openTok) {
  if (match(TK::RParen)) return stamp(std::make_unique<ast::TupleLiteral>(), openTok);
  if (peek().kind == TK::Yield) {
    auto y = parseYieldExpr();
    (void)expect(TK::RParen, "')'");
    return y;
  }
  auto first = parseStarOrTest(true);
  if (atAsyncFor()) {
    auto gen = stamp(std::make_unique<ast::GeneratorExpr>(), openTok);
    gen->elt = std::move(first);
    gen->fors = parseComprehensionFors();
    (void)expect(TK::RParen, "')'");
    return gen;
  }
  if (peek().kind != TK::Comma) {
    if (first->kind == ast::NodeKind::Starred) failHere("cannot use starred expression here");
    (void)expect(TK::RParen, "')'");
    return first;
  }
  auto tuple = stamp(std::make_unique<ast::TupleLiteral>(), openTok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RParen) break;
    tuple->elements.push_back(parseStarOrTest(true));
  }
  (void)expect(TK::RParen, "')'");
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseListDisplay(const lex::Token& openTok) {
  auto list = stamp(std::make_unique<ast::ListLiteral>(), openTok);
  if (match(TK::RBracket)) return list;
  auto first = parseStarOrTest(true);
  if (atAsyncFor()) {
    auto comp = stamp(std::make_unique<ast::ListComp>(), openTok);
    comp->elt = std::move(first);
    comp->fors = parseComprehensionFors();
    (void)expect(TK::RBracket, "']'");
    return comp;
  }
  list->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) break;
    list->elements.push_back(parseStarOrTest(true));
  }
  (void)expect(TK::RBracket, "']'");
  return list;
}

std::unique_ptr<ast::Expr> Parser::parseDictOrSetDisplay(const lex::Token& openTok) {
  if (match(TK::RBrace)) return stamp(std::make_unique<ast::DictLiteral>(), openTok);

  auto dictEntries = [this](ast::DictLiteral& dict) {
    while (match(TK::Comma)) {
      if (peek().kind == TK::RBrace) break;
      if (match(TK::StarStar)) {
        dict.keys.push_back(nullptr);
        dict.values.push_back(parseBitwiseOr());
        continue;
      }
      dict.keys.push_back(parseExpr());
      (void)expect(TK::Colon, "':'");
      dict.values.push_back(parseExpr());
    }
    (void)expect(TK::RBrace, "'}'");
  };

  if (match(TK::StarStar)) {
    auto dict = stamp(std::make_unique<ast::DictLiteral>(), openTok);
    dict->keys.push_back(nullptr);
    dict->values.push_back(parseBitwiseOr());
    dictEntries(*dict);
    return dict;
  }

  auto first = parseStarOrTest(true);
  if (match(TK::Colon)) {
    auto value = parseExpr();
    if (atAsyncFor()) {
      auto comp = stamp(std::make_unique<ast::DictComp>(), openTok);
      comp->key = std::move(first);
      comp->value = std::move(value);
      comp->fors = parseComprehensionFors();
      (void)expect(TK::RBrace, "'}'");
      return comp;
    }
    auto dict = stamp(std::make_unique<ast::DictLiteral>(), openTok);
    dict->keys.push_back(std::move(first));
    dict->values.push_back(std::move(value));
    dictEntries(*dict);
    return dict;
  }

  if (atAsyncFor()) {
    auto comp = stamp(std::make_unique<ast::SetComp>(), openTok);
    comp->elt = std::move(first);
    comp->fors = parseComprehensionFors();
    (void)expect(TK::RBrace, "'}'");
    return comp;
  }
  auto set = stamp(std::make_unique<ast::SetLiteral>(), openTok);
  set->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBrace) break;
    set->elements.push_back(parseStarOrTest(true));
  }
  (void)expect(TK::RBrace, "'}'");
  return set;
}

// ---------------------------------------------------------------------------
// Targets

void Parser::setTargetContext(ast::Expr* e, ast::ExprContext ctx) const {
  switch (e->kind) {
    case ast::NodeKind::Name:
      static_cast<ast::Name*>(e)->ctx = ctx;
      return;
    case ast::NodeKind::Attribute:
      static_cast<ast::Attribute*>(e)->ctx = ctx;
      return;
    case ast::NodeKind::Subscript:
      static_cast<ast::Subscript*>(e)->ctx = ctx;
      return;
    case ast::NodeKind::TupleLiteral:
    case ast::NodeKind::ListLiteral: {
      auto& elements = e->kind == ast::NodeKind::TupleLiteral
                           ? static_cast<ast::TupleLiteral*>(e)->elements
                           : static_cast<ast::ListLiteral*>(e)->elements;
      if (e->kind == ast::NodeKind::TupleLiteral) {
        static_cast<ast::TupleLiteral*>(e)->ctx = ctx;
      } else {
        static_cast<ast::ListLiteral*>(e)->ctx = ctx;
      }
      int starred = 0;
      for (auto& el : elements) {
        if (el->kind == ast::NodeKind::Starred && ++starred > 1) {
          throw exceptions::ParseError("multiple starred expressions in assignment", el->line, el->col);
        }
        setTargetContext(el.get(), ctx);
      }
      return;
    }
    case ast::NodeKind::Starred: {
      if (ctx == ast::ExprContext::Del) {
        throw exceptions::ParseError("cannot delete starred", e->line, e->col);
      }
      auto* st = static_cast<ast::Starred*>(e);
      st->ctx = ctx;
      setTargetContext(st->value.get(), ctx);
      return;
    }
    default: {
      const std::string verb = ctx == ast::ExprContext::Del ? "cannot delete " : "cannot assign to ";
      throw exceptions::ParseError(verb + describeInvalidTarget(e), e->line, e->col);
    }
  }
}

const char* Parser::describeInvalidTarget(const ast::Expr* e) {
  switch (e->kind) {
    case ast::NodeKind::IntLiteral:
    case ast::NodeKind::FloatLiteral:
    case ast::NodeKind::ImagLiteral:
    case ast::NodeKind::StringLiteral:
    case ast::NodeKind::BytesLiteral:
      return "literal";
    case ast::NodeKind::BoolLiteral:
      return static_cast<const ast::BoolLiteral*>(e)->value ? "True" : "False";
    case ast::NodeKind::NoneLiteral: return "None";
    case ast::NodeKind::EllipsisLiteral: return "ellipsis";
    case ast::NodeKind::FStringLiteral: return "f-string expression";
    case ast::NodeKind::Call: return "function call";
    case ast::NodeKind::Compare: return "comparison";
    case ast::NodeKind::IfExpr: return "conditional expression";
    case ast::NodeKind::LambdaExpr: return "lambda";
    case ast::NodeKind::NamedExpr: return "named expression";
    case ast::NodeKind::AwaitExpr: return "await expression";
    case ast::NodeKind::YieldExpr: return "yield expression";
    case ast::NodeKind::DictLiteral: return "dict literal";
    case ast::NodeKind::SetLiteral: return "set display";
    case ast::NodeKind::ListComp: return "list comprehension";
    case ast::NodeKind::SetComp: return "set comprehension";
    case ast::NodeKind::DictComp: return "dict comprehension";
    case ast::NodeKind::GeneratorExpr: return "generator expression";
    default: return "expression";
  }
}

} // namespace pybox::parse
