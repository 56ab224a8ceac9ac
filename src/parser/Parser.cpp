/***
 * Name: pybox::parse::Parser (impl)
 * Purpose: Token buffer handling and statement grammar.
 */
#include "parser/Parser.h"

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "pybox/exceptions/parse_error.h"

namespace pybox::parse {

using TK = lex::TokenKind;

Parser::DepthGuard::DepthGuard(Parser& p) : parser(p) {
  if (parser.depth_ >= kMaxNesting) {
    parser.failHere("too many nested parentheses or blocks");
  }
  ++parser.depth_;
}

void Parser::ChainGuard::extend() {
  if (parser.chainDepth_ >= kMaxChain) {
    parser.failHere("expression too long");
  }
  ++parser.chainDepth_;
  ++count;
}

void Parser::initBuffer() {
  if (initialized_) return;
  if (auto* lx = dynamic_cast<lex::Lexer*>(&ts_)) {
    tokens_ = lx->tokens();
  } else {
    tokens_.clear();
    for (;;) {
      auto t = ts_.next();
      tokens_.push_back(t);
      if (t.kind == TK::End) break;
    }
  }
  if (tokens_.empty() || tokens_.back().kind != TK::End) {
    lex::Token end;
    end.kind = TK::End;
    if (!tokens_.empty()) {
      end.file = tokens_.back().file;
      end.line = tokens_.back().line;
    }
    tokens_.push_back(end);
  }
  pos_ = 0;
  initialized_ = true;
}

const lex::Token& Parser::peek() const {
  return tokens_[pos_ < tokens_.size() ? pos_ : (tokens_.size() - 1)];
}

const lex::Token& Parser::peekNext() const {
  const std::size_t idx = pos_ + 1;
  return tokens_[idx < tokens_.size() ? idx : (tokens_.size() - 1)];
}

lex::Token Parser::get() {
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

bool Parser::match(TK tokenKind) {
  if (peek().kind == tokenKind) { (void)get(); return true; }
  return false;
}

lex::Token Parser::expect(TK tokenKind, const char* msg) {
  if (peek().kind != tokenKind) {
    failHere(std::string("expected ") + msg);
  }
  return get();
}

void Parser::fail(const lex::Token& tok, const std::string& msg) const {
  std::string text = msg;
  if (tok.kind == TK::Error) {
    text = tok.text;
  } else if (tok.kind == TK::Indent) {
    text = "unexpected indent";
  } else if (tok.kind == TK::Dedent) {
    text = "unindent does not match any outer indentation level";
  } else if (tok.kind == TK::End && msg == "invalid syntax") {
    text = "unexpected EOF while parsing";
  }
  throw exceptions::ParseError(text, tok.line + lineOffset_, tok.col);
}

std::unique_ptr<ast::Module> Parser::parseModule() {
  initBuffer();
  auto mod = std::make_unique<ast::Module>();
  mod->file = tokens_.front().file;
  mod->line = 1;
  mod->col = 1;
  while (peek().kind != TK::End) {
    if (match(TK::Newline)) continue;
    parseStatementInto(mod->body);
  }
  return mod;
}

std::unique_ptr<ast::Expr> Parser::parseStandaloneExpr() {
  initBuffer();
  auto e = parseTestList(true);
  while (match(TK::Newline)) {}
  if (peek().kind != TK::End) {
    failHere("invalid syntax");
  }
  return e;
}

// ---------------------------------------------------------------------------
// Statements

void Parser::parseStatementInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  DepthGuard guard(*this);
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::If: out.push_back(parseIfStmt()); return;
    case TK::While: out.push_back(parseWhileStmt()); return;
    case TK::For: (void)get(); out.push_back(parseForStmt(false, tok)); return;
    case TK::Try: out.push_back(parseTryStmt()); return;
    case TK::With: (void)get(); out.push_back(parseWithStmt(false, tok)); return;
    case TK::Def: (void)get(); out.push_back(parseFunction(false, tok)); return;
    case TK::Class: out.push_back(parseClass()); return;
    case TK::At: {
      auto decorators = parseDecorators();
      const lex::Token defTok = peek();
      if (defTok.kind == TK::Def) {
        (void)get();
        auto fn = parseFunction(false, defTok);
        fn->decorators = std::move(decorators);
        out.push_back(std::move(fn));
      } else if (defTok.kind == TK::Async && peekNext().kind == TK::Def) {
        (void)get();
        (void)get();
        auto fn = parseFunction(true, defTok);
        fn->decorators = std::move(decorators);
        out.push_back(std::move(fn));
      } else if (defTok.kind == TK::Class) {
        auto cls = parseClass();
        cls->decorators = std::move(decorators);
        out.push_back(std::move(cls));
      } else {
        failHere("invalid syntax");
      }
      return;
    }
    case TK::Async: {
      (void)get();
      if (match(TK::Def)) { out.push_back(parseFunction(true, tok)); return; }
      if (match(TK::For)) { out.push_back(parseForStmt(true, tok)); return; }
      if (match(TK::With)) { out.push_back(parseWithStmt(true, tok)); return; }
      failHere("invalid syntax");
    }
    default:
      parseSimpleStatementsInto(out);
      return;
  }
}

void Parser::parseSimpleStatementsInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  out.push_back(parseSmallStatement());
  while (match(TK::Semicolon)) {
    if (peek().kind == TK::Newline || peek().kind == TK::End) break;
    out.push_back(parseSmallStatement());
  }
  if (peek().kind == TK::End) return;
  if (!match(TK::Newline)) {
    failHere("invalid syntax");
  }
}

std::unique_ptr<ast::Stmt> Parser::parseSmallStatement() {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Pass: (void)get(); return stamp(std::make_unique<ast::PassStmt>(), tok);
    case TK::Break: (void)get(); return stamp(std::make_unique<ast::BreakStmt>(), tok);
    case TK::Continue: (void)get(); return stamp(std::make_unique<ast::ContinueStmt>(), tok);
    case TK::Return: return parseReturnStmt();
    case TK::Raise: return parseRaiseStmt();
    case TK::Global: return parseGlobalStmt();
    case TK::Nonlocal: return parseNonlocalStmt();
    case TK::Assert: return parseAssertStmt();
    case TK::Del: return parseDelStmt();
    case TK::Import: return parseImportStmt();
    case TK::From: return parseFromImportStmt();
    default: return parseExprOrAssignStmt();
  }
}

namespace {

bool augmentedOperator(TK kind, ast::BinaryOperator& op) {
  using BO = ast::BinaryOperator;
  switch (kind) {
    case TK::PlusEqual: op = BO::Add; return true;
    case TK::MinusEqual: op = BO::Sub; return true;
    case TK::StarEqual: op = BO::Mul; return true;
    case TK::SlashEqual: op = BO::Div; return true;
    case TK::SlashSlashEqual: op = BO::FloorDiv; return true;
    case TK::PercentEqual: op = BO::Mod; return true;
    case TK::StarStarEqual: op = BO::Pow; return true;
    case TK::LShiftEqual: op = BO::LShift; return true;
    case TK::RShiftEqual: op = BO::RShift; return true;
    case TK::AmpEqual: op = BO::BitAnd; return true;
    case TK::PipeEqual: op = BO::BitOr; return true;
    case TK::CaretEqual: op = BO::BitXor; return true;
    default: return false;
  }
}

const char* augTargetName(ast::NodeKind k) {
  switch (k) {
    case ast::NodeKind::TupleLiteral: return "tuple";
    case ast::NodeKind::ListLiteral: return "list";
    case ast::NodeKind::Starred: return "starred";
    default: return "expression";
  }
}

} // namespace

std::unique_ptr<ast::Stmt> Parser::parseExprOrAssignStmt() {
  const lex::Token startTok = peek();
  auto first = (peek().kind == TK::Yield) ? parseYieldExpr() : parseTestList(true);

  if (peek().kind == TK::Colon) {
    (void)get();
    if (first->kind == ast::NodeKind::TupleLiteral) {
      fail(startTok, "only single target (not tuple) can be annotated");
    }
    if (first->kind == ast::NodeKind::ListLiteral) {
      fail(startTok, "only single target (not list) can be annotated");
    }
    setTargetContext(first.get(), ast::ExprContext::Store);
    auto node = stamp(std::make_unique<ast::AssignStmt>(), startTok);
    node->annotation = parseExpr();
    if (match(TK::Equal)) {
      node->value = (peek().kind == TK::Yield) ? parseYieldExpr() : parseTestList(true);
    }
    node->targets.push_back(std::move(first));
    return node;
  }

  ast::BinaryOperator op{};
  if (augmentedOperator(peek().kind, op)) {
    (void)get();
    const auto k = first->kind;
    if (k != ast::NodeKind::Name && k != ast::NodeKind::Attribute && k != ast::NodeKind::Subscript) {
      if (k == ast::NodeKind::TupleLiteral || k == ast::NodeKind::ListLiteral || k == ast::NodeKind::Starred) {
        fail(startTok, std::string("'") + augTargetName(k) + "' is an illegal expression for augmented assignment");
      }
      fail(startTok, std::string("'") + describeInvalidTarget(first.get()) + "' is an illegal expression for augmented assignment");
    }
    setTargetContext(first.get(), ast::ExprContext::Store);
    auto node = stamp(std::make_unique<ast::AugAssignStmt>(), startTok);
    node->target = std::move(first);
    node->op = op;
    node->value = (peek().kind == TK::Yield) ? parseYieldExpr() : parseTestList(false);
    return node;
  }

  if (peek().kind == TK::Equal) {
    std::vector<std::unique_ptr<ast::Expr>> chain;
    chain.push_back(std::move(first));
    while (match(TK::Equal)) {
      chain.push_back((peek().kind == TK::Yield) ? parseYieldExpr() : parseTestList(true));
    }
    auto node = stamp(std::make_unique<ast::AssignStmt>(), startTok);
    node->value = std::move(chain.back());
    chain.pop_back();
    for (auto& target : chain) {
      setTargetContext(target.get(), ast::ExprContext::Store);
      node->targets.push_back(std::move(target));
    }
    return node;
  }

  if (first->kind == ast::NodeKind::Starred) {
    fail(startTok, "can't use starred expression here");
  }
  return stamp(std::make_unique<ast::ExprStmt>(std::move(first)), startTok);
}

void Parser::parseSuiteInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  (void)expect(TK::Colon, "':'");
  if (!match(TK::Newline)) {
    if (peek().kind == TK::End) failHere("expected an indented block");
    parseSimpleStatementsInto(out);
    return;
  }
  while (match(TK::Newline)) {}
  if (peek().kind != TK::Indent) {
    failHere("expected an indented block");
  }
  (void)get();
  while (peek().kind != TK::Dedent && peek().kind != TK::End) {
    if (match(TK::Newline)) continue;
    if (peek().kind == TK::Indent) failHere("unexpected indent");
    parseStatementInto(out);
  }
  (void)match(TK::Dedent);
}

std::unique_ptr<ast::Stmt> Parser::parseIfStmt() {
  const lex::Token tok = get(); // 'if' or 'elif'
  auto node = stamp(std::make_unique<ast::IfStmt>(), tok);
  node->cond = parseNamedExprTest();
  parseSuiteInto(node->thenBody);
  if (peek().kind == TK::Elif) {
    DepthGuard guard(*this);
    node->elseBody.push_back(parseIfStmt());
  } else if (match(TK::Else)) {
    parseSuiteInto(node->elseBody);
  }
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseWhileStmt() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::WhileStmt>(), tok);
  node->cond = parseNamedExprTest();
  parseSuiteInto(node->thenBody);
  if (match(TK::Else)) parseSuiteInto(node->elseBody);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseForStmt(bool isAsync, const lex::Token& startTok) {
  auto node = stamp(std::make_unique<ast::ForStmt>(), startTok);
  node->isAsync = isAsync;
  node->target = parseTargetList();
  (void)expect(TK::In, "'in'");
  node->iterable = parseTestList(true);
  parseSuiteInto(node->thenBody);
  if (match(TK::Else)) parseSuiteInto(node->elseBody);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseTryStmt() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::TryStmt>(), tok);
  parseSuiteInto(node->body);
  bool sawBare = false;
  while (peek().kind == TK::Except) {
    const lex::Token exceptTok = get();
    if (sawBare) fail(exceptTok, "default 'except:' must be last");
    auto handler = stamp(std::make_unique<ast::ExceptHandler>(), exceptTok);
    if (peek().kind != TK::Colon) {
      handler->type = parseExpr();
      if (peek().kind == TK::Comma) {
        failHere("multiple exception types must be parenthesized");
      }
      if (match(TK::As)) {
        handler->name = expect(TK::Ident, "name after 'as'").text;
      }
    } else {
      sawBare = true;
    }
    parseSuiteInto(handler->body);
    node->handlers.push_back(std::move(handler));
  }
  if (peek().kind == TK::Else) {
    if (node->handlers.empty()) failHere("invalid syntax");
    (void)get();
    parseSuiteInto(node->orelse);
  }
  if (match(TK::Finally)) parseSuiteInto(node->finalbody);
  if (node->handlers.empty() && node->finalbody.empty()) {
    failHere("expected 'except' or 'finally' block");
  }
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseWithStmt(bool isAsync, const lex::Token& startTok) {
  auto node = stamp(std::make_unique<ast::WithStmt>(), startTok);
  node->isAsync = isAsync;
  do {
    ast::WithItem item;
    item.context = parseExpr();
    if (match(TK::As)) {
      item.target = parseBitwiseOr();
      setTargetContext(item.target.get(), ast::ExprContext::Store);
    }
    node->items.push_back(std::move(item));
  } while (match(TK::Comma));
  parseSuiteInto(node->body);
  return node;
}

std::string Parser::parseDottedName() {
  std::string name = expect(TK::Ident, "module name").text;
  while (peek().kind == TK::Dot) {
    (void)get();
    name += ".";
    name += expect(TK::Ident, "module name").text;
  }
  return name;
}

std::unique_ptr<ast::Stmt> Parser::parseImportStmt() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::Import>(), tok);
  do {
    ast::Alias alias;
    alias.line = peek().line + lineOffset_;
    alias.name = parseDottedName();
    if (match(TK::As)) alias.asname = expect(TK::Ident, "name after 'as'").text;
    node->names.push_back(std::move(alias));
  } while (match(TK::Comma));
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseFromImportStmt() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::ImportFrom>(), tok);
  for (;;) {
    if (match(TK::Dot)) { node->level += 1; continue; }
    if (match(TK::Ellipsis)) { node->level += 3; continue; }
    break;
  }
  if (peek().kind == TK::Ident) {
    node->module = parseDottedName();
  } else if (node->level == 0) {
    failHere("invalid syntax");
  }
  (void)expect(TK::Import, "'import'");
  if (peek().kind == TK::Star) {
    ast::Alias star;
    star.line = get().line + lineOffset_;
    star.name = "*";
    node->names.push_back(std::move(star));
    return node;
  }
  const bool parenthesized = match(TK::LParen);
  do {
    if (parenthesized && peek().kind == TK::RParen) break;
    ast::Alias alias;
    const lex::Token nameTok = expect(TK::Ident, "name to import");
    alias.line = nameTok.line + lineOffset_;
    alias.name = nameTok.text;
    if (match(TK::As)) alias.asname = expect(TK::Ident, "name after 'as'").text;
    node->names.push_back(std::move(alias));
  } while (match(TK::Comma));
  if (parenthesized) (void)expect(TK::RParen, "')'");
  if (node->names.empty()) failHere("invalid syntax");
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseRaiseStmt() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::RaiseStmt>(), tok);
  if (startsExpression(peek().kind)) {
    node->exc = parseExpr();
    if (match(TK::From)) node->cause = parseExpr();
  }
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseGlobalStmt() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::GlobalStmt>(), tok);
  do {
    node->names.push_back(expect(TK::Ident, "name").text);
  } while (match(TK::Comma));
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseNonlocalStmt() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::NonlocalStmt>(), tok);
  do {
    node->names.push_back(expect(TK::Ident, "name").text);
  } while (match(TK::Comma));
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseAssertStmt() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::AssertStmt>(), tok);
  node->test = parseExpr();
  if (match(TK::Comma)) node->msg = parseExpr();
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseDelStmt() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::DelStmt>(), tok);
  do {
    if (!startsExpression(peek().kind)) break;
    auto target = parseBitwiseOr();
    setTargetContext(target.get(), ast::ExprContext::Del);
    node->targets.push_back(std::move(target));
  } while (match(TK::Comma));
  if (node->targets.empty()) failHere("invalid syntax");
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseReturnStmt() {
  const lex::Token tok = get();
  auto node = stamp(std::make_unique<ast::ReturnStmt>(), tok);
  if (startsExpression(peek().kind)) node->value = parseTestList(true);
  return node;
}

std::vector<std::unique_ptr<ast::Expr>> Parser::parseDecorators() {
  std::vector<std::unique_ptr<ast::Expr>> decorators;
  while (match(TK::At)) {
    decorators.push_back(parseNamedExprTest());
    (void)expect(TK::Newline, "newline after decorator");
  }
  return decorators;
}

std::unique_ptr<ast::FunctionDef> Parser::parseFunction(bool isAsync, const lex::Token& startTok) {
  const lex::Token nameTok = expect(TK::Ident, "function name");
  auto fn = stamp(std::make_unique<ast::FunctionDef>(nameTok.text), startTok);
  fn->isAsync = isAsync;
  (void)expect(TK::LParen, "'('");
  parseParamList(fn->params, TK::RParen, true);
  (void)expect(TK::RParen, "')'");
  if (match(TK::Arrow)) fn->returns = parseExpr();
  parseSuiteInto(fn->body);
  return fn;
}

std::unique_ptr<ast::ClassDef> Parser::parseClass() {
  const lex::Token tok = get();
  const lex::Token nameTok = expect(TK::Ident, "class name");
  auto cls = stamp(std::make_unique<ast::ClassDef>(nameTok.text), tok);
  if (match(TK::LParen)) {
    ast::Call holder(nullptr);
    parseCallArgs(holder);
    cls->bases = std::move(holder.args);
    cls->keywords = std::move(holder.keywords);
  }
  parseSuiteInto(cls->body);
  return cls;
}

void Parser::parseParamList(std::vector<ast::Param>& outParams, TK closer, bool allowAnnotations) {
  bool seenStar = false;
  bool seenKwArgs = false;
  bool seenDefault = false;
  bool seenSlash = false;
  bool bareStarPending = false;
  std::set<std::string> names;

  auto addParam = [&](ast::Param p, const lex::Token& tok) {
    if (!names.insert(p.name).second) {
      fail(tok, "duplicate argument '" + p.name + "' in function definition");
    }
    outParams.push_back(std::move(p));
  };

  while (peek().kind != closer) {
    const lex::Token tok = peek();
    if (seenKwArgs) fail(tok, "arguments cannot follow var-keyword argument");
    if (match(TK::Slash)) {
      if (seenSlash) fail(tok, "/ may appear only once");
      if (seenStar) fail(tok, "/ must be ahead of *");
      if (outParams.empty()) fail(tok, "at least one argument must precede /");
      for (auto& p : outParams) p.kind = ast::ParamKind::PositionalOnly;
      seenSlash = true;
    } else if (match(TK::StarStar)) {
      const lex::Token nameTok = expect(TK::Ident, "parameter name");
      ast::Param p;
      p.name = nameTok.text;
      p.kind = ast::ParamKind::KwArgs;
      p.line = nameTok.line + lineOffset_;
      if (allowAnnotations && match(TK::Colon)) p.annotation = parseExpr();
      addParam(std::move(p), nameTok);
      seenKwArgs = true;
      bareStarPending = false;
    } else if (match(TK::Star)) {
      if (seenStar) fail(tok, "* argument may appear only once");
      seenStar = true;
      if (peek().kind == TK::Ident) {
        const lex::Token nameTok = get();
        ast::Param p;
        p.name = nameTok.text;
        p.kind = ast::ParamKind::VarArgs;
        p.line = nameTok.line + lineOffset_;
        if (allowAnnotations && match(TK::Colon)) p.annotation = parseExpr();
        addParam(std::move(p), nameTok);
      } else {
        bareStarPending = true;
      }
    } else {
      const lex::Token nameTok = expect(TK::Ident, "parameter name");
      ast::Param p;
      p.name = nameTok.text;
      p.kind = seenStar ? ast::ParamKind::KeywordOnly : ast::ParamKind::Positional;
      p.line = nameTok.line + lineOffset_;
      if (allowAnnotations && match(TK::Colon)) p.annotation = parseExpr();
      if (match(TK::Equal)) {
        p.defaultValue = parseExpr();
        if (!seenStar) seenDefault = true;
      } else if (!seenStar && seenDefault) {
        fail(nameTok, "non-default argument follows default argument");
      }
      addParam(std::move(p), nameTok);
      bareStarPending = false;
    }
    if (!match(TK::Comma)) break;
  }
  if (bareStarPending) failHere("named arguments must follow bare *");
}

} // namespace pybox::parse
