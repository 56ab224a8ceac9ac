/***
 * Name: pybox::parse::Parser
 * Purpose: Build a syntax tree for a fragment from its token stream.
 * Inputs:
 *   - Token stream from Lexer (drained once into a buffer)
 * Outputs:
 *   - Module AST holding every top-level statement in source order.
 * Theory of Operation:
 *   Recursive descent over the Python statement and expression grammar.
 *   The first error throws exceptions::ParseError with the offending token's
 *   line and column; there is no recovery. Expression and block nesting is
 *   capped so hostile input cannot exhaust the native stack. f-string
 *   replacement fields are parsed by a nested Parser over the field text.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "ast/Nodes.h"
#include "lexer/Lexer.h"

namespace pybox::parse {

class Parser {
 public:
  explicit Parser(lex::ITokenStream& stream) : ts_(stream) {}
  std::unique_ptr<ast::Module> parseModule();

  // Parse a standalone expression (used for f-string fields).
  std::unique_ptr<ast::Expr> parseStandaloneExpr();

  static constexpr int kMaxNesting = 200;
  // Operator and postfix chains deepen the tree without recursing.
  static constexpr int kMaxChain = 1000;

 private:
  lex::ITokenStream& ts_;
  std::vector<lex::Token> tokens_{};
  std::size_t pos_{0};
  bool initialized_{false};
  int depth_{0};
  int chainDepth_{0};
  int lineOffset_{0}; // added to token lines when parsing embedded f-string fields

  struct DepthGuard {
    Parser& parser;
    explicit DepthGuard(Parser& p);
    ~DepthGuard() { --parser.depth_; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;
  };

  struct ChainGuard {
    Parser& parser;
    int count{0};
    explicit ChainGuard(Parser& p) : parser(p) {}
    ~ChainGuard() { parser.chainDepth_ -= count; }
    ChainGuard(const ChainGuard&) = delete;
    ChainGuard& operator=(const ChainGuard&) = delete;
    void extend();
  };

  void initBuffer();
  const lex::Token& peek() const;
  const lex::Token& peekNext() const;
  lex::Token get();
  bool match(lex::TokenKind tokenKind);
  lex::Token expect(lex::TokenKind tokenKind, const char* msg);
  [[noreturn]] void fail(const lex::Token& tok, const std::string& msg) const;
  [[noreturn]] void failHere(const std::string& msg) const { fail(peek(), msg); }
  template <typename T>
  std::unique_ptr<T> stamp(std::unique_ptr<T> node, const lex::Token& tok) const {
    node->line = tok.line + lineOffset_;
    node->col = tok.col;
    node->file = tok.file;
    return node;
  }

  // Statements
  void parseStatementInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  void parseSimpleStatementsInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  std::unique_ptr<ast::Stmt> parseSmallStatement();
  std::unique_ptr<ast::Stmt> parseExprOrAssignStmt();
  void parseSuiteInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  std::unique_ptr<ast::Stmt> parseIfStmt();
  std::unique_ptr<ast::Stmt> parseWhileStmt();
  std::unique_ptr<ast::Stmt> parseForStmt(bool isAsync, const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseTryStmt();
  std::unique_ptr<ast::Stmt> parseWithStmt(bool isAsync, const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseImportStmt();
  std::unique_ptr<ast::Stmt> parseFromImportStmt();
  std::unique_ptr<ast::Stmt> parseRaiseStmt();
  std::unique_ptr<ast::Stmt> parseGlobalStmt();
  std::unique_ptr<ast::Stmt> parseNonlocalStmt();
  std::unique_ptr<ast::Stmt> parseAssertStmt();
  std::unique_ptr<ast::Stmt> parseDelStmt();
  std::unique_ptr<ast::Stmt> parseReturnStmt();
  std::unique_ptr<ast::FunctionDef> parseFunction(bool isAsync, const lex::Token& startTok);
  std::unique_ptr<ast::ClassDef> parseClass();
  std::vector<std::unique_ptr<ast::Expr>> parseDecorators();
  void parseParamList(std::vector<ast::Param>& outParams, lex::TokenKind closer, bool allowAnnotations);
  std::string parseDottedName();

  // Expressions (lowest to highest precedence)
  std::unique_ptr<ast::Expr> parseTestList(bool allowStar);
  std::unique_ptr<ast::Expr> parseNamedExprTest();
  std::unique_ptr<ast::Expr> parseExpr();
  std::unique_ptr<ast::Expr> parseLambda();
  std::unique_ptr<ast::Expr> parseLogicalOr();
  std::unique_ptr<ast::Expr> parseLogicalAnd();
  std::unique_ptr<ast::Expr> parseLogicalNot();
  std::unique_ptr<ast::Expr> parseComparison();
  std::unique_ptr<ast::Expr> parseBitwiseOr();
  std::unique_ptr<ast::Expr> parseBitwiseXor();
  std::unique_ptr<ast::Expr> parseBitwiseAnd();
  std::unique_ptr<ast::Expr> parseShift();
  std::unique_ptr<ast::Expr> parseAdditive();
  std::unique_ptr<ast::Expr> parseMultiplicative();
  std::unique_ptr<ast::Expr> parseUnary();
  std::unique_ptr<ast::Expr> parsePower();
  std::unique_ptr<ast::Expr> parsePostfix(std::unique_ptr<ast::Expr> base);
  std::unique_ptr<ast::Expr> parseAtom();
  std::unique_ptr<ast::Expr> parseStarOrTest(bool allowNamed);
  std::unique_ptr<ast::Expr> parseYieldExpr();
  std::unique_ptr<ast::Expr> parseTargetList();
  static bool startsExpression(lex::TokenKind kind);
  bool atAsyncFor() const;

  std::unique_ptr<ast::Expr> parseParenthesized(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseListDisplay(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseDictOrSetDisplay(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseSubscriptList();
  std::unique_ptr<ast::Expr> parseSubscriptItem();
  void parseCallArgs(ast::Call& call);
  std::vector<ast::ComprehensionFor> parseComprehensionFors();

  // Literals
  std::unique_ptr<ast::Expr> parseNumber(const lex::Token& tok) const;
  std::unique_ptr<ast::Expr> parseStrings();
  void appendFStringParts(ast::FStringLiteral& out, const std::string& body, bool raw, const lex::Token& tok) const;
  std::unique_ptr<ast::Expr> parseExprFromString(const std::string& text, const lex::Token& tok) const;

  // Target checking
  void setTargetContext(ast::Expr* e, ast::ExprContext ctx) const;
  static const char* describeInvalidTarget(const ast::Expr* e);
};

// Decode a string or bytes token (prefix, quotes and escapes).
struct DecodedString {
  std::string value;
  bool isBytes{false};
  bool isFormat{false};
  bool isRaw{false};
  std::string body; // text between the quotes, undecoded
};

// Throws exceptions::ParseError on malformed escapes.
DecodedString decodeStringToken(const std::string& text, int line, int col);

// Append escape-processed text (non-raw strings) to out.
void decodeEscapes(const std::string& body, bool isBytes, std::string& out, int line, int col);

} // namespace pybox::parse
