/***
 * Name: pybox::lex::Lexer
 * Purpose: Tokenize fragment source(s) into a single token vector (LIFO inputs).
 */
#include "lexer/Lexer.h"
#include <cctype>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "pybox/exceptions/file_read_error.h"

namespace pybox::lex {

namespace {
constexpr std::size_t kTabStop = 8;

bool isIdentStart(const char chr) {
  const auto uch = static_cast<unsigned char>(chr);
  return (std::isalpha(uch) != 0) || chr == '_' || uch >= 0x80U;
}
bool isIdentChar(const char chr) {
  const auto uch = static_cast<unsigned char>(chr);
  return (std::isalnum(uch) != 0) || chr == '_' || uch >= 0x80U;
}
bool isStringPrefixChar(const char c) {
  return c == 'b' || c == 'B' || c == 'r' || c == 'R' || c == 'f' || c == 'F' || c == 'u' || c == 'U';
}

TokenKind keywordKind(const std::string& ident) {
  static const std::pair<const char*, TokenKind> kKeywords[] = {
      {"def", TokenKind::Def},         {"return", TokenKind::Return},     {"del", TokenKind::Del},
      {"if", TokenKind::If},           {"else", TokenKind::Else},         {"elif", TokenKind::Elif},
      {"while", TokenKind::While},     {"for", TokenKind::For},           {"in", TokenKind::In},
      {"break", TokenKind::Break},     {"continue", TokenKind::Continue}, {"pass", TokenKind::Pass},
      {"try", TokenKind::Try},         {"except", TokenKind::Except},     {"finally", TokenKind::Finally},
      {"with", TokenKind::With},       {"as", TokenKind::As},             {"import", TokenKind::Import},
      {"from", TokenKind::From},       {"class", TokenKind::Class},       {"async", TokenKind::Async},
      {"assert", TokenKind::Assert},   {"raise", TokenKind::Raise},       {"global", TokenKind::Global},
      {"nonlocal", TokenKind::Nonlocal}, {"yield", TokenKind::Yield},     {"await", TokenKind::Await},
      {"lambda", TokenKind::Lambda},   {"is", TokenKind::Is},             {"and", TokenKind::And},
      {"or", TokenKind::Or},           {"not", TokenKind::Not},           {"None", TokenKind::NoneLit},
      {"True", TokenKind::BoolLit},    {"False", TokenKind::BoolLit},
  };
  for (const auto& [word, kind] : kKeywords) {
    if (ident == word) { return kind; }
  }
  return TokenKind::Ident;
}
} // namespace

FileInput::FileInput(std::string path) : path_(std::move(path)), in_(path_) {
  if (!in_) { throw exceptions::FileReadError("cannot open '" + path_ + "'"); }
}

bool FileInput::getline(std::string& out) {
  if (!in_) { return false; }
  return static_cast<bool>(std::getline(in_, out));
}

StringInput::StringInput(std::string text, std::string name)
  : name_(std::move(name)), in_(std::move(text)) {}

bool StringInput::getline(std::string& out) {
  if (!in_) { return false; }
  return static_cast<bool>(std::getline(in_, out));
}

void Lexer::push(std::unique_ptr<InputSource> src) {
  State state;
  state.src = std::move(src);
  stack_.push_back(std::move(state));
  finalized_ = false;
}

void Lexer::pushFile(const std::string& path) { push(std::make_unique<FileInput>(path)); }

void Lexer::pushString(const std::string& text, const std::string& name) {
  push(std::make_unique<StringInput>(text, name));
}

bool Lexer::readNextLine(State& state) {
  std::string raw;
  if (!state.src->getline(raw)) { return false; }
  ++state.lineNo;
  if (!raw.empty() && raw.back() == '\r') { raw.pop_back(); }
  state.line = std::move(raw);
  state.index = 0;
  return true;
}

Token Lexer::makeError(const State& state, const std::size_t col, std::string message) const {
  Token tok;
  tok.kind = TokenKind::Error;
  tok.text = std::move(message);
  tok.file = state.src->name();
  tok.line = state.lineNo;
  tok.col = static_cast<int>(col + 1);
  return tok;
}

// Measure leading whitespace and emit Indent/Dedent tokens for a new logical line.
bool Lexer::scanIndent(State& state) {
  const std::string& line = state.line;
  std::size_t idx = 0;
  std::size_t width = 0;
  while (idx < line.size() && (line[idx] == ' ' || line[idx] == '\t' || line[idx] == '\f')) {
    if (line[idx] == '\t') { width = (width / kTabStop + 1) * kTabStop; }
    else if (line[idx] == ' ') { ++width; }
    ++idx;
  }
  if (idx >= line.size() || line[idx] == '#') {
    state.index = line.size();
    return false; // blank or comment-only line
  }
  state.index = idx;
  auto make = [&](TokenKind kind, const char* text) {
    Token tok; tok.kind = kind; tok.text = text; tok.file = state.src->name(); tok.line = state.lineNo; tok.col = static_cast<int>(idx + 1);
    return tok;
  };
  if (width > state.indentStack.back()) {
    state.indentStack.push_back(width);
    tokens_.push_back(make(TokenKind::Indent, "<INDENT>"));
    return true;
  }
  while (width < state.indentStack.back()) {
    state.indentStack.pop_back();
    tokens_.push_back(make(TokenKind::Dedent, "<DEDENT>"));
  }
  if (width != state.indentStack.back()) {
    tokens_.push_back(makeError(state, idx, "unindent does not match any outer indentation level"));
    state.failed = true;
  }
  return true;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
Token Lexer::scanString(State& state, const std::size_t start, const std::size_t quotePos, const bool isBytes) {
  const int startLine = state.lineNo;
  const char quote = state.line[quotePos];
  const bool triple = quotePos + 2 < state.line.size() && state.line[quotePos + 1] == quote &&
                      state.line[quotePos + 2] == quote;
  std::size_t pos = quotePos + (triple ? 3 : 1);
  std::string text = state.line.substr(start, pos - start);
  while (true) {
    const std::string& line = state.line;
    bool closed = false;
    bool escapedEol = false;
    while (pos < line.size()) {
      const char c = line[pos];
      if (c == '\\' && pos + 1 < line.size()) {
        // Raw strings keep the backslash but it still protects the next quote.
        text += c; text += line[pos + 1]; pos += 2;
        continue;
      }
      if (c == '\\' && !triple) {
        // Backslash-newline inside a single-quoted string continues it.
        pos += 1;
        escapedEol = true;
        break;
      }
      if (c == quote) {
        if (!triple) { text += c; ++pos; closed = true; break; }
        if (pos + 2 < line.size() && line[pos + 1] == quote && line[pos + 2] == quote) {
          text.append(3, quote); pos += 3; closed = true; break;
        }
      }
      text += c; ++pos;
    }
    if (closed) { state.index = pos; break; }
    if (!triple && !escapedEol) {
      Token err = makeError(state, start, "unterminated string literal");
      err.line = startLine;
      state.failed = true;
      return err;
    }
    if (!readNextLine(state)) {
      Token err = makeError(state, start, triple ? "unterminated triple-quoted string literal"
                                                 : "unterminated string literal");
      err.line = startLine;
      state.failed = true;
      return err;
    }
    if (triple) { text += '\n'; }
    pos = 0;
  }
  Token tok;
  tok.kind = isBytes ? TokenKind::Bytes : TokenKind::String;
  tok.text = std::move(text);
  tok.file = state.src->name();
  tok.line = startLine;
  tok.col = static_cast<int>(start + 1);
  return tok;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
Token Lexer::scanNumber(State& state) {
  const std::string& line = state.line;
  std::size_t& idx = state.index;
  const std::size_t i0 = idx;
  auto make = [&](TokenKind kind, std::size_t end) {
    Token tok; tok.kind = kind; tok.text = line.substr(i0, end - i0); tok.file = state.src->name(); tok.line = state.lineNo; tok.col = static_cast<int>(i0 + 1);
    idx = end;
    return tok;
  };
  auto scanDigits = [&](std::size_t pos, auto isOk) {
    std::size_t i = pos; bool have = false; bool prevUnderscore = false;
    while (i < line.size()) {
      const char c = line[i];
      if (isOk(c)) { have = true; prevUnderscore = false; ++i; continue; }
      if (c == '_' && have && !prevUnderscore) { prevUnderscore = true; ++i; continue; }
      break;
    }
    if (prevUnderscore) { --i; }
    return i;
  };
  auto isDec = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  auto isHex = [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; };
  auto isOct = [](char c) { return c >= '0' && c <= '7'; };
  auto isBin = [](char c) { return c == '0' || c == '1'; };
  auto scanExponent = [&](std::size_t pos) {
    if (pos >= line.size() || (line[pos] != 'e' && line[pos] != 'E')) { return pos; }
    std::size_t i = pos + 1;
    if (i < line.size() && (line[i] == '+' || line[i] == '-')) { ++i; }
    const std::size_t end = scanDigits(i, isDec);
    return end == i ? pos : end;
  };
  auto finish = [&](TokenKind kind, std::size_t end) {
    if (end < line.size() && (line[end] == 'j' || line[end] == 'J')) { return make(TokenKind::Imag, end + 1); }
    if (end < line.size() && isIdentChar(line[end])) {
      state.failed = true;
      return makeError(state, i0, "invalid decimal literal");
    }
    return make(kind, end);
  };

  if (line[idx] == '0' && idx + 1 < line.size()) {
    const char p1 = line[idx + 1];
    std::size_t end = idx + 2;
    if (p1 == 'x' || p1 == 'X') { end = scanDigits(end, isHex); }
    else if (p1 == 'o' || p1 == 'O') { end = scanDigits(end, isOct); }
    else if (p1 == 'b' || p1 == 'B') { end = scanDigits(end, isBin); }
    if (end != idx + 2) { return finish(TokenKind::Int, end); }
    if (p1 == 'x' || p1 == 'X' || p1 == 'o' || p1 == 'O' || p1 == 'b' || p1 == 'B') {
      state.failed = true;
      return makeError(state, i0, "invalid numeric literal");
    }
  }
  std::size_t end = line[idx] == '.' ? idx : scanDigits(idx, isDec);
  bool isFloat = false;
  if (end < line.size() && line[end] == '.') {
    isFloat = true;
    end = scanDigits(end + 1, isDec);
  }
  const std::size_t epos = scanExponent(end);
  if (epos != end) { isFloat = true; end = epos; }
  return finish(isFloat ? TokenKind::Float : TokenKind::Int, end);
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanOne(State& state) {
  const std::string& line = state.line;
  std::size_t& idx = state.index;
  while (idx < line.size() && (line[idx] == ' ' || line[idx] == '\t' || line[idx] == '\f')) { ++idx; }

  Token nl; nl.kind = TokenKind::Newline; nl.text = "\n"; nl.file = state.src->name(); nl.line = state.lineNo; nl.col = static_cast<int>(line.size() + 1);
  if (idx >= line.size()) { return nl; }
  if (line[idx] == '#') { idx = line.size(); return nl; }

  auto makeTok = [&](TokenKind kind, std::size_t len) {
    Token tok; tok.kind = kind; tok.text = line.substr(idx, len); tok.file = state.src->name(); tok.line = state.lineNo; tok.col = static_cast<int>(idx + 1);
    idx += len;
    return tok;
  };
  auto at = [&](std::size_t off) -> char { return idx + off < line.size() ? line[idx + off] : '\0'; };

  const char chr = line[idx];
  if (chr == '\\') {
    if (idx + 1 == line.size()) { state.continuation = true; idx = line.size(); return nl; }
    state.failed = true;
    return makeError(state, idx, "unexpected character after line continuation character");
  }

  if (isStringPrefixChar(chr) || chr == '"' || chr == '\'') {
    std::size_t p = idx; bool hasB = false; bool hasF = false; bool hasU = false;
    while (p < line.size() && p - idx < 2 && isStringPrefixChar(line[p])) {
      const char c = line[p];
      if (c == 'b' || c == 'B') { hasB = true; }
      else if (c == 'f' || c == 'F') { hasF = true; }
      else if (c == 'u' || c == 'U') { hasU = true; }
      ++p;
    }
    const bool validPrefix = !(hasB && hasF) && !(hasU && (p - idx) > 1);
    if (p < line.size() && (line[p] == '"' || line[p] == '\'') && validPrefix) {
      const std::size_t start = idx;
      return scanString(state, start, p, hasB);
    }
  }

  if (std::isdigit(static_cast<unsigned char>(chr)) != 0 ||
      (chr == '.' && std::isdigit(static_cast<unsigned char>(at(1))) != 0)) {
    return scanNumber(state);
  }

  if (isIdentStart(chr)) {
    std::size_t end = idx + 1;
    while (end < line.size() && isIdentChar(line[end])) { ++end; }
    const std::string ident = line.substr(idx, end - idx);
    return makeTok(keywordKind(ident), end - idx);
  }

  switch (chr) {
    case '(': ++state.bracketDepth; return makeTok(TokenKind::LParen, 1);
    case '[': ++state.bracketDepth; return makeTok(TokenKind::LBracket, 1);
    case '{': ++state.bracketDepth; return makeTok(TokenKind::LBrace, 1);
    case ')': case ']': case '}': {
      if (state.bracketDepth == 0) {
        state.failed = true;
        return makeError(state, idx, std::string("unmatched '") + chr + "'");
      }
      --state.bracketDepth;
      const TokenKind kind = chr == ')' ? TokenKind::RParen : (chr == ']' ? TokenKind::RBracket : TokenKind::RBrace);
      return makeTok(kind, 1);
    }
    case ':': return at(1) == '=' ? makeTok(TokenKind::ColonEqual, 2) : makeTok(TokenKind::Colon, 1);
    case ';': return makeTok(TokenKind::Semicolon, 1);
    case ',': return makeTok(TokenKind::Comma, 1);
    case '@': return makeTok(TokenKind::At, 1);
    case '~': return makeTok(TokenKind::Tilde, 1);
    case '.':
      if (at(1) == '.' && at(2) == '.') { return makeTok(TokenKind::Ellipsis, 3); }
      return makeTok(TokenKind::Dot, 1);
    case '+': return at(1) == '=' ? makeTok(TokenKind::PlusEqual, 2) : makeTok(TokenKind::Plus, 1);
    case '-':
      if (at(1) == '>') { return makeTok(TokenKind::Arrow, 2); }
      return at(1) == '=' ? makeTok(TokenKind::MinusEqual, 2) : makeTok(TokenKind::Minus, 1);
    case '*':
      if (at(1) == '*') { return at(2) == '=' ? makeTok(TokenKind::StarStarEqual, 3) : makeTok(TokenKind::StarStar, 2); }
      return at(1) == '=' ? makeTok(TokenKind::StarEqual, 2) : makeTok(TokenKind::Star, 1);
    case '/':
      if (at(1) == '/') { return at(2) == '=' ? makeTok(TokenKind::SlashSlashEqual, 3) : makeTok(TokenKind::SlashSlash, 2); }
      return at(1) == '=' ? makeTok(TokenKind::SlashEqual, 2) : makeTok(TokenKind::Slash, 1);
    case '%': return at(1) == '=' ? makeTok(TokenKind::PercentEqual, 2) : makeTok(TokenKind::Percent, 1);
    case '=': return at(1) == '=' ? makeTok(TokenKind::EqEq, 2) : makeTok(TokenKind::Equal, 1);
    case '!':
      if (at(1) == '=') { return makeTok(TokenKind::NotEq, 2); }
      break;
    case '<':
      if (at(1) == '<') { return at(2) == '=' ? makeTok(TokenKind::LShiftEqual, 3) : makeTok(TokenKind::LShift, 2); }
      if (at(1) == '>') { break; }
      return at(1) == '=' ? makeTok(TokenKind::Le, 2) : makeTok(TokenKind::Lt, 1);
    case '>':
      if (at(1) == '>') { return at(2) == '=' ? makeTok(TokenKind::RShiftEqual, 3) : makeTok(TokenKind::RShift, 2); }
      return at(1) == '=' ? makeTok(TokenKind::Ge, 2) : makeTok(TokenKind::Gt, 1);
    case '|': return at(1) == '=' ? makeTok(TokenKind::PipeEqual, 2) : makeTok(TokenKind::Pipe, 1);
    case '&': return at(1) == '=' ? makeTok(TokenKind::AmpEqual, 2) : makeTok(TokenKind::Amp, 1);
    case '^': return at(1) == '=' ? makeTok(TokenKind::CaretEqual, 2) : makeTok(TokenKind::Caret, 1);
    default: break;
  }
  state.failed = true;
  const auto uch = static_cast<unsigned char>(chr);
  if (std::isprint(uch) != 0) { return makeError(state, idx, std::string("invalid character '") + chr + "'"); }
  return makeError(state, idx, "invalid non-printable character");
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Lexer::lexSource(State& state) {
  auto emitNewline = [&]() {
    if (tokens_.empty()) { return; }
    const TokenKind last = tokens_.back().kind;
    if (last == TokenKind::Newline || last == TokenKind::Indent || last == TokenKind::Dedent) { return; }
    Token nl; nl.kind = TokenKind::Newline; nl.text = "\n"; nl.file = state.src->name(); nl.line = state.lineNo; nl.col = static_cast<int>(state.line.size() + 1);
    tokens_.push_back(std::move(nl));
  };
  const std::size_t sourceStart = tokens_.size();
  while (!state.failed && readNextLine(state)) {
    const bool joined = state.bracketDepth > 0 || state.continuation;
    state.continuation = false;
    if (!joined && !scanIndent(state)) { continue; }
    if (state.failed) { return; }
    while (state.index < state.line.size()) {
      Token tok = scanOne(state);
      if (tok.kind == TokenKind::Newline) { break; }
      const bool isError = tok.kind == TokenKind::Error;
      tokens_.push_back(std::move(tok));
      if (isError) { return; }
    }
    if (state.bracketDepth == 0 && !state.continuation && tokens_.size() > sourceStart) { emitNewline(); }
  }
  if (state.bracketDepth > 0 || state.continuation) {
    tokens_.push_back(makeError(state, state.line.size(), "unexpected EOF while scanning a continued line"));
    state.failed = true;
    return;
  }
  if (tokens_.size() > sourceStart) { emitNewline(); }
  while (state.indentStack.size() > 1) {
    state.indentStack.pop_back();
    Token ded; ded.kind = TokenKind::Dedent; ded.text = "<DEDENT>"; ded.file = state.src->name(); ded.line = state.lineNo + 1; ded.col = 1;
    tokens_.push_back(std::move(ded));
  }
}

void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  while (!stack_.empty()) {
    State state = std::move(stack_.back());
    stack_.pop_back();
    lexSource(state);
    if (state.failed) { break; }
  }
  Token eof; eof.kind = TokenKind::End; eof.text = "<EOF>"; eof.line = 0; eof.col = 1;
  if (!tokens_.empty()) { eof.file = tokens_.back().file; eof.line = tokens_.back().line + 1; }
  tokens_.push_back(std::move(eof));
}

const Token& Lexer::peek(std::size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace pybox::lex
