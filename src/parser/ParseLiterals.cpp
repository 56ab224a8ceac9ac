/***
 * Name: pybox::parse::Parser (literals)
 * Purpose: Numeric literals, string concatenation, escapes and f-strings.
 * Theory of Operation:
 *   String tokens arrive with prefix and quotes intact. Adjacent tokens are
 *   concatenated; when any piece is an f-string the result is a single
 *   FStringLiteral whose text and field segments keep source order. Field
 *   expressions are parsed by a nested Parser over "(" + text + ")".
 */
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <utility>

#include "parser/Parser.h"
#include "pybox/exceptions/parse_error.h"

namespace pybox::parse {

using TK = lex::TokenKind;

namespace {

void appendUtf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Reads exactly `count` hex digits at body[pos]; returns false when short.
bool readHex(const std::string& body, std::size_t pos, std::size_t count, std::uint32_t& value) {
  value = 0;
  if (pos + count > body.size()) return false;
  for (std::size_t k = 0; k < count; ++k) {
    const int h = hexValue(body[pos + k]);
    if (h < 0) return false;
    value = (value << 4) | static_cast<std::uint32_t>(h);
  }
  return true;
}

void appendText(ast::FStringLiteral& out, const std::string& text) {
  if (text.empty()) return;
  if (!out.parts.empty() && !out.parts.back().isExpr) {
    out.parts.back().text += text;
    return;
  }
  ast::FStringSegment seg;
  seg.text = text;
  out.parts.push_back(std::move(seg));
}

std::string stripUnderscores(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c != '_') out.push_back(c);
  }
  return out;
}

} // namespace

void decodeEscapes(const std::string& body, bool isBytes, std::string& out, int line, int col) {
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    if (c != '\\' || i + 1 >= body.size()) {
      if (isBytes && static_cast<unsigned char>(c) >= 0x80) {
        throw exceptions::ParseError("bytes can only contain ASCII literal characters", line, col);
      }
      out.push_back(c);
      continue;
    }
    const char e = body[++i];
    switch (e) {
      case '\n': break;
      case '\\': out.push_back('\\'); break;
      case '\'': out.push_back('\''); break;
      case '"': out.push_back('"'); break;
      case 'a': out.push_back('\a'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'v': out.push_back('\v'); break;
      case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': {
        std::uint32_t v = static_cast<std::uint32_t>(e - '0');
        for (int k = 0; k < 2 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7'; ++k) {
          v = v * 8 + static_cast<std::uint32_t>(body[++i] - '0');
        }
        if (isBytes) {
          out.push_back(static_cast<char>(v & 0xFF));
        } else {
          appendUtf8(out, v);
        }
        break;
      }
      case 'x': {
        std::uint32_t v = 0;
        if (!readHex(body, i + 1, 2, v)) {
          throw exceptions::ParseError("truncated \\xXX escape", line, col);
        }
        i += 2;
        if (isBytes) {
          out.push_back(static_cast<char>(v));
        } else {
          appendUtf8(out, v);
        }
        break;
      }
      case 'u':
      case 'U': {
        if (isBytes) {
          out.push_back('\\');
          out.push_back(e);
          break;
        }
        const std::size_t width = e == 'u' ? 4 : 8;
        std::uint32_t v = 0;
        if (!readHex(body, i + 1, width, v)) {
          throw exceptions::ParseError(e == 'u' ? "truncated \\uXXXX escape" : "truncated \\UXXXXXXXX escape", line, col);
        }
        if (v > 0x10FFFF) {
          throw exceptions::ParseError("illegal Unicode character", line, col);
        }
        i += width;
        appendUtf8(out, v);
        break;
      }
      case 'N':
        if (!isBytes) {
          throw exceptions::ParseError("\\N{...} escapes are not supported", line, col);
        }
        [[fallthrough]];
      default:
        out.push_back('\\');
        out.push_back(e);
        break;
    }
  }
}

DecodedString decodeStringToken(const std::string& text, int line, int col) {
  DecodedString d;
  std::size_t p = 0;
  while (p < text.size() && text[p] != '\'' && text[p] != '"') {
    const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(text[p])));
    if (c == 'b') d.isBytes = true;
    if (c == 'r') d.isRaw = true;
    if (c == 'f') d.isFormat = true;
    ++p;
  }
  if (p >= text.size()) {
    throw exceptions::ParseError("malformed string literal", line, col);
  }
  const char q = text[p];
  const bool triple = text.size() >= p + 6 && text[p + 1] == q && text[p + 2] == q;
  const std::size_t qlen = triple ? 3 : 1;
  if (text.size() < p + 2 * qlen) {
    throw exceptions::ParseError("malformed string literal", line, col);
  }
  d.body = text.substr(p + qlen, text.size() - p - 2 * qlen);
  if (d.isFormat) return d;
  if (d.isRaw) {
    if (d.isBytes) {
      for (char c : d.body) {
        if (static_cast<unsigned char>(c) >= 0x80) {
          throw exceptions::ParseError("bytes can only contain ASCII literal characters", line, col);
        }
      }
    }
    d.value = d.body;
  } else {
    decodeEscapes(d.body, d.isBytes, d.value, line, col);
  }
  return d;
}

std::unique_ptr<ast::Expr> Parser::parseNumber(const lex::Token& tok) const {
  const std::string clean = stripUnderscores(tok.text);
  if (tok.kind == TK::Imag) {
    const double v = std::strtod(clean.substr(0, clean.size() - 1).c_str(), nullptr);
    return stamp(std::make_unique<ast::ImagLiteral>(v), tok);
  }
  if (tok.kind == TK::Float) {
    const double v = std::strtod(clean.c_str(), nullptr);
    return stamp(std::make_unique<ast::FloatLiteral>(v), tok);
  }
  int base = 10;
  std::string digits = clean;
  if (clean.size() > 1 && clean[0] == '0') {
    const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(clean[1])));
    if (p == 'x') base = 16;
    else if (p == 'o') base = 8;
    else if (p == 'b') base = 2;
    if (base != 10) {
      digits = clean.substr(2);
    } else if (clean.find_first_not_of('0') != std::string::npos) {
      fail(tok, "leading zeros in decimal integer literals are not permitted; use an 0o prefix for octal integers");
    }
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(digits.c_str(), &end, base);
  if (digits.empty() || end == nullptr || *end != '\0') {
    fail(tok, "invalid " + std::string(base == 16 ? "hexadecimal" : base == 8 ? "octal" : base == 2 ? "binary" : "decimal") + " literal");
  }
  if (errno == ERANGE || v > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
    fail(tok, "integer literal too large");
  }
  return stamp(std::make_unique<ast::IntLiteral>(static_cast<long long>(v)), tok);
}

std::unique_ptr<ast::Expr> Parser::parseStrings() {
  const lex::Token first = peek();
  bool anyBytes = false;
  bool anyText = false;
  bool anyFormat = false;
  std::string plain;
  auto fstr = std::make_unique<ast::FStringLiteral>();
  while (peek().kind == TK::String || peek().kind == TK::Bytes) {
    const lex::Token tok = get();
    const DecodedString d = decodeStringToken(tok.text, tok.line + lineOffset_, tok.col);
    if (d.isBytes) anyBytes = true; else anyText = true;
    if (anyBytes && anyText) fail(tok, "cannot mix bytes and nonbytes literals");
    if (d.isFormat) {
      if (!anyFormat) {
        appendText(*fstr, plain);
        anyFormat = true;
      }
      appendFStringParts(*fstr, d.body, d.isRaw, tok);
    } else if (anyFormat) {
      appendText(*fstr, d.value);
    } else {
      plain += d.value;
    }
  }
  if (anyFormat) return stamp(std::move(fstr), first);
  if (anyBytes) return stamp(std::make_unique<ast::BytesLiteral>(plain), first);
  return stamp(std::make_unique<ast::StringLiteral>(plain), first);
}

void Parser::appendFStringParts(ast::FStringLiteral& out, const std::string& body, bool raw,
                                const lex::Token& tok) const {
  const int line = tok.line + lineOffset_;
  std::string literal;
  auto flushLiteral = [&]() {
    if (literal.empty()) return;
    if (raw) {
      appendText(out, literal);
    } else {
      std::string decoded;
      decodeEscapes(literal, false, decoded, line, tok.col);
      appendText(out, decoded);
    }
    literal.clear();
  };

  const std::size_t n = body.size();
  std::size_t i = 0;
  while (i < n) {
    const char c = body[i];
    if (c == '}') {
      if (i + 1 < n && body[i + 1] == '}') { literal.push_back('}'); i += 2; continue; }
      fail(tok, "f-string: single '}' is not allowed");
    }
    if (c != '{') { literal.push_back(c); ++i; continue; }
    if (i + 1 < n && body[i + 1] == '{') { literal.push_back('{'); i += 2; continue; }

    flushLiteral();
    std::size_t j = i + 1;
    int depth = 0;
    char inQuote = '\0';
    for (; j < n; ++j) {
      const char d = body[j];
      if (inQuote != '\0') {
        if (d == inQuote) inQuote = '\0';
        continue;
      }
      if (d == '\'' || d == '"') { inQuote = d; continue; }
      if (d == '(' || d == '[' || d == '{') { ++depth; continue; }
      if (d == ')' || d == ']') { --depth; continue; }
      if (d == '}') {
        if (depth == 0) break;
        --depth;
        continue;
      }
      if (depth == 0 && d == ':') break;
      if (depth == 0 && d == '!' && (j + 1 >= n || body[j + 1] != '=')) break;
    }
    if (j >= n) fail(tok, "f-string: expecting '}'");

    std::string exprText = body.substr(i + 1, j - i - 1);
    std::string debugText;
    {
      std::size_t last = exprText.find_last_not_of(" \t\n");
      if (last != std::string::npos && exprText[last] == '=' &&
          (last == 0 || std::string("=!<>").find(exprText[last - 1]) == std::string::npos)) {
        debugText = exprText;
        exprText.erase(last);
      }
    }
    if (exprText.find_first_not_of(" \t\n") == std::string::npos) {
      fail(tok, "f-string: empty expression not allowed");
    }

    ast::FStringSegment seg;
    seg.isExpr = true;
    seg.expr = parseExprFromString(exprText, tok);
    if (body[j] == '!') {
      if (j + 1 >= n || std::string("rsa").find(body[j + 1]) == std::string::npos) {
        fail(tok, "f-string: invalid conversion character: expected 's', 'r', or 'a'");
      }
      seg.conversion = body[j + 1];
      j += 2;
    }
    if (j < n && body[j] == ':') {
      std::size_t k = j + 1;
      int specDepth = 0;
      for (; k < n; ++k) {
        if (body[k] == '{') {
          ++specDepth;
        } else if (body[k] == '}') {
          if (specDepth == 0) break;
          --specDepth;
        }
      }
      if (k >= n) fail(tok, "f-string: expecting '}'");
      auto spec = std::make_unique<ast::FStringLiteral>();
      appendFStringParts(*spec, body.substr(j + 1, k - j - 1), raw, tok);
      seg.formatSpec = std::move(spec);
      j = k;
    }
    if (j >= n || body[j] != '}') fail(tok, "f-string: expecting '}'");

    if (!debugText.empty()) {
      appendText(out, debugText);
      if (seg.conversion == '\0' && !seg.formatSpec) seg.conversion = 'r';
    }
    out.parts.push_back(std::move(seg));
    i = j + 1;
  }
  flushLiteral();
}

std::unique_ptr<ast::Expr> Parser::parseExprFromString(const std::string& text, const lex::Token& tok) const {
  lex::Lexer lexer;
  lexer.pushString("(" + text + ")", tok.file);
  Parser nested(lexer);
  nested.lineOffset_ = tok.line + lineOffset_ - 1;
  nested.depth_ = depth_;
  auto e = nested.parseStandaloneExpr();
  return e;
}

} // namespace pybox::parse
