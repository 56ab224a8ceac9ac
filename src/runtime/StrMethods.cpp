/***
 * Name: pybox::rt str and bytes methods
 * Purpose: Native methods of str and bytes.
 * Theory of Operation:
 *   Positions (find, index, slicing arguments, widths) count code points, so
 *   these methods decode to UTF-32 where a position is involved and work on
 *   the UTF-8 bytes directly otherwise.
 */
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>
#include <utility>

#include "runtime/Builtins.h"
#include "runtime/Heap.h"
#include "runtime/Interpreter.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/Text.h"
#include "runtime/detail/ArgReader.h"
#include "runtime/detail/Methods.h"

namespace pybox::rt::detail {

namespace {

const BuiltinTypes& types() { return builtinTypes(); }

const std::string& self(const Value& v) { return v.as<StrObj>()->value; }

std::u32string strArg(const ArgReader& r, std::size_t i) { return text::decode(r.string(i)); }

Value u32(const std::u32string& s) { return newStr(text::encode(s)); }

// Python slice-style [start, end) over a sequence of `len` code points.
struct Span {
  std::size_t start;
  std::size_t end;
  bool empty; // start lies beyond the end of the string
};

Span spanOf(const ArgReader& r, std::size_t first, std::size_t len) {
  auto bound = [&](std::size_t i, long long fallback) {
    if (!r.has(i) || r.at(i).isNone()) { return fallback; }
    long long v = toInteger(r.at(i));
    if (v < 0) { v = std::max(0LL, v + static_cast<long long>(len)); }
    return v;
  };
  const long long start = bound(first, 0);
  const long long end = std::min(bound(first + 1, static_cast<long long>(len)), static_cast<long long>(len));
  Span out{};
  out.empty = start > static_cast<long long>(len) || start > end;
  out.start = static_cast<std::size_t>(std::min(start, static_cast<long long>(len)));
  out.end = static_cast<std::size_t>(std::max(end, start));
  if (out.end > len) { out.end = len; }
  return out;
}

long long findIn(const Value& s, CallArgs& args, const char* name, bool fromRight) {
  ArgReader r(name, args);
  r.noKeywords();
  r.expect(1, 3);
  const std::u32string hay = text::decode(self(s));
  const std::u32string needle = strArg(r, 0);
  const Span span = spanOf(r, 1, hay.size());
  if (span.empty || span.end - span.start < needle.size()) { return -1; }
  const std::u32string window = hay.substr(span.start, span.end - span.start);
  const std::size_t pos = fromRight ? window.rfind(needle) : window.find(needle);
  if (pos == std::u32string::npos) { return -1; }
  return static_cast<long long>(span.start + pos);
}

Value strFind(Interpreter&, const Value& s, CallArgs& args) { return Value::integer(findIn(s, args, "find", false)); }
Value strRfind(Interpreter&, const Value& s, CallArgs& args) { return Value::integer(findIn(s, args, "rfind", true)); }

Value strIndex(Interpreter&, const Value& s, CallArgs& args) {
  const long long pos = findIn(s, args, "index", false);
  if (pos < 0) { raise(types().valueError, "substring not found"); }
  return Value::integer(pos);
}

Value strRindex(Interpreter&, const Value& s, CallArgs& args) {
  const long long pos = findIn(s, args, "rindex", true);
  if (pos < 0) { raise(types().valueError, "substring not found"); }
  return Value::integer(pos);
}

Value strCount(Interpreter&, const Value& s, CallArgs& args) {
  ArgReader r("count", args);
  r.noKeywords();
  r.expect(1, 3);
  const std::u32string hay = text::decode(self(s));
  const std::u32string needle = strArg(r, 0);
  const Span span = spanOf(r, 1, hay.size());
  if (span.empty) { return Value::integer(0); }
  const std::size_t len = span.end - span.start;
  if (needle.empty()) { return Value::integer(static_cast<long long>(len + 1)); }
  const std::u32string window = hay.substr(span.start, len);
  long long n = 0;
  for (std::size_t pos = window.find(needle); pos != std::u32string::npos; pos = window.find(needle, pos + needle.size())) {
    ++n;
  }
  return Value::integer(n);
}

bool affixMatch(const Value& s, CallArgs& args, const char* name, bool suffix) {
  ArgReader r(name, args);
  r.noKeywords();
  r.expect(1, 3);
  const std::u32string hay = text::decode(self(s));
  const Span span = spanOf(r, 1, hay.size());
  if (span.empty) { return false; }
  const std::u32string window = hay.substr(span.start, span.end - span.start);
  auto test = [&](const Value& candidate) {
    const auto* c = candidate.as<StrObj>();
    if (c == nullptr) {
      raise(types().typeError, std::string(name) + " first arg must be str or a tuple of str, not " + typeName(candidate));
    }
    const std::u32string affix = text::decode(c->value);
    if (affix.size() > window.size()) { return false; }
    return suffix ? window.compare(window.size() - affix.size(), affix.size(), affix) == 0
                  : window.compare(0, affix.size(), affix) == 0;
  };
  if (const auto* tuple = r.at(0).as<TupleObj>()) {
    return std::any_of(tuple->items.begin(), tuple->items.end(), test);
  }
  return test(r.at(0));
}

Value strStartswith(Interpreter&, const Value& s, CallArgs& args) {
  return Value::boolean(affixMatch(s, args, "startswith", false));
}
Value strEndswith(Interpreter&, const Value& s, CallArgs& args) {
  return Value::boolean(affixMatch(s, args, "endswith", true));
}

Value strJoin(Interpreter& interp, const Value& s, CallArgs& args) {
  ArgReader r("join", args);
  r.noKeywords();
  r.expect(1, 1);
  const std::string& sep = self(s);
  std::string out;
  std::size_t index = 0;
  interp.iterate(r.at(0), [&](const Value& item) {
    const auto* piece = item.as<StrObj>();
    if (piece == nullptr) {
      raise(types().typeError,
            "sequence item " + std::to_string(index) + ": expected str instance, " + typeName(item) + " found");
    }
    if (index++ != 0) { out += sep; }
    out += piece->value;
    Heap::checkLength(out.size());
    return true;
  });
  return newStr(std::move(out));
}

ValueList splitWhitespace(const std::u32string& s, long long maxsplit, bool fromRight) {
  ValueList parts;
  if (!fromRight) {
    std::size_t i = 0;
    while (i < s.size()) {
      while (i < s.size() && text::isSpace(s[i])) { ++i; }
      if (i >= s.size()) { break; }
      if (maxsplit >= 0 && static_cast<long long>(parts.size()) >= maxsplit) {
        std::size_t end = s.size();
        while (end > i && text::isSpace(s[end - 1])) { --end; }
        parts.push_back(u32(s.substr(i, end - i)));
        break;
      }
      std::size_t j = i;
      while (j < s.size() && !text::isSpace(s[j])) { ++j; }
      parts.push_back(u32(s.substr(i, j - i)));
      i = j;
    }
    return parts;
  }
  std::size_t end = s.size();
  while (end > 0) {
    while (end > 0 && text::isSpace(s[end - 1])) { --end; }
    if (end == 0) { break; }
    if (maxsplit >= 0 && static_cast<long long>(parts.size()) >= maxsplit) {
      std::size_t begin = 0;
      while (begin < end && text::isSpace(s[begin])) { ++begin; }
      parts.push_back(u32(s.substr(begin, end - begin)));
      break;
    }
    std::size_t j = end;
    while (j > 0 && !text::isSpace(s[j - 1])) { --j; }
    parts.push_back(u32(s.substr(j, end - j)));
    end = j;
  }
  std::reverse(parts.begin(), parts.end());
  return parts;
}

Value splitImpl(const Value& s, CallArgs& args, const char* name, bool fromRight) {
  ArgReader r(name, args);
  auto sep = r.argument(0, "sep");
  auto maxArg = r.argument(1, "maxsplit");
  r.finish();
  const long long maxsplit = maxArg ? toInteger(*maxArg) : -1;
  if (!sep || sep->isNone()) { return newList(splitWhitespace(text::decode(self(s)), maxsplit, fromRight)); }
  const std::string& value = self(s);
  const std::string& delim = toString(*sep, name);
  if (delim.empty()) { raise(types().valueError, "empty separator"); }
  ValueList parts;
  if (!fromRight) {
    std::size_t start = 0;
    for (;;) {
      const std::size_t pos = value.find(delim, start);
      if (pos == std::string::npos || (maxsplit >= 0 && static_cast<long long>(parts.size()) >= maxsplit)) {
        parts.push_back(newStr(value.substr(start)));
        break;
      }
      parts.push_back(newStr(value.substr(start, pos - start)));
      start = pos + delim.size();
    }
    return newList(std::move(parts));
  }
  std::size_t end = value.size();
  for (;;) {
    const std::size_t pos = end >= delim.size() ? value.rfind(delim, end - delim.size()) : std::string::npos;
    if (pos == std::string::npos || (maxsplit >= 0 && static_cast<long long>(parts.size()) >= maxsplit)) {
      parts.push_back(newStr(value.substr(0, end)));
      break;
    }
    parts.push_back(newStr(value.substr(pos + delim.size(), end - pos - delim.size())));
    end = pos;
  }
  std::reverse(parts.begin(), parts.end());
  return newList(std::move(parts));
}

Value strSplit(Interpreter&, const Value& s, CallArgs& args) { return splitImpl(s, args, "split", false); }
Value strRsplit(Interpreter&, const Value& s, CallArgs& args) { return splitImpl(s, args, "rsplit", true); }

bool isLineBreak(char32_t c) {
  switch (c) {
    case U'\n':
    case U'\r':
    case U'\v':
    case U'\f':
    case U'\x1c':
    case U'\x1d':
    case U'\x1e':
    case U'\x85':
    case U'\u2028':
    case U'\u2029': return true;
    default: return false;
  }
}

Value strSplitlines(Interpreter&, const Value& s, CallArgs& args) {
  ArgReader r("splitlines", args);
  auto keep = r.argument(0, "keepends");
  r.finish();
  const bool keepends = keep && truthy(*keep);
  const std::u32string cps = text::decode(self(s));
  ValueList lines;
  std::size_t start = 0;
  std::size_t i = 0;
  while (i < cps.size()) {
    if (!isLineBreak(cps[i])) {
      ++i;
      continue;
    }
    std::size_t breakEnd = i + 1;
    if (cps[i] == U'\r' && breakEnd < cps.size() && cps[breakEnd] == U'\n') { ++breakEnd; }
    lines.push_back(u32(cps.substr(start, (keepends ? breakEnd : i) - start)));
    start = i = breakEnd;
  }
  if (start < cps.size()) { lines.push_back(u32(cps.substr(start))); }
  return newList(std::move(lines));
}

enum class StripSide { Left, Right, Both };

Value stripImpl(const Value& s, CallArgs& args, const char* name, StripSide side) {
  ArgReader r(name, args);
  r.noKeywords();
  r.expect(0, 1);
  const std::u32string cps = text::decode(self(s));
  std::u32string chars;
  const bool whitespace = !r.has(0) || r.at(0).isNone();
  if (!whitespace) { chars = strArg(r, 0); }
  auto strip = [&](char32_t c) { return whitespace ? text::isSpace(c) : chars.find(c) != std::u32string::npos; };
  std::size_t b = 0;
  std::size_t e = cps.size();
  if (side != StripSide::Right) {
    while (b < e && strip(cps[b])) { ++b; }
  }
  if (side != StripSide::Left) {
    while (e > b && strip(cps[e - 1])) { --e; }
  }
  return u32(cps.substr(b, e - b));
}

Value strStrip(Interpreter&, const Value& s, CallArgs& args) { return stripImpl(s, args, "strip", StripSide::Both); }
Value strLstrip(Interpreter&, const Value& s, CallArgs& args) { return stripImpl(s, args, "lstrip", StripSide::Left); }
Value strRstrip(Interpreter&, const Value& s, CallArgs& args) { return stripImpl(s, args, "rstrip", StripSide::Right); }

template <std::string (*Fn)(std::string_view)>
Value caseMap(Interpreter&, const Value& s, CallArgs& args) {
  ArgReader r("str method", args);
  r.noKeywords();
  r.expect(0, 0);
  return newStr(Fn(self(s)));
}

template <bool (*Pred)(std::string_view)>
Value predicate(Interpreter&, const Value& s, CallArgs& args) {
  ArgReader r("str method", args);
  r.noKeywords();
  r.expect(0, 0);
  return Value::boolean(Pred(self(s)));
}

bool nonEmptyAlpha(std::string_view s) { return !s.empty() && text::allOf(s, &text::isAlpha); }
bool nonEmptyDigit(std::string_view s) { return !s.empty() && text::allOf(s, &text::isDigit); }
bool nonEmptyDecimal(std::string_view s) { return !s.empty() && text::allOf(s, &text::isDecimal); }
bool nonEmptyNumeric(std::string_view s) { return !s.empty() && text::allOf(s, &text::isNumeric); }
bool nonEmptyAlnum(std::string_view s) { return !s.empty() && text::allOf(s, &text::isAlnum); }
bool nonEmptySpace(std::string_view s) { return !s.empty() && text::allOf(s, &text::isSpace); }
bool printable(std::string_view s) { return text::allOf(s, &text::isPrintable); }
bool ascii(std::string_view s) {
  return std::all_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}
bool identifier(std::string_view s) {
  const std::u32string cps = text::decode(s);
  if (cps.empty()) { return false; }
  if (cps[0] != U'_' && !text::isAlpha(cps[0])) { return false; }
  return std::all_of(cps.begin() + 1, cps.end(), [](char32_t c) { return c == U'_' || text::isAlnum(c); });
}

Value strReplace(Interpreter&, const Value& s, CallArgs& args) {
  ArgReader r("replace", args);
  r.noKeywords();
  r.expect(2, 3);
  const std::string& from = r.string(0);
  const std::string& to = r.string(1);
  long long count = r.has(2) ? r.integer(2) : -1;
  const std::string& value = self(s);
  std::string out;
  if (from.empty()) {
    const std::u32string cps = text::decode(value);
    for (std::size_t i = 0; i <= cps.size(); ++i) {
      if (count != 0) {
        out += to;
        if (count > 0) { --count; }
      }
      if (i < cps.size()) { out += text::encode(cps[i]); }
      Heap::checkLength(out.size());
    }
    return newStr(std::move(out));
  }
  std::size_t start = 0;
  while (count != 0) {
    const std::size_t pos = value.find(from, start);
    if (pos == std::string::npos) { break; }
    out.append(value, start, pos - start);
    out += to;
    Heap::checkLength(out.size());
    start = pos + from.size();
    if (count > 0) { --count; }
  }
  out.append(value, start, std::string::npos);
  return newStr(std::move(out));
}

Value strFormat(Interpreter& interp, const Value& s, CallArgs& args) {
  return newStr(formatString(interp, self(s), args));
}

char32_t fillChar(const ArgReader& r, std::size_t i) {
  if (!r.has(i)) { return U' '; }
  const std::u32string fill = strArg(r, i);
  if (fill.size() != 1) { raise(types().typeError, "The fill character must be exactly one character long"); }
  return fill[0];
}

enum class Justify { Left, Right, Center };

Value justify(const Value& s, CallArgs& args, const char* name, Justify how) {
  ArgReader r(name, args);
  r.noKeywords();
  r.expect(1, 2);
  const long long width = r.integer(0);
  const char32_t fill = fillChar(r, 1);
  const std::u32string cps = text::decode(self(s));
  if (width <= static_cast<long long>(cps.size())) { return s; }
  Heap::checkLength(static_cast<std::size_t>(width));
  const std::size_t margin = static_cast<std::size_t>(width) - cps.size();
  std::size_t left = 0;
  switch (how) {
    case Justify::Left: left = 0; break;
    case Justify::Right: left = margin; break;
    case Justify::Center: left = margin / 2 + (margin & static_cast<std::size_t>(width) & 1U); break;
  }
  return u32(std::u32string(left, fill) + cps + std::u32string(margin - left, fill));
}

Value strCenter(Interpreter&, const Value& s, CallArgs& args) { return justify(s, args, "center", Justify::Center); }
Value strLjust(Interpreter&, const Value& s, CallArgs& args) { return justify(s, args, "ljust", Justify::Left); }
Value strRjust(Interpreter&, const Value& s, CallArgs& args) { return justify(s, args, "rjust", Justify::Right); }

Value strZfill(Interpreter&, const Value& s, CallArgs& args) {
  ArgReader r("zfill", args);
  r.noKeywords();
  r.expect(1, 1);
  const long long width = r.integer(0);
  std::u32string cps = text::decode(self(s));
  if (width <= static_cast<long long>(cps.size())) { return s; }
  Heap::checkLength(static_cast<std::size_t>(width));
  const std::size_t fill = static_cast<std::size_t>(width) - cps.size();
  const std::size_t at = (!cps.empty() && (cps[0] == U'+' || cps[0] == U'-')) ? 1 : 0;
  cps.insert(at, fill, U'0');
  return u32(cps);
}

Value partitionImpl(const Value& s, CallArgs& args, const char* name, bool fromRight) {
  ArgReader r(name, args);
  r.noKeywords();
  r.expect(1, 1);
  const std::string& value = self(s);
  const std::string& sep = r.string(0);
  if (sep.empty()) { raise(types().valueError, "empty separator"); }
  const std::size_t pos = fromRight ? value.rfind(sep) : value.find(sep);
  if (pos == std::string::npos) {
    return fromRight ? newTuple({newStr(""), newStr(""), s}) : newTuple({s, newStr(""), newStr("")});
  }
  return newTuple({newStr(value.substr(0, pos)), newStr(sep), newStr(value.substr(pos + sep.size()))});
}

Value strPartition(Interpreter&, const Value& s, CallArgs& args) { return partitionImpl(s, args, "partition", false); }
Value strRpartition(Interpreter&, const Value& s, CallArgs& args) { return partitionImpl(s, args, "rpartition", true); }

std::string normalizedEncoding(const std::string& name) {
  std::string out;
  for (char c : name) {
    if (c == '-' || c == '_') { continue; }
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

Value strEncode(Interpreter&, const Value& s, CallArgs& args) {
  ArgReader r("encode", args);
  auto encoding = r.argument(0, "encoding");
  auto errors = r.argument(1, "errors");
  r.finish();
  const std::string name = encoding ? toString(*encoding, "encode") : std::string("utf-8");
  const std::string codec = normalizedEncoding(name);
  const std::string& value = self(s);
  if (codec == "utf8") { return make<BytesObj>(value); }
  if (codec == "ascii") {
    const std::string mode = errors ? toString(*errors, "encode") : std::string("strict");
    std::string out;
    for (char32_t c : text::decode(value)) {
      if (c < 0x80) {
        out += static_cast<char>(c);
      } else if (mode == "replace") {
        out += '?';
      } else if (mode != "ignore") {
        raise(types().valueError, "'ascii' codec can't encode character");
      }
    }
    return make<BytesObj>(std::move(out));
  }
  raise(types().lookupError, "unknown encoding: " + name);
}

Value strRemoveprefix(Interpreter&, const Value& s, CallArgs& args) {
  ArgReader r("removeprefix", args);
  r.noKeywords();
  r.expect(1, 1);
  const std::string& value = self(s);
  const std::string& prefix = r.string(0);
  if (!prefix.empty() && value.compare(0, prefix.size(), prefix) == 0) { return newStr(value.substr(prefix.size())); }
  return s;
}

Value strRemovesuffix(Interpreter&, const Value& s, CallArgs& args) {
  ArgReader r("removesuffix", args);
  r.noKeywords();
  r.expect(1, 1);
  const std::string& value = self(s);
  const std::string& suffix = r.string(0);
  if (!suffix.empty() && value.size() >= suffix.size() &&
      value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0) {
    return newStr(value.substr(0, value.size() - suffix.size()));
  }
  return s;
}

Value bytesDecode(Interpreter&, const Value& b, CallArgs& args) {
  ArgReader r("decode", args);
  auto encoding = r.argument(0, "encoding");
  auto errors = r.argument(1, "errors");
  r.finish();
  const std::string name = encoding ? toString(*encoding, "decode") : std::string("utf-8");
  const std::string mode = errors ? toString(*errors, "decode") : std::string("strict");
  const std::string& raw = b.as<BytesObj>()->value;
  const std::string codec = normalizedEncoding(name);
  if (codec == "utf8") {
    if (text::isValidUtf8(raw)) { return newStr(raw); }
    if (mode == "strict") { raise(types().valueError, "'utf-8' codec can't decode bytes"); }
    return newStr(text::encode(text::decode(raw)));
  }
  if (codec == "ascii") {
    std::string out;
    for (char c : raw) {
      if (static_cast<unsigned char>(c) < 0x80) {
        out += c;
      } else if (mode == "replace") {
        out += text::encode(U'\uFFFD');
      } else if (mode != "ignore") {
        raise(types().valueError, "'ascii' codec can't decode byte");
      }
    }
    return newStr(std::move(out));
  }
  raise(types().lookupError, "unknown encoding: " + name);
}

Value bytesHex(Interpreter&, const Value& b, CallArgs& args) {
  ArgReader r("hex", args);
  r.noKeywords();
  r.expect(0, 0);
  std::string out;
  for (char c : b.as<BytesObj>()->value) {
    char buf[3];
    std::snprintf(buf, sizeof buf, "%02x", static_cast<unsigned char>(c));
    out += buf;
  }
  return newStr(std::move(out));
}

} // namespace

const std::vector<MethodEntry>& strMethods() {
  static const std::vector<MethodEntry> methods{
      {"capitalize", &caseMap<&text::capitalize>},
      {"casefold", &caseMap<&text::casefold>},
      {"center", &strCenter},
      {"count", &strCount},
      {"encode", &strEncode},
      {"endswith", &strEndswith},
      {"find", &strFind},
      {"format", &strFormat},
      {"index", &strIndex},
      {"isalnum", &predicate<&nonEmptyAlnum>},
      {"isalpha", &predicate<&nonEmptyAlpha>},
      {"isascii", &predicate<&ascii>},
      {"isdecimal", &predicate<&nonEmptyDecimal>},
      {"isdigit", &predicate<&nonEmptyDigit>},
      {"isidentifier", &predicate<&identifier>},
      {"islower", &predicate<&text::isLower>},
      {"isnumeric", &predicate<&nonEmptyNumeric>},
      {"isprintable", &predicate<&printable>},
      {"isspace", &predicate<&nonEmptySpace>},
      {"istitle", &predicate<&text::isTitle>},
      {"isupper", &predicate<&text::isUpper>},
      {"join", &strJoin},
      {"ljust", &strLjust},
      {"lower", &caseMap<&text::lower>},
      {"lstrip", &strLstrip},
      {"partition", &strPartition},
      {"removeprefix", &strRemoveprefix},
      {"removesuffix", &strRemovesuffix},
      {"replace", &strReplace},
      {"rfind", &strRfind},
      {"rindex", &strRindex},
      {"rjust", &strRjust},
      {"rpartition", &strRpartition},
      {"rsplit", &strRsplit},
      {"rstrip", &strRstrip},
      {"split", &strSplit},
      {"splitlines", &strSplitlines},
      {"startswith", &strStartswith},
      {"strip", &strStrip},
      {"swapcase", &caseMap<&text::swapcase>},
      {"title", &caseMap<&text::title>},
      {"upper", &caseMap<&text::upper>},
      {"zfill", &strZfill},
  };
  return methods;
}

const std::vector<MethodEntry>& bytesMethods() {
  static const std::vector<MethodEntry> methods{
      {"decode", &bytesDecode},
      {"hex", &bytesHex},
  };
  return methods;
}

} // namespace pybox::rt::detail
